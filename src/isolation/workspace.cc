#include "workspace.hh"

#include <cerrno>
#include <execbox/concat_tostr.hh>
#include <execbox/errmsg.hh>
#include <execbox/file_descriptor.hh>
#include <execbox/file_manip.hh>
#include <execbox/macros/throw.hh>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace execbox::isolation {

std::string create_workspace_dir(
    const std::string& root, std::string_view request_id, mode_t mode, std::optional<Owner> owner
) {
    auto path =
        concat_tostr(root, root.ends_with('/') ? "" : "/", WORKSPACE_NAME_PREFIX, request_id);
    if (mkdir(path.c_str(), mode)) {
        THROW("mkdir('", path, "')", errmsg());
    }
    // mkdir() applies umask
    if (chmod(path.c_str(), mode) || (owner && chown(path.c_str(), owner->uid, owner->gid))) {
        int errnum = errno;
        (void)rmdir(path.c_str());
        THROW("setting up workspace '", path, "' failed", errmsg(errnum));
    }
    return path;
}

void write_workspace_file(
    const std::string& workspace, const SourceFile& file, std::optional<Owner> owner
) {
    FileDescriptor dirfd{workspace, O_RDONLY | O_DIRECTORY | O_CLOEXEC};
    if (!dirfd.is_open()) {
        THROW("open('", workspace, "')", errmsg());
    }
    create_parent_directories_at(dirfd, file.path);
    if (owner) {
        for (size_t pos = file.path.find('/'); pos != std::string::npos;
             pos = file.path.find('/', pos + 1))
        {
            auto dir = file.path.substr(0, pos);
            if (fchownat(dirfd, dir.c_str(), owner->uid, owner->gid, AT_SYMLINK_NOFOLLOW)) {
                THROW("fchownat('", dir, "')", errmsg());
            }
        }
    }

    FileDescriptor fd{dirfd, file.path, O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC};
    if (!fd.is_open()) {
        THROW("openat('", file.path, "')", errmsg());
    }
    if (write_all(fd, file.content) != file.content.size()) {
        THROW("write('", file.path, "')", errmsg());
    }
    if (owner && fchown(fd, owner->uid, owner->gid)) {
        THROW("fchown('", file.path, "')", errmsg());
    }
    if (fd.close()) {
        THROW("close('", file.path, "')", errmsg());
    }
}

void remove_workspace_dir(const std::string& workspace) {
    if (remove_r(workspace.c_str()) && errno != ENOENT) {
        THROW("remove_r('", workspace, "')", errmsg());
    }
}

} // namespace execbox::isolation
