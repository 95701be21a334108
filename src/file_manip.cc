#include <cerrno>
#include <dirent.h>
#include <execbox/errmsg.hh>
#include <execbox/file_descriptor.hh>
#include <execbox/file_manip.hh>
#include <execbox/macros/throw.hh>
#include <sys/stat.h>
#include <unistd.h>

using std::string;

static int remove_rat_impl(int dirfd, const char* path) noexcept {
    constexpr int open_flags = O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC;
    int fd = openat(dirfd, path, open_flags);
    // A directory without the read permission (e.g. chmod 000) cannot be listed until it is
    // made accessible again
    if (fd == -1 && errno == EACCES && fchmodat(dirfd, path, S_IRWXU, 0) == 0) {
        fd = openat(dirfd, path, open_flags);
    }
    if (fd == -1) {
        return unlinkat(dirfd, path, 0);
    }

    DIR* dir = fdopendir(fd);
    if (dir == nullptr) {
        (void)close(fd);
        return unlinkat(dirfd, path, AT_REMOVEDIR);
    }

    int ec = 0;
    int rc = 0;
    for (;;) {
        errno = 0;
        dirent* file = readdir(dir);
        if (file == nullptr) {
            if (errno) {
                ec = errno;
                rc = -1;
            }
            break;
        }
        std::string_view name = file->d_name;
        if (name == "." or name == "..") {
            continue;
        }

        if (file->d_type == DT_DIR || file->d_type == DT_UNKNOWN) {
            if (remove_rat_impl(fd, file->d_name) &&
                (errno != EACCES || fchmod(fd, S_IRWXU) || remove_rat_impl(fd, file->d_name)))
            {
                ec = errno;
                rc = -1;
                break;
            }
        } else if (unlinkat(fd, file->d_name, 0)) {
            // The directory itself may lack the write permission
            if (errno != EACCES || fchmod(fd, S_IRWXU) || unlinkat(fd, file->d_name, 0)) {
                ec = errno;
                rc = -1;
                break;
            }
        }
    }

    (void)closedir(dir);

    if (rc == -1) {
        errno = ec;
        return -1;
    }

    return unlinkat(dirfd, path, AT_REMOVEDIR);
}

int remove_rat(int dirfd, const char* path) noexcept { return remove_rat_impl(dirfd, path); }

size_t write_all(int fd, const void* buf, size_t len) noexcept {
    const auto* ptr = static_cast<const char*>(buf);
    size_t pos = 0;
    while (pos < len) {
        auto rc = write(fd, ptr + pos, len - pos);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        pos += static_cast<size_t>(rc);
    }
    return pos;
}

string get_file_contents(int fd) {
    string res;
    char buff[1 << 14];
    for (;;) {
        auto rc = read(fd, buff, sizeof(buff));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW("read()", errmsg());
        }
        if (rc == 0) {
            return res;
        }
        res.append(buff, static_cast<size_t>(rc));
    }
}

string get_file_contents(const string& path) {
    FileDescriptor fd{path, O_RDONLY | O_CLOEXEC};
    if (!fd.is_open()) {
        THROW("open('", path, "')", errmsg());
    }
    return get_file_contents(fd);
}

void put_file_contents(const string& path, std::string_view data, mode_t mode) {
    FileDescriptor fd{path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode};
    if (!fd.is_open()) {
        THROW("open('", path, "')", errmsg());
    }
    if (write_all(fd, data) != data.size()) {
        THROW("write('", path, "')", errmsg());
    }
    if (fd.close()) {
        THROW("close('", path, "')", errmsg());
    }
}

void create_parent_directories_at(int dirfd, std::string_view relative_path, mode_t mode) {
    for (size_t pos = relative_path.find('/'); pos != std::string_view::npos;
         pos = relative_path.find('/', pos + 1))
    {
        auto dir = string{relative_path.substr(0, pos)};
        if (dir.empty()) {
            continue;
        }
        if (mkdirat(dirfd, dir.c_str(), mode) && errno != EEXIST) {
            THROW("mkdirat('", dir, "')", errmsg());
        }
    }
}
