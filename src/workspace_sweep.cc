#include "isolation/run_command.hh"
#include "isolation/workspace.hh"

#include <cerrno>
#include <ctime>
#include <dirent.h>
#include <execbox/errmsg.hh>
#include <execbox/file_manip.hh>
#include <execbox/logger.hh>
#include <execbox/macros/throw.hh>
#include <execbox/workspace_sweep.hh>
#include <fcntl.h>
#include <memory>
#include <string_view>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

using std::string;
using std::string_view;
using std::vector;

namespace execbox {

namespace {

// Calls @p remove(dirfd, name) for every execbox-* directory in @p root last modified more
// than @p max_age ago, returns the number of successful calls
template <class Func>
size_t remove_old_directories(const string& root, std::chrono::seconds max_age, Func&& remove) {
    std::unique_ptr<DIR, decltype(&closedir)> dir{opendir(root.c_str()), closedir};
    if (!dir) {
        THROW("opendir('", root, "')", errmsg());
    }
    int dirfd = ::dirfd(dir.get());
    auto threshold = std::chrono::system_clock::now() - max_age;

    size_t removed = 0;
    for (;;) {
        errno = 0;
        dirent* entry = readdir(dir.get());
        if (entry == nullptr) {
            if (errno) {
                THROW("readdir('", root, "')", errmsg());
            }
            break;
        }
        string_view name = entry->d_name;
        if (not name.starts_with(isolation::WORKSPACE_NAME_PREFIX)) {
            continue;
        }
        struct stat64 st = {};
        if (fstatat64(dirfd, entry->d_name, &st, AT_SYMLINK_NOFOLLOW)) {
            errlog("sweep: fstatat('", name, "')", errmsg());
            continue;
        }
        if (not S_ISDIR(st.st_mode)) {
            continue;
        }
        auto mtime = std::chrono::system_clock::from_time_t(st.st_mtim.tv_sec);
        if (mtime > threshold) {
            continue;
        }
        if (remove(dirfd, entry->d_name)) {
            ++removed;
        }
    }
    return removed;
}

std::chrono::system_clock::time_point parse_docker_time(const string& str) {
    // E.g. "2026-10-17 12:34:56 +0200 CEST", the zone name is redundant
    tm t = {};
    if (strptime(str.c_str(), "%Y-%m-%d %H:%M:%S %z", &t) == nullptr) {
        THROW("invalid time: ", str);
    }
    time_t utc = timegm(&t) - t.tm_gmtoff;
    return std::chrono::system_clock::from_time_t(utc);
}

} // namespace

size_t
sweep_orphaned_workspaces(const std::string& workspace_root, std::chrono::seconds max_age) {
    return remove_old_directories(workspace_root, max_age, [&](int dirfd, const char* name) {
        if (remove_rat(dirfd, name)) {
            errlog("sweep: removing workspace ", workspace_root, '/', name, errmsg());
            return false;
        }
        stdlog("sweep: removed orphaned workspace ", workspace_root, '/', name);
        return true;
    });
}

size_t sweep_orphaned_cgroups(const std::string& cgroup_parent, std::chrono::seconds max_age) {
    return remove_old_directories(cgroup_parent, max_age, [&](int dirfd, const char* name) {
        if (unlinkat(dirfd, name, AT_REMOVEDIR)) {
            errlog("sweep: removing cgroup ", cgroup_parent, '/', name, errmsg());
            return false;
        }
        stdlog("sweep: removed orphaned cgroup ", cgroup_parent, '/', name);
        return true;
    });
}

vector<string> docker_ps_argv(const std::string& docker_binary) {
    return {
        docker_binary,
        "ps",
        "--all",
        "--no-trunc",
        "--filter",
        "label=execbox.request",
        "--format",
        "{{.Names}}\t{{.CreatedAt}}",
    };
}

vector<ContainerInfo> parse_docker_ps_output(std::string_view output) {
    vector<ContainerInfo> res;
    while (not output.empty()) {
        auto eol = output.find('\n');
        auto line = output.substr(0, eol);
        output.remove_prefix(eol == string_view::npos ? output.size() : eol + 1);
        if (line.empty()) {
            continue;
        }
        auto tab = line.find('\t');
        if (tab == string_view::npos or tab == 0) {
            THROW("malformed docker ps line: ", line);
        }
        try {
            res.push_back({
                .name = string{line.substr(0, tab)},
                .created = parse_docker_time(string{line.substr(tab + 1)}),
            });
        } catch (const std::exception& e) {
            THROW("malformed docker ps line: ", line, " (", e.what(), ')');
        }
    }
    return res;
}

size_t sweep_orphaned_containers(const std::string& docker_binary, std::chrono::seconds max_age) {
    auto env = isolation::current_environment();
    auto ps = isolation::run_command(docker_ps_argv(docker_binary), env);
    if (ps.si != Si{.code = CLD_EXITED, .status = 0}) {
        THROW("docker ps failed (", ps.si.description(), "): ", ps.output);
    }

    auto threshold = std::chrono::system_clock::now() - max_age;
    size_t removed = 0;
    for (const auto& container : parse_docker_ps_output(ps.output)) {
        if (container.created > threshold) {
            continue;
        }
        auto rm = isolation::run_command({docker_binary, "rm", "--force", container.name}, env);
        if (rm.si != Si{.code = CLD_EXITED, .status = 0}) {
            errlog(
                "sweep: removing container ",
                container.name,
                " failed (",
                rm.si.description(),
                "): ",
                rm.output
            );
            continue;
        }
        stdlog("sweep: removed orphaned container ", container.name);
        ++removed;
    }
    return removed;
}

} // namespace execbox
