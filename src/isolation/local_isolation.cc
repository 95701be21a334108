#include "seccomp_filter.hh"
#include "spawn_child.hh"
#include "workspace.hh"

#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <cstdlib>
#include <execbox/concat_tostr.hh>
#include <execbox/errmsg.hh>
#include <execbox/errors.hh>
#include <execbox/file_manip.hh>
#include <execbox/isolation/local_isolation.hh>
#include <execbox/logger.hh>
#include <execbox/macros/throw.hh>
#include <execbox/syscalls.hh>
#include <fcntl.h>
#include <memory>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

using std::string;

namespace execbox::isolation {

namespace {

bool am_i_root() noexcept { return geteuid() == 0; }

std::optional<Owner> workspace_owner(const RuntimeProfile& profile) noexcept {
    if (am_i_root()) {
        return Owner{.uid = profile.uid, .gid = profile.gid};
    }
    return std::nullopt;
}

// Returns false if the file does not exist
bool write_cgroup_file(const string& cgroup, const char* file, std::string_view value) {
    auto path = concat_tostr(cgroup, '/', file);
    FileDescriptor fd{path, O_WRONLY | O_CLOEXEC};
    if (!fd.is_open()) {
        if (errno == ENOENT) {
            return false;
        }
        THROW("open('", path, "')", errmsg());
    }
    if (write_all(fd, value) != value.size()) {
        THROW("write('", path, "')", errmsg());
    }
    return true;
}

// @p extra_processes are the processes of the sandbox that are not the program's
string create_cgroup(
    const string& parent,
    std::string_view request_id,
    const LimitSet& limits,
    uint64_t extra_processes
) {
    auto cgroup = concat_tostr(parent, '/', WORKSPACE_NAME_PREFIX, request_id);
    if (mkdir(cgroup.c_str(), 0755)) {
        THROW("mkdir('", cgroup, "')", errmsg());
    }
    try {
        (void)write_cgroup_file(
            cgroup, "pids.max", concat_tostr(limits.max_processes + extra_processes)
        );
        (void)write_cgroup_file(cgroup, "memory.max", concat_tostr(limits.memory_bytes));
        // Absent if swap accounting is disabled
        (void)write_cgroup_file(cgroup, "memory.swap.max", "0");
        constexpr uint64_t period_usec = 100'000;
        auto quota_usec = static_cast<uint64_t>(limits.cpu_cores * period_usec);
        (void)write_cgroup_file(cgroup, "cpu.max", concat_tostr(quota_usec, ' ', period_usec));
    } catch (...) {
        (void)rmdir(cgroup.c_str());
        throw;
    }
    return cgroup;
}

// Request variables take precedence over the base ones
std::vector<string>
sandbox_environment(const std::vector<string>& request_env, const string& home) {
    std::vector<string> env = request_env;
    auto add_unless_set = [&](std::string_view name, std::string_view value) {
        for (const auto& var : request_env) {
            if (var.size() > name.size() and var.starts_with(name) and var[name.size()] == '=') {
                return;
            }
        }
        env.emplace_back(concat_tostr(name, '=', value));
    };
    add_unless_set("PATH", "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin");
    add_unless_set("HOME", home);
    add_unless_set("LANG", "C.UTF-8");
    return env;
}

} // namespace

LocalIsolation::LocalIsolation(Options opts)
: opts_{std::move(opts)} {
    char* real_root = realpath(opts_.workspace_root.c_str(), nullptr);
    if (real_root == nullptr) {
        throw InfrastructureFault(
            "invalid workspace root '", opts_.workspace_root, "'", errmsg()
        );
    }
    opts_.workspace_root = real_root;
    free(real_root); // NOLINT(cppcoreguidelines-no-malloc)

    uses_namespaces_ = can_use_namespaces(opts_.workspace_root);
    if (not uses_namespaces_) {
        if (opts_.require_workspace_isolation) {
            throw InfrastructureFault(
                "sandbox isolation is required, but creating user, PID and mount namespaces is "
                "not permitted"
            );
        }
        stdlog(
            "warning: creating user, PID and mount namespaces is not permitted, sandboxes will "
            "see each other's processes and workspaces"
        );
    }
    if (opts_.cgroup_parent.empty() and not am_i_root() and not uses_namespaces_) {
        stdlog(
            "warning: no cgroup, no root and no user namespace: the process count limit will "
            "not be enforced"
        );
    }
    debuglog(
        "local isolation: workspace root: ",
        opts_.workspace_root,
        ", cgroup parent: ",
        opts_.cgroup_parent.empty() ? "(none)" : opts_.cgroup_parent,
        ", namespaces: ",
        uses_namespaces_
    );
}

string
LocalIsolation::create_workspace(std::string_view request_id, const RuntimeProfile& profile) {
    return create_workspace_dir(opts_.workspace_root, request_id, 0700, workspace_owner(profile));
}

void LocalIsolation::write_file(
    const string& workspace, const SourceFile& file, const RuntimeProfile& profile
) {
    write_workspace_file(workspace, file, workspace_owner(profile));
}

SpawnedProcess LocalIsolation::spawn(const SpawnSpec& spec) {
    const auto& limits = spec.limits;
    bool use_cgroup = not opts_.cgroup_parent.empty();
    // pid1 of the sandbox runs as the same user as the program
    uint64_t extra_processes = uses_namespaces_ ? 1 : 0;

    auto seccomp_fd = build_seccomp_filter(limits.network);

    ChildOptions copts = {
        .argv = spec.command,
        .env = sandbox_environment(spec.env, string{spec.workspace}),
        .working_dir = string{spec.workspace},
        .stdin_fd = spec.stdin_fd,
        .stdout_fd = spec.stdout_fd,
        .stderr_fd = spec.stderr_fd,
        .cgroup_fd = std::nullopt,
        .namespaces = std::nullopt,
        .prlimit =
            {
                .max_address_space_size_in_bytes = std::nullopt,
                // Rounded up to whole seconds, the wall time limit is the precise one
                .cpu_time_limit_in_seconds =
                    static_cast<uint64_t>((limits.cpu_time.count() + 999) / 1000),
                .max_file_size_in_bytes = limits.write_quota_bytes,
                .file_descriptors_num_limit = limits.open_files,
                .process_num_limit = std::nullopt,
                .max_core_file_size_in_bytes = 0,
            },
        .switch_identity = std::nullopt,
        .seccomp_bpf_fd = static_cast<int>(seccomp_fd),
    };
    if (uses_namespaces_) {
        copts.namespaces = ChildOptions::Namespaces{
            .workspace_root = opts_.workspace_root,
            .workspace = string{spec.workspace},
        };
    }
    if (am_i_root()) {
        copts.switch_identity = ChildOptions::Identity{
            .uid = spec.profile.uid,
            .gid = spec.profile.gid,
        };
    }
    // cgroup limits the whole sandbox, prlimits limit each process separately. RLIMIT_NPROC
    // counts the processes of the user within its user namespace, so only a sandbox with a user
    // namespace of its own gets a count of its own. As root without namespaces the count is
    // shared by the sandboxes of the same profile.
    if (not use_cgroup) {
        copts.prlimit.max_address_space_size_in_bytes = limits.memory_bytes;
        if (uses_namespaces_ or am_i_root()) {
            copts.prlimit.process_num_limit = limits.max_processes + extra_processes;
        }
    }

    string cgroup;
    FileDescriptor cgroup_fd;
    if (use_cgroup) {
        cgroup = create_cgroup(opts_.cgroup_parent, spec.request_id, limits, extra_processes);
        cgroup_fd = FileDescriptor{cgroup, O_RDONLY | O_DIRECTORY | O_CLOEXEC};
        if (!cgroup_fd.is_open()) {
            int errnum = errno;
            (void)rmdir(cgroup.c_str());
            THROW("open('", cgroup, "')", errmsg(errnum));
        }
        copts.cgroup_fd = static_cast<int>(cgroup_fd);
    }

    try {
        auto child = spawn_child(copts);
        return SpawnedProcess{
            .pid = child.pid,
            .pidfd = std::move(child.pidfd),
            .isolation_id = std::move(cgroup),
            .backend_state = std::move(child.pid1_report),
        };
    } catch (const std::exception& e) {
        if (use_cgroup) {
            (void)rmdir(cgroup.c_str());
        }
        throw InfrastructureFault("spawning the sandboxed process failed: ", e.what());
    }
}

void LocalIsolation::signal_group(const SpawnedProcess& process, int signo) {
    // ESRCH: the group is already empty
    if (kill(-process.pid, signo) && errno != ESRCH) {
        THROW("kill(-", process.pid, ", ", signo, ')', errmsg());
    }
}

void LocalIsolation::kill_group(const SpawnedProcess& process) {
    if (not process.isolation_id.empty()) {
        // Also kills the processes that left the process group
        (void)write_cgroup_file(process.isolation_id, "cgroup.kill", "1");
    }
    signal_group(process, SIGKILL);
}

ReapResult wait_for_child(pid_t pid) {
    siginfo_t info = {};
    rusage ru = {};
    while (syscalls::waitid(P_PID, pid, &info, WEXITED, &ru)) {
        if (errno != EINTR) {
            THROW("waitid()", errmsg());
        }
    }
    auto to_usec = [](timeval tv) {
        return std::chrono::microseconds{tv.tv_sec * 1'000'000 + tv.tv_usec};
    };
    return ReapResult{
        .si = {.code = info.si_code, .status = info.si_status},
        .cpu_time = to_usec(ru.ru_utime) + to_usec(ru.ru_stime),
        // ru_maxrss is in kilobytes
        .peak_memory_bytes = static_cast<uint64_t>(ru.ru_maxrss) * 1024,
    };
}

ReapResult LocalIsolation::reap(SpawnedProcess& process) {
    auto res = wait_for_child(process.pid);
    process.pidfd.reset(-1);
    // CPU time and ru_maxrss of pid1 include the reaped processes of the namespace
    if (auto report = std::static_pointer_cast<Pid1Report>(process.backend_state)) {
        res.si = program_si(*report, res.si);
    }
    if (not process.isolation_id.empty()) {
        try {
            auto peak = get_file_contents(concat_tostr(process.isolation_id, "/memory.peak"));
            char* end = nullptr;
            auto val = strtoull(peak.c_str(), &end, 10);
            if (end != peak.c_str() and val != ULLONG_MAX) {
                res.peak_memory_bytes = val;
            }
        } catch (const std::exception& e) {
            // Kernels older than 5.19 lack memory.peak
            debuglog("reading memory.peak failed: ", e.what());
        }
    }
    return res;
}

void LocalIsolation::release_process(const SpawnedProcess& process) {
    if (process.isolation_id.empty()) {
        return;
    }
    // The cgroup is busy until the killed processes are gone
    constexpr int attempts = 1000;
    for (int i = 0; i < attempts; ++i) {
        if (rmdir(process.isolation_id.c_str()) == 0 or errno == ENOENT) {
            return;
        }
        if (errno != EBUSY) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{1});
    }
    THROW("rmdir('", process.isolation_id, "')", errmsg());
}

void LocalIsolation::remove_workspace(const string& workspace) {
    remove_workspace_dir(workspace);
}

} // namespace execbox::isolation
