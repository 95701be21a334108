#include "run_command.hh"
#include "spawn_child.hh"
#include "workspace.hh"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <execbox/concat_tostr.hh>
#include <execbox/errmsg.hh>
#include <execbox/errors.hh>
#include <execbox/isolation/container_isolation.hh>
#include <execbox/isolation/local_isolation.hh>
#include <execbox/logger.hh>
#include <execbox/macros/throw.hh>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

using std::string;
using std::vector;

namespace execbox::isolation {

namespace {

// docker run's own failure, as opposed to the container's exit code
constexpr int DOCKER_RUN_FAILED_EXIT_CODE = 125;

std::optional<Owner> workspace_owner(const RuntimeProfile& profile) noexcept {
    if (geteuid() == 0) {
        return Owner{.uid = profile.uid, .gid = profile.gid};
    }
    return std::nullopt;
}

string container_name(std::string_view request_id) {
    return concat_tostr(WORKSPACE_NAME_PREFIX, request_id);
}

} // namespace

ContainerIsolation::ContainerIsolation(Options opts)
: opts_{std::move(opts)} {
    char* real_root = realpath(opts_.workspace_root.c_str(), nullptr);
    if (real_root == nullptr) {
        throw InfrastructureFault(
            "invalid workspace root '", opts_.workspace_root, "'", errmsg()
        );
    }
    opts_.workspace_root = real_root;
    free(real_root); // NOLINT(cppcoreguidelines-no-malloc)
    debuglog(
        "container isolation: workspace root: ",
        opts_.workspace_root,
        ", docker: ",
        opts_.docker_binary
    );
}

vector<string> ContainerIsolation::docker_run_argv(
    const string& docker_binary, const string& container_name, const SpawnSpec& spec
) {
    const auto& limits = spec.limits;
    const auto& profile = spec.profile;
    auto cpu_seconds = (limits.cpu_time.count() + 999) / 1000;

    vector<string> argv = {
        docker_binary,
        "run",
        "--rm",
        "-i",
        "--name",
        container_name,
    };
    if (limits.network == NetworkPolicy::DENIED) {
        argv.insert(argv.end(), {"--network", "none"});
    }
    // --memory-swap equal to --memory disables swap
    argv.insert(
        argv.end(),
        {
            "--memory",
            concat_tostr(limits.memory_bytes),
            "--memory-swap",
            concat_tostr(limits.memory_bytes),
            "--pids-limit",
            concat_tostr(limits.max_processes),
            "--cpus",
            concat_tostr(limits.cpu_cores),
            "--ulimit",
            concat_tostr("nofile=", limits.open_files, ':', limits.open_files),
            "--ulimit",
            concat_tostr("fsize=", limits.write_quota_bytes, ':', limits.write_quota_bytes),
            "--ulimit",
            concat_tostr("cpu=", cpu_seconds, ':', cpu_seconds + 1),
            "--user",
            concat_tostr(profile.uid, ':', profile.gid),
            "--cap-drop",
            "ALL",
            "--security-opt",
            "no-new-privileges",
            "--read-only",
            "--tmpfs",
            "/tmp:rw,noexec,nosuid,nodev,size=50m",
            "-v",
            concat_tostr(spec.workspace, ':', profile.workspace),
            "-w",
            profile.workspace,
            "--env",
            "HOME=/tmp",
        }
    );
    for (const auto& var : spec.env) {
        argv.insert(argv.end(), {"--env", var});
    }
    argv.insert(
        argv.end(),
        {
            "--label",
            concat_tostr("execbox.language=", profile.language),
            "--label",
            concat_tostr("execbox.request=", spec.request_id),
        }
    );
    if (not profile.entrypoint.empty()) {
        argv.insert(argv.end(), {"--entrypoint", profile.entrypoint.front()});
    }
    argv.emplace_back(profile.image);
    if (not profile.entrypoint.empty()) {
        argv.insert(argv.end(), profile.entrypoint.begin() + 1, profile.entrypoint.end());
    }
    argv.insert(argv.end(), spec.command.begin(), spec.command.end());
    return argv;
}

void ContainerIsolation::run_docker(
    vector<string> args, std::initializer_list<std::string_view> ignored_errors
) {
    args.insert(args.begin(), opts_.docker_binary);
    auto res = run_command(args, current_environment());
    if (res.si == Si{.code = CLD_EXITED, .status = 0}) {
        return;
    }
    for (auto ignored_error : ignored_errors) {
        if (res.output.find(ignored_error) != string::npos) {
            debuglog("docker ", args[1], ": ", res.output);
            return;
        }
    }
    THROW("docker ", args[1], " failed (", res.si.description(), "): ", res.output);
}

string ContainerIsolation::create_workspace(
    std::string_view request_id, const RuntimeProfile& profile
) {
    auto owner = workspace_owner(profile);
    // Without root the workspace cannot be given to the container user
    return create_workspace_dir(opts_.workspace_root, request_id, owner ? 0700 : 0777, owner);
}

void ContainerIsolation::write_file(
    const string& workspace, const SourceFile& file, const RuntimeProfile& profile
) {
    write_workspace_file(workspace, file, workspace_owner(profile));
}

SpawnedProcess ContainerIsolation::spawn(const SpawnSpec& spec) {
    auto name = container_name(spec.request_id);
    try {
        auto child = spawn_child({
            .argv = docker_run_argv(opts_.docker_binary, name, spec),
            .env = current_environment(),
            .working_dir = std::nullopt,
            .stdin_fd = spec.stdin_fd,
            .stdout_fd = spec.stdout_fd,
            .stderr_fd = spec.stderr_fd,
        });
        return SpawnedProcess{
            .pid = child.pid,
            .pidfd = std::move(child.pidfd),
            .isolation_id = std::move(name),
            .backend_state = nullptr,
        };
    } catch (const std::exception& e) {
        throw InfrastructureFault("starting the container failed: ", e.what());
    }
}

void ContainerIsolation::signal_group(const SpawnedProcess& process, int signo) {
    const char* abbrev = sigabbrev_np(signo);
    if (abbrev == nullptr) {
        THROW("unknown signal ", signo);
    }
    // The container may have already exited (and been removed by --rm)
    run_docker(
        {"kill", concat_tostr("--signal=", abbrev), process.isolation_id},
        {"is not running", "No such container"}
    );
}

void ContainerIsolation::kill_group(const SpawnedProcess& process) {
    try {
        run_docker(
            {"kill", "--signal=KILL", process.isolation_id}, {"is not running", "No such container"}
        );
    } catch (const std::exception& e) {
        // Killing the client below must happen anyway, "docker rm --force" finishes the job
        errlog("killing container ", process.isolation_id, " failed: ", e.what());
    }
    if (kill(-process.pid, SIGKILL) && errno != ESRCH) {
        THROW("kill(-", process.pid, ", SIGKILL)", errmsg());
    }
}

ReapResult ContainerIsolation::reap(SpawnedProcess& process) {
    auto res = wait_for_child(process.pid);
    process.pidfd.reset(-1);
    if (res.si.code == CLD_EXITED) {
        if (res.si.status == DOCKER_RUN_FAILED_EXIT_CODE) {
            throw InfrastructureFault(
                "docker run failed to start container ", process.isolation_id
            );
        }
        if (res.si.status > 128 and res.si.status <= 128 + 64) {
            res.si = {.code = CLD_KILLED, .status = res.si.status - 128};
        }
    }
    // The client's usage says nothing about the container
    res.cpu_time = std::nullopt;
    res.peak_memory_bytes = std::nullopt;
    return res;
}

void ContainerIsolation::release_process(const SpawnedProcess& process) {
    run_docker({"rm", "--force", process.isolation_id}, {"No such container"});
}

void ContainerIsolation::remove_workspace(const string& workspace) {
    remove_workspace_dir(workspace);
}

} // namespace execbox::isolation
