#pragma once

#include <cstdint>
#include <execbox/file_descriptor.hh>
#include <execbox/si.hh>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace execbox::isolation {

struct ChildOptions {
    std::vector<std::string> argv;
    std::vector<std::string> env;
    std::optional<std::string> working_dir;
    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
    std::optional<int> cgroup_fd; // the child is created inside this cgroup (a directory fd)

    // Runs the program under a pid1 process inside new user, PID and mount namespaces. The
    // program sees only the processes of its own sandbox (a fresh /proc is mounted) and only its
    // own workspace under workspace_root: an empty tmpfs is mounted over workspace_root and the
    // workspace is bind-mounted back.
    struct Namespaces {
        std::string workspace_root;
        std::string workspace;
    };

    std::optional<Namespaces> namespaces;

    struct Prlimit {
        std::optional<uint64_t> max_address_space_size_in_bytes;
        std::optional<uint64_t> cpu_time_limit_in_seconds;
        std::optional<uint64_t> max_file_size_in_bytes;
        std::optional<uint64_t> file_descriptors_num_limit;
        std::optional<uint64_t> process_num_limit;
        std::optional<uint64_t> max_core_file_size_in_bytes;
    } prlimit = {};

    struct Identity {
        uid_t uid;
        gid_t gid;
    };

    std::optional<Identity> switch_identity; // requires root
    std::optional<int> seccomp_bpf_fd;
};

// Written by pid1 to the memory shared with the spawning process just before pid1 exits
struct Pid1Report {
    enum class State : int32_t {
        NONE = 0, // pid1 was killed (or failed) before the program was reaped
        PROGRAM_EXITED,
        FAILED, // waitid() failed inside pid1, errnum is set
    };

    volatile State state;
    volatile int si_code;
    volatile int status;
    volatile int errnum;
};

struct Child {
    pid_t pid; // the program itself or its pid1 if ChildOptions::namespaces was set
    FileDescriptor pidfd;
    std::shared_ptr<Pid1Report> pid1_report; // set iff ChildOptions::namespaces was set
};

/**
 * @brief Creates a child that executes argv[0] (searched in PATH) with the @p opts applied. The
 *   child leads a new session and process group and is killed if the current thread dies. If
 *   @p opts.namespaces is set, the child is pid1 of a new PID namespace that runs the program as
 *   its only direct child, reaps every orphan and exits once the program is reaped (which kills
 *   every remaining process of the namespace).
 *
 * @errors Throws std::runtime_error if creating the child fails or setting up the child fails
 *   (the error reported by the child is included in the message)
 */
Child spawn_child(const ChildOptions& opts);

// Returns the status of the program reported by pid1 that exited with @p pid1_si
//
// @errors Throws std::runtime_error if pid1 failed
[[nodiscard]] Si program_si(const Pid1Report& report, const Si& pid1_si);

// Returns true iff the current process can create user, PID and mount namespaces and mount a
// fresh /proc and a tmpfs at @p tmpfs_mount_point inside them
bool can_use_namespaces(const std::string& tmpfs_mount_point);

} // namespace execbox::isolation
