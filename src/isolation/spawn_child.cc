#include "do_die_with_error.hh"
#include "spawn_child.hh"

#include <algorithm>
#include <array>
#include <csignal>
#include <execbox/concat_tostr.hh>
#include <execbox/errmsg.hh>
#include <execbox/file_manip.hh>
#include <execbox/logger.hh>
#include <execbox/macros/throw.hh>
#include <execbox/pipe.hh>
#include <execbox/syscalls.hh>
#include <fcntl.h>
#include <grp.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <new>
#include <poll.h>
#include <sched.h>
#include <string_view>
#include <sys/capability.h>
#include <sys/mman.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <type_traits>
#include <unistd.h>

namespace execbox::isolation {

namespace {

struct CapFree {
    void operator()(cap_t caps) const noexcept { (void)cap_free(caps); }
};

// Everything the child needs, prepared before clone3() so that the child does not allocate
struct PreparedArgs {
    std::vector<char*> argv;
    std::vector<char*> env;
    std::unique_ptr<std::remove_pointer_t<cap_t>, CapFree> no_capabilities;
};

// Set in the child processes only
int child_error_fd = -1;
const char* child_name = "child";

template <class... Args>
[[noreturn]] void die_with_msg(Args&&... msg) noexcept {
    do_die_with_msg(child_error_fd, child_name, ": ", std::forward<Args>(msg)...);
}

template <class... Args>
[[noreturn]] void die_with_error(Args&&... msg) noexcept {
    do_die_with_error(child_error_fd, child_name, ": ", std::forward<Args>(msg)...);
}

void kill_on_parent_death(int parent_pidfd) noexcept {
    if (prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0)) {
        die_with_error("prctl(PR_SET_PDEATHSIG)");
    }
    // The parent may have died before prctl(). getppid() cannot tell it inside a new PID
    // namespace, the parent's pidfd can.
    pollfd pfd = {
        .fd = parent_pidfd,
        .events = POLLIN,
        .revents = 0,
    };
    if (poll(&pfd, 1, 0) == 1) {
        _exit(1);
    }
}

void become_session_leader() noexcept {
    if (setsid() < 0) {
        die_with_error("setsid()");
    }
}

void reset_signals() noexcept {
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    if (sigprocmask(SIG_SETMASK, &empty_mask, nullptr)) {
        die_with_error("sigprocmask()");
    }
    // Ignored signals stay ignored across execve()
    for (int sig = 1; sig < NSIG; ++sig) {
        if (sig != SIGKILL && sig != SIGSTOP) {
            (void)signal(sig, SIG_DFL);
        }
    }
}

void setup_std_fds(const ChildOptions& opts) noexcept {
    if (opts.stdin_fd >= 0 && dup3(opts.stdin_fd, STDIN_FILENO, 0) < 0) {
        die_with_error("dup3()");
    }
    if (opts.stdout_fd >= 0 && dup3(opts.stdout_fd, STDOUT_FILENO, 0) < 0) {
        die_with_error("dup3()");
    }
    if (opts.stderr_fd >= 0 && dup3(opts.stderr_fd, STDERR_FILENO, 0) < 0) {
        die_with_error("dup3()");
    }
}

template <size_t N>
void close_all_non_std_file_descriptors_except(std::array<int, N> surviving_fds) noexcept {
    std::sort(surviving_fds.begin(), surviving_fds.end());
    int prev_fd = STDERR_FILENO;
    for (auto fd : surviving_fds) {
        if (fd <= prev_fd) {
            continue; // absent (-1) or a standard one
        }
        if (prev_fd + 1 < fd &&
            syscalls::close_range(
                static_cast<unsigned>(prev_fd + 1), static_cast<unsigned>(fd - 1), 0
            ))
        {
            die_with_error("close_range()");
        }
        prev_fd = fd;
    }
    if (syscalls::close_range(static_cast<unsigned>(prev_fd + 1), ~0U, 0)) {
        die_with_error("close_range()");
    }
}

void wait_for_id_maps(int sync_fd) noexcept {
    char byte;
    if (read(sync_fd, &byte, 1) != 1) {
        _exit(1); // the parent failed and kills us
    }
    if (close(sync_fd)) {
        die_with_error("close()");
    }
}

void setup_mount_namespace(const ChildOptions::Namespaces& ns) noexcept {
    // Do not propagate our mounts to the host
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr)) {
        die_with_error("mount(/, MS_PRIVATE)");
    }
    // The working directory keeps the own workspace reachable after it is covered
    if (chdir(ns.workspace.c_str())) {
        die_with_error("chdir(", ns.workspace, ")");
    }
    if (mount(
            "tmpfs", ns.workspace_root.c_str(), "tmpfs", MS_NOSUID | MS_NODEV, "size=50m,mode=1777"
        ))
    {
        die_with_error("mount(tmpfs, ", ns.workspace_root, ")");
    }
    if (mkdir(ns.workspace.c_str(), 0700)) {
        die_with_error("mkdir(", ns.workspace, ")");
    }
    if (mount(".", ns.workspace.c_str(), nullptr, MS_BIND | MS_REC, nullptr)) {
        die_with_error("mount(bind, ", ns.workspace, ")");
    }
    // Shows only the processes of the new PID namespace
    if (mount("proc", "/proc", "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr)) {
        die_with_error("mount(proc, /proc)");
    }
}

void change_working_dir(const ChildOptions& opts) noexcept {
    if (opts.working_dir && chdir(opts.working_dir->c_str())) {
        die_with_error("chdir(", *opts.working_dir, ")");
    }
}

void switch_identity(const ChildOptions::Identity& id) noexcept {
    if (setgroups(0, nullptr)) {
        die_with_error("setgroups()");
    }
    if (setresgid(id.gid, id.gid, id.gid)) {
        die_with_error("setresgid()");
    }
    if (setresuid(id.uid, id.uid, id.uid)) {
        die_with_error("setresuid()");
    }
}

void drop_all_capabilities(cap_t no_capabilities) noexcept {
    if (cap_set_proc(no_capabilities)) {
        die_with_error("cap_set_proc()");
    }
}

void setup_prlimit(const ChildOptions::Prlimit& pr) noexcept {
    auto setup_limit = [&](auto resource, std::optional<uint64_t> opt, uint64_t hard_extra = 0
                       ) noexcept {
        if (not opt) {
            return;
        }
        rlimit64 old_rlim;
        if (prlimit64(0, resource, nullptr, &old_rlim)) {
            die_with_error("prlimit()");
        }
        // An unprivileged process cannot raise the hard limit
        rlimit64 rlim = {
            .rlim_cur = std::min<rlim64_t>(*opt, old_rlim.rlim_max),
            .rlim_max = std::min<rlim64_t>(*opt + hard_extra, old_rlim.rlim_max),
        };
        if (prlimit64(0, resource, &rlim, nullptr)) {
            die_with_error("prlimit()");
        }
    };
    setup_limit(RLIMIT_AS, pr.max_address_space_size_in_bytes);
    // The soft limit sends SIGXCPU, the hard limit a second later sends SIGKILL
    setup_limit(RLIMIT_CPU, pr.cpu_time_limit_in_seconds, 1);
    setup_limit(RLIMIT_FSIZE, pr.max_file_size_in_bytes);
    setup_limit(RLIMIT_NOFILE, pr.file_descriptors_num_limit);
    setup_limit(RLIMIT_NPROC, pr.process_num_limit);
    setup_limit(RLIMIT_CORE, pr.max_core_file_size_in_bytes);
}

void install_seccomp_filter(int fd) noexcept {
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0)) {
        die_with_error("prctl(PR_SET_NO_NEW_PRIVS)");
    }
    auto fd_len = lseek64(fd, 0, SEEK_END);
    if (fd_len < 0) {
        die_with_error("lseek64()");
    }
    if (fd_len % sizeof(sock_filter) != 0) {
        die_with_msg(
            "invalid seccomp_bpf_fd length: ", fd_len, " is not a multiple of ", sizeof(sock_filter)
        );
    }
    auto fprog_len = static_cast<uint64_t>(fd_len) / sizeof(sock_filter);
    if (fprog_len > UINT16_MAX) {
        die_with_msg("seccomp_bpf_fd is too big");
    }
    void* seccomp_filter_ptr =
        mmap(nullptr, static_cast<size_t>(fd_len), PROT_READ, MAP_PRIVATE, fd, 0);
    if (seccomp_filter_ptr == MAP_FAILED) {
        die_with_error("mmap()");
    }
    auto fprog = sock_fprog{
        .len = static_cast<uint16_t>(fprog_len),
        .filter = static_cast<sock_filter*>(seccomp_filter_ptr),
    };
    if (syscalls::seccomp_set_filter(&fprog)) {
        die_with_error("seccomp()");
    }
}

// Applies the per-process restrictions and executes the program
[[noreturn]] void exec_program(const ChildOptions& opts, const PreparedArgs& args) noexcept {
    setup_prlimit(opts.prlimit);
    // Exceeding the file size limit makes write() fail with EFBIG instead of killing
    if (signal(SIGXFSZ, SIG_IGN) == SIG_ERR) {
        die_with_error("signal(SIGXFSZ)");
    }
    if (opts.seccomp_bpf_fd) {
        install_seccomp_filter(*opts.seccomp_bpf_fd);
    }
    // Descriptors leaked by other threads (no O_CLOEXEC) must not reach the sandbox
    if (syscalls::mark_cloexec_from(STDERR_FILENO + 1) && errno != ENOSYS) {
        die_with_error("close_range()");
    }

    execvpe(args.argv[0], args.argv.data(), args.env.data());
    die_with_error("execvpe(", args.argv[0], ")");
}

[[noreturn]] void
program_main(const ChildOptions& opts, const PreparedArgs& args, int parent_pidfd) noexcept {
    kill_on_parent_death(parent_pidfd);
    become_session_leader();
    reset_signals();
    setup_std_fds(opts);
    change_working_dir(opts);
    if (opts.switch_identity) {
        switch_identity(*opts.switch_identity);
        // Changing the effective uid clears the parent death signal
        kill_on_parent_death(parent_pidfd);
    }
    if (close(parent_pidfd)) {
        die_with_error("close()");
    }
    exec_program(opts, args);
}

[[noreturn]] void report_failure(Pid1Report* report, int errnum) noexcept {
    report->errnum = errnum;
    report->state = Pid1Report::State::FAILED;
    _exit(1);
}

// Runs as pid1 of the new PID namespace. Once the program is reaped pid1 exits and the kernel
// kills every process left in the namespace.
[[noreturn]] void pid1_main(
    const ChildOptions& opts,
    const PreparedArgs& args,
    int parent_pidfd,
    int sync_fd,
    Pid1Report* report
) noexcept {
    child_name = "pid1";
    kill_on_parent_death(parent_pidfd);
    become_session_leader();
    reset_signals();
    setup_std_fds(opts);
    // The parent writes our uid_map and gid_map
    wait_for_id_maps(sync_fd);
    close_all_non_std_file_descriptors_except(
        std::array{child_error_fd, parent_pidfd, opts.seccomp_bpf_fd.value_or(-1)}
    );

    setup_mount_namespace(*opts.namespaces);
    change_working_dir(opts);
    if (opts.switch_identity) {
        switch_identity(*opts.switch_identity);
        // Changing the effective uid clears the parent death signal
        kill_on_parent_death(parent_pidfd);
    }
    if (close(parent_pidfd)) {
        die_with_error("close()");
    }
    drop_all_capabilities(args.no_capabilities.get());

    clone_args cl_args = {};
    cl_args.exit_signal = SIGCHLD;
    auto program_pid = syscalls::clone3(&cl_args);
    if (program_pid == -1) {
        die_with_error("clone3()");
    }
    if (program_pid == 0) {
        child_name = "child";
        exec_program(opts, args);
    }

    // pid1 must not keep the output pipes open or the seccomp filter around
    if (opts.seccomp_bpf_fd && close(*opts.seccomp_bpf_fd)) {
        die_with_error("close()");
    }
    for (int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
        if (close(fd) && errno != EBADF) {
            die_with_error("close()");
        }
    }
    // EOF on the error pipe tells the parent that spawning succeeded
    if (close(child_error_fd)) {
        report_failure(report, errno);
    }

    siginfo_t si;
    for (;;) {
        if (syscalls::waitid(P_ALL, 0, &si, __WALL | WEXITED, nullptr)) {
            if (errno == EINTR) {
                continue;
            }
            report_failure(report, errno);
        }
        if (si.si_pid == program_pid) {
            break;
        }
    }
    report->si_code = si.si_code;
    report->status = si.si_status;
    report->state = Pid1Report::State::PROGRAM_EXITED;
    _exit(0);
}

int wait_for_exit_status(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            THROW("waitpid()", errmsg());
        }
    }
    return status;
}

void kill_and_reap(pid_t pid) noexcept {
    (void)kill(pid, SIGKILL);
    while (waitpid(pid, nullptr, 0) == -1 && errno == EINTR) {
    }
}

std::string id_map_with_root(uint32_t id) {
    // Keeping root mapped lets pid1 set the namespace up as root before switching the identity
    if (id == 0) {
        return "0 0 1";
    }
    return concat_tostr("0 0 1\n", id, ' ', id, " 1");
}

// Without @p identity maps only the current effective ids (allowed without privileges)
void write_id_maps(pid_t pid, const std::optional<ChildOptions::Identity>& identity) {
    auto write = [&](std::string_view file, std::string_view data) {
        auto path = concat_tostr("/proc/", pid, '/', file);
        FileDescriptor fd{path, O_WRONLY | O_CLOEXEC};
        if (!fd.is_open()) {
            THROW("open(", path, ")", errmsg());
        }
        if (write_all(fd, data) != data.size()) {
            THROW("write(", path, ")", errmsg());
        }
    };
    if (identity) {
        write("uid_map", id_map_with_root(identity->uid));
        write("gid_map", id_map_with_root(identity->gid));
    } else {
        write("uid_map", concat_tostr(geteuid(), ' ', geteuid(), " 1"));
        write("setgroups", "deny");
        write("gid_map", concat_tostr(getegid(), ' ', getegid(), " 1"));
    }
}

std::shared_ptr<Pid1Report> map_pid1_report() {
    void* mem = mmap(
        nullptr, sizeof(Pid1Report), PROT_READ | PROT_WRITE, MAP_SHARED | MAP_ANONYMOUS, -1, 0
    );
    if (mem == MAP_FAILED) {
        THROW("mmap()", errmsg());
    }
    auto* report = new (mem) Pid1Report{};
    return std::shared_ptr<Pid1Report>(report, [](Pid1Report* r) {
        if (munmap(r, sizeof(Pid1Report))) {
            errlog("munmap()", errmsg());
        }
    });
}

} // namespace

Child spawn_child(const ChildOptions& opts) {
    if (opts.argv.empty()) {
        THROW("argv cannot be empty");
    }

    // execvpe() takes non-const pointers, the strings themselves are not modified
    PreparedArgs args;
    for (const auto& arg : opts.argv) {
        args.argv.emplace_back(const_cast<char*>(arg.c_str())); // NOLINT
    }
    args.argv.emplace_back(nullptr);
    for (const auto& var : opts.env) {
        args.env.emplace_back(const_cast<char*>(var.c_str())); // NOLINT
    }
    args.env.emplace_back(nullptr);

    auto error_pipe = pipe2(O_CLOEXEC);
    if (!error_pipe) {
        THROW("pipe2()", errmsg());
    }
    std::optional<Pipe> sync_pipe;
    std::shared_ptr<Pid1Report> pid1_report;
    if (opts.namespaces) {
        sync_pipe = pipe2(O_CLOEXEC);
        if (!sync_pipe) {
            THROW("pipe2()", errmsg());
        }
        pid1_report = map_pid1_report();
        args.no_capabilities.reset(cap_init()); // all capabilities are cleared
        if (!args.no_capabilities) {
            THROW("cap_init()", errmsg());
        }
    }

    auto parent_pidfd = FileDescriptor{syscalls::pidfd_open(getpid(), 0)};
    if (!parent_pidfd.is_open()) {
        THROW("pidfd_open()", errmsg());
    }

    int child_pidfd = -1;
    clone_args cl_args = {};
    cl_args.flags = CLONE_PIDFD;
    cl_args.pidfd = reinterpret_cast<uint64_t>(&child_pidfd);
    cl_args.exit_signal = SIGCHLD;
    if (opts.cgroup_fd) {
        cl_args.flags |= CLONE_INTO_CGROUP;
        cl_args.cgroup = static_cast<uint64_t>(*opts.cgroup_fd);
    }
    if (opts.namespaces) {
        cl_args.flags |= CLONE_NEWUSER | CLONE_NEWPID | CLONE_NEWNS;
    }
    auto pid = syscalls::clone3(&cl_args);
    if (pid == -1) {
        THROW("clone3()", errmsg());
    }
    if (pid == 0) {
        child_error_fd = error_pipe->writable;
        if (opts.namespaces) {
            pid1_main(opts, args, parent_pidfd, sync_pipe->readable, pid1_report.get());
        }
        program_main(opts, args, parent_pidfd);
    }

    Child child = {
        .pid = static_cast<pid_t>(pid),
        .pidfd = FileDescriptor{child_pidfd},
        .pid1_report = std::move(pid1_report),
    };
    try {
        if (opts.namespaces) {
            if (sync_pipe->readable.close()) {
                THROW("close()", errmsg());
            }
            write_id_maps(child.pid, opts.switch_identity);
            if (write_all(sync_pipe->writable, "x") != 1) {
                THROW("write()", errmsg());
            }
            if (sync_pipe->writable.close()) {
                THROW("close()", errmsg());
            }
        }
        if (error_pipe->writable.close()) {
            THROW("close()", errmsg());
        }
        // The pipe reaches EOF at the successful exec (O_CLOEXEC) of the program (and pid1
        // closing it) or at the death of the child
        auto child_error = get_file_contents(error_pipe->readable);
        if (not child_error.empty()) {
            THROW(child_error);
        }
    } catch (const std::exception&) {
        kill_and_reap(child.pid);
        throw;
    }
    return child;
}

Si program_si(const Pid1Report& report, const Si& pid1_si) {
    switch (report.state) {
    case Pid1Report::State::PROGRAM_EXITED:
        return Si{.code = report.si_code, .status = report.status};
    case Pid1Report::State::FAILED:
        THROW("sandbox pid1: waitid()", errmsg(report.errnum));
    case Pid1Report::State::NONE:
        // Killed before the program exited: the program died with the namespace
        if (pid1_si.code != CLD_EXITED) {
            return pid1_si;
        }
        THROW("sandbox pid1 exited without reaping the program: ", pid1_si.description());
    }
    THROW("invalid pid1 report state: ", static_cast<int32_t>(report.state));
}

bool can_use_namespaces(const std::string& tmpfs_mount_point) {
    auto sync_pipe = pipe2(O_CLOEXEC);
    if (!sync_pipe) {
        THROW("pipe2()", errmsg());
    }

    clone_args cl_args = {};
    cl_args.flags = CLONE_NEWUSER | CLONE_NEWPID | CLONE_NEWNS;
    cl_args.exit_signal = SIGCHLD;
    auto pid = syscalls::clone3(&cl_args);
    if (pid == -1) {
        debuglog("clone3(CLONE_NEWUSER | CLONE_NEWPID | CLONE_NEWNS)", errmsg());
        return false;
    }
    if (pid == 0) {
        char byte;
        if (close(sync_pipe->writable) || read(sync_pipe->readable, &byte, 1) != 1) {
            _exit(1);
        }
        if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr)) {
            _exit(2);
        }
        if (mount("proc", "/proc", "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr)) {
            _exit(3);
        }
        if (mount("tmpfs", tmpfs_mount_point.c_str(), "tmpfs", MS_NOSUID | MS_NODEV, "size=1m")) {
            _exit(4);
        }
        _exit(0);
    }

    try {
        if (sync_pipe->readable.close()) {
            THROW("close()", errmsg());
        }
        write_id_maps(static_cast<pid_t>(pid), std::nullopt);
        if (write_all(sync_pipe->writable, "x") != 1) {
            THROW("write()", errmsg());
        }
    } catch (const std::exception& e) {
        debuglog("setting up the namespaces failed: ", e.what());
        kill_and_reap(static_cast<pid_t>(pid));
        return false;
    }

    int status = wait_for_exit_status(static_cast<pid_t>(pid));
    if (not WIFEXITED(status) or WEXITSTATUS(status) != 0) {
        debuglog("namespace setup failed in the child, wait status: ", status);
        return false;
    }
    return true;
}

} // namespace execbox::isolation
