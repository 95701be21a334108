#pragma once

#include <csignal>
#include <linux/close_range.h>
#include <linux/sched.h>
#include <linux/seccomp.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

// Headers older than Linux 5.11 lack it
#ifndef CLOSE_RANGE_CLOEXEC
#define CLOSE_RANGE_CLOEXEC (1U << 2)
#endif

extern "C" struct rusage;
extern "C" struct sock_fprog;

// Raw system calls that glibc does not wrap (or wraps without the needed arguments)
namespace syscalls {

// Unlike the glibc wrapper it also returns the resource usage of the reaped child
inline int
waitid(int id_type, pid_t id, siginfo_t* info, int options, struct rusage* usage) noexcept {
    return static_cast<int>(syscall(SYS_waitid, id_type, id, info, options, usage));
}

// Without CLONE_VM behaves like fork() but does not run the pthread_atfork() handlers
inline long clone3(struct clone_args* cl_args) noexcept {
    return syscall(SYS_clone3, cl_args, sizeof(*cl_args));
}

inline int pidfd_open(pid_t pid, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_pidfd_open, pid, flags));
}

// Async-signal-safe, usable between fork() and exec()
inline int seccomp_set_filter(const struct sock_fprog* prog) noexcept {
    return static_cast<int>(syscall(SYS_seccomp, SECCOMP_SET_MODE_FILTER, 0, prog));
}

// Fails with ENOSYS on kernels older than 5.11 (for CLOSE_RANGE_CLOEXEC)
inline int mark_cloexec_from(unsigned int first_fd) noexcept {
    return static_cast<int>(syscall(SYS_close_range, first_fd, ~0U, CLOSE_RANGE_CLOEXEC));
}

inline int close_range(unsigned int first_fd, unsigned int last_fd, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_close_range, first_fd, last_fd, flags));
}

} // namespace syscalls
