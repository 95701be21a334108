#include "seccomp_filter.hh"

#include <cerrno>
#include <execbox/seccomp/bpf_builder.hh>
#include <sched.h>
#include <sys/socket.h>

namespace execbox::isolation {

FileDescriptor build_seccomp_filter(NetworkPolicy network) {
    using seccomp::ArgCmp;

    seccomp::BpfBuilder bpf(SCMP_ACT_ALLOW);
    // The process group is what the controller signals and kills
    bpf.err_syscall(EPERM, SCMP_SYS(setsid));
    bpf.err_syscall(EPERM, SCMP_SYS(setpgid));

    for (int sys : {
             SCMP_SYS(unshare),
             SCMP_SYS(setns),
             SCMP_SYS(mount),
             SCMP_SYS(umount2),
             SCMP_SYS(pivot_root),
             SCMP_SYS(chroot),
             SCMP_SYS(ptrace),
             SCMP_SYS(process_vm_readv),
             SCMP_SYS(process_vm_writev),
             SCMP_SYS(bpf),
             SCMP_SYS(perf_event_open),
             SCMP_SYS(keyctl),
             SCMP_SYS(add_key),
             SCMP_SYS(request_key),
             SCMP_SYS(userfaultfd),
             // io_uring operations bypass the seccomp filter
             SCMP_SYS(io_uring_setup),
             SCMP_SYS(io_uring_enter),
             SCMP_SYS(io_uring_register),
             SCMP_SYS(kexec_load),
             SCMP_SYS(init_module),
             SCMP_SYS(finit_module),
             SCMP_SYS(delete_module),
             SCMP_SYS(reboot),
             SCMP_SYS(swapon),
             SCMP_SYS(swapoff),
         })
    {
        bpf.err_syscall(EPERM, sys);
    }

    // clone3() passes flags in memory, so it cannot be filtered by flags; glibc falls back to
    // clone()
    bpf.err_syscall(ENOSYS, SCMP_SYS(clone3));
    for (uint64_t ns_flag : {
             CLONE_NEWUSER,
             CLONE_NEWNS,
             CLONE_NEWPID,
             CLONE_NEWNET,
             CLONE_NEWIPC,
             CLONE_NEWUTS,
             CLONE_NEWCGROUP,
         })
    {
        bpf.err_syscall(
            EPERM,
            SCMP_SYS(clone),
            ArgCmp{.arg = 0, .op = SCMP_CMP_MASKED_EQ, .datum = ns_flag, .datum_b = ns_flag}
        );
    }

    if (network == NetworkPolicy::DENIED) {
        bpf.err_syscall(
            EACCES,
            SCMP_SYS(socket),
            ArgCmp{.arg = 0, .op = SCMP_CMP_NE, .datum = AF_UNIX}
        );
        bpf.err_syscall(
            EACCES,
            SCMP_SYS(socketpair),
            ArgCmp{.arg = 0, .op = SCMP_CMP_NE, .datum = AF_UNIX}
        );
    }

    return bpf.export_to_fd();
}

} // namespace execbox::isolation
