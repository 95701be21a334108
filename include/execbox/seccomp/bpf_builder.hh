#pragma once

#include <array>
#include <cstdint>
#include <execbox/errmsg.hh>
#include <execbox/file_descriptor.hh>
#include <execbox/macros/throw.hh>
#include <seccomp.h>
#include <sys/mman.h>

namespace execbox::seccomp {

// Comparison of the syscall argument number `arg` with `datum`. For SCMP_CMP_MASKED_EQ `datum`
// is the mask and `datum_b` the value compared with the masked argument.
struct ArgCmp {
    unsigned int arg;
    scmp_compare op;
    uint64_t datum;
    uint64_t datum_b = 0;
};

class BpfBuilder {
    scmp_filter_ctx seccomp_ctx_;

    template <size_t N>
    void add_rule(uint32_t action, int syscall, const std::array<ArgCmp, N>& arg_cmps) {
        std::array<scmp_arg_cmp, N> native{};
        for (size_t i = 0; i < N; ++i) {
            native[i] = scmp_arg_cmp{
                .arg = arg_cmps[i].arg,
                .op = arg_cmps[i].op,
                .datum_a = arg_cmps[i].datum,
                .datum_b = arg_cmps[i].datum_b,
            };
        }
        int err = seccomp_rule_add_array(seccomp_ctx_, action, syscall, N, native.data());
        if (err) {
            THROW("seccomp_rule_add_array()", errmsg(-err));
        }
    }

public:
    explicit BpfBuilder(uint32_t def_action)
    : seccomp_ctx_{seccomp_init(def_action)} {
        if (!seccomp_ctx_) {
            THROW("seccomp_init() failed");
        }

        // Enable binary tree sorted syscalls in the filter
        int err = seccomp_attr_set(seccomp_ctx_, SCMP_FLTATR_CTL_OPTIMIZE, 2);
        if (err) {
            THROW("seccomp_attr_set()", errmsg(-err));
        }
    }

    BpfBuilder(const BpfBuilder&) = delete;
    BpfBuilder(BpfBuilder&&) = delete;
    BpfBuilder& operator=(const BpfBuilder&) = delete;
    BpfBuilder& operator=(BpfBuilder&&) = delete;

    // Makes @p syscall fail with @p errnum (when all @p arg_cmps match)
    template <class... Args>
    void err_syscall(int errnum, int syscall, Args... arg_cmps) {
        add_rule(
            SCMP_ACT_ERRNO(errnum), syscall, std::array<ArgCmp, sizeof...(Args)>{arg_cmps...}
        );
    }

    // Returns a memfd with the filter as an array of struct sock_filter
    [[nodiscard]] FileDescriptor export_to_fd() const {
        auto mfd = FileDescriptor{memfd_create("seccomp bpf", MFD_CLOEXEC)};
        if (!mfd.is_open()) {
            THROW("memfd_create()", errmsg());
        }

        int err = seccomp_export_bpf(seccomp_ctx_, mfd);
        if (err) {
            THROW("seccomp_export_bpf()", errmsg(-err));
        }

        return mfd;
    }

    ~BpfBuilder() { seccomp_release(seccomp_ctx_); }
};

} // namespace execbox::seccomp
