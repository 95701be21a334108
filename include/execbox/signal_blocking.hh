#pragma once

#include <csignal>
#include <ctime>
#include <initializer_list>
#include <pthread.h>

// Blocks the given signals for the lifetime of the object
template <int (*func)(int, const sigset_t*, sigset_t*)>
class SignalBlockerBase {
private:
    sigset_t mask_{};
    sigset_t old_mask_{};

public:
    explicit SignalBlockerBase(std::initializer_list<int> signals) noexcept {
        sigemptyset(&mask_);
        for (int sig : signals) {
            sigaddset(&mask_, sig);
        }
        (void)func(SIG_BLOCK, &mask_, &old_mask_);
    }

    SignalBlockerBase(const SignalBlockerBase&) = delete;
    SignalBlockerBase(SignalBlockerBase&&) = delete;
    SignalBlockerBase& operator=(const SignalBlockerBase&) = delete;
    SignalBlockerBase& operator=(SignalBlockerBase&&) = delete;

    // Consumes the blocked signals that became pending, so that they are not delivered on
    // unblocking
    void discard_pending() noexcept {
        static constexpr timespec zero = {.tv_sec = 0, .tv_nsec = 0};
        while (sigtimedwait(&mask_, nullptr, &zero) > 0) {
        }
    }

    ~SignalBlockerBase() noexcept { (void)func(SIG_SETMASK, &old_mask_, nullptr); }
};

using SignalBlocker = SignalBlockerBase<sigprocmask>;
using ThreadSignalBlocker = SignalBlockerBase<pthread_sigmask>;
