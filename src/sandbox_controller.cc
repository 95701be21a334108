#include <array>
#include <csignal>
#include <execbox/errors.hh>
#include <execbox/logger.hh>
#include <execbox/random.hh>
#include <execbox/result_assembler.hh>
#include <execbox/sandbox_controller.hh>
#include <poll.h>
#include <stdexcept>
#include <utility>

using std::chrono::steady_clock;
using std::string;

namespace execbox {

namespace {

constexpr size_t GENERATED_REQUEST_ID_LEN = 32;

template <class... Context>
[[noreturn]] void throw_infrastructure_fault(const std::exception& e, Context&&... context) {
    throw InfrastructureFault(std::forward<Context>(context)..., ": ", e.what());
}

} // namespace

void SandboxHandle::destroy_if_needed() noexcept {
    if (sb_ and sb_->state != SandboxState::DESTROYED) {
        controller_->destroy(*this);
    }
}

IoChannel::Output SandboxHandle::take_output() {
    if (not sb_->io) {
        throw std::logic_error("the output of a destroyed sandbox is gone");
    }
    return sb_->io->take_output();
}

SandboxHandle SandboxController::create(
    const RuntimeProfile& profile,
    const LimitSet& limits,
    const ExecutionRequest& req,
    ResourceAccountant::Reservation reservation
) {
    auto sb = std::make_unique<SandboxHandle::Sandbox>();
    sb->request_id = req.id.empty() ? random_hex_string(GENERATED_REQUEST_ID_LEN) : req.id;
    sb->profile = &profile;
    sb->limits = limits;
    sb->reservation = std::move(reservation);
    sb->command = profile.command;
    sb->command.insert(sb->command.end(), req.arguments.begin(), req.arguments.end());
    for (const auto& [name, value] : req.environment) {
        sb->env.emplace_back(concat_tostr(name, '=', value));
    }

    SandboxHandle handle{*this, std::move(sb)};
    auto& s = *handle.sb_;
    try {
        s.workspace = backend_.create_workspace(s.request_id, profile);
        for (const auto& file : req.files) {
            backend_.write_file(s.workspace, file, profile);
        }
        s.io.emplace(req.stdin_data.value_or(""), limits.max_output_bytes, req.capture_combined);
    } catch (const std::exception& e) {
        s.state = SandboxState::FAULTED;
        destroy(handle);
        throw_infrastructure_fault(e, "creating sandbox ", s.request_id, " failed");
    }
    debuglog("sandbox ", s.request_id, " created: ", s.workspace);
    return handle;
}

void SandboxController::start(SandboxHandle& handle) {
    auto& s = *handle.sb_;
    if (s.state != SandboxState::CREATED) {
        throw std::logic_error(concat_tostr("cannot start a sandbox in state ", to_str(s.state)));
    }
    try {
        s.start_time = steady_clock::now();
        s.process = backend_.spawn({
            .request_id = s.request_id,
            .profile = *s.profile,
            .limits = s.limits,
            .workspace = s.workspace,
            .command = s.command,
            .env = s.env,
            .stdin_fd = s.io->child_stdin(),
            .stdout_fd = s.io->child_stdout(),
            .stderr_fd = s.io->child_stderr(),
        });
        s.spawned = true;
        s.needs_reap = true;
        s.io->close_child_ends();
        s.state = SandboxState::RUNNING;
    } catch (const std::exception& e) {
        s.state = SandboxState::FAULTED;
        destroy(handle);
        throw_infrastructure_fault(e, "starting sandbox ", s.request_id, " failed");
    }
    debuglog("sandbox ", s.request_id, " started: pid ", s.process.pid);
}

Completion SandboxController::await_completion(
    SandboxHandle& handle,
    steady_clock::time_point deadline,
    const CancellationToken* cancellation
) {
    auto& s = *handle.sb_;
    if (s.state != SandboxState::RUNNING) {
        throw std::logic_error(
            concat_tostr("cannot await a sandbox in state ", to_str(s.state))
        );
    }
    try {
        std::optional<SandboxState> termination_cause;
        bool termination_signal_sent = false;
        std::optional<steady_clock::time_point> kill_at;
        bool killed = false;

        auto terminate = [&](SandboxState cause) {
            termination_cause = cause;
            debuglog("sandbox ", s.request_id, ": terminating (", to_str(cause), ')');
            if (s.profile->forwards_signals_to_child) {
                backend_.signal_group(s.process, SIGTERM);
                kill_at = steady_clock::now() + opts_.grace_period;
            } else {
                backend_.kill_group(s.process);
                killed = true;
            }
            termination_signal_sent = true;
        };
        auto ms_until = [](steady_clock::time_point tp, steady_clock::time_point now) {
            return std::chrono::ceil<std::chrono::milliseconds>(tp - now);
        };

        steady_clock::time_point end_time;
        for (;;) {
            auto now = steady_clock::now();
            if (not termination_cause) {
                if (cancellation and cancellation->is_cancelled()) {
                    terminate(SandboxState::CANCELLED);
                } else if (now >= deadline) {
                    terminate(SandboxState::TIMED_OUT);
                }
            }
            if (kill_at and not killed and now >= *kill_at) {
                debuglog("sandbox ", s.request_id, ": grace period elapsed, killing");
                backend_.kill_group(s.process);
                killed = true;
            }

            std::optional<std::chrono::milliseconds> timeout;
            if (not termination_cause) {
                timeout = ms_until(deadline, now);
            } else if (not killed) {
                timeout = ms_until(*kill_at, now);
            }
            int cancellation_fd = -1; // ignored by poll()
            if (cancellation and not termination_cause) {
                cancellation_fd = cancellation->fd();
            }
            std::array<pollfd, 2> extra = {{
                {.fd = s.process.pidfd, .events = POLLIN, .revents = 0},
                {.fd = cancellation_fd, .events = POLLIN, .revents = 0},
            }};
            s.io->poll_and_pump(extra, timeout);
            if (extra[0].revents & POLLIN) {
                end_time = steady_clock::now();
                break;
            }
        }

        // Processes left in the group must not outlive the sandbox. The group is killed before
        // the leader is reaped, so that the process group id cannot be reused in between.
        backend_.kill_group(s.process);
        s.needs_reap = false;
        auto reaped = backend_.reap(s.process);
        s.io->drain(opts_.output_drain_timeout);

        Completion completion = {
            .state = classify_termination(reaped.si, termination_cause, termination_signal_sent),
            .si = reaped.si,
            .termination_cause = termination_cause,
            .termination_signal_sent = termination_signal_sent,
            .wall_time = end_time - s.start_time,
            .cpu_time = reaped.cpu_time,
            .peak_memory_bytes = reaped.peak_memory_bytes,
        };
        s.state = completion.state;
        debuglog(
            "sandbox ", s.request_id, ": ", to_str(s.state), " (", reaped.si.description(), ')'
        );
        return completion;
    } catch (const std::exception& e) {
        s.state = SandboxState::FAULTED;
        destroy(handle);
        throw_infrastructure_fault(e, "awaiting sandbox ", s.request_id, " failed");
    }
}

void SandboxController::destroy(SandboxHandle& handle) noexcept {
    if (not handle.sb_ or handle.sb_->state == SandboxState::DESTROYED) {
        return;
    }
    auto& s = *handle.sb_;
    // Returns true on success
    auto with_retries = [&](const char* what, auto&& func) noexcept {
        for (unsigned attempt = 1; attempt <= opts_.destroy_attempts; ++attempt) {
            try {
                func();
                return true;
            } catch (const std::exception& e) {
                errlog(
                    "sandbox ",
                    s.request_id,
                    ": ",
                    what,
                    " failed (attempt ",
                    attempt,
                    '/',
                    opts_.destroy_attempts,
                    "): ",
                    e.what()
                );
            }
        }
        return false;
    };

    bool clean = true;
    if (s.needs_reap) {
        clean &= with_retries("killing the process group", [&] { backend_.kill_group(s.process); });
        // The process may be reaped only once, even if reap() fails
        s.needs_reap = false;
        clean &= with_retries("reaping the process", [&] { (void)backend_.reap(s.process); });
    }
    if (s.spawned) {
        clean &=
            with_retries("releasing the process", [&] { backend_.release_process(s.process); });
        s.spawned = false;
    }
    if (not s.workspace.empty()) {
        clean &=
            with_retries("removing the workspace", [&] { backend_.remove_workspace(s.workspace); });
    }
    s.io.reset();
    s.reservation.release();
    s.state = SandboxState::DESTROYED;
    if (clean) {
        debuglog("sandbox ", s.request_id, " destroyed");
    } else {
        errlog("sandbox ", s.request_id, " destroyed with errors, resources may have leaked");
    }
}

} // namespace execbox
