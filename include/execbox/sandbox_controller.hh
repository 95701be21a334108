#pragma once

#include <chrono>
#include <cstdint>
#include <execbox/cancellation.hh>
#include <execbox/execution_request.hh>
#include <execbox/io_channel.hh>
#include <execbox/isolation/isolation_backend.hh>
#include <execbox/limits.hh>
#include <execbox/resource_accountant.hh>
#include <execbox/runtime_profile.hh>
#include <execbox/si.hh>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace execbox {

enum class SandboxState : uint8_t {
    CREATED,
    RUNNING,
    COMPLETED,
    TIMED_OUT,
    SIGNALED,
    CANCELLED,
    FAULTED,
    DESTROYED,
};

[[nodiscard]] constexpr std::string_view to_str(SandboxState s) noexcept {
    switch (s) {
    case SandboxState::CREATED: return "created";
    case SandboxState::RUNNING: return "running";
    case SandboxState::COMPLETED: return "completed";
    case SandboxState::TIMED_OUT: return "timed_out";
    case SandboxState::SIGNALED: return "signaled";
    case SandboxState::CANCELLED: return "cancelled";
    case SandboxState::FAULTED: return "faulted";
    case SandboxState::DESTROYED: return "destroyed";
    }
    return "unknown";
}

// How the sandboxed process finished
struct Completion {
    SandboxState state; // COMPLETED, TIMED_OUT, SIGNALED or CANCELLED
    Si si;
    // TIMED_OUT or CANCELLED if the controller decided to terminate the process
    std::optional<SandboxState> termination_cause;
    bool termination_signal_sent;
    std::chrono::nanoseconds wall_time;
    std::optional<std::chrono::microseconds> cpu_time;
    std::optional<uint64_t> peak_memory_bytes;
};

class SandboxController;

// Exclusive owner of one sandbox. The sandbox is destroyed exactly once: by
// SandboxController::destroy() or by the destructor, whichever comes first.
class SandboxHandle {
    struct Sandbox {
        std::string request_id;
        const RuntimeProfile* profile;
        LimitSet limits;
        std::string workspace; // empty until the workspace is created
        std::vector<std::string> command;
        std::vector<std::string> env;
        std::optional<IoChannel> io;
        isolation::SpawnedProcess process;
        bool spawned = false;
        bool needs_reap = false;
        SandboxState state = SandboxState::CREATED;
        std::chrono::steady_clock::time_point start_time;
        ResourceAccountant::Reservation reservation;
    };

    SandboxController* controller_ = nullptr;
    std::unique_ptr<Sandbox> sb_;

    friend class SandboxController;

    SandboxHandle(SandboxController& controller, std::unique_ptr<Sandbox> sb) noexcept
    : controller_{&controller}
    , sb_{std::move(sb)} {}

    void destroy_if_needed() noexcept;

public:
    SandboxHandle(const SandboxHandle&) = delete;
    SandboxHandle(SandboxHandle&&) noexcept = default;
    SandboxHandle& operator=(const SandboxHandle&) = delete;

    SandboxHandle& operator=(SandboxHandle&& other) noexcept {
        if (this != &other) {
            destroy_if_needed();
            controller_ = other.controller_;
            sb_ = std::move(other.sb_);
        }
        return *this;
    }

    ~SandboxHandle() { destroy_if_needed(); }

    [[nodiscard]] SandboxState state() const noexcept { return sb_->state; }

    [[nodiscard]] const std::string& request_id() const noexcept { return sb_->request_id; }

    [[nodiscard]] const RuntimeProfile& profile() const noexcept { return *sb_->profile; }

    [[nodiscard]] const LimitSet& limits() const noexcept { return sb_->limits; }

    [[nodiscard]] const std::string& workspace() const noexcept { return sb_->workspace; }

    [[nodiscard]] const std::vector<std::string>& command() const noexcept {
        return sb_->command;
    }

    // Valid after start()
    [[nodiscard]] pid_t pid() const noexcept { return sb_->process.pid; }

    [[nodiscard]] const std::string& isolation_id() const noexcept {
        return sb_->process.isolation_id;
    }

    [[nodiscard]] std::chrono::steady_clock::time_point start_time() const noexcept {
        return sb_->start_time;
    }

    // Captured output, has to be taken before destroying
    [[nodiscard]] IoChannel::Output take_output();
};

/**
 * @brief Owns the lifecycle of sandboxes: create -> start -> await_completion -> destroy
 * @details The controller keeps no state between sandboxes, so one controller may be used from
 *   many threads concurrently. A fault in create(), start() or await_completion() destroys the
 *   sandbox at once and is rethrown as InfrastructureFault.
 */
class SandboxController {
public:
    struct Options {
        // Time between the graceful termination signal and SIGKILL
        std::chrono::milliseconds grace_period{5000};
        unsigned destroy_attempts = 3;
        // Time for reading the remaining output after the process group is killed
        std::chrono::milliseconds output_drain_timeout{1000};
    };

private:
    isolation::IsolationBackend& backend_;
    Options opts_;

public:
    SandboxController(isolation::IsolationBackend& backend, Options opts) noexcept
    : backend_{backend}
    , opts_{opts} {}

    [[nodiscard]] isolation::IsolationBackend& backend() const noexcept { return backend_; }

    [[nodiscard]] const Options& options() const noexcept { return opts_; }

    /**
     * @brief Creates the workspace, writes the request's files into it as the profile's
     *   identity and prepares the command and the I/O pipes. The @p reservation is released
     *   when the sandbox is destroyed.
     *
     * @errors Throws InfrastructureFault if anything fails (the sandbox is destroyed by then)
     */
    [[nodiscard]] SandboxHandle create(
        const RuntimeProfile& profile,
        const LimitSet& limits,
        const ExecutionRequest& req,
        ResourceAccountant::Reservation reservation = {}
    );

    /**
     * @brief Spawns the process: CREATED -> RUNNING
     *
     * @errors Throws InfrastructureFault if spawning fails (the sandbox is destroyed by then)
     *   and std::logic_error if the sandbox is not in the CREATED state
     */
    void start(SandboxHandle& handle);

    /**
     * @brief Pumps the I/O until the process exits, @p deadline passes or @p cancellation is
     *   cancelled, whichever comes first
     * @details On deadline or cancellation the process group gets SIGTERM and after the grace
     *   period SIGKILL (SIGKILL at once if the profile's entrypoint does not forward signals).
     *   Once the process exits, the rest of its process group is killed, the process is reaped
     *   and the remaining output is drained.
     *
     * @errors Throws InfrastructureFault if an isolation primitive fails (the sandbox is
     *   destroyed by then) and std::logic_error if the sandbox is not RUNNING
     */
    Completion await_completion(
        SandboxHandle& handle,
        std::chrono::steady_clock::time_point deadline,
        const CancellationToken* cancellation = nullptr
    );

    // Like above, with the deadline at the wall time limit after start
    Completion
    await_completion(SandboxHandle& handle, const CancellationToken* cancellation = nullptr) {
        return await_completion(
            handle, handle.start_time() + handle.limits().wall_time, cancellation
        );
    }

    /**
     * @brief Kills and reaps the process, removes the workspace and releases the reservation
     * @details Idempotent. Every step is retried up to destroy_attempts times, failures are
     *   logged to errlog.
     */
    void destroy(SandboxHandle& handle) noexcept;
};

} // namespace execbox
