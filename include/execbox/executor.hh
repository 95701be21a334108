#pragma once

#include <atomic>
#include <cstdint>
#include <execbox/cancellation.hh>
#include <execbox/execution_request.hh>
#include <execbox/execution_result.hh>
#include <execbox/isolation/isolation_backend.hh>
#include <execbox/resource_accountant.hh>
#include <execbox/resource_limiter.hh>
#include <execbox/runtime_profile.hh>
#include <execbox/sandbox_controller.hh>

namespace execbox {

// Runs execution requests end to end, safe to use from many threads concurrently
class Executor {
public:
    struct Options {
        LimitCeilings ceilings = {};
        uint64_t max_source_bytes = 1 << 20;
        uint32_t max_concurrent_executions = 10;
        uint64_t memory_budget_bytes = 0; // 0 means unlimited
        SandboxController::Options controller = {};
    };

    struct Stats {
        uint32_t active_executions;
        uint64_t reserved_memory_bytes;
        uint64_t total;
        uint64_t completed;
        uint64_t timed_out;
        uint64_t signaled;
        uint64_t cancelled;
        uint64_t faulted;
    };

private:
    const RuntimeProfileRegistry& registry_;
    Options opts_;
    ResourceLimiter limiter_;
    ResourceAccountant accountant_;
    SandboxController controller_;

    std::atomic<uint64_t> total_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> timed_out_{0};
    std::atomic<uint64_t> signaled_{0};
    std::atomic<uint64_t> cancelled_{0};
    std::atomic<uint64_t> faulted_{0};

    void count(Classification classification) noexcept;

public:
    Executor(
        const RuntimeProfileRegistry& registry,
        isolation::IsolationBackend& backend,
        Options opts
    );

    /**
     * @brief Validates @p req, resolves its profile, computes the limits, reserves host
     *   capacity and runs the request in a sandbox that is destroyed before returning
     * @details If @p req.id is empty, a random id is generated.
     *
     * @errors Throws before acquiring anything: ValidationError for a malformed request or
     *   limits and NotFoundError for an unknown language. Throws InfrastructureFault if the
     *   host capacity is exhausted or the sandbox fails.
     */
    ExecutionResult execute(ExecutionRequest req, const CancellationToken* cancellation = nullptr);

    [[nodiscard]] Stats stats() noexcept;

    [[nodiscard]] const SandboxController& controller() const noexcept { return controller_; }
};

} // namespace execbox
