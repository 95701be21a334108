#include <execbox/errors.hh>
#include <execbox/executor.hh>
#include <execbox/logger.hh>
#include <execbox/random.hh>
#include <execbox/result_assembler.hh>

namespace execbox {

Executor::Executor(
    const RuntimeProfileRegistry& registry, isolation::IsolationBackend& backend, Options opts
)
: registry_{registry}
, opts_{opts}
, limiter_{opts.ceilings}
, accountant_{opts.max_concurrent_executions, opts.memory_budget_bytes}
, controller_{backend, opts.controller} {}

void Executor::count(Classification classification) noexcept {
    switch (classification) {
    case Classification::COMPLETED: ++completed_; return;
    case Classification::TIMED_OUT: ++timed_out_; return;
    case Classification::SIGNALED: ++signaled_; return;
    case Classification::CANCELLED: ++cancelled_; return;
    case Classification::INFRASTRUCTURE_ERROR: ++faulted_; return;
    }
}

ExecutionResult Executor::execute(ExecutionRequest req, const CancellationToken* cancellation) {
    if (req.id.empty()) {
        req.id = random_hex_string(32);
    }
    validate_request(req, opts_.max_source_bytes);
    const auto& profile = registry_.resolve(req.language);
    auto limits = limiter_.compute_limits(profile, req);

    ++total_;
    try {
        auto handle =
            controller_.create(profile, limits, req, accountant_.reserve(limits.memory_bytes));
        controller_.start(handle);
        auto completion = controller_.await_completion(handle, cancellation);
        auto result = assemble_result(handle, handle.take_output(), completion);
        controller_.destroy(handle);
        count(result.classification);
        stdlog(
            "request ",
            result.request_id,
            " (",
            req.language,
            "): ",
            to_str(result.classification),
            ", ",
            result.status_description,
            ", ",
            result.wall_time.count(),
            " ms"
        );
        return result;
    } catch (const InfrastructureFault& e) {
        ++faulted_;
        errlog("request ", req.id, " (", req.language, "): ", e.what());
        throw;
    } catch (const std::exception& e) {
        ++faulted_;
        errlog("request ", req.id, " (", req.language, "): ", e.what());
        throw InfrastructureFault(e.what());
    }
}

Executor::Stats Executor::stats() noexcept {
    auto usage = accountant_.usage();
    return Stats{
        .active_executions = usage.active_executions,
        .reserved_memory_bytes = usage.reserved_memory_bytes,
        .total = total_.load(),
        .completed = completed_.load(),
        .timed_out = timed_out_.load(),
        .signaled = signaled_.load(),
        .cancelled = cancelled_.load(),
        .faulted = faulted_.load(),
    };
}

} // namespace execbox
