#include <execbox/errors.hh>
#include <execbox/resource_accountant.hh>

namespace execbox {

ResourceAccountant::Reservation ResourceAccountant::reserve(uint64_t memory_bytes) {
    std::lock_guard lock{mutex_};
    if (usage_.active_executions >= max_concurrent_executions_) {
        throw InfrastructureFault(
            "host capacity exhausted: ",
            usage_.active_executions,
            " executions are already running (limit: ",
            max_concurrent_executions_,
            ')'
        );
    }
    if (memory_budget_bytes_ != 0 and
        memory_bytes > memory_budget_bytes_ - usage_.reserved_memory_bytes)
    {
        throw InfrastructureFault(
            "host memory budget exhausted: requested ",
            memory_bytes,
            " bytes, available ",
            memory_budget_bytes_ - usage_.reserved_memory_bytes,
            " bytes"
        );
    }
    ++usage_.active_executions;
    usage_.reserved_memory_bytes += memory_bytes;
    return Reservation{this, memory_bytes};
}

void ResourceAccountant::release(uint64_t memory_bytes) noexcept {
    std::lock_guard lock{mutex_};
    --usage_.active_executions;
    usage_.reserved_memory_bytes -= memory_bytes;
}

ResourceAccountant::Usage ResourceAccountant::usage() {
    std::lock_guard lock{mutex_};
    return usage_;
}

} // namespace execbox
