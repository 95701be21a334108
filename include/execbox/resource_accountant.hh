#pragma once

#include <cstdint>
#include <mutex>
#include <utility>

namespace execbox {

// Host-wide capacity shared by all concurrent executions
class ResourceAccountant {
public:
    struct Usage {
        uint32_t active_executions;
        uint64_t reserved_memory_bytes;
    };

    // Returns the reserved capacity to the accountant on destruction or release()
    class [[nodiscard]] Reservation {
        ResourceAccountant* accountant_ = nullptr;
        uint64_t memory_bytes_ = 0;

        friend class ResourceAccountant;

        Reservation(ResourceAccountant* accountant, uint64_t memory_bytes) noexcept
        : accountant_{accountant}
        , memory_bytes_{memory_bytes} {}

    public:
        Reservation() = default;

        Reservation(const Reservation&) = delete;
        Reservation& operator=(const Reservation&) = delete;

        Reservation(Reservation&& other) noexcept
        : accountant_{std::exchange(other.accountant_, nullptr)}
        , memory_bytes_{other.memory_bytes_} {}

        Reservation& operator=(Reservation&& other) noexcept {
            if (this != &other) {
                release();
                accountant_ = std::exchange(other.accountant_, nullptr);
                memory_bytes_ = other.memory_bytes_;
            }
            return *this;
        }

        [[nodiscard]] bool is_held() const noexcept { return accountant_ != nullptr; }

        // Idempotent
        void release() noexcept {
            if (accountant_) {
                std::exchange(accountant_, nullptr)->release(memory_bytes_);
            }
        }

        ~Reservation() { release(); }
    };

private:
    uint32_t max_concurrent_executions_;
    uint64_t memory_budget_bytes_; // 0 means unlimited
    std::mutex mutex_;
    Usage usage_{.active_executions = 0, .reserved_memory_bytes = 0};

    void release(uint64_t memory_bytes) noexcept;

public:
    ResourceAccountant(uint32_t max_concurrent_executions, uint64_t memory_budget_bytes) noexcept
    : max_concurrent_executions_{max_concurrent_executions}
    , memory_budget_bytes_{memory_budget_bytes} {}

    ResourceAccountant(const ResourceAccountant&) = delete;
    ResourceAccountant(ResourceAccountant&&) = delete;
    ResourceAccountant& operator=(const ResourceAccountant&) = delete;
    ResourceAccountant& operator=(ResourceAccountant&&) = delete;
    ~ResourceAccountant() = default;

    /**
     * @brief Reserves one execution slot and @p memory_bytes of the memory budget
     *
     * @errors Throws InfrastructureFault if the host capacity is exhausted
     */
    Reservation reserve(uint64_t memory_bytes);

    [[nodiscard]] Usage usage();
};

} // namespace execbox
