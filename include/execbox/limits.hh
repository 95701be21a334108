#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace execbox {

enum class NetworkPolicy : uint8_t {
    DENIED,
    ALLOWED,
};

[[nodiscard]] constexpr std::string_view to_str(NetworkPolicy np) noexcept {
    switch (np) {
    case NetworkPolicy::DENIED: return "denied";
    case NetworkPolicy::ALLOWED: return "allowed";
    }
    return "unknown";
}

// Bounds of a single execution
struct LimitSet {
    std::chrono::milliseconds wall_time;
    std::chrono::milliseconds cpu_time;
    uint64_t memory_bytes;
    uint32_t max_processes;
    uint64_t max_output_bytes; // per captured stream
    uint64_t write_quota_bytes; // maximum size of a file written inside the sandbox
    uint32_t open_files;
    double cpu_cores; // enforced only by the container backend and cgroups
    NetworkPolicy network = NetworkPolicy::DENIED;
};

// Caller-supplied limits, each one may only tighten the defaults
struct LimitOverrides {
    std::optional<std::chrono::milliseconds> wall_time;
    std::optional<std::chrono::milliseconds> cpu_time;
    std::optional<int64_t> memory_bytes;
    std::optional<int64_t> max_processes;
    std::optional<int64_t> max_output_bytes;
    std::optional<int64_t> write_quota_bytes;
    std::optional<int64_t> open_files;
    std::optional<double> cpu_cores;
    std::optional<NetworkPolicy> network;
};

// Hard, operator-configured bounds
struct LimitCeilings {
    std::chrono::milliseconds wall_time{30'000};
    std::chrono::milliseconds cpu_time{30'000};
    uint64_t memory_bytes = 256 << 20;
    uint32_t max_processes = 50;
    uint64_t max_output_bytes = 1 << 20;
    uint64_t write_quota_bytes = 100 << 20;
    uint32_t open_files = 1024;
    double cpu_cores = 2.0;
    bool allow_network = false;
};

/**
 * @brief Parses a byte size in format: digits optionally followed by one of k, m, g (case
 *   insensitive) e.g. "128m"
 *
 * @return std::nullopt if @p str is malformed or the value overflows
 */
[[nodiscard]] std::optional<uint64_t> parse_byte_size(std::string_view str) noexcept;

} // namespace execbox
