#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace execbox {

// Output of one stream, bounded by the output cap
struct CapturedStream {
    std::string data; // the first bytes produced, at most the cap
    uint64_t total_bytes = 0; // all bytes produced, including the discarded ones

    [[nodiscard]] bool truncated() const noexcept { return total_bytes > data.size(); }
};

enum class Classification : uint8_t {
    COMPLETED, // exited on its own, with any exit code
    TIMED_OUT,
    SIGNALED,
    CANCELLED,
    INFRASTRUCTURE_ERROR,
};

[[nodiscard]] constexpr std::string_view to_str(Classification c) noexcept {
    switch (c) {
    case Classification::COMPLETED: return "completed";
    case Classification::TIMED_OUT: return "timed_out";
    case Classification::SIGNALED: return "signaled";
    case Classification::CANCELLED: return "cancelled";
    case Classification::INFRASTRUCTURE_ERROR: return "infrastructure_error";
    }
    return "unknown";
}

struct ExecutionResult {
    std::string request_id;
    Classification classification;
    std::optional<int> exit_code; // set iff the process exited
    std::optional<int> signal; // set iff the process was killed by a signal
    std::string status_description; // e.g. "exited with 7" or the infrastructure error
    CapturedStream stdout_stream;
    CapturedStream stderr_stream;
    std::optional<CapturedStream> combined_stream;
    std::chrono::milliseconds wall_time{0};
    std::optional<std::chrono::microseconds> cpu_time;
    std::optional<uint64_t> peak_memory_bytes;
};

} // namespace execbox
