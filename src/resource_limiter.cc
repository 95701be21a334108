#include <algorithm>
#include <cctype>
#include <execbox/errors.hh>
#include <execbox/logger.hh>
#include <execbox/resource_limiter.hh>
#include <limits>
#include <type_traits>
#include <utility>

using std::chrono::milliseconds;

namespace execbox {

std::optional<uint64_t> parse_byte_size(std::string_view str) noexcept {
    if (str.empty()) {
        return std::nullopt;
    }
    uint64_t multiplier = 1;
    switch (std::tolower(static_cast<unsigned char>(str.back()))) {
    case 'k': multiplier = uint64_t{1} << 10; break;
    case 'm': multiplier = uint64_t{1} << 20; break;
    case 'g': multiplier = uint64_t{1} << 30; break;
    }
    if (multiplier != 1) {
        str.remove_suffix(1);
    }
    if (str.empty()) {
        return std::nullopt;
    }

    uint64_t val = 0;
    for (char c : str) {
        if (c < '0' or c > '9') {
            return std::nullopt;
        }
        if (val > (std::numeric_limits<uint64_t>::max() - (c - '0')) / 10) {
            return std::nullopt;
        }
        val = val * 10 + static_cast<uint64_t>(c - '0');
    }
    if (val > std::numeric_limits<uint64_t>::max() / multiplier) {
        return std::nullopt;
    }
    return val * multiplier;
}

LimitSet
ResourceLimiter::compute_limits(const RuntimeProfile& profile, const ExecutionRequest& req) const {
    const auto& ov = req.overrides;
    LimitSet res = profile.default_limits;

    // Non-positive overrides are rejected, overrides above the ceiling are clamped
    auto apply = [&]<class V, class O>(
                     const char* name, V& value, const std::optional<O>& override_val, V ceiling
                 ) {
        if (override_val) {
            if (not(*override_val > 0)) {
                throw ValidationError("limit ", name, " has to be positive");
            }
            bool above_ceiling = false;
            if constexpr (std::is_integral_v<O>) {
                above_ceiling = std::cmp_greater(*override_val, ceiling);
            } else {
                above_ceiling = *override_val > ceiling;
            }
            if (above_ceiling) {
                debuglog("request ", req.id, ": clamping ", name, " override to the ceiling");
                value = ceiling;
            } else {
                value = static_cast<V>(*override_val);
            }
        }
        value = std::min(value, ceiling);
    };
    auto apply_duration = [&](const char* name,
                              milliseconds& value,
                              const std::optional<milliseconds>& override_val,
                              milliseconds ceiling) {
        if (override_val) {
            if (override_val->count() <= 0) {
                throw ValidationError("limit ", name, " has to be positive");
            }
            if (*override_val > ceiling) {
                debuglog("request ", req.id, ": clamping ", name, " override to the ceiling");
            }
            value = std::min(*override_val, ceiling);
        }
        value = std::min(value, ceiling);
    };

    apply_duration("wall_time", res.wall_time, ov.wall_time, ceilings_.wall_time);
    apply_duration("timeout", res.wall_time, req.timeout, res.wall_time);
    apply_duration("cpu_time", res.cpu_time, ov.cpu_time, ceilings_.cpu_time);
    apply("memory", res.memory_bytes, ov.memory_bytes, ceilings_.memory_bytes);
    apply("processes", res.max_processes, ov.max_processes, ceilings_.max_processes);
    apply("output_bytes", res.max_output_bytes, ov.max_output_bytes, ceilings_.max_output_bytes);
    apply("write_quota", res.write_quota_bytes, ov.write_quota_bytes, ceilings_.write_quota_bytes);
    apply("open_files", res.open_files, ov.open_files, ceilings_.open_files);
    apply("cpu_cores", res.cpu_cores, ov.cpu_cores, ceilings_.cpu_cores);

    res.network = NetworkPolicy::DENIED;
    if (ov.network == NetworkPolicy::ALLOWED) {
        if (ceilings_.allow_network) {
            res.network = NetworkPolicy::ALLOWED;
        } else {
            debuglog("request ", req.id, ": network access denied by the ceiling");
        }
    }
    return res;
}

} // namespace execbox
