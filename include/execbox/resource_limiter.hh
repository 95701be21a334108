#pragma once

#include <execbox/execution_request.hh>
#include <execbox/limits.hh>
#include <execbox/runtime_profile.hh>

namespace execbox {

class ResourceLimiter {
    LimitCeilings ceilings_;

public:
    explicit ResourceLimiter(LimitCeilings ceilings) noexcept
    : ceilings_{ceilings} {}

    [[nodiscard]] const LimitCeilings& ceilings() const noexcept { return ceilings_; }

    /**
     * @brief Merges the profile's default limits with the request's overrides and clamps the
     *   result to the ceilings
     * @details The caller-supplied timeout tightens the wall time like the wall time override.
     *   Overrides above a ceiling are clamped (a caller can only tighten limits). Network
     *   access is granted only if requested and allowed by the ceilings.
     *
     * @errors Throws ValidationError if any override is out of range (e.g. non-positive)
     */
    [[nodiscard]] LimitSet
    compute_limits(const RuntimeProfile& profile, const ExecutionRequest& req) const;
};

} // namespace execbox
