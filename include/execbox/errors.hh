#pragma once

#include <execbox/concat_tostr.hh>
#include <stdexcept>
#include <utility>

namespace execbox {

// Unknown language id
class NotFoundError : public std::runtime_error {
public:
    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    explicit NotFoundError(Args&&... msg)
    : runtime_error(concat_tostr(std::forward<Args>(msg)...)) {}
};

// Malformed or out-of-range request (or configuration)
class ValidationError : public std::runtime_error {
public:
    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    explicit ValidationError(Args&&... msg)
    : runtime_error(concat_tostr(std::forward<Args>(msg)...)) {}
};

// The sandbox failed, not the submission: an isolation primitive failed or host resources are
// exhausted
class InfrastructureFault : public std::runtime_error {
public:
    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    explicit InfrastructureFault(Args&&... msg)
    : runtime_error(concat_tostr(std::forward<Args>(msg)...)) {}
};

} // namespace execbox
