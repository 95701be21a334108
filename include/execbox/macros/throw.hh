#pragma once

#include <execbox/concat_tostr.hh>
#include <execbox/macros/stringify.hh>
#include <stdexcept>

// Includes the exception origin
#define THROW(...)                                                                     \
    throw std::runtime_error(                                                          \
        concat_tostr(__VA_ARGS__, " (thrown at " __FILE__ ":" STRINGIFY(__LINE__) ")") \
    )
