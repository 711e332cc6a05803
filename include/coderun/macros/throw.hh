#pragma once

#include <coderun/concat_tostr.hh>
#include <coderun/macros/stringify.hh>
#include <stdexcept>

// Includes exception origin
#define THROW(...)                                                                     \
    throw std::runtime_error(                                                          \
        concat_tostr(__VA_ARGS__, " (thrown at " __FILE__ ":" STRINGIFY(__LINE__) ")") \
    )
