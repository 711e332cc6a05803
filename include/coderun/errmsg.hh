#pragma once

#include <cerrno>
#include <coderun/concat_tostr.hh>
#include <cstring>
#include <string>

// Returns " - <description> (os error <errnum>)"
inline std::string errmsg(int errnum) {
    // At the time of writing, longest error description is 50 bytes in size
    // (including null terminator)
    char buff[64];
    const char* description = strerror_r(errnum, buff, sizeof(buff));
    if (description == nullptr) {
        description = "Unknown error";
    }
    return concat_tostr(" - ", description, " (os error ", errnum, ')');
}

inline std::string errmsg() { return errmsg(errno); }
