#pragma once

#include <algorithm>
#include <string_view>

class ArgvParser {
    unsigned argc_;
    const char* const* argv_;

public:
    ArgvParser(int argc, const char* const* argv)
    : argc_(std::max(argc, 0))
    , argv_(argv) {}

    [[nodiscard]] bool empty() const noexcept { return argc_ == 0; }

    std::string_view extract_next() noexcept {
        if (argc_ > 0) {
            --argc_;
            return argv_++[0];
        }
        return {};
    }
};
