#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace coderun {

struct ExecutionResult {
    std::optional<int> return_code;
    std::optional<std::string> data; // stdout and stderr interleaved as delivered
    std::optional<std::chrono::duration<double, std::milli>> elapsed;
};

} // namespace coderun
