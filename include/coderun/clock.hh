#pragma once

#include <chrono>

namespace coderun {

// Source of the current time, injected to make elapsed time and timeouts testable
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    Clock() = default;
    Clock(const Clock&) = delete;
    Clock(Clock&&) = delete;
    Clock& operator=(const Clock&) = delete;
    Clock& operator=(Clock&&) = delete;

    virtual ~Clock() = default;

    [[nodiscard]] virtual time_point now() const = 0;
};

class SteadyClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override { return std::chrono::steady_clock::now(); }
};

} // namespace coderun
