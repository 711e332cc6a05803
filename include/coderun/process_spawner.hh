#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace coderun {

namespace process_event {

struct Stdout {
    std::string chunk;
};

struct Stderr {
    std::string chunk;
};

// Delivered exactly once, as the last event
struct Exited {
    int code; // exit status or 128 + signal number if killed by a signal
};

} // namespace process_event

using ProcessEvent =
    std::variant<process_event::Stdout, process_event::Stderr, process_event::Exited>;

// A running process
class ProcessHandle {
public:
    ProcessHandle() = default;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle(ProcessHandle&&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;
    ProcessHandle& operator=(ProcessHandle&&) = delete;

    // Kills the process if it is still running
    virtual ~ProcessHandle() = default;

    // Writes each line followed by '\n' to the standard input of the process,
    // in order, then closes it. May be called at most once.
    virtual void write_input(const std::vector<std::string>& lines) = 0;

    // Closes the standard input of the process without writing anything
    virtual void close_input() = 0;

    // Waits at most @p max_wait for the next event, returns std::nullopt if
    // none arrived in time
    virtual std::optional<ProcessEvent> next_event(std::chrono::nanoseconds max_wait) = 0;

    // Forcibly terminates the process. No event is delivered afterwards.
    virtual void kill() = 0;
};

class ProcessSpawner {
public:
    struct Options {
        std::string working_directory;
        std::chrono::milliseconds timeout;
    };

    ProcessSpawner() = default;
    ProcessSpawner(const ProcessSpawner&) = delete;
    ProcessSpawner(ProcessSpawner&&) = delete;
    ProcessSpawner& operator=(const ProcessSpawner&) = delete;
    ProcessSpawner& operator=(ProcessSpawner&&) = delete;

    virtual ~ProcessSpawner() = default;

    // Spawns shell @p command. Throws SpawnError on failure.
    virtual std::unique_ptr<ProcessHandle>
    spawn(const std::string& command, const Options& options) = 0;
};

} // namespace coderun
