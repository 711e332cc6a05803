#pragma once

#include <coderun/process_spawner.hh>
#include <string>

namespace coderun {

/**
 * Runs commands through `<shell> -c <command>` in a new process group. Standard
 * input, output and error of the process are pipes. Output chunks and the exit
 * code are delivered by ProcessHandle::next_event() in the order they are read.
 *
 * Options::timeout is enforced by the caller through next_event() and kill();
 * the spawner only derives a CPU time limit from it (timeout rounded up to
 * seconds + 1 second) as a backstop.
 */
class PosixProcessSpawner final : public ProcessSpawner {
    std::string shell_;

public:
    explicit PosixProcessSpawner(std::string shell = "/bin/sh") : shell_{std::move(shell)} {}

    std::unique_ptr<ProcessHandle>
    spawn(const std::string& command, const Options& options) override;
};

} // namespace coderun
