#pragma once

#include <chrono>
#include <coderun/clock.hh>
#include <coderun/execution_result.hh>
#include <coderun/process_spawner.hh>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace coderun {

// Runs one process to completion, collecting its output
class ProcessRunner {
    std::shared_ptr<ProcessSpawner> spawner_;
    std::shared_ptr<const Clock> clock_;

public:
    ProcessRunner(std::shared_ptr<ProcessSpawner> spawner, std::shared_ptr<const Clock> clock);

    /**
     * @brief Runs @p command in @p working_directory
     * @details Lines of @p inputs are written to the standard input right after
     *   the launch, then the standard input is closed. Chunks of standard output
     *   and standard error are appended to the result data in arrival order.
     *   Elapsed time is measured from just after the launch until the exit.
     *
     * @return data, return code and elapsed time of the process
     *
     * @errors MissingCommand if @p command is empty (nothing is spawned),
     *   Timeout if the process did not exit within @p timeout (it is killed
     *   first), SpawnError and other exceptions from the spawner
     */
    [[nodiscard]] ExecutionResult run(
        const std::string& command,
        const std::string& working_directory,
        std::chrono::milliseconds timeout,
        const std::vector<std::string>& inputs
    ) const;

    // Like run(), but asynchronous
    std::future<ExecutionResult> async_run(
        std::string command,
        std::string working_directory,
        std::chrono::milliseconds timeout,
        std::vector<std::string> inputs
    ) const;
};

} // namespace coderun
