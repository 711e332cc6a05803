#pragma once

#include <chrono>
#include <coderun/clock.hh>
#include <coderun/concat_tostr.hh>
#include <coderun/execution_descriptor.hh>
#include <coderun/execution_result.hh>
#include <coderun/process_spawner.hh>
#include <coderun/toolchain.hh>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace coderun {

/**
 * Compiles (if the toolchain has a compile command) and runs one program.
 *
 * execute() resolves the toolchain of the descriptor's language, merges its
 * defaults into a copy of the descriptor, and then:
 *   - with no compile command, or when the compile command exits with
 *     SUCCESS_CODE, runs the run command and yields its result;
 *   - when the compile command exits with another code, yields the compile
 *     result (so the caller sees the compiler diagnostics);
 *   - when there is no run command, fails with MissingRunCommand.
 */
class ExecutionOrchestrator {
public:
    static constexpr int SUCCESS_CODE = 0;

    struct Dependencies {
        std::shared_ptr<ToolchainRegistry> toolchains;
        std::shared_ptr<ProcessSpawner> spawner;
        std::shared_ptr<const Clock> clock = std::make_shared<SteadyClock>();
    };

private:
    ExecutionDescriptor descriptor_;
    Dependencies deps_;

public:
    // @p config is parsed with ExecutionDescriptor::from_string()
    ExecutionOrchestrator(std::string config, Dependencies deps);

    ExecutionOrchestrator(ExecutionOptions options, Dependencies deps);

    [[nodiscard]] const ExecutionDescriptor& descriptor() const noexcept { return descriptor_; }

    // Takes precedence over the toolchain's default timeout
    void set_execution_timeout(std::chrono::milliseconds timeout) {
        descriptor_.set_execution_timeout(timeout);
    }

    // No-op if the trimmed @p name is empty
    void put_variable(std::string_view name, std::string_view value) {
        descriptor_.put_variable(name, std::string{value});
    }

    // Numbers are stored in their shortest form e.g. 5 -> "5", bools as "true" / "false"
    template <class T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
    void put_variable(std::string_view name, T value) {
        descriptor_.put_variable(name, concat_tostr(value));
    }

    // Replaces the pending inputs
    void set_inputs(std::vector<std::string> lines) { descriptor_.inputs = std::move(lines); }

    /**
     * @brief Starts the orchestration
     * @details The returned future does not depend on the lifetime of *this.
     *
     * @return future holding the terminal result or one of: ToolchainLoadError,
     *   MissingRunCommand, CompilationError, MissingCommand, Timeout, SpawnError
     */
    [[nodiscard]] std::future<ExecutionResult> execute() const;
};

} // namespace coderun
