#pragma once

#include <chrono>
#include <coderun/command_template.hh>
#include <coderun/toolchain.hh>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace coderun {

// Typed form of the user configuration
struct ExecutionOptions {
    std::string language;
    std::optional<std::string> compile_command;
    std::optional<std::string> run_command;
    std::optional<std::string> working_directory;
    std::optional<std::chrono::milliseconds> execution_timeout;
    Variables variables;
    std::vector<std::string> inputs;
};

class ExecutionDescriptor {
    std::string language_;

public:
    std::optional<std::string> compile_command; // unset => no compile phase
    std::optional<std::string> run_command;
    std::optional<std::string> working_directory;
    std::optional<std::chrono::milliseconds> execution_timeout;
    Variables variables;
    std::vector<std::string> inputs;

    // Throws InvalidDescriptor if the trimmed @p language is empty
    explicit ExecutionDescriptor(std::string_view language);

    /**
     * @brief Parses the descriptor from @p config in the ConfigFile format
     * @details Recognized variables: language (required), compile_command,
     *   run_command, working_directory, execution_timeout (positive number of
     *   milliseconds), variables (array of name=value items), inputs (array).
     *
     * @errors Throws InvalidDescriptor on a parse error or an invalid value
     */
    static ExecutionDescriptor from_string(std::string config);

    // Validates @p options and copies them field by field, throws InvalidDescriptor
    static ExecutionDescriptor from_options(ExecutionOptions options);

    [[nodiscard]] const std::string& language() const noexcept { return language_; }

    // Throws InvalidDescriptor if @p timeout is not positive
    void set_execution_timeout(std::chrono::milliseconds timeout);

    // No-op if the trimmed @p name is empty
    void put_variable(std::string_view name, std::string value);
};

// Returns @p descriptor with working_directory set to "./" if it was unset
ExecutionDescriptor with_default_working_directory(ExecutionDescriptor descriptor);

/**
 * @brief Merges @p descriptor with @p toolchain defaults
 * @details Working directory and both command templates are always taken from
 *   the toolchain. The execution timeout is taken from the toolchain only if
 *   @p descriptor has none.
 */
ExecutionDescriptor
merge_with_toolchain(ExecutionDescriptor descriptor, const Toolchain& toolchain);

} // namespace coderun
