#pragma once

#include <chrono>
#include <future>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace coderun {

// Defaults of one language
struct Toolchain {
    std::string working_directory = "./";
    std::optional<std::string> compile_command;
    std::optional<std::string> run_command;
    std::chrono::milliseconds execution_timeout{};
};

class ToolchainRegistry {
public:
    ToolchainRegistry() = default;
    ToolchainRegistry(const ToolchainRegistry&) = delete;
    ToolchainRegistry(ToolchainRegistry&&) = delete;
    ToolchainRegistry& operator=(const ToolchainRegistry&) = delete;
    ToolchainRegistry& operator=(ToolchainRegistry&&) = delete;

    virtual ~ToolchainRegistry() = default;

    // The future throws ToolchainLoadError if @p language is unknown or its
    // definition is invalid
    virtual std::future<Toolchain> resolve(std::string_view language) = 0;
};

class InMemoryToolchainRegistry final : public ToolchainRegistry {
    std::map<std::string, Toolchain, std::less<>> toolchains_;

public:
    explicit InMemoryToolchainRegistry(std::map<std::string, Toolchain, std::less<>> toolchains)
    : toolchains_{std::move(toolchains)} {}

    std::future<Toolchain> resolve(std::string_view language) override;
};

/**
 * Reads toolchain definitions from files <dir>/<language>.conf written in the
 * ConfigFile format:
 *   working_directory: /tmp/judge   # optional, defaults to ./
 *   compile_command: gcc {file} -o {out}   # optional
 *   run_command: ./{out}   # optional
 *   execution_timeout: 5000   # in milliseconds, required
 */
class ToolchainDirectory final : public ToolchainRegistry {
    std::string dir_;

public:
    explicit ToolchainDirectory(std::string dir);

    [[nodiscard]] const std::string& dir() const noexcept { return dir_; }

    std::future<Toolchain> resolve(std::string_view language) override;

    // Throws ToolchainLoadError on invalid @p config
    static Toolchain parse_toolchain(std::string_view language, std::string config);

    // Checks whether @p language may be used as a toolchain file name
    static bool is_valid_language(std::string_view language) noexcept;
};

} // namespace coderun
