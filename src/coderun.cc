#include <algorithm>
#include <charconv>
#include <chrono>
#include <coderun/argv_parser.hh>
#include <coderun/concat_tostr.hh>
#include <coderun/config_file.hh>
#include <coderun/execution_orchestrator.hh>
#include <coderun/file_contents.hh>
#include <coderun/logger.hh>
#include <coderun/posix_process_spawner.hh>
#include <coderun/toolchain.hh>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using coderun::ExecutionOptions;
using coderun::ExecutionOrchestrator;

namespace {

void help(const char* program_name) {
    if (not program_name) {
        program_name = "coderun";
    }

    // clang-format off
    stdlog("Usage: ", program_name, " [options] <language>\n"
           "       ", program_name, " [options] -c <descriptor file> [<language>]\n"
           "Compiles (if the language needs it) and runs a program, then prints its output.\n"
           "Options:\n"
           "  -c FILE        Load execution descriptor from FILE\n"
           "  -D NAME=VALUE  Set variable NAME used in the command templates\n"
           "  -h             Display this information\n"
           "  -i LINE        Append LINE to the program's input\n"
           "  -l FILE        Append logs to FILE\n"
           "  -t DIR         Directory with toolchain definitions (default: $CODERUN_TOOLCHAINS\n"
           "                   or ./toolchains)\n"
           "  -T MS          Execution timeout in milliseconds");
    // clang-format on
}

struct CmdOptions {
    bool help = false;
    std::optional<std::string> language;
    std::optional<std::string> descriptor_file;
    std::string toolchains_dir;
    std::vector<std::pair<std::string, std::string>> variables;
    std::optional<std::vector<std::string>> inputs;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::string> log_file;
};

// Returns std::nullopt on invalid usage (the reason is logged)
std::optional<CmdOptions> parse_cmd_options(int argc, char** argv) {
    CmdOptions cmd_options;
    const char* toolchains_env = getenv("CODERUN_TOOLCHAINS");
    cmd_options.toolchains_dir = (toolchains_env ? toolchains_env : "toolchains");

    ArgvParser args(argc - 1, argv + 1);
    while (not args.empty()) {
        auto arg = args.extract_next();
        auto option_value = [&]() -> std::optional<std::string> {
            if (args.empty()) {
                errlog("Option ", arg, " requires an argument");
                return std::nullopt;
            }
            return std::string{args.extract_next()};
        };

        if (arg == "-h") {
            cmd_options.help = true;
        } else if (arg == "-c" or arg == "-i" or arg == "-l" or arg == "-t" or arg == "-D" or
                   arg == "-T")
        {
            auto value = option_value();
            if (not value) {
                return std::nullopt;
            }
            if (arg == "-c") {
                cmd_options.descriptor_file = std::move(*value);
            } else if (arg == "-i") {
                if (not cmd_options.inputs) {
                    cmd_options.inputs.emplace();
                }
                cmd_options.inputs->emplace_back(std::move(*value));
            } else if (arg == "-l") {
                cmd_options.log_file = std::move(*value);
            } else if (arg == "-t") {
                cmd_options.toolchains_dir = std::move(*value);
            } else if (arg == "-D") {
                auto eq_pos = value->find('=');
                if (eq_pos == std::string::npos) {
                    errlog("Invalid variable: ", *value, " (expected NAME=VALUE)");
                    return std::nullopt;
                }
                cmd_options.variables.emplace_back(
                    value->substr(0, eq_pos), value->substr(eq_pos + 1)
                );
            } else { // -T
                int64_t ms = 0;
                auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), ms);
                if (ec != std::errc{} or ptr != value->data() + value->size() or ms <= 0) {
                    errlog("Invalid timeout: ", *value);
                    return std::nullopt;
                }
                cmd_options.timeout = std::chrono::milliseconds{ms};
            }
        } else if (arg.size() > 1 and arg[0] == '-') {
            errlog("Unknown option: ", arg);
            return std::nullopt;
        } else if (cmd_options.language) {
            errlog("Unexpected argument: ", arg);
            return std::nullopt;
        } else {
            cmd_options.language = std::string{arg};
        }
    }

    if (not cmd_options.help and not cmd_options.language and not cmd_options.descriptor_file) {
        errlog("Missing language");
        return std::nullopt;
    }
    return cmd_options;
}

ExecutionOrchestrator make_orchestrator(CmdOptions& cmd_options) {
    auto deps = ExecutionOrchestrator::Dependencies{
        .toolchains = std::make_shared<coderun::ToolchainDirectory>(cmd_options.toolchains_dir),
        .spawner = std::make_shared<coderun::PosixProcessSpawner>(),
    };
    if (not cmd_options.descriptor_file) {
        return ExecutionOrchestrator{
            ExecutionOptions{.language = std::move(*cmd_options.language)}, std::move(deps)
        };
    }

    auto config = get_file_contents(*cmd_options.descriptor_file);
    if (cmd_options.language) {
        // The last definition of a variable wins
        back_insert(config, "\nlanguage: ", ConfigFile::escape_string(*cmd_options.language), '\n');
    }
    return ExecutionOrchestrator{std::move(config), std::move(deps)};
}

int run(CmdOptions cmd_options) {
    try {
        auto orchestrator = make_orchestrator(cmd_options);
        for (auto& [name, value] : cmd_options.variables) {
            orchestrator.put_variable(name, value);
        }
        if (cmd_options.inputs) {
            orchestrator.set_inputs(std::move(*cmd_options.inputs));
        }
        if (cmd_options.timeout) {
            orchestrator.set_execution_timeout(*cmd_options.timeout);
        }

        auto res = orchestrator.execute().get();
        const auto& data = res.data.value_or("");
        if (fwrite(data.data(), 1, data.size(), stdout) != data.size() or fflush(stdout)) {
            errlog("Failed to write the program output");
        }

        int return_code = res.return_code.value_or(EXIT_FAILURE);
        stdlog(
            "return code: ",
            return_code,
            ", elapsed: ",
            res.elapsed.value_or(std::chrono::duration<double, std::milli>{0}).count(),
            " ms"
        );
        return std::clamp(return_code, 0, 255);
    } catch (const std::exception& e) {
        errlog("Error: ", e.what());
        return EXIT_FAILURE;
    }
}

} // namespace

int main(int argc, char** argv) {
    auto cmd_options = parse_cmd_options(argc, argv);
    if (not cmd_options) {
        help(argv[0]);
        return 2;
    }
    if (cmd_options->help) {
        stdlog.label(false);
        help(argv[0]);
        return 0;
    }

    if (cmd_options->log_file) {
        try {
            stdlog.open(cmd_options->log_file->c_str());
            errlog.open(cmd_options->log_file->c_str());
        } catch (const std::exception& e) {
            errlog("Failed to open log file: ", e.what());
            return EXIT_FAILURE;
        }
    }

    return run(std::move(*cmd_options));
}
