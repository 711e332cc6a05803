#include <coderun/concat_tostr.hh>
#include <coderun/config_file.hh>
#include <coderun/errors.hh>
#include <coderun/execution_descriptor.hh>
#include <coderun/string_transform.hh>
#include <cstdint>

namespace coderun {

namespace {

std::optional<std::string> non_empty(std::optional<std::string> str) {
    if (str and str->empty()) {
        return std::nullopt;
    }
    return str;
}

} // namespace

ExecutionDescriptor::ExecutionDescriptor(std::string_view language)
: language_{trim(language)} {
    if (language_.empty()) {
        throw InvalidDescriptor{"Language identifier cannot be empty"};
    }
}

ExecutionDescriptor ExecutionDescriptor::from_options(ExecutionOptions options) {
    ExecutionDescriptor res{options.language};
    res.compile_command = non_empty(std::move(options.compile_command));
    res.run_command = non_empty(std::move(options.run_command));
    res.working_directory = non_empty(std::move(options.working_directory));
    if (options.execution_timeout) {
        res.set_execution_timeout(*options.execution_timeout);
    }
    for (auto& [name, value] : options.variables) {
        res.put_variable(name, std::move(value));
    }
    res.inputs = std::move(options.inputs);
    return res;
}

ExecutionDescriptor ExecutionDescriptor::from_string(std::string config) {
    ConfigFile cf;
    cf.add_vars(
        "language",
        "compile_command",
        "run_command",
        "working_directory",
        "execution_timeout",
        "variables",
        "inputs"
    );
    try {
        cf.load_config_from_string(std::move(config));
    } catch (const ConfigFile::ParseError& pe) {
        throw InvalidDescriptor{
            concat_tostr("Invalid execution descriptor: ", pe.what(), '\n', pe.diagnostics())
        };
    }

    auto scalar = [&](std::string_view name) -> std::optional<std::string> {
        const auto& var = cf[name];
        if (not var.is_set()) {
            return std::nullopt;
        }
        if (var.is_array()) {
            throw InvalidDescriptor{concat_tostr("Variable `", name, "` cannot be an array")};
        }
        return var.as_string();
    };
    auto array = [&](std::string_view name) -> std::vector<std::string> {
        const auto& var = cf[name];
        if (var.is_set() and not var.is_array()) {
            throw InvalidDescriptor{concat_tostr("Variable `", name, "` has to be an array")};
        }
        return var.as_array();
    };

    ExecutionOptions options{
        .language = scalar("language").value_or(""),
        .compile_command = scalar("compile_command"),
        .run_command = scalar("run_command"),
        .working_directory = scalar("working_directory"),
        .execution_timeout = std::nullopt,
        .variables = {},
        .inputs = array("inputs"),
    };

    if (scalar("execution_timeout")) {
        auto timeout = cf["execution_timeout"].as<int64_t>();
        if (not timeout) {
            throw InvalidDescriptor{"execution_timeout has to be a positive integer"};
        }
        options.execution_timeout = std::chrono::milliseconds{*timeout};
    }

    for (const auto& item : array("variables")) {
        auto eq_pos = item.find('=');
        if (eq_pos == std::string::npos) {
            throw InvalidDescriptor{
                concat_tostr("Invalid variable `", item, "`: expected name=value")
            };
        }
        // Later items override earlier ones
        auto name = trim(std::string_view{item}.substr(0, eq_pos));
        options.variables.insert_or_assign(std::string{name}, item.substr(eq_pos + 1));
    }

    return from_options(std::move(options));
}

void ExecutionDescriptor::set_execution_timeout(std::chrono::milliseconds timeout) {
    if (timeout <= std::chrono::milliseconds::zero()) {
        throw InvalidDescriptor{
            concat_tostr("execution_timeout has to be a positive integer, got: ", timeout.count())
        };
    }
    execution_timeout = timeout;
}

void ExecutionDescriptor::put_variable(std::string_view name, std::string value) {
    name = trim(name);
    if (name.empty()) {
        return;
    }
    variables.insert_or_assign(std::string{name}, std::move(value));
}

ExecutionDescriptor with_default_working_directory(ExecutionDescriptor descriptor) {
    if (not descriptor.working_directory) {
        descriptor.working_directory = "./";
    }
    return descriptor;
}

ExecutionDescriptor
merge_with_toolchain(ExecutionDescriptor descriptor, const Toolchain& toolchain) {
    descriptor.working_directory = toolchain.working_directory;
    descriptor.compile_command = toolchain.compile_command;
    descriptor.run_command = toolchain.run_command;
    if (not descriptor.execution_timeout) {
        descriptor.execution_timeout = toolchain.execution_timeout;
    }
    return descriptor;
}

} // namespace coderun
