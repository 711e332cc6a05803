#include <algorithm>
#include <coderun/concat_tostr.hh>
#include <coderun/config_file.hh>
#include <coderun/errors.hh>
#include <coderun/file_contents.hh>
#include <coderun/toolchain.hh>
#include <cstdint>
#include <exception>

namespace coderun {

std::future<Toolchain> InMemoryToolchainRegistry::resolve(std::string_view language) {
    std::promise<Toolchain> promise;
    if (auto it = toolchains_.find(language); it != toolchains_.end()) {
        promise.set_value(it->second);
    } else {
        promise.set_exception(std::make_exception_ptr(
            ToolchainLoadError{concat_tostr("Unknown language: ", language)}
        ));
    }
    return promise.get_future();
}

ToolchainDirectory::ToolchainDirectory(std::string dir) : dir_{std::move(dir)} {
    if (dir_.empty()) {
        dir_ = "./";
    } else if (dir_.back() != '/') {
        dir_ += '/';
    }
}

bool ToolchainDirectory::is_valid_language(std::string_view language) noexcept {
    if (language.empty() or language == "." or language == "..") {
        return false;
    }
    return std::all_of(language.begin(), language.end(), [](char c) {
        return (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or (c >= '0' and c <= '9') or
            c == '_' or c == '.' or c == '+' or c == '-';
    });
}

Toolchain ToolchainDirectory::parse_toolchain(std::string_view language, std::string config) {
    ConfigFile cf;
    cf.add_vars("working_directory", "compile_command", "run_command", "execution_timeout");
    try {
        cf.load_config_from_string(std::move(config));
    } catch (const ConfigFile::ParseError& pe) {
        throw ToolchainLoadError{
            concat_tostr("Invalid toolchain `", language, "`: ", pe.what(), '\n', pe.diagnostics())
        };
    }

    for (auto const& [name, var] : cf.get_vars()) {
        if (var.is_array()) {
            throw ToolchainLoadError{
                concat_tostr("Invalid toolchain `", language, "`: ", name, " cannot be an array")
            };
        }
    }

    auto optional_string = [&](std::string_view name) -> std::optional<std::string> {
        const auto& var = cf[name];
        if (not var.is_set() or var.as_string().empty()) {
            return std::nullopt;
        }
        return var.as_string();
    };

    auto timeout = cf["execution_timeout"].as<int64_t>();
    if (not timeout or *timeout <= 0) {
        throw ToolchainLoadError{concat_tostr(
            "Invalid toolchain `", language, "`: execution_timeout has to be a positive integer"
        )};
    }

    return Toolchain{
        .working_directory = optional_string("working_directory").value_or("./"),
        .compile_command = optional_string("compile_command"),
        .run_command = optional_string("run_command"),
        .execution_timeout = std::chrono::milliseconds{*timeout},
    };
}

std::future<Toolchain> ToolchainDirectory::resolve(std::string_view language) {
    return std::async(
        std::launch::async,
        [dir = dir_, language = std::string{language}] {
            if (not is_valid_language(language)) {
                throw ToolchainLoadError{
                    concat_tostr("Invalid language identifier: `", language, '`')
                };
            }

            std::string config;
            try {
                config = get_file_contents(concat_tostr(dir, language, ".conf"));
            } catch (const std::exception& e) {
                throw ToolchainLoadError{
                    concat_tostr("Unknown language `", language, "`: ", e.what())
                };
            }
            return parse_toolchain(language, std::move(config));
        }
    );
}

} // namespace coderun
