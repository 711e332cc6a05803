#include <coderun/command_template.hh>
#include <coderun/errors.hh>
#include <coderun/execution_orchestrator.hh>
#include <coderun/logger.hh>
#include <coderun/process_runner.hh>
#include <coderun/throw_assert.hh>
#include <exception>

namespace coderun {

namespace {

std::string_view describe(const std::optional<std::string>& command) {
    return command ? std::string_view{*command} : std::string_view{"(none)"};
}

Toolchain resolve_toolchain(ToolchainRegistry& toolchains, const std::string& language) {
    try {
        return toolchains.resolve(language).get();
    } catch (const ToolchainLoadError&) {
        throw;
    } catch (const std::exception& e) {
        throw ToolchainLoadError{
            concat_tostr("Failed to load toolchain `", language, "`: ", e.what())
        };
    }
}

ExecutionResult compile_and_run(
    ExecutionDescriptor descriptor, const ExecutionOrchestrator::Dependencies& deps
) {
    constexpr int SUCCESS_CODE = ExecutionOrchestrator::SUCCESS_CODE;

    // Resolving toolchain
    descriptor = with_default_working_directory(std::move(descriptor));
    auto toolchain = resolve_toolchain(*deps.toolchains, descriptor.language());
    const auto resolved = merge_with_toolchain(std::move(descriptor), toolchain);
    const auto& language = resolved.language();
    if (not resolved.execution_timeout or
        *resolved.execution_timeout <= std::chrono::milliseconds::zero())
    {
        throw ToolchainLoadError{concat_tostr("Toolchain `", language, "` has no positive timeout")
        };
    }
    stdlog(
        '[',
        language,
        "] toolchain resolved: compile command: ",
        describe(resolved.compile_command),
        ", run command: ",
        describe(resolved.run_command),
        ", working directory: ",
        *resolved.working_directory,
        ", timeout: ",
        resolved.execution_timeout->count(),
        " ms"
    );

    ProcessRunner runner{deps.spawner, deps.clock};
    auto run_phase = [&](const std::string& templ, std::vector<std::string> inputs) {
        auto command = build_command(templ, resolved.variables);
        stdlog('[', language, "] running: ", command);
        return runner
            .async_run(
                std::move(command),
                *resolved.working_directory,
                *resolved.execution_timeout,
                std::move(inputs)
            )
            .get();
    };

    // Compiling
    ExecutionResult compile_result = resolved.compile_command
        ? run_phase(*resolved.compile_command, {})
        : ExecutionResult{
              .return_code = SUCCESS_CODE,
              .data = std::nullopt,
              .elapsed = std::nullopt,
          };

    // Running
    if (compile_result.return_code == SUCCESS_CODE and resolved.run_command) {
        auto run_result = run_phase(*resolved.run_command, resolved.inputs);
        stdlog('[', language, "] finished with return code ", run_result.return_code.value_or(-1));
        return run_result;
    }
    if (not resolved.run_command) {
        throw MissingRunCommand{};
    }
    if (compile_result.return_code != SUCCESS_CODE) {
        stdlog(
            '[',
            language,
            "] compilation finished with return code ",
            compile_result.return_code.value_or(-1)
        );
        return compile_result;
    }
    throw CompilationError{};
}

} // namespace

ExecutionOrchestrator::ExecutionOrchestrator(std::string config, Dependencies deps)
: descriptor_{ExecutionDescriptor::from_string(std::move(config))}
, deps_{std::move(deps)} {
    throw_assert(deps_.toolchains and deps_.spawner and deps_.clock);
}

ExecutionOrchestrator::ExecutionOrchestrator(ExecutionOptions options, Dependencies deps)
: descriptor_{ExecutionDescriptor::from_options(std::move(options))}
, deps_{std::move(deps)} {
    throw_assert(deps_.toolchains and deps_.spawner and deps_.clock);
}

std::future<ExecutionResult> ExecutionOrchestrator::execute() const {
    return std::async(std::launch::async, [descriptor = descriptor_, deps = deps_]() mutable {
        const auto language = descriptor.language();
        try {
            return compile_and_run(std::move(descriptor), deps);
        } catch (const std::exception& e) {
            errlog('[', language, "] execution failed: ", e.what());
            throw;
        }
    });
}

} // namespace coderun
