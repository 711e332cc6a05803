#include <coderun/concat_tostr.hh>
#include <coderun/errors.hh>
#include <coderun/overloaded.hh>
#include <coderun/process_runner.hh>
#include <coderun/throw_assert.hh>
#include <variant>

namespace coderun {

ProcessRunner::ProcessRunner(
    std::shared_ptr<ProcessSpawner> spawner, std::shared_ptr<const Clock> clock
)
: spawner_{std::move(spawner)}
, clock_{std::move(clock)} {
    throw_assert(spawner_ and clock_);
}

ExecutionResult ProcessRunner::run(
    const std::string& command,
    const std::string& working_directory,
    std::chrono::milliseconds timeout,
    const std::vector<std::string>& inputs
) const {
    if (command.empty()) {
        throw MissingCommand{};
    }

    auto process = spawner_->spawn(
        command,
        {
            .working_directory = working_directory,
            .timeout = timeout,
        }
    );
    auto started = clock_->now();
    if (inputs.empty()) {
        process->close_input();
    } else {
        process->write_input(inputs);
    }

    // Saturated, started + timeout would overflow for huge timeouts
    auto deadline =
        timeout >= std::chrono::duration_cast<std::chrono::milliseconds>(
                       Clock::time_point::max() - started
                   )
        ? Clock::time_point::max()
        : started + timeout;
    std::string data;
    for (;;) {
        auto now = clock_->now();
        if (now >= deadline) {
            process->kill();
            throw Timeout{concat_tostr("Time limit of ", timeout.count(), " ms exceeded")};
        }

        auto event = process->next_event(deadline - now);
        if (not event) {
            continue;
        }

        std::optional<int> return_code;
        std::visit(
            overloaded{
                [&](process_event::Stdout& out) { data += out.chunk; },
                [&](process_event::Stderr& err) { data += err.chunk; },
                [&](process_event::Exited exited) { return_code = exited.code; },
            },
            *event
        );
        if (return_code) {
            return {
                .return_code = return_code,
                .data = std::move(data),
                .elapsed = clock_->now() - started,
            };
        }
    }
}

std::future<ExecutionResult> ProcessRunner::async_run(
    std::string command,
    std::string working_directory,
    std::chrono::milliseconds timeout,
    std::vector<std::string> inputs
) const {
    return std::async(
        std::launch::async,
        [runner = *this,
         command = std::move(command),
         working_directory = std::move(working_directory),
         timeout,
         inputs = std::move(inputs)] {
            return runner.run(command, working_directory, timeout, inputs);
        }
    );
}

} // namespace coderun
