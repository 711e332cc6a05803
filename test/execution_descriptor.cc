#include <chrono>
#include <coderun/errors.hh>
#include <coderun/execution_descriptor.hh>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using coderun::ExecutionDescriptor;
using coderun::ExecutionOptions;
using coderun::InvalidDescriptor;
using coderun::Toolchain;
using coderun::Variables;
using std::string;
using std::vector;
using std::chrono_literals::operator""ms;

// NOLINTNEXTLINE
TEST(execution_descriptor, language_is_trimmed_and_required) {
    EXPECT_EQ(ExecutionDescriptor{"  python \t"}.language(), "python");
    EXPECT_THROW(ExecutionDescriptor{""}, InvalidDescriptor);
    EXPECT_THROW(ExecutionDescriptor{" \t "}, InvalidDescriptor);
}

// NOLINTNEXTLINE
TEST(execution_descriptor, put_variable) {
    ExecutionDescriptor desc{"python"};
    desc.put_variable("  ", "ignored");
    desc.put_variable("", "ignored");
    EXPECT_TRUE(desc.variables.empty());

    desc.put_variable(" n ", "5");
    desc.put_variable("file", "a.py");
    desc.put_variable("file", "b.py");
    EXPECT_EQ(desc.variables, (Variables{{"n", "5"}, {"file", "b.py"}}));
}

// NOLINTNEXTLINE
TEST(execution_descriptor, set_execution_timeout) {
    ExecutionDescriptor desc{"python"};
    EXPECT_EQ(desc.execution_timeout, std::nullopt);
    desc.set_execution_timeout(1500ms);
    EXPECT_EQ(desc.execution_timeout, 1500ms);
    EXPECT_THROW(desc.set_execution_timeout(0ms), InvalidDescriptor);
    EXPECT_THROW(desc.set_execution_timeout(-1ms), InvalidDescriptor);
    EXPECT_EQ(desc.execution_timeout, 1500ms);
}

// NOLINTNEXTLINE
TEST(execution_descriptor, from_string) {
    auto desc = ExecutionDescriptor::from_string(R"===(
language: python
run_command: 'python3 {file}'
compile_command: ''
execution_timeout: 2500
variables: [file=main.py, ' n =5', 'expr=a=b', '=skipped']
inputs: [
    5
    '6 7'
]
)===");
    EXPECT_EQ(desc.language(), "python");
    EXPECT_EQ(desc.run_command, "python3 {file}");
    EXPECT_EQ(desc.compile_command, std::nullopt);
    EXPECT_EQ(desc.working_directory, std::nullopt);
    EXPECT_EQ(desc.execution_timeout, 2500ms);
    EXPECT_EQ(
        desc.variables, (Variables{{"file", "main.py"}, {"n", "5"}, {"expr", "a=b"}})
    );
    EXPECT_EQ(desc.inputs, (vector<string>{"5", "6 7"}));
}

// NOLINTNEXTLINE
TEST(execution_descriptor, from_string_later_variables_override_earlier) {
    auto desc = ExecutionDescriptor::from_string("language: sh\nvariables: ['a=1', ' a=2']");
    EXPECT_EQ(desc.variables, (Variables{{"a", "2"}}));

    desc = ExecutionDescriptor::from_string("language: sh\nvariables: [' b =1', 'b=2', 'b =3']");
    EXPECT_EQ(desc.variables, (Variables{{"b", "3"}}));
}

// NOLINTNEXTLINE
TEST(execution_descriptor, from_string_minimal) {
    auto desc = ExecutionDescriptor::from_string("language = c-gcc");
    EXPECT_EQ(desc.language(), "c-gcc");
    EXPECT_EQ(desc.compile_command, std::nullopt);
    EXPECT_EQ(desc.run_command, std::nullopt);
    EXPECT_EQ(desc.execution_timeout, std::nullopt);
    EXPECT_TRUE(desc.variables.empty());
    EXPECT_TRUE(desc.inputs.empty());
}

// NOLINTNEXTLINE
TEST(execution_descriptor, from_string_errors) {
    for (string config : {
             "",
             "run_command: x",
             "language: ''",
             "language: [python]",
             "language: python\nlanguage: 'unterminated",
             "language: python\nexecution_timeout: abc",
             "language: python\nexecution_timeout: 0",
             "language: python\nexecution_timeout: -5",
             "language: python\nexecution_timeout: [1]",
             "language: python\nvariables: file=x",
             "language: python\nvariables: [no_equals_sign]",
             "language: python\ninputs: 5",
         })
    {
        EXPECT_THROW(ExecutionDescriptor::from_string(config), InvalidDescriptor)
            << "config: " << config;
    }
}

// NOLINTNEXTLINE
TEST(execution_descriptor, from_options) {
    auto desc = ExecutionDescriptor::from_options({
        .language = " bash ",
        .compile_command = "",
        .run_command = "bash {file}",
        .working_directory = "",
        .execution_timeout = 100ms,
        .variables = {{" file ", "x.sh"}, {" ", "skipped"}},
        .inputs = {"a"},
    });
    EXPECT_EQ(desc.language(), "bash");
    EXPECT_EQ(desc.compile_command, std::nullopt);
    EXPECT_EQ(desc.run_command, "bash {file}");
    EXPECT_EQ(desc.working_directory, std::nullopt);
    EXPECT_EQ(desc.execution_timeout, 100ms);
    EXPECT_EQ(desc.variables, (Variables{{"file", "x.sh"}}));
    EXPECT_EQ(desc.inputs, vector<string>{"a"});

    EXPECT_THROW(ExecutionDescriptor::from_options({.language = ""}), InvalidDescriptor);
    EXPECT_THROW(
        ExecutionDescriptor::from_options({.language = "bash", .execution_timeout = 0ms}),
        InvalidDescriptor
    );
}

// NOLINTNEXTLINE
TEST(execution_descriptor, with_default_working_directory) {
    ExecutionDescriptor desc{"python"};
    EXPECT_EQ(with_default_working_directory(desc).working_directory, "./");
    desc.working_directory = "/tmp";
    EXPECT_EQ(with_default_working_directory(desc).working_directory, "/tmp");
}

// NOLINTNEXTLINE
TEST(execution_descriptor, merge_with_toolchain) {
    Toolchain toolchain{
        .working_directory = "/judge",
        .compile_command = "gcc {file}",
        .run_command = "./a.out",
        .execution_timeout = 3000ms,
    };

    ExecutionDescriptor desc{"c-gcc"};
    desc.compile_command = "user compile";
    desc.run_command = "user run";
    desc.working_directory = "/user";
    desc.put_variable("file", "main.c");
    desc.inputs = {"1"};

    auto merged = merge_with_toolchain(desc, toolchain);
    EXPECT_EQ(merged.language(), "c-gcc");
    EXPECT_EQ(merged.working_directory, "/judge");
    EXPECT_EQ(merged.compile_command, "gcc {file}");
    EXPECT_EQ(merged.run_command, "./a.out");
    EXPECT_EQ(merged.execution_timeout, 3000ms);
    EXPECT_EQ(merged.variables, (Variables{{"file", "main.c"}}));
    EXPECT_EQ(merged.inputs, vector<string>{"1"});

    // Timeout set by the user takes precedence
    desc.set_execution_timeout(10ms);
    EXPECT_EQ(merge_with_toolchain(desc, toolchain).execution_timeout, 10ms);

    // Toolchain without commands clears them
    toolchain.compile_command = std::nullopt;
    toolchain.run_command = std::nullopt;
    merged = merge_with_toolchain(desc, toolchain);
    EXPECT_EQ(merged.compile_command, std::nullopt);
    EXPECT_EQ(merged.run_command, std::nullopt);
}
