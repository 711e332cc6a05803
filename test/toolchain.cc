#include "temporary_directory.hh"

#include <chrono>
#include <coderun/errors.hh>
#include <coderun/file_contents.hh>
#include <coderun/toolchain.hh>
#include <gtest/gtest.h>
#include <string>

using coderun::InMemoryToolchainRegistry;
using coderun::Toolchain;
using coderun::ToolchainDirectory;
using coderun::ToolchainLoadError;
using std::string;
using std::chrono_literals::operator""ms;

// NOLINTNEXTLINE
TEST(toolchain, in_memory_registry) {
    InMemoryToolchainRegistry registry{{
        {"python",
         Toolchain{
             .working_directory = "./",
             .compile_command = std::nullopt,
             .run_command = "python3 {file}",
             .execution_timeout = 1000ms,
         }},
    }};

    auto toolchain = registry.resolve("python").get();
    EXPECT_EQ(toolchain.run_command, "python3 {file}");
    EXPECT_EQ(toolchain.compile_command, std::nullopt);
    EXPECT_EQ(toolchain.execution_timeout, 1000ms);

    auto unknown = registry.resolve("cobol");
    try {
        unknown.get();
        ADD_FAILURE();
    } catch (const ToolchainLoadError& e) {
        EXPECT_STREQ(e.what(), "Unknown language: cobol");
    }
}

// NOLINTNEXTLINE
TEST(toolchain, default_timeout_is_zero) {
    Toolchain toolchain;
    toolchain.run_command = "run";
    EXPECT_EQ(toolchain.working_directory, "./");
    EXPECT_EQ(toolchain.compile_command, std::nullopt);
    EXPECT_EQ(toolchain.execution_timeout, 0ms);
}

// NOLINTNEXTLINE
TEST(toolchain, is_valid_language) {
    EXPECT_TRUE(ToolchainDirectory::is_valid_language("python"));
    EXPECT_TRUE(ToolchainDirectory::is_valid_language("cpp-gcc"));
    EXPECT_TRUE(ToolchainDirectory::is_valid_language("c++17.gcc_13"));
    EXPECT_FALSE(ToolchainDirectory::is_valid_language(""));
    EXPECT_FALSE(ToolchainDirectory::is_valid_language("."));
    EXPECT_FALSE(ToolchainDirectory::is_valid_language(".."));
    EXPECT_FALSE(ToolchainDirectory::is_valid_language("../etc/passwd"));
    EXPECT_FALSE(ToolchainDirectory::is_valid_language("py thon"));
    EXPECT_FALSE(ToolchainDirectory::is_valid_language("a/b"));
}

// NOLINTNEXTLINE
TEST(toolchain, parse_toolchain) {
    auto toolchain = ToolchainDirectory::parse_toolchain("c-gcc", R"===(
# C compiled with gcc
working_directory: /tmp/judge
compile_command: 'gcc -O2 -o {out} {file}'
run_command: ./{out}
execution_timeout: 5000
)===");
    EXPECT_EQ(toolchain.working_directory, "/tmp/judge");
    EXPECT_EQ(toolchain.compile_command, "gcc -O2 -o {out} {file}");
    EXPECT_EQ(toolchain.run_command, "./{out}");
    EXPECT_EQ(toolchain.execution_timeout, 5000ms);

    toolchain = ToolchainDirectory::parse_toolchain(
        "python", "compile_command: ''\nrun_command: python3 {file}\nexecution_timeout: 1"
    );
    EXPECT_EQ(toolchain.working_directory, "./");
    EXPECT_EQ(toolchain.compile_command, std::nullopt);
    EXPECT_EQ(toolchain.run_command, "python3 {file}");
    EXPECT_EQ(toolchain.execution_timeout, 1ms);
}

// NOLINTNEXTLINE
TEST(toolchain, parse_toolchain_errors) {
    for (string config : {
             "",
             "run_command: x",
             "run_command: x\nexecution_timeout: 0",
             "run_command: x\nexecution_timeout: -1",
             "run_command: x\nexecution_timeout: 1.5",
             "run_command: [x]\nexecution_timeout: 1",
             "run_command: 'x\nexecution_timeout: 1",
         })
    {
        EXPECT_THROW(ToolchainDirectory::parse_toolchain("lang", config), ToolchainLoadError)
            << "config: " << config;
    }
}

// NOLINTNEXTLINE
TEST(toolchain, toolchain_directory) {
    TemporaryDirectory tmp_dir;
    put_file_contents(
        tmp_dir.path() + "bash.conf", "run_command: bash {file}\nexecution_timeout: 700"
    );
    put_file_contents(tmp_dir.path() + "broken.conf", "run_command: bash {file}");

    // Without the trailing slash
    ToolchainDirectory registry{tmp_dir.path().substr(0, tmp_dir.path().size() - 1)};
    EXPECT_EQ(registry.dir(), tmp_dir.path());

    auto toolchain = registry.resolve("bash").get();
    EXPECT_EQ(toolchain.run_command, "bash {file}");
    EXPECT_EQ(toolchain.execution_timeout, 700ms);

    EXPECT_THROW(registry.resolve("missing").get(), ToolchainLoadError);
    EXPECT_THROW(registry.resolve("broken").get(), ToolchainLoadError);
    EXPECT_THROW(registry.resolve("../bash").get(), ToolchainLoadError);
    EXPECT_THROW(registry.resolve("").get(), ToolchainLoadError);
}

// NOLINTNEXTLINE
TEST(toolchain, toolchain_directory_default_dir) {
    EXPECT_EQ(ToolchainDirectory{""}.dir(), "./");
    EXPECT_EQ(ToolchainDirectory{"toolchains/"}.dir(), "toolchains/");
}
