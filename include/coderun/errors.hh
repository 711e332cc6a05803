#pragma once

#include <stdexcept>
#include <string>

namespace coderun {

// Base of every error that terminates an orchestration
class ExecutionError : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

// Unknown, unavailable or malformed toolchain
class ToolchainLoadError : public ExecutionError {
public:
    using ExecutionError::ExecutionError;
};

// The descriptor has no run command after toolchain resolution
class MissingRunCommand : public ExecutionError {
public:
    MissingRunCommand() : ExecutionError("runCommand not found.") {}
};

// Outcome of the compile phase matches none of the expected branches
class CompilationError : public ExecutionError {
public:
    CompilationError() : ExecutionError("Failed to compile.") {}
};

// ProcessRunner was given an empty command
class MissingCommand : public ExecutionError {
public:
    MissingCommand() : ExecutionError("Command is empty.") {}
};

// The process did not terminate within its time limit and was killed
class Timeout : public ExecutionError {
public:
    using ExecutionError::ExecutionError;
};

// The spawn primitive failed to start the process
class SpawnError : public ExecutionError {
public:
    using ExecutionError::ExecutionError;
};

// Raw or typed configuration does not describe a valid execution
class InvalidDescriptor : public ExecutionError {
public:
    using ExecutionError::ExecutionError;
};

} // namespace coderun
