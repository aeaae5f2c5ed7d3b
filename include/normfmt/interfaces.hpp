#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace normfmt {

// Output of a finished child process
struct ProcessResult {
    int exit_code{};
    std::string stdout_output;
    std::string stderr_output;
};

// Environment variables handed to a child on top of the inherited ones
using EnvOverrides = std::map<std::string, std::string>;

// Abstract interfaces for dependency injection
class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto read_file(const std::string& path) -> std::optional<std::string> = 0;
    virtual auto write_file_atomic(const std::string& path, const std::string& content) -> bool = 0;
    virtual auto file_exists(const std::string& path) -> bool = 0;
    virtual auto is_directory(const std::string& path) -> bool = 0;
    virtual auto is_executable(const std::string& path) -> bool = 0;
};

class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;
    virtual auto run(const std::vector<std::string>& argv, const EnvOverrides& env)
        -> ProcessResult = 0;
};

class IEnvironment {
public:
    virtual ~IEnvironment() = default;
    virtual auto get(const std::string& name) -> std::optional<std::string> = 0;
};

} // namespace normfmt
