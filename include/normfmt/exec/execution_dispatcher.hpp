#pragma once

#include "normfmt/errors.hpp"
#include "normfmt/interfaces.hpp"
#include "normfmt/resolve/resolver_chain.hpp"
#include "normfmt/result.hpp"
#include <string>
#include <variant>
#include <vector>

namespace normfmt {

using DispatchError = std::variant<ExecutionError, IoError>;

// Runs the external formatter on a scratch copy of a file. The original is
// only ever written by format_in_place, and only after the tool succeeded.
class ExecutionDispatcher {
private:
    IProcessRunner& runner_;
    IFileSystem& filesystem_;
    EnvOverrides extra_env_;

public:
    ExecutionDispatcher(IProcessRunner& runner, IFileSystem& filesystem, EnvOverrides extra_env = {});

    // Formatted contents of `file_path`; the file itself is left alone
    auto run(const ExecutionPlan& plan, const std::string& file_path) -> Result<std::string, ExecutionError>;

    // run(), then replace the original atomically. Returns the new contents.
    auto format_in_place(const ExecutionPlan& plan, const std::string& file_path)
        -> Result<std::string, DispatchError>;

    // Full argv for a staged file (SHIM plans also need the script path)
    static auto build_argv(const ExecutionPlan& plan, const std::string& staged_path,
                           const std::string& script_path = "") -> std::vector<std::string>;
};

// Python script that imports the package from `module_dir` and rewrites argv[1] in place
auto shim_script(const std::string& module_dir, const std::string& package) -> std::string;

// The message an error variant carries
auto dispatch_error_message(const DispatchError& error) -> std::string;

} // namespace normfmt
