#include "normfmt/exec/execution_dispatcher.hpp"
#include "normfmt/exec/process_runner.hpp"
#include "normfmt/exec/temp_file.hpp"
#include <optional>

namespace normfmt {

namespace {

// Single-quoted Python literal
auto python_literal(const std::string& text) -> std::string {
    std::string literal = "'";
    for (char c : text) {
        if (c == '\\' || c == '\'') {
            literal += '\\';
        }
        literal += c;
    }
    return literal + "'";
}

auto execution_error(std::string message, int exit_code, std::string diagnostics)
    -> Result<std::string, ExecutionError> {
    return Result<std::string, ExecutionError>::failure(ExecutionError{
        .message = std::move(message), .exit_code = exit_code, .diagnostics = std::move(diagnostics)});
}

} // namespace

ExecutionDispatcher::ExecutionDispatcher(IProcessRunner& runner, IFileSystem& filesystem,
                                         EnvOverrides extra_env)
    : runner_(runner), filesystem_(filesystem), extra_env_(std::move(extra_env)) {}

auto ExecutionDispatcher::build_argv(const ExecutionPlan& plan, const std::string& staged_path,
                                     const std::string& script_path) -> std::vector<std::string> {
    auto argv = plan.command;
    if (plan.mode == InvocationMode::SHIM) {
        argv.push_back(script_path);
    }
    argv.push_back(staged_path);
    return argv;
}

auto ExecutionDispatcher::run(const ExecutionPlan& plan, const std::string& file_path)
    -> Result<std::string, ExecutionError> {
    auto original = filesystem_.read_file(file_path);
    if (!original) {
        return execution_error("cannot read " + file_path, 0, "");
    }

    auto staged = ScopedTempFile::create(".c", *original);
    if (!staged) {
        return execution_error(staged.error().message, 0, "");
    }

    std::optional<ScopedTempFile> script;
    if (plan.mode == InvocationMode::SHIM) {
        auto created = ScopedTempFile::create(".py", shim_script(plan.module_dir, plan.package));
        if (!created) {
            return execution_error(created.error().message, 0, "");
        }
        script.emplace(std::move(created).value());
    }

    auto env = plan.env;
    for (const auto& [key, value] : extra_env_) {
        env[key] = value;
    }

    auto argv = build_argv(plan, staged.value().path(), script ? script->path() : "");
    auto result = runner_.run(argv, env);

    if (result.exit_code != 0) {
        auto output = result.stderr_output.empty() ? result.stdout_output : result.stderr_output;
        auto message = result.exit_code == kExecFailureExitCode
            ? "could not launch " + argv.front()
            : argv.front() + " exited with status " + std::to_string(result.exit_code);
        return execution_error(std::move(message), result.exit_code, std::move(output));
    }

    auto formatted = filesystem_.read_file(staged.value().path());
    if (!formatted) {
        return execution_error("formatter output disappeared: " + staged.value().path(), 0, "");
    }
    return Result<std::string, ExecutionError>::success(std::move(*formatted));
}

auto ExecutionDispatcher::format_in_place(const ExecutionPlan& plan, const std::string& file_path)
    -> Result<std::string, DispatchError> {
    auto formatted = run(plan, file_path);
    if (!formatted) {
        return Result<std::string, DispatchError>::failure(std::move(formatted).error());
    }

    if (!filesystem_.write_file_atomic(file_path, formatted.value())) {
        return Result<std::string, DispatchError>::failure(
            IoError{.message = "cannot write " + file_path, .path = file_path});
    }
    return Result<std::string, DispatchError>::success(std::move(formatted).value());
}

auto shim_script(const std::string& module_dir, const std::string& package) -> std::string {
    return "import sys\n"
           "sys.path.insert(0, " + python_literal(module_dir) + ")\n"
           "from " + package + ".run import run_all\n"
           "with open(sys.argv[1]) as source:\n"
           "    content = source.read()\n"
           "with open(sys.argv[1], 'w') as target:\n"
           "    target.write(run_all(content))\n"
           "sys.exit(0)\n";
}

auto dispatch_error_message(const DispatchError& error) -> std::string {
    if (const auto* execution = std::get_if<ExecutionError>(&error)) {
        return execution->message;
    }
    const auto& io = std::get<IoError>(error);
    return io.message;
}

} // namespace normfmt
