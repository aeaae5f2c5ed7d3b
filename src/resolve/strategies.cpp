#include "normfmt/resolve/strategies.hpp"
#include "normfmt/string_utils.hpp"
#include <filesystem>

namespace normfmt {

namespace {

auto join_path(const std::string& dir, const std::string& name) -> std::string {
    return (std::filesystem::path(dir) / name).string();
}

auto first_interpreter(ResolveContext& context) -> std::optional<std::string> {
    for (const auto& name : context.request.interpreters) {
        if (auto found = find_on_path(context.environment, context.filesystem, name)) {
            return found;
        }
    }
    return std::nullopt;
}

auto not_found_at(CandidateKind kind, std::string location) -> ResolverCandidate {
    return ResolverCandidate{.kind = kind,
                             .priority = 0,
                             .location = std::move(location),
                             .found = false,
                             .executable = std::nullopt,
                             .module_dir = std::nullopt,
                             .module_has_main = false};
}

auto executable_at(CandidateKind kind, const std::string& executable) -> ResolverCandidate {
    return ResolverCandidate{.kind = kind,
                             .priority = 0,
                             .location = executable,
                             .found = true,
                             .executable = executable,
                             .module_dir = std::nullopt,
                             .module_has_main = false};
}

// Check `<dir>/<tool>` for each directory, recording every look
auto scan_directories(ResolveContext& context, CandidateKind kind, const std::vector<std::string>& dirs)
    -> StrategyOutcome {
    for (const auto& dir : dirs) {
        auto candidate = join_path(dir, context.request.tool_name);
        if (context.filesystem.is_executable(candidate)) {
            context.record(executable_at(kind, candidate));
            return StrategyOutcome::found(make_direct_plan(candidate, kind));
        }
        context.record(not_found_at(kind, candidate));
    }
    return StrategyOutcome::not_found();
}

// `<prefix>/lib/pythonX.Y/site-packages` -> `<prefix>`
auto install_prefix(const std::string& packages_dir) -> std::optional<std::filesystem::path> {
    std::filesystem::path site(packages_dir);
    auto leaf = site.filename().string();
    if (leaf != "site-packages" && leaf != "dist-packages") {
        return std::nullopt;
    }
    auto lib = site.parent_path().parent_path();
    if (lib.filename() != "lib") {
        return std::nullopt;
    }
    return lib.parent_path();
}

} // namespace

auto find_on_path(IEnvironment& environment, IFileSystem& filesystem, const std::string& program)
    -> std::optional<std::string> {
    auto path = environment.get("PATH");
    if (!path) {
        return std::nullopt;
    }
    for (const auto& dir : StringUtils::split(*path, ':')) {
        if (dir.empty()) {
            continue;
        }
        auto candidate = join_path(dir, program);
        if (filesystem.is_executable(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

auto module_location_script(const std::string& package) -> std::string {
    return "import importlib.util, os, sys\n"
           "spec = importlib.util.find_spec('" + package + "')\n"
           "if spec is None or not spec.submodule_search_locations:\n"
           "    sys.exit(1)\n"
           "print(os.path.dirname(list(spec.submodule_search_locations)[0]))\n"
           "print(1 if importlib.util.find_spec('" + package + ".__main__') else 0)\n";
}

auto ExplicitOverrideStrategy::attempt(ResolveContext& context) -> StrategyOutcome {
    const auto& request = context.request;
    if (!request.override_path || request.override_path->empty()) {
        return StrategyOutcome::not_found();
    }

    constexpr auto kind = CandidateKind::EXPLICIT_OVERRIDE;
    const auto& path = *request.override_path;
    auto& filesystem = context.filesystem;

    if (filesystem.is_directory(path)) {
        auto package_dir = join_path(path, request.tool_name);
        if (filesystem.file_exists(join_path(package_dir, "__init__.py"))) {
            auto interpreter = first_interpreter(context);
            context.record(ResolverCandidate{
                .kind = kind,
                .priority = 0,
                .location = path,
                .found = true,
                .executable = std::nullopt,
                .module_dir = path,
                .module_has_main = filesystem.file_exists(join_path(package_dir, "__main__.py"))});
            if (!interpreter) {
                return StrategyOutcome::fatal("no Python interpreter on PATH to run the package in " + path);
            }
            return StrategyOutcome::found(
                make_module_plan(*interpreter, path, request.tool_name, context.environment, kind));
        }

        if (filesystem.is_executable(package_dir)) {
            context.record(executable_at(kind, package_dir));
            return StrategyOutcome::found(make_direct_plan(package_dir, kind));
        }

        context.record(not_found_at(kind, path));
        return StrategyOutcome::fatal(path + " holds neither the " + request.tool_name
                                      + " package nor an executable");
    }

    if (filesystem.is_executable(path)) {
        context.record(executable_at(kind, path));
        return StrategyOutcome::found(make_direct_plan(path, kind));
    }

    context.record(not_found_at(kind, path));
    return StrategyOutcome::fatal(filesystem.file_exists(path) ? path + " is not executable"
                                                               : path + " does not exist");
}

auto SearchPathStrategy::attempt(ResolveContext& context) -> StrategyOutcome {
    auto path = context.environment.get("PATH");
    if (!path) {
        return StrategyOutcome::not_found();
    }

    std::vector<std::string> dirs;
    for (auto& dir : StringUtils::split(*path, ':')) {
        if (!dir.empty()) {
            dirs.push_back(std::move(dir));
        }
    }
    return scan_directories(context, CandidateKind::SEARCH_PATH, dirs);
}

auto ModuleLookupStrategy::attempt(ResolveContext& context) -> StrategyOutcome {
    constexpr auto kind = CandidateKind::MODULE_LOOKUP;
    const auto& tool = context.request.tool_name;

    auto interpreter = first_interpreter(context);
    if (!interpreter) {
        context.record(not_found_at(kind, "python interpreter on PATH"));
        return StrategyOutcome::not_found();
    }

    auto located = context.runner.run({*interpreter, "-c", module_location_script(tool)}, {});
    auto lines = StringUtils::split(located.stdout_output, '\n');
    if (located.exit_code != 0 || lines.size() < 2 || StringUtils::trim(lines[0]).empty()) {
        context.record(not_found_at(kind, *interpreter + " (import " + tool + ")"));
        return StrategyOutcome::not_found();
    }

    auto module_dir = StringUtils::trim(lines[0]);
    bool has_main = StringUtils::trim(lines[1]) == "1";

    if (auto prefix = install_prefix(module_dir)) {
        auto shim = (*prefix / "bin" / tool).string();
        if (context.filesystem.is_executable(shim)) {
            auto candidate = executable_at(kind, shim);
            candidate.module_dir = module_dir;
            candidate.module_has_main = has_main;
            context.record(std::move(candidate));
            return StrategyOutcome::found(make_direct_plan(shim, kind));
        }
    }

    context.record(ResolverCandidate{.kind = kind,
                                     .priority = 0,
                                     .location = module_dir,
                                     .found = true,
                                     .executable = std::nullopt,
                                     .module_dir = module_dir,
                                     .module_has_main = has_main});
    if (has_main) {
        return StrategyOutcome::found(
            make_module_plan(*interpreter, module_dir, tool, context.environment, kind));
    }
    return StrategyOutcome::found(make_shim_plan(*interpreter, module_dir, tool, kind));
}

auto WellKnownDirectoryStrategy::directories(IEnvironment& environment, const std::string& package_name)
    -> std::vector<std::string> {
    std::vector<std::string> dirs;

    if (auto home = environment.get("HOME")) {
        dirs.push_back(join_path(*home, ".local/bin"));
        dirs.push_back(join_path(*home, ".local/pipx/venvs/" + package_name + "/bin"));
    }
    if (auto user_base = environment.get("PYTHONUSERBASE")) {
        dirs.push_back(join_path(*user_base, "bin"));
    }
    if (auto venv = environment.get("VIRTUAL_ENV")) {
        dirs.push_back(join_path(*venv, "bin"));
    }
    dirs.emplace_back("/opt/homebrew/bin");
    dirs.emplace_back("/home/linuxbrew/.linuxbrew/bin");
    dirs.emplace_back("/usr/local/bin");

    return dirs;
}

auto WellKnownDirectoryStrategy::attempt(ResolveContext& context) -> StrategyOutcome {
    return scan_directories(context, CandidateKind::WELL_KNOWN_DIRECTORY,
                            directories(context.environment, context.request.package_name));
}

auto PackageManagerStrategy::attempt(ResolveContext& context) -> StrategyOutcome {
    constexpr auto kind = CandidateKind::PACKAGE_MANAGER;
    const auto& request = context.request;

    // Run `<manager> <args...>`, then look for the tool under `<output><subdir>`
    auto query = [&](const std::string& manager, std::vector<std::string> args,
                     const std::string& subdir) -> std::optional<StrategyOutcome> {
        auto program = find_on_path(context.environment, context.filesystem, manager);
        if (!program) {
            return std::nullopt;
        }

        std::string description = manager;
        for (const auto& arg : args) {
            description += " " + arg;
        }
        args.insert(args.begin(), *program);

        auto result = context.runner.run(args, {});
        auto dir = StringUtils::trim(result.stdout_output);
        if (result.exit_code != 0 || dir.empty()) {
            context.record(not_found_at(kind, description));
            return std::nullopt;
        }

        auto candidate = join_path(subdir.empty() ? dir : join_path(dir, subdir), request.tool_name);
        if (!context.filesystem.is_executable(candidate)) {
            context.record(not_found_at(kind, candidate));
            return std::nullopt;
        }
        context.record(executable_at(kind, candidate));
        return StrategyOutcome::found(make_direct_plan(candidate, kind));
    };

    if (auto outcome = query("brew", {"--prefix", request.package_name}, "bin")) {
        return *outcome;
    }
    if (auto outcome = query("pipx", {"environment", "--value", "PIPX_BIN_DIR"}, "")) {
        return *outcome;
    }
    return StrategyOutcome::not_found();
}

auto default_strategies() -> Strategies {
    Strategies strategies;
    strategies.push_back(std::make_unique<ExplicitOverrideStrategy>());
    strategies.push_back(std::make_unique<SearchPathStrategy>());
    strategies.push_back(std::make_unique<ModuleLookupStrategy>());
    strategies.push_back(std::make_unique<WellKnownDirectoryStrategy>());
    strategies.push_back(std::make_unique<PackageManagerStrategy>());
    return strategies;
}

} // namespace normfmt
