#include "normfmt/resolve/resolver_chain.hpp"
#include <sstream>

namespace normfmt {

auto ResolveContext::record(ResolverCandidate candidate) -> void {
    candidate.priority = priority;
    attempts.push_back(std::move(candidate));
}

auto StrategyOutcome::found(ExecutionPlan plan) -> StrategyOutcome {
    return StrategyOutcome{.kind = Kind::FOUND, .plan = std::move(plan), .reason = ""};
}

auto StrategyOutcome::not_found() -> StrategyOutcome {
    return StrategyOutcome{.kind = Kind::NOT_FOUND, .plan = std::nullopt, .reason = ""};
}

auto StrategyOutcome::fatal(std::string reason) -> StrategyOutcome {
    return StrategyOutcome{.kind = Kind::FATAL, .plan = std::nullopt, .reason = std::move(reason)};
}

ResolverChain::ResolverChain(Strategies strategies, IFileSystem& filesystem, IProcessRunner& runner,
                             IEnvironment& environment)
    : strategies_(std::move(strategies)), filesystem_(filesystem), runner_(runner),
      environment_(environment) {}

auto ResolverChain::resolve(const ResolveRequest& request) -> Result<ExecutionPlan, ResolutionError> {
    ResolveContext context{.request = request,
                           .filesystem = filesystem_,
                           .runner = runner_,
                           .environment = environment_,
                           .attempts = {},
                           .priority = 0};

    for (size_t i = 0; i < strategies_.size(); ++i) {
        context.priority = i;
        auto outcome = strategies_[i]->attempt(context);

        if (outcome.kind == StrategyOutcome::Kind::FOUND && outcome.plan) {
            last_attempts_ = context.attempts;
            return Result<ExecutionPlan, ResolutionError>::success(std::move(*outcome.plan));
        }
        if (outcome.kind == StrategyOutcome::Kind::FATAL) {
            last_attempts_ = context.attempts;
            return Result<ExecutionPlan, ResolutionError>::failure(
                ResolutionError{.message = strategies_[i]->name() + ": " + outcome.reason,
                                .attempts = std::move(context.attempts)});
        }
    }

    last_attempts_ = context.attempts;
    return Result<ExecutionPlan, ResolutionError>::failure(ResolutionError{
        .message = "could not find " + request.tool_name + ", install it with one of:\n"
            + "  pip install " + request.package_name + "\n"
            + "  pipx install " + request.package_name + "\n"
            + "  brew install " + request.package_name + " (macOS with Homebrew)\n"
            + "or set " + request.override_variable + " to the path of the executable",
        .attempts = std::move(context.attempts)});
}

auto PlanCache::lookup(const std::optional<std::string>& override_path) const
    -> std::optional<ExecutionPlan> {
    if (!plan_ || override_path != override_path_) {
        return std::nullopt;
    }
    return plan_;
}

auto PlanCache::store(ExecutionPlan plan, std::optional<std::string> override_path) -> void {
    plan_ = std::move(plan);
    override_path_ = std::move(override_path);
}

auto PlanCache::clear() -> void {
    plan_.reset();
    override_path_.reset();
}

auto resolve_cached(PlanCache& cache, ResolverChain& chain, const ResolveRequest& request)
    -> Result<ExecutionPlan, ResolutionError> {
    if (auto cached = cache.lookup(request.override_path)) {
        return Result<ExecutionPlan, ResolutionError>::success(std::move(*cached));
    }

    cache.clear();
    auto result = chain.resolve(request);
    if (result.is_ok()) {
        cache.store(result.value(), request.override_path);
    }
    return result;
}

auto make_direct_plan(const std::string& executable, CandidateKind source) -> ExecutionPlan {
    return ExecutionPlan{.mode = InvocationMode::DIRECT,
                         .command = {executable},
                         .interpreter = "",
                         .module_dir = "",
                         .package = "",
                         .env = {},
                         .source = source};
}

auto make_module_plan(const std::string& interpreter, const std::string& module_dir,
                      const std::string& package, IEnvironment& environment, CandidateKind source)
    -> ExecutionPlan {
    auto python_path = module_dir;
    if (auto existing = environment.get("PYTHONPATH"); existing && !existing->empty()) {
        python_path += ":" + *existing;
    }

    return ExecutionPlan{.mode = InvocationMode::MODULE,
                         .command = {interpreter, "-m", package},
                         .interpreter = interpreter,
                         .module_dir = module_dir,
                         .package = package,
                         .env = {{"PYTHONPATH", python_path}},
                         .source = source};
}

auto make_shim_plan(const std::string& interpreter, const std::string& module_dir,
                    const std::string& package, CandidateKind source) -> ExecutionPlan {
    return ExecutionPlan{.mode = InvocationMode::SHIM,
                         .command = {interpreter},
                         .interpreter = interpreter,
                         .module_dir = module_dir,
                         .package = package,
                         .env = {},
                         .source = source};
}

auto invocation_mode_name(InvocationMode mode) -> std::string {
    switch (mode) {
    case InvocationMode::DIRECT:
        return "direct";
    case InvocationMode::MODULE:
        return "module";
    case InvocationMode::SHIM:
        return "shim";
    }
    return "unknown";
}

auto describe_plan(const ExecutionPlan& plan) -> std::string {
    std::ostringstream oss;
    oss << invocation_mode_name(plan.mode) << ":";
    for (const auto& token : plan.command) {
        oss << " " << token;
    }
    if (plan.mode == InvocationMode::SHIM) {
        oss << " <script importing " << plan.package << " from " << plan.module_dir << ">";
    }
    for (const auto& [key, value] : plan.env) {
        oss << " (" << key << "=" << value << ")";
    }
    oss << " [" << candidate_kind_name(plan.source) << "]";
    return oss.str();
}

} // namespace normfmt
