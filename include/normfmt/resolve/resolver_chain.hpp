#pragma once

#include "normfmt/errors.hpp"
#include "normfmt/interfaces.hpp"
#include "normfmt/result.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace normfmt {

// How the external formatter gets launched
enum class InvocationMode {
    DIRECT,     // <executable> <file>
    MODULE,     // <interpreter> -m <package> <file>
    SHIM        // <interpreter> <generated script> <file>
};

// The winning resolution: everything needed to launch the formatter
struct ExecutionPlan {
    InvocationMode mode = InvocationMode::DIRECT;
    std::vector<std::string> command;       // argv prefix, the target file is appended
    std::string interpreter;                // MODULE and SHIM only
    std::string module_dir;                 // Directory holding the package
    std::string package;                    // Importable package name
    EnvOverrides env;
    CandidateKind source = CandidateKind::SEARCH_PATH;

    auto operator==(const ExecutionPlan& other) const -> bool = default;
};

struct ResolveRequest {
    std::optional<std::string> override_path;
    std::string tool_name = "c_formatter_42";
    std::vector<std::string> interpreters{"python3", "python"};
    std::string package_name = "c-formatter-42";
    std::string override_variable = "C_FORMATTER_42_PATH";
};

// Shared state of one resolution: the request, the injected system seams and
// every location looked at so far
struct ResolveContext {
    const ResolveRequest& request;
    IFileSystem& filesystem;
    IProcessRunner& runner;
    IEnvironment& environment;
    std::vector<ResolverCandidate> attempts;
    size_t priority{};

    // Record an attempt under the running strategy's priority
    auto record(ResolverCandidate candidate) -> void;
};

struct StrategyOutcome {
    enum class Kind {
        FOUND,
        NOT_FOUND,
        FATAL       // Stop the chain, nothing later may run
    };

    Kind kind = Kind::NOT_FOUND;
    std::optional<ExecutionPlan> plan;
    std::string reason;

    static auto found(ExecutionPlan plan) -> StrategyOutcome;
    static auto not_found() -> StrategyOutcome;
    static auto fatal(std::string reason) -> StrategyOutcome;
};

class IResolverStrategy {
public:
    virtual ~IResolverStrategy() = default;
    virtual auto name() const -> std::string = 0;
    virtual auto attempt(ResolveContext& context) -> StrategyOutcome = 0;
};

using Strategies = std::vector<std::unique_ptr<IResolverStrategy>>;

// Ordered fallback discovery: the first strategy that finds the formatter wins
class ResolverChain {
private:
    Strategies strategies_;
    IFileSystem& filesystem_;
    IProcessRunner& runner_;
    IEnvironment& environment_;
    std::vector<ResolverCandidate> last_attempts_;

public:
    ResolverChain(Strategies strategies, IFileSystem& filesystem, IProcessRunner& runner,
                  IEnvironment& environment);

    auto resolve(const ResolveRequest& request) -> Result<ExecutionPlan, ResolutionError>;

    // Attempts of the most recent resolve(), successful or not
    auto last_attempts() const -> const std::vector<ResolverCandidate>& { return last_attempts_; }
};

// Process-wide memo of the last plan, keyed by the override it was resolved with
class PlanCache {
private:
    std::optional<ExecutionPlan> plan_;
    std::optional<std::string> override_path_;

public:
    auto lookup(const std::optional<std::string>& override_path) const -> std::optional<ExecutionPlan>;
    auto store(ExecutionPlan plan, std::optional<std::string> override_path) -> void;
    auto clear() -> void;
    auto has_plan() const -> bool { return plan_.has_value(); }
};

auto resolve_cached(PlanCache& cache, ResolverChain& chain, const ResolveRequest& request)
    -> Result<ExecutionPlan, ResolutionError>;

// Plan builders shared by the strategies
auto make_direct_plan(const std::string& executable, CandidateKind source) -> ExecutionPlan;
auto make_module_plan(const std::string& interpreter, const std::string& module_dir,
                      const std::string& package, IEnvironment& environment, CandidateKind source)
    -> ExecutionPlan;
auto make_shim_plan(const std::string& interpreter, const std::string& module_dir,
                    const std::string& package, CandidateKind source) -> ExecutionPlan;

auto invocation_mode_name(InvocationMode mode) -> std::string;

// One-line summary, e.g. "module: /usr/bin/python3 -m c_formatter_42 (PYTHONPATH=/x)"
auto describe_plan(const ExecutionPlan& plan) -> std::string;

} // namespace normfmt
