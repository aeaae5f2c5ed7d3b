#pragma once

#include "normfmt/resolve/resolver_chain.hpp"
#include <optional>
#include <string>
#include <vector>

namespace normfmt {

// Override from --formatter-path or C_FORMATTER_42_PATH; unusable means fatal
class ExplicitOverrideStrategy : public IResolverStrategy {
public:
    auto name() const -> std::string override { return "explicit override"; }
    auto attempt(ResolveContext& context) -> StrategyOutcome override;
};

// Every PATH entry, in order
class SearchPathStrategy : public IResolverStrategy {
public:
    auto name() const -> std::string override { return "search path"; }
    auto attempt(ResolveContext& context) -> StrategyOutcome override;
};

// Ask the Python interpreter where the package is installed
class ModuleLookupStrategy : public IResolverStrategy {
public:
    auto name() const -> std::string override { return "module lookup"; }
    auto attempt(ResolveContext& context) -> StrategyOutcome override;
};

// pipx, user-site, virtualenv and Homebrew bin directories
class WellKnownDirectoryStrategy : public IResolverStrategy {
public:
    auto name() const -> std::string override { return "well-known directories"; }
    auto attempt(ResolveContext& context) -> StrategyOutcome override;

    // Directories scanned, in order; entries whose variable is unset are left out
    static auto directories(IEnvironment& environment, const std::string& package_name)
        -> std::vector<std::string>;
};

// Last resort: brew and pipx report their install directories
class PackageManagerStrategy : public IResolverStrategy {
public:
    auto name() const -> std::string override { return "package manager"; }
    auto attempt(ResolveContext& context) -> StrategyOutcome override;
};

// The five strategies in resolution order
auto default_strategies() -> Strategies;

// First executable named `program` on PATH
auto find_on_path(IEnvironment& environment, IFileSystem& filesystem, const std::string& program)
    -> std::optional<std::string>;

// Python snippet printing the package's parent directory and whether it has __main__
auto module_location_script(const std::string& package) -> std::string;

} // namespace normfmt
