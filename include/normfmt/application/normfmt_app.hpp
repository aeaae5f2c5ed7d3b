#pragma once

#include "normfmt/application/cli.hpp"
#include "normfmt/interfaces.hpp"
#include "normfmt/resolve/resolver_chain.hpp"
#include "normfmt/types.hpp"
#include <iostream>
#include <memory>
#include <string>

namespace normfmt {

// Debug sink: prints prefixed lines when enabled, nothing otherwise
class DebugLog {
private:
    std::ostream& out_;
    bool enabled_;

public:
    DebugLog(std::ostream& out, bool enabled) : out_(out), enabled_(enabled) {}

    auto enabled() const -> bool { return enabled_; }
    auto line(const std::string& message) -> void;
    auto block(const std::string& rendered) -> void;
};

class NormfmtApp {
private:
    std::unique_ptr<IFileSystem> filesystem_;
    std::unique_ptr<IProcessRunner> runner_;
    std::unique_ptr<IEnvironment> environment_;
    ResolverChain chain_;
    PlanCache cache_;
    Config config_;

    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;

public:
    NormfmtApp(std::unique_ptr<IFileSystem> filesystem,
               std::unique_ptr<IProcessRunner> runner,
               std::unique_ptr<IEnvironment> environment,
               Strategies strategies,
               std::istream& in = std::cin,
               std::ostream& out = std::cout,
               std::ostream& err = std::cerr);

    // Format every configured file (or stdin); returns the worst exit code
    auto run(const Config& config) -> int;

    // One file, committed in place unless the configuration says dry-run
    auto format_file(const std::string& path, bool enhanced, const HeaderIdentity& identity, bool debug) -> int;

    // Login and email for the header; the filename is left for the caller
    auto resolve_identity(const Config& config) -> HeaderIdentity;

    auto plan_cache() const -> const PlanCache& { return cache_; }

private:
    auto format_enhanced(const std::string& path, const HeaderIdentity& identity, DebugLog& log) -> int;
    auto format_external(const std::string& path, DebugLog& log) -> int;
    auto format_stdin(const HeaderIdentity& identity) -> int;
    auto print_plan() -> int;
    auto confirm_overwrite(const std::string& path) -> bool;

    auto make_request() const -> ResolveRequest;
    auto report_diagnostics(const std::string& file, const Diagnostics& diagnostics, DebugLog& log) -> void;
};

} // namespace normfmt
