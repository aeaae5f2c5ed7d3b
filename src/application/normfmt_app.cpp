#include "normfmt/application/normfmt_app.hpp"
#include "normfmt/core/rule_engine.hpp"
#include "normfmt/exec/execution_dispatcher.hpp"
#include "normfmt/exec/temp_file.hpp"
#include "normfmt/string_utils.hpp"
#include "normfmt/ui/report_view.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iterator>
#include <variant>

namespace normfmt {

namespace {

constexpr const char* kStdinName = "stdin.c";

auto base_name(const std::string& path) -> std::string {
    return std::filesystem::path(path).filename().string();
}

} // namespace

auto DebugLog::line(const std::string& message) -> void {
    if (enabled_) {
        out_ << "[normfmt] " << message << "\n";
    }
}

auto DebugLog::block(const std::string& rendered) -> void {
    if (enabled_) {
        out_ << rendered;
    }
}

NormfmtApp::NormfmtApp(std::unique_ptr<IFileSystem> filesystem, std::unique_ptr<IProcessRunner> runner,
                       std::unique_ptr<IEnvironment> environment, Strategies strategies, std::istream& in,
                       std::ostream& out, std::ostream& err)
    : filesystem_(std::move(filesystem)), runner_(std::move(runner)), environment_(std::move(environment)),
      chain_(std::move(strategies), *filesystem_, *runner_, *environment_), in_(in), out_(out), err_(err) {}

auto NormfmtApp::run(const Config& config) -> int {
    config_ = config;

    if (config.print_plan) {
        return print_plan();
    }

    auto identity = resolve_identity(config);
    if (config.files.empty()) {
        identity.filename = kStdinName;
        identity.timestamp = std::chrono::system_clock::now();
        return format_stdin(identity);
    }

    int worst = EXIT_OK;
    for (const auto& path : config.files) {
        identity.filename = base_name(path);
        identity.timestamp = std::chrono::system_clock::now();
        worst = std::max(worst, format_file(path, config.enhanced, identity, config.debug));
    }
    return worst;
}

auto NormfmtApp::format_file(const std::string& path, bool enhanced, const HeaderIdentity& identity, bool debug)
    -> int {
    DebugLog log(err_, debug);
    log.line(std::string(enhanced ? "enhanced" : "external") + " formatting of " + path);

    return enhanced ? format_enhanced(path, identity, log) : format_external(path, log);
}

auto NormfmtApp::resolve_identity(const Config& config) -> HeaderIdentity {
    HeaderIdentity identity;

    if (config.username && !config.username->empty()) {
        identity.login = *config.username;
    } else if (auto user = environment_->get("USER"); user && !user->empty()) {
        identity.login = *user;
    } else {
        identity.login = "unknown";
    }

    if (config.email && !config.email->empty()) {
        identity.email = *config.email;
    } else {
        // Only consulted when a header may be written
        auto git = (config.enhanced && config.add_header)
            ? runner_->run({"git", "config", "user.email"}, {})
            : ProcessResult{.exit_code = 1, .stdout_output = "", .stderr_output = ""};
        auto email = StringUtils::trim(git.stdout_output);
        identity.email = (git.exit_code == 0 && !email.empty()) ? email : identity.login + "@student.42.fr";
    }

    identity.timestamp = std::chrono::system_clock::now();
    return identity;
}

auto NormfmtApp::format_enhanced(const std::string& path, const HeaderIdentity& identity, DebugLog& log)
    -> int {
    auto content = filesystem_->read_file(path);
    if (!content) {
        err_ << "Error: cannot read " << path << "\n";
        return EXIT_EXECUTION_FAILURE;
    }

    auto result = rule_engine::format(*content,
                                      FormatOptions{.identity = identity, .add_header = config_.add_header});
    report_diagnostics(path, result.diagnostics, log);

    if (config_.dry_run) {
        out_ << result.text;
        return EXIT_OK;
    }

    if (result.text == *content) {
        log.line(path + " already formatted");
        return EXIT_OK;
    }
    if (!confirm_overwrite(path)) {
        log.line("kept " + path);
        return EXIT_OK;
    }
    if (!filesystem_->write_file_atomic(path, result.text)) {
        err_ << "Error: cannot write " << path << "\n";
        return EXIT_EXECUTION_FAILURE;
    }
    log.line("wrote " + path);
    return EXIT_OK;
}

auto NormfmtApp::format_external(const std::string& path, DebugLog& log) -> int {
    bool fresh = !cache_.lookup(config_.formatter_path);
    auto plan = resolve_cached(cache_, chain_, make_request());
    if (!plan) {
        err_ << "Error: " << plan.error().message << "\n";
        err_ << ui::render_attempts(plan.error().attempts, "Locations checked");
        return EXIT_RESOLUTION_FAILURE;
    }
    log.line("plan " + describe_plan(plan.value()));
    if (fresh) {
        log.block(ui::render_attempts(chain_.last_attempts(), "Locations checked"));
    }

    ExecutionDispatcher dispatcher(*runner_, *filesystem_, config_.extra_env);

    // Dry runs and confirmed writes format a scratch copy first
    if (config_.dry_run || config_.confirm) {
        auto formatted = dispatcher.run(plan.value(), path);
        if (!formatted) {
            err_ << "Error: " << path << ": " << formatted.error().message << "\n";
            err_ << ui::render_execution_error(formatted.error());
            return EXIT_EXECUTION_FAILURE;
        }
        if (config_.dry_run) {
            out_ << formatted.value();
            return EXIT_OK;
        }
        if (!confirm_overwrite(path)) {
            log.line("kept " + path);
            return EXIT_OK;
        }
        if (!filesystem_->write_file_atomic(path, formatted.value())) {
            err_ << "Error: cannot write " << path << "\n";
            return EXIT_EXECUTION_FAILURE;
        }
        log.line("wrote " + path);
        return EXIT_OK;
    }

    auto committed = dispatcher.format_in_place(plan.value(), path);
    if (!committed) {
        const auto& error = committed.error();
        err_ << "Error: " << path << ": " << dispatch_error_message(error) << "\n";
        if (const auto* execution = std::get_if<ExecutionError>(&error)) {
            err_ << ui::render_execution_error(*execution);
        }
        return EXIT_EXECUTION_FAILURE;
    }
    log.line("wrote " + path);
    return EXIT_OK;
}

// Only a plain "y" answer overwrites
auto NormfmtApp::confirm_overwrite(const std::string& path) -> bool {
    if (!config_.confirm) {
        return true;
    }
    err_ << "Are you sure you want to overwrite " << path << "? [y/N] " << std::flush;

    std::string answer;
    if (!std::getline(in_, answer)) {
        return false;
    }
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer == "y";
}

auto NormfmtApp::format_stdin(const HeaderIdentity& identity) -> int {
    DebugLog log(err_, config_.debug);
    std::string content(std::istreambuf_iterator<char>(in_), {});

    if (config_.enhanced) {
        auto result = rule_engine::format(content,
                                          FormatOptions{.identity = identity, .add_header = config_.add_header});
        report_diagnostics(kStdinName, result.diagnostics, log);
        out_ << result.text;
        return EXIT_OK;
    }

    // The external tool only rewrites files, so stdin goes through a scratch copy
    auto staged = ScopedTempFile::create(".c", content);
    if (!staged) {
        err_ << "Error: " << staged.error().message << "\n";
        return EXIT_EXECUTION_FAILURE;
    }

    auto plan = resolve_cached(cache_, chain_, make_request());
    if (!plan) {
        err_ << "Error: " << plan.error().message << "\n";
        err_ << ui::render_attempts(plan.error().attempts, "Locations checked");
        return EXIT_RESOLUTION_FAILURE;
    }
    log.line("plan " + describe_plan(plan.value()));

    ExecutionDispatcher dispatcher(*runner_, *filesystem_, config_.extra_env);
    auto formatted = dispatcher.run(plan.value(), staged.value().path());
    if (!formatted) {
        err_ << "Error: " << formatted.error().message << "\n";
        err_ << ui::render_execution_error(formatted.error());
        return EXIT_EXECUTION_FAILURE;
    }
    out_ << formatted.value();
    return EXIT_OK;
}

auto NormfmtApp::print_plan() -> int {
    auto plan = chain_.resolve(make_request());
    if (!plan) {
        err_ << "Error: " << plan.error().message << "\n";
        err_ << ui::render_attempts(plan.error().attempts, "Locations checked");
        return EXIT_RESOLUTION_FAILURE;
    }

    out_ << describe_plan(plan.value()) << "\n";
    out_ << ui::render_attempts(chain_.last_attempts(), "Locations checked");
    return EXIT_OK;
}

auto NormfmtApp::make_request() const -> ResolveRequest {
    ResolveRequest request;
    request.override_path = config_.formatter_path;
    return request;
}

auto NormfmtApp::report_diagnostics(const std::string& file, const Diagnostics& diagnostics, DebugLog& log)
    -> void {
    auto skipped = skipped_count(diagnostics);
    if (log.enabled() || config_.dry_run) {
        err_ << ui::render_diagnostics(file, diagnostics);
        return;
    }
    if (skipped > 0) {
        err_ << "Warning: " << file << ": " << skipped
             << " line(s) left unchanged, run with --verbose for details\n";
    }
}

} // namespace normfmt
