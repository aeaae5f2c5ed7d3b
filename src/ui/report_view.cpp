#include "normfmt/ui/report_view.hpp"
#include "normfmt/string_utils.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>
#include <algorithm>

namespace normfmt::ui {

namespace {

auto pad(const std::string& text, size_t width) -> std::string {
    if (text.size() >= width) {
        return text;
    }
    return text + std::string(width - text.size(), ' ');
}

} // namespace

auto attempts_element(const std::vector<ResolverCandidate>& attempts) -> ftxui::Element {
    using namespace ftxui;

    Elements rows;
    rows.push_back(text(pad("#", 4) + pad("Strategy", 22) + pad("Result", 10) + "Location") | bold);
    rows.push_back(separator());

    if (attempts.empty()) {
        rows.push_back(text("No locations were checked") | dim);
    }

    for (const auto& attempt : attempts) {
        std::string line = pad(std::to_string(attempt.priority + 1), 4)
            + pad(candidate_kind_name(attempt.kind), 22)
            + pad(attempt.found ? "found" : "missing", 10)
            + attempt.location;
        if (attempt.module_dir && !attempt.executable) {
            line += attempt.module_has_main ? " (package, runnable)" : " (package)";
        }

        auto row = text(line);
        if (attempt.found) {
            row |= color(Color::Green) | bold;
        }
        rows.push_back(row);
    }

    return vbox(std::move(rows)) | border;
}

auto diagnostics_element(const std::string& file, const Diagnostics& diagnostics) -> ftxui::Element {
    using namespace ftxui;

    auto skipped = skipped_count(diagnostics);
    auto summary = text(file + ": " + std::to_string(applied_count(diagnostics)) + " edits, "
                        + std::to_string(skipped) + " skipped")
        | bold;

    Elements lines{summary};
    for (const auto& outcome : diagnostics) {
        if (outcome.status != PassOutcome::Status::SKIPPED) {
            continue;
        }
        lines.push_back(hbox({
            text("  line " + std::to_string(outcome.line_number) + ": "),
            text(outcome.reason) | color(Color::Yellow),
            text(" [" + outcome.pass + "]") | dim,
        }));
    }

    return vbox(std::move(lines));
}

auto execution_error_element(const ExecutionError& error) -> ftxui::Element {
    using namespace ftxui;

    Elements lines{text(error.message) | bold | color(Color::Red)};
    if (!error.diagnostics.empty()) {
        lines.push_back(separator());
        for (const auto& line : StringUtils::split(error.diagnostics, '\n')) {
            if (!line.empty()) {
                lines.push_back(text(line));
            }
        }
    }
    return vbox(std::move(lines)) | border;
}

auto to_string(ftxui::Element element) -> std::string {
    // Sized from the element's own requirement so long tables are not cut at the terminal height
    element->ComputeRequirement();
    auto requirement = element->requirement();
    auto screen = ftxui::Screen::Create(ftxui::Dimension::Fixed(std::max(requirement.min_x, 1)),
                                        ftxui::Dimension::Fixed(std::max(requirement.min_y, 1)));
    ftxui::Render(screen, element);
    return screen.ToString() + "\n";
}

auto render_attempts(const std::vector<ResolverCandidate>& attempts, const std::string& title) -> std::string {
    using namespace ftxui;
    return to_string(vbox({text(title) | bold, attempts_element(attempts)}));
}

auto render_diagnostics(const std::string& file, const Diagnostics& diagnostics) -> std::string {
    return to_string(diagnostics_element(file, diagnostics));
}

auto render_execution_error(const ExecutionError& error) -> std::string {
    return to_string(execution_error_element(error));
}

} // namespace normfmt::ui
