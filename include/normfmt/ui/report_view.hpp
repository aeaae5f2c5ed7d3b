#pragma once

#include "normfmt/errors.hpp"
#include "normfmt/types.hpp"
#include <ftxui/dom/elements.hpp>
#include <string>
#include <vector>

namespace normfmt::ui {

// Table of every location the resolver looked at
auto attempts_element(const std::vector<ResolverCandidate>& attempts) -> ftxui::Element;

// Skipped lines of one file, with a count summary
auto diagnostics_element(const std::string& file, const Diagnostics& diagnostics) -> ftxui::Element;

// Captured output of a failed formatter run
auto execution_error_element(const ExecutionError& error) -> ftxui::Element;

// Render an element at its natural size
auto to_string(ftxui::Element element) -> std::string;

auto render_attempts(const std::vector<ResolverCandidate>& attempts, const std::string& title) -> std::string;
auto render_diagnostics(const std::string& file, const Diagnostics& diagnostics) -> std::string;
auto render_execution_error(const ExecutionError& error) -> std::string;

} // namespace normfmt::ui
