#include "normfmt/ui/report_view.hpp"
#include <gtest/gtest.h>

namespace normfmt::ui {

namespace {

auto contains(const std::string& haystack, const std::string& needle) -> bool {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(ReportViewTest, AttemptTableListsEveryLocation)
{
    std::vector<ResolverCandidate> attempts{
        ResolverCandidate{.kind = CandidateKind::SEARCH_PATH,
                          .priority = 1,
                          .location = "/usr/bin/c_formatter_42",
                          .found = false,
                          .executable = std::nullopt,
                          .module_dir = std::nullopt,
                          .module_has_main = false},
        ResolverCandidate{.kind = CandidateKind::MODULE_LOOKUP,
                          .priority = 2,
                          .location = "/src/checkout",
                          .found = true,
                          .executable = std::nullopt,
                          .module_dir = "/src/checkout",
                          .module_has_main = true},
    };

    auto rendered = render_attempts(attempts, "Locations checked");

    EXPECT_TRUE(contains(rendered, "Locations checked"));
    EXPECT_TRUE(contains(rendered, "Strategy"));
    EXPECT_TRUE(contains(rendered, "/usr/bin/c_formatter_42"));
    EXPECT_TRUE(contains(rendered, "missing"));
    EXPECT_TRUE(contains(rendered, "module-lookup"));
    EXPECT_TRUE(contains(rendered, "/src/checkout (package, runnable)"));
}

TEST(ReportViewTest, EmptyAttemptTable)
{
    auto rendered = render_attempts({}, "Locations checked");

    EXPECT_TRUE(contains(rendered, "No locations were checked"));
}

TEST(ReportViewTest, DiagnosticsShowOnlySkippedLines)
{
    Diagnostics diagnostics{
        PassOutcome{.pass = "indentation", .status = PassOutcome::Status::APPLIED, .line_number = 2, .reason = ""},
        PassOutcome{.pass = "split-declarations",
                    .status = PassOutcome::Status::SKIPPED,
                    .line_number = 7,
                    .reason = "comment on declaration line"},
    };

    auto rendered = render_diagnostics("main.c", diagnostics);

    EXPECT_TRUE(contains(rendered, "main.c: 1 edits, 1 skipped"));
    EXPECT_TRUE(contains(rendered, "line 7: "));
    EXPECT_TRUE(contains(rendered, "comment on declaration line"));
    EXPECT_TRUE(contains(rendered, "[split-declarations]"));
    EXPECT_FALSE(contains(rendered, "[indentation]"));
}

TEST(ReportViewTest, ExecutionErrorShowsToolOutput)
{
    ExecutionError error{.message = "c_formatter_42 exited with status 1",
                         .exit_code = 1,
                         .diagnostics = "Traceback (most recent call last):\nValueError: bad input\n"};

    auto rendered = render_execution_error(error);

    EXPECT_TRUE(contains(rendered, "c_formatter_42 exited with status 1"));
    EXPECT_TRUE(contains(rendered, "Traceback (most recent call last):"));
    EXPECT_TRUE(contains(rendered, "ValueError: bad input"));
}

TEST(ReportViewTest, LongTablesAreNotTruncated)
{
    std::vector<ResolverCandidate> attempts;
    for (size_t i = 0; i < 40; ++i) {
        attempts.push_back(ResolverCandidate{.kind = CandidateKind::SEARCH_PATH,
                                             .priority = 1,
                                             .location = "/dir" + std::to_string(i) + "/c_formatter_42",
                                             .found = false,
                                             .executable = std::nullopt,
                                             .module_dir = std::nullopt,
                                             .module_has_main = false});
    }

    auto rendered = render_attempts(attempts, "Locations checked");

    EXPECT_TRUE(contains(rendered, "/dir0/c_formatter_42"));
    EXPECT_TRUE(contains(rendered, "/dir39/c_formatter_42"));
}

} // namespace normfmt::ui
