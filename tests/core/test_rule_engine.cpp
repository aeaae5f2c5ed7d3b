#include "normfmt/core/header_block.hpp"
#include "normfmt/core/rule_engine.hpp"
#include "normfmt/string_utils.hpp"
#include <gtest/gtest.h>

namespace normfmt::rule_engine {

class RuleEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.identity = HeaderIdentity{.filename = "main.c",
                                           .login = "jdoe",
                                           .email = "jdoe@student.42.fr",
                                           .timestamp = std::chrono::system_clock::from_time_t(1700000000)};
        options_.add_header = false;
    }

    auto buffer_of(std::vector<std::string> lines) -> SourceBuffer {
        return SourceBuffer{.lines = std::move(lines), .line_ending = LineEnding::LF};
    }

    FormatOptions options_;
    Diagnostics diagnostics_;
};

// Indentation

TEST_F(RuleEngineTest, ConvertsSpaceIndentationToTabs)
{
    auto buffer = buffer_of({"int f(void)", "{", "    int a;", "        a = 1;", "\t    c;", "}"});

    normalize_indentation(buffer, diagnostics_);

    EXPECT_EQ(buffer.lines, (std::vector<std::string>{"int f(void)", "{", "\tint a;", "\t\ta = 1;", "\t\tc;", "}"}));
    EXPECT_EQ(applied_count(diagnostics_), 3);
}

TEST_F(RuleEngineTest, SkipsIndentationThatIsNotWholeTabs)
{
    auto buffer = buffer_of({"  b;", " \td;"});

    normalize_indentation(buffer, diagnostics_);

    EXPECT_EQ(buffer.lines, (std::vector<std::string>{"  b;", " \td;"}));
    ASSERT_EQ(diagnostics_.size(), 2);
    EXPECT_EQ(diagnostics_[0].reason, "indentation of 2 spaces is not a multiple of 4");
    EXPECT_EQ(diagnostics_[0].line_number, 1);
    EXPECT_EQ(diagnostics_[1].reason, "space before tab in indentation");
}

TEST_F(RuleEngineTest, IndentationLeavesCommentsAndInnerWhitespaceAlone)
{
    auto buffer = buffer_of({"/*", "    * doc", "*/", "\tputs(\"    x\");  ", "   \t"});

    normalize_indentation(buffer, diagnostics_);

    EXPECT_EQ(buffer.lines, (std::vector<std::string>{"/*", "    * doc", "*/", "\tputs(\"    x\");  ", ""}));
}

TEST_F(RuleEngineTest, IndentationIsIdempotent)
{
    auto buffer = buffer_of({"    a;", "  b;", "\t    c;"});
    normalize_indentation(buffer, diagnostics_);
    auto once = buffer.lines;

    normalize_indentation(buffer, diagnostics_);

    EXPECT_EQ(buffer.lines, once);
}

// Declaration split

TEST_F(RuleEngineTest, SplitsDeclarationInsideFunction)
{
    auto buffer = buffer_of({"int main(void)", "{", "\tint i = 0;", "\treturn (i);", "}"});

    split_declarations(buffer, diagnostics_);

    EXPECT_EQ(buffer.lines,
              (std::vector<std::string>{"int main(void)", "{", "\tint i;", "\ti = 0;", "\treturn (i);", "}"}));
    ASSERT_EQ(diagnostics_.size(), 1);
    EXPECT_EQ(diagnostics_[0].line_number, 3);
}

TEST_F(RuleEngineTest, SplitLeavesForLoopHeaderAlone)
{
    auto buffer = buffer_of({"int f(void)", "{", "\tfor (int i = 0; i < 10; i++) {}", "}"});
    auto original = buffer.lines;

    split_declarations(buffer, diagnostics_);

    EXPECT_EQ(buffer.lines, original);
    EXPECT_TRUE(diagnostics_.empty());
}

TEST_F(RuleEngineTest, SplitLeavesFileScopeAlone)
{
    auto buffer = buffer_of({"int g_count = 0;"});

    split_declarations(buffer, diagnostics_);

    EXPECT_EQ(buffer.lines, (std::vector<std::string>{"int g_count = 0;"}));
}

TEST_F(RuleEngineTest, SplitSkipsUnsafeAndCommentedDeclarations)
{
    auto buffer = buffer_of({"int f(void)", "{", "\tstatic int n = 0;", "\tint i = 0; // counter", "}"});
    auto original = buffer.lines;

    split_declarations(buffer, diagnostics_);

    EXPECT_EQ(buffer.lines, original);
    ASSERT_EQ(diagnostics_.size(), 2);
    EXPECT_EQ(diagnostics_[1].reason, "comment on declaration line");
    EXPECT_EQ(skipped_count(diagnostics_), 2);
}

// Braces

TEST_F(RuleEngineTest, MovesBracesOntoTheirOwnLines)
{
    auto buffer = buffer_of({"int f(int x) {", "\tif (x) {", "\t\treturn (1);", "\t} else {", "\t\treturn (0);", "\t}",
                             "}"});

    place_braces(buffer, diagnostics_);

    EXPECT_EQ(buffer.lines,
              (std::vector<std::string>{"int f(int x)", "{", "\tif (x)", "\t{", "\t\treturn (1);", "\t}", "\telse",
                                        "\t{", "\t\treturn (0);", "\t}", "}"}));
    EXPECT_EQ(applied_count(diagnostics_), 3);
}

TEST_F(RuleEngineTest, SplitsOneLineBlock)
{
    auto buffer = buffer_of({"\tif (a) { b(); }"});

    place_braces(buffer, diagnostics_);

    EXPECT_EQ(buffer.lines, (std::vector<std::string>{"\tif (a)", "\t{", "\t\tb();", "\t}"}));
}

TEST_F(RuleEngineTest, ClosingBraceKeepsTypedefNameAndWhile)
{
    auto buffer = buffer_of({"typedef struct s_list {", "\tint x;", "} t_list;", "\tdo {", "\t} while (x);"});

    place_braces(buffer, diagnostics_);

    EXPECT_EQ(buffer.lines, (std::vector<std::string>{"typedef struct s_list", "{", "\tint x;", "} t_list;", "\tdo",
                                                      "\t{", "\t} while (x);"}));
}

TEST_F(RuleEngineTest, LeavesInitializersAndEmptyBodiesAlone)
{
    auto buffer = buffer_of({"int f(void)", "{", "\tint tab[2] = {1, 2};", "\twhile (x) {}", "\tputs(\"{\");", "}"});
    auto original = buffer.lines;

    place_braces(buffer, diagnostics_);

    EXPECT_EQ(buffer.lines, original);
    EXPECT_TRUE(diagnostics_.empty());
}

TEST_F(RuleEngineTest, CompoundLiteralsKeepTheirBraces)
{
    auto buffer = buffer_of({"t_vec\tf(void)", "{", "\treturn ((t_vec){1, 2});", "\tv = (t_vec){1, 2};",
                             "\tg((t_vec){3, 4});", "}"});
    auto original = buffer.lines;

    place_braces(buffer, diagnostics_);

    EXPECT_EQ(buffer.lines, original);
    EXPECT_TRUE(diagnostics_.empty());
}

TEST_F(RuleEngineTest, ContinuedStringLiteralIsNotCode)
{
    auto buffer = buffer_of({"int f(void)", "{", "\tputs(\"usage: a\\", "    b { c }\");", "}"});
    auto original = buffer.lines;

    normalize_indentation(buffer, diagnostics_);
    split_declarations(buffer, diagnostics_);
    place_braces(buffer, diagnostics_);
    space_blocks(buffer, diagnostics_);
    prune_blank_lines(buffer, diagnostics_);

    EXPECT_EQ(buffer.lines, original);
    EXPECT_TRUE(diagnostics_.empty());
}

TEST_F(RuleEngineTest, BraceWithCommentOrSpaceIndentIsSkipped)
{
    auto buffer = buffer_of({"\tif (x) { // check", "  if (y) {"});
    auto original = buffer.lines;

    place_braces(buffer, diagnostics_);

    EXPECT_EQ(buffer.lines, original);
    ASSERT_EQ(diagnostics_.size(), 2);
    EXPECT_EQ(diagnostics_[0].reason, "comment shares a line with a brace");
    EXPECT_EQ(diagnostics_[1].reason, "indentation is not made of tabs");
}

// Blank lines

TEST_F(RuleEngineTest, BlankLineAfterDeclarationBlock)
{
    auto buffer = buffer_of({"int f(void)", "{", "\tint a;", "\tchar *s;", "\tf(a);", "}"});

    space_blocks(buffer, diagnostics_);

    EXPECT_EQ(buffer.lines,
              (std::vector<std::string>{"int f(void)", "{", "\tint a;", "\tchar *s;", "", "\tf(a);", "}"}));
}

TEST_F(RuleEngineTest, BlankLineAfterInnerBlockBrace)
{
    auto buffer = buffer_of({"int f(void)", "{", "\tif (x)", "\t{", "\t\ty();", "\t}", "}"});

    space_blocks(buffer, diagnostics_);

    EXPECT_EQ(buffer.lines,
              (std::vector<std::string>{"int f(void)", "{", "\tif (x)", "\t{", "", "\t\ty();", "\t}", "}"}));
}

TEST_F(RuleEngineTest, NoBlankLinesBetweenStructMembers)
{
    auto buffer = buffer_of({"typedef struct s_cmd", "{", "\tchar\t*name;", "\tint\t\t(*fn)(char **);",
                             "}\tt_cmd;"});
    auto original = buffer.lines;

    space_blocks(buffer, diagnostics_);

    EXPECT_EQ(buffer.lines, original);
    EXPECT_TRUE(diagnostics_.empty());
}

TEST_F(RuleEngineTest, NoBlankLinesInsideNestedInitializers)
{
    auto buffer = buffer_of({"t_op\tg_ops[] =", "{", "\t{", "\t\t\"a\",", "\t\t1", "\t},", "};"});
    auto original = buffer.lines;

    space_blocks(buffer, diagnostics_);

    EXPECT_EQ(buffer.lines, original);
    EXPECT_TRUE(diagnostics_.empty());
}

TEST_F(RuleEngineTest, PrunesBlankRunsAndBlankAfterFunctionBrace)
{
    auto buffer = buffer_of({"int f(void)", "{", "", "\treturn (0);", "}", "", "", "", "int g;"});

    prune_blank_lines(buffer, diagnostics_);

    EXPECT_EQ(buffer.lines, (std::vector<std::string>{"int f(void)", "{", "\treturn (0);", "}", "", "int g;"}));
    EXPECT_EQ(applied_count(diagnostics_), 3);
}

// Whole pipeline

TEST_F(RuleEngineTest, FormatSplitsWithBlankLineBetween)
{
    auto result = format("int main(void)\n{\n\tint i = 0;\n\treturn (i);\n}\n", options_);

    EXPECT_EQ(result.text, "int main(void)\n{\n\tint i;\n\n\ti = 0;\n\treturn (i);\n}\n");
}

TEST_F(RuleEngineTest, FormatKeepsForLoop)
{
    const std::string source = "int f(void)\n{\n\tfor (int i = 0; i < 10; i++) {}\n}\n";

    EXPECT_EQ(format(source, options_).text, source);
}

TEST_F(RuleEngineTest, FormatLeavesContinuedStringLiteral)
{
    const std::string source = "int\tmain(void)\n{\n\tputs(\"usage: a\\\n    b { c }\");\n\treturn (0);\n}\n";

    auto result = format(source, options_);

    EXPECT_EQ(result.text, source);
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST_F(RuleEngineTest, FormatLeavesCompoundLiterals)
{
    const std::string source = "t_vec\tf(void)\n{\n\tt_vec\tv;\n\n\tv = (t_vec){1, 2};\n\tg((t_vec){3, 4});\n"
                               "\treturn ((t_vec){1, 2});\n}\n";

    EXPECT_EQ(format(source, options_).text, source);
}

TEST_F(RuleEngineTest, FormatLeavesStructWithFunctionPointerMember)
{
    const std::string source = "typedef struct s_cmd\n{\n\tchar\t*name;\n\tint\t\t(*fn)(char **);\n}\tt_cmd;\n";

    EXPECT_EQ(format(source, options_).text, source);
}

TEST_F(RuleEngineTest, FormatLeavesNestedInitializers)
{
    const std::string file_scope = "t_op\tg_ops[] =\n{\n\t{\n\t\t\"a\",\n\t\t1\n\t},\n\t{\n\t\t\"b\",\n\t\t2\n"
                                   "\t},\n};\n";
    const std::string in_function = "int\tf(void)\n{\n\tstatic t_op\tops[] =\n\t{\n\t\t{\n\t\t\t1\n\t\t},\n"
                                    "\t};\n\n\treturn (ops[0].n);\n}\n";

    EXPECT_EQ(format(file_scope, options_).text, file_scope);
    EXPECT_EQ(format(in_function, options_).text, in_function);
}

TEST_F(RuleEngineTest, TrailingNewlinesConvergeToOne)
{
    EXPECT_EQ(format("int x;", options_).text, "int x;\n");
    EXPECT_EQ(format("int x;\n\n\n\n\n", options_).text, "int x;\n");
    EXPECT_EQ(format("", options_).text, "\n");
}

TEST_F(RuleEngineTest, SkipsAreReportedOnce)
{
    auto result = format("int f(void)\n{\n  f();\n}\n", options_);

    EXPECT_EQ(result.text, "int f(void)\n{\n  f();\n}\n");
    EXPECT_EQ(skipped_count(result.diagnostics), 1);
}

TEST_F(RuleEngineTest, PreservesCrlf)
{
    auto result = format("int x;\r\n\r\n\r\n", options_);

    EXPECT_EQ(result.text, "int x;\r\n");
}

TEST_F(RuleEngineTest, AddsHeaderWhenRequested)
{
    options_.add_header = true;

    auto result = format("\n\nint x;\n", options_);
    auto lines = StringUtils::split(result.text, '\n');

    ASSERT_GE(lines.size(), kHeaderLines + 2);
    for (size_t i = 0; i < kHeaderLines; ++i) {
        EXPECT_EQ(lines[i].size(), kHeaderWidth);
    }
    EXPECT_EQ(lines[kHeaderLines], "");
    EXPECT_EQ(lines[kHeaderLines + 1], "int x;");
}

TEST_F(RuleEngineTest, ExistingHeaderKeepsCreationFields)
{
    options_.add_header = true;
    auto first = format("int x;\n", options_);

    options_.identity.login = "other";
    options_.identity.timestamp += std::chrono::hours(1);
    auto second = format(first.text, options_);

    auto before = StringUtils::split(first.text, '\n');
    auto after = StringUtils::split(second.text, '\n');
    ASSERT_EQ(before.size(), after.size());
    for (size_t i = 0; i < before.size(); ++i) {
        if (i != kUpdatedLine) {
            EXPECT_EQ(before[i], after[i]) << "line " << i;
        }
    }
    EXPECT_NE(before[kUpdatedLine], after[kUpdatedLine]);
}

class RuleEngineIdempotenceTest : public RuleEngineTest, public ::testing::WithParamInterface<std::string> {};

TEST_P(RuleEngineIdempotenceTest, FormattingTwiceChangesNothing)
{
    options_.add_header = true;

    auto once = format(GetParam(), options_).text;
    auto twice = format(once, options_).text;

    EXPECT_EQ(twice, once);
}

INSTANTIATE_TEST_SUITE_P(
    RepresentativeSources, RuleEngineIdempotenceTest,
    ::testing::Values(
        "",
        "int x;",
        "#include <unistd.h>\n\nint\tmain(void) {\n    int i = 0;\n    char *s = \"a { b\";\n"
        "    if (i == 0) { write(1, s, 5); }\n    return (0);\n}\n",
        "static int\tg_n = 0;\n\nvoid\tf(int a, int b)\n{\n\tint x = a, y = b;\n\n\n\tif (x)\n\t{\n"
        "\t\ty = x;\n\t}\n\telse {\n\t\tx = y;\n\t}\n}\n\n\n",
        "typedef struct s_list {\n\tvoid *content;\n\tstruct s_list *next;\n} t_list;\n",
        "/*\n * { not code = 1; }\n */\nint f(void)\n{\n  int bad = 1;\n\tint tab[2] = {1, 2};\n"
        "\tdo {\n\t\tbad--;\n\t} while (bad);\n\treturn (tab[0]);\n}\n",
        "int\tf(void)\r\n{\r\n\tint i = 0;\r\n\treturn (i);\r\n}\r\n",
        "int\tmain(void)\n{\n    puts(\"usage: a\\\n    b { c }\");\n    return (0);\n}\n",
        "t_vec\tf(void)\n{\n\tt_vec v = (t_vec){1, 2};\n\tg((t_vec){3, 4});\n\treturn ((t_vec){v.x, 2});\n}\n",
        "typedef struct s_cmd {\n\tchar\t*name;\n\tint\t\t(*fn)(char **);\n}\tt_cmd;\n",
        "t_op\tg_ops[] =\n{\n\t{\n\t\t\"a\",\n\t\t1\n\t},\n\t{\"b\", 2},\n};\n"));

} // namespace normfmt::rule_engine
