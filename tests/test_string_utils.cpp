#include "normfmt/string_utils.hpp"
#include <gtest/gtest.h>

namespace normfmt {

TEST(StringUtilsTest, ExtractIndentation)
{
    EXPECT_EQ(StringUtils::extract_indentation("\t\tx = 1;"), "\t\t");
    EXPECT_EQ(StringUtils::extract_indentation(" \tx"), " \t");
    EXPECT_EQ(StringUtils::extract_indentation("x"), "");
    // A whitespace-only line is all indentation
    EXPECT_EQ(StringUtils::extract_indentation("  \t"), "  \t");
}

TEST(StringUtilsTest, TrimAndBlank)
{
    EXPECT_EQ(StringUtils::trim("  a b\t\r\n"), "a b");
    EXPECT_EQ(StringUtils::trim(" \t "), "");
    EXPECT_TRUE(StringUtils::is_blank(""));
    EXPECT_TRUE(StringUtils::is_blank(" \t\r"));
    EXPECT_FALSE(StringUtils::is_blank("  ;"));
}

TEST(StringUtilsTest, SplitKeepsEmptyFields)
{
    auto parts = StringUtils::split("/usr/bin::/bin:", ':');

    ASSERT_EQ(parts.size(), 4);
    EXPECT_EQ(parts[0], "/usr/bin");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "/bin");
    EXPECT_EQ(parts[3], "");
    EXPECT_EQ(StringUtils::split("", ':').size(), 1);
}

TEST(StringUtilsTest, Identifiers)
{
    EXPECT_TRUE(StringUtils::is_identifier("g_count"));
    EXPECT_TRUE(StringUtils::is_identifier("_x1"));
    EXPECT_FALSE(StringUtils::is_identifier("1x"));
    EXPECT_FALSE(StringUtils::is_identifier("a-b"));
    EXPECT_FALSE(StringUtils::is_identifier(""));
}

} // namespace normfmt
