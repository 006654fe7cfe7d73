#include "sandpool/utils/string_utils.hpp"

#include <gtest/gtest.h>

using sandpool::utils::StringUtils;

TEST(StringUtilsTest, TrimAndLower) {
    EXPECT_EQ("abc", StringUtils::Trim("  abc \t\n"));
    EXPECT_EQ("", StringUtils::Trim("   "));
    EXPECT_EQ("mixed case", StringUtils::ToLower("MiXeD Case"));
}

TEST(StringUtilsTest, SplitTrimsAndSkipsEmpty) {
    auto parts = StringUtils::Split(" base , browser,, gui ", ',');
    ASSERT_EQ(3u, parts.size());
    EXPECT_EQ("base", parts[0]);
    EXPECT_EQ("browser", parts[1]);
    EXPECT_EQ("gui", parts[2]);

    EXPECT_TRUE(StringUtils::Split("", ',').empty());
}

TEST(StringUtilsTest, ParseBool) {
    EXPECT_EQ(true, StringUtils::ParseBool("TRUE"));
    EXPECT_EQ(true, StringUtils::ParseBool(" yes "));
    EXPECT_EQ(false, StringUtils::ParseBool("0"));
    EXPECT_EQ(false, StringUtils::ParseBool("off"));
    EXPECT_FALSE(StringUtils::ParseBool("maybe").has_value());
}

TEST(StringUtilsTest, ParseIntRejectsTrailingGarbage) {
    EXPECT_EQ(42, StringUtils::ParseInt(" 42 "));
    EXPECT_EQ(-7, StringUtils::ParseInt("-7"));
    EXPECT_FALSE(StringUtils::ParseInt("12abc").has_value());
    EXPECT_FALSE(StringUtils::ParseInt("").has_value());
    EXPECT_FALSE(StringUtils::ParseInt("99999999999999999999999").has_value());
}

TEST(StringUtilsTest, ParseKeyValueListSplitsOnLastSeparator) {
    auto sizes = StringUtils::ParseKeyValueList("base:2, browser:1", ':');
    EXPECT_EQ("2", sizes["base"]);
    EXPECT_EQ("1", sizes["browser"]);

    auto mounts = StringUtils::ParseKeyValueList("/data/models:/models,/etc/ssl:/ssl", ':');
    EXPECT_EQ("/models", mounts["/data/models"]);
    EXPECT_EQ("/ssl", mounts["/etc/ssl"]);

    auto broken = StringUtils::ParseKeyValueList("novalue:,:nokey,plain", ':');
    EXPECT_TRUE(broken.empty());
}

TEST(StringUtilsTest, Unquote) {
    EXPECT_EQ("value", StringUtils::Unquote("\"value\""));
    EXPECT_EQ("value", StringUtils::Unquote("'value'"));
    EXPECT_EQ("\"value'", StringUtils::Unquote("\"value'"));
}

TEST(StringUtilsTest, JoinAndAffixes) {
    EXPECT_EQ("a,b,c", StringUtils::Join({"a", "b", "c"}, ","));
    EXPECT_EQ("", StringUtils::Join({}, ","));
    EXPECT_TRUE(StringUtils::StartsWith("sandpool:container:x", "sandpool:"));
    EXPECT_FALSE(StringUtils::StartsWith("sand", "sandpool"));
    EXPECT_TRUE(StringUtils::EndsWith("bucket/", "/"));
}
