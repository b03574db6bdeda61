#include "sandrun/utils/string_utils.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

using sandrun::utils::StringUtils;

/*
 * Trim / Split / Join
 */

// NOLINTNEXTLINE
TEST(StringUtils, Trim) {
    EXPECT_EQ(StringUtils::Trim("  numpy \t\n"), "numpy");
    EXPECT_EQ(StringUtils::Trim("   "), "");
    EXPECT_EQ(StringUtils::Trim(""), "");
    EXPECT_EQ(StringUtils::Trim("a b"), "a b");
}

// NOLINTNEXTLINE
TEST(StringUtils, ToLower) {
    EXPECT_EQ(StringUtils::ToLower("EOF"), "eof");
    EXPECT_EQ(StringUtils::ToLower("MiXeD-123"), "mixed-123");
}

// NOLINTNEXTLINE
TEST(StringUtils, SplitSkipsEmptyTokens) {
    EXPECT_THAT(StringUtils::Split("a,,b,", ','), ElementsAre("a", "b"));
    EXPECT_THAT(StringUtils::Split("", ','), IsEmpty());
}

// NOLINTNEXTLINE
TEST(StringUtils, Join) {
    EXPECT_EQ(StringUtils::Join({"numpy", "pandas"}, ", "), "numpy, pandas");
    EXPECT_EQ(StringUtils::Join({"one"}, ", "), "one");
    EXPECT_EQ(StringUtils::Join({}, ", "), "");
}

/*
 * Package lists
 */

// NOLINTNEXTLINE
TEST(StringUtils, ParsePackageList) {
    EXPECT_THAT(StringUtils::ParsePackageList("numpy, pandas,,numpy , requests==2.31"),
                ElementsAre("numpy", "pandas", "requests==2.31"));
}

// NOLINTNEXTLINE
TEST(StringUtils, ParsePackageListEmpty) {
    EXPECT_THAT(StringUtils::ParsePackageList(""), IsEmpty());
    EXPECT_THAT(StringUtils::ParsePackageList(" , ,"), IsEmpty());
}

// NOLINTNEXTLINE
TEST(StringUtils, NormalizePackagesKeepsFirstOccurrenceOrder) {
    EXPECT_THAT(StringUtils::NormalizePackages({"scipy", " numpy", "scipy", "", "numpy "}),
                ElementsAre("scipy", "numpy"));
}

/*
 * Shell quoting
 */

// NOLINTNEXTLINE
TEST(StringUtils, ShellQuotePlain) {
    EXPECT_EQ(StringUtils::ShellQuote("numpy"), "'numpy'");
    EXPECT_EQ(StringUtils::ShellQuote(""), "''");
}

// NOLINTNEXTLINE
TEST(StringUtils, ShellQuoteNeutralizesMetacharacters) {
    EXPECT_EQ(StringUtils::ShellQuote("pkg; rm -rf /"), "'pkg; rm -rf /'");
    EXPECT_EQ(StringUtils::ShellQuote("numpy>=1.26"), "'numpy>=1.26'");
    EXPECT_EQ(StringUtils::ShellQuote("it's"), "'it'\"'\"'s'");
}

// NOLINTNEXTLINE
TEST(StringUtils, Truncate) {
    EXPECT_EQ(StringUtils::Truncate("short", 10), "short");
    EXPECT_EQ(StringUtils::Truncate("0123456789", 8), "01234...");
    EXPECT_EQ(StringUtils::Truncate("0123456789", 2), "01");
    EXPECT_EQ(StringUtils::Truncate("0123456789", 6, "~"), "01234~");
}

}  // namespace
