#include "Sanitizer.h"

#include <gtest/gtest.h>
#include <set>

TEST(SanitizerTest, LowercasesAndReplacesPunctuation) {
    EXPECT_EQ(Sanitizer::sanitizeName("Order ID"), "order_id");
    EXPECT_EQ(Sanitizer::sanitizeName("  Total-Amount ($) "), "total_amount____");
    EXPECT_EQ(Sanitizer::sanitizeName("already_clean_1"), "already_clean_1");
}

TEST(SanitizerTest, LeadingDigitGetsPrefix) {
    EXPECT_EQ(Sanitizer::sanitizeName("2024 sales"), "col_2024_sales");
    EXPECT_EQ(Sanitizer::sanitizeName("9"), "col_9");
}

TEST(SanitizerTest, BlankLabelBecomesUnnamed) {
    EXPECT_EQ(Sanitizer::sanitizeName(""), "unnamed_column");
    EXPECT_EQ(Sanitizer::sanitizeName("   "), "unnamed_column");
}

TEST(SanitizerTest, NonAsciiBytesBecomeUnderscores) {
    EXPECT_EQ(Sanitizer::sanitizeName("caf\xc3\xa9"), "caf__");
}

TEST(SanitizerTest, SanitizingIsIdempotent) {
    for (const char* label : {"Order ID", "2024 sales", "", "a.b.c", "MiXeD_Case", "col_1", "%%%"}) {
        const std::string once = Sanitizer::sanitizeName(label);
        EXPECT_EQ(Sanitizer::sanitizeName(once), once) << "label: " << label;
    }
}

TEST(SanitizerTest, CollisionsGetNumericSuffixes) {
    const auto names = Sanitizer::sanitizeNames({"Name", "name", "NAME", "name_1"});
    ASSERT_EQ(names.size(), 4u);
    EXPECT_EQ(names[0], "name");
    EXPECT_EQ(names[1], "name_1");
    EXPECT_EQ(names[2], "name_2");
    // "name_1" is taken by the second label, so the literal one moves on.
    EXPECT_EQ(names[3], "name_1_1");

    const std::set<std::string> unique(names.begin(), names.end());
    EXPECT_EQ(unique.size(), names.size());
}

TEST(SanitizerTest, SanitizeNamesKeepsOrderAndSize) {
    const auto names = Sanitizer::sanitizeNames({"B", "A", "", ""});
    ASSERT_EQ(names.size(), 4u);
    EXPECT_EQ(names[0], "b");
    EXPECT_EQ(names[1], "a");
    EXPECT_EQ(names[2], "unnamed_column");
    EXPECT_EQ(names[3], "unnamed_column_1");
}

TEST(SanitizerTest, NullLikeTokens) {
    for (const char* token : {"", "  ", "null", "NULL", "None", "n/a", "N/A", "na", "nil", "undefined",
                              "empty", "missing", "Unknown", "NaN", " nan "}) {
        EXPECT_TRUE(Sanitizer::isNullLike(token)) << "token: '" << token << "'";
    }
    for (const char* token : {"0", "no", "false", "nullable", "n.a.", "-"}) {
        EXPECT_FALSE(Sanitizer::isNullLike(token)) << "token: '" << token << "'";
    }
}
