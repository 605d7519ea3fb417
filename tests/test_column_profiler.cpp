#include "ColumnProfiler.h"

#include <cmath>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {
CleanedColumn numericColumn(const std::string& name, const std::vector<double>& values) {
    CleanedColumn col;
    col.name = name;
    col.originalName = name;
    col.values = NumericValues(values);
    col.missing.assign(values.size(), 0);
    for (size_t i = 0; i < values.size(); ++i) {
        if (std::isnan(values[i])) col.missing[i] = 1;
    }
    return col;
}

// Empty strings are treated as missing cells.
CleanedColumn textColumn(const std::string& name, const std::vector<std::string>& values) {
    CleanedColumn col;
    col.name = name;
    col.originalName = name;
    col.values = TextValues(values);
    col.missing.assign(values.size(), 0);
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i].empty()) col.missing[i] = 1;
    }
    return col;
}

void expectCountsConsistent(const ColumnProfile& p) {
    EXPECT_EQ(p.nullCount + p.nonNullCount, p.totalRows);
    EXPECT_LE(p.uniqueCount, p.nonNullCount);
}
} // namespace

TEST(ColumnProfilerTest, NumericColumnSummary) {
    std::vector<double> values;
    for (int i = 1; i <= 30; ++i) values.push_back(static_cast<double>(i));
    values[5] = std::nan("");

    const ColumnProfile p = ColumnProfiler::build(numericColumn("qty", values));
    expectCountsConsistent(p);
    EXPECT_EQ(p.type, ColumnType::NUMERIC);
    EXPECT_EQ(p.totalRows, 30u);
    EXPECT_EQ(p.nullCount, 1u);
    EXPECT_DOUBLE_EQ(p.nullPercentage, 100.0 / 30.0);
    EXPECT_EQ(p.uniqueCount, 29u);
    ASSERT_TRUE(p.numeric.has_value());
    EXPECT_DOUBLE_EQ(p.numeric->min, 1.0);
    EXPECT_DOUBLE_EQ(p.numeric->max, 30.0);
    EXPECT_FALSE(p.text.has_value());
    EXPECT_FALSE(p.datetime.has_value());
    EXPECT_TRUE(p.isIdLike);
    EXPECT_TRUE(p.warnings.empty());
}

TEST(ColumnProfilerTest, TopValuesKeepFirstAppearanceOnTies) {
    const ColumnProfile p = ColumnProfiler::build(textColumn("code", {"b", "a", "b", "a", "c"}));
    ASSERT_EQ(p.topValues.size(), 3u);
    EXPECT_EQ(p.topValues[0].value, "b");
    EXPECT_EQ(p.topValues[1].value, "a");
    EXPECT_EQ(p.topValues[2].value, "c");
    EXPECT_EQ(p.topValues[0].count, 2u);
    EXPECT_DOUBLE_EQ(p.topValues[0].percentage, 40.0);
    EXPECT_DOUBLE_EQ(p.topValues[2].percentage, 20.0);
    EXPECT_EQ(p.type, ColumnType::CATEGORICAL);
    EXPECT_FALSE(p.numeric.has_value());
    EXPECT_FALSE(p.text.has_value());
}

TEST(ColumnProfilerTest, SampleAndTopValuesAreCapped) {
    std::vector<std::string> values;
    for (int i = 0; i < 50; ++i) values.push_back("word" + std::to_string(i));
    const ColumnProfile p = ColumnProfiler::build(textColumn("w", values));
    ASSERT_EQ(p.sampleValues.size(), 10u);
    EXPECT_EQ(p.sampleValues.front(), "word0");
    EXPECT_EQ(p.sampleValues.back(), "word9");
    EXPECT_EQ(p.topValues.size(), 10u);
}

TEST(ColumnProfilerTest, TextLengthSummary) {
    std::vector<std::string> values;
    for (int i = 0; i < 30; ++i) values.push_back(std::string(static_cast<size_t>(i % 3 + 1), 'x') + std::to_string(i));
    const ColumnProfile p = ColumnProfiler::build(textColumn("note", values));
    ASSERT_EQ(p.type, ColumnType::TEXT);
    ASSERT_TRUE(p.text.has_value());
    EXPECT_EQ(p.text->minLength, 2u);
    EXPECT_EQ(p.text->maxLength, 5u);
    EXPECT_GT(p.text->avgLength, 2.0);
    EXPECT_LT(p.text->avgLength, 5.0);
}

TEST(ColumnProfilerTest, DatetimeSummaryUsesIsoBounds) {
    CleanedColumn col;
    col.name = "created";
    col.originalName = "Created";
    col.values = DatetimeValues{86400 * 2, 0, 86400};
    col.missing = {0, 0, 0};

    const ColumnProfile p = ColumnProfiler::build(col);
    EXPECT_EQ(p.type, ColumnType::DATETIME);
    ASSERT_TRUE(p.datetime.has_value());
    EXPECT_EQ(p.datetime->min, "1970-01-01T00:00:00");
    EXPECT_EQ(p.datetime->max, "1970-01-03T00:00:00");
    EXPECT_EQ(p.originalName, "Created");
}

TEST(ColumnProfilerTest, BooleanColumnHasNoSummary) {
    const ColumnProfile p = ColumnProfiler::build(textColumn("active", {"yes", "no", "yes", ""}));
    expectCountsConsistent(p);
    EXPECT_EQ(p.type, ColumnType::BOOLEAN);
    EXPECT_EQ(p.uniqueCount, 2u);
    EXPECT_FALSE(p.numeric.has_value());
    EXPECT_FALSE(p.text.has_value());
}

TEST(ColumnProfilerTest, AllMissingColumn) {
    const ColumnProfile p = ColumnProfiler::build(textColumn("empty", {"", "", ""}));
    expectCountsConsistent(p);
    EXPECT_EQ(p.nullCount, 3u);
    EXPECT_DOUBLE_EQ(p.nullPercentage, 100.0);
    EXPECT_EQ(p.uniqueCount, 0u);
    EXPECT_TRUE(p.topValues.empty());
    EXPECT_FALSE(p.isIdLike);
}

TEST(ColumnProfilerTest, NearbyDoublesStayDistinct) {
    // Microsecond timestamps need 16 significant digits to tell apart.
    std::vector<double> values;
    for (int i = 0; i < 1000; ++i) values.push_back(1700000000.0 + static_cast<double>(i) / 1e6);

    const ColumnProfile p = ColumnProfiler::build(numericColumn("event_ts", values));
    EXPECT_EQ(p.type, ColumnType::NUMERIC);
    EXPECT_EQ(p.uniqueCount, 1000u);
    EXPECT_EQ(p.cardinality, 1000u);
    ASSERT_FALSE(p.topValues.empty());
    EXPECT_EQ(p.topValues.front().count, 1u);
    ASSERT_EQ(p.sampleValues.size(), 10u);
    for (size_t i = 0; i < p.sampleValues.size(); ++i) {
        EXPECT_EQ(std::stod(p.sampleValues[i]), values[i]);
    }
}

TEST(ColumnProfilerTest, EmailPhoneAndUrlPatterns) {
    const ColumnProfile email = ColumnProfiler::build(textColumn("contact", {"a@x.com", "b@y.org", "nope"}));
    EXPECT_TRUE(email.isEmailLike);
    EXPECT_FALSE(email.isUrlLike);

    const ColumnProfile phone =
        ColumnProfiler::build(textColumn("phone", {"555-123-4567", "(555) 123-4567", "+1 555 123 4567"}));
    EXPECT_TRUE(phone.isPhoneLike);
    EXPECT_FALSE(phone.isEmailLike);

    const ColumnProfile url = ColumnProfiler::build(textColumn("site", {"https://a.com", "http://b.org/x", "ftp://c"}));
    EXPECT_TRUE(url.isUrlLike);
    EXPECT_TRUE(url.warnings.empty());
}

TEST(ColumnProfilerTest, PatternsNeedMoreThanHalf) {
    const ColumnProfile p = ColumnProfiler::build(textColumn("contact", {"a@x.com", "plain", "b@y.org", "text"}));
    EXPECT_FALSE(p.isEmailLike);
}

TEST(ColumnProfilerTest, PatternsIgnoreMissingCells) {
    const ColumnProfile p = ColumnProfiler::build(textColumn("contact", {"a@x.com", "", "", "b@y.org", ""}));
    EXPECT_TRUE(p.isEmailLike);
}

TEST(ColumnProfilerTest, UuidsAreIdLike) {
    const ColumnProfile p = ColumnProfiler::build(textColumn("ref", {"123e4567-e89b-12d3-a456-426614174000",
                                                                    "6F9619FF-8B86-D011-B42D-00C04FC964FF",
                                                                    "not-a-uuid"}));
    EXPECT_TRUE(p.isIdLike);
}

TEST(ColumnProfilerTest, PatternSampleIsBounded) {
    ProfilingThresholds thresholds;
    thresholds.patternSampleSize = 2;
    const ColumnProfile p = ColumnProfiler::build(textColumn("contact", {"a@b.io", "c@d.io", "x", "y", "z"}), thresholds);
    EXPECT_TRUE(p.isEmailLike);
}

TEST(ColumnProfilerTest, SequentialNumericNeedsMoreThanTenValues) {
    std::vector<std::string> ten;
    for (int i = 1; i <= 10; ++i) ten.push_back(std::to_string(i));
    EXPECT_FALSE(ColumnProfiler::isSequentialNumeric(ten));

    ten.push_back("11");
    EXPECT_TRUE(ColumnProfiler::isSequentialNumeric(ten));

    std::vector<std::string> odd;
    for (int i = 1; i <= 40; i += 2) odd.push_back(std::to_string(i));
    EXPECT_FALSE(ColumnProfiler::isSequentialNumeric(odd));
}
