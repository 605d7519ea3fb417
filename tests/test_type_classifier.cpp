#include "TypeClassifier.h"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {
std::vector<std::string> repeatCycle(const std::vector<std::string>& cycle, size_t total) {
    std::vector<std::string> out;
    out.reserve(total);
    for (size_t i = 0; i < total; ++i) out.push_back(cycle[i % cycle.size()]);
    return out;
}
} // namespace

TEST(TypeClassifierTest, EmptyColumnIsText) {
    EXPECT_EQ(TypeClassifier::classify({}), ColumnType::TEXT);
}

TEST(TypeClassifierTest, ZeroOneIsBoolean) {
    EXPECT_EQ(TypeClassifier::classify({"1", "0", "1", "0"}), ColumnType::BOOLEAN);
    EXPECT_EQ(TypeClassifier::classify({"1.0", "0", "1"}), ColumnType::BOOLEAN);
}

TEST(TypeClassifierTest, BooleanVocabulariesIgnoreCase) {
    EXPECT_EQ(TypeClassifier::classify({"True", "FALSE", "true"}), ColumnType::BOOLEAN);
    EXPECT_EQ(TypeClassifier::classify({"yes", "No"}), ColumnType::BOOLEAN);
    EXPECT_EQ(TypeClassifier::classify({"on", "off", "on"}), ColumnType::BOOLEAN);
    // Mixed vocabularies are not boolean.
    EXPECT_NE(TypeClassifier::classify({"yes", "false"}), ColumnType::BOOLEAN);
}

TEST(TypeClassifierTest, IsoDatesAreDatetime) {
    std::vector<std::string> dates;
    for (int d = 1; d <= 28; ++d) {
        dates.push_back("2024-02-" + std::string(d < 10 ? "0" : "") + std::to_string(d));
    }
    EXPECT_EQ(TypeClassifier::classify(dates), ColumnType::DATETIME);
}

TEST(TypeClassifierTest, DatetimeNeedsSeventyPercentOfSample) {
    std::vector<std::string> values;
    for (int i = 0; i < 7; ++i) values.push_back("2024-03-1" + std::to_string(i));
    for (int i = 0; i < 3; ++i) values.push_back("note " + std::to_string(i));
    EXPECT_EQ(TypeClassifier::classify(values), ColumnType::DATETIME);

    values[6] = "note 6";
    EXPECT_NE(TypeClassifier::classify(values), ColumnType::DATETIME);
}

TEST(TypeClassifierTest, NumberOnlyTokensAreNotDates) {
    std::vector<std::string> values;
    for (int i = 0; i < 50; ++i) values.push_back(std::to_string(20240101 + i));
    EXPECT_EQ(TypeClassifier::classify(values), ColumnType::NUMERIC);
}

TEST(TypeClassifierTest, ContinuousNumbersAreNumeric) {
    std::vector<std::string> values;
    for (int i = 0; i < 200; ++i) values.push_back(std::to_string(i * 1.5));
    EXPECT_EQ(TypeClassifier::classify(values), ColumnType::NUMERIC);
}

TEST(TypeClassifierTest, LowCardinalityNumericCodesAreCategorical) {
    EXPECT_EQ(TypeClassifier::classify(repeatCycle({"1", "2", "3", "4", "5"}, 100)), ColumnType::CATEGORICAL);
    EXPECT_EQ(TypeClassifier::classify({"1", "2", "3", "4", "5"}), ColumnType::CATEGORICAL);
}

TEST(TypeClassifierTest, ThreeValuedRatingIsCategorical) {
    EXPECT_EQ(TypeClassifier::classify(repeatCycle({"1", "2", "3"}, 30)), ColumnType::CATEGORICAL);
}

TEST(TypeClassifierTest, TwentyDistinctNumbersStayNumeric) {
    std::vector<std::string> values;
    for (int i = 0; i < 20; ++i) values.push_back(std::to_string(i * 3));
    EXPECT_EQ(TypeClassifier::classify(values), ColumnType::NUMERIC);
    values.pop_back();
    EXPECT_EQ(TypeClassifier::classify(values), ColumnType::CATEGORICAL);
}

TEST(TypeClassifierTest, ThreeLabelsOverManyRowsAreCategorical) {
    EXPECT_EQ(TypeClassifier::classify(repeatCycle({"red", "green", "blue"}, 1000)), ColumnType::CATEGORICAL);
}

TEST(TypeClassifierTest, FewDistinctStringsAreCategorical) {
    EXPECT_EQ(TypeClassifier::classify({"north", "south", "east"}), ColumnType::CATEGORICAL);
}

TEST(TypeClassifierTest, FreeTextIsText) {
    std::vector<std::string> values;
    for (int i = 0; i < 100; ++i) values.push_back("customer comment number " + std::to_string(i));
    EXPECT_EQ(TypeClassifier::classify(values), ColumnType::TEXT);
}

TEST(TypeClassifierTest, ClassificationIsDeterministic) {
    const auto values = repeatCycle({"a", "b", "2024-01-01", "7"}, 400);
    const ColumnType first = TypeClassifier::classify(values);
    for (int i = 0; i < 5; ++i) EXPECT_EQ(TypeClassifier::classify(values), first);
}

TEST(TypeClassifierTest, CanonicalTokenFoldsNumbersAndCase) {
    EXPECT_EQ(TypeClassifier::canonicalToken("1.0"), "1");
    EXPECT_EQ(TypeClassifier::canonicalToken(" 1 "), "1");
    EXPECT_EQ(TypeClassifier::canonicalToken("  Yes "), "yes");
    EXPECT_EQ(TypeClassifier::canonicalToken("2.50"), "2.5");
}

TEST(TypeClassifierTest, BooleanVocabularySubsets) {
    EXPECT_TRUE(TypeClassifier::isBooleanVocabulary({"t", "f"}));
    EXPECT_TRUE(TypeClassifier::isBooleanVocabulary({"y"}));
    EXPECT_FALSE(TypeClassifier::isBooleanVocabulary({"y", "f"}));
    EXPECT_FALSE(TypeClassifier::isBooleanVocabulary({}));
}
