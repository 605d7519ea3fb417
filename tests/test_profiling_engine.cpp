#include "ProfilingEngine.h"
#include "TabsightExceptions.h"

#include "test_util.h"

#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {
bool contains(const std::vector<std::string>& list, const std::string& name) {
    return std::find(list.begin(), list.end(), name) != list.end();
}

// hugeAmountAt > 0 replaces that order's amount with 1e308.
RawTable orderTable(int hugeAmountAt = 0) {
    const std::vector<std::string> statuses = {"new", "paid", "shipped", "cancelled"};
    std::vector<std::vector<std::string>> rows;
    for (int i = 1; i <= 100; ++i) {
        rows.push_back({std::to_string(i),
                        i == hugeAmountAt ? "1e308" : std::to_string(10 + (i * 37) % 500) + ".5",
                        statuses[static_cast<size_t>(i) % statuses.size()]});
    }
    return test_util::textTable({"Order ID", "Amount", "Status"}, rows);
}
} // namespace

TEST(ProfilingEngineTest, ProfilesOrderTable) {
    const ProfilingEngine engine;
    const DatasetProfile p = engine.profile(orderTable(), "orders");

    EXPECT_EQ(p.datasetId, "orders");
    EXPECT_EQ(p.totalRows, 100u);
    EXPECT_EQ(p.totalColumns, 3u);
    EXPECT_EQ(p.sampleSize, 100u);
    EXPECT_EQ(p.numericColumns, (std::vector<std::string>{"order_id", "amount"}));
    EXPECT_EQ(p.categoricalColumns, (std::vector<std::string>{"status"}));
    EXPECT_TRUE(contains(p.potentialIdColumns, "order_id"));
    EXPECT_FALSE(contains(p.potentialIdColumns, "amount"));
    EXPECT_EQ(p.cleaning.outliersNulled, 0u);
    EXPECT_FALSE(p.cleaning.fallbackApplied);
    EXPECT_EQ(p.correlationMatrix.size(), 2u);

    const ColumnProfile* orderId = p.findColumn("order_id");
    ASSERT_NE(orderId, nullptr);
    EXPECT_EQ(orderId->originalName, "Order ID");
    EXPECT_TRUE(orderId->isIdLike);
    ASSERT_TRUE(orderId->numeric.has_value());
    EXPECT_DOUBLE_EQ(orderId->numeric->min, 1.0);
    EXPECT_DOUBLE_EQ(orderId->numeric->max, 100.0);

    const ColumnProfile* status = p.findColumn("status");
    ASSERT_NE(status, nullptr);
    EXPECT_EQ(status->type, ColumnType::CATEGORICAL);
    EXPECT_EQ(status->uniqueCount, 4u);
    EXPECT_FALSE(status->numeric.has_value());
    ASSERT_FALSE(status->topValues.empty());
    EXPECT_EQ(status->topValues.front().count, 25u);

    ASSERT_FALSE(p.profiledAt.empty());
    EXPECT_EQ(p.profiledAt.back(), 'Z');
}

TEST(ProfilingEngineTest, OrderTableWithExtremeAmount) {
    const DatasetProfile p = ProfilingEngine().profile(orderTable(50), "orders");

    EXPECT_EQ(p.totalRows, 100u);
    EXPECT_EQ(p.cleaning.outliersNulled, 1u);
    EXPECT_EQ(p.numericColumns, (std::vector<std::string>{"order_id", "amount"}));
    EXPECT_EQ(p.categoricalColumns, (std::vector<std::string>{"status"}));
    EXPECT_TRUE(contains(p.potentialIdColumns, "order_id"));

    const ColumnProfile* amount = p.findColumn("amount");
    ASSERT_NE(amount, nullptr);
    EXPECT_EQ(amount->nullCount, 1u);
    EXPECT_EQ(amount->uniqueCount, 99u);
    ASSERT_TRUE(amount->numeric.has_value());
    EXPECT_LT(amount->numeric->max, 1000.0);
    EXPECT_TRUE(std::isfinite(amount->numeric->stddev));
}

TEST(ProfilingEngineTest, ExtremeValueIsNulledAsOutlier) {
    std::vector<std::vector<std::string>> rows;
    for (int i = 1; i <= 29; ++i) rows.push_back({std::to_string(i), std::to_string(i)});
    rows.push_back({"30", "1e308"});
    const RawTable raw = test_util::textTable({"row", "amount"}, rows);

    const DatasetProfile p = ProfilingEngine().profile(raw, "extreme");
    EXPECT_EQ(p.totalRows, 30u);
    EXPECT_EQ(p.cleaning.outliersNulled, 1u);

    const ColumnProfile* amount = p.findColumn("amount");
    ASSERT_NE(amount, nullptr);
    EXPECT_EQ(amount->type, ColumnType::NUMERIC);
    EXPECT_EQ(amount->nullCount, 1u);
    ASSERT_TRUE(amount->numeric.has_value());
    EXPECT_DOUBLE_EQ(amount->numeric->max, 29.0);
}

TEST(ProfilingEngineTest, SequentialColumnIsIdCandidate) {
    std::vector<std::vector<std::string>> rows;
    for (int i = 1; i <= 1000; ++i) rows.push_back({std::to_string(i)});
    const RawTable raw = test_util::textTable({"record_no"}, rows);

    const DatasetProfile p = ProfilingEngine().profile(raw, "seq");
    const ColumnProfile* col = p.findColumn("record_no");
    ASSERT_NE(col, nullptr);
    EXPECT_TRUE(col->isIdLike);
    EXPECT_EQ(p.potentialIdColumns, (std::vector<std::string>{"record_no"}));
    EXPECT_TRUE(contains(p.highCardinalityColumns, "record_no"));
}

TEST(ProfilingEngineTest, AllNullTableIsFatal) {
    const RawTable raw = test_util::textTable({"a", "b"}, {{"", "NA"}, {"null", ""}});
    try {
        ProfilingEngine().profile(raw, "empty");
        FAIL() << "expected ProfilingException";
    } catch (const Tabsight::ProfilingException& ex) {
        EXPECT_EQ(ex.datasetId(), "empty");
        EXPECT_NE(std::string(ex.what()).find("Profiling Error [empty]"), std::string::npos);
    }
}

TEST(ProfilingEngineTest, ProfileFileHonoursMaxRows) {
    std::string csv = "id;label\n";
    for (int i = 1; i <= 20; ++i) csv += std::to_string(i) + ";" + (i % 2 ? "odd" : "even") + "\n";
    test_util::TempCsvFile file(csv);

    ProfilerConfig config;
    config.maxRows = 5;
    const DatasetProfile p = ProfilingEngine(config).profileFile(file.path(), "limited");
    EXPECT_EQ(p.totalRows, 5u);
    EXPECT_EQ(p.sampleSize, 5u);
    EXPECT_EQ(p.cleaning.originalRows, 5u);
    EXPECT_EQ(p.totalColumns, 2u);
}

TEST(ProfilingEngineTest, IngestWarningsLeadQualityWarnings) {
    test_util::TempCsvFile file("value\n1\n2\n3\n");
    const DatasetProfile p = ProfilingEngine().profileFile(file.path(), "single");
    ASSERT_FALSE(p.qualityWarnings.empty());
    EXPECT_NE(p.qualityWarnings.front().find("CSV"), std::string::npos);
}

TEST(ProfilingEngineTest, HeaderlessFileIsProfilingError) {
    test_util::TempCsvFile file("");
    EXPECT_THROW(ProfilingEngine().profileFile(file.path(), "blank"), Tabsight::ProfilingException);
}

TEST(ProfilingEngineTest, MissingFileIsIoError) {
    EXPECT_THROW(ProfilingEngine().profileFile("/nonexistent/tabsight/orders.csv", "orders"), Tabsight::IOException);
}

TEST(ProfilingEngineTest, InvalidThresholdsRejectedAtConstruction) {
    ProfilerConfig config;
    config.thresholds.maxOutlierFraction = 2.0;
    EXPECT_THROW(ProfilingEngine{config}, Tabsight::ConfigurationException);
}
