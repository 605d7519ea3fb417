#pragma once

#include "Table.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct TopValue {
    std::string value;
    size_t count = 0;
    double percentage = 0.0; // of non-null values
};

struct NumericSummary {
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double median = 0.0;
    double stddev = 0.0;
};

struct TextLengthSummary {
    size_t minLength = 0;
    size_t maxLength = 0;
    double avgLength = 0.0;
};

struct DatetimeSummary {
    std::string min; // ISO-8601
    std::string max;
};

struct ColumnProfile {
    std::string name;
    std::string originalName;
    ColumnType type = ColumnType::TEXT;

    size_t totalRows = 0;
    size_t nullCount = 0;
    size_t nonNullCount = 0;
    double nullPercentage = 0.0;
    size_t uniqueCount = 0;
    size_t cardinality = 0;

    std::vector<std::string> sampleValues;
    std::vector<TopValue> topValues;

    std::optional<NumericSummary> numeric;
    std::optional<TextLengthSummary> text;
    std::optional<DatetimeSummary> datetime;

    bool isIdLike = false;
    bool isEmailLike = false;
    bool isPhoneLike = false;
    bool isUrlLike = false;

    // Steps that fell back to defaults for this column.
    std::vector<std::string> warnings;
};

struct CleaningSummary {
    size_t originalRows = 0;
    size_t originalColumns = 0;
    size_t droppedEmptyRows = 0;
    std::vector<std::string> droppedEmptyColumns;
    size_t droppedSparseRows = 0;
    size_t outliersNulled = 0;
    size_t nonFiniteNulled = 0;
    size_t valuesTruncated = 0;
    std::vector<std::string> datetimeConvertedColumns;
    bool fallbackApplied = false;
};

using CorrelationMatrix = std::map<std::string, std::map<std::string, double>>;

/**
 * @brief Complete result of one profiling run. Built once, never mutated afterwards.
 */
struct DatasetProfile {
    std::string datasetId;
    size_t totalRows = 0;
    size_t totalColumns = 0;
    std::vector<ColumnProfile> columns;

    std::vector<std::string> numericColumns;
    std::vector<std::string> categoricalColumns;
    std::vector<std::string> datetimeColumns;
    std::vector<std::string> textColumns;
    std::vector<std::string> booleanColumns;

    bool hasDatetime = false;
    bool hasNumeric = false;
    bool hasCategorical = false;

    std::vector<std::string> potentialIdColumns;
    std::vector<std::string> potentialTargetColumns;

    double overallNullPercentage = 0.0;
    std::vector<std::string> highCardinalityColumns;
    std::vector<std::string> lowCardinalityColumns;

    CorrelationMatrix correlationMatrix;

    std::vector<std::string> qualityWarnings;
    CleaningSummary cleaning;

    std::string profiledAt; // ISO-8601 UTC
    size_t sampleSize = 0;

    const ColumnProfile* findColumn(const std::string& name) const {
        for (const auto& col : columns) {
            if (col.name == name) return &col;
        }
        return nullptr;
    }
};
