#pragma once

#include "DateTimeParsing.h"
#include "Diagnostics.h"
#include "ProfilerConfig.h"
#include "Table.h"

#include <string>
#include <vector>

struct ColumnCleaningStats {
    std::string column;          // canonical name
    size_t nonFiniteNulled = 0;
    size_t outliersNulled = 0;
    bool outlierSuppressionSkipped = false;
    size_t nullTokensMapped = 0;
    size_t valuesTruncated = 0;
    bool convertedToDatetime = false;
    size_t datetimeParseFailures = 0;
};

struct CleaningReport {
    size_t originalRowCount = 0;
    size_t originalColumnCount = 0;
    size_t droppedEmptyRows = 0;
    std::vector<std::string> droppedEmptyColumns; // original labels
    size_t droppedSparseRows = 0;
    size_t finalRowCount = 0;
    size_t finalColumnCount = 0;
    bool fallbackApplied = false;
    std::vector<ColumnCleaningStats> columns;

    size_t totalOutliersNulled() const noexcept;
    size_t totalNonFiniteNulled() const noexcept;
    size_t totalValuesTruncated() const noexcept;
};

// Cleaned table plus the non-fatal findings gathered while producing it.
struct CleaningResult {
    CleanedTable table;
    CleaningReport report;
    Diagnostics diagnostics;
};

class DataCleaner {
public:
    /**
     * @brief Prunes, renames and coerces a raw table. The input is never modified.
     * @details Steps, in order: drop all-null rows then all-null columns; sanitize names;
     * null non-finite values and suppress z-score outliers in numeric columns; trim, null-map
     * and truncate text; convert date-like text columns; drop sparse rows; validate.
     * Any failure inside steps 1-6 returns CleanedTable::fromRaw(raw) with fallbackApplied set.
     * @post Row and column counts never grow and surviving order is preserved.
     * @throws Tabsight::DatasetException when zero rows or zero columns remain.
     */
    static CleaningResult clean(const RawTable& raw,
                                const ProfilingThresholds& thresholds = ProfilingThresholds(),
                                DateTimeParsing::DateLocaleHint hint = DateTimeParsing::DateLocaleHint::AUTO);
};
