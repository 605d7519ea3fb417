#pragma once

#include "DateTimeParsing.h"
#include "Profile.h"
#include "ProfilerConfig.h"
#include "Table.h"

#include <string>
#include <vector>

namespace ColumnProfiler {
/**
 * @brief Builds the profile of one cleaned column.
 * @details Reads only its own column, so independent columns may be profiled concurrently.
 * A failing step (summary or pattern check) leaves its defaults in place and appends a
 * message to ColumnProfile::warnings; it never throws for bad cell content.
 * @post nullCount + nonNullCount == totalRows and uniqueCount <= nonNullCount.
 */
ColumnProfile build(const CleanedColumn& column,
                    const ProfilingThresholds& thresholds = ProfilingThresholds(),
                    DateTimeParsing::DateLocaleHint hint = DateTimeParsing::DateLocaleHint::AUTO);

bool isSequentialNumeric(const std::vector<std::string>& sample);
} // namespace ColumnProfiler
