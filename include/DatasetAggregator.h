#pragma once

#include "Profile.h"
#include "ProfilerConfig.h"
#include "Table.h"

#include <string>
#include <vector>

namespace DatasetAggregator {
/**
 * @brief Read-only fan-in of per-column profiles into the dataset-level profile.
 * @details Fills type partitions, cardinality buckets, overall null percentage,
 * the numeric correlation matrix and the id/target candidate lists. Metadata such as
 * timestamps and cleaning summaries is left to the caller.
 * @pre profiles[i] describes cleaned.columns()[i].
 */
DatasetProfile aggregate(const std::string& datasetId,
                         std::vector<ColumnProfile> profiles,
                         const CleanedTable& cleaned,
                         const ProfilingThresholds& thresholds = ProfilingThresholds());

/**
 * @brief Pairwise Pearson matrix over the named columns (diagonal included).
 * @details Pairs without a finite coefficient are left out; columns with no pairs at all are omitted.
 * Returns an empty matrix when fewer than two columns are given.
 */
CorrelationMatrix correlations(const CleanedTable& cleaned, const std::vector<std::string>& numericColumns);

bool isTargetName(const std::string& originalName);
bool isIdName(const std::string& originalName);
} // namespace DatasetAggregator
