#pragma once

#include "Diagnostics.h"
#include "Profile.h"
#include "ProfilerConfig.h"
#include "Table.h"

#include <string>

/**
 * @brief Runs raw table -> DataCleaner -> ColumnProfiler (per column) -> DatasetAggregator.
 * @details Stateless between calls; one engine may serve concurrent callers.
 * Column profiling fans out over OpenMP threads when built with USE_OPENMP.
 */
class ProfilingEngine {
public:
    explicit ProfilingEngine(ProfilerConfig config = ProfilerConfig());

    /**
     * @throws Tabsight::ProfilingException when no rows or no columns survive cleaning.
     */
    DatasetProfile profile(const RawTable& raw, const std::string& datasetId) const;

    /**
     * @brief Reads up to config().maxRows data rows of a delimited file and profiles them.
     * @throws Tabsight::IOException when the file cannot be read.
     * @throws Tabsight::ProfilingException when the file has no usable header or nothing survives cleaning.
     */
    DatasetProfile profileFile(const std::string& path, const std::string& datasetId) const;

    const ProfilerConfig& config() const noexcept { return config_; }

private:
    DatasetProfile run(const RawTable& raw, const std::string& datasetId, const Diagnostics& ingest) const;

    ProfilerConfig config_;
};
