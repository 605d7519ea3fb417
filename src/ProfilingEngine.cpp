#include "ProfilingEngine.h"
#include "CSVUtils.h"
#include "ColumnProfiler.h"
#include "DataCleaner.h"
#include "DatasetAggregator.h"
#include "DateTimeParsing.h"
#include "Logger.h"
#include "TabsightExceptions.h"

#include <ctime>

namespace {
constexpr const char* kStage = "Engine";

std::string utcNowIso8601() {
    return DateTimeParsing::formatIso8601(static_cast<int64_t>(std::time(nullptr))) + "Z";
}

CleaningSummary summarize(const CleaningReport& report) {
    CleaningSummary summary;
    summary.originalRows = report.originalRowCount;
    summary.originalColumns = report.originalColumnCount;
    summary.droppedEmptyRows = report.droppedEmptyRows;
    summary.droppedEmptyColumns = report.droppedEmptyColumns;
    summary.droppedSparseRows = report.droppedSparseRows;
    summary.outliersNulled = report.totalOutliersNulled();
    summary.nonFiniteNulled = report.totalNonFiniteNulled();
    summary.valuesTruncated = report.totalValuesTruncated();
    for (const auto& col : report.columns) {
        if (col.convertedToDatetime) summary.datetimeConvertedColumns.push_back(col.column);
    }
    summary.fallbackApplied = report.fallbackApplied;
    return summary;
}
} // namespace

ProfilingEngine::ProfilingEngine(ProfilerConfig config) : config_(std::move(config)) {
    config_.thresholds.validate();
}

DatasetProfile ProfilingEngine::profile(const RawTable& raw, const std::string& datasetId) const {
    return run(raw, datasetId, Diagnostics());
}

DatasetProfile ProfilingEngine::profileFile(const std::string& path, const std::string& datasetId) const {
    CSVUtils::CsvReadOptions options;
    options.delimiter = config_.delimiter;
    options.maxRows = config_.maxRows;

    Diagnostics ingest;
    RawTable raw;
    try {
        raw = CSVUtils::CsvTableReader(options).readFile(path, ingest);
    } catch (const Tabsight::DatasetException& ex) {
        throw Tabsight::ProfilingException(datasetId, ex.what());
    }
    return run(raw, datasetId, ingest);
}

DatasetProfile ProfilingEngine::run(const RawTable& raw, const std::string& datasetId, const Diagnostics& ingest) const {
    const ProfilingThresholds& thresholds = config_.thresholds;
    Logger::info(kStage, "profiling '" + datasetId + "' (" + std::to_string(raw.rowCount()) + " rows, " +
                         std::to_string(raw.colCount()) + " columns)");

    CleaningResult cleaned;
    try {
        cleaned = DataCleaner::clean(raw, thresholds, config_.dateLocale);
    } catch (const Tabsight::DatasetException& ex) {
        Logger::error(kStage, "dataset '" + datasetId + "' is unusable: " + ex.what());
        throw Tabsight::ProfilingException(datasetId, ex.what());
    }

    const auto& columns = cleaned.table.columns();
    std::vector<ColumnProfile> profiles(columns.size());

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (long long c = 0; c < static_cast<long long>(columns.size()); ++c) {
        const size_t idx = static_cast<size_t>(c);
        try {
            profiles[idx] = ColumnProfiler::build(columns[idx], thresholds, config_.dateLocale);
        } catch (const std::exception& ex) {
            ColumnProfile fallback;
            fallback.name = columns[idx].name;
            fallback.originalName = columns[idx].originalName;
            fallback.totalRows = columns[idx].size();
            fallback.nullCount = columns[idx].nullCount();
            fallback.nonNullCount = fallback.totalRows - fallback.nullCount;
            fallback.warnings.push_back(std::string("profiling failed: ") + ex.what());
            profiles[idx] = std::move(fallback);
        }
    }

    DatasetProfile out = DatasetAggregator::aggregate(datasetId, std::move(profiles), cleaned.table, thresholds);

    std::vector<std::string> warnings = ingest.warningMessages();
    for (const auto& w : cleaned.diagnostics.warningMessages()) warnings.push_back(w);
    for (const auto& col : out.columns) {
        for (const auto& w : col.warnings) {
            warnings.push_back("column '" + col.name + "': " + w);
            Logger::warn("Profiler", "column '" + col.name + "': " + w);
        }
    }
    warnings.insert(warnings.end(), out.qualityWarnings.begin(), out.qualityWarnings.end());
    out.qualityWarnings = std::move(warnings);

    out.cleaning = summarize(cleaned.report);
    out.sampleSize = raw.rowCount();
    out.profiledAt = utcNowIso8601();

    Logger::info(kStage, "profiled '" + datasetId + "': " + std::to_string(out.totalRows) + " rows, " +
                         std::to_string(out.totalColumns) + " columns, " +
                         std::to_string(out.qualityWarnings.size()) + " warnings");
    return out;
}
