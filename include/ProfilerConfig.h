#pragma once

#include "DateTimeParsing.h"
#include "Logger.h"

#include <cstddef>
#include <string>

struct ProfilingThresholds {
    // Cleaner: |z| above this marks a numeric value as an outlier.
    double outlierZThreshold = 3.0;
    // Cleaner: outliers are only suppressed when they are at most this share of non-null values.
    double maxOutlierFraction = 0.10;
    // Cleaner: z-score suppression needs more than this many non-null values.
    size_t minOutlierSample = 10;
    // Cleaner: rows missing more than this share of all columns are dropped.
    double sparseRowMissingRatio = 0.80;
    size_t maxTextLength = 1000;

    // Cleaner date-likeness test.
    size_t dateSampleSize = 100;
    double datePatternRatio = 0.5;
    double dateParseRatio = 0.7;

    // Classifier.
    double datetimeMinParseRatio = 0.7;
    double categoricalMaxRatio = 0.1;
    size_t categoricalMaxUnique = 20;

    // Aggregator.
    double highCardinalityRatio = 0.8;
    double lowCardinalityRatio = 0.1;
    double binaryTargetMaxNullPercentage = 10.0;
    double idUniqueRatio = 0.9;

    // Column profiler.
    size_t patternSampleSize = 100;
    double patternMatchRatio = 0.5;
    size_t sampleValueCount = 10;
    size_t topValueCount = 10;

    /**
     * @throws Tabsight::ConfigurationException when a ratio leaves [0,1] or a count is zero.
     */
    void validate() const;
};

/**
 * @brief Run configuration for the profiler CLI and engine.
 * @details Sources are layered: defaults, then the optional --config file, then CLI flags.
 */
class ProfilerConfig {
public:
    std::string datasetPath;
    std::string datasetId;
    std::string outputPath = "profile.json";
    char delimiter = 0; // 0 => auto-detect
    size_t maxRows = 1000;
    DateTimeParsing::DateLocaleHint dateLocale = DateTimeParsing::DateLocaleHint::AUTO;
    LogLevel logLevel = LogLevel::WARN;
    bool verbose = false;
    size_t registryTtlSeconds = 300;
    ProfilingThresholds thresholds;

    /**
     * @brief Parses `tabsight <dataset.csv> [flags]`.
     * @throws Tabsight::ConfigurationException on usage errors or invalid values.
     */
    static ProfilerConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Overlays loose YAML (`key: value`) or flat JSON on top of base.
     * @throws Tabsight::ConfigurationException when the file is unreadable or a value is invalid.
     */
    static ProfilerConfig fromFile(const std::string& configPath, const ProfilerConfig& base);
    static ProfilerConfig fromFile(const std::string& configPath);

    // Dataset id falls back to the file stem of datasetPath.
    std::string effectiveDatasetId() const;
    LogLevel effectiveLogLevel() const noexcept;

    void validate() const;
};
