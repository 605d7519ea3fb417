#include "ProfilerConfig.h"
#include "CommonUtils.h"
#include "TabsightExceptions.h"

#include <filesystem>
#include <fstream>
#include <unordered_map>

namespace {
constexpr const char* kUsage =
    "Usage: tabsight <dataset.csv> [--config path] [--dataset-id id] [--max-rows N] "
    "[--delimiter auto|c] [--output profile.json] [--date-locale auto|dmy|mdy] "
    "[--log-level debug|info|warn|error|off] [--verbose true|false]";

template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Tabsight::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Tabsight::TabsightException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Tabsight::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

size_t parseSizeStrict(const std::string& value, const std::string& key, size_t minValue) {
    const std::string v = CommonUtils::trim(value);
    if (!v.empty() && v.front() == '-') {
        throw Tabsight::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    const unsigned long long parsed = parseNumericStrict<unsigned long long>(
        v,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& s, size_t* pos) { return std::stoull(s, pos); });
    if (parsed < minValue) {
        throw Tabsight::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return static_cast<size_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    const double parsed = parseNumericStrict<double>(
        CommonUtils::trim(value),
        key,
        "Invalid number for ",
        [](const std::string& s, size_t* pos) { return std::stod(s, pos); });
    if (parsed < minValue) {
        throw Tabsight::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Tabsight::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

char parseDelimiter(const std::string& value, const std::string& key) {
    const std::string lowered = CommonUtils::toLower(value);
    if (lowered == "auto") return 0;
    if (lowered == "\\t" || lowered == "tab") return '\t';
    if (value.size() != 1) throw Tabsight::ConfigurationException(key + " expects auto or a single character");
    if (value[0] == '"' || value[0] == '\n' || value[0] == '\r') {
        throw Tabsight::ConfigurationException(key + " cannot be a quote or newline character");
    }
    return value[0];
}

DateTimeParsing::DateLocaleHint parseLocale(const std::string& value, const std::string& key) {
    const auto hint = DateTimeParsing::parseLocaleHint(value);
    if (!hint) throw Tabsight::ConfigurationException(key + " must be one of: auto, dmy, mdy");
    return *hint;
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }

    const size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// "Max-Rows" and "max_rows" both map to max_rows; a "thresholds." prefix is optional.
std::string normalizeConfigKey(const std::string& key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    for (char& c : out) {
        if (c == '-') c = '_';
    }
    const std::string prefix = "thresholds.";
    if (out.rfind(prefix, 0) == 0) out = out.substr(prefix.size());
    return out;
}

struct DoubleField {
    double ProfilingThresholds::*member;
    double minValue;
};

struct SizeField {
    size_t ProfilingThresholds::*member;
    size_t minValue;
};

void assignKeyValue(ProfilerConfig& config, const std::string& key, const std::string& value) {
    static const std::unordered_map<std::string, DoubleField> thresholdDoubles = {
        {"outlier_z_threshold", {&ProfilingThresholds::outlierZThreshold, 0.0}},
        {"max_outlier_fraction", {&ProfilingThresholds::maxOutlierFraction, 0.0}},
        {"sparse_row_missing_ratio", {&ProfilingThresholds::sparseRowMissingRatio, 0.0}},
        {"date_pattern_ratio", {&ProfilingThresholds::datePatternRatio, 0.0}},
        {"date_parse_ratio", {&ProfilingThresholds::dateParseRatio, 0.0}},
        {"datetime_min_parse_ratio", {&ProfilingThresholds::datetimeMinParseRatio, 0.0}},
        {"categorical_max_ratio", {&ProfilingThresholds::categoricalMaxRatio, 0.0}},
        {"high_cardinality_ratio", {&ProfilingThresholds::highCardinalityRatio, 0.0}},
        {"low_cardinality_ratio", {&ProfilingThresholds::lowCardinalityRatio, 0.0}},
        {"binary_target_max_null_percentage", {&ProfilingThresholds::binaryTargetMaxNullPercentage, 0.0}},
        {"id_unique_ratio", {&ProfilingThresholds::idUniqueRatio, 0.0}},
        {"pattern_match_ratio", {&ProfilingThresholds::patternMatchRatio, 0.0}}
    };
    static const std::unordered_map<std::string, SizeField> thresholdSizes = {
        {"min_outlier_sample", {&ProfilingThresholds::minOutlierSample, 0}},
        {"max_text_length", {&ProfilingThresholds::maxTextLength, 1}},
        {"date_sample_size", {&ProfilingThresholds::dateSampleSize, 1}},
        {"categorical_max_unique", {&ProfilingThresholds::categoricalMaxUnique, 0}},
        {"pattern_sample_size", {&ProfilingThresholds::patternSampleSize, 1}},
        {"sample_value_count", {&ProfilingThresholds::sampleValueCount, 0}},
        {"top_value_count", {&ProfilingThresholds::topValueCount, 0}}
    };

    if (key == "dataset" || key == "dataset_path") {
        config.datasetPath = value;
        return;
    }
    if (key == "dataset_id") {
        config.datasetId = value;
        return;
    }
    if (key == "output" || key == "output_path") {
        config.outputPath = value;
        return;
    }
    if (key == "delimiter") {
        config.delimiter = parseDelimiter(value, key);
        return;
    }
    if (key == "max_rows") {
        config.maxRows = parseSizeStrict(value, key, 0);
        return;
    }
    if (key == "date_locale" || key == "datetime_locale_hint") {
        config.dateLocale = parseLocale(value, key);
        return;
    }
    if (key == "log_level") {
        config.logLevel = Logger::parseLevel(value);
        return;
    }
    if (key == "verbose") {
        config.verbose = parseBoolStrict(value, key);
        return;
    }
    if (key == "registry_ttl_seconds" || key == "cache_ttl") {
        config.registryTtlSeconds = parseSizeStrict(value, key, 0);
        return;
    }
    if (const auto it = thresholdDoubles.find(key); it != thresholdDoubles.end()) {
        config.thresholds.*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return;
    }
    if (const auto it = thresholdSizes.find(key); it != thresholdSizes.end()) {
        config.thresholds.*(it->second.member) = parseSizeStrict(value, key, it->second.minValue);
        return;
    }
    Logger::warn("Config", "ignoring unknown key '" + key + "'");
}

void requireRatio(double value, const char* key) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw Tabsight::ConfigurationException(std::string(key) + " must be within [0,1]");
    }
}
} // namespace

void ProfilingThresholds::validate() const {
    if (!(outlierZThreshold > 0.0)) {
        throw Tabsight::ConfigurationException("outlier_z_threshold must be > 0");
    }
    requireRatio(maxOutlierFraction, "max_outlier_fraction");
    requireRatio(sparseRowMissingRatio, "sparse_row_missing_ratio");
    requireRatio(datePatternRatio, "date_pattern_ratio");
    requireRatio(dateParseRatio, "date_parse_ratio");
    requireRatio(datetimeMinParseRatio, "datetime_min_parse_ratio");
    requireRatio(categoricalMaxRatio, "categorical_max_ratio");
    requireRatio(highCardinalityRatio, "high_cardinality_ratio");
    requireRatio(lowCardinalityRatio, "low_cardinality_ratio");
    requireRatio(idUniqueRatio, "id_unique_ratio");
    requireRatio(patternMatchRatio, "pattern_match_ratio");
    if (lowCardinalityRatio > highCardinalityRatio) {
        throw Tabsight::ConfigurationException("low_cardinality_ratio must not exceed high_cardinality_ratio");
    }
    if (binaryTargetMaxNullPercentage < 0.0 || binaryTargetMaxNullPercentage > 100.0) {
        throw Tabsight::ConfigurationException("binary_target_max_null_percentage must be within [0,100]");
    }
    if (maxTextLength == 0 || dateSampleSize == 0 || patternSampleSize == 0) {
        throw Tabsight::ConfigurationException("max_text_length, date_sample_size and pattern_sample_size must be > 0");
    }
}

ProfilerConfig ProfilerConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) throw Tabsight::ConfigurationException(kUsage);

    const std::string first = argv[1];
    if (first == "--help" || first == "-h" || first.rfind("--", 0) == 0) {
        throw Tabsight::ConfigurationException(kUsage);
    }

    std::string configPath;
    for (int i = 2; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) throw Tabsight::ConfigurationException("--config expects a path");
            configPath = argv[i + 1];
            break;
        }
    }

    ProfilerConfig config = configPath.empty() ? ProfilerConfig() : fromFile(configPath);
    config.datasetPath = first;

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (i + 1 >= argc) {
            throw Tabsight::ConfigurationException("Missing value for " + arg + "\n" + kUsage);
        }
        const std::string value = argv[++i];
        if (arg == "--config") {
            continue;
        } else if (arg == "--dataset-id") {
            config.datasetId = value;
        } else if (arg == "--max-rows") {
            config.maxRows = parseSizeStrict(value, arg, 0);
        } else if (arg == "--delimiter") {
            config.delimiter = parseDelimiter(value, arg);
        } else if (arg == "--output") {
            config.outputPath = value;
        } else if (arg == "--date-locale") {
            config.dateLocale = parseLocale(value, arg);
        } else if (arg == "--log-level") {
            config.logLevel = Logger::parseLevel(value);
        } else if (arg == "--verbose") {
            config.verbose = parseBoolStrict(value, arg);
        } else {
            throw Tabsight::ConfigurationException("Unknown option " + arg + "\n" + kUsage);
        }
    }

    config.validate();
    return config;
}

ProfilerConfig ProfilerConfig::fromFile(const std::string& configPath) {
    return fromFile(configPath, ProfilerConfig());
}

ProfilerConfig ProfilerConfig::fromFile(const std::string& configPath, const ProfilerConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Tabsight::ConfigurationException("Could not open config file: " + configPath);

    ProfilerConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Loose YAML (key: value) and flat JSON ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));
        if (key == "thresholds" && value.empty()) continue;

        try {
            assignKeyValue(config, key, value);
        } catch (const Tabsight::TabsightException& ex) {
            throw Tabsight::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    config.thresholds.validate();
    return config;
}

std::string ProfilerConfig::effectiveDatasetId() const {
    if (!datasetId.empty()) return datasetId;
    const std::string stem = std::filesystem::path(datasetPath).stem().string();
    return stem.empty() ? "dataset" : stem;
}

LogLevel ProfilerConfig::effectiveLogLevel() const noexcept {
    if (verbose && logLevel > LogLevel::INFO) return LogLevel::INFO;
    return logLevel;
}

void ProfilerConfig::validate() const {
    if (datasetPath.empty()) {
        throw Tabsight::ConfigurationException("dataset path is required");
    }
    if (outputPath.empty()) {
        throw Tabsight::ConfigurationException("output path must not be empty");
    }
    thresholds.validate();
}
