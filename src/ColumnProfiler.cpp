#include "ColumnProfiler.h"
#include "CommonUtils.h"
#include "Statistics.h"
#include "TypeClassifier.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <regex>
#include <unordered_map>

namespace {
constexpr size_t kMinSequentialValues = 10;

const std::regex& uuidRegex() {
    static const std::regex re(R"(^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$)");
    return re;
}

const std::regex& emailRegex() {
    static const std::regex re(R"(@.*\.)");
    return re;
}

const std::regex& phoneRegex() {
    static const std::regex re(R"(^[\+]?[1-9]?[\d\s\-\(\)\.]{7,15}$)");
    return re;
}

const std::regex& urlRegex() {
    static const std::regex re(R"(https?://)");
    return re;
}

bool moreThanShare(const std::vector<std::string>& sample, double share, const std::function<bool(const std::string&)>& pred) {
    if (sample.empty()) return false;
    const size_t hits = static_cast<size_t>(std::count_if(sample.begin(), sample.end(), pred));
    return static_cast<double>(hits) > static_cast<double>(sample.size()) * share;
}

// Runs one profiling step; failures become column warnings.
template <typename Fn>
void guardedStep(ColumnProfile& profile, const char* step, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& ex) {
        profile.warnings.push_back(std::string(step) + " failed: " + ex.what());
    }
}

void fillFrequencies(ColumnProfile& profile, const std::vector<std::string>& values, const ProfilingThresholds& thresholds) {
    std::unordered_map<std::string, size_t> counts;
    std::vector<std::string> firstSeen;
    counts.reserve(values.size());
    for (const auto& v : values) {
        auto [it, inserted] = counts.emplace(v, 0);
        if (inserted) firstSeen.push_back(v);
        ++it->second;
    }
    profile.uniqueCount = counts.size();
    profile.cardinality = counts.size();

    const size_t sampleCount = std::min(values.size(), thresholds.sampleValueCount);
    profile.sampleValues.assign(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(sampleCount));

    // Ties keep first-appearance order.
    std::stable_sort(firstSeen.begin(), firstSeen.end(), [&](const std::string& a, const std::string& b) {
        return counts[a] > counts[b];
    });
    const size_t topCount = std::min(firstSeen.size(), thresholds.topValueCount);
    profile.topValues.reserve(topCount);
    for (size_t i = 0; i < topCount; ++i) {
        const size_t count = counts[firstSeen[i]];
        profile.topValues.push_back({firstSeen[i], count,
                                     100.0 * static_cast<double>(count) / static_cast<double>(values.size())});
    }
}

void fillNumericSummary(ColumnProfile& profile, const CleanedColumn& column, const std::vector<std::string>& values) {
    std::vector<double> numbers;
    numbers.reserve(values.size());
    if (column.storage() == StorageKind::NUMERIC) {
        const auto& stored = std::get<NumericValues>(column.values);
        for (size_t r = 0; r < stored.size(); ++r) {
            if (!column.isMissing(r)) numbers.push_back(stored[r]);
        }
    } else {
        for (const auto& v : values) {
            if (const auto num = CommonUtils::parseFiniteNumber(v)) numbers.push_back(*num);
        }
    }

    const ColumnStats stats = Statistics::calculateStats(numbers);
    if (stats.count == 0) {
        profile.warnings.push_back("numeric summary skipped: no parseable values");
        return;
    }
    profile.numeric = NumericSummary{stats.min, stats.max, stats.mean, stats.median, stats.stddev};
}

void fillTextSummary(ColumnProfile& profile, const std::vector<std::string>& values) {
    if (values.empty()) return;
    TextLengthSummary summary;
    summary.minLength = std::numeric_limits<size_t>::max();
    double total = 0.0;
    for (const auto& v : values) {
        const size_t len = CommonUtils::utf8Length(v);
        summary.minLength = std::min(summary.minLength, len);
        summary.maxLength = std::max(summary.maxLength, len);
        total += static_cast<double>(len);
    }
    summary.avgLength = total / static_cast<double>(values.size());
    profile.text = summary;
}

void fillDatetimeSummary(ColumnProfile& profile,
                         const CleanedColumn& column,
                         const std::vector<std::string>& values,
                         DateTimeParsing::DateLocaleHint hint) {
    std::vector<int64_t> stamps;
    stamps.reserve(values.size());
    if (column.storage() == StorageKind::DATETIME) {
        const auto& stored = std::get<DatetimeValues>(column.values);
        for (size_t r = 0; r < stored.size(); ++r) {
            if (!column.isMissing(r)) stamps.push_back(stored[r]);
        }
    } else {
        for (const auto& v : values) {
            if (const auto ts = DateTimeParsing::parseDateTime(v, hint)) stamps.push_back(*ts);
        }
    }
    if (stamps.empty()) {
        profile.warnings.push_back("datetime summary skipped: no parseable values");
        return;
    }
    const auto [lo, hi] = std::minmax_element(stamps.begin(), stamps.end());
    profile.datetime = DatetimeSummary{DateTimeParsing::formatIso8601(*lo), DateTimeParsing::formatIso8601(*hi)};
}

std::vector<std::string> patternSample(const std::vector<std::string>& values, const ProfilingThresholds& thresholds) {
    const size_t n = std::min(values.size(), thresholds.patternSampleSize);
    return std::vector<std::string>(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(n));
}

bool idLike(const std::vector<std::string>& sample, double share) {
    return ColumnProfiler::isSequentialNumeric(sample) ||
           moreThanShare(sample, share, [](const std::string& v) { return std::regex_match(v, uuidRegex()); });
}

bool emailLike(const std::vector<std::string>& sample, double share) {
    return moreThanShare(sample, share, [](const std::string& v) { return std::regex_search(v, emailRegex()); });
}

bool phoneLike(const std::vector<std::string>& sample, double share) {
    return moreThanShare(sample, share, [](const std::string& v) { return std::regex_match(v, phoneRegex()); });
}

bool urlLike(const std::vector<std::string>& sample, double share) {
    return moreThanShare(sample, share, [](const std::string& v) { return std::regex_search(v, urlRegex()); });
}
} // namespace

bool ColumnProfiler::isSequentialNumeric(const std::vector<std::string>& sample) {
    std::vector<double> numbers;
    numbers.reserve(sample.size());
    for (const auto& v : sample) {
        if (const auto num = CommonUtils::parseFiniteNumber(v)) numbers.push_back(*num);
    }
    if (numbers.size() <= kMinSequentialValues) return false;

    std::vector<double> diffs;
    diffs.reserve(numbers.size() - 1);
    for (size_t i = 1; i < numbers.size(); ++i) diffs.push_back(numbers[i] - numbers[i - 1]);
    return CommonUtils::medianByNth(std::move(diffs)) == 1.0;
}

ColumnProfile ColumnProfiler::build(const CleanedColumn& column,
                                    const ProfilingThresholds& thresholds,
                                    DateTimeParsing::DateLocaleHint hint) {
    ColumnProfile profile;
    profile.name = column.name;
    profile.originalName = column.originalName;
    profile.totalRows = column.size();
    profile.nullCount = column.nullCount();
    profile.nonNullCount = profile.totalRows - profile.nullCount;
    profile.nullPercentage = profile.totalRows > 0
        ? 100.0 * static_cast<double>(profile.nullCount) / static_cast<double>(profile.totalRows)
        : 0.0;

    std::vector<std::string> values;
    values.reserve(profile.nonNullCount);
    for (size_t r = 0; r < column.size(); ++r) {
        if (!column.isMissing(r)) values.push_back(column.valueAsString(r));
    }

    guardedStep(profile, "type inference", [&]() { profile.type = TypeClassifier::classify(values, thresholds, hint); });
    guardedStep(profile, "value frequencies", [&]() { fillFrequencies(profile, values, thresholds); });

    switch (profile.type) {
        case ColumnType::NUMERIC:
            guardedStep(profile, "numeric summary", [&]() { fillNumericSummary(profile, column, values); });
            break;
        case ColumnType::TEXT:
            guardedStep(profile, "text summary", [&]() { fillTextSummary(profile, values); });
            break;
        case ColumnType::DATETIME:
            guardedStep(profile, "datetime summary", [&]() { fillDatetimeSummary(profile, column, values, hint); });
            break;
        case ColumnType::CATEGORICAL:
        case ColumnType::BOOLEAN:
            break;
    }

    // Each pattern check is independent; one failing leaves only its own flag false.
    if (!values.empty()) {
        const std::vector<std::string> sample = patternSample(values, thresholds);
        const double share = thresholds.patternMatchRatio;
        guardedStep(profile, "id pattern", [&]() { profile.isIdLike = idLike(sample, share); });
        guardedStep(profile, "email pattern", [&]() { profile.isEmailLike = emailLike(sample, share); });
        guardedStep(profile, "phone pattern", [&]() { profile.isPhoneLike = phoneLike(sample, share); });
        guardedStep(profile, "url pattern", [&]() { profile.isUrlLike = urlLike(sample, share); });
    }
    return profile;
}
