#include "TypeClassifier.h"
#include "CommonUtils.h"

#include <algorithm>
#include <array>
#include <set>

namespace {
struct BooleanVocabulary {
    const char* a;
    const char* b;
};

constexpr std::array<BooleanVocabulary, 6> kBooleanSets = {{
    {"true", "false"}, {"yes", "no"}, {"y", "n"}, {"1", "0"}, {"t", "f"}, {"on", "off"}
}};

bool looksLikeDatetimeColumn(const std::vector<std::string>& values,
                             const ProfilingThresholds& thresholds,
                             DateTimeParsing::DateLocaleHint hint) {
    const size_t sampleSize = std::min(values.size(), thresholds.dateSampleSize);
    if (sampleSize == 0) return false;

    size_t parsed = 0;
    for (size_t i = 0; i < sampleSize; ++i) {
        if (DateTimeParsing::isDateTime(values[i], hint)) ++parsed;
    }
    return static_cast<double>(parsed) / static_cast<double>(sampleSize) >= thresholds.datetimeMinParseRatio;
}
} // namespace

std::string TypeClassifier::canonicalToken(const std::string& value) {
    if (const auto num = CommonUtils::parseFiniteNumber(value)) return CommonUtils::formatNumber(*num);
    return CommonUtils::toLower(CommonUtils::trim(value));
}

bool TypeClassifier::isBooleanVocabulary(const std::vector<std::string>& canonicalDistinct) {
    if (canonicalDistinct.empty()) return false;
    for (const auto& vocab : kBooleanSets) {
        const bool subset = std::all_of(canonicalDistinct.begin(), canonicalDistinct.end(), [&](const std::string& v) {
            return v == vocab.a || v == vocab.b;
        });
        if (subset) return true;
    }
    return false;
}

ColumnType TypeClassifier::classify(const std::vector<std::string>& values,
                                    const ProfilingThresholds& thresholds,
                                    DateTimeParsing::DateLocaleHint hint) {
    if (values.empty()) return ColumnType::TEXT;

    std::set<std::string> canonical;
    bool allNumeric = true;
    for (const auto& value : values) {
        canonical.insert(canonicalToken(value));
        if (allNumeric && !CommonUtils::parseFiniteNumber(value)) allNumeric = false;
    }

    // Boolean sets are small; anything with more than two distinct tokens cannot match.
    if (canonical.size() <= 2) {
        const std::vector<std::string> distinct(canonical.begin(), canonical.end());
        if (isBooleanVocabulary(distinct)) return ColumnType::BOOLEAN;
    }

    if (!allNumeric && looksLikeDatetimeColumn(values, thresholds, hint)) return ColumnType::DATETIME;

    const size_t unique = canonical.size();
    const double uniqueRatio = static_cast<double>(unique) / static_cast<double>(values.size());

    // All-numeric columns included: low-cardinality codes are categorical.
    if (uniqueRatio < thresholds.categoricalMaxRatio || unique < thresholds.categoricalMaxUnique) {
        return ColumnType::CATEGORICAL;
    }
    return allNumeric ? ColumnType::NUMERIC : ColumnType::TEXT;
}
