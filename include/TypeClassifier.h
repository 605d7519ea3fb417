#pragma once

#include "DateTimeParsing.h"
#include "ProfilerConfig.h"
#include "Table.h"

#include <string>
#include <vector>

namespace TypeClassifier {
/**
 * @brief Decides the semantic type of a column from its non-null values.
 * @details Checks run in a fixed order and the first match wins:
 * boolean vocabulary, datetime (sampled parse ratio), numeric (all finite numbers,
 * demoted to categorical for low-cardinality codes), categorical (cardinality), text.
 * Numbers compare in canonical form, so "1.0" and "1" are the same value.
 * @post An empty input yields ColumnType::TEXT. Deterministic for identical input.
 */
ColumnType classify(const std::vector<std::string>& values,
                    const ProfilingThresholds& thresholds = ProfilingThresholds(),
                    DateTimeParsing::DateLocaleHint hint = DateTimeParsing::DateLocaleHint::AUTO);

// Lower-cased trimmed text, or formatNumber() form for numeric tokens.
std::string canonicalToken(const std::string& value);

bool isBooleanVocabulary(const std::vector<std::string>& canonicalDistinct);
} // namespace TypeClassifier
