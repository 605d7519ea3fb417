#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace DateTimeParsing {

enum class DateLocaleHint {
    AUTO,
    DMY,
    MDY
};

/**
 * @brief Parses common calendar date/timestamp spellings into Unix seconds (UTC).
 * @details Accepts ISO (YYYY-MM-DD, with / or . separators), DD-MM-YYYY, DD.MM.YYYY,
 * slash dates resolved by the locale hint, MM-DD-YY and month-name forms, each with an
 * optional time of day, fractional seconds and Z or numeric offset.
 * Number-only tokens are never treated as dates.
 * @post Returns std::nullopt when the text is not a valid calendar date.
 */
std::optional<int64_t> parseDateTime(std::string_view text, DateLocaleHint hint = DateLocaleHint::AUTO);

bool isDateTime(std::string_view text, DateLocaleHint hint = DateLocaleHint::AUTO);

// YYYY-MM-DDTHH:MM:SS
std::string formatIso8601(int64_t unixSeconds);

// Loose regex screen used by the cleaner's date-likeness test.
bool matchesDatePattern(std::string_view text);

std::optional<DateLocaleHint> parseLocaleHint(const std::string& name);
const char* toString(DateLocaleHint hint) noexcept;

} // namespace DateTimeParsing
