#include "DateTimeParsing.h"
#include "CommonUtils.h"

#include <array>
#include <cctype>
#include <cstdio>
#include <regex>
#include <vector>

namespace DateTimeParsing {
namespace {

bool parseFixedInt(std::string_view s, size_t offset, size_t len, int& out) {
    if (len == 0 || offset + len > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        const unsigned char ch = static_cast<unsigned char>(s[offset + i]);
        if (ch < '0' || ch > '9') return false;
        value = value * 10 + static_cast<int>(ch - '0');
    }
    out = value;
    return true;
}

bool parseWholeInt(std::string_view s, int& out) {
    if (s.empty() || s.size() > 9) return false;
    return parseFixedInt(s, 0, s.size(), out);
}

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return (year % 4 == 0);
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t z, int& year, int& month, int& day) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int>(y + (m <= 2 ? 1 : 0));
    month = static_cast<int>(m);
    day = static_cast<int>(d);
}

bool isNumberToken(std::string_view s) {
    if (s.empty()) return false;
    bool dot = false;
    bool exp = false;
    bool digit = false;
    size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    for (; i < s.size(); ++i) {
        const char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digit = true;
            continue;
        }
        if (c == '.' && !dot && !exp) {
            dot = true;
            continue;
        }
        if ((c == 'e' || c == 'E') && !exp && digit) {
            exp = true;
            if (i + 1 < s.size() && (s[i + 1] == '+' || s[i + 1] == '-')) ++i;
            continue;
        }
        return false;
    }
    return digit;
}

int monthFromName(const std::string& token) {
    static const std::array<const char*, 12> kFull = {"january", "february", "march", "april", "may", "june",
                                                      "july", "august", "september", "october", "november", "december"};
    const std::string t = CommonUtils::toLower(token);
    if (t.size() < 3) return 0;
    if (t == "sept") return 9;
    for (size_t i = 0; i < kFull.size(); ++i) {
        const std::string full = kFull[i];
        if (t == full || t == full.substr(0, 3)) return static_cast<int>(i) + 1;
    }
    return 0;
}

// First/second field order for D?M?Y numeric dates. defaultMonthFirst applies in AUTO when ambiguous.
void resolveDayMonth(int a, int b, DateLocaleHint hint, bool defaultMonthFirst, int& month, int& day) {
    bool monthFirst = defaultMonthFirst;
    if (hint == DateLocaleHint::DMY) {
        monthFirst = false;
    } else if (hint == DateLocaleHint::MDY) {
        monthFirst = true;
    } else if (a > 12 && b <= 12) {
        monthFirst = false;
    } else if (b > 12 && a <= 12) {
        monthFirst = true;
    }
    month = monthFirst ? a : b;
    day = monthFirst ? b : a;
}

bool parseIsoWeekDate(std::string_view datePart, int& year, int& month, int& day) {
    if (datePart.size() != 10 || datePart[4] != '-' || datePart[5] != 'W' || datePart[8] != '-') return false;
    int isoYear = 0;
    int isoWeek = 0;
    int isoDay = 0;
    if (!parseFixedInt(datePart, 0, 4, isoYear) ||
        !parseFixedInt(datePart, 6, 2, isoWeek) ||
        !parseFixedInt(datePart, 9, 1, isoDay)) {
        return false;
    }
    if (isoWeek < 1 || isoWeek > 53 || isoDay < 1 || isoDay > 7) return false;

    const int64_t jan4 = daysFromCivil(isoYear, 1, 4);
    const int jan4WeekdayMon1 = static_cast<int>(((jan4 + 3) % 7 + 7) % 7) + 1;
    const int64_t week1Monday = jan4 - static_cast<int64_t>(jan4WeekdayMon1 - 1);
    civilFromDays(week1Monday + (isoWeek - 1) * 7 + (isoDay - 1), year, month, day);
    return true;
}

bool parseNumericDate(std::string_view datePart, DateLocaleHint hint, int& year, int& month, int& day) {
    char sep = 0;
    for (char ch : datePart) {
        if (ch == '-' || ch == '/' || ch == '.') {
            sep = ch;
            break;
        }
    }
    if (sep == 0) return false;

    std::vector<std::string_view> fields;
    size_t start = 0;
    for (size_t i = 0; i <= datePart.size(); ++i) {
        if (i == datePart.size() || datePart[i] == sep) {
            fields.push_back(datePart.substr(start, i - start));
            start = i + 1;
        }
    }
    if (fields.size() != 3) return false;

    int f0 = 0;
    int f1 = 0;
    int f2 = 0;
    if (!parseWholeInt(fields[0], f0) || !parseWholeInt(fields[1], f1) || !parseWholeInt(fields[2], f2)) return false;

    if (fields[0].size() == 4 && fields[1].size() <= 2 && fields[2].size() <= 2) {
        year = f0;
        month = f1;
        day = f2;
        return true;
    }
    if (fields[0].size() <= 2 && fields[1].size() <= 2 && fields[2].size() == 4) {
        resolveDayMonth(f0, f1, hint, sep == '/', month, day);
        year = f2;
        return true;
    }
    if (fields[0].size() == 2 && fields[1].size() == 2 && fields[2].size() == 2 && sep != '.') {
        month = f0;
        day = f1;
        if (hint == DateLocaleHint::DMY) {
            day = f0;
            month = f1;
        }
        year = (f2 >= 70) ? (1900 + f2) : (2000 + f2);
        return true;
    }
    return false;
}

bool parseMonthNameDate(const std::string& datePart, int& year, int& month, int& day) {
    std::vector<std::string> tokens;
    std::string cur;
    for (char ch : datePart) {
        if (ch == ' ' || ch == '-' || ch == ',' || ch == '/') {
            if (!cur.empty()) tokens.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(ch);
        }
    }
    if (!cur.empty()) tokens.push_back(cur);
    if (tokens.size() != 3) return false;

    // Optional ordinal suffix: 1st, 2nd, 3rd, 15th.
    auto stripOrdinal = [](std::string t) {
        if (t.size() > 2) {
            const std::string tail = CommonUtils::toLower(t.substr(t.size() - 2));
            if (tail == "st" || tail == "nd" || tail == "rd" || tail == "th") t.resize(t.size() - 2);
        }
        return t;
    };

    int y = 0;
    if (tokens[2].size() != 4 || !parseWholeInt(tokens[2], y)) return false;

    int m = monthFromName(tokens[1]);
    int d = 0;
    if (m != 0 && parseWholeInt(stripOrdinal(tokens[0]), d)) {
        year = y;
        month = m;
        day = d;
        return true;
    }
    m = monthFromName(tokens[0]);
    if (m != 0 && parseWholeInt(stripOrdinal(tokens[1]), d)) {
        year = y;
        month = m;
        day = d;
        return true;
    }
    return false;
}

bool parseOffset(std::string_view s, int& offsetSeconds) {
    if (s.empty()) {
        offsetSeconds = 0;
        return true;
    }
    const std::string lower = CommonUtils::toLower(s);
    if (lower == "z" || lower == "utc" || lower == "gmt") {
        offsetSeconds = 0;
        return true;
    }
    if (s[0] != '+' && s[0] != '-') return false;
    const int sign = (s[0] == '-') ? -1 : 1;
    int hh = 0;
    int mm = 0;
    if (s.size() == 3) {
        if (!parseFixedInt(s, 1, 2, hh)) return false;
    } else if (s.size() == 5) {
        if (!parseFixedInt(s, 1, 2, hh) || !parseFixedInt(s, 3, 2, mm)) return false;
    } else if (s.size() == 6 && s[3] == ':') {
        if (!parseFixedInt(s, 1, 2, hh) || !parseFixedInt(s, 4, 2, mm)) return false;
    } else {
        return false;
    }
    if (hh > 14 || mm > 59) return false;
    offsetSeconds = sign * (hh * 3600 + mm * 60);
    return true;
}

bool parseTimePart(std::string timePart, int& hour, int& minute, int& second, int& offsetSeconds) {
    hour = minute = second = 0;
    offsetSeconds = 0;
    if (timePart.empty()) return true;

    int pmShift = -1;
    const std::string lower = CommonUtils::toLower(timePart);
    if (lower.size() > 2 && (lower.compare(lower.size() - 2, 2, "am") == 0 || lower.compare(lower.size() - 2, 2, "pm") == 0)) {
        pmShift = (lower[lower.size() - 2] == 'p') ? 12 : 0;
        timePart.resize(timePart.size() - 2);
    }

    size_t pos = 0;
    auto readTwo = [&](int& out) {
        size_t len = 0;
        while (pos + len < timePart.size() && len < 2 && std::isdigit(static_cast<unsigned char>(timePart[pos + len]))) ++len;
        if (len == 0 || !parseFixedInt(timePart, pos, len, out)) return false;
        pos += len;
        return true;
    };

    if (!readTwo(hour)) return false;
    if (pos >= timePart.size() || timePart[pos] != ':') return false;
    ++pos;
    if (!readTwo(minute)) return false;
    if (pos < timePart.size() && timePart[pos] == ':') {
        ++pos;
        if (!readTwo(second)) return false;
        if (pos < timePart.size() && (timePart[pos] == '.' || timePart[pos] == ',')) {
            ++pos;
            while (pos < timePart.size() && std::isdigit(static_cast<unsigned char>(timePart[pos]))) ++pos;
        }
    }
    if (!parseOffset(std::string_view(timePart).substr(pos), offsetSeconds)) return false;

    if (pmShift >= 0) {
        if (hour < 1 || hour > 12) return false;
        hour = (hour % 12) + pmShift;
    }
    return hour <= 23 && minute <= 59 && second <= 60;
}

void splitDateAndTime(const std::string& s, std::string& datePart, std::string& timePart) {
    const size_t tPos = s.find('T');
    if (tPos != std::string::npos && tPos >= 8 && tPos + 1 < s.size() &&
        std::isdigit(static_cast<unsigned char>(s[tPos - 1])) &&
        std::isdigit(static_cast<unsigned char>(s[tPos + 1]))) {
        datePart = s.substr(0, tPos);
        timePart = s.substr(tPos + 1);
        return;
    }

    std::vector<std::string> tokens;
    std::string cur;
    for (char ch : s) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            if (!cur.empty()) tokens.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(ch);
        }
    }
    if (!cur.empty()) tokens.push_back(cur);

    datePart = s;
    timePart.clear();
    for (size_t i = 1; i < tokens.size(); ++i) {
        if (tokens[i].find(':') == std::string::npos) continue;
        datePart.clear();
        for (size_t j = 0; j < i; ++j) {
            if (j > 0) datePart.push_back(' ');
            datePart += tokens[j];
        }
        for (size_t j = i; j < tokens.size(); ++j) timePart += tokens[j];
        return;
    }
}

} // namespace

std::optional<int64_t> parseDateTime(std::string_view text, DateLocaleHint hint) {
    const std::string s = CommonUtils::trim(text);
    if (s.size() < 6 || isNumberToken(s)) return std::nullopt;

    std::string datePart;
    std::string timePart;
    splitDateAndTime(s, datePart, timePart);
    while (!datePart.empty() && (datePart.back() == ',' || datePart.back() == ' ')) datePart.pop_back();

    int year = 0;
    int month = 0;
    int day = 0;
    const bool dateOk = parseIsoWeekDate(datePart, year, month, day) ||
                        parseNumericDate(datePart, hint, year, month, day) ||
                        parseMonthNameDate(datePart, year, month, day);
    if (!dateOk) return std::nullopt;
    if (year < 1 || year > 9999) return std::nullopt;
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > daysInMonth(year, month)) return std::nullopt;

    int hour = 0;
    int minute = 0;
    int second = 0;
    int offsetSeconds = 0;
    if (!parseTimePart(timePart, hour, minute, second, offsetSeconds)) return std::nullopt;

    const int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return days * 86400 + static_cast<int64_t>(hour) * 3600 + static_cast<int64_t>(minute) * 60 + second - offsetSeconds;
}

bool isDateTime(std::string_view text, DateLocaleHint hint) {
    return parseDateTime(text, hint).has_value();
}

std::string formatIso8601(int64_t unixSeconds) {
    int64_t days = unixSeconds / 86400;
    int64_t rem = unixSeconds % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }
    int year = 0;
    int month = 0;
    int day = 0;
    civilFromDays(days, year, month, day);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d", year, month, day,
                  static_cast<int>(rem / 3600), static_cast<int>((rem % 3600) / 60), static_cast<int>(rem % 60));
    return buf;
}

bool matchesDatePattern(std::string_view text) {
    static const std::regex kIso(R"(^\d{4}[-/.]\d{1,2}[-/.]\d{1,2})");
    static const std::regex kDayFirst(R"(^\d{1,2}[-/.]\d{1,2}[-/.]\d{2,4})");
    static const std::regex kNamedDayFirst(R"(^\d{1,2}(st|nd|rd|th)?[ -][A-Za-z]{3,9}[ ,-]+\d{4})");
    static const std::regex kNamedMonthFirst(R"(^[A-Za-z]{3,9} \d{1,2}(st|nd|rd|th)?,? \d{4})");
    const std::string s = CommonUtils::trim(text);
    if (s.empty()) return false;
    return std::regex_search(s, kIso) ||
           std::regex_search(s, kDayFirst) ||
           std::regex_search(s, kNamedDayFirst) ||
           std::regex_search(s, kNamedMonthFirst);
}

std::optional<DateLocaleHint> parseLocaleHint(const std::string& name) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(name));
    if (v == "auto") return DateLocaleHint::AUTO;
    if (v == "dmy") return DateLocaleHint::DMY;
    if (v == "mdy") return DateLocaleHint::MDY;
    return std::nullopt;
}

const char* toString(DateLocaleHint hint) noexcept {
    switch (hint) {
        case DateLocaleHint::AUTO: return "auto";
        case DateLocaleHint::DMY: return "dmy";
        case DateLocaleHint::MDY: return "mdy";
    }
    return "auto";
}

} // namespace DateTimeParsing
