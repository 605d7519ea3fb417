#include "Sanitizer.h"
#include "CommonUtils.h"

#include <array>
#include <cctype>
#include <unordered_set>

namespace {
constexpr std::array<const char*, 10> kNullTokens = {
    "null", "none", "n/a", "na", "nil", "undefined", "empty", "missing", "unknown", "nan"
};
constexpr const char* kUnnamedColumn = "unnamed_column";
constexpr const char* kDigitPrefix = "col_";
} // namespace

std::string Sanitizer::sanitizeName(std::string_view raw) {
    const std::string trimmed = CommonUtils::trim(raw);
    std::string out;
    out.reserve(trimmed.size() + 4);
    for (unsigned char ch : trimmed) {
        if (std::isalnum(ch) || ch == '_') {
            out.push_back(static_cast<char>(std::tolower(ch)));
        } else {
            out.push_back('_');
        }
    }
    if (out.empty()) return kUnnamedColumn;
    if (std::isdigit(static_cast<unsigned char>(out.front()))) out = kDigitPrefix + out;
    return out;
}

std::vector<std::string> Sanitizer::sanitizeNames(const std::vector<std::string>& raw) {
    std::vector<std::string> out;
    out.reserve(raw.size());
    std::unordered_set<std::string> used;
    used.reserve(raw.size() * 2);

    for (const auto& label : raw) {
        const std::string base = sanitizeName(label);
        std::string candidate = base;
        size_t suffix = 1;
        while (used.count(candidate)) {
            candidate = base + "_" + std::to_string(suffix++);
        }
        used.insert(candidate);
        out.push_back(std::move(candidate));
    }
    return out;
}

bool Sanitizer::isNullLike(std::string_view raw) {
    const std::string token = CommonUtils::toLower(CommonUtils::trim(raw));
    if (token.empty()) return true;
    for (const char* nullToken : kNullTokens) {
        if (token == nullToken) return true;
    }
    return false;
}
