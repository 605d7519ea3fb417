#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace Sanitizer {
// Canonical identifier rules shared by the cleaner and the profile output.
// Pure functions; applying them to their own output is a no-op.

/**
 * @brief Trims, lower-cases and maps every character other than [a-z0-9_] to '_'.
 * @post Result is non-empty and never starts with a digit ("col_" prefix, "unnamed_column" fallback).
 */
std::string sanitizeName(std::string_view raw);

/**
 * @brief Sanitizes a batch of labels and resolves collisions in encounter order.
 * @details Repeated names get "_1", "_2", ... appended, skipping any suffix already taken.
 * @post out.size() == raw.size() and all entries are unique.
 */
std::vector<std::string> sanitizeNames(const std::vector<std::string>& raw);

// True for "", null, none, n/a, na, nil, undefined, empty, missing, unknown, nan (case-insensitive, trimmed).
bool isNullLike(std::string_view raw);
} // namespace Sanitizer
