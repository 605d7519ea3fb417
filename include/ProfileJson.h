#pragma once

#include "Profile.h"

#include <string>

namespace ProfileJson {
std::string escapeJsonString(const std::string& input);

/**
 * @brief Serializes the profile with snake_case keys. Non-finite numbers become null.
 * @details Optional summaries are emitted as null when absent.
 */
std::string toJson(const DatasetProfile& profile);

/**
 * @throws Tabsight::IOException when the file cannot be written.
 */
void save(const DatasetProfile& profile, const std::string& path);
} // namespace ProfileJson
