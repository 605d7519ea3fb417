#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

struct ColumnStats {
    size_t count = 0;
    double mean = 0.0;
    double median = 0.0;
    double stddev = 0.0;
    double min = 0.0;
    double max = 0.0;
};

namespace Statistics {
/**
 * @brief Summary of the finite entries of col (non-finite entries are ignored).
 * @details Values are divided by the largest magnitude before accumulating so that
 * inputs near DBL_MAX still yield a finite mean and sample standard deviation.
 * @post count == 0 leaves every other field at 0.
 */
ColumnStats calculateStats(const std::vector<double>& col);

/**
 * @brief Flags entries whose |z| exceeds zThreshold using the sample standard deviation.
 * @pre every entry of values is finite.
 * @post Nothing is flagged when stddev is zero or fewer than three values are given.
 */
std::vector<bool> detectOutliersZ(const std::vector<double>& values, double zThreshold);

/**
 * @brief Pearson coefficient over rows where both columns are present and finite.
 * @return std::nullopt when fewer than two complete pairs exist, either side has zero
 * variance, or the coefficient is not finite.
 */
std::optional<double> pearson(const std::vector<double>& x, const std::vector<uint8_t>& missingX,
                              const std::vector<double>& y, const std::vector<uint8_t>& missingY);
} // namespace Statistics
