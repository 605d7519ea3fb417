#include "Statistics.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace {
constexpr double kNumericEpsilon = 1e-12;

double maxAbs(const std::vector<double>& values) {
    double out = 0.0;
    for (double v : values) out = std::max(out, std::abs(v));
    return out;
}

struct ScaledMoments {
    double mean = 0.0;
    double stddev = 0.0;
};

// Welford over values / scale.
ScaledMoments scaledMoments(const std::vector<double>& values, double scale) {
    ScaledMoments out;
    double m2 = 0.0;
    size_t count = 0;
    for (double value : values) {
        const double v = value / scale;
        ++count;
        const double delta = v - out.mean;
        out.mean += delta / static_cast<double>(count);
        m2 += delta * (v - out.mean);
    }
    out.stddev = (count > 1) ? std::sqrt(std::max(0.0, m2 / static_cast<double>(count - 1))) : 0.0;
    return out;
}
} // namespace

ColumnStats Statistics::calculateStats(const std::vector<double>& col) {
    ColumnStats stats;

    std::vector<double> finite;
    finite.reserve(col.size());
    for (double value : col) {
        if (std::isfinite(value)) finite.push_back(value);
    }
    if (finite.empty()) return stats;

    stats.count = finite.size();
    const auto [minIt, maxIt] = std::minmax_element(finite.begin(), finite.end());
    stats.min = *minIt;
    stats.max = *maxIt;

    const double scale = std::max(maxAbs(finite), kNumericEpsilon);
    const ScaledMoments moments = scaledMoments(finite, scale);
    stats.mean = moments.mean * scale;
    stats.stddev = moments.stddev * scale;
    stats.median = CommonUtils::medianByNth(std::move(finite));
    return stats;
}

std::vector<bool> Statistics::detectOutliersZ(const std::vector<double>& values, double zThreshold) {
    std::vector<bool> flags(values.size(), false);
    if (values.size() < 3) return flags;

    // z is scale-invariant, so work entirely in scaled units.
    const double scale = maxAbs(values);
    if (scale <= 0.0) return flags;
    const ScaledMoments moments = scaledMoments(values, scale);
    if (moments.stddev <= kNumericEpsilon) return flags;

    for (size_t i = 0; i < values.size(); ++i) {
        const double z = std::abs((values[i] / scale - moments.mean) / moments.stddev);
        flags[i] = z > zThreshold;
    }
    return flags;
}

std::optional<double> Statistics::pearson(const std::vector<double>& x, const std::vector<uint8_t>& missingX,
                                          const std::vector<double>& y, const std::vector<uint8_t>& missingY) {
    const size_t n = std::min({x.size(), y.size(), missingX.size(), missingY.size()});
    std::vector<double> xs;
    std::vector<double> ys;
    xs.reserve(n);
    ys.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (missingX[i] || missingY[i]) continue;
        if (!std::isfinite(x[i]) || !std::isfinite(y[i])) continue;
        xs.push_back(x[i]);
        ys.push_back(y[i]);
    }
    if (xs.size() < 2) return std::nullopt;

    const double scaleX = maxAbs(xs);
    const double scaleY = maxAbs(ys);
    if (scaleX <= 0.0 || scaleY <= 0.0) return std::nullopt;
    for (double& v : xs) v /= scaleX;
    for (double& v : ys) v /= scaleY;

    const double meanX = std::accumulate(xs.begin(), xs.end(), 0.0) / static_cast<double>(xs.size());
    const double meanY = std::accumulate(ys.begin(), ys.end(), 0.0) / static_cast<double>(ys.size());

    double sxx = 0.0;
    double syy = 0.0;
    double sxy = 0.0;
    for (size_t i = 0; i < xs.size(); ++i) {
        const double dx = xs[i] - meanX;
        const double dy = ys[i] - meanY;
        sxx += dx * dx;
        syy += dy * dy;
        sxy += dx * dy;
    }
    if (sxx <= kNumericEpsilon * kNumericEpsilon || syy <= kNumericEpsilon * kNumericEpsilon) return std::nullopt;

    const double r = sxy / std::sqrt(sxx * syy);
    if (!std::isfinite(r)) return std::nullopt;
    return std::clamp(r, -1.0, 1.0);
}
