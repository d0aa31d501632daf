#include "omr/ThresholdEstimator.hpp"

#include <algorithm>
#include <numeric>

namespace omr {

ThresholdEstimator::ThresholdEstimator(const OmrConfig& config)
    : config_(config) {}

double ThresholdEstimator::estimate(std::vector<double> values) const {
    const double fallback = std::min(config_.defaultThreshold, config_.globalThreshold);
    if (values.empty()) return fallback;

    std::sort(values.begin(), values.end());

    double maxGap = 0.0;
    double threshold = fallback;
    for (size_t i = 1; i < values.size(); ++i) {
        double gap = values[i] - values[i - 1];
        if (gap > config_.minJump && gap > maxGap) {
            maxGap = gap;
            threshold = (values[i] + values[i - 1]) / 2.0;
        }
    }

    if (maxGap == 0.0) {
        threshold = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    }

    return std::min(threshold, config_.globalThreshold);
}

double ThresholdEstimator::estimate(const std::vector<BubbleReading>& readings) const {
    std::vector<double> values;
    values.reserve(readings.size());
    for (const auto& r : readings) {
        if (!r.key.isSeparator()) values.push_back(r.meanIntensity);
    }
    if (values.empty()) return config_.globalThreshold;
    return estimate(std::move(values));
}

}
