#ifndef OMR_THRESHOLD_ESTIMATOR_HPP
#define OMR_THRESHOLD_ESTIMATOR_HPP

#include <vector>

#include "omr/BubbleSampler.hpp"
#include "omr/OmrConfig.hpp"

namespace omr {

class ThresholdEstimator {
public:
    explicit ThresholdEstimator(const OmrConfig& config);

    // Cut point between marked (dark) and unmarked (light) intensities of one
    // page: the middle of the widest gap larger than minJump, otherwise the
    // mean. Never above globalThreshold.
    double estimate(std::vector<double> values) const;

    // Same, over a page's readings with decimal/slash sentinels left out.
    // A page holding only sentinels gets globalThreshold.
    double estimate(const std::vector<BubbleReading>& readings) const;

    bool isMarked(double intensity, double threshold) const {
        return intensity < threshold && intensity < config_.globalThreshold;
    }

private:
    OmrConfig config_;
};

}

#endif
