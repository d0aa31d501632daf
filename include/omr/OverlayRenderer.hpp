#ifndef OMR_OVERLAY_RENDERER_HPP
#define OMR_OVERLAY_RENDERER_HPP

#include <opencv2/core.hpp>
#include <vector>

#include "omr/BubbleSampler.hpp"
#include "omr/OmrConfig.hpp"
#include "omr/ThresholdEstimator.hpp"

namespace omr {

class OverlayRenderer {
public:
    explicit OverlayRenderer(const OmrConfig& config);

    // BGR copy of the aligned page with one box per sampled bubble, coloured by
    // the same marked test the assembler uses. Decimal/slash positions get a
    // ring and dot instead.
    cv::Mat render(const cv::Mat& gray,
                   const std::vector<BubbleReading>& readings,
                   double threshold) const;

private:
    OmrConfig config_;
    ThresholdEstimator threshold_;
};

}

#endif
