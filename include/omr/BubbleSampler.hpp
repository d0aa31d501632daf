#ifndef OMR_BUBBLE_SAMPLER_HPP
#define OMR_BUBBLE_SAMPLER_HPP

#include <opencv2/core.hpp>
#include <vector>

#include "omr/BubbleLayout.hpp"
#include "omr/OmrConfig.hpp"
#include "omr/Units.hpp"

namespace omr {

struct BubbleReading {
    BubbleKey key;
    double meanIntensity = 255.0;
    cv::Rect box;   // clipped sample box, may be empty
};

class BubbleSampler {
public:
    explicit BubbleSampler(const OmrConfig& config);

    // Inscribed-square box of a bubble centred at (x, y) points, clipped to
    // `bounds`. Sampling inside the square keeps the printed outline out.
    cv::Rect sampleBox(double x, double y, const Dpi& dpi, const cv::Size& bounds) const;

    std::vector<BubbleReading> sample(const cv::Mat& gray,
                                      const std::vector<const BubbleSpec*>& bubbles,
                                      const Dpi& dpi) const;

private:
    OmrConfig config_;
};

}

#endif
