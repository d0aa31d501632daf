#include "omr/BubbleSampler.hpp"

#include <algorithm>
#include <cmath>

namespace omr {

BubbleSampler::BubbleSampler(const OmrConfig& config)
    : config_(config) {}

cv::Rect BubbleSampler::sampleBox(double x, double y, const Dpi& dpi, const cv::Size& bounds) const {
    const double half = config_.bubbleRadius / std::sqrt(2.0);

    int left = std::max(0, pointsToPixels(x - half, dpi.x));
    int top = std::max(0, pointsToPixels(y - half, dpi.y));
    int right = std::min(bounds.width, pointsToPixels(x + half, dpi.x));
    int bottom = std::min(bounds.height, pointsToPixels(y + half, dpi.y));

    return cv::Rect(left, top, std::max(0, right - left), std::max(0, bottom - top));
}

std::vector<BubbleReading> BubbleSampler::sample(const cv::Mat& gray,
                                                 const std::vector<const BubbleSpec*>& bubbles,
                                                 const Dpi& dpi) const {
    CV_Assert(gray.empty() || gray.channels() == 1);

    std::vector<BubbleReading> out;
    out.reserve(bubbles.size());

    for (const BubbleSpec* b : bubbles) {
        BubbleReading r;
        r.key = b->key;
        r.box = sampleBox(b->x, b->y, dpi, gray.size());

        if (r.key.isSeparator()) {
            // No printed bubble behind a decimal point or slash.
            r.meanIntensity = config_.separatorIntensity;
        } else if (r.box.area() > 0) {
            r.meanIntensity = cv::mean(gray(r.box))[0];
        } else {
            r.meanIntensity = config_.emptyBoxIntensity;
        }
        out.push_back(std::move(r));
    }
    return out;
}

}
