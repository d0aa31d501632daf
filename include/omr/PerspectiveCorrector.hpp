#pragma once
#include <opencv2/core.hpp>
#include <array>
#include <string>

#include "omr/CornerFinder.hpp"

namespace omr {

struct WarpResult {
    bool ok = false;
    cv::Mat warped;                        // aligned page, or the input when !ok
    cv::Mat homography;                    // 3x3 CV_64F, empty when !ok
    std::array<cv::Point2f, 4> corners{};  // detected centres, search-window order
    std::array<cv::Point2f, 4> targets{};
    std::string failure;
};

class PerspectiveCorrector {
public:
    PerspectiveCorrector(const cv::Mat& markerTemplate, const OmrConfig& config);

    // Warps `gray` so its markers land on the canonical anchor positions.
    // Failure is not fatal: the unaligned page comes back with ok == false.
    WarpResult align(const cv::Mat& gray, const Dpi& dpi) const;

    // Anchor centres `offset` pixels in from each edge, TL, TR, BL, BR.
    static std::array<cv::Point2f, 4> canonicalTargets(const cv::Size& size, int offset);

    // TL/TR/BL/BR must form a convex quadrilateral in reading order.
    static bool cornersConsistent(const std::array<cv::Point2f, 4>& c);

private:
    OmrConfig config_;
    CornerFinder finder_;
};

}
