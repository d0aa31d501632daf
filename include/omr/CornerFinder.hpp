#pragma once
#include <opencv2/core.hpp>
#include <array>

#include "omr/OmrConfig.hpp"
#include "omr/Units.hpp"

namespace omr {

// Search-window order. Marker centres and their warp targets are always
// paired by this index.
enum Corner { TopLeft = 0, TopRight = 1, BottomLeft = 2, BottomRight = 3 };

const char* cornerName(int corner);

struct MarkerMatch {
    cv::Point2f center{-1, -1};
    double confidence = 0.0;
    cv::Rect window;
};

struct CornerResult {
    bool ok = false;
    int failedCorner = -1;
    std::array<MarkerMatch, 4> markers{};
};

class CornerFinder {
public:
    CornerFinder(const cv::Mat& markerTemplate, const OmrConfig& config);

    // Finds the four registration marks of a grayscale page. Stops at the
    // first corner whose best score is below the confidence limit.
    CornerResult find(const cv::Mat& gray, const Dpi& dpi) const;

    // Template resized to the marker diameter at `dpi`, blurred and stretched.
    cv::Mat scaledTemplate(const Dpi& dpi) const;

    static std::array<cv::Rect, 4> searchWindows(const cv::Size& imageSize);

private:
    cv::Mat template_;
    OmrConfig config_;
};

}
