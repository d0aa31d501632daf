#include "omr/CornerFinder.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

using namespace cv;

namespace omr {

const char* cornerName(int corner) {
    switch (corner) {
    case TopLeft: return "top-left";
    case TopRight: return "top-right";
    case BottomLeft: return "bottom-left";
    case BottomRight: return "bottom-right";
    default: return "unknown";
    }
}

CornerFinder::CornerFinder(const Mat& markerTemplate, const OmrConfig& config)
    : template_(markerTemplate), config_(config) {
    CV_Assert(!template_.empty() && template_.channels() == 1);
}

Mat CornerFinder::scaledTemplate(const Dpi& dpi) const {
    int side = pointsToPixels(config_.anchorRadius * 2, dpi.x);
    if (side <= 0) return Mat();
    Mat marker;
    resize(template_, marker, Size(side, side));
    GaussianBlur(marker, marker, Size(3, 3), 0);
    normalize(marker, marker, 0, 255, NORM_MINMAX);
    return marker;
}

std::array<Rect, 4> CornerFinder::searchWindows(const Size& imageSize) {
    const int w = imageSize.width;
    const int h = imageSize.height;
    const int m = w / 4;
    // Small windows hugging the real corners keep page content out of the match.
    return {{
        Rect(0, 0, m, m),
        Rect(w - m, 0, m, m),
        Rect(0, h - m, m, m),
        Rect(w - m, h - m, m, m)
    }};
}

CornerResult CornerFinder::find(const Mat& gray, const Dpi& dpi) const {
    CornerResult R;
    if (gray.empty()) return R;

    Mat marker = scaledTemplate(dpi);
    if (marker.empty()) {
        spdlog::warn("Marker template collapses to zero size at {} dpi", dpi.x);
        return R;
    }

    const Rect page(0, 0, gray.cols, gray.rows);
    const auto windows = searchWindows(gray.size());
    for (int i = 0; i < 4; ++i) {
        Rect win = windows[i] & page;
        MarkerMatch& m = R.markers[i];
        m.window = win;

        if (win.width < marker.cols || win.height < marker.rows) {
            spdlog::warn("Marker {} ({}) search window {}x{} is smaller than the {}px marker",
                         i + 1, cornerName(i), win.width, win.height, marker.cols);
            R.failedCorner = i;
            return R;
        }

        Mat score;
        matchTemplate(gray(win), marker, score, TM_CCOEFF_NORMED);
        double maxVal = 0.0;
        Point maxLoc;
        minMaxLoc(score, nullptr, &maxVal, nullptr, &maxLoc);
        m.confidence = maxVal;

        if (maxVal < config_.markerConfidence) {
            spdlog::warn("Marker {} ({}) confidence too low ({:.3f})", i + 1, cornerName(i), maxVal);
            R.failedCorner = i;
            return R;
        }

        m.center = Point2f(static_cast<float>(win.x + maxLoc.x + marker.cols / 2),
                           static_cast<float>(win.y + maxLoc.y + marker.rows / 2));
        spdlog::debug("Marker {} ({}) at ({}, {}) confidence {:.3f}",
                      i + 1, cornerName(i), m.center.x, m.center.y, maxVal);
    }

    R.ok = true;
    return R;
}

}
