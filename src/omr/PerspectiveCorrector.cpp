#include "omr/PerspectiveCorrector.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include <vector>

using namespace cv;

namespace omr {

PerspectiveCorrector::PerspectiveCorrector(const Mat& markerTemplate, const OmrConfig& config)
    : config_(config), finder_(markerTemplate, config) {}

std::array<Point2f, 4> PerspectiveCorrector::canonicalTargets(const Size& size, int offset) {
    const float w = static_cast<float>(size.width);
    const float h = static_cast<float>(size.height);
    const float o = static_cast<float>(offset);
    return {{ {o, o}, {w - o, o}, {o, h - o}, {w - o, h - o} }};
}

bool PerspectiveCorrector::cornersConsistent(const std::array<Point2f, 4>& c) {
    if (!(c[TopLeft].x < c[TopRight].x && c[BottomLeft].x < c[BottomRight].x)) return false;
    if (!(c[TopLeft].y < c[BottomLeft].y && c[TopRight].y < c[BottomRight].y)) return false;

    std::vector<Point2f> quad = {c[TopLeft], c[TopRight], c[BottomRight], c[BottomLeft]};
    return isContourConvex(quad);
}

WarpResult PerspectiveCorrector::align(const Mat& gray, const Dpi& dpi) const {
    WarpResult R;
    R.warped = gray;
    if (gray.empty()) {
        R.failure = "empty image";
        return R;
    }

    CornerResult C = finder_.find(gray, dpi);
    if (!C.ok) {
        R.failure = C.failedCorner >= 0
            ? std::string("marker not found in ") + cornerName(C.failedCorner) + " corner"
            : std::string("marker template unusable");
        return R;
    }
    for (int i = 0; i < 4; ++i) R.corners[i] = C.markers[i].center;

    if (!cornersConsistent(R.corners)) {
        spdlog::error("Marker centres TL({},{}) TR({},{}) BL({},{}) BR({},{}) do not form an upright "
                      "quadrilateral, page left unaligned",
                      R.corners[0].x, R.corners[0].y, R.corners[1].x, R.corners[1].y,
                      R.corners[2].x, R.corners[2].y, R.corners[3].x, R.corners[3].y);
        R.failure = "inconsistent marker geometry";
        return R;
    }

    R.targets = canonicalTargets(gray.size(), pointsToPixels(config_.anchorDistance, dpi.x));

    std::vector<Point2f> src(R.corners.begin(), R.corners.end());
    std::vector<Point2f> dst(R.targets.begin(), R.targets.end());
    R.homography = getPerspectiveTransform(src, dst);

    Mat aligned;
    warpPerspective(gray, aligned, R.homography, gray.size());
    R.warped = aligned;
    R.ok = true;
    return R;
}

}
