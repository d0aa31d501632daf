#include "omr/OverlayRenderer.hpp"

#include <opencv2/imgproc.hpp>

namespace omr {

OverlayRenderer::OverlayRenderer(const OmrConfig& config)
    : config_(config), threshold_(config) {}

cv::Mat OverlayRenderer::render(const cv::Mat& gray,
                                const std::vector<BubbleReading>& readings,
                                double threshold) const {
    cv::Mat overlay;
    if (gray.empty()) return overlay;
    if (gray.channels() == 1) cv::cvtColor(gray, overlay, cv::COLOR_GRAY2BGR);
    else overlay = gray.clone();

    for (const auto& r : readings) {
        const cv::Rect& box = r.box;
        if (r.key.isSeparator()) {
            cv::Point c(box.x + box.width / 2, box.y + box.height / 2);
            cv::circle(overlay, c, 5, config_.separatorColor, 2);
            cv::circle(overlay, c, 2, config_.separatorColor, cv::FILLED);
            continue;
        }
        bool marked = threshold_.isMarked(r.meanIntensity, threshold);
        cv::rectangle(overlay, box.tl(), box.br(), marked ? config_.markedColor : config_.unmarkedColor, 2);
    }
    return overlay;
}

}
