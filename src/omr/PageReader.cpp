#include "omr/PageReader.hpp"
#include "omr/ImageDpi.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

namespace omr {

std::string studentIdFromPath(const std::filesystem::path& imagePath) {
    std::string stem = imagePath.stem().string();
    return stem.substr(0, stem.find('_'));
}

PageReader::PageReader(const cv::Mat& markerTemplate, const BubbleLayout& layout, const OmrConfig& config)
    : layout_(layout),
      config_(config),
      corrector_(markerTemplate, config),
      sampler_(config),
      threshold_(config),
      assembler_(config),
      renderer_(config) {}

cv::Mat PageReader::preprocess(const cv::Mat& gray) {
    cv::Mat out;
    cv::GaussianBlur(gray, out, cv::Size(3, 3), 0);
    cv::normalize(out, out, 0, 255, cv::NORM_MINMAX);
    return out;
}

std::optional<PageResult> PageReader::read(const std::filesystem::path& imagePath, int page) const {
    cv::Mat gray = cv::imread(imagePath.string(), cv::IMREAD_GRAYSCALE);
    if (gray.empty()) {
        spdlog::error("Could not load image {}", imagePath.string());
        return std::nullopt;
    }
    Dpi dpi = readImageDpi(imagePath, Dpi{config_.defaultDpi, config_.defaultDpi});
    spdlog::debug("{}: {}x{} px at {}x{} dpi", imagePath.filename().string(),
                  gray.cols, gray.rows, dpi.x, dpi.y);
    return readImage(gray, studentIdFromPath(imagePath), page, dpi);
}

PageResult PageReader::readImage(const cv::Mat& gray, const std::string& studentId,
                                 int page, const Dpi& dpi) const {
    CV_Assert(!gray.empty() && gray.channels() == 1);

    PageResult R;
    R.studentId = studentId;
    R.page = page;
    R.dpi = dpi;

    WarpResult W = corrector_.align(preprocess(gray), dpi);
    R.aligned = W.ok;
    if (!W.ok) spdlog::warn("Student {} page {}: {}, reading unaligned", studentId, page, W.failure);

    std::vector<const BubbleSpec*> bubbles = layout_.forPage(page);
    if (bubbles.empty()) {
        spdlog::warn("No bubbles defined for page {}", page);
        cv::cvtColor(W.warped, R.overlay, cv::COLOR_GRAY2BGR);
        return R;
    }
    R.hasBubbles = true;

    R.readings = sampler_.sample(W.warped, bubbles, dpi);
    R.threshold = threshold_.estimate(R.readings);
    spdlog::debug("Student {} page {}: threshold {:.2f}", studentId, page, R.threshold);

    R.answers = assembler_.assemble(R.readings, R.threshold, layout_);
    R.overlay = renderer_.render(W.warped, R.readings, R.threshold);
    return R;
}

}
