#ifndef OMR_PAGE_READER_HPP
#define OMR_PAGE_READER_HPP

#include <opencv2/core.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "omr/AnswerAssembler.hpp"
#include "omr/BubbleLayout.hpp"
#include "omr/BubbleSampler.hpp"
#include "omr/OverlayRenderer.hpp"
#include "omr/PerspectiveCorrector.hpp"
#include "omr/ThresholdEstimator.hpp"

namespace omr {

struct PageResult {
    std::string studentId;
    int page = 1;
    Dpi dpi;
    bool aligned = false;
    bool hasBubbles = false;     // layout defines bubbles for this page
    double threshold = 0.0;
    std::vector<BubbleReading> readings;
    StudentAnswers answers;
    cv::Mat overlay;             // BGR, always set for a loaded image
};

class PageReader {
public:
    // `layout` must outlive the reader.
    PageReader(const cv::Mat& markerTemplate, const BubbleLayout& layout, const OmrConfig& config);

    // Loads `imagePath` as grayscale and reads it as `page`. Returns nullopt
    // (after logging) when the file cannot be decoded.
    std::optional<PageResult> read(const std::filesystem::path& imagePath, int page) const;

    PageResult readImage(const cv::Mat& gray, const std::string& studentId,
                         int page, const Dpi& dpi) const;

    // 3x3 blur and min-max stretch against scan exposure differences.
    static cv::Mat preprocess(const cv::Mat& gray);

private:
    const BubbleLayout& layout_;
    OmrConfig config_;
    PerspectiveCorrector corrector_;
    BubbleSampler sampler_;
    ThresholdEstimator threshold_;
    AnswerAssembler assembler_;
    OverlayRenderer renderer_;
};

// "abc123_3_1.jpeg" -> "abc123"
std::string studentIdFromPath(const std::filesystem::path& imagePath);

}

#endif
