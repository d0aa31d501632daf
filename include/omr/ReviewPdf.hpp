#ifndef OMR_REVIEW_PDF_HPP
#define OMR_REVIEW_PDF_HPP

#include <opencv2/core.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace omr {

// Multi-page PDF of JPEG-compressed page images, one image filling each page,
// for human review of detected marks.
class ReviewPdf {
public:
    explicit ReviewPdf(double resolution = 100.0, int jpegQuality = 90);

    // 8-bit gray or BGR. Returns false if the image cannot be encoded.
    bool addPage(const cv::Mat& image);

    size_t pageCount() const { return pages_.size(); }

    std::string serialize() const;
    bool save(const std::filesystem::path& path) const;

private:
    struct Page {
        std::vector<uchar> jpeg;
        int width = 0;
        int height = 0;
        bool color = true;
    };

    double resolution_;
    int jpegQuality_;
    std::vector<Page> pages_;
};

}

#endif
