#ifndef OMR_TEST_SYNTHETIC_SCAN_HPP
#define OMR_TEST_SYNTHETIC_SCAN_HPP

#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <omr/Units.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace omr_test {

namespace fs = std::filesystem;

// Ring-shaped registration mark, similar to the printed anchors.
inline cv::Mat makeMarkerTemplate() {
    cv::Mat m(80, 80, CV_8UC1, cv::Scalar(255));
    cv::circle(m, cv::Point(40, 40), 36, cv::Scalar(0), cv::FILLED, cv::LINE_AA);
    cv::circle(m, cv::Point(40, 40), 14, cv::Scalar(255), cv::FILLED, cv::LINE_AA);
    return m;
}

inline int markerSide(double dpi = 200.0) {
    return omr::pointsToPixels(20.0, dpi);
}

inline int anchorOffset(double dpi = 200.0) {
    return omr::pointsToPixels(30.0, dpi);
}

inline void pasteMarker(cv::Mat& page, const cv::Mat& tmpl, cv::Point center, int side) {
    cv::Mat resized;
    cv::resize(tmpl, resized, cv::Size(side, side));
    resized.copyTo(page(cv::Rect(center.x - side / 2, center.y - side / 2, side, side)));
}

// Markers at TL, TR, BL, BR anchor positions, each moved by `shift`.
inline void pasteAllMarkers(cv::Mat& page, const cv::Mat& tmpl, cv::Point shift = cv::Point(0, 0),
                            double dpi = 200.0) {
    const int off = anchorOffset(dpi);
    const int side = markerSide(dpi);
    const int w = page.cols;
    const int h = page.rows;
    pasteMarker(page, tmpl, cv::Point(off, off) + shift, side);
    pasteMarker(page, tmpl, cv::Point(w - off, off) + shift, side);
    pasteMarker(page, tmpl, cv::Point(off, h - off) + shift, side);
    pasteMarker(page, tmpl, cv::Point(w - off, h - off) + shift, side);
}

inline void addNoise(cv::Mat& page, uint64_t seed = 7, double sigma = 4.0) {
    cv::RNG rng(seed);
    cv::Mat noise(page.size(), CV_32F);
    rng.fill(noise, cv::RNG::NORMAL, 0.0, sigma);
    cv::Mat f;
    page.convertTo(f, CV_32F);
    f += noise;
    f.convertTo(page, CV_8U);
}

// Printed bubble outline, or a pencil-filled one.
inline void drawBubble(cv::Mat& page, double xPt, double yPt, bool filled, double dpi = 200.0) {
    cv::Point c(omr::pointsToPixels(xPt, dpi), omr::pointsToPixels(yPt, dpi));
    if (filled) cv::circle(page, c, 20, cv::Scalar(0), cv::FILLED);
    else cv::circle(page, c, 19, cv::Scalar(0), 2);
}

inline std::string readAll(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void writeText(const fs::path& p, const std::string& text) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary);
    out << text;
}

inline size_t countOccurrences(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) n++;
    return n;
}

// Scratch directory removed with the fixture.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = std::string("omr_") + (info ? info->name() : "test") + "_" +
                           std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                           "_" + std::to_string(counter++);
        path_ = fs::temp_directory_path() / name;
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

}

#endif
