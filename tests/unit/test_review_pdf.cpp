/**
 * @file test_review_pdf.cpp
 * @brief Unit tests for the review PDF writer
 */

#include <gtest/gtest.h>
#include <omr/ReviewPdf.hpp>

#include "SyntheticScan.hpp"

using namespace omr;
using omr_test::countOccurrences;

TEST(ReviewPdfTest, TwoPageDocumentStructure) {
    ReviewPdf pdf;
    ASSERT_TRUE(pdf.addPage(cv::Mat(100, 200, CV_8UC3, cv::Scalar(0, 0, 255))));
    ASSERT_TRUE(pdf.addPage(cv::Mat(100, 200, CV_8UC1, cv::Scalar(128))));
    EXPECT_EQ(pdf.pageCount(), 2u);

    const std::string bytes = pdf.serialize();
    EXPECT_EQ(bytes.rfind("%PDF-1.4\n", 0), 0u);
    EXPECT_EQ(countOccurrences(bytes, "/Type /Page /Parent 2 0 R"), 2u);
    EXPECT_NE(bytes.find("/Kids [3 0 R 6 0 R] /Count 2"), std::string::npos);
    EXPECT_NE(bytes.find("/MediaBox [0 0 144.00 72.00]"), std::string::npos);
    EXPECT_EQ(countOccurrences(bytes, "/Filter /DCTDecode"), 2u);
    EXPECT_EQ(countOccurrences(bytes, "/DeviceRGB"), 1u);
    EXPECT_EQ(countOccurrences(bytes, "/DeviceGray"), 1u);
    EXPECT_NE(bytes.find("trailer\n<< /Size 9 /Root 1 0 R >>"), std::string::npos);

    const std::string eof = "%%EOF\n";
    ASSERT_GE(bytes.size(), eof.size());
    EXPECT_EQ(bytes.substr(bytes.size() - eof.size()), eof);
}

TEST(ReviewPdfTest, XrefOffsetsPointAtObjects) {
    ReviewPdf pdf;
    ASSERT_TRUE(pdf.addPage(cv::Mat(50, 40, CV_8UC1, cv::Scalar(10))));
    const std::string bytes = pdf.serialize();

    size_t xref = bytes.find("xref\n0 6\n");
    ASSERT_NE(xref, std::string::npos);
    size_t line = bytes.find('\n', bytes.find("65535 f \n", xref)) + 1;
    for (int id = 1; id < 6; ++id, line += 20) {
        size_t offset = std::stoul(bytes.substr(line, 10));
        EXPECT_EQ(bytes.compare(offset, std::to_string(id).size() + 6, std::to_string(id) + " 0 obj"), 0)
            << "object " << id;
    }
}

TEST(ReviewPdfTest, SaveWritesFile) {
    omr_test::TempDir dir;
    ReviewPdf pdf(100.0, 80);
    ASSERT_TRUE(pdf.addPage(cv::Mat(60, 60, CV_8UC3, cv::Scalar(255, 255, 255))));

    auto path = dir.path() / "review.pdf";
    ASSERT_TRUE(pdf.save(path));
    EXPECT_EQ(omr_test::readAll(path), pdf.serialize());
}

TEST(ReviewPdfTest, RejectsUnusablePages) {
    ReviewPdf pdf;
    EXPECT_FALSE(pdf.addPage(cv::Mat()));
    EXPECT_FALSE(pdf.addPage(cv::Mat(10, 10, CV_32FC1, cv::Scalar(0.5))));
    EXPECT_FALSE(pdf.addPage(cv::Mat(10, 10, CV_8UC4, cv::Scalar(0, 0, 0, 0))));
    EXPECT_EQ(pdf.pageCount(), 0u);

    omr_test::TempDir dir;
    EXPECT_FALSE(pdf.save(dir.path() / "empty.pdf"));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "empty.pdf"));
}
