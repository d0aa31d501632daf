#ifndef OMR_BATCH_RUNNER_HPP
#define OMR_BATCH_RUNNER_HPP

#include <opencv2/core.hpp>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "omr/AnswerAssembler.hpp"
#include "omr/Csv.hpp"
#include "omr/OmrConfig.hpp"
#include "omr/PageReader.hpp"
#include "omr/ScanDiscovery.hpp"

namespace omr {

// Bubble intensities of one page label, one row per student. Rows and
// columns keep first-seen order; unset cells are written empty.
class PageTable {
public:
    void set(const std::string& studentId, const std::string& column, double value);

    bool empty() const { return students_.empty(); }
    const std::vector<std::string>& columns() const { return columns_; }
    const std::vector<std::string>& students() const { return students_; }

    csv::Row header() const;
    std::vector<csv::Row> rows() const;

private:
    std::vector<std::string> columns_;
    std::map<std::string, size_t> columnIndex_;
    std::vector<std::string> students_;
    std::map<std::string, std::map<size_t, double>> values_;
};

struct BatchSummary {
    std::filesystem::path outputDir;
    std::filesystem::path consolidatedCsv;   // empty when no student was read
    size_t pageGroups = 0;
    size_t images = 0;
    size_t scansRead = 0;
    size_t scansFailed = 0;
    size_t students = 0;
};

class BatchRunner {
public:
    explicit BatchRunner(const OmrConfig& config);

    // Reads every scan under `parsedFolder` and writes the results next to it
    // in "<parsedFolder>_OMR". Throws InputError / LayoutError for unusable
    // inputs; individual bad scans are logged and skipped.
    BatchSummary run(const std::filesystem::path& markerPath,
                     const std::filesystem::path& bubblesCsv,
                     const std::filesystem::path& parsedFolder) const;

    static std::filesystem::path outputFolderFor(const std::filesystem::path& parsedFolder);

    // Drops the top `topCropFraction` rows (exam header) and converts to BGR.
    cv::Mat cropForReview(const cv::Mat& page) const;

    static bool writeConsolidated(const StudentAnswerTable& table, const std::filesystem::path& path);

private:
    void processPage(const PageGroup& group,
                     const PageReader& reader,
                     const std::filesystem::path& outputDir,
                     PageTable& intensities,
                     StudentAnswerTable& answers,
                     BatchSummary& summary) const;

    OmrConfig config_;
};

std::string formatIntensity(double value);

}

#endif
