#include "omr/BatchRunner.hpp"
#include "omr/Errors.hpp"
#include "omr/ReviewPdf.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <system_error>

namespace fs = std::filesystem;

namespace omr {

namespace {

void requireFile(const fs::path& p, const std::string& what) {
    if (!fs::is_regular_file(p)) throw InputError(what + " not found: " + p.string());
}

void requireCsv(const fs::path& p, const std::string& what) {
    if (!fs::is_regular_file(p) || p.extension() != ".csv") {
        throw InputError(what + " is not a valid CSV: " + p.string());
    }
}

void requireDirectory(const fs::path& p, const std::string& what) {
    if (!fs::is_directory(p)) throw InputError(what + " is not a valid directory: " + p.string());
}

fs::path pageFolder(const fs::path& outputDir, const std::string& label) {
    return outputDir / ("page_" + label);
}

}

std::string formatIntensity(double value) {
    return fmt::format("{}", value);
}

void PageTable::set(const std::string& studentId, const std::string& column, double value) {
    auto col = columnIndex_.find(column);
    if (col == columnIndex_.end()) {
        col = columnIndex_.emplace(column, columns_.size()).first;
        columns_.push_back(column);
    }
    auto row = values_.find(studentId);
    if (row == values_.end()) {
        row = values_.emplace(studentId, std::map<size_t, double>()).first;
        students_.push_back(studentId);
    }
    row->second[col->second] = value;
}

csv::Row PageTable::header() const {
    csv::Row h = {"student_id"};
    h.insert(h.end(), columns_.begin(), columns_.end());
    return h;
}

std::vector<csv::Row> PageTable::rows() const {
    std::vector<csv::Row> out;
    out.reserve(students_.size());
    for (const auto& id : students_) {
        const auto& vals = values_.at(id);
        csv::Row r = {id};
        for (size_t c = 0; c < columns_.size(); ++c) {
            auto it = vals.find(c);
            r.push_back(it == vals.end() ? std::string() : formatIntensity(it->second));
        }
        out.push_back(std::move(r));
    }
    return out;
}

BatchRunner::BatchRunner(const OmrConfig& config)
    : config_(config) {}

fs::path BatchRunner::outputFolderFor(const fs::path& parsedFolder) {
    fs::path p = parsedFolder.lexically_normal();
    if (p.filename().empty()) p = p.parent_path();
    return p.parent_path() / (p.filename().string() + "_OMR");
}

cv::Mat BatchRunner::cropForReview(const cv::Mat& page) const {
    cv::Mat bgr;
    if (page.channels() == 1) cv::cvtColor(page, bgr, cv::COLOR_GRAY2BGR);
    else bgr = page;
    int crop = static_cast<int>(bgr.rows * config_.topCropFraction);
    return bgr.rowRange(crop, bgr.rows).clone();
}

bool BatchRunner::writeConsolidated(const StudentAnswerTable& table, const fs::path& path) {
    const std::vector<std::string> questions = table.sortedQuestions();

    csv::Row header = {"student_id"};
    header.insert(header.end(), questions.begin(), questions.end());

    std::vector<csv::Row> rows;
    for (const auto& entry : table.rows()) {
        csv::Row r = {entry.first};
        for (const auto& q : questions) r.push_back(table.cell(entry.first, q));
        rows.push_back(std::move(r));
    }
    return csv::writeFile(path, header, rows);
}

void BatchRunner::processPage(const PageGroup& group,
                              const PageReader& reader,
                              const fs::path& outputDir,
                              PageTable& intensities,
                              StudentAnswerTable& answers,
                              BatchSummary& summary) const {
    spdlog::info("Processing {} images in {}", group.imageCount, group.directory.string());

    const fs::path pageDir = pageFolder(outputDir, group.label);
    std::error_code ec;
    fs::create_directories(pageDir, ec);
    const bool canWrite = !ec;
    if (!canWrite) {
        spdlog::error("Could not create {}: {}; review PDFs of this page are skipped",
                      pageDir.string(), ec.message());
    }

    for (const StudentScan& scan : group.students) {
        std::optional<PageResult> result = reader.read(scan.files.front(), group.pageNumber);
        if (!result) {
            summary.scansFailed++;
            continue;
        }
        summary.scansRead++;

        if (result->hasBubbles) {
            for (const auto& r : result->readings) {
                if (!r.key.isSeparator()) intensities.set(scan.studentId, r.key.columnName(), r.meanIntensity);
            }
            intensities.set(scan.studentId, fmt::format("page{}_threshold", group.pageNumber), result->threshold);
            answers.merge(scan.studentId, result->answers);
        }
        if (!canWrite) continue;

        ReviewPdf pdf(config_.reviewResolution, config_.reviewJpegQuality);
        if (!pdf.addPage(cropForReview(result->overlay))) {
            spdlog::error("Could not encode overlay of {}", scan.files.front().string());
        }
        for (size_t i = 1; i < scan.files.size(); ++i) {
            cv::Mat extra = cv::imread(scan.files[i].string(), cv::IMREAD_GRAYSCALE);
            if (extra.empty()) {
                spdlog::warn("Could not load replacement page {}", scan.files[i].string());
                continue;
            }
            if (!pdf.addPage(cropForReview(extra))) {
                spdlog::warn("Could not encode replacement page {}", scan.files[i].string());
            }
        }

        const fs::path pdfPath = pageDir / (scan.studentId + "_" + group.label + ".pdf");
        if (!pdf.save(pdfPath)) spdlog::error("Could not write review PDF {}", pdfPath.string());
    }
}

BatchSummary BatchRunner::run(const fs::path& markerPath,
                              const fs::path& bubblesCsv,
                              const fs::path& parsedFolder) const {
    requireFile(markerPath, "OMR marker file");
    requireCsv(bubblesCsv, "Bubbles CSV file");
    requireDirectory(parsedFolder, "Parsed folder");

    cv::Mat marker = cv::imread(markerPath.string(), cv::IMREAD_GRAYSCALE);
    if (marker.empty()) throw InputError("OMR marker file is not a readable image: " + markerPath.string());

    const BubbleLayout layout = BubbleLayout::fromCsv(bubblesCsv);
    const PageReader reader(marker, layout, config_);

    BatchSummary summary;
    summary.outputDir = outputFolderFor(parsedFolder);
    fs::create_directories(summary.outputDir);

    // Page folders that share a label (one per room, say) land in one table.
    std::vector<std::string> labels;
    std::map<std::string, PageTable> tables;
    StudentAnswerTable answers;

    for (const PageGroup& group : discoverPages(parsedFolder)) {
        summary.pageGroups++;
        summary.images += group.imageCount;
        if (tables.find(group.label) == tables.end()) labels.push_back(group.label);
        processPage(group, reader, summary.outputDir, tables[group.label], answers, summary);
    }

    for (const auto& label : labels) {
        const PageTable& t = tables.at(label);
        std::error_code ec;
        if (!fs::is_directory(pageFolder(summary.outputDir, label), ec)) {
            spdlog::error("Skipping intensity table of page {}: no output folder", label);
            continue;
        }
        const fs::path path = pageFolder(summary.outputDir, label) / (label + "_OMR.csv");
        if (!csv::writeFile(path, t.header(), t.rows())) spdlog::error("Could not write {}", path.string());
    }

    summary.students = answers.size();
    if (answers.empty()) {
        spdlog::warn("No student answers to consolidate");
        return summary;
    }

    const fs::path consolidated = summary.outputDir / "consolidated_answers.csv";
    if (writeConsolidated(answers, consolidated)) {
        summary.consolidatedCsv = consolidated;
        spdlog::info("Saved consolidated answers to: {}", consolidated.string());
        spdlog::info("Total students processed: {}", answers.size());
    } else {
        spdlog::error("Could not write {}", consolidated.string());
    }
    return summary;
}

}
