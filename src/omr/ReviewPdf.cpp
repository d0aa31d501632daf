#include "omr/ReviewPdf.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace omr {

ReviewPdf::ReviewPdf(double resolution, int jpegQuality)
    : resolution_(resolution), jpegQuality_(jpegQuality) {}

bool ReviewPdf::addPage(const cv::Mat& image) {
    if (image.empty() || image.depth() != CV_8U) return false;
    if (image.channels() != 1 && image.channels() != 3) return false;

    Page p;
    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, jpegQuality_};
    if (!cv::imencode(".jpg", image, p.jpeg, params)) return false;
    p.width = image.cols;
    p.height = image.rows;
    p.color = image.channels() == 3;
    pages_.push_back(std::move(p));
    return true;
}

std::string ReviewPdf::serialize() const {
    std::ostringstream pdf(std::ios::binary);
    pdf.imbue(std::locale::classic());
    std::vector<std::streamoff> offsets;

    auto beginObject = [&](size_t id) {
        offsets.resize(std::max(offsets.size(), id + 1));
        offsets[id] = pdf.tellp();
        pdf << id << " 0 obj\n";
    };

    pdf << "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";

    // 1: catalog, 2: page tree, then page / content / image per page.
    beginObject(1);
    pdf << "<< /Type /Catalog /Pages 2 0 R >>\nendobj\n";

    beginObject(2);
    pdf << "<< /Type /Pages /Kids [";
    for (size_t i = 0; i < pages_.size(); ++i) pdf << (i ? " " : "") << 3 + 3 * i << " 0 R";
    pdf << "] /Count " << pages_.size() << " >>\nendobj\n";

    pdf << std::fixed << std::setprecision(2);
    for (size_t i = 0; i < pages_.size(); ++i) {
        const Page& p = pages_[i];
        const size_t pageId = 3 + 3 * i;
        const double w = p.width * 72.0 / resolution_;
        const double h = p.height * 72.0 / resolution_;

        beginObject(pageId);
        pdf << "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 " << w << " " << h << "]"
            << " /Resources << /XObject << /Im0 " << pageId + 2 << " 0 R >> >>"
            << " /Contents " << pageId + 1 << " 0 R >>\nendobj\n";

        std::ostringstream content;
        content.imbue(std::locale::classic());
        content << std::fixed << std::setprecision(2) << "q " << w << " 0 0 " << h << " 0 0 cm /Im0 Do Q";
        const std::string stream = content.str();
        beginObject(pageId + 1);
        pdf << "<< /Length " << stream.size() << " >>\nstream\n" << stream << "\nendstream\nendobj\n";

        beginObject(pageId + 2);
        pdf << "<< /Type /XObject /Subtype /Image /Width " << p.width << " /Height " << p.height
            << " /ColorSpace " << (p.color ? "/DeviceRGB" : "/DeviceGray")
            << " /BitsPerComponent 8 /Filter /DCTDecode /Length " << p.jpeg.size() << " >>\nstream\n";
        pdf.write(reinterpret_cast<const char*>(p.jpeg.data()), static_cast<std::streamsize>(p.jpeg.size()));
        pdf << "\nendstream\nendobj\n";
    }

    const std::streamoff xref = pdf.tellp();
    const size_t count = offsets.size();
    pdf << "xref\n0 " << count << "\n0000000000 65535 f \n";
    for (size_t id = 1; id < count; ++id) {
        pdf << std::setw(10) << std::setfill('0') << offsets[id] << " 00000 n \n";
    }
    pdf << "trailer\n<< /Size " << count << " /Root 1 0 R >>\nstartxref\n" << xref << "\n%%EOF\n";
    return pdf.str();
}

bool ReviewPdf::save(const std::filesystem::path& path) const {
    if (pages_.empty()) return false;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    const std::string bytes = serialize();
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(out);
}

}
