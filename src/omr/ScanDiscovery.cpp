#include "omr/ScanDiscovery.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace fs = std::filesystem;

namespace omr {

namespace {

void walk(const fs::path& dir, std::vector<PageGroup>& out) {
    std::vector<fs::path> images;
    std::vector<fs::path> subdirs;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_directory()) subdirs.push_back(entry.path());
        else if (entry.is_regular_file() && isPageImage(entry.path())) images.push_back(entry.path());
    }
    std::sort(images.begin(), images.end());
    std::sort(subdirs.begin(), subdirs.end());

    if (!images.empty()) {
        PageGroup g;
        g.directory = dir;
        g.label = dir.filename().string();
        g.pageNumber = pageNumberFromLabel(g.label);
        g.imageCount = images.size();

        for (const auto& img : images) {
            std::string stem = img.stem().string();
            size_t first = stem.find('_');
            if (first == std::string::npos) {
                spdlog::warn("Skipping {}: name is not studentID_page", img.filename().string());
                continue;
            }
            size_t second = stem.find('_', first + 1);
            std::string key = stem.substr(0, second);

            auto it = std::find_if(g.students.begin(), g.students.end(),
                                   [&](const StudentScan& s) { return s.key == key; });
            if (it == g.students.end()) {
                g.students.push_back(StudentScan{stem.substr(0, first), key, {}});
                it = std::prev(g.students.end());
            }
            it->files.push_back(img);
        }
        out.push_back(std::move(g));
    }

    for (const auto& sub : subdirs) walk(sub, out);
}

}

bool isPageImage(const fs::path& path) {
    const std::string ext = path.extension().string();
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg";
}

int pageNumberFromLabel(const std::string& label) {
    if (label.empty() || label.size() > 9) return 1;
    bool digits = std::all_of(label.begin(), label.end(),
                              [](unsigned char c) { return std::isdigit(c) != 0; });
    return digits ? std::stoi(label) : 1;
}

std::vector<PageGroup> discoverPages(const fs::path& root) {
    std::vector<PageGroup> out;
    walk(root, out);
    return out;
}

}
