#ifndef OMR_SCAN_DISCOVERY_HPP
#define OMR_SCAN_DISCOVERY_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace omr {

// All scans of one student for one page. files[0] is the primary scan that
// gets read; later files are replacement pages appended for review only.
struct StudentScan {
    std::string studentId;
    std::string key;                              // "studentID_page"
    std::vector<std::filesystem::path> files;
};

// One directory holding page images.
struct PageGroup {
    std::filesystem::path directory;
    std::string label;     // directory name
    int pageNumber = 1;    // label when it is all digits, otherwise 1
    size_t imageCount = 0;
    std::vector<StudentScan> students;   // first-seen order
};

bool isPageImage(const std::filesystem::path& path);

int pageNumberFromLabel(const std::string& label);

// Directory first, then its subdirectories in name order. Has no side effects
// beyond reading the tree; throws std::filesystem::filesystem_error if `root`
// cannot be listed.
std::vector<PageGroup> discoverPages(const std::filesystem::path& root);

}

#endif
