#ifndef OMR_ERRORS_HPP
#define OMR_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace omr {

class OmrError : public std::runtime_error {
public:
    explicit OmrError(const std::string& what) : std::runtime_error(what) {}
};

// Missing or unusable input file / folder.
class InputError : public OmrError {
public:
    explicit InputError(const std::string& what) : OmrError(what) {}
};

// Bubble table that cannot describe a consistent page layout.
class LayoutError : public OmrError {
public:
    explicit LayoutError(const std::string& what) : OmrError(what) {}
};

class CsvError : public OmrError {
public:
    explicit CsvError(const std::string& what) : OmrError(what) {}
};

}

#endif
