#ifndef OMR_IMAGE_DPI_HPP
#define OMR_IMAGE_DPI_HPP

#include "omr/Units.hpp"

#include <filesystem>

namespace omr {

// Resolution stored in the image header: JFIF APP0 density for JPEG, pHYs
// for PNG. Anything else, or a header without usable density, yields
// `fallback`. Never throws.
Dpi readImageDpi(const std::filesystem::path& path, Dpi fallback);

}

#endif
