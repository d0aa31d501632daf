#ifndef OMR_UNITS_HPP
#define OMR_UNITS_HPP

namespace omr {

constexpr double kPointsPerInch = 72.27;

struct Dpi {
    double x = 200.0;
    double y = 200.0;
};

// Document points to pixels. Truncates like the layout generator does, so
// positions stay bit-compatible with existing bubble tables.
int pointsToPixels(double value, double dpi);

}

#endif
