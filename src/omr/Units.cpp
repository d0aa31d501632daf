#include "omr/Units.hpp"

namespace omr {

int pointsToPixels(double value, double dpi) {
    return static_cast<int>(value * dpi / kPointsPerInch);
}

}
