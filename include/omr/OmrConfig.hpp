#ifndef OMR_CONFIG_HPP
#define OMR_CONFIG_HPP

#include <opencv2/core.hpp>

namespace omr {

// All tunables of the pipeline. Lengths are in document points (1/72.27 in),
// intensities in 0-255 gray levels.
struct OmrConfig {
    double minJump = 25.0;            // smallest intensity gap that splits marked/unmarked
    double globalThreshold = 210.0;   // a bubble at or above this is never marked
    double defaultThreshold = 200.0;  // used when a page has nothing to estimate from

    double bubbleRadius = 7.0;
    double anchorRadius = 10.0;
    double anchorDistance = 30.0;     // marker centre to page edge
    double markerConfidence = 0.6;    // minimum TM_CCOEFF_NORMED score per corner

    double separatorIntensity = 100.0; // D/S pseudo bubbles
    double emptyBoxIntensity = 255.0;

    double defaultDpi = 200.0;

    double topCropFraction = 0.09;    // header strip removed from review pages
    double reviewResolution = 100.0;
    int reviewJpegQuality = 90;

    cv::Scalar unmarkedColor{130, 130, 130};
    cv::Scalar markedColor{0, 0, 255};
    cv::Scalar separatorColor{0, 255, 0};
};

}

#endif
