#pragma once
#include <opencv2/core.hpp>
#include <cstddef>
#include <string>

namespace rasteranim {

struct OverlayOptions {
    int    bar_height    = 20;     // upper bound, shrinks to fit small frames
    int    margin        = 10;     // distance of bar/text from the frame edges
    bool   draw_caption  = true;   // frame name in the top-left corner
    bool   draw_percent  = true;   // "NN%" right-aligned above the bar
    double font_scale    = 0.5;
    cv::Scalar fill      {255, 255, 255, 255};  // BGRA, alpha is always 255
    cv::Scalar track     { 48,  48,  48, 255};
};

/* Where the bar of frame `index` (0-based) of `total` lands. */
struct BarGeometry {
    cv::Rect track;    // full bar extent
    cv::Rect filled;   // part proportional to (index+1)/total, may be empty
};

/** Compute the bar rectangles for a frame of size `frame`. */
BarGeometry progressBarGeometry(const cv::Size& frame,
                                std::size_t index, std::size_t total,
                                const OverlayOptions& opt = {});

/** Integer percentage shown for frame `index` of `total`. */
int progressPercent(std::size_t index, std::size_t total);

/**
 * Burn the progress indicator into a BGRA frame in place.
 * Frame size never changes; every painted pixel gets alpha 255.
 * Text that does not fit the frame is skipped, the bar is always drawn.
 */
void drawProgressOverlay(cv::Mat& bgra,
                         std::size_t index, std::size_t total,
                         const std::string& caption,
                         const OverlayOptions& opt = {});

} // namespace rasteranim
