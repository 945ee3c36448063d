#include "rasteranim/compose/ProgressOverlay.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <string>

namespace rasteranim {

static constexpr int kFont = cv::FONT_HERSHEY_SIMPLEX;

/* Text box for `s`; height includes the part below the baseline. */
static cv::Size textBox(const std::string& s, double scale, int* baseline) {
    cv::Size sz = cv::getTextSize(s, kFont, scale, 1, baseline);
    sz.height += *baseline;
    return sz;
}

int progressPercent(std::size_t index, std::size_t total) {
    CV_Assert(total > 0 && index < total);
    return static_cast<int>((index + 1) * 100 / total);
}

/*
  Bar layout.

  - margin and height are reduced on small frames (at most 1/8 of the
    frame), so even a 4x4 frame gets a 1-pixel bar on its last row.
  - filled width = floor((index+1)/total * track width); the last frame
    is always full.
*/
BarGeometry progressBarGeometry(const cv::Size& frame,
                                std::size_t index, std::size_t total,
                                const OverlayOptions& opt)
{
    CV_Assert(frame.width > 0 && frame.height > 0);
    CV_Assert(total > 0 && index < total);

    const int m    = std::clamp(opt.margin, 0, std::min(frame.width, frame.height) / 8);
    const int barH = std::clamp(opt.bar_height, 1, std::max(1, frame.height / 8));

    BarGeometry g{};
    g.track = cv::Rect(m, frame.height - m - barH, std::max(1, frame.width - 2 * m), barH);

    const double progress = double(index + 1) / double(total);
    const int fillW = (index + 1 == total) ? g.track.width
                                           : static_cast<int>(progress * g.track.width);
    g.filled = cv::Rect(g.track.x, g.track.y, fillW, barH);
    return g;
}

void drawProgressOverlay(cv::Mat& bgra,
                         std::size_t index, std::size_t total,
                         const std::string& caption,
                         const OverlayOptions& opt)
{
    CV_Assert(bgra.type() == CV_8UC4 && !bgra.empty());

    const BarGeometry g = progressBarGeometry(bgra.size(), index, total, opt);
    cv::rectangle(bgra, g.track, opt.track, cv::FILLED);
    if (g.filled.width > 0) cv::rectangle(bgra, g.filled, opt.fill, cv::FILLED);

    // LINE_8 keeps text pixels fully opaque (no blended alpha at the edges)
    const int m = std::clamp(opt.margin, 0, std::min(bgra.cols, bgra.rows) / 8);
    int top = 0;

    if (opt.draw_caption && !caption.empty()) {
        int base = 0;
        const cv::Size box = textBox(caption, opt.font_scale, &base);
        if (box.width <= bgra.cols - 2 * m && m + box.height < g.track.y) {
            cv::putText(bgra, caption, {m, m + box.height - base}, kFont,
                        opt.font_scale, opt.fill, 1, cv::LINE_8);
            top = m + box.height;
        }
    }

    if (opt.draw_percent) {
        const std::string label = std::to_string(progressPercent(index, total)) + "%";
        int base = 0;
        const cv::Size box = textBox(label, opt.font_scale, &base);
        const int y = g.track.y - 2;  // bottom of the text box
        if (box.width <= bgra.cols - 2 * m && y - box.height >= top) {
            const int x = bgra.cols - m - box.width;
            cv::putText(bgra, label, {x, y - base}, kFont,
                        opt.font_scale, opt.fill, 1, cv::LINE_8);
        }
    }
}

} // namespace rasteranim
