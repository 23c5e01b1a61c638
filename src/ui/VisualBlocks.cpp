#include "ui/VisualBlocks.hpp"
#include <algorithm>
#include <cmath>

namespace halo::ui::blocks {

namespace {
    // Dot numbering of the braille block:
    //   1 4
    //   2 5
    //   3 6
    //   7 8
    constexpr uint8_t DOT_BITS[4][2] = {
        {0x01, 0x08},
        {0x02, 0x10},
        {0x04, 0x20},
        {0x40, 0x80},
    };
}

std::string spinner_frame(int frame) {
    const char* frames[SPINNER_FRAMES] = {"⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};
    int index = frame % SPINNER_FRAMES;
    if (index < 0) index += SPINNER_FRAMES;
    return frames[index];
}

std::string braille_glyph(uint8_t dots) {
    // U+2800 + dots, encoded as 3-byte UTF-8
    std::string out(3, '\0');
    out[0] = static_cast<char>(0xE2);
    out[1] = static_cast<char>(0xA0 | (dots >> 6));
    out[2] = static_cast<char>(0x80 | (dots & 0x3F));
    return out;
}

BrailleRaster::BrailleRaster(int cols, int rows)
    : cols_(std::max(0, cols)), rows_(std::max(0, rows)) {
    cells_.assign(static_cast<size_t>(cols_ * rows_), 0);
}

RectF BrailleRaster::bounds() const {
    return RectF{0.0f, 0.0f, static_cast<float>(dot_width()), static_cast<float>(dot_height())};
}

void BrailleRaster::plot(int dx, int dy) {
    if (dx < 0 || dy < 0 || dx >= dot_width() || dy >= dot_height()) return;

    cells_[(dy / 4) * cols_ + (dx / 2)] |= DOT_BITS[dy % 4][dx % 2];
}

bool BrailleRaster::is_set(int dx, int dy) const {
    if (dx < 0 || dy < 0 || dx >= dot_width() || dy >= dot_height()) return false;
    return (cells_[(dy / 4) * cols_ + (dx / 2)] & DOT_BITS[dy % 4][dx % 2]) != 0;
}

void BrailleRaster::draw_line(PointF a, PointF b) {
    float span = std::max(std::abs(b.x - a.x), std::abs(b.y - a.y));
    int steps = static_cast<int>(std::ceil(span * 2.0f));

    for (int i = 0; i <= steps; ++i) {
        float t = steps == 0 ? 0.0f : static_cast<float>(i) / steps;
        PointF p = interpolate(a, b, t);
        // Points on the far edge belong to the last dot
        int dx = std::min(static_cast<int>(std::floor(p.x)), dot_width() - 1);
        int dy = std::min(static_cast<int>(std::floor(p.y)), dot_height() - 1);
        plot(dx, dy);
    }
}

void BrailleRaster::draw_path(const StrokePath& path) {
    for (const auto& sub : path.subpaths()) {
        for (size_t i = 1; i < sub.size(); ++i) {
            if (distance(sub[i - 1], sub[i]) <= 0.0f) continue;
            draw_line(sub[i - 1], sub[i]);
        }
    }
}

bool BrailleRaster::empty() const {
    return std::all_of(cells_.begin(), cells_.end(), [](uint8_t c) { return c == 0; });
}

void BrailleRaster::render(Canvas& canvas, int x, int y, Style style) const {
    for (int row = 0; row < rows_; ++row) {
        for (int col = 0; col < cols_; ++col) {
            uint8_t dots = cells_[row * cols_ + col];
            if (dots == 0) continue;
            canvas.put(x + col, y + row, braille_glyph(dots), style);
        }
    }
}

}  // namespace halo::ui::blocks
