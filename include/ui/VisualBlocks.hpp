#pragma once

#include "ui/Canvas.hpp"
#include "ui/ShapePath.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace halo::ui::blocks {

// One frame of the loading spinner; frames cycle every SPINNER_FRAMES
constexpr int SPINNER_FRAMES = 10;
std::string spinner_frame(int frame);

// UTF-8 braille glyph for an 8-dot mask (bit layout of U+2800)
std::string braille_glyph(uint8_t dots);

/**
 * Sub-cell raster for stroke paths. Each terminal cell holds a 2x4 grid of
 * braille dots, so a `cols` x `rows` cell area is addressed as a
 * (cols * 2) x (rows * 4) dot surface.
 */
class BrailleRaster {
public:
    BrailleRaster(int cols, int rows);

    int cols() const { return cols_; }
    int rows() const { return rows_; }
    int dot_width() const { return cols_ * 2; }
    int dot_height() const { return rows_ * 4; }

    // Dot-space rectangle covering the whole raster
    RectF bounds() const;

    void plot(int dx, int dy);
    bool is_set(int dx, int dy) const;
    void draw_line(PointF a, PointF b);

    // Each subpath is stroked on its own; subpaths are never joined
    void draw_path(const StrokePath& path);

    bool empty() const;

    // Draw non-empty cells at (x, y); blank cells leave the canvas untouched
    void render(Canvas& canvas, int x, int y, Style style) const;

private:
    int cols_;
    int rows_;
    std::vector<uint8_t> cells_;
};

}  // namespace halo::ui::blocks
