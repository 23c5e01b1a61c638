#include "ui/Canvas.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>

namespace halo::ui {

Canvas::Canvas(int width, int height) : width_(width), height_(height) {
    buffer_.resize(width * height);
}

Cell& Canvas::at(int x, int y) {
    if (!is_in_bounds(x, y)) {
        static Cell dummy;
        return dummy;
    }
    return buffer_[y * width_ + x];
}

const Cell& Canvas::at(int x, int y) const {
    if (!is_in_bounds(x, y)) {
        static Cell dummy;
        return dummy;
    }
    return buffer_[y * width_ + x];
}

void Canvas::clear(const Cell& fill_cell) {
    std::fill(buffer_.begin(), buffer_.end(), fill_cell);
}

void Canvas::put(int x, int y, const std::string& grapheme, Style style) {
    if (is_in_bounds(x, y)) {
        buffer_[y * width_ + x] = Cell{grapheme, style};
    }
}

void Canvas::resize(int width, int height) {
    if (width_ == width && height_ == height) return;
    width_ = width;
    height_ = height;
    buffer_.clear();
    buffer_.resize(width * height);
}

int Canvas::draw_text(int x, int y, std::string_view text, Style style) {
    if (y < 0 || y >= height_) return x;

    auto unicode_text = icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));

    int current_x = x;
    for (int32_t i = 0; i < unicode_text.length() && current_x < width_;
         i = unicode_text.moveIndex32(i, 1)) {
        UChar32 c = unicode_text.char32At(i);
        std::string grapheme;
        icu::UnicodeString(c).toUTF8String(grapheme);

        int char_width = halo::util::codepoint_width(c);
        if (char_width == 0) {
            // Combining mark: attach to the previous cell
            if (is_in_bounds(current_x - 1, y)) {
                buffer_[y * width_ + current_x - 1].content += grapheme;
            }
            continue;
        }

        if (current_x >= 0) {
            put(current_x, y, grapheme, style);

            // Wide characters own the next cell too; leave it empty
            if (char_width == 2 && current_x + 1 < width_) {
                put(current_x + 1, y, "", style);
            }
        }
        current_x += char_width;
    }
    return current_x;
}

void Canvas::draw_rect(int x, int y, int w, int h, Style style, bool rounded) {
    if (w <= 0 || h <= 0) return;

    put(x, y, rounded ? "╭" : "┌", style);
    put(x + w - 1, y, rounded ? "╮" : "┐", style);
    put(x, y + h - 1, rounded ? "╰" : "└", style);
    put(x + w - 1, y + h - 1, rounded ? "╯" : "┘", style);

    for (int i = 1; i < w - 1; ++i) {
        put(x + i, y, "─", style);
        put(x + i, y + h - 1, "─", style);
    }

    for (int i = 1; i < h - 1; ++i) {
        put(x, y + i, "│", style);
        put(x + w - 1, y + i, "│", style);
    }
}

void Canvas::fill_rect(int x, int y, int w, int h, const Cell& cell) {
    for (int cy = y; cy < y + h; ++cy) {
        for (int cx = x; cx < x + w; ++cx) {
            if (is_in_bounds(cx, cy)) {
                buffer_[cy * width_ + cx] = cell;
            }
        }
    }
}

void Canvas::tint_rect(int x, int y, int w, int h, Color bg, Attribute attr) {
    for (int cy = y; cy < y + h; ++cy) {
        for (int cx = x; cx < x + w; ++cx) {
            if (!is_in_bounds(cx, cy)) continue;
            auto& style = buffer_[cy * width_ + cx].style;
            if (bg != Color::Default) {
                style.bg = bg;
            }
            style.attr = style.attr | attr;
        }
    }
}

} // namespace halo::ui
