#pragma once

namespace halo::ui {

/**
 * Computed layout rectangle for a widget, in terminal cells
 */
struct LayoutRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool operator==(const LayoutRect& other) const {
        return x == other.x && y == other.y &&
               width == other.width && height == other.height;
    }

    bool operator!=(const LayoutRect& other) const {
        return !(*this == other);
    }

    // A width x height rectangle centered inside this one
    LayoutRect centered(int w, int h) const {
        return LayoutRect{x + (width - w) / 2, y + (height - h) / 2, w, h};
    }
};

}  // namespace halo::ui
