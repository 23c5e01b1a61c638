#include "ui/Component.hpp"

namespace halo::ui {

LayoutRect Component::draw_box_border(
    Canvas& canvas,
    const LayoutRect& rect,
    const std::string& title,
    Style border_style,
    bool rounded
) const {
    canvas.draw_rect(rect.x, rect.y, rect.width, rect.height, border_style, rounded);

    // Title sits on the top border
    if (!title.empty()) {
        Style title_style = border_style;
        title_style.attr = title_style.attr | Attribute::Bold;
        canvas.draw_text(rect.x + 2, rect.y, " " + title + " ", title_style);
    }

    return LayoutRect{
        rect.x + 1,
        rect.y + 1,
        rect.width - 2,
        rect.height - 2
    };
}

}  // namespace halo::ui
