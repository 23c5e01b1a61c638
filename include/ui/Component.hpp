#pragma once

#include "ui/Canvas.hpp"
#include "ui/LayoutConstraints.hpp"
#include "ui/InputEvent.hpp"
#include "model/Snapshot.hpp"
#include <string>

namespace halo::ui {

/**
 * Base class for everything drawn by the Renderer.
 *
 * Components render to a Canvas inside the rectangle they are given and
 * read application state only from the frame's Snapshot.
 */
class Component {
public:
    virtual ~Component() = default;

    /**
     * Render this component to the canvas.
     *
     * @param canvas    The canvas to draw on
     * @param rect      Your allocated screen space (x, y, width, height)
     * @param snap      State captured for this frame
     */
    virtual void render(
        Canvas& canvas,
        const LayoutRect& rect,
        const model::Snapshot& snap
    ) = 0;

    virtual void handle_input(const InputEvent& event) {
        // Default: do nothing
        (void)event;
    }

protected:
    /**
     * Helper: Draw a bordered box with title.
     * Returns the inner content rectangle (area inside border).
     */
    LayoutRect draw_box_border(
        Canvas& canvas,
        const LayoutRect& rect,
        const std::string& title,
        Style border_style = Style{},
        bool rounded = false
    ) const;
};

}  // namespace halo::ui
