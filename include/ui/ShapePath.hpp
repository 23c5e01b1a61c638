#pragma once

#include <vector>

namespace halo::ui {

struct PointF {
    float x = 0.0f;
    float y = 0.0f;

    bool operator==(const PointF& other) const = default;
};

struct RectF {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
};

/**
 * A stroke made of disconnected polylines.
 *
 * move_to() always opens a new subpath; renderers must never join the end
 * of one subpath to the start of the next.
 */
class StrokePath {
public:
    void move_to(PointF p);
    void line_to(PointF p);

    const std::vector<std::vector<PointF>>& subpaths() const { return subpaths_; }

    // Sum of all segment lengths
    float length() const;

    // True when the path draws nothing
    bool empty() const { return length() <= 0.0f; }

private:
    std::vector<std::vector<PointF>> subpaths_;
};

enum class ShapeKind {
    Checkmark,
    Cross,
};

/**
 * Progressive checkmark: p1 (0.25w, 0.5h) -> p2 (0.5w, 0.75h) -> p3 (0.85w, 0.25h),
 * drawn as one polyline. `progress` is clamped to [0, 1].
 */
StrokePath checkmark_path(const RectF& rect, float progress);

/**
 * Progressive cross: the top-left to bottom-right diagonal first, then the
 * top-right to bottom-left diagonal as a separate subpath.
 */
StrokePath cross_path(const RectF& rect, float progress);

StrokePath shape_path(ShapeKind kind, const RectF& rect, float progress);

float distance(PointF a, PointF b);
PointF interpolate(PointF a, PointF b, float t);

}  // namespace halo::ui
