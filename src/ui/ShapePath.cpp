#include "ui/ShapePath.hpp"
#include <algorithm>
#include <cmath>

namespace halo::ui {

void StrokePath::move_to(PointF p) {
    subpaths_.push_back({p});
}

void StrokePath::line_to(PointF p) {
    if (subpaths_.empty()) {
        subpaths_.push_back({p});
        return;
    }
    subpaths_.back().push_back(p);
}

float StrokePath::length() const {
    float total = 0.0f;
    for (const auto& sub : subpaths_) {
        for (size_t i = 1; i < sub.size(); ++i) {
            total += distance(sub[i - 1], sub[i]);
        }
    }
    return total;
}

float distance(PointF a, PointF b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

PointF interpolate(PointF a, PointF b, float t) {
    return PointF{a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t};
}

namespace {

float clamp_progress(float progress) {
    if (std::isnan(progress)) return 0.0f;
    return std::clamp(progress, 0.0f, 1.0f);
}

// Fraction of a segment of `length` covered by `travelled`; 0 for degenerate segments
float segment_fraction(float travelled, float length) {
    if (length <= 0.0f) return 0.0f;
    return std::min(1.0f, travelled / length);
}

PointF at(const RectF& rect, float fx, float fy) {
    return PointF{rect.x + rect.width * fx, rect.y + rect.height * fy};
}

}  // namespace

StrokePath checkmark_path(const RectF& rect, float progress) {
    StrokePath path;

    PointF p1 = at(rect, 0.25f, 0.50f);  // lower-left
    PointF p2 = at(rect, 0.50f, 0.75f);  // middle
    PointF p3 = at(rect, 0.85f, 0.25f);  // upper-right

    float d12 = distance(p1, p2);
    float d23 = distance(p2, p3);
    float current = clamp_progress(progress) * (d12 + d23);

    path.move_to(p1);

    if (current <= d12) {
        path.line_to(interpolate(p1, p2, segment_fraction(current, d12)));
    } else {
        path.line_to(p2);
        path.line_to(interpolate(p2, p3, segment_fraction(current - d12, d23)));
    }

    return path;
}

StrokePath cross_path(const RectF& rect, float progress) {
    StrokePath path;

    // top-left -> bottom-right
    PointF a1 = at(rect, 0.15f, 0.15f);
    PointF a2 = at(rect, 0.85f, 0.85f);

    // top-right -> bottom-left
    PointF b1 = at(rect, 0.85f, 0.15f);
    PointF b2 = at(rect, 0.15f, 0.85f);

    float d1 = distance(a1, a2);
    float d2 = distance(b1, b2);
    float current = clamp_progress(progress) * (d1 + d2);

    path.move_to(a1);

    if (current <= d1) {
        path.line_to(interpolate(a1, a2, segment_fraction(current, d1)));
        return path;
    }
    path.line_to(a2);

    path.move_to(b1);
    path.line_to(interpolate(b1, b2, segment_fraction(current - d1, d2)));

    return path;
}

StrokePath shape_path(ShapeKind kind, const RectF& rect, float progress) {
    switch (kind) {
        case ShapeKind::Checkmark: return checkmark_path(rect, progress);
        case ShapeKind::Cross:     return cross_path(rect, progress);
    }
    return StrokePath{};
}

}  // namespace halo::ui
