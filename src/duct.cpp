#include "duct.hpp"
#include <cmath>

static std::vector<ControlPoint> default_layout(int width, int points, float baseY) {
    std::vector<ControlPoint> pts;
    pts.reserve(size_t(points));
    for (int i=0; i<points; ++i) {
        float x = (float(width) / float(points - 1)) * float(i);
        float y = baseY + std::sin(float(i) * float(M_PI) / 2.0f) * 20.0f;
        pts.push_back({x, y});
    }
    return pts;
}

void Duct::reset(int width, int height, int points) {
    height_ = height;
    top.set_control_points(default_layout(width, points, float(height) * 0.2f));
    bottom.set_control_points(default_layout(width, points, float(height) * 0.8f));
}

size_t Duct::drag(WallSide side, size_t index, ControlPoint p) {
    WallProfile& own    = (side == WallSide::Top) ? top : bottom;
    WallProfile& mirror = (side == WallSide::Top) ? bottom : top;

    // ambas paredes comparten las x, así que reordenan igual
    size_t moved = own.move_point(index, p);
    mirror.move_point(index, {p.x, float(height_) - p.y});
    return moved;
}

DragHandle Duct::pick(float x, float y) const {
    const float r2 = kPickRadiusPx * kPickRadiusPx;
    auto hit = [&](const WallProfile& w, WallSide side, DragHandle& h) {
        const auto& pts = w.points();
        for (size_t i=0; i<pts.size(); ++i) {
            float dx = pts[i].x - x, dy = pts[i].y - y;
            if (dx*dx + dy*dy < r2) { h = {side, i, true}; return true; }
        }
        return false;
    };
    DragHandle h;
    if (!hit(top, WallSide::Top, h)) hit(bottom, WallSide::Bottom, h);
    return h;
}

void Duct::move_handle(DragHandle& h, float x, float y) {
    if (!h.active) return;
    h.index = drag(h.side, h.index, {x, y});
}

void Duct::record_velocity(float x, float v) {
    top.record_velocity(x, v);
    bottom.record_velocity(x, v);
}
