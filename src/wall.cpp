#include "wall.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

void WallProfile::set_control_points(std::vector<ControlPoint> pts) {
    if (pts.size() < 2) throw std::runtime_error("pared: se requieren al menos 2 puntos de control");
    pts_ = std::move(pts);
    vel_.assign(pts_.size(), std::deque<float>{});
    sort_and_clamp();
}

size_t WallProfile::move_point(size_t i, ControlPoint p) {
    if (i >= pts_.size()) throw std::runtime_error("pared: indice de punto fuera de rango");
    pts_[i] = p;
    std::vector<size_t> order = sort_and_clamp();
    return size_t(std::find(order.begin(), order.end(), i) - order.begin());
}

// order[k] = índice previo del punto que queda en la posición k
std::vector<size_t> WallProfile::sort_and_clamp() {
    std::vector<size_t> order(pts_.size());
    std::iota(order.begin(), order.end(), size_t(0));
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b){ return pts_[a].x < pts_[b].x; });

    // los buffers de velocidad acompañan a su punto
    std::vector<ControlPoint> sp; sp.reserve(pts_.size());
    std::vector<std::deque<float>> sv; sv.reserve(vel_.size());
    for (size_t k : order) { sp.push_back(pts_[k]); sv.push_back(std::move(vel_[k])); }
    pts_ = std::move(sp);
    vel_ = std::move(sv);

    // nodos estrictamente crecientes
    for (size_t i=1; i<pts_.size(); ++i)
        pts_[i].x = std::max(pts_[i].x, pts_[i-1].x + kMinKnotGapPx);
    dirty_ = true;
    return order;
}

void WallProfile::prepare() const {
    if (!dirty_) return;
    std::vector<float> xs(pts_.size()), ys(pts_.size());
    for (size_t i=0; i<pts_.size(); ++i) { xs[i] = pts_[i].x; ys[i] = pts_[i].y; }
    spline_.fit(xs, ys);
    dirty_ = false;
}

float WallProfile::height_at(float x) const {
    if (x <= pts_.front().x) return pts_.front().y;
    if (x >= pts_.back().x)  return pts_.back().y;
    prepare();
    return spline_.at(x);
}

void WallProfile::record_velocity(float x, float v) {
    size_t best = 0;
    float bestDist = std::fabs(pts_[0].x - x);
    for (size_t i=1; i<pts_.size(); ++i) {
        float d = std::fabs(pts_[i].x - x);
        if (d < bestDist) { bestDist = d; best = i; }
    }
    if (bestDist >= kRecordRadiusPx) return;

    auto& buf = vel_[best];
    buf.push_back(v);
    if (buf.size() > kVelocityWindow) buf.pop_front();
}

float WallProfile::average_velocity_at(size_t i) const {
    const auto& buf = vel_.at(i);
    if (buf.empty()) return 0.0f;
    float sum = std::accumulate(buf.begin(), buf.end(), 0.0f);
    return sum / float(buf.size());
}

std::vector<ControlPoint> WallProfile::sample(int n) const {
    std::vector<ControlPoint> out;
    if (n < 2) n = 2;
    out.reserve(size_t(n));
    prepare();
    const float x0 = pts_.front().x, x1 = pts_.back().x;
    const float dx = (x1 - x0) / float(n - 1);
    for (int i=0; i<n; ++i) {
        float x = x0 + float(i) * dx;
        out.push_back({x, spline_.at(x)});
    }
    return out;
}
