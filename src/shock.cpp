#include "shock.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

ShockTracker::ShockTracker(float grouping_px, int threshold, double lifetime_ms, size_t window)
: grouping_(grouping_px), threshold_(threshold), lifetime_(lifetime_ms), window_(window) {
    if (!(grouping_px > 0.0f)) throw std::runtime_error("choques: distancia de agrupamiento debe ser > 0");
    if (threshold < 1) throw std::runtime_error("choques: umbral debe ser >= 1");
}

void ShockTracker::set_grouping(float grouping_px) {
    if (!(grouping_px > 0.0f)) throw std::runtime_error("choques: distancia de agrupamiento debe ser > 0");
    grouping_ = grouping_px;
    buckets_.clear();
}

void ShockTracker::set_threshold(int t) {
    if (t < 1) throw std::runtime_error("choques: umbral debe ser >= 1");
    threshold_ = t;
}

long ShockTracker::bucket_index(float x) const {
    return long(std::floor(x / grouping_ + 0.5f));
}

float ShockTracker::bucket_key(float x) const {
    return float(bucket_index(x)) * grouping_;
}

const std::deque<ShockEvent>* ShockTracker::bucket_at(float x) const {
    auto it = buckets_.find(bucket_index(x));
    return it == buckets_.end() ? nullptr : &it->second;
}

void ShockTracker::report_transition(float x, ShockKind kind, double t_ms) {
    auto& ev = buckets_[bucket_index(x)];
    ev.push_back({kind, t_ms});
    while (ev.size() > window_) ev.pop_front();

    // solo eventos dentro de la ventana de vida
    ev.erase(std::remove_if(ev.begin(), ev.end(),
                            [&](const ShockEvent& e){ return t_ms - e.t_ms >= lifetime_; }),
             ev.end());
}

void ShockTracker::prune_expired(double now_ms) {
    for (auto it = buckets_.begin(); it != buckets_.end(); ) {
        if (it->second.empty() || now_ms - it->second.back().t_ms >= lifetime_)
            it = buckets_.erase(it);
        else
            ++it;
    }
}

std::vector<ShockMarker> ShockTracker::active_markers(double now_ms, const Duct& duct) const {
    std::vector<ShockMarker> out;
    for (const auto& kv : buckets_) {
        const auto& ev = kv.second;
        if (ev.empty()) continue;

        double newest = ev.front().t_ms;
        int nSuper = 0, nSub = 0;
        for (const auto& e : ev) {
            newest = std::max(newest, e.t_ms);
            if (now_ms - e.t_ms >= lifetime_) continue;
            if (e.kind == ShockKind::SupersonicEntry) ++nSuper; else ++nSub;
        }
        double age = now_ms - newest;
        if (age >= lifetime_) continue;
        if (nSuper < threshold_ && nSub < threshold_) continue;

        ShockMarker m;
        m.x        = float(kv.first) * grouping_;
        m.top_y    = duct.top.height_at(m.x);
        m.bottom_y = duct.bottom.height_at(m.x);
        m.opacity  = float(std::clamp(1.0 - age / lifetime_, 0.0, 1.0));
        m.kind     = (nSuper >= nSub) ? ShockKind::SupersonicEntry : ShockKind::SubsonicEntry;
        out.push_back(m);
    }
    return out;
}
