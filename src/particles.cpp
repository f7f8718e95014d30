#include "particles.hpp"
#include <cmath>
#include <iostream>

World::World(const AppConfig& c)
: cfg(c), flow(flow_params_from(c)), rng(c.seed),
  shocks(1.0f, c.shock_threshold) {
    resize(cfg.width, cfg.height);
}

void World::resize(int w, int h) {
    cfg.width = w; cfg.height = h;
    scale.width_px = float(w);
    scale.length_m = cfg.duct_length;
    shocks.set_grouping(scale.m_to_px(kShockGroupingM));
    reset_walls();
}

void World::reset_walls() {
    duct.reset(cfg.width, cfg.height, cfg.points);
}

Particle World::spawn_particle() {
    Particle p;
    p.size    = rng.rb(1.0f, 3.0f);
    p.x       = 0.0f;
    p.nlat    = rng.unit();
    p.vx      = flow.injection_velocity;
    p.opacity = rng.rb(0.5f, 1.0f);
    const float topY = duct.top.height_at(0.0f);
    p.y       = topY + p.nlat * (duct.bottom.height_at(0.0f) - topY);
    p.supersonic = mach(p.vx, flow) > 1.0f;
    return p;
}

void World::maybe_spawn(double now_ms) {
    double interval = kSpawnIntervalMs / double(flow.time_scale);
    if (now_ms - last_spawn_ms <= interval) return;
    if (particles.size() >= size_t(cfg.max_particles)) return;
    particles.push_back(spawn_particle());
    last_spawn_ms = now_ms;
}

FlowSample sample_flow(const Particle& p, const Duct& duct,
                       const ScreenScale& scale, const FlowParams& fp) {
    const float topY    = duct.top.height_at(p.x);
    const float bottomY = duct.bottom.height_at(p.x);
    const float aheadY  = duct.bottom.height_at(p.x + scale.m_to_px(kLookAheadM));

    // radio = altura de la pared inferior, en metros
    const float A1 = disc_area(scale.px_to_m(bottomY));
    const float A2 = disc_area(scale.px_to_m(aheadY));

    FlowSample s;
    s.y     = topY + p.nlat * (bottomY - topY);
    s.v_new = next_velocity(A1, A2, p.vx, fp);
    return s;
}

bool apply_flow(Particle& p, const FlowSample& s, Duct& duct, ShockTracker& shocks,
                const ScreenScale& scale, const FlowParams& fp,
                float dt, double now_ms, bool verbose) {
    p.y = s.y;

    const float m0 = mach(p.vx, fp);
    p.vx = s.v_new;
    const float m1 = mach(p.vx, fp);

    if ((m0 < 1.0f && m1 >= 1.0f) || (m0 >= 1.0f && m1 < 1.0f)) {
        if (verbose)
            std::cout << "Transicion de Mach en x=" << p.x
                      << " M " << m0 << " -> " << m1 << "\n";
        shocks.report_transition(p.x, m1 >= 1.0f ? ShockKind::SupersonicEntry
                                                 : ShockKind::SubsonicEntry, now_ms);
    }

    duct.record_velocity(p.x, p.vx);
    p.supersonic = m1 > 1.0f;

    p.x += scale.m_to_px(p.vx * dt * fp.time_scale);

    // fuera del ducto por cualquiera de los extremos, detenida o NaN
    return p.x >= 0.0f && p.x <= scale.width_px && std::fabs(p.vx) >= kMinSpeed;
}

void World::step_sequential(float dt, double now_ms) {
    size_t w = 0;
    for (size_t i=0; i<particles.size(); ++i) {
        if (advance_particle(particles[i], duct, shocks, scale, flow, dt, now_ms, cfg.verbose))
            particles[w++] = particles[i];
    }
    particles.resize(w);
}

std::vector<ShockMarker> World::shock_markers(double now_ms) {
    shocks.prune_expired(now_ms);
    return shocks.active_markers(now_ms, duct);
}
