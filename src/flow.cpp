#include "flow.hpp"
#include <cmath>

FlowParams flow_params_from(const AppConfig& cfg) {
    FlowParams fp;
    fp.sound_speed        = cfg.sound_speed;
    fp.injection_velocity = cfg.velocity;
    fp.time_scale         = cfg.time_scale / 100.0f;  // porcentaje -> decimal
    return fp;
}

float disc_area(float radius_m) {
    return float(M_PI) * radius_m * radius_m;
}

float next_velocity(float area_up, float area_down, float v, const FlowParams& fp) {
    const float M = mach(v, fp);
    const float one_minus_M2 = 1.0f - M*M;

    // singularidad sónica
    if (std::fabs(one_minus_M2) < kSonicGuard) return fp.injection_velocity;

    // pared arrastrada hasta y = 0: área nula, sin variación definida
    if (!(area_up > 0.0f)) return v;

    const float dA_A =(area_down - area_up) / area_up;
    const float dV = -dA_A * v / one_minus_M2;
    return v + dV * fp.damping;
}
