#pragma once
#include "config.hpp"

constexpr float kFlowDamping = 0.05f;  // amortiguamiento del paso explícito
constexpr float kSonicGuard  = 0.01f;  // |1 - M^2| por debajo -> reinyección

// Parámetros globales del flujo, modificables entre ticks
struct FlowParams {
    float sound_speed        = 343.0f;  // m/s
    float injection_velocity = 100.0f;  // m/s
    float time_scale         = 0.01f;   // multiplicador (1% -> 0.01)
    float damping            = kFlowDamping;
};

FlowParams flow_params_from(const AppConfig& cfg);

inline float mach(float v, const FlowParams& fp) { return v / fp.sound_speed; }

// Área de sección circular de radio r (m)
float disc_area(float radius_m);

// Relación cuasi-1D linealizada: (M^2 - 1) dv/v = dA/A
// Cerca de M = 1 devuelve la velocidad de inyección.
float next_velocity(float area_up, float area_down, float v, const FlowParams& fp);
