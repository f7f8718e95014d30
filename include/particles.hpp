#pragma once
#include <vector>
#include "config.hpp"
#include "rng.hpp"
#include "units.hpp"
#include "flow.hpp"
#include "duct.hpp"
#include "shock.hpp"

// ------------------- Trazadores -------------------
struct Particle {
    float x, y;       // posicion (px); y se deriva de las paredes
    float nlat;       // fracción lateral fija: 0 = pared superior, 1 = inferior
    float vx;         // velocidad aguas abajo (m/s)
    float size;       // radio (px)
    float opacity;
    bool  supersonic; // estado de color
};

constexpr float  kLookAheadM      = 0.1f;    // 10 cm aguas abajo
constexpr float  kMinSpeed        = 0.001f;  // m/s, por debajo se descarta
constexpr double kSpawnIntervalMs = 0.01;    // se divide por la escala de tiempo

// Fase de flujo de una partícula: solo lee las paredes
struct FlowSample {
    float y;       // posición lateral derivada
    float v_new;   // velocidad tras el paso de flujo
};

FlowSample sample_flow(const Particle& p, const Duct& duct,
                       const ScreenScale& scale, const FlowParams& fp);

// Aplica la muestra: transición de Mach, registro en paredes, avance y color.
// Devuelve false si la partícula debe eliminarse.
bool apply_flow(Particle& p, const FlowSample& s, Duct& duct, ShockTracker& shocks,
                const ScreenScale& scale, const FlowParams& fp,
                float dt, double now_ms, bool verbose = false);

inline bool advance_particle(Particle& p, Duct& duct, ShockTracker& shocks,
                             const ScreenScale& scale, const FlowParams& fp,
                             float dt, double now_ms, bool verbose = false) {
    return apply_flow(p, sample_flow(p, duct, scale, fp), duct, shocks, scale, fp, dt, now_ms, verbose);
}

struct World {
    AppConfig cfg;
    FlowParams flow;
    ScreenScale scale;
    RNG rng;
    Duct duct;
    ShockTracker shocks;
    std::vector<Particle> particles;

    double last_spawn_ms = -1.0e300;

    World(const AppConfig& c);

    // Nuevo tamaño de lienzo: paredes con la disposición por defecto
    void resize(int w, int h);
    void reset_walls();

    Particle spawn_particle();
    void maybe_spawn(double now_ms);

    void step(float dt, double now_ms) {
        if (cfg.parallel) step_parallel(dt, now_ms); else step_sequential(dt, now_ms);
    }
    void step_sequential(float dt, double now_ms);
    void step_parallel(float dt, double now_ms);   // particles_parallel.cpp

    // Poda cubetas expiradas y devuelve los marcadores vivos
    std::vector<ShockMarker> shock_markers(double now_ms);
};
