#include "particles.hpp"
#include <omp.h>

// Igual que step_sequential, pero la fase de flujo (lectura de paredes +
// velocidad) corre en paralelo. Registro, choques y avance siguen en orden
// de partícula, así que el resultado coincide con la versión secuencial.
void World::step_parallel(float dt, double now_ms) {
    const int n = int(particles.size());
    std::vector<FlowSample> samples(particles.size());

    // spline reconstruido antes de las lecturas concurrentes
    duct.prepare();

    #pragma omp parallel for schedule(static)
    for (int i=0; i<n; ++i) {
        samples[size_t(i)] = sample_flow(particles[size_t(i)], duct, scale, flow);
    }

    size_t w = 0;
    for (size_t i=0; i<particles.size(); ++i) {
        if (apply_flow(particles[i], samples[i], duct, shocks, scale, flow, dt, now_ms, cfg.verbose))
            particles[w++] = particles[i];
    }
    particles.resize(w);
}
