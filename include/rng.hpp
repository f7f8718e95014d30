#pragma once
#include <cstdint>
#include <random>

// Generador de la simulación: posición lateral, tamaño y opacidad de partículas
struct RNG {
    std::mt19937 gen;
    std::uniform_real_distribution<float> U{0.0f,1.0f};

    explicit RNG(int seed) { reseed(seed); }

    void reseed(int seed) {
        if (seed < 0) { std::random_device rd; gen.seed(rd()); }
        else          { gen.seed(static_cast<uint32_t>(seed)); }
    }
    inline float unit()               { return U(gen); }
    inline float rb(float a, float b) { return a + (b-a)*U(gen); }
};
