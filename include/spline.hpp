#pragma once
#include <cstddef>
#include <vector>

// Spline cúbico natural (S'' = 0 en los extremos).
// Segmento i: y = a + b*t + c*t^2 + d*t^3, con t = x - xs[i].
struct CubicSpline {
    std::vector<float> xs;            // nodos
    std::vector<float> a, b, c, d;    // coeficientes por segmento

    // xs estrictamente creciente, xs.size() == ys.size() >= 2
    void fit(const std::vector<float>& xs, const std::vector<float>& ys);

    float at(float x) const;
    float slope_at(float x) const;

    size_t segment(float x) const;
};
