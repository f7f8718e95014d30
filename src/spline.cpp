#include "spline.hpp"
#include <algorithm>
#include <stdexcept>

void CubicSpline::fit(const std::vector<float>& kx, const std::vector<float>& ky) {
    if (kx.size() < 2 || kx.size() != ky.size())
        throw std::runtime_error("spline: se requieren al menos 2 nodos con x e y");

    const size_t n = kx.size() - 1;   // número de segmentos
    std::vector<float> h(n);
    for (size_t i=0; i<n; ++i) {
        h[i] = kx[i+1] - kx[i];
        if (h[i] <= 0.0f) throw std::runtime_error("spline: nodos no estrictamente crecientes");
    }

    // Sistema tridiagonal para c (c[0] = c[n] = 0, spline natural), Thomas
    std::vector<float> alpha(n+1, 0.0f);
    for (size_t i=1; i<n; ++i)
        alpha[i] = 3.0f/h[i]*(ky[i+1]-ky[i]) - 3.0f/h[i-1]*(ky[i]-ky[i-1]);

    std::vector<float> l(n+1, 1.0f), mu(n+1, 0.0f), z(n+1, 0.0f);
    for (size_t i=1; i<n; ++i) {
        l[i]  = 2.0f*(kx[i+1]-kx[i-1]) - h[i-1]*mu[i-1];
        mu[i] = h[i]/l[i];
        z[i]  = (alpha[i] - h[i-1]*z[i-1]) / l[i];
    }

    xs = kx;
    a.assign(ky.begin(), ky.end());
    b.assign(n, 0.0f);
    c.assign(n+1, 0.0f);
    d.assign(n, 0.0f);
    for (size_t j=n; j-- > 0; ) {
        c[j] = z[j] - mu[j]*c[j+1];
        b[j] = (a[j+1]-a[j])/h[j] - h[j]*(c[j+1] + 2.0f*c[j])/3.0f;
        d[j] = (c[j+1]-c[j]) / (3.0f*h[j]);
    }
}

size_t CubicSpline::segment(float x) const {
    // último nodo <= x, limitado a [0, n-1]
    auto it = std::upper_bound(xs.begin(), xs.end(), x);
    size_t i = (it == xs.begin()) ? 0 : size_t(it - xs.begin()) - 1;
    return std::min(i, xs.size() - 2);
}

float CubicSpline::at(float x) const {
    size_t i = segment(x);
    float t = x - xs[i];
    return a[i] + t*(b[i] + t*(c[i] + t*d[i]));
}

float CubicSpline::slope_at(float x) const {
    size_t i = segment(x);
    float t = x - xs[i];
    return b[i] + t*(2.0f*c[i] + 3.0f*t*d[i]);
}
