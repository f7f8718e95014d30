#pragma once
#include <cstddef>
#include <deque>
#include <utility>
#include <vector>
#include "spline.hpp"

struct ControlPoint {
    float x, y;   // posicion (px): x aguas abajo, y lateral
};

constexpr size_t kVelocityWindow  = 50;     // muestras por punto de control
constexpr float  kRecordRadiusPx  = 50.0f;  // distancia máxima para registrar
constexpr float  kMinKnotGapPx    = 1.0f;   // separación mínima entre nodos
constexpr int    kWallSamples     = 200;    // resolución de la polilínea

// Perfil de una pared: puntos de control ordenados por x + spline perezoso.
class WallProfile {
public:
    WallProfile() = default;
    explicit WallProfile(std::vector<ControlPoint> pts) { set_control_points(std::move(pts)); }

    // Reemplaza los puntos, reordena y vacía los buffers de velocidad
    void set_control_points(std::vector<ControlPoint> pts);

    // Mueve el punto i; devuelve su nuevo índice tras reordenar
    size_t move_point(size_t i, ControlPoint p);

    const std::vector<ControlPoint>& points() const { return pts_; }
    size_t size() const { return pts_.size(); }

    // Fuera del rango de nodos devuelve la altura del nodo extremo
    float height_at(float x) const;

    void  record_velocity(float x, float v);
    float average_velocity_at(size_t i) const;
    size_t samples_at(size_t i) const { return vel_.at(i).size(); }

    // Polilínea muestreada entre el primer y el último nodo
    std::vector<ControlPoint> sample(int n = kWallSamples) const;

    // Reconstruye el spline si quedó invalidado (antes de lecturas concurrentes)
    void prepare() const;

private:
    std::vector<size_t> sort_and_clamp();

    std::vector<ControlPoint> pts_;
    std::vector<std::deque<float>> vel_;

    mutable CubicSpline spline_;
    mutable bool dirty_ = true;
};
