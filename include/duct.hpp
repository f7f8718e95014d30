#pragma once
#include <cstddef>
#include "wall.hpp"

enum class WallSide { Top, Bottom };

struct DragHandle {
    WallSide side = WallSide::Top;
    size_t   index = 0;
    bool     active = false;
};

constexpr float kPickRadiusPx = 10.0f;   // radio de agarre de un punto

// Par de paredes espejadas respecto de la línea media del lienzo.
class Duct {
public:
    WallProfile top;
    WallProfile bottom;

    Duct() = default;
    Duct(int width, int height, int points) { reset(width, height, points); }

    // Disposición por defecto: puntos equiespaciados, base al 20% / 80% del alto
    void reset(int width, int height, int points);

    // Mueve el punto `index` de una pared y su espejo (y -> height - y).
    // Devuelve el índice del punto tras reordenar.
    size_t drag(WallSide side, size_t index, ControlPoint p);

    // Agarre por puntero: primer punto a menos de kPickRadiusPx
    DragHandle pick(float x, float y) const;
    void move_handle(DragHandle& h, float x, float y);

    // Velocidad registrada en ambas paredes
    void record_velocity(float x, float v);

    // Spline listo en ambas paredes
    void prepare() const { top.prepare(); bottom.prepare(); }

private:
    int height_ = 0;
};
