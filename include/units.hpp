#pragma once

// Conversión entre metros y píxeles: el ancho de la ventana representa
// `length_m` metros del ducto.
struct ScreenScale {
    float width_px = 1280.0f;
    float length_m = 5.0f;

    inline float m_to_px(float m)  const { return (m / length_m) * width_px; }
    inline float px_to_m(float px) const { return (px / width_px) * length_m; }
};
