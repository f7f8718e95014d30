#pragma once
#include <SDL.h>
#include <vector>
#include "particles.hpp"

// Lienzo persistente (textura destino) para las estelas de las partículas
struct TrailBuffer {
    SDL_Texture* tex = nullptr;
    int w=0, h=0;
    Uint32 format = SDL_PIXELFORMAT_ARGB8888;
};

bool create_trail_buffer(SDL_Renderer* r, int w, int h, TrailBuffer& out);
void destroy_trail_buffer(TrailBuffer& tb);

// Paredes, puntos de control con barras de velocidad media, choques y partículas
void draw_frame(
    SDL_Renderer* renderer,
    TrailBuffer& tb,
    const World& world,
    const std::vector<ShockMarker>& markers
);
