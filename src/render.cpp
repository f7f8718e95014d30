#include "render.hpp"
#include <algorithm>
#include <cmath>

static inline Uint8 to_byte(float x){
    int v = int(std::round(255.0f * std::clamp(x, 0.0f, 1.0f)));
    return (Uint8)v;
}

bool create_trail_buffer(SDL_Renderer* r, int w, int h, TrailBuffer& out) {
    out.w = w; out.h = h;
    out.tex = SDL_CreateTexture(r, out.format, SDL_TEXTUREACCESS_TARGET, w, h);
    if (!out.tex) return false;
    SDL_SetTextureBlendMode(out.tex, SDL_BLENDMODE_NONE);

    SDL_SetRenderTarget(r, out.tex);
    SDL_SetRenderDrawColor(r, 0,0,0,255);
    SDL_RenderClear(r);
    SDL_SetRenderTarget(r, nullptr);
    return true;
}

void destroy_trail_buffer(TrailBuffer& tb) {
    if (tb.tex) SDL_DestroyTexture(tb.tex);
    tb.tex = nullptr; tb.w = tb.h = 0;
}

static void draw_wall(SDL_Renderer* renderer, const WallProfile& wall, bool isTop,
                      float soundSpeed)
{
    std::vector<ControlPoint> pts = wall.sample();
    std::vector<SDL_FPoint> line(pts.size());
    for (size_t i=0; i<pts.size(); ++i) line[i] = {pts[i].x, pts[i].y};

    SDL_SetRenderDrawColor(renderer, 255,255,255,255);
    SDL_RenderDrawLinesF(renderer, line.data(), int(line.size()));
    // trazo de 2 px
    for (auto& q : line) q.y += 1.0f;
    SDL_RenderDrawLinesF(renderer, line.data(), int(line.size()));

    const auto& cps = wall.points();
    for (size_t i=0; i<cps.size(); ++i) {
        SDL_FRect dot{cps[i].x - 5.0f, cps[i].y - 5.0f, 10.0f, 10.0f};
        SDL_SetRenderDrawColor(renderer, 255,0,0,255);
        SDL_RenderFillRectF(renderer, &dot);

        // barra de velocidad media: hacia fuera del ducto, 40 px = Mach 1
        float avg = wall.average_velocity_at(i);
        if (avg <= 0.0f) continue;
        float len = std::min(120.0f, 40.0f * avg / soundSpeed);
        float y0  = isTop ? cps[i].y - 10.0f - len : cps[i].y + 10.0f;
        SDL_FRect bar{cps[i].x - 2.0f, y0, 4.0f, len};
        if (avg > soundSpeed) SDL_SetRenderDrawColor(renderer, 255,50,50,220);
        else                  SDL_SetRenderDrawColor(renderer, 255,255,255,220);
        SDL_RenderFillRectF(renderer, &bar);
    }
}

void draw_frame(SDL_Renderer* renderer, TrailBuffer& tb, const World& world,
                const std::vector<ShockMarker>& markers)
{
    if (SDL_SetRenderTarget(renderer, tb.tex) != 0) {
        SDL_SetRenderDrawColor(renderer, 0,0,0,255);
        SDL_RenderClear(renderer);
        return;
    }
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

    // desvanecido de estelas
    SDL_SetRenderDrawColor(renderer, 0,0,0, to_byte(0.1f));
    SDL_RenderFillRect(renderer, nullptr);

    draw_wall(renderer, world.duct.top,    true,  world.flow.sound_speed);
    draw_wall(renderer, world.duct.bottom, false, world.flow.sound_speed);

    // choques: rojo = entrada supersónica, azul = entrada subsónica
    for (const auto& m : markers) {
        Uint8 a = to_byte(m.opacity);
        if (m.kind == ShockKind::SupersonicEntry) SDL_SetRenderDrawColor(renderer, 255,50,50,a);
        else                                      SDL_SetRenderDrawColor(renderer, 50,50,255,a);
        SDL_FRect seg{m.x - 1.5f, std::min(m.top_y, m.bottom_y), 3.0f, std::fabs(m.bottom_y - m.top_y)};
        SDL_RenderFillRectF(renderer, &seg);
    }

    for (const auto& p : world.particles) {
        Uint8 a = to_byte(p.opacity);
        if (p.supersonic) SDL_SetRenderDrawColor(renderer, 255,50,50,a);
        else              SDL_SetRenderDrawColor(renderer, 255,255,255,a);
        SDL_FRect r{p.x - p.size, p.y - p.size, 2.0f*p.size, 2.0f*p.size};
        SDL_RenderFillRectF(renderer, &r);
    }

    SDL_SetRenderTarget(renderer, nullptr);
    SDL_RenderCopy(renderer, tb.tex, nullptr, nullptr);
}
