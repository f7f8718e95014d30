#include <SDL.h>
#include <algorithm>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <cmath>
#include "config.hpp"
#include "particles.hpp"
#include "render.hpp"

// Teclado: parámetros del flujo, acotados a los rangos de la línea de comandos
static void handle_key(SDL_Keycode k, World& world) {
    FlowParams& fp = world.flow;
    switch (k) {
        case SDLK_q: fp.sound_speed = std::min(kSoundSpeedMax, fp.sound_speed + 10.0f); break;
        case SDLK_a: fp.sound_speed = std::max(kSoundSpeedMin, fp.sound_speed - 10.0f); break;
        case SDLK_w: fp.injection_velocity = std::min(kVelocityMax, fp.injection_velocity + 10.0f); break;
        case SDLK_s: fp.injection_velocity = std::max(kVelocityMin, fp.injection_velocity - 10.0f); break;
        case SDLK_e: fp.time_scale = std::min(kTimeScaleMax/100.0f, fp.time_scale + 0.001f); break;
        case SDLK_d: fp.time_scale = std::max(kTimeScaleMin/100.0f, fp.time_scale - 0.001f); break;
        case SDLK_r: world.reset_walls(); break;
        default: break;
    }
}

int main(int argc, char** argv) {
    try {
        AppConfig cfg = parse_args(argc, argv);

        if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
            std::cerr << "SDL_Init error: " << SDL_GetError() << "\n";
            return 1;
        }

        SDL_Window* window = SDL_CreateWindow(
            "Ducto compresible",
            SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
            cfg.width, cfg.height, SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE
        );
        if (!window) {
            std::cerr << "SDL_CreateWindow: " << SDL_GetError() << "\n";
            SDL_Quit(); return 1;
        }

        Uint32 renderer_flags = SDL_RENDERER_ACCELERATED | SDL_RENDERER_TARGETTEXTURE;
        if (!cfg.novsync) renderer_flags |= SDL_RENDERER_PRESENTVSYNC;

        SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, renderer_flags);
        if (!renderer) {
            std::cerr << "SDL_CreateRenderer: " << SDL_GetError() << "\n";
            SDL_DestroyWindow(window); SDL_Quit(); return 1;
        }

        if (cfg.fpslog || cfg.profile) {
            SDL_RendererInfo ri{};
            if (SDL_GetRendererInfo(renderer, &ri)==0) {
                std::cout << "Renderer: " << (ri.name?ri.name:"<unknown>") << "\n";
            }
        }

        TrailBuffer tb;
        if (!create_trail_buffer(renderer, cfg.width, cfg.height, tb)) {
            std::cerr << "SDL_CreateTexture: " << SDL_GetError() << "\n";
            SDL_DestroyRenderer(renderer); SDL_DestroyWindow(window); SDL_Quit(); return 1;
        }

        World world(cfg);
        DragHandle drag;
        Uint64 pf = SDL_GetPerformanceFrequency();
        Uint64 t0 = SDL_GetPerformanceCounter();
        double accTime = 0.0;

        bool running = true;
        SDL_Event ev;

        double fps_accum = 0.0; int fps_frames = 0; double fps_smoothed = 0.0;
        auto update_title = [&](double fps){
            std::ostringstream tt;
            tt<<"Ducto compresible"
              <<" | c="<<(int)std::round(world.flow.sound_speed)<<" m/s"
              <<" | v0="<<(int)std::round(world.flow.injection_velocity)<<" m/s"
              <<" | t="<<std::fixed<<std::setprecision(1)<<world.flow.time_scale*100.0f<<"%"
              <<" | N="<<world.particles.size()
              <<" | FPS="<<(int)std::round(fps);
            SDL_SetWindowTitle(window, tt.str().c_str());
        };
        update_title(0.0);

        while (running) {
            // ---- Entrada: paredes y parámetros antes de simular ----
            while (SDL_PollEvent(&ev)) {
                if (ev.type == SDL_QUIT) running = false;
                else if (ev.type == SDL_KEYDOWN) {
                    if (ev.key.keysym.sym == SDLK_ESCAPE) running = false;
                    else { handle_key(ev.key.keysym.sym, world); update_title(fps_smoothed); }
                }
                else if (ev.type == SDL_MOUSEBUTTONDOWN && ev.button.button == SDL_BUTTON_LEFT) {
                    drag = world.duct.pick(float(ev.button.x), float(ev.button.y));
                }
                else if (ev.type == SDL_MOUSEMOTION) {
                    world.duct.move_handle(drag, float(ev.motion.x), float(ev.motion.y));
                }
                else if (ev.type == SDL_MOUSEBUTTONUP && ev.button.button == SDL_BUTTON_LEFT) {
                    drag.active = false;
                }
                else if (ev.type == SDL_WINDOWEVENT && ev.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
                    int w = ev.window.data1, h = ev.window.data2;
                    destroy_trail_buffer(tb);
                    if (!create_trail_buffer(renderer, w, h, tb)) {
                        std::cerr << "SDL_CreateTexture: " << SDL_GetError() << "\n";
                        running = false;
                    }
                    world.resize(w, h);
                    drag.active = false;
                }
            }
            if (!running) break;

            Uint64 t1 = SDL_GetPerformanceCounter();
            double dt = double(t1 - t0)/double(pf);
            t0 = t1;
            accTime += dt;
            double now_ms = accTime * 1000.0;
            float step_dt = float(std::min(dt, 0.05));   // pausas largas no saltan el ducto

            // ---- Simulación ----
            Uint64 tA = 0, tB = 0, tC = 0;
            if (cfg.profile) tA = SDL_GetPerformanceCounter();

            world.maybe_spawn(now_ms);
            world.step(step_dt, now_ms);
            std::vector<ShockMarker> markers = world.shock_markers(now_ms);

            if (cfg.profile) tB = SDL_GetPerformanceCounter();

            // ---- Render ----
            SDL_SetRenderDrawColor(renderer, 0,0,0,255);
            SDL_RenderClear(renderer);
            draw_frame(renderer, tb, world, markers);
            SDL_RenderPresent(renderer);

            if (cfg.profile) {
                tC = SDL_GetPerformanceCounter();
                double k = 1000.0 / double(pf);
                double sim_ms    = (tB - tA) * k;
                double render_ms = (tC - tB) * k;
                std::cout << "sim=" << sim_ms << " ms, render=" << render_ms << " ms"
                          << ", particulas=" << world.particles.size()
                          << ", cubetas=" << world.shocks.bucket_count() << "\n";
            }

            // ---- FPS (cada ~1s) ----
            fps_accum += dt; fps_frames++;
            if (fps_accum >= 1.0) {
                double fps_inst = fps_frames / fps_accum;
                fps_smoothed = (fps_smoothed==0.0) ? fps_inst : (0.8*fps_smoothed + 0.2*fps_inst);
                update_title(fps_smoothed);
                if (cfg.fpslog) std::cout << "FPS= " << fps_smoothed << "\n";
                fps_accum = 0.0; fps_frames = 0;
            }
        }

        destroy_trail_buffer(tb);
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }
}
