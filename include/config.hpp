#pragma once
#include <string>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <limits>
#include <cstdlib>

struct AppConfig {
    int   width  = 1280;    // >= 640
    int   height = 720;     // >= 480
    int   seed   = -1;      // -1 -> random_device
    bool  fpslog = false;   // FPS en consola
    bool  novsync = false;  // medir cómputo puro
    bool  profile = false;  // tiempos sim/render
    bool  verbose = false;  // log de transiciones de Mach

    // ---- Flujo ----
    float sound_speed = 343.0f;  // m/s
    float velocity    = 100.0f;  // velocidad de inyección (m/s)
    float time_scale  = 1.0f;    // porcentaje (0.1..2)

    // ---- Ducto ----
    int   points      = 5;       // puntos de control por pared
    float duct_length = 5.0f;    // ancho físico del dominio (m)

    // ---- Choques / partículas ----
    int   shock_threshold = 1;     // eventos por dirección para dibujar
    int   max_particles   = 5000;  // tope de partículas vivas
    bool  parallel        = false; // fase de flujo con OpenMP
};

// Rangos admitidos (también usados por los controles de teclado)
constexpr float kSoundSpeedMin = 50.0f,  kSoundSpeedMax = 2000.0f;
constexpr float kVelocityMin   = 1.0f,   kVelocityMax   = 2000.0f;
constexpr float kTimeScaleMin  = 0.1f,   kTimeScaleMax  = 2.0f;

inline void print_usage(const char* prog) {
    std::cout << "Uso: " << prog
              << " [--width W] [--height H] [--seed S]"
                 " [--sound-speed C] [--velocity V] [--time-scale P]"
                 " [--points N] [--duct-length L] [--shock-threshold T] [--max-particles M]"
                 " [--parallel] [--fpslog] [--profile] [--novsync] [--verbose]\n"
              << "Teclas: Q/A sonido +-10, W/S velocidad +-10, E/D escala de tiempo +-0.1%,"
                 " R reiniciar paredes, Esc salir\n";
}

inline bool parse_int(const char* s, int& out, int minv, int maxv) {
    try { long v = std::stol(s); if (v<minv || v>maxv) return false; out=int(v); return true; }
    catch (const std::exception&) { return false; }
}
inline bool parse_float(const char* s, float& out, float minv, float maxv) {
    try { float v = std::stof(s); if (v<minv || v>maxv) return false; out=v; return true; }
    catch (const std::exception&) { return false; }
}

inline AppConfig parse_args(int argc, char** argv) {
    AppConfig cfg;
    for (int i=1; i<argc; ++i) {
        std::string a = argv[i];
        auto need = [&](const char* name){ if (i+1>=argc) throw std::runtime_error(std::string("Falta valor para ")+name); return argv[++i]; };

        if (a=="--width"||a=="-w"){ const char* v=need(a.c_str()); if(!parse_int(v,cfg.width,640,16384))  throw std::runtime_error("width invalido (>=640)"); }
        else if (a=="--height"||a=="-h"){ const char* v=need(a.c_str()); if(!parse_int(v,cfg.height,480,16384)) throw std::runtime_error("height invalido (>=480)"); }
        else if (a=="--seed"){ const char* v=need(a.c_str()); int tmp; if(!parse_int(v,tmp,-1,std::numeric_limits<int>::max())) throw std::runtime_error("seed invalida"); cfg.seed=tmp; }
        else if (a=="--sound-speed"){ const char* v=need(a.c_str()); float tmp; if(!parse_float(v,tmp,kSoundSpeedMin,kSoundSpeedMax)) throw std::runtime_error("sound-speed invalida (50..2000)"); cfg.sound_speed=tmp; }
        else if (a=="--velocity"){ const char* v=need(a.c_str()); float tmp; if(!parse_float(v,tmp,kVelocityMin,kVelocityMax)) throw std::runtime_error("velocity invalida (1..2000)"); cfg.velocity=tmp; }
        else if (a=="--time-scale"){ const char* v=need(a.c_str()); float tmp; if(!parse_float(v,tmp,kTimeScaleMin,kTimeScaleMax)) throw std::runtime_error("time-scale invalida (0.1..2 %)"); cfg.time_scale=tmp; }
        else if (a=="--points"){ const char* v=need(a.c_str()); if(!parse_int(v,cfg.points,2,32)) throw std::runtime_error("points invalido (2..32)"); }
        else if (a=="--duct-length"){ const char* v=need(a.c_str()); float tmp; if(!parse_float(v,tmp,0.5f,100.0f)) throw std::runtime_error("duct-length invalida (0.5..100 m)"); cfg.duct_length=tmp; }
        else if (a=="--shock-threshold"){ const char* v=need(a.c_str()); if(!parse_int(v,cfg.shock_threshold,1,100)) throw std::runtime_error("shock-threshold invalido (1..100)"); }
        else if (a=="--max-particles"){ const char* v=need(a.c_str()); if(!parse_int(v,cfg.max_particles,1,std::numeric_limits<int>::max())) throw std::runtime_error("max-particles invalido (>=1)"); }
        else if (a=="--parallel"){ cfg.parallel=true; }
        else if (a=="--fpslog"){ cfg.fpslog=true; }
        else if (a=="--novsync"){ cfg.novsync=true; }
        else if (a=="--profile"){ cfg.profile=true; }
        else if (a=="--verbose"||a=="-v"){ cfg.verbose=true; }
        else if (a=="--help"||a=="-?"){ print_usage(argv[0]); std::exit(0); }
        else { std::ostringstream oss; oss<<"Argumento desconocido: "<<a; throw std::runtime_error(oss.str()); }
    }
    return cfg;
}
