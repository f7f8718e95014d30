#pragma once
#include <cstddef>
#include <deque>
#include <map>
#include <vector>
#include "duct.hpp"

enum class ShockKind { SupersonicEntry, SubsonicEntry };

struct ShockEvent {
    ShockKind kind;
    double    t_ms;   // marca de tiempo (ms)
};

// Marcador a dibujar: segmento vertical entre las dos paredes
struct ShockMarker {
    float     x;
    float     top_y, bottom_y;
    float     opacity;    // 1 -> recién creado, 0 -> expirado
    ShockKind kind;       // dirección dominante
};

constexpr size_t kShockWindow     = 100;     // eventos por cubeta
constexpr double kShockLifetimeMs = 300.0;   // vida de un evento
constexpr float  kShockGroupingM  = 0.1f;    // 10 cm

// Agrupa transiciones de Mach por posición (cubetas de `grouping_px`)
// y decide qué marcadores dibujar.
class ShockTracker {
public:
    explicit ShockTracker(float grouping_px, int threshold = 1,
                          double lifetime_ms = kShockLifetimeMs,
                          size_t window = kShockWindow);

    void report_transition(float x, ShockKind kind, double t_ms);
    void prune_expired(double now_ms);
    std::vector<ShockMarker> active_markers(double now_ms, const Duct& duct) const;

    // round(x / d) * d
    float bucket_key(float x) const;

    size_t bucket_count() const { return buckets_.size(); }
    const std::deque<ShockEvent>* bucket_at(float x) const;

    // Nueva distancia de agrupamiento; descarta las cubetas existentes
    void  set_grouping(float grouping_px);
    float grouping() const { return grouping_; }
    void  set_threshold(int t);
    int   threshold() const { return threshold_; }

private:
    long bucket_index(float x) const;

    float  grouping_;
    int    threshold_;
    double lifetime_;
    size_t window_;
    std::map<long, std::deque<ShockEvent>> buckets_;  // índice de cubeta -> eventos
};
