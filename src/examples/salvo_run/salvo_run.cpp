// salvo_run.cpp: Headless stage runner
// Build: see CMakeLists.txt (target salvo_run)
// Run:   ./salvo_run <waves.json5> [seconds] [dt_ms] [config.json]
//
// Loads a wave file, flies the ship with a simple autopilot at a fixed step
// and prints a status line every 5 s of sim time plus a final summary. Same
// inputs always print the same numbers.

#include "salvo_core.hpp"
#include "salvo_math.hpp"
#include "salvo_config.hpp"
#include "salvo_wave_loader.hpp"
#include "salvo_stage.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

using namespace salvo;

// =============================================================================
// File input: same size ceiling as a fetched wave document
// =============================================================================
static bool read_wave_file(const char* path, std::string& out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        fprintf(stderr, "[run] cannot open %s\n", path);
        return false;
    }
    WaveFetchBuffer buf;
    char chunk[4096];
    while (f) {
        f.read(chunk, sizeof(chunk));
        std::streamsize n = f.gcount();
        if (n <= 0) break;
        if (!buf.append(chunk, (size_t)n)) {
            fprintf(stderr, "[run] %s is larger than %zu bytes\n", path, buf.limit);
            return false;
        }
    }
    out = std::move(buf.text);
    return true;
}

// =============================================================================
// Autopilot: line up with the nearest enemy, sidestep close shots
// =============================================================================
static Vec2 autopilot(const Stage& stage) {
    const Ship& ship = stage.ship();
    Vec2 move{0, 0};

    float best = 1e9f;
    stage.enemies().each([&](const Enemy& e) {
        float d = dist(e.pos, ship.pos);
        if (d < best) { best = d; move.y = e.pos.y > ship.pos.y ? 1.f : -1.f; }
    });

    Vec2 threat{0, 0};
    stage.enemy_shots().each([&](const Bullet& b) {
        Vec2 away = ship.pos - b.pos;
        float d2 = len2(away);
        if (d2 < 90.f * 90.f && d2 > 0.f) threat += away * (1.f / d2);
    });
    if (len2(threat) > 0.f) move = norm(threat);

    // Drift back toward the home column.
    float home = stage.config().width * 0.15f;
    if (std::fabs(ship.pos.x - home) > 20.f) move.x += ship.pos.x > home ? -0.5f : 0.5f;
    return move;
}

// =============================================================================
// Main
// =============================================================================
int main(int argc, char** argv) {
    if (argc < 2) {
        fprintf(stderr, "usage: %s <waves.json5> [seconds] [dt_ms] [config.json]\n", argv[0]);
        return 1;
    }
    float seconds = argc > 2 ? strtof(argv[2], nullptr) : 60.f;
    float dt_ms   = argc > 3 ? strtof(argv[3], nullptr) : 1000.f / 60.f;
    if (!std::isfinite(seconds) || seconds <= 0.f || !std::isfinite(dt_ms) || dt_ms <= 0.f) {
        fprintf(stderr, "[run] seconds and dt_ms must be positive\n");
        return 1;
    }

    StageConfig cfg;
    if (argc > 4 && !load_stage_config_file(argv[4], cfg))
        return 1;

    std::string text;
    if (!read_wave_file(argv[1], text)) return 1;
    std::vector<Wave> waves = load_waves_text(text, cfg.wave_bounds());
    if (waves.empty())
        fprintf(stderr, "[run] no waves loaded from %s; running an empty stage\n", argv[1]);

    Stage stage(cfg);
    stage.load(std::move(waves));
    printf("[run] %s: %zu wave(s), %.0f s at %.2f ms/tick, seed %u\n",
           argv[1], stage.waves().size(), seconds, dt_ms, cfg.seed);

    double next_report = 5000.0;
    stage.sim().schedule("status", Phase::REPORT, [&stage, next_report](TaskContext& ctx) mutable {
        if (ctx.time_ms() < next_report) return;
        next_report += 5000.0;
        printf("[run] t=%.0f  score=%d  lives=%d  enemies=%zu  shots=%zu/%zu",
               ctx.time_ms(), stage.stats().score, stage.ship().lives, stage.enemies().size(),
               stage.player_shots().size(), stage.enemy_shots().size());
        if (const Boss* boss = stage.boss())
            printf("  boss=%s %.0f/%.0f", boss_phase_name(boss->phase()), boss->hp(), boss->max_hp());
        printf("\n");
    });

    double end_ms = (double)seconds * 1000.0;
    while (stage.time_ms() < end_ms && !stage.game_over()) {
        stage.set_input(autopilot(stage), true);
        stage.tick(dt_ms);
    }

    for (const auto& f : stage.sim().faults())
        fprintf(stderr, "[run] task fault: %s\n", f.c_str());

    const StageStats& st = stage.stats();
    printf("[run] done at t=%.0f: %s  score=%d  kills=%d  waves=%d/%zu  bosses=%d/%d  hits=%d  lives=%d\n",
           stage.time_ms(), stage.game_over() ? "game over" : (stage.cleared() ? "cleared" : "survived"),
           st.score, st.kills, st.waves_triggered, stage.waves().size(),
           st.bosses_defeated, st.bosses_spawned, st.hits_taken, stage.ship().lives);
    return stage.sim().faults().empty() ? 0 : 2;
}
