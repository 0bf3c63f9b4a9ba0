// bench.cpp: salvo stress tests & benchmarks
//
// Measures ns/op for the kernel pools, the bullet field, SAT tests, the grid
// and a full stage tick. Raw chrono timing + printf results.
// Writes benchmarks/latest.csv when run from the repo root.
//
// Build: cmake --build build --target salvo_bench
// Run:   ./build/salvo_bench

#include "salvo_core.hpp"
#include "salvo_math.hpp"
#include "salvo_bullets.hpp"
#include "salvo_collide.hpp"
#include "salvo_spatial_grid.hpp"
#include "salvo_waves.hpp"
#include "salvo_wave_loader.hpp"
#include "salvo_stage.hpp"
#include <cassert>
#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

// =============================================================================
// Timing helpers
// =============================================================================

struct BenchResult
{
    std::string name;
    double total_ms;
    uint64_t ops;
    double ns_per_op;
};

static std::vector<BenchResult> g_results;

template <typename F>
void bench(const char *name, uint64_t ops, F &&fn)
{
    // Warmup
    fn();

    auto t0 = std::chrono::high_resolution_clock::now();
    fn();
    auto t1 = std::chrono::high_resolution_clock::now();

    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    double ns_op = (ms * 1e6) / static_cast<double>(ops);

    printf("  %-50s %8.2f ms  %10.1f ns/op\n", name, ms, ns_op);
    g_results.push_back({name, ms, ops, ns_op});
}

// Helper to prevent compiler from optimizing away a value
template <typename T>
static void do_not_optimize(T const &val)
{
    asm volatile("" : : "r,m"(val) : "memory");
}

struct Pos { float x = 0, y = 0; };

// =============================================================================
// KERNEL
// =============================================================================

void bench_pool()
{
    printf("\n--- Pool ---\n");

    bench("pool add 100k", 100000, []() {
        salvo::Sim sim;
        auto *pool = sim.pool<Pos>("pos");
        for (int i = 0; i < 100000; i++)
            pool->add(sim.spawn(), {static_cast<float>(i), 0});
    });

    bench("remove 10k via flush_removes", 10000, []() {
        salvo::Sim sim;
        auto *pool = sim.pool<Pos>("pos");
        std::vector<salvo::Id> ids;
        ids.reserve(10000);
        for (int i = 0; i < 10000; i++)
        {
            salvo::Id id = sim.spawn();
            pool->add(id, {static_cast<float>(i), 0});
            ids.push_back(id);
        }
        for (auto id : ids)
            sim.remove_entity(id);
        sim.flush_removes();
        assert(pool->empty());
    });

    bench("sim tick, 8 empty tasks x 10k", 10000, []() {
        salvo::Sim sim;
        int runs = 0;
        for (int i = 0; i < 8; i++)
            sim.schedule(("t" + std::to_string(i)).c_str(), static_cast<float>(i), [&runs](salvo::TaskContext &) { runs++; });
        for (int i = 0; i < 10000; i++)
            sim.tick(16.f);
        do_not_optimize(runs);
    });
}

// =============================================================================
// BULLET FIELD
// =============================================================================

void bench_bullets()
{
    printf("\n--- BulletField ---\n");

    bench("spawn_fan 1k x 32 bullets", 32000, []() {
        salvo::BulletField field;
        for (int i = 0; i < 1000; i++)
            field.spawn_fan(640, 360, static_cast<float>(i), 360.f, 32, 200.f, 4000.f);
        assert(field.size() == 32000);
    });

    {
        salvo::BulletField field;
        for (int i = 0; i < 50; i++)
            field.spawn_fan(640, 360, static_cast<float>(i) * 7.f, 360.f, 200, 150.f, 1e9f);
        bench("update 10k live bullets x 100 ticks", 1000000, [&]() {
            for (int t = 0; t < 100; t++)
                field.update(16.f);
            do_not_optimize(field.items()[0].pos.x);
        });
    }

    bench("bullet churn: spawn 50 / reap ~50 per tick x 2k", 2000, []() {
        salvo::BulletField field;
        for (int t = 0; t < 2000; t++)
        {
            field.spawn_fan(640, 360, static_cast<float>(t), 90.f, 50, 200.f, 500.f);
            field.update(16.f);
        }
        do_not_optimize(field.size());
    });
}

// =============================================================================
// COLLISION
// =============================================================================

void bench_collide()
{
    printf("\n--- SAT ---\n");

    salvo::Polygon diamond({100, 100}, {{0, -20}, {20, 0}, {0, 20}, {-20, 0}});
    diamond.angle_deg = 30.f;
    salvo::Polygon box = salvo::Polygon::box({90, 90}, 30, 30);

    bench("circle_vs_circle 1M", 1000000, []() {
        int hits = 0;
        for (int i = 0; i < 1000000; i++)
            hits += salvo::circle_vs_circle({{static_cast<float>(i % 50), 0}, 10}, {{20, 0}, 10}).collided;
        do_not_optimize(hits);
    });

    bench("circle_vs_polygon 1M", 1000000, [&]() {
        int hits = 0;
        for (int i = 0; i < 1000000; i++)
            hits += salvo::circle_vs_polygon({{70.f + static_cast<float>(i % 60), 100}, 5}, diamond).collided;
        do_not_optimize(hits);
    });

    bench("polygon_vs_polygon 1M", 1000000, [&]() {
        int hits = 0;
        for (int i = 0; i < 1000000; i++)
        {
            box.pos.x = 60.f + static_cast<float>(i % 60);
            hits += salvo::polygon_vs_polygon(box, diamond).collided;
        }
        do_not_optimize(hits);
    });

    bench("grid: 400 enemies, 2k bullet queries", 2000, []() {
        salvo::SpatialGrid grid(1280, 720, 128);
        salvo::Rng rng(7);
        for (uint32_t i = 0; i < 400; i++)
            grid.insert(salvo::make_id(i, 0), {rng.rf() * 1280.f, rng.rf() * 720.f}, 20.f);
        int hits = 0;
        for (int i = 0; i < 2000; i++)
            grid.query({rng.rf() * 1280.f, rng.rf() * 720.f}, 4.f, [&](salvo::Id, salvo::Vec2, float) { hits++; });
        do_not_optimize(hits);
    });
}

// =============================================================================
// STAGE
// =============================================================================

void bench_stage()
{
    printf("\n--- Stage ---\n");

    const char *doc = R"([
        { "t0": 0, "duration": 100, "enemy": "turret", "formation": "line", "count": 12, "x": 1200, "speed": 0,
          "pattern": { "name": "ring", "repeat": 1000, "spawnEveryMs": 100,
                       "bullets": [ { "speed": 120, "angleDeg": 0 }, { "speed": 120, "angleDeg": 90 },
                                    { "speed": 120, "angleDeg": 180 }, { "speed": 120, "angleDeg": 270 } ] } },
    ])";
    std::vector<salvo::Wave> waves = salvo::load_waves_text(doc);
    assert(!waves.empty());

    bench("stage tick, 12 turrets firing x 3k ticks", 3000, [&]() {
        salvo::StageConfig cfg;
        cfg.player_lives = 1000000;
        salvo::Stage stage(cfg);
        stage.load(waves);
        for (int i = 0; i < 3000; i++)
        {
            stage.set_input({0, (i / 60) % 2 ? 1.f : -1.f}, true);
            stage.tick(16.f);
        }
        do_not_optimize(stage.stats().score);
    });
}

static void write_csv()
{
    const char* path = "benchmarks/latest.csv";
    FILE* f = fopen(path, "w");
    if (!f) {
        fprintf(stderr, "warning: could not write %s (run from repo root?)\n", path);
        return;
    }
    fprintf(f, "benchmark,total_ms,ops,ns_per_op\n");
    for (auto& r : g_results)
        fprintf(f, "\"%s\",%.4f,%llu,%.2f\n",
                r.name.c_str(), r.total_ms,
                (unsigned long long)r.ops, r.ns_per_op);
    fclose(f);
    printf("\nCSV written to %s\n", path);
}

int main()
{
    printf("=== salvo benchmarks ===\n");
    printf("(warmup run + timed run per bench, reporting timed run only)\n");

    bench_pool();
    bench_bullets();
    bench_collide();
    bench_stage();

    printf("\n=== Summary ===\n");
    printf("  %-50s %10s %12s\n", "Benchmark", "Total ms", "ns/op");
    printf("  %-50s %10s %12s\n",
           "--------------------------------------------------",
           "--------", "----------");
    for (auto &r : g_results)
        printf("  %-50s %8.2f ms %10.1f\n", r.name.c_str(), r.total_ms, r.ns_per_op);
    printf("\n=== All benchmarks complete ===\n");

    write_csv();

    return 0;
}
