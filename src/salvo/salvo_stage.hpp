// salvo_stage.hpp: One playable stage on top of the Sim kernel
//
// Wires the pieces into a fixed task order:
//
//   waves    (INPUT)          trigger waves whose window contains sim time,
//                              bring in a boss once the boss clock runs out
//   ship     (SIMULATE - 1)   move + clamp the ship, player gun
//   enemies  (SIMULATE + 1)   formation movement, aimed shots, scripted volleys
//   boss     (SIMULATE + 1.5) boss movement and phase volleys
//   bullets  (SIMULATE + 2)   integrate both bullet fields
//   collide  (COLLIDE)        player shots vs enemies and boss, enemy
//                              shots/hulls and the boss vs the ship
//   cleanup  (CLEANUP)        reap anything that left the field
//
// Everything runs on sim time and the stage Rng, so two stages built from the
// same config, waves and input sequence stay identical tick for tick.
//
//   Stage stage(cfg);
//   stage.load(load_waves_text(text, cfg.wave_bounds()));
//   while (!stage.game_over()) { stage.set_input(dir, true); stage.tick(16.f); }
//
// The boss clock only runs while no boss is on the field, so the next boss
// arrives boss.every_ms after the previous one falls.
//
// Depends: salvo_core, salvo_math, salvo_bullets, salvo_waves, salvo_collide,
//          salvo_spatial_grid, salvo_util, salvo_boss, salvo_config

#pragma once
#include "salvo_core.hpp"
#include "salvo_math.hpp"
#include "salvo_bullets.hpp"
#include "salvo_waves.hpp"
#include "salvo_collide.hpp"
#include "salvo_spatial_grid.hpp"
#include "salvo_util.hpp"
#include "salvo_boss.hpp"
#include "salvo_config.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace salvo {

struct Enemy {
	EnemyType type      = EnemyType::Chaser;
	Formation formation = Formation::Line;
	Vec2  pos, vel;
	float hp     = 0;
	float radius = 20;
	float speed  = 0;      // units/s toward -x
	float age_ms = 0;
	int   slot   = 0;      // index inside the formation
	float offset = 0;      // slot - centre of the formation
	float drift  = 0;      // vertical speed for random formations
	std::shared_ptr<const BulletPattern> pattern;   // shared by the formation
	Cooldown fire;
	Counter  volleys;
};

struct Ship {
	Vec2  pos;
	Vec2  move;            // input direction, any length
	bool  firing     = false;
	int   lives      = 3;
	float iframes_ms = 0;
	bool  alive      = true;
	Cooldown gun;
};

struct StageStats {
	int score           = 0;
	int kills           = 0;
	int waves_triggered = 0;
	int hits_taken      = 0;
	int bosses_spawned  = 0;
	int bosses_defeated = 0;
};

class Stage {
	StageConfig   m_cfg;
	Sim           m_sim;
	BulletField   m_enemy_shots;
	BulletField   m_player_shots;
	Pool<Enemy>*  m_enemies = nullptr;
	std::vector<Wave> m_waves;
	WaveCursor    m_cursor;
	Rng           m_rng;
	SpatialGrid   m_grid;
	Ship          m_ship;
	StageStats    m_stats;
	std::optional<Boss> m_boss;
	float         m_boss_clock_ms = 0;
	bool          m_over = false;

	static const StageConfig& checked(const StageConfig& cfg) {
		std::string err;
		if (!check_stage_config(cfg, err))
			throw Fault("stage config: " + err);
		return cfg;
	}

public:
	// Throws Fault when `cfg` fails check_stage_config.
	explicit Stage(const StageConfig& cfg = {})
		: m_cfg(checked(cfg))
		, m_enemy_shots(cfg.enemy_bullet_radius)
		, m_player_shots(cfg.player_bullet_radius)
		, m_rng(cfg.seed)
		, m_grid(cfg.width, cfg.height, cfg.grid_cell)
	{
		m_enemies = m_sim.pool<Enemy>("enemies");
		reset_ship();
		install_tasks();
	}

	Stage(const Stage&) = delete;
	Stage& operator=(const Stage&) = delete;

	// Replace the wave list and restart the stage from t = 0.
	void load(std::vector<Wave> waves) {
		m_waves = std::move(waves);
		reset();
	}

	void reset() {
		m_sim.clear_entities();
		m_sim.reset_clock();
		m_enemy_shots.clear();
		m_player_shots.clear();
		m_cursor.reset();
		m_rng = Rng(m_cfg.seed);
		m_stats = {};
		m_boss.reset();
		m_boss_clock_ms = 0;
		m_over = false;
		reset_ship();
	}

	void set_input(Vec2 move, bool firing) {
		m_ship.move = move;
		m_ship.firing = firing;
	}

	void tick(float dt_ms) { m_sim.tick(dt_ms); }

	// Spawn one wave's formation now, regardless of its time window. The
	// formation keeps its own copy of the wave's pattern.
	void spawn_wave(const Wave& w) {
		const EnemyStats& st = m_cfg.stats(w.enemy);
		float anchor_y = w.y >= 0 ? w.y : m_cfg.height * 0.5f;
		float centre = (float)(w.count - 1) * 0.5f;
		float arc_r = w.spacing * (float)w.count * 0.5f;
		std::shared_ptr<const BulletPattern> pattern;
		if (w.has_pattern)
			pattern = std::make_shared<const BulletPattern>(w.pattern);

		for (int i = 0; i < w.count; i++) {
			float k = (float)i - centre;
			Vec2 p;
			switch (w.formation) {
			case Formation::Line:
				p = {w.x, anchor_y + k * w.spacing};
				break;
			case Formation::V:
				p = {w.x + std::fabs(k) * w.spacing, anchor_y + k * w.spacing};
				break;
			case Formation::Sine:
				p = {w.x + (float)i * w.spacing, anchor_y};
				break;
			case Formation::Arc: {
				float a = w.count > 1 ? -w.spread_deg * 0.5f + w.spread_deg * (float)i / (float)(w.count - 1) : 0.f;
				float r = deg_to_rad(a);
				p = {w.x + arc_r * (1.f - std::cos(r)), anchor_y + arc_r * std::sin(r)};
				break;
			}
			case Formation::Random:
				p = {w.x + (float)i * w.spacing * 0.5f, m_rng.rfr(st.radius, m_cfg.height - st.radius)};
				break;
			}

			Enemy e;
			e.type      = w.enemy;
			e.formation = w.formation;
			e.pos       = p;
			e.hp        = st.hp;
			e.radius    = st.radius;
			e.speed     = w.speed >= 0 ? w.speed : st.speed;
			e.slot      = i;
			e.offset    = k;
			if (w.formation == Formation::Random)
				e.drift = m_rng.rfr(-50.f, 50.f);
			if (pattern) {
				e.pattern = pattern;
				e.fire    = Cooldown((float)w.pattern.spawn_every_ms);
				e.volleys = Counter(w.pattern.repeat);
			} else {
				e.fire = Cooldown(st.fire_rate > 0 ? 1000.f / st.fire_rate : 1000.f);
			}
			m_enemies->add(m_sim.spawn(), e);
		}
	}

	// Bring a boss in at the right edge now. No-op while one is already up.
	void spawn_boss() {
		if (m_boss) return;
		m_boss.emplace(m_cfg.boss, Vec2{m_cfg.width - 200.f, m_cfg.height * 0.5f});
		m_boss_clock_ms = 0;
		m_stats.bosses_spawned++;
		printf("[stage] boss %d in at %.0f ms\n", m_stats.bosses_spawned, m_sim.time_ms());
	}

	// ====== ACCESSORS ======
	const StageConfig& config() const { return m_cfg; }
	Sim& sim() { return m_sim; }
	const Sim& sim() const { return m_sim; }
	const Pool<Enemy>& enemies() const { return *m_enemies; }
	const BulletField& enemy_shots() const { return m_enemy_shots; }
	const BulletField& player_shots() const { return m_player_shots; }
	BulletField& enemy_shots() { return m_enemy_shots; }
	BulletField& player_shots() { return m_player_shots; }
	const Ship& ship() const { return m_ship; }
	const StageStats& stats() const { return m_stats; }
	const std::vector<Wave>& waves() const { return m_waves; }
	double time_ms() const { return m_sim.time_ms(); }
	bool game_over() const { return m_over; }
	bool cleared() const { return m_cursor.fired_count() == m_waves.size() && m_enemies->empty() && !m_boss; }
	const Boss* boss() const { return m_boss ? &*m_boss : nullptr; }

	// Ship outline in world space: a dart pointing along +x.
	Polygon ship_hull() const {
		float r = m_cfg.player_radius;
		return Polygon(m_ship.pos, {{r, 0}, {-r, -r * 0.8f}, {-r, r * 0.8f}});
	}

private:
	void reset_ship() {
		m_ship = Ship{};
		m_ship.pos = {m_cfg.width * 0.15f, m_cfg.height * 0.5f};
		m_ship.lives = m_cfg.player_lives;
		float interval = m_cfg.player_fire_rate > 0 ? 1000.f / m_cfg.player_fire_rate : 0.f;
		m_ship.gun = Cooldown(interval);
		m_ship.gun.elapsed = interval;   // first shot leaves on the first firing frame
	}

	void hit_ship() {
		m_stats.hits_taken++;
		m_ship.lives--;
		m_ship.iframes_ms = m_cfg.player_iframes_ms;
		if (m_ship.lives > 0)
			return;
		m_ship.lives = 0;
		m_ship.alive = false;
		m_over = true;
		printf("[stage] game over at %.0f ms, score %d\n", m_sim.time_ms(), m_stats.score);
	}

	void move_enemy(Enemy& e, float dt_ms) {
		float t = e.age_ms;
		float vy = 0.f;
		switch (e.formation) {
		case Formation::Line:   break;
		case Formation::Sine:   vy = std::sin((t + (float)e.slot * 200.f) / 300.f) * 80.f; break;
		case Formation::Arc:    vy = e.offset * 45.f; break;
		case Formation::V:      vy = e.offset * 50.f; break;
		case Formation::Random: vy = e.drift; break;
		}
		switch (e.type) {
		case EnemyType::Chaser:
			vy += std::clamp((m_ship.pos.y - e.pos.y) * 2.f, -60.f, 60.f);
			break;
		case EnemyType::Turret:
			break;
		case EnemyType::SineFlyer:
			vy += std::sin(t / 1000.f * 2.f * PI * 2.f) * 100.f;
			break;
		}
		e.vel = {-e.speed, vy};
		e.pos += e.vel * (dt_ms / 1000.f);
		e.age_ms += dt_ms;
	}

	void fire_enemy(Enemy& e, float dt_ms) {
		// Guns stay cold until the enemy scrolls into view.
		if (e.pos.x > m_cfg.width)
			return;
		if (e.pattern) {
			if (!e.volleys.done && e.fire.ready(dt_ms)) {
				m_enemy_shots.spawn_pattern(e.pos.x, e.pos.y, *e.pattern);
				e.volleys.increment();
			}
			return;
		}
		if (m_cfg.stats(e.type).fire_rate <= 0 || !e.fire.ready(dt_ms) || !m_ship.alive)
			return;
		Vec2 to = m_ship.pos - e.pos;
		float angle = rad_to_deg(std::atan2(to.y, to.x));
		m_enemy_shots.spawn(e.pos, angle, m_cfg.enemy_bullet_speed, m_cfg.enemy_bullet_life);
	}

	void install_tasks() {
		m_sim.schedule("waves", Phase::INPUT, [this](TaskContext& ctx) {
			if (m_over) return;
			for (const Wave* w : m_cursor.poll(m_waves, ctx.time_ms())) {
				spawn_wave(*w);
				m_stats.waves_triggered++;
			}
			if (m_boss || m_cfg.boss.every_ms <= 0) return;
			m_boss_clock_ms += ctx.dt_ms();
			if (m_boss_clock_ms >= m_cfg.boss.every_ms)
				spawn_boss();
		}, true);

		m_sim.schedule("ship", Phase::SIMULATE - 1.f, [this](TaskContext& ctx) {
			if (m_over || !m_ship.alive) return;
			float dt = ctx.dt_ms();
			m_ship.pos += norm(m_ship.move) * (m_cfg.player_speed * dt / 1000.f);
			float r = m_cfg.player_radius;
			m_ship.pos.x = std::clamp(m_ship.pos.x, r, m_cfg.width - r);
			m_ship.pos.y = std::clamp(m_ship.pos.y, r, m_cfg.height - r);
			if (m_ship.iframes_ms > 0) m_ship.iframes_ms = std::max(0.f, m_ship.iframes_ms - dt);

			if (!m_ship.firing) {
				m_ship.gun.elapsed = std::min(m_ship.gun.elapsed + dt, m_ship.gun.interval);
				return;
			}
			if (m_ship.gun.ready(dt))
				m_player_shots.spawn_fan(m_ship.pos.x + r, m_ship.pos.y, 0.f, m_cfg.player_spread_deg,
				                         m_cfg.player_shot_count, m_cfg.player_bullet_speed, m_cfg.player_bullet_life);
		}, true);

		m_sim.schedule("enemies", Phase::SIMULATE + 1.f, [this](TaskContext& ctx) {
			if (m_over) return;
			float dt = ctx.dt_ms();
			m_enemies->each_mut([&](Enemy& e) {
				move_enemy(e, dt);
				fire_enemy(e, dt);
			});
		}, true);

		m_sim.schedule("boss", Phase::SIMULATE + 1.5f, [this](TaskContext& ctx) {
			if (m_over || !m_boss) return;
			if (!m_boss->update(ctx.dt_ms(), m_ship.pos) || !m_ship.alive) return;
			Vec2 at = m_boss->pos();
			for (const BulletSpec& s : m_boss->volley(m_ship.pos, m_cfg.enemy_bullet_life))
				m_enemy_shots.spawn(at, s.angle_deg, s.speed, s.life_ms, s.accel);
		}, true);

		m_sim.schedule("bullets", Phase::SIMULATE + 2.f, [this](TaskContext& ctx) {
			if (m_over) return;
			m_enemy_shots.update(ctx.dt_ms());
			m_player_shots.update(ctx.dt_ms());
		}, true);

		m_sim.schedule("collide", Phase::COLLIDE, [this](TaskContext& ctx) {
			if (m_over) return;

			m_grid.clear();
			m_enemies->each([&](Id id, const Enemy& e) { m_grid.insert(id, e.pos, e.radius); });

			// Player shots vs enemies. A shot is spent on its first hit.
			m_player_shots.each([&](Id bid, const Bullet& b) {
				bool spent = false;
				if (m_boss && m_boss->alive()
				    && circle_vs_circle({b.pos, b.radius}, {m_boss->pos(), m_boss->radius()}).collided) {
					spent = true;
					if (m_boss->take_damage(m_cfg.player_bullet_damage)) {
						m_stats.score += m_boss->score();
						m_stats.bosses_defeated++;
					}
				}
				m_grid.query(b.pos, b.radius, [&](Id eid, Vec2, float) {
					if (spent) return;
					Enemy* e = m_enemies->get(eid);
					if (!e || e->hp <= 0) return;
					if (!circle_vs_circle({b.pos, b.radius}, {e->pos, e->radius}).collided) return;
					spent = true;
					e->hp -= m_cfg.player_bullet_damage;
					if (e->hp <= 0) {
						ctx.remove_entity(eid);
						m_stats.score += m_cfg.stats(e->type).score;
						m_stats.kills++;
					}
				});
				if (spent)
					ctx.defer([this, bid] { m_player_shots.remove(bid); });
			});
			if (m_boss && !m_boss->alive()) {
				printf("[stage] boss %d down at %.0f ms, score %d\n",
				       m_stats.bosses_defeated, m_sim.time_ms(), m_stats.score);
				m_boss.reset();
			}

			if (!m_ship.alive || m_ship.iframes_ms > 0) return;

			Polygon hull = ship_hull();
			float reach = m_cfg.player_radius * 1.5f;
			bool hit = false;
			m_enemy_shots.each([&](Id bid, const Bullet& b) {
				if (hit) return;
				float rr = reach + b.radius;
				if (len2(b.pos - m_ship.pos) > rr * rr) return;
				if (!circle_vs_polygon({b.pos, b.radius}, hull).collided) return;
				hit = true;
				ctx.defer([this, bid] { m_enemy_shots.remove(bid); });
			});
			// An enemy that rams the ship is destroyed without scoring.
			if (!hit) {
				m_enemies->each([&](Id eid, const Enemy& e) {
					if (hit || e.hp <= 0) return;
					float rr = reach + e.radius;
					if (len2(e.pos - m_ship.pos) > rr * rr) return;
					hit = circle_vs_polygon({e.pos, e.radius}, hull).collided;
					if (hit)
						ctx.remove_entity(eid);
				});
			}
			if (!hit && m_boss)
				hit = circle_vs_polygon({m_boss->pos(), m_boss->radius()}, hull).collided;
			if (hit)
				hit_ship();
		}, true);

		m_sim.schedule("cleanup", Phase::CLEANUP, [this](TaskContext& ctx) {
			float m = m_cfg.cull_margin;
			m_enemy_shots.cull_outside({-m, -m}, {m_cfg.width + m, m_cfg.height + m});
			m_player_shots.cull_outside({-m, -m}, {m_cfg.width + m, m_cfg.height + m});
			// No cull past the right edge: formations trail in from there.
			m_enemies->each([&](Id id, const Enemy& e) {
				if (e.pos.x < -m || e.pos.y < -m || e.pos.y > m_cfg.height + m)
					ctx.remove_entity(id);
			});
		}, true);
	}
};

} // namespace salvo
