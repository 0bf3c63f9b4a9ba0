// salvo_bullets.hpp: BulletField: the live projectile set
//
// Owns its own slot arena, so every bullet has a generation-checked Id that
// survives update() and swap-removal of its neighbours, and stops resolving
// the moment the bullet is reaped, removed or cleared.
//
//   BulletField field;
//   field.spawn_fan(x, y, 180.f, 60.f, 5, 220.f, 4000.f);
//   Id first = field.id_at(0);
//   field.update(16.f);
//   if (auto* b = field.get(first)) { /* same bullet, moved */ }
//
// Angles are degrees; 0° points along +x (scroll direction), positive angles
// rotate toward +y. Speeds are units/second, time is milliseconds.
//
// Depends: salvo_core.hpp, salvo_math.hpp

#pragma once
#include "salvo_core.hpp"
#include "salvo_math.hpp"
#include <cmath>
#include <string>
#include <vector>

namespace salvo {

constexpr float DEFAULT_BULLET_LIFE_MS = 4000.f;
constexpr float DEFAULT_BULLET_RADIUS  = 4.f;

struct Bullet {
	Vec2  pos, vel;
	float life_ms = 0;
	float accel   = 0;   // units/s², applied along dir
	Vec2  dir;           // unit heading at spawn
	float radius  = DEFAULT_BULLET_RADIUS;
};

// One entry of a data-driven pattern. Absolute angle, not aim-relative.
struct BulletSpec {
	float speed     = 0;
	float angle_deg = 0;
	float accel     = 0;
	float life_ms   = DEFAULT_BULLET_LIFE_MS;
};

struct BulletPattern {
	std::string name;
	int repeat         = 1;
	int spawn_every_ms = 0;
	std::vector<BulletSpec> bullets;
};

class BulletField {
	Slots m_slots;
	Pool<Bullet> m_pool;
	float m_radius = DEFAULT_BULLET_RADIUS;

	static void check_spawn(const char* op, float speed, float life_ms) {
		if (!std::isfinite(speed) || speed < 0.f)
			throw Fault(std::string(op) + ": speed must be finite and >= 0");
		if (!std::isfinite(life_ms) || life_ms <= 0.f)
			throw Fault(std::string(op) + ": life_ms must be finite and > 0");
	}

public:
	explicit BulletField(float radius = DEFAULT_BULLET_RADIUS) : m_radius(radius) {
		m_pool.slots = &m_slots;
	}

	BulletField(const BulletField&) = delete;
	BulletField& operator=(const BulletField&) = delete;

	// Single bullet. Throws Fault on speed < 0, life_ms <= 0 or non-finite input.
	Id spawn(Vec2 pos, float angle_deg, float speed, float life_ms, float accel = 0.f) {
		check_spawn("spawn", speed, life_ms);
		if (!std::isfinite(pos.x) || !std::isfinite(pos.y) || !std::isfinite(angle_deg) || !std::isfinite(accel))
			throw Fault("spawn: position, angle and accel must be finite");
		Vec2 dir = heading(angle_deg);
		Id id = m_slots.acquire();
		m_pool.add(id, Bullet{pos, dir * speed, life_ms, accel, dir, m_radius});
		return id;
	}

	// `count` bullets spread evenly over [base - spread/2, base + spread/2],
	// both ends included. count == 1 fires exactly along base_deg.
	void spawn_fan(float x, float y, float base_deg, float spread_deg, int count,
	               float speed, float life_ms = DEFAULT_BULLET_LIFE_MS) {
		if (count < 1)
			throw Fault("spawn_fan: count must be >= 1");
		check_spawn("spawn_fan", speed, life_ms);
		if (!std::isfinite(base_deg) || !std::isfinite(spread_deg))
			throw Fault("spawn_fan: angles must be finite");

		if (count == 1) {
			spawn({x, y}, base_deg, speed, life_ms);
			return;
		}
		float a0   = base_deg - spread_deg * 0.5f;
		float step = spread_deg / (float)(count - 1);
		for (int i = 0; i < count; i++)
			spawn({x, y}, a0 + step * (float)i, speed, life_ms);
	}

	// One bullet per pattern entry, all from (x, y).
	void spawn_pattern(float x, float y, const BulletPattern& pat) {
		for (const auto& s : pat.bullets)
			spawn({x, y}, s.angle_deg, s.speed, s.life_ms, s.accel);
	}

	// Integrate every live bullet by dt_ms, then reap those whose remaining
	// life reached zero or below. Must not be called from inside each().
	void update(float dt_ms) {
		if (!std::isfinite(dt_ms) || dt_ms < 0.f)
			throw Fault("update: dt_ms must be finite and >= 0");
		float dt = dt_ms / 1000.f;
		m_pool.each_mut([&](Bullet& b) {
			b.pos += b.vel * dt;
			if (b.accel != 0.f)
				b.vel += b.dir * (b.accel * dt);
			b.life_ms -= dt_ms;
		});

		// Walk backwards: swap-remove only pulls entries we've already kept.
		for (size_t i = m_pool.size(); i-- > 0;) {
			if (m_pool.items[i].life_ms > 0.f)
				continue;
			Id id = m_pool.id_at(i);
			m_pool.remove(id);
			m_slots.release(id);
		}
	}

	void clear() {
		m_pool.clear_all();
		m_slots.release_all();
	}

	bool remove(Id id) {
		if (!m_pool.has(id))
			return false;
		m_pool.remove(id);
		m_slots.release(id);
		return true;
	}

	// Remove bullets whose centre lies outside [min, max]. Returns how many.
	size_t cull_outside(Vec2 min, Vec2 max) {
		size_t removed = 0;
		for (size_t i = m_pool.size(); i-- > 0;) {
			const Vec2& p = m_pool.items[i].pos;
			if (p.x >= min.x && p.x <= max.x && p.y >= min.y && p.y <= max.y)
				continue;
			Id id = m_pool.id_at(i);
			m_pool.remove(id);
			m_slots.release(id);
			removed++;
		}
		return removed;
	}

	const std::vector<Bullet>& items() const { return m_pool.items; }
	size_t size() const { return m_pool.size(); }
	bool empty() const { return m_pool.empty(); }
	Id id_at(size_t dense_idx) const { return m_pool.id_at(dense_idx); }

	Bullet* get(Id id) { return m_pool.get(id); }
	const Bullet* get(Id id) const { return m_pool.get(id); }
	bool has(Id id) const { return m_pool.has(id); }
	Handle<Bullet> handle(Id id) { return m_pool.handle(id); }

	float radius() const { return m_radius; }

	// fn: void(const Bullet&) or void(Id, const Bullet&). Read-only; queue any
	// removal until after the call returns.
	template <typename F>
	void each(F&& fn) const { m_pool.each(std::forward<F>(fn)); }
};

} // namespace salvo
