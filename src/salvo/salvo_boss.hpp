// salvo_boss.hpp: Phase-driven boss pattern source
//
// A Boss sways, homes and fires by phase, and the phase follows remaining HP:
//
//   Opening   hp above pressing_at   sine sway about the spawn row; aimed shot
//                                     plus two side shots
//   Pressing  hp above frenzy_at     homes on the target at half speed; aimed
//                                     shot plus a 5-way spread
//   Frenzy    otherwise              homes at full speed; aimed triple, 7-way
//                                     fan and two wide side shots
//
// Phases only advance. Volleys come back as BulletSpec lists with absolute
// angles, aimed at the target passed in; the caller spawns them.
//
//   Boss boss(cfg.boss, {1080, 360});
//   if (boss.update(dt_ms, ship.pos))
//       for (const BulletSpec& s : boss.volley(ship.pos, life_ms)) shots.spawn(boss.pos(), ...);
//
// Depends: salvo_math, salvo_bullets (BulletSpec), salvo_util (Cooldown)

#pragma once
#include "salvo_math.hpp"
#include "salvo_bullets.hpp"
#include "salvo_util.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

namespace salvo {

enum class BossPhase : uint8_t { Opening, Pressing, Frenzy };

inline const char* boss_phase_name(BossPhase p) {
	switch (p) {
	case BossPhase::Opening:  return "opening";
	case BossPhase::Pressing: return "pressing";
	case BossPhase::Frenzy:   return "frenzy";
	}
	return "?";
}

struct BossStats {
	float hp           = 2400;
	float speed        = 100;     // units/s while homing
	float fire_rate    = 4;       // volleys/s, 0 = silent
	float bullet_speed = 350;
	float radius       = 48;
	int   score        = 5000;
	float every_ms     = 50000;   // boss-free time before the next one, 0 = never
	float pressing_at  = 0.70f;   // hp fraction
	float frenzy_at    = 0.35f;
};

class Boss {
	BossStats m_stats;
	Vec2      m_pos, m_home;
	float     m_hp     = 0;
	float     m_age_ms = 0;
	BossPhase m_phase  = BossPhase::Opening;
	Cooldown  m_gun;

	void approach(Vec2 target, float step) {
		Vec2 d = target - m_pos;
		float l = len(d);
		if (l > 0.f)
			m_pos += d * (std::min(step, l) / l);
	}

public:
	Boss(const BossStats& stats, Vec2 at)
		: m_stats(stats), m_pos(at), m_home(at), m_hp(stats.hp)
		, m_gun(stats.fire_rate > 0 ? 1000.f / stats.fire_rate : 0.f) {}

	// Move for dt_ms with `target` as the homing point. True when a volley is due.
	bool update(float dt_ms, Vec2 target) {
		m_age_ms += dt_ms;
		float step = m_stats.speed * dt_ms / 1000.f;
		switch (m_phase) {
		case BossPhase::Opening:
			m_pos.y = m_home.y + std::sin(m_age_ms / 1000.f * 2.f) * 100.f;
			break;
		case BossPhase::Pressing:
			approach(target, step * 0.5f);
			break;
		case BossPhase::Frenzy:
			approach(target, step);
			break;
		}
		return m_stats.fire_rate > 0 && m_gun.ready(dt_ms);
	}

	// Returns true when this hit was fatal.
	bool take_damage(float amount) {
		if (m_hp <= 0) return false;
		m_hp = std::max(0.f, m_hp - amount);
		float ratio = m_hp / m_stats.hp;
		if (ratio <= m_stats.frenzy_at)
			m_phase = BossPhase::Frenzy;
		else if (ratio <= m_stats.pressing_at && m_phase == BossPhase::Opening)
			m_phase = BossPhase::Pressing;
		return m_hp <= 0;
	}

	std::vector<BulletSpec> volley(Vec2 target, float life_ms) const {
		Vec2 to = target - m_pos;
		float aim = rad_to_deg(std::atan2(to.y, to.x));
		float v = m_stats.bullet_speed;
		std::vector<BulletSpec> out;
		auto shot = [&](float rel_deg, float speed) { out.push_back({speed, aim + rel_deg, 0.f, life_ms}); };

		switch (m_phase) {
		case BossPhase::Opening:
			shot(0.f, v);
			shot(-30.f, v * 0.8f);
			shot(30.f, v * 0.8f);
			break;
		case BossPhase::Pressing:
			shot(0.f, v);
			for (int i = -2; i <= 2; i++)
				shot(30.f * (float)i, v * 0.9f);
			break;
		case BossPhase::Frenzy:
			shot(0.f, v * 1.1f);
			shot(-15.f, v);
			shot(15.f, v);
			for (int i = -3; i <= 3; i++)
				shot(18.f * (float)i, v * 1.1f);
			shot(-60.f, v * 0.8f);
			shot(60.f, v * 0.8f);
			break;
		}
		return out;
	}

	Vec2      pos() const    { return m_pos; }
	float     hp() const     { return m_hp; }
	float     max_hp() const { return m_stats.hp; }
	float     radius() const { return m_stats.radius; }
	int       score() const  { return m_stats.score; }
	BossPhase phase() const  { return m_phase; }
	bool      alive() const  { return m_hp > 0; }
};

} // namespace salvo
