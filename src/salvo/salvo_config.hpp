// salvo_config.hpp: Stage tuning values
//
// StageConfig holds every number the stage reads. In-class defaults are the
// shipped balance; a JSON file can override any subset of them:
//
//   {
//     "field":  { "width": 1280, "height": 720, "seed": 12345 },
//     "player": { "lives": 3, "fireRate": 8 },
//     "enemies": { "turret": { "hp": 200 } },
//     "boss":   { "everyMs": 30000, "hp": 1200 },
//   }
//
// Unknown keys are ignored. A missing, unreadable or out-of-range file keeps
// the defaults.
//
// Depends: salvo_waves.hpp (EnemyType, WaveBounds), salvo_boss.hpp (BossStats),
//          nlohmann/json

#pragma once
#include "salvo_waves.hpp"
#include "salvo_wave_loader.hpp"
#include "salvo_boss.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

namespace salvo {

struct EnemyStats {
	float hp        = 140;
	float speed     = 100;   // units/s along -x
	float fire_rate = 1;     // aimed shots/s when the wave has no pattern, 0 = silent
	float radius    = 20;
	int   score     = 100;
};

struct StageConfig {
	// Field
	float    width        = 1280;
	float    height       = 720;
	uint32_t seed         = 12345;
	int      grid_cell    = 128;
	float    cull_margin  = 100;   // bullets/enemies this far outside are reaped
	float    spawn_margin = 200;   // waves may spawn up to width + spawn_margin

	// Player
	int   player_lives        = 3;
	float player_speed        = 400;
	float player_radius       = 12;
	float player_iframes_ms   = 2000;
	float player_fire_rate    = 8;     // shots/s
	int   player_shot_count   = 1;
	float player_spread_deg   = 0;
	float player_bullet_speed = 800;
	float player_bullet_life  = 1500;
	float player_bullet_damage = 10;
	float player_bullet_radius = 4;

	// Enemies
	float enemy_bullet_speed  = 400;
	float enemy_bullet_life   = 4000;
	float enemy_bullet_radius = 4;
	EnemyStats enemies[ENEMY_TYPE_COUNT] = {
		{140, 150, 1.5f, 20, 100},   // chaser
		{140,  80, 2.0f, 24, 150},   // turret
		{140, 120, 1.0f, 20,  80},   // sineFlyer
	};

	BossStats boss;

	const EnemyStats& stats(EnemyType t) const { return enemies[(int)t]; }

	WaveBounds wave_bounds() const { return {0.f, width + spawn_margin}; }
};

inline void apply_enemy_stats(const nlohmann::json& j, EnemyStats& s) {
	if (!j.is_object()) return;
	s.hp        = j.value("hp", s.hp);
	s.speed     = j.value("speed", s.speed);
	s.fire_rate = j.value("fireRate", s.fire_rate);
	s.radius    = j.value("radius", s.radius);
	s.score     = j.value("score", s.score);
}

// Overlay `j` on `base`. Wrongly-typed values throw nlohmann::json::type_error.
inline StageConfig load_stage_config(const nlohmann::json& j, StageConfig base = {}) {
	StageConfig c = base;
	if (!j.is_object()) return c;

	if (j.contains("field") && j["field"].is_object()) {
		const auto& f = j["field"];
		c.width        = f.value("width", c.width);
		c.height       = f.value("height", c.height);
		c.seed         = f.value("seed", c.seed);
		c.grid_cell    = f.value("gridCell", c.grid_cell);
		c.cull_margin  = f.value("cullMargin", c.cull_margin);
		c.spawn_margin = f.value("spawnMargin", c.spawn_margin);
	}
	if (j.contains("player") && j["player"].is_object()) {
		const auto& p = j["player"];
		c.player_lives         = p.value("lives", c.player_lives);
		c.player_speed         = p.value("speed", c.player_speed);
		c.player_radius        = p.value("radius", c.player_radius);
		c.player_iframes_ms    = p.value("iframesMs", c.player_iframes_ms);
		c.player_fire_rate     = p.value("fireRate", c.player_fire_rate);
		c.player_shot_count    = p.value("shotCount", c.player_shot_count);
		c.player_spread_deg    = p.value("spreadDeg", c.player_spread_deg);
		c.player_bullet_speed  = p.value("bulletSpeed", c.player_bullet_speed);
		c.player_bullet_life   = p.value("bulletLifeMs", c.player_bullet_life);
		c.player_bullet_damage = p.value("bulletDamage", c.player_bullet_damage);
		c.player_bullet_radius = p.value("bulletRadius", c.player_bullet_radius);
	}
	if (j.contains("enemyBullets") && j["enemyBullets"].is_object()) {
		const auto& b = j["enemyBullets"];
		c.enemy_bullet_speed  = b.value("speed", c.enemy_bullet_speed);
		c.enemy_bullet_life   = b.value("lifeMs", c.enemy_bullet_life);
		c.enemy_bullet_radius = b.value("radius", c.enemy_bullet_radius);
	}
	if (j.contains("boss") && j["boss"].is_object()) {
		const auto& b = j["boss"];
		c.boss.hp           = b.value("hp", c.boss.hp);
		c.boss.speed        = b.value("speed", c.boss.speed);
		c.boss.fire_rate    = b.value("fireRate", c.boss.fire_rate);
		c.boss.bullet_speed = b.value("bulletSpeed", c.boss.bullet_speed);
		c.boss.radius       = b.value("radius", c.boss.radius);
		c.boss.score        = b.value("score", c.boss.score);
		c.boss.every_ms     = b.value("everyMs", c.boss.every_ms);
		c.boss.pressing_at  = b.value("pressingAt", c.boss.pressing_at);
		c.boss.frenzy_at    = b.value("frenzyAt", c.boss.frenzy_at);
	}
	if (j.contains("enemies") && j["enemies"].is_object()) {
		const auto& e = j["enemies"];
		for (int i = 0; i < ENEMY_TYPE_COUNT; i++) {
			const char* key = enemy_type_name((EnemyType)i);
			if (e.contains(key))
				apply_enemy_stats(e[key], c.enemies[i]);
		}
	}
	return c;
}

// Range check for values the stage divides by, spawns with or sizes from.
// On failure `err` names the first bad field.
inline bool check_stage_config(const StageConfig& c, std::string& err) {
	auto positive = [&](float v, const char* name) {
		if (std::isfinite(v) && v > 0.f) return true;
		err = std::string(name) + " must be > 0";
		return false;
	};
	auto non_negative = [&](float v, const char* name) {
		if (std::isfinite(v) && v >= 0.f) return true;
		err = std::string(name) + " must be >= 0";
		return false;
	};

	if (!positive(c.width, "field.width") || !positive(c.height, "field.height")) return false;
	if (c.grid_cell < 1) { err = "field.gridCell must be >= 1"; return false; }
	if (!non_negative(c.cull_margin, "field.cullMargin") || !non_negative(c.spawn_margin, "field.spawnMargin"))
		return false;

	if (c.player_lives < 1) { err = "player.lives must be >= 1"; return false; }
	if (c.player_shot_count < 1) { err = "player.shotCount must be >= 1"; return false; }
	if (!non_negative(c.player_speed, "player.speed")
	    || !positive(c.player_radius, "player.radius")
	    || !non_negative(c.player_iframes_ms, "player.iframesMs")
	    || !positive(c.player_fire_rate, "player.fireRate")
	    || !non_negative(c.player_spread_deg, "player.spreadDeg")
	    || !non_negative(c.player_bullet_speed, "player.bulletSpeed")
	    || !positive(c.player_bullet_life, "player.bulletLifeMs")
	    || !positive(c.player_bullet_damage, "player.bulletDamage")
	    || !positive(c.player_bullet_radius, "player.bulletRadius"))
		return false;

	if (!non_negative(c.enemy_bullet_speed, "enemyBullets.speed")
	    || !positive(c.enemy_bullet_life, "enemyBullets.lifeMs")
	    || !positive(c.enemy_bullet_radius, "enemyBullets.radius"))
		return false;

	for (const EnemyStats& s : c.enemies) {
		if (!positive(s.hp, "enemies.hp") || !non_negative(s.speed, "enemies.speed")
		    || !non_negative(s.fire_rate, "enemies.fireRate") || !positive(s.radius, "enemies.radius"))
			return false;
	}

	const BossStats& b = c.boss;
	if (!positive(b.hp, "boss.hp") || !non_negative(b.speed, "boss.speed")
	    || !non_negative(b.fire_rate, "boss.fireRate") || !non_negative(b.bullet_speed, "boss.bulletSpeed")
	    || !positive(b.radius, "boss.radius") || !non_negative(b.every_ms, "boss.everyMs"))
		return false;
	if (!(b.frenzy_at >= 0.f && b.frenzy_at <= b.pressing_at && b.pressing_at <= 1.f)) {
		err = "boss phases need 0 <= frenzyAt <= pressingAt <= 1";
		return false;
	}
	return true;
}

// Read a config file into `out`. On any failure `out` is left unchanged and
// false is returned.
inline bool load_stage_config_file(const std::string& path, StageConfig& out) {
	std::ifstream f(path);
	if (!f.is_open()) {
		fprintf(stderr, "[config] cannot open %s; using defaults\n", path.c_str());
		return false;
	}
	std::stringstream ss;
	ss << f.rdbuf();
	nlohmann::json j = decode_document(ss.str());
	if (j.is_discarded() || !j.is_object()) {
		fprintf(stderr, "[config] %s is not a JSON object; using defaults\n", path.c_str());
		return false;
	}
	StageConfig loaded;
	try {
		loaded = load_stage_config(j, out);
	} catch (const nlohmann::json::exception& e) {
		fprintf(stderr, "[config] %s: %s; using defaults\n", path.c_str(), e.what());
		return false;
	}
	std::string err;
	if (!check_stage_config(loaded, err)) {
		fprintf(stderr, "[config] %s: %s; using defaults\n", path.c_str(), err.c_str());
		return false;
	}
	out = loaded;
	return true;
}

} // namespace salvo
