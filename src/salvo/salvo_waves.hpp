// salvo_waves.hpp: Wave records, validation and time-window queries
//
// A wave is a timed spawn trigger: from t0_ms for duration_ms, a formation of
// `count` enemies of one type appears around (x, y), optionally firing a
// bullet pattern.
//
//   auto waves = parse_waves(doc, bounds);          // empty on any error
//   for (const Wave* w : get_waves_at_time(waves, t)) { ... }
//
// get_waves_at_time() is a pure filter: it returns a wave on every call whose
// time lies in [t0, t0 + duration). Hosts that want one trigger per wave keep
// a WaveCursor, which remembers what it has already handed out.
//
// Depends: salvo_bullets.hpp (BulletPattern), nlohmann/json

#pragma once
#include "salvo_bullets.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace salvo {

enum class EnemyType : uint8_t { Chaser, Turret, SineFlyer };
constexpr int ENEMY_TYPE_COUNT = 3;

enum class Formation : uint8_t { Line, Arc, Sine, V, Random };

inline const char* enemy_type_name(EnemyType t) {
	switch (t) {
	case EnemyType::Chaser:    return "chaser";
	case EnemyType::Turret:    return "turret";
	case EnemyType::SineFlyer: return "sineFlyer";
	}
	return "";
}

inline bool enemy_type_from_name(const std::string& s, EnemyType& out) {
	if (s == "chaser")    { out = EnemyType::Chaser;    return true; }
	if (s == "turret")    { out = EnemyType::Turret;    return true; }
	if (s == "sineFlyer") { out = EnemyType::SineFlyer; return true; }
	return false;
}

inline const char* formation_name(Formation f) {
	switch (f) {
	case Formation::Line:   return "line";
	case Formation::Arc:    return "arc";
	case Formation::Sine:   return "sine";
	case Formation::V:      return "v";
	case Formation::Random: return "random";
	}
	return "";
}

inline bool formation_from_name(const std::string& s, Formation& out) {
	if (s == "line")   { out = Formation::Line;   return true; }
	if (s == "arc")    { out = Formation::Arc;    return true; }
	if (s == "sine")   { out = Formation::Sine;   return true; }
	if (s == "v")      { out = Formation::V;      return true; }
	if (s == "random") { out = Formation::Random; return true; }
	return false;
}

// Accepted spawn x range. Waves usually spawn just past the right edge.
struct WaveBounds {
	float min_x = 0.f;
	float max_x = 1480.f;
};

struct Wave {
	int       t0_ms       = 0;
	int       duration_ms = 0;
	EnemyType enemy       = EnemyType::Chaser;
	Formation formation   = Formation::Line;
	int       count       = 1;
	float     x           = 0;
	float     y           = -1;    // < 0: middle of the field
	float     spacing     = 48;
	float     speed       = -1;    // < 0: enemy type default
	float     spread_deg  = 90;
	bool      has_pattern = false;
	BulletPattern pattern;

	bool active_at(double time_ms) const {
		return time_ms >= (double)t0_ms && time_ms < (double)t0_ms + (double)duration_ms;
	}
};

// ─── Field readers (file-local) ──────────────────────────────────────────────

namespace detail {

inline bool read_number(const nlohmann::json& j, const char* key, double& out, std::string& err) {
	auto it = j.find(key);
	if (it == j.end()) { err = std::string("missing '") + key + "'"; return false; }
	if (!it->is_number()) { err = std::string("'") + key + "' must be a number"; return false; }
	out = it->get<double>();
	if (!std::isfinite(out)) { err = std::string("'") + key + "' must be finite"; return false; }
	return true;
}

inline bool read_int(const nlohmann::json& j, const char* key, int& out, std::string& err) {
	double v;
	if (!read_number(j, key, v, err)) return false;
	if (v != std::floor(v) || std::fabs(v) > 2147483647.0) {
		err = std::string("'") + key + "' must be an integer";
		return false;
	}
	out = (int)v;
	return true;
}

// Optional fields fall back to `fallback` when absent, but a present field of
// the wrong type is still an error.
inline bool read_opt_number(const nlohmann::json& j, const char* key, double fallback, double& out, std::string& err) {
	if (!j.contains(key)) { out = fallback; return true; }
	return read_number(j, key, out, err);
}

inline bool read_opt_int(const nlohmann::json& j, const char* key, int fallback, int& out, std::string& err) {
	if (!j.contains(key)) { out = fallback; return true; }
	return read_int(j, key, out, err);
}

inline bool read_string(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
	auto it = j.find(key);
	if (it == j.end()) { err = std::string("missing '") + key + "'"; return false; }
	if (!it->is_string()) { err = std::string("'") + key + "' must be a string"; return false; }
	out = it->get<std::string>();
	return true;
}

} // namespace detail

// Validate a pattern object. Entries need speed >= 0 and life_ms >= 100.
inline bool parse_pattern(const nlohmann::json& j, BulletPattern& out, std::string& err) {
	if (!j.is_object()) { err = "pattern must be an object"; return false; }
	BulletPattern p;
	if (!detail::read_string(j, "name", p.name, err)) return false;
	if (!detail::read_opt_int(j, "repeat", 1, p.repeat, err)) return false;
	if (p.repeat < 1) { err = "pattern 'repeat' must be >= 1"; return false; }
	if (!detail::read_int(j, "spawnEveryMs", p.spawn_every_ms, err)) return false;
	if (p.spawn_every_ms < 0) { err = "pattern 'spawnEveryMs' must be >= 0"; return false; }

	auto it = j.find("bullets");
	if (it == j.end() || !it->is_array()) { err = "pattern 'bullets' must be an array"; return false; }
	for (const auto& b : *it) {
		if (!b.is_object()) { err = "pattern bullet must be an object"; return false; }
		BulletSpec s;
		double speed, angle, accel;
		int life;
		if (!detail::read_number(b, "speed", speed, err)) return false;
		if (!detail::read_number(b, "angleDeg", angle, err)) return false;
		if (!detail::read_opt_number(b, "accel", 0.0, accel, err)) return false;
		if (!detail::read_opt_int(b, "lifeMs", (int)DEFAULT_BULLET_LIFE_MS, life, err)) return false;
		if (speed < 0) { err = "pattern bullet 'speed' must be >= 0"; return false; }
		if (life < 100) { err = "pattern bullet 'lifeMs' must be >= 100"; return false; }
		s.speed = (float)speed;
		s.angle_deg = (float)angle;
		s.accel = (float)accel;
		s.life_ms = (float)life;
		p.bullets.push_back(s);
	}
	out = std::move(p);
	return true;
}

// Validate one wave record. On failure `err` says why and `out` is untouched.
inline bool parse_wave(const nlohmann::json& j, const WaveBounds& bounds, Wave& out, std::string& err) {
	if (!j.is_object()) { err = "wave must be an object"; return false; }
	Wave w;
	std::string name;
	double x, y, spacing, speed, spread;

	if (!detail::read_int(j, "t0", w.t0_ms, err)) return false;
	if (w.t0_ms < 0) { err = "'t0' must be >= 0"; return false; }
	if (!detail::read_int(j, "duration", w.duration_ms, err)) return false;
	if (w.duration_ms <= 0) { err = "'duration' must be > 0"; return false; }

	if (!detail::read_string(j, "enemy", name, err)) return false;
	if (!enemy_type_from_name(name, w.enemy)) { err = "unknown enemy '" + name + "'"; return false; }
	if (!detail::read_string(j, "formation", name, err)) return false;
	if (!formation_from_name(name, w.formation)) { err = "unknown formation '" + name + "'"; return false; }

	if (!detail::read_int(j, "count", w.count, err)) return false;
	if (w.count < 1) { err = "'count' must be >= 1"; return false; }

	if (!detail::read_number(j, "x", x, err)) return false;
	if (x < bounds.min_x || x > bounds.max_x) { err = "'x' outside play-field bounds"; return false; }
	w.x = (float)x;

	if (!detail::read_opt_number(j, "y", -1.0, y, err)) return false;
	if (!detail::read_opt_number(j, "spacing", 48.0, spacing, err)) return false;
	if (!detail::read_opt_number(j, "speed", -1.0, speed, err)) return false;
	if (!detail::read_opt_number(j, "spreadDeg", 90.0, spread, err)) return false;
	if (j.contains("speed") && speed < 0) { err = "'speed' must be >= 0"; return false; }
	if (spacing < 0) { err = "'spacing' must be >= 0"; return false; }
	w.y = (float)y;
	w.spacing = (float)spacing;
	w.speed = (float)speed;
	w.spread_deg = (float)spread;

	if (j.contains("pattern")) {
		if (!parse_pattern(j.at("pattern"), w.pattern, err)) return false;
		w.has_pattern = true;
	}

	out = std::move(w);
	return true;
}

// Parse a whole document. Any malformed record empties the result: a broken
// level degrades to "no spawns" instead of a half-loaded stage.
inline std::vector<Wave> parse_waves(const nlohmann::json& doc, const WaveBounds& bounds = {}) {
	std::vector<Wave> out;
	if (!doc.is_array()) {
		fprintf(stderr, "[waves] document must be an array of waves\n");
		return out;
	}
	out.reserve(doc.size());
	for (size_t i = 0; i < doc.size(); i++) {
		Wave w;
		std::string err;
		if (!parse_wave(doc[i], bounds, w, err)) {
			fprintf(stderr, "[waves] wave %zu rejected: %s\n", i, err.c_str());
			return {};
		}
		out.push_back(std::move(w));
	}
	std::stable_sort(out.begin(), out.end(),
		[](const Wave& a, const Wave& b) { return a.t0_ms < b.t0_ms; });
	return out;
}

inline std::vector<const Wave*> get_waves_at_time(const std::vector<Wave>& waves, double time_ms) {
	std::vector<const Wave*> out;
	for (const auto& w : waves)
		if (w.active_at(time_ms))
			out.push_back(&w);
	return out;
}

// =============================================================================
// WaveCursor: one trigger per wave
// =============================================================================
//
// Feed monotonically increasing times. A wave is returned by the first poll
// whose time falls inside its window and never again until reset(). A window
// skipped entirely by a large time step is not triggered.

struct WaveCursor {
	std::vector<bool> fired;

	std::vector<const Wave*> poll(const std::vector<Wave>& waves, double time_ms) {
		if (fired.size() != waves.size())
			fired.assign(waves.size(), false);
		std::vector<const Wave*> out;
		for (size_t i = 0; i < waves.size(); i++) {
			if (fired[i] || !waves[i].active_at(time_ms))
				continue;
			fired[i] = true;
			out.push_back(&waves[i]);
		}
		return out;
	}

	void reset() { fired.clear(); }

	size_t fired_count() const { return (size_t)std::count(fired.begin(), fired.end(), true); }
};

} // namespace salvo
