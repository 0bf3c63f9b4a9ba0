// salvo_math.hpp: Lightweight math primitives for the projectile engine
//
// Provides:
//   Vec2                   : 2D value vector with arithmetic operators
//   dot, cross, perp       : products used by the SAT routines
//   len, len2, dist, norm  : vector utilities
//   rotate, deg_to_rad     : angle helpers (degrees at the API surface)
//   Rng                    : xorshift32 PRNG with float helpers
//
// No dependencies beyond <cmath> and <cstdint>.

#pragma once
#include <cmath>
#include <cstdint>

namespace salvo {

constexpr float PI = 3.14159265358979323846f;

inline float deg_to_rad(float deg) { return deg * (PI / 180.f); }
inline float rad_to_deg(float rad) { return rad * (180.f / PI); }

// =============================================================================
// Vec2
// =============================================================================
struct Vec2 {
	float x = 0, y = 0;

	Vec2() = default;
	Vec2(float x, float y) : x(x), y(y) {}

	Vec2 operator+(Vec2 o)  const { return {x + o.x, y + o.y}; }
	Vec2 operator-(Vec2 o)  const { return {x - o.x, y - o.y}; }
	Vec2 operator-()        const { return {-x, -y}; }
	Vec2 operator*(float s) const { return {x * s, y * s}; }
	Vec2 operator/(float s) const { return {x / s, y / s}; }

	Vec2& operator+=(Vec2 o) { x += o.x; y += o.y; return *this; }
	Vec2& operator-=(Vec2 o) { x -= o.x; y -= o.y; return *this; }
	Vec2& operator*=(float s) { x *= s; y *= s; return *this; }
};

inline Vec2 operator*(float s, Vec2 v) { return {s * v.x, s * v.y}; }

inline float dot(Vec2 a, Vec2 b)   { return a.x * b.x + a.y * b.y; }
inline float cross(Vec2 a, Vec2 b) { return a.x * b.y - a.y * b.x; }

// Left-hand perpendicular (rotated +90°).
inline Vec2 perp(Vec2 v) { return {-v.y, v.x}; }

inline float len2(Vec2 v) { return v.x * v.x + v.y * v.y; }

inline float len(Vec2 v) {
	return std::sqrt(v.x * v.x + v.y * v.y);
}

inline float dist(Vec2 a, Vec2 b) {
	return len(a - b);
}

inline Vec2 norm(Vec2 v) {
	float l = len(v);
	return l > 0.0001f ? v * (1.f / l) : Vec2{0, 0};
}

// Unit vector for an angle in degrees. 0° points along +x.
inline Vec2 heading(float deg) {
	float a = deg_to_rad(deg);
	return {std::cos(a), std::sin(a)};
}

inline Vec2 rotate(Vec2 v, float deg) {
	if (deg == 0.f) return v;
	float a = deg_to_rad(deg);
	float c = std::cos(a), s = std::sin(a);
	return {v.x * c - v.y * s, v.x * s + v.y * c};
}

// =============================================================================
// Rng: xorshift32 PRNG
// =============================================================================
struct Rng {
	uint32_t state;

	explicit Rng(uint32_t seed = 12345) : state(seed ? seed : 1) {}

	uint32_t next() {
		state ^= state << 13;
		state ^= state >> 17;
		state ^= state << 5;
		return state;
	}

	// Uniform float in [0, 1)
	float rf() {
		return (float)(next() & 0xFFFFFF) / (float)0x1000000;
	}

	// Uniform float in [lo, hi]
	float rfr(float lo, float hi) {
		return lo + rf() * (hi - lo);
	}

	// Uniform int in [lo, hi]
	int ri(int lo, int hi) {
		return lo + (int)(next() % (uint32_t)(hi - lo + 1));
	}
};

} // namespace salvo
