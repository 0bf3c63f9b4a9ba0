// salvo_collide.hpp: Narrow-phase overlap tests (separating-axis theorem)
//
// Provides:
//   Circle, Polygon, Aabb     : value-typed shapes, no heap
//   CollisionResult           : hit flag, penetration depth, push normal
//   circle_vs_circle          : axis: centre to centre
//   circle_vs_polygon         : axes: polygon edge normals + closest vertex
//   polygon_vs_polygon        : axes: edge normals of both polygons
//   aabb_vs_aabb, circle_vs_aabb: cheap boolean tests
//
// Conventions:
//   - Touching shapes collide (projections meeting at a point overlap by 0).
//   - result.normal is the unit direction that moves shape A out of shape B;
//     A.pos += normal * overlap separates them.
//   - Polygons are convex, at most MAX_POINTS vertices, in either winding.
//     Fewer than 3 points throws Fault. Self-intersecting outlines give
//     unspecified results.
//
// Every function is pure: same inputs, same outputs, no shared state.
//
// Depends: salvo_core.hpp (Fault), salvo_math.hpp

#pragma once
#include "salvo_core.hpp"
#include "salvo_math.hpp"
#include <cmath>
#include <initializer_list>

namespace salvo {

struct Circle {
	Vec2  pos;
	float r = 0;
};

struct Aabb {
	float x = 0, y = 0, w = 0, h = 0;   // top-left corner + size
};

struct Polygon {
	static constexpr int MAX_POINTS = 16;

	Vec2  pos;              // world position
	Vec2  offset;           // applied to points before rotation
	float angle_deg = 0;    // rotation about the local origin
	Vec2  points[MAX_POINTS];
	int   count = 0;

	Polygon() = default;
	Polygon(Vec2 at, std::initializer_list<Vec2> pts) : pos(at) {
		for (Vec2 p : pts)
			if (!add(p)) throw Fault("Polygon: more than MAX_POINTS vertices");
	}

	bool add(Vec2 p) {
		if (count >= MAX_POINTS) return false;
		points[count++] = p;
		return true;
	}

	// World-space vertex i.
	Vec2 world(int i) const { return pos + rotate(points[i] + offset, angle_deg); }

	// Axis-aligned w×h box with its top-left corner at `at` (SAT.js Box).
	static Polygon box(Vec2 at, float w, float h) {
		return Polygon(at, {{0, 0}, {w, 0}, {w, h}, {0, h}});
	}
};

struct CollisionResult {
	bool  collided = false;
	float overlap  = 0;
	Vec2  normal;
};

// ─── SAT helpers (file-local) ────────────────────────────────────────────────

namespace detail {

struct Interval { float min, max; };

inline Interval project(const Vec2* pts, int n, Vec2 axis) {
	float d = dot(pts[0], axis);
	Interval r{d, d};
	for (int i = 1; i < n; i++) {
		d = dot(pts[i], axis);
		if (d < r.min) r.min = d;
		if (d > r.max) r.max = d;
	}
	return r;
}

inline Interval project_circle(const Circle& c, Vec2 axis) {
	float d = dot(c.pos, axis);
	return {d - c.r, d + c.r};
}

// Track the axis of least penetration. Returns false on a gap (separated).
// `axis` must be unit length.
struct MinAxis {
	float depth = 0;
	Vec2  normal;
	bool  found = false;

	bool test(Interval a, Interval b, Vec2 axis) {
		if (a.max < b.min || b.max < a.min)
			return false;
		// Push A backwards along the axis, or forwards, whichever is shorter.
		float back = a.max - b.min;
		float fwd  = b.max - a.min;
		float d    = back < fwd ? back : fwd;
		if (!found || d < depth) {
			depth  = d;
			normal = back < fwd ? -axis : axis;
			found  = true;
		}
		return true;
	}
};

inline int world_points(const Polygon& p, Vec2* out) {
	if (p.count < 3)
		throw Fault("polygon needs at least 3 points");
	for (int i = 0; i < p.count; i++)
		out[i] = p.world(i);
	return p.count;
}

// Edge normals of `pts` tested against both projections. Zero-length edges
// contribute no axis.
inline bool test_edges(const Vec2* pts, int n, const Vec2* a, int na, const Vec2* b, int nb, MinAxis& m) {
	for (int i = 0; i < n; i++) {
		Vec2 edge = pts[(i + 1) % n] - pts[i];
		Vec2 axis = norm(perp(edge));
		if (axis.x == 0.f && axis.y == 0.f)
			continue;
		if (!m.test(project(a, na, axis), project(b, nb, axis), axis))
			return false;
	}
	return true;
}

} // namespace detail

// =============================================================================
// Circle vs Circle
// =============================================================================
inline CollisionResult circle_vs_circle(const Circle& a, const Circle& b) {
	CollisionResult r;
	Vec2 d = a.pos - b.pos;
	float rsum = a.r + b.r;
	float d2 = len2(d);
	if (d2 > rsum * rsum)
		return r;
	float l = std::sqrt(d2);
	r.collided = true;
	r.overlap = rsum - l;
	// Concentric circles have no preferred axis; push A along +x.
	r.normal = l > 0.f ? d * (1.f / l) : Vec2{1, 0};
	return r;
}

// =============================================================================
// Circle vs Polygon
// =============================================================================
inline CollisionResult circle_vs_polygon(const Circle& c, const Polygon& p) {
	CollisionResult r;
	Vec2 pts[Polygon::MAX_POINTS];
	int n = detail::world_points(p, pts);
	detail::MinAxis m;

	for (int i = 0; i < n; i++) {
		Vec2 axis = norm(perp(pts[(i + 1) % n] - pts[i]));
		if (axis.x == 0.f && axis.y == 0.f)
			continue;
		if (!m.test(detail::project_circle(c, axis), detail::project(pts, n, axis), axis))
			return r;
	}

	// Voronoi axis: from the nearest vertex to the circle centre.
	int best = 0;
	float best_d2 = len2(c.pos - pts[0]);
	for (int i = 1; i < n; i++) {
		float d2 = len2(c.pos - pts[i]);
		if (d2 < best_d2) { best_d2 = d2; best = i; }
	}
	Vec2 axis = norm(c.pos - pts[best]);
	if (axis.x != 0.f || axis.y != 0.f) {
		if (!m.test(detail::project_circle(c, axis), detail::project(pts, n, axis), axis))
			return r;
	}

	r.collided = true;
	r.overlap = m.depth;
	r.normal = m.normal;
	return r;
}

// =============================================================================
// Polygon vs Polygon
// =============================================================================
inline CollisionResult polygon_vs_polygon(const Polygon& a, const Polygon& b) {
	CollisionResult r;
	Vec2 pa[Polygon::MAX_POINTS], pb[Polygon::MAX_POINTS];
	int na = detail::world_points(a, pa);
	int nb = detail::world_points(b, pb);
	detail::MinAxis m;

	if (!detail::test_edges(pa, na, pa, na, pb, nb, m)) return r;
	if (!detail::test_edges(pb, nb, pa, na, pb, nb, m)) return r;

	r.collided = true;
	r.overlap = m.depth;
	r.normal = m.normal;
	return r;
}

// =============================================================================
// Boolean broad checks (edges inclusive)
// =============================================================================
inline bool aabb_vs_aabb(const Aabb& a, const Aabb& b) {
	return a.x <= b.x + b.w && a.x + a.w >= b.x
		&& a.y <= b.y + b.h && a.y + a.h >= b.y;
}

inline bool circle_vs_aabb(const Circle& c, const Aabb& b) {
	float cx = c.pos.x < b.x ? b.x : (c.pos.x > b.x + b.w ? b.x + b.w : c.pos.x);
	float cy = c.pos.y < b.y ? b.y : (c.pos.y > b.y + b.h ? b.y + b.h : c.pos.y);
	float dx = c.pos.x - cx, dy = c.pos.y - cy;
	return dx * dx + dy * dy <= c.r * c.r;
}

} // namespace salvo
