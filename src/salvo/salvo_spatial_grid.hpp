// salvo_spatial_grid.hpp: Flat uniform spatial grid for broad-phase queries
//
// Divides the play field into a fixed grid of cells. Each entry occupies
// exactly one cell (by centre). Queries scan every cell touched by the query
// circle grown by the largest radius inserted this frame, then hand each
// candidate to the caller for the narrow-phase test.
//
// Rebuild every frame:
//   grid.clear();
//   for each enemy: grid.insert(id, pos, radius);
//   grid.query(bullet.pos, bullet.radius, [](Id id, Vec2 pos, float r){ ... });
//
// Cell vectors keep their capacity across clear(), so steady state does not
// allocate.
//
// Depends: salvo_core.hpp, salvo_math.hpp

#pragma once
#include "salvo_core.hpp"
#include "salvo_math.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace salvo {

struct GridEntry {
	Id    id;
	Vec2  pos;
	float radius;
};

struct SpatialGrid {
	int cell_sz = 128;
	int cols    = 0;
	int rows    = 0;
	float max_radius = 0.f;
	std::vector<std::vector<GridEntry>> cells;

	SpatialGrid() = default;

	// field_w / field_h: extent of the play field in world units.
	// csz              : side of one cell, same units.
	SpatialGrid(float field_w, float field_h, int csz = 128)
		: cell_sz(std::max(1, csz))
		, cols(std::max(1, (int)std::ceil(field_w / (float)cell_sz)))
		, rows(std::max(1, (int)std::ceil(field_h / (float)cell_sz)))
		, cells((size_t)cols * rows)
	{}

	void clear() {
		for (auto& c : cells) c.clear();
		max_radius = 0.f;
	}

	// Positions outside the field are clamped to the border cells.
	void insert(Id id, Vec2 pos, float radius) {
		int cx = std::clamp((int)std::floor(pos.x / cell_sz), 0, cols - 1);
		int cy = std::clamp((int)std::floor(pos.y / cell_sz), 0, rows - 1);
		cells[(size_t)cy * cols + cx].push_back({id, pos, radius});
		max_radius = std::max(max_radius, radius);
	}

	// fn(Id, Vec2 pos, float radius) for every entry whose circle may touch
	// the query circle. Candidates are filtered by centre distance against
	// radius + entry radius, so touching counts. fn must not insert or clear.
	template<typename F>
	void query(Vec2 centre, float radius, F&& fn) const {
		float reach = radius + max_radius;
		int x0 = std::clamp((int)std::floor((centre.x - reach) / cell_sz), 0, cols - 1);
		int x1 = std::clamp((int)std::floor((centre.x + reach) / cell_sz), 0, cols - 1);
		int y0 = std::clamp((int)std::floor((centre.y - reach) / cell_sz), 0, rows - 1);
		int y1 = std::clamp((int)std::floor((centre.y + reach) / cell_sz), 0, rows - 1);
		for (int cy = y0; cy <= y1; cy++) {
			for (int cx = x0; cx <= x1; cx++) {
				for (const GridEntry& e : cells[(size_t)cy * cols + cx]) {
					float rr = radius + e.radius;
					if (len2(e.pos - centre) <= rr * rr)
						fn(e.id, e.pos, e.radius);
				}
			}
		}
	}

	size_t size() const {
		size_t n = 0;
		for (const auto& c : cells) n += c.size();
		return n;
	}
};

} // namespace salvo
