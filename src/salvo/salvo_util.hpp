// salvo_util.hpp: PLC-inspired timers for pattern and weapon pacing
//
// Provides:
//   Cooldown : fire-once-per-interval timer
//   Counter  : count up to a preset, then latch done
//
// All time is float milliseconds (matches ctx.dt_ms()).
// No external dependencies.

#pragma once

namespace salvo {

// =============================================================================
// Cooldown: fire-once-per-interval timer
// =============================================================================
//
// Accumulates time; ready() returns true once per interval. Overshoot carries
// into the next interval, so the average rate holds under uneven dt.
// An interval of 0 fires on every call.
//   Cooldown cd(125.f);
//   if (cd.ready(dt_ms)) { /* fires every 125 ms */ }

struct Cooldown {
	float interval = 1000.f;
	float elapsed  = 0.f;

	Cooldown() = default;
	explicit Cooldown(float ms) : interval(ms) {}

	bool ready(float dt_ms) {
		elapsed += dt_ms;
		if (elapsed >= interval) {
			elapsed -= interval;
			if (elapsed > interval) elapsed = interval;
			return true;
		}
		return false;
	}

	void  reset()           { elapsed = 0.f; }
	float remaining() const { return interval - elapsed; }
};

// =============================================================================
// Counter: count up with preset and done flag
// =============================================================================
//
//   Counter volleys(pattern.repeat);
//   if (!volleys.done && cd.ready(dt)) { fire(); volleys.increment(); }

struct Counter {
	int  count  = 0;
	int  preset = 0;
	bool done   = false;

	Counter() = default;
	explicit Counter(int preset_val) : preset(preset_val), done(preset_val <= 0) {}

	void increment() {
		if (done) return;
		if (++count >= preset) done = true;
	}

	void reset() { count = 0; done = preset <= 0; }
	void reset(int new_preset) { preset = new_preset; count = 0; done = new_preset <= 0; }
};

} // namespace salvo
