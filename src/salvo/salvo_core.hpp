// salvo_core.hpp: Frame kernel for the projectile engine
//
// THE RULE OF 3 VERBS:
// 1. Data: Pool<T> sparse sets, sim.pool<T>(name)
// 2. Ids: Slots::acquire(), sim.spawn(), sim.remove_entity(id)
// 3. Scheduling: sim.schedule(name, priority, fn), sim.tick(dt_ms)
//
// TIME:
// The host owns time. tick(dt_ms) advances the simulation by exactly the
// supplied milliseconds; nothing in here reads a clock, so a recorded dt
// stream replays to identical state.
//
// MUTATION DURING ITERATION:
// Tasks never add or remove pool entries while iterating that pool.
// ctx.defer(fn) queues work until the current task returns;
// ctx.remove_entity(id) queues a removal until the end of the frame.

#pragma once

#include <vector>
#include <string>
#include <string_view>
#include <unordered_map>
#include <algorithm>
#include <functional>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <type_traits>
#include <typeinfo>
#include <stdexcept>
#include <memory>

namespace salvo
{

// =============================================================================
// Names: Interned into a table, passed around as 4-byte handles
// =============================================================================
using NameId = uint32_t;
constexpr NameId NULL_NAME = 0xFFFFFFFF;

class NameTable
{
	struct StringHash
	{
		using is_transparent = void;
		size_t operator()(std::string_view sv) const { return std::hash<std::string_view>{}(sv); }
		size_t operator()(const std::string &s) const { return std::hash<std::string_view>{}(s); }
		size_t operator()(const char *s) const { return std::hash<std::string_view>{}(s); }
	};
	std::unordered_map<std::string, NameId, StringHash, std::equal_to<>> to_id;
	std::vector<std::string> to_str;

public:
	NameId intern(const char *s)
	{
		if (!s || !s[0])
			return NULL_NAME;
		auto it = to_id.find(s);
		if (it != to_id.end())
			return it->second;
		NameId id = static_cast<NameId>(to_str.size());
		to_id.emplace(s, id);
		to_str.push_back(s);
		return id;
	}

	NameId find(const char *s) const
	{
		if (!s || !s[0])
			return NULL_NAME;
		auto it = to_id.find(s);
		return it != to_id.end() ? it->second : NULL_NAME;
	}

	const char *str(NameId id) const
	{
		if (id == NULL_NAME || id >= to_str.size())
			return "";
		return to_str[id].c_str();
	}
};

// Caller-contract violation: bad spawn parameters, negative dt, degenerate
// shapes. Thrown, never clamped. A Fault escaping a task disables that task.
struct Fault : std::exception
{
	std::string msg;
	explicit Fault(std::string m) : msg(std::move(m)) {}
	const char *what() const noexcept override { return msg.c_str(); }
};

// =============================================================================
// Type IDs: via typeid name hash
// =============================================================================
template <typename T>
inline size_t get_type_id()
{
	static const size_t id = std::hash<std::string_view>{}(typeid(T).name());
	return id;
}

// =============================================================================
// Ids & Handles
// =============================================================================
using Id = uint64_t;
constexpr Id NULL_ID = 0xFFFFFFFFFFFFFFFFULL;
constexpr uint32_t NULL_INDEX = 0x00FFFFFF;

// Id layout: [63..40] 24-bit index, [39..16] 24-bit generation, [15..0] 16-bit flags
inline uint32_t id_index(Id id) { return static_cast<uint32_t>((id >> 40) & 0xFFFFFF); }
inline uint32_t id_generation(Id id) { return static_cast<uint32_t>((id >> 16) & 0xFFFFFF); }
inline Id make_id(uint32_t idx, uint32_t gen, uint16_t flags = 0)
{
	return (static_cast<uint64_t>(idx & 0xFFFFFF) << 40)
		 | (static_cast<uint64_t>(gen & 0xFFFFFF) << 16)
		 | flags;
}

constexpr uint16_t ID_FLAG_FREE = 0x0001;
inline bool id_is_free(Id slot) { return (slot & ID_FLAG_FREE) != 0; }

// =============================================================================
// Slots: one packed Id per index. Releasing a slot bumps its generation, so
// every Id issued for the old occupant stops resolving, even after the index
// is handed out again.
// =============================================================================
class Slots
{
	std::vector<Id> m_slots;
	std::vector<uint32_t> free_ids;
	uint32_t alive_count = 0;

public:
	Id acquire()
	{
		uint32_t idx = UINT32_MAX;
		while (!free_ids.empty())
		{
			uint32_t candidate = free_ids.back();
			free_ids.pop_back();
			if (id_is_free(m_slots[candidate]))
			{
				idx = candidate;
				break;
			}
		}
		if (idx == UINT32_MAX)
		{
			idx = static_cast<uint32_t>(m_slots.size());
			if (idx >= NULL_INDEX)
				throw Fault("slot index space exhausted");
			m_slots.push_back(make_id(idx, 1, ID_FLAG_FREE));
		}
		uint32_t gen = id_generation(m_slots[idx]);
		m_slots[idx] = make_id(idx, gen); // clear free flag
		alive_count++;
		return make_id(idx, gen);
	}

	bool release(Id id)
	{
		if (!alive(id))
			return false;
		uint32_t idx = id_index(id);
		uint32_t new_gen = (id_generation(id) + 1) & 0xFFFFFF;
		if (new_gen == 0) new_gen = 1;
		m_slots[idx] = make_id(idx, new_gen, ID_FLAG_FREE);
		free_ids.push_back(idx);
		alive_count--;
		return true;
	}

	// Release every live slot. Generations advance exactly as release() would.
	void release_all()
	{
		for (uint32_t idx = 0; idx < m_slots.size(); idx++)
		{
			if (!id_is_free(m_slots[idx]))
				release(make_id(idx, id_generation(m_slots[idx])));
		}
	}

	bool alive(Id id) const
	{
		if (id == NULL_ID)
			return false;
		uint32_t idx = id_index(id);
		if (idx >= m_slots.size())
			return false;
		Id slot = m_slots[idx];
		return id_generation(slot) == id_generation(id) && !id_is_free(slot);
	}

	uint32_t count() const { return alive_count; }
	size_t capacity() const { return m_slots.size(); }
};

template <typename T>
class Pool;

template <typename T>
struct Handle
{
	Id id = NULL_ID;
	Pool<T> *pool = nullptr;

	T *get() const { return pool ? pool->get(id) : nullptr; }
	T *operator->() const { return get(); }
	T &operator*() const { return *get(); }
	explicit operator bool() const { return get() != nullptr; }
};

// PoolBase: type-erased base for Pool<T>.
// Lets Sim manage pools during entity removal without knowing T.
class PoolBase
{
public:
	virtual ~PoolBase() = default;
	uint32_t pool_id = 0;
	const Slots *slots = nullptr; // generation authority for get()
	virtual void remove(Id id) = 0;
	virtual void clear_all() = 0;
};

// =============================================================================
// Pool<T>: Contiguous sparse set
//
// Pure data container. Dense storage is swap-removed, so raw pointers and
// dense indices are only good until the next add/remove; hold an Id or a
// Handle<T> across frames instead.
// =============================================================================
template <typename T>
class Pool : public PoolBase
{
public:
	std::vector<T> items;
	std::vector<uint32_t> dense_indices;  // slot index per dense entry
	std::vector<Id> dense_ids;            // full Id per dense entry
	std::vector<uint32_t> sparse_indices;

	Id id_at(size_t dense_idx) const
	{
		return dense_ids[dense_idx];
	}

	T *add(Id id, T val = T{})
	{
		uint32_t idx = id_index(id);
		if (idx >= sparse_indices.size())
			sparse_indices.resize(idx + 1, NULL_INDEX);

		if (sparse_indices[idx] != NULL_INDEX)
		{
			uint32_t dense_idx = sparse_indices[idx];
			dense_indices[dense_idx] = idx;
			dense_ids[dense_idx] = id;
			items[dense_idx] = std::move(val);
			return &items[dense_idx];
		}

		uint32_t dense_idx = static_cast<uint32_t>(items.size());
		sparse_indices[idx] = dense_idx;
		dense_indices.push_back(idx);
		dense_ids.push_back(id);
		items.push_back(std::move(val));
		return &items.back();
	}

	void remove(Id id) override
	{
		uint32_t idx = id_index(id);
		if (idx >= sparse_indices.size() || sparse_indices[idx] == NULL_INDEX)
			return;

		uint32_t dense_idx = sparse_indices[idx];
		if (dense_indices[dense_idx] != idx)
			return;

		uint32_t last_dense_idx = static_cast<uint32_t>(items.size() - 1);
		uint32_t last_slot_idx = dense_indices[last_dense_idx];

		if (dense_idx != last_dense_idx)
		{
			items[dense_idx] = std::move(items[last_dense_idx]);
			dense_indices[dense_idx] = last_slot_idx;
			dense_ids[dense_idx] = dense_ids[last_dense_idx];
			sparse_indices[last_slot_idx] = dense_idx;
		}

		sparse_indices[idx] = NULL_INDEX;
		items.pop_back();
		dense_indices.pop_back();
		dense_ids.pop_back();
	}

	void clear_all() override
	{
		for (uint32_t idx : dense_indices)
			sparse_indices[idx] = NULL_INDEX;
		items.clear();
		dense_indices.clear();
		dense_ids.clear();
	}

	T *get(Id id)
	{
		if (id == NULL_ID)
			return nullptr;
		uint32_t idx = id_index(id);
		if (idx >= sparse_indices.size() || sparse_indices[idx] == NULL_INDEX)
			return nullptr;
		if (slots && !slots->alive(id))
			return nullptr;
		uint32_t dense_idx = sparse_indices[idx];
		if (dense_ids[dense_idx] != id)
			return nullptr;
		return &items[dense_idx];
	}
	const T *get(Id id) const { return const_cast<Pool *>(this)->get(id); }

	bool has(Id id) const { return get(id) != nullptr; }
	size_t size() const { return items.size(); }
	bool empty() const { return items.empty(); }

	Handle<T> handle(Id id) { return {id, this}; }

	// each():     void(const T&) or void(Id, const T&)
	// each_mut(): void(T&) or void(Id, T&)
	// The callback must not add to or remove from this pool.
	template <typename F>
	void each(F &&fn) const
	{
		for (size_t i = 0; i < items.size(); i++)
		{
			if constexpr (std::is_invocable_v<F, Id, const T &>)
				fn(id_at(i), items[i]);
			else
				fn(items[i]);
		}
	}

	template <typename F>
	void each_mut(F &&fn)
	{
		for (size_t i = 0; i < items.size(); i++)
		{
			if constexpr (std::is_invocable_v<F, Id, T &>)
				fn(id_at(i), items[i]);
			else
				fn(items[i]);
		}
	}
};

// =============================================================================
// TaskContext: what a task sees during one frame
// =============================================================================
class Sim;
class TaskContext
{
	Sim *owner;
public:
	explicit TaskContext(Sim &sim) : owner(&sim) {}

	Sim &sim();

	float dt_ms() const;
	double time_ms() const;
	uint64_t tick_count() const;

	Id spawn();
	void remove_entity(Id id);
	void defer(std::function<void()> fn);
};

// =============================================================================
// Task
// =============================================================================
struct Task
{
	NameId name = NULL_NAME;
	float priority = 0;
	bool active = true;
	bool pauseable = false;
	uint64_t runs = 0;

	std::function<void(TaskContext &)> fn;
};

// =============================================================================
// Phase: Suggested priority constants for common task ordering
// =============================================================================
struct Phase
{
	static constexpr float INPUT = 10.f;
	static constexpr float SIMULATE = 30.f;
	static constexpr float COLLIDE = 50.f;
	static constexpr float CLEANUP = 55.f;
	static constexpr float REPORT = 80.f;
};

// =============================================================================
// Sim Kernel
// =============================================================================
class Sim
{
	NameTable name_table;
	Slots m_slots;
	std::vector<Id> pending_removes;
	std::vector<std::function<void()>> deferred;

	std::vector<Task> task_list;
	std::vector<uint16_t> task_order_indices;
	bool tasks_dirty = false;

	struct PoolEntry
	{
		std::unique_ptr<PoolBase> pool;
		size_t type_id = 0;
	};
	std::vector<PoolEntry> pool_entries;
	std::vector<PoolBase *> pool_by_id;
	uint32_t next_pool_id = 0;

	float frame_dt = 0.f;
	double elapsed_ms = 0.0;
	uint64_t tick_no = 0;
	bool stepping_active = false, paused = false, step_requested = false;
	std::vector<std::string> fault_list;

public:
	Sim() = default;
	Sim(const Sim &) = delete;
	Sim &operator=(const Sim &) = delete;
	Sim(Sim &&) = delete;
	Sim &operator=(Sim &&) = delete;

	// ====== NAME INTERNING ======
	NameId intern(const char *s) { return name_table.intern(s); }
	const char *name_str(NameId id) const { return name_table.str(id); }

	// ====== CORE TIMELINE ======
	uint32_t entity_count() const { return m_slots.count(); }
	float dt_ms() const { return frame_dt; }
	double time_ms() const { return elapsed_ms; }
	uint64_t tick_count() const { return tick_no; }

	const std::vector<std::string> &faults() const { return fault_list; }
	bool is_paused() const { return paused; }
	void pause() { paused = true; }
	void resume() { paused = false; }
	void request_step() { step_requested = true; }
	void reset_clock()
	{
		elapsed_ms = 0.0;
		tick_no = 0;
	}

	// Advance one frame by dt_ms. Simulation time only moves while unpaused
	// (or while stepping).
	void tick(float dt_ms)
	{
		if (!std::isfinite(dt_ms) || dt_ms < 0.f)
			throw Fault("tick: dt_ms must be finite and >= 0");

		stepping_active = step_requested;
		step_requested = false;

		bool advancing = !paused || stepping_active;
		frame_dt = advancing ? dt_ms : 0.f;
		elapsed_ms += frame_dt;
		tick_no++;

		if (tasks_dirty)
		{
			task_order_indices.clear();
			for (uint16_t i = 0; i < (uint16_t)task_list.size(); i++)
				if (task_list[i].active)
					task_order_indices.push_back(i);
			std::stable_sort(task_order_indices.begin(), task_order_indices.end(),
				[this](uint16_t a, uint16_t b) { return task_list[a].priority < task_list[b].priority; });
			tasks_dirty = false;
		}

		for (uint16_t oi = 0; oi < (uint16_t)task_order_indices.size(); ++oi)
		{
			uint16_t ti = task_order_indices[oi];
			// Index task_list by ti throughout; schedule() may reallocate it.
			if (!task_list[ti].active || !task_list[ti].fn)
				continue;
			if (task_list[ti].pauseable && !advancing)
				continue;

			TaskContext ctx(*this);
			try
			{
				task_list[ti].fn(ctx);
				flush_deferred();
			}
			catch (const Fault &e)
			{
				deferred.clear();
				task_list[ti].active = false;
				fault_list.push_back(std::string(name_str(task_list[ti].name)) + ": " + e.what());
				tasks_dirty = true;
			}
			task_list[ti].runs++;
		}

		flush_removes();
		stepping_active = false;
	}

	// ====== IDS ======
	Id spawn()
	{
		return m_slots.acquire();
	}

	void remove_entity(Id id)
	{
		pending_removes.push_back(id);
	}

	bool alive(Id id) const { return m_slots.alive(id); }

	void flush_removes()
	{
		for (Id id : pending_removes)
		{
			if (!m_slots.alive(id))
				continue;
			for (PoolBase *p : pool_by_id)
			{
				if (p) p->remove(id);
			}
			m_slots.release(id);
		}
		pending_removes.clear();
	}

	// Drop every entity from every pool. Pending removals are discarded.
	void clear_entities()
	{
		for (PoolBase *p : pool_by_id)
			if (p) p->clear_all();
		m_slots.release_all();
		pending_removes.clear();
	}

	// ====== DEFERRED WORK ======
	void defer(std::function<void()> fn)
	{
		deferred.push_back(std::move(fn));
	}

	void flush_deferred()
	{
		// An action may defer more work; those run in the same flush.
		for (size_t i = 0; i < deferred.size(); i++)
		{
			auto fn = std::move(deferred[i]);
			fn();
		}
		deferred.clear();
	}

	// ====== SCHEDULING ======
	template <typename F>
	void schedule(NameId name, float priority, F &&fn, bool pauseable = false)
	{
		Task t;
		t.name = name;
		t.priority = priority;
		t.pauseable = pauseable;

		t.fn = [f = std::forward<F>(fn)](TaskContext &ctx) mutable { f(ctx); };
		task_list.push_back(std::move(t));
		tasks_dirty = true;
	}

	template <typename F>
	void schedule(const char *name, float priority, F &&fn, bool pauseable = false)
	{
		schedule(intern(name), priority, std::forward<F>(fn), pauseable);
	}

	const std::vector<Task> &tasks() const { return task_list; }

	Task *task(NameId name)
	{
		for (auto &t : task_list)
			if (t.name == name)
				return &t;
		return nullptr;
	}
	Task *task(const char *name) { return task(intern(name)); }

	void stop_task(NameId name)
	{
		for (auto &t : task_list)
			if (t.name == name)
			{
				t.active = false;
				tasks_dirty = true;
			}
	}
	void stop_task(const char *name) { stop_task(intern(name)); }

	// ====== POOLS ======
	template <typename T>
	Pool<T> *pool(NameId name)
	{
		if (name == NULL_NAME) return nullptr;
		if (name >= pool_entries.size()) pool_entries.resize(name + 1);
		auto &r = pool_entries[name];
		if (!r.pool)
		{
			auto p = std::make_unique<Pool<T>>();
			p->pool_id = next_pool_id++;
			p->slots = &m_slots;
			r.type_id = get_type_id<T>();

			if (p->pool_id >= pool_by_id.size())
				pool_by_id.resize(p->pool_id + 1, nullptr);
			pool_by_id[p->pool_id] = p.get();
			r.pool = std::move(p);
		}
		assert(r.type_id == get_type_id<T>() && "Pool type mismatch! Same name used with different types");
		return static_cast<Pool<T> *>(r.pool.get());
	}

	template <typename T>
	Pool<T> *pool(const char *name) { return pool<T>(intern(name)); }
};

// =============================================================================
// TaskContext inline implementations
// =============================================================================
inline Sim &TaskContext::sim() { return *owner; }
inline float TaskContext::dt_ms() const { return owner->dt_ms(); }
inline double TaskContext::time_ms() const { return owner->time_ms(); }
inline uint64_t TaskContext::tick_count() const { return owner->tick_count(); }
inline Id TaskContext::spawn() { return owner->spawn(); }
inline void TaskContext::remove_entity(Id id) { owner->remove_entity(id); }
inline void TaskContext::defer(std::function<void()> fn) { owner->defer(std::move(fn)); }

} // namespace salvo
