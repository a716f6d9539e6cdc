// rsched_world.hpp — Region ownership boundary
//
// RegionMap is everything the scheduler knows about the world: which worker
// ticks a chunk right now, and where an entity is right now. The scheduler
// only queries it and never caches an answer past the drain step that used
// it, because the answers change underneath it (merge, split, rebalance,
// entities walking across region borders, teleports, despawns).
//
// GridRegionMap is a self-contained in-memory RegionMap:
//   - regions are square blocks of (1 << region_shift) chunks per side
//   - each region is explicitly assigned to a worker (or to none)
//   - entities live in generational slots; remove() bumps the generation
//     so every outstanding EntityRef resolves as Retired from then on
//
// Usage:
//   GridRegionMap map(3);                 // 8x8 chunks per region
//   map.assign(0, 0, 0, 0);               // world 0, region (0,0) -> worker 0
//   EntityRef e = map.spawn({0, 10, 64, 10});
//   map.set_retire_hook(&Scheduler::on_entity_retired, &sched);
//
// Depends: rsched_core.hpp

#pragma once

#include "rsched_core.hpp"
#include <mutex>
#include <vector>
#include <unordered_map>

namespace rsched
{

// =============================================================================
// EntityResolution
// =============================================================================
struct EntityResolution
{
	enum class Kind : uint8_t
	{
		Owned,   // in a region, ticked by `worker`
		Pending, // mid-transition (teleport, world change), ask again next tick
		Retired  // permanently gone
	};

	Kind kind = Kind::Retired;
	WorkerId worker = NO_WORKER;

	static EntityResolution owned(WorkerId w) { return {Kind::Owned, w}; }
	static EntityResolution pending() { return {Kind::Pending, NO_WORKER}; }
	static EntityResolution retired() { return {Kind::Retired, NO_WORKER}; }
};

// =============================================================================
// RegionMap — external collaborator interface
// =============================================================================
class RegionMap
{
public:
	virtual ~RegionMap() = default;

	// Worker currently ticking the region that contains the chunk, or
	// NO_WORKER if no worker ticks it.
	virtual WorkerId resolve_region(WorldId world, int32_t chunk_x, int32_t chunk_z) const = 0;

	virtual EntityResolution resolve_entity(EntityRef entity) const = 0;
};

// =============================================================================
// GridRegionMap
// =============================================================================
class GridRegionMap : public RegionMap
{
public:
	struct RegionKey
	{
		WorldId world = 0;
		int32_t x = 0;
		int32_t z = 0;

		bool operator==(const RegionKey &o) const { return world == o.world && x == o.x && z == o.z; }
	};

	using RetireHook = void (*)(void *, EntityRef);

	explicit GridRegionMap(int region_shift = 3) : m_region_shift(region_shift) {}

	GridRegionMap(const GridRegionMap &) = delete;
	GridRegionMap &operator=(const GridRegionMap &) = delete;

	int region_shift() const { return m_region_shift; }

	RegionKey region_of(ChunkPos c) const
	{
		return {c.world, c.x >> m_region_shift, c.z >> m_region_shift};
	}

	// Called from the thread that removes the entity, after the map lock is
	// released. The scheduler fires retirement callbacks from here.
	void set_retire_hook(RetireHook fn, void *ctx)
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		m_retire_fn = fn;
		m_retire_ctx = ctx;
	}

	// ====== REGIONS ======

	void assign(WorldId world, int32_t region_x, int32_t region_z, WorkerId worker)
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		m_owners[{world, region_x, region_z}] = worker;
	}

	void unassign(WorldId world, int32_t region_x, int32_t region_z)
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		m_owners.erase({world, region_x, region_z});
	}

	// Hand every region of `from` to `to` (a merge). Returns regions moved.
	size_t reassign_worker(WorkerId from, WorkerId to)
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		size_t moved = 0;
		for (auto &kv : m_owners)
		{
			if (kv.second == from)
			{
				kv.second = to;
				moved++;
			}
		}
		return moved;
	}

	WorkerId region_owner(WorldId world, int32_t region_x, int32_t region_z) const
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		auto it = m_owners.find({world, region_x, region_z});
		return it != m_owners.end() ? it->second : NO_WORKER;
	}

	size_t region_count() const
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		return m_owners.size();
	}

	// ====== ENTITIES ======

	EntityRef spawn(const Location &pos)
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		uint32_t idx;
		if (!m_free.empty())
		{
			idx = m_free.back();
			m_free.pop_back();
		}
		else
		{
			idx = static_cast<uint32_t>(m_slots.size());
			m_slots.emplace_back();
		}
		Slot &s = m_slots[idx];
		s.alive = true;
		s.in_transit = false;
		s.pos = pos;
		m_alive++;
		return make_entity(idx, s.generation);
	}

	bool move(EntityRef e, const Location &pos)
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		Slot *s = live_slot(e);
		if (!s)
			return false;
		s->pos = pos;
		return true;
	}

	// Teleport start: the entity belongs to no region until end_transit().
	bool begin_transit(EntityRef e)
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		Slot *s = live_slot(e);
		if (!s)
			return false;
		s->in_transit = true;
		return true;
	}

	bool end_transit(EntityRef e, const Location &pos)
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		Slot *s = live_slot(e);
		if (!s)
			return false;
		s->in_transit = false;
		s->pos = pos;
		return true;
	}

	// Permanently removes the entity and fires the retire hook once.
	bool remove(EntityRef e)
	{
		RetireHook fn;
		void *ctx;
		{
			std::lock_guard<std::mutex> lk(m_mtx);
			Slot *s = live_slot(e);
			if (!s)
				return false;
			s->alive = false;
			s->in_transit = false;
			s->generation++;
			if (s->generation == 0)
				s->generation = 1;
			m_free.push_back(entity_index(e));
			m_alive--;
			fn = m_retire_fn;
			ctx = m_retire_ctx;
		}
		if (fn)
			fn(ctx, e);
		return true;
	}

	bool alive(EntityRef e) const
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		return live_slot(e) != nullptr;
	}

	bool location(EntityRef e, Location &out) const
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		const Slot *s = live_slot(e);
		if (!s)
			return false;
		out = s->pos;
		return true;
	}

	size_t entity_count() const
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		return m_alive;
	}

	// ====== RegionMap ======

	WorkerId resolve_region(WorldId world, int32_t chunk_x, int32_t chunk_z) const override
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		return owner_locked(region_of({world, chunk_x, chunk_z}));
	}

	EntityResolution resolve_entity(EntityRef e) const override
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		const Slot *s = live_slot(e);
		if (!s)
			return EntityResolution::retired();
		if (s->in_transit)
			return EntityResolution::pending();

		// An entity standing in a region nobody ticks cannot be acted on
		// this tick, but it still exists.
		WorkerId w = owner_locked(region_of(s->pos.chunk()));
		if (w == NO_WORKER)
			return EntityResolution::pending();
		return EntityResolution::owned(w);
	}

private:
	struct RegionKeyHash
	{
		size_t operator()(const RegionKey &k) const
		{
			uint64_t h = static_cast<uint64_t>(k.world) * 0x9E3779B97F4A7C15ULL;
			h ^= static_cast<uint64_t>(static_cast<uint32_t>(k.x)) + 0x7F4A7C15ULL + (h << 6) + (h >> 2);
			h ^= static_cast<uint64_t>(static_cast<uint32_t>(k.z)) + 0x9E3779B9ULL + (h << 6) + (h >> 2);
			return static_cast<size_t>(h);
		}
	};

	struct Slot
	{
		uint32_t generation = 1;
		bool alive = false;
		bool in_transit = false;
		Location pos;
	};

	int m_region_shift;
	mutable std::mutex m_mtx;
	std::unordered_map<RegionKey, WorkerId, RegionKeyHash> m_owners;
	std::vector<Slot> m_slots;
	std::vector<uint32_t> m_free;
	size_t m_alive = 0;

	RetireHook m_retire_fn = nullptr;
	void *m_retire_ctx = nullptr;

	const Slot *live_slot(EntityRef e) const
	{
		uint32_t idx = entity_index(e);
		if (e == NULL_ENTITY || idx >= m_slots.size())
			return nullptr;
		const Slot &s = m_slots[idx];
		if (!s.alive || s.generation != entity_generation(e))
			return nullptr;
		return &s;
	}
	Slot *live_slot(EntityRef e) { return const_cast<Slot *>(static_cast<const GridRegionMap *>(this)->live_slot(e)); }

	WorkerId owner_locked(const RegionKey &k) const
	{
		auto it = m_owners.find(k);
		return it != m_owners.end() ? it->second : NO_WORKER;
	}
};

} // namespace rsched
