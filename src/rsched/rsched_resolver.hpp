// rsched_resolver.hpp — Target descriptor -> owning worker
//
// One switch over the Target variant. Asked at submission and again right
// before every execution attempt, because the answer for a region or an
// entity may have changed since the task was queued.
//
// Depends: rsched_task.hpp, rsched_world.hpp

#pragma once

#include "rsched_task.hpp"
#include "rsched_world.hpp"
#include <variant>

namespace rsched
{

struct Resolution
{
	enum class Kind : uint8_t
	{
		Owned,   // run on `worker`
		Pending, // entity mid-transition, try again next tick
		Retired, // entity gone, fire the retirement callback
		Unowned  // region not ticked by any known worker, park it
	};

	Kind kind = Kind::Unowned;
	WorkerId worker = NO_WORKER;

	static Resolution owned(WorkerId w) { return {Kind::Owned, w}; }
	static Resolution pending() { return {Kind::Pending, NO_WORKER}; }
	static Resolution retired() { return {Kind::Retired, NO_WORKER}; }
	static Resolution unowned() { return {Kind::Unowned, NO_WORKER}; }
};

class TargetResolver
{
	const RegionMap *m_map;
	uint32_t m_workers;

public:
	TargetResolver(const RegionMap &map, uint32_t workers) : m_map(&map), m_workers(workers) {}

	bool valid_worker(WorkerId w) const { return w < m_workers; }

	Resolution resolve(const Target &target) const
	{
		if (std::holds_alternative<NoTarget>(target))
			return Resolution::owned(GLOBAL_WORKER);

		if (const auto *r = std::get_if<RegionTarget>(&target))
		{
			WorkerId w = m_map->resolve_region(r->chunk.world, r->chunk.x, r->chunk.z);
			return valid_worker(w) ? Resolution::owned(w) : Resolution::unowned();
		}

		const auto &e = std::get<EntityTarget>(target);
		EntityResolution er = m_map->resolve_entity(e.entity);
		switch (er.kind)
		{
		case EntityResolution::Kind::Owned:
			// Owned by a worker we do not run: treat like a teleport in
			// progress rather than guess a thread.
			return valid_worker(er.worker) ? Resolution::owned(er.worker) : Resolution::pending();
		case EntityResolution::Kind::Pending:
			return Resolution::pending();
		case EntityResolution::Kind::Retired:
			return Resolution::retired();
		}
		return Resolution::retired();
	}
};

} // namespace rsched
