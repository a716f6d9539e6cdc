// rsched_facades.hpp — Plugin-facing scheduling front ends
//
// Four thin value types over one Scheduler. Each turns caller intent into a
// ScheduledTask plus target descriptor and hands it to the kernel:
//
//   GlobalScheduler  — no target, runs on the global region
//   RegionScheduler  — fixed chunk target, runs on whoever ticks that chunk
//   EntityScheduler  — entity target, follows the entity, retires with it
//   AsyncScheduler   — no target, runs on the async pool (milliseconds)
//
// Usage:
//   auto h = sched.regions().run_delayed(owner, 0, 12, -3, [](TaskHandle &) { ... }, 20);
//   sched.entities().run_at_fixed_rate(owner, e, tick_fn, on_gone, 1, 1);
//   sched.global().cancel_tasks(owner);
//
// Tick delays and periods below 1 are clamped to 1. "execute"/"run" are the
// immediate variants: due on the owner's next drain, never run inline.
//
// Depends: rsched_scheduler.hpp

#pragma once

#include "rsched_scheduler.hpp"
#include <chrono>
#include <functional>
#include <utility>

namespace rsched
{

using SimpleFn = std::function<void()>;

inline TaskFn wrap_simple(SimpleFn fn)
{
	if (!fn)
		return {};
	return [fn = std::move(fn)](TaskHandle &) { fn(); };
}

// =============================================================================
// GlobalScheduler
// =============================================================================
class GlobalScheduler
{
	Scheduler *m_sched;

public:
	explicit GlobalScheduler(Scheduler &s) : m_sched(&s) {}

	void execute(OwnerId owner, SimpleFn fn)
	{
		submit(owner, wrap_simple(std::move(fn)), 0, 0);
	}

	TaskHandle run(OwnerId owner, TaskFn fn)
	{
		return submit(owner, std::move(fn), 0, 0);
	}

	TaskHandle run_delayed(OwnerId owner, TaskFn fn, int64_t delay_ticks)
	{
		return submit(owner, std::move(fn), normalize_ticks(delay_ticks), 0);
	}

	TaskHandle run_at_fixed_rate(OwnerId owner, TaskFn fn, int64_t initial_ticks, int64_t period_ticks)
	{
		return submit(owner, std::move(fn), normalize_ticks(initial_ticks), normalize_ticks(period_ticks));
	}

	size_t cancel_tasks(OwnerId owner)
	{
		return m_sched->cancel_kind_for(owner, TaskKind::Global);
	}

private:
	TaskHandle submit(OwnerId owner, TaskFn fn, uint64_t delay, uint64_t period)
	{
		return m_sched->submit(
			m_sched->make_task(owner, TaskKind::Global, NoTarget{}, std::move(fn), {}, period), delay);
	}
};

// =============================================================================
// RegionScheduler
// =============================================================================
class RegionScheduler
{
	Scheduler *m_sched;

public:
	explicit RegionScheduler(Scheduler &s) : m_sched(&s) {}

	// ====== BY CHUNK ======

	void execute(OwnerId owner, WorldId world, int32_t chunk_x, int32_t chunk_z, SimpleFn fn)
	{
		submit(owner, {world, chunk_x, chunk_z}, wrap_simple(std::move(fn)), 0, 0);
	}

	TaskHandle run(OwnerId owner, WorldId world, int32_t chunk_x, int32_t chunk_z, TaskFn fn)
	{
		return submit(owner, {world, chunk_x, chunk_z}, std::move(fn), 0, 0);
	}

	TaskHandle run_delayed(OwnerId owner, WorldId world, int32_t chunk_x, int32_t chunk_z,
		TaskFn fn, int64_t delay_ticks)
	{
		return submit(owner, {world, chunk_x, chunk_z}, std::move(fn), normalize_ticks(delay_ticks), 0);
	}

	TaskHandle run_at_fixed_rate(OwnerId owner, WorldId world, int32_t chunk_x, int32_t chunk_z,
		TaskFn fn, int64_t initial_ticks, int64_t period_ticks)
	{
		return submit(owner, {world, chunk_x, chunk_z}, std::move(fn),
			normalize_ticks(initial_ticks), normalize_ticks(period_ticks));
	}

	// ====== BY LOCATION (chunk derived from block coordinates) ======

	void execute(OwnerId owner, const Location &at, SimpleFn fn)
	{
		submit(owner, at.chunk(), wrap_simple(std::move(fn)), 0, 0);
	}

	TaskHandle run(OwnerId owner, const Location &at, TaskFn fn)
	{
		return submit(owner, at.chunk(), std::move(fn), 0, 0);
	}

	TaskHandle run_delayed(OwnerId owner, const Location &at, TaskFn fn, int64_t delay_ticks)
	{
		return submit(owner, at.chunk(), std::move(fn), normalize_ticks(delay_ticks), 0);
	}

	TaskHandle run_at_fixed_rate(OwnerId owner, const Location &at, TaskFn fn,
		int64_t initial_ticks, int64_t period_ticks)
	{
		return submit(owner, at.chunk(), std::move(fn),
			normalize_ticks(initial_ticks), normalize_ticks(period_ticks));
	}

	size_t cancel_tasks(OwnerId owner)
	{
		return m_sched->cancel_kind_for(owner, TaskKind::Region);
	}

private:
	TaskHandle submit(OwnerId owner, ChunkPos chunk, TaskFn fn, uint64_t delay, uint64_t period)
	{
		return m_sched->submit(
			m_sched->make_task(owner, TaskKind::Region, RegionTarget{chunk}, std::move(fn), {}, period),
			delay);
	}
};

// =============================================================================
// EntityScheduler
//
// `retired` fires at most once, instead of any further run, when the entity
// is gone for good. If the entity is already gone at submission it fires
// right away on the calling thread and the returned handle is CANCELLED.
// =============================================================================
class EntityScheduler
{
	Scheduler *m_sched;

public:
	explicit EntityScheduler(Scheduler &s) : m_sched(&s) {}

	// Returns false if the entity was already retired (`retired` has run).
	bool execute(OwnerId owner, EntityRef entity, SimpleFn fn, SimpleFn retired, int64_t delay_ticks)
	{
		uint64_t delay = delay_ticks <= 0 ? 0 : static_cast<uint64_t>(delay_ticks);
		bool queued = false;
		submit(owner, entity, wrap_simple(std::move(fn)), std::move(retired), delay, 0, &queued);
		return queued;
	}

	TaskHandle run(OwnerId owner, EntityRef entity, TaskFn fn, SimpleFn retired = {})
	{
		return submit(owner, entity, std::move(fn), std::move(retired), 0, 0);
	}

	TaskHandle run_delayed(OwnerId owner, EntityRef entity, TaskFn fn, SimpleFn retired, int64_t delay_ticks)
	{
		return submit(owner, entity, std::move(fn), std::move(retired), normalize_ticks(delay_ticks), 0);
	}

	TaskHandle run_at_fixed_rate(OwnerId owner, EntityRef entity, TaskFn fn, SimpleFn retired,
		int64_t initial_ticks, int64_t period_ticks)
	{
		return submit(owner, entity, std::move(fn), std::move(retired),
			normalize_ticks(initial_ticks), normalize_ticks(period_ticks));
	}

	size_t cancel_tasks(OwnerId owner)
	{
		return m_sched->cancel_kind_for(owner, TaskKind::Entity);
	}

private:
	TaskHandle submit(OwnerId owner, EntityRef entity, TaskFn fn, SimpleFn retired,
		uint64_t delay, uint64_t period, bool *queued = nullptr)
	{
		return m_sched->submit(
			m_sched->make_task(owner, TaskKind::Entity, EntityTarget{entity}, std::move(fn),
				std::move(retired), period),
			delay, queued);
	}
};

// =============================================================================
// AsyncScheduler
// =============================================================================
class AsyncScheduler
{
	Scheduler *m_sched;

public:
	using ms = std::chrono::milliseconds;

	explicit AsyncScheduler(Scheduler &s) : m_sched(&s) {}

	TaskHandle run_now(OwnerId owner, TaskFn fn)
	{
		return submit(owner, std::move(fn), ms(0), 0);
	}

	TaskHandle run_delayed(OwnerId owner, TaskFn fn, ms delay)
	{
		return submit(owner, std::move(fn), delay < ms(0) ? ms(0) : delay, 0);
	}

	TaskHandle run_at_fixed_rate(OwnerId owner, TaskFn fn, ms initial, ms period)
	{
		uint64_t p = period.count() < 1 ? 1 : static_cast<uint64_t>(period.count());
		return submit(owner, std::move(fn), initial < ms(0) ? ms(0) : initial, p);
	}

	size_t cancel_tasks(OwnerId owner)
	{
		return m_sched->cancel_kind_for(owner, TaskKind::Async);
	}

private:
	TaskHandle submit(OwnerId owner, TaskFn fn, ms delay, uint64_t period_ms)
	{
		return m_sched->submit_async(
			m_sched->make_task(owner, TaskKind::Async, NoTarget{}, std::move(fn), {}, period_ms), delay);
	}
};

// =============================================================================
// Scheduler facade accessors
// =============================================================================
inline GlobalScheduler Scheduler::global() { return GlobalScheduler(*this); }
inline RegionScheduler Scheduler::regions() { return RegionScheduler(*this); }
inline EntityScheduler Scheduler::entities() { return EntityScheduler(*this); }
inline AsyncScheduler Scheduler::async() { return AsyncScheduler(*this); }

} // namespace rsched
