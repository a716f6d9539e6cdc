// rsched_scheduler.hpp — Scheduler kernel
//
// Owns one RegionQueue per region worker, the global queue, the async
// executor and the live-task indexes. Everything a facade submits ends up
// in submit() / submit_async(); everything a worker runs goes through
// tick_worker() / tick_global().
//
// DRAIN PROTOCOL (per due entry, on the worker draining the queue):
//   1. Not IDLE any more (cancelled or retired while queued) -> drop.
//   2. Re-resolve the target:
//        Owned by this worker   -> try_begin, run, finish_run, maybe re-enqueue
//        Owned by another       -> push to that worker's queue, same due tick
//        Pending (teleporting)  -> push back here for next tick
//        Unowned region         -> park on the global queue
//        Retired entity         -> fire the retirement callback, terminal
//
// Tick clock:
//   advance_tick() bumps the global tick; every worker drains against the
//   same counter. RegionTicker drives this on real threads. Tests call
//   advance_tick() + tick_worker()/tick_global() (or tick_all()) directly.
//
// Lifetime: stop whatever drives tick_worker() before destroying the
// Scheduler. The destructor cancels every task still alive.
//
// Depends: rsched_queue.hpp, rsched_async.hpp, rsched_registry.hpp,
//          rsched_resolver.hpp

#pragma once

#include "rsched_core.hpp"
#include "rsched_task.hpp"
#include "rsched_world.hpp"
#include "rsched_queue.hpp"
#include "rsched_async.hpp"
#include "rsched_registry.hpp"
#include "rsched_resolver.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace rsched
{

// =============================================================================
// SchedulerConfig — set before constructing the Scheduler
// =============================================================================
struct SchedulerConfig
{
	uint32_t region_workers = 4;
	uint32_t async_threads = 2;

	// Consecutive ticks an entity task may wait on a pending (teleporting)
	// entity before it is retired. 0 = wait forever.
	uint32_t pending_retry_limit = 0;

	size_t max_faults = 256; // fault strings kept; the rest are only counted
	bool log_faults = true;
};

class GlobalScheduler;
class RegionScheduler;
class EntityScheduler;
class AsyncScheduler;

// Worker the calling thread is draining right now, NO_WORKER outside a drain.
inline WorkerId &current_worker_slot()
{
	static thread_local WorkerId w = NO_WORKER;
	return w;
}

// =============================================================================
// Scheduler
// =============================================================================
class Scheduler
{
public:
	// Marks the calling thread as the owner of `worker` for its lifetime.
	struct WorkerScope
	{
		WorkerId prev;
		explicit WorkerScope(WorkerId w) : prev(current_worker_slot()) { current_worker_slot() = w; }
		~WorkerScope() { current_worker_slot() = prev; }
		WorkerScope(const WorkerScope &) = delete;
		WorkerScope &operator=(const WorkerScope &) = delete;
	};

	explicit Scheduler(RegionMap &map, SchedulerConfig cfg = {})
		: m_config(cfg)
		, m_map(&map)
		, m_resolver(map, cfg.region_workers)
		, m_global(GLOBAL_WORKER)
	{
		m_queues.reserve(m_config.region_workers);
		for (uint32_t i = 0; i < m_config.region_workers; i++)
			m_queues.push_back(std::make_unique<RegionQueue>(i));
		m_async.set_fault_hook(&Scheduler::on_async_fault, this);

		// Taken here so they resolve to the host image. Plugins reach
		// make_task() and current_worker() through their own copy of this
		// header, and may be unloaded while their cancelled records still
		// sit in a queue.
		m_alloc_fn = &Scheduler::alloc_task;
		m_terminal_fn = &Scheduler::on_task_terminal;
		m_worker_slot_fn = &current_worker_slot;
	}

	Scheduler(const Scheduler &) = delete;
	Scheduler &operator=(const Scheduler &) = delete;
	Scheduler(Scheduler &&) = delete;
	Scheduler &operator=(Scheduler &&) = delete;

	~Scheduler()
	{
		m_async.shutdown();
		size_t n = m_registry.cancel_everything();
		if (n)
			printf("[sched] shutdown cancelled %zu live task(s)\n", n);
	}

	const SchedulerConfig &config() const { return m_config; }
	const RegionMap &region_map() const { return *m_map; }
	const TargetResolver &resolver() const { return m_resolver; }

	// ====== FACADES (defined in rsched_facades.hpp) ======
	GlobalScheduler global();
	RegionScheduler regions();
	EntityScheduler entities();
	AsyncScheduler async();

	// ====== OWNERS ======
	OwnerId register_owner(const char *name)
	{
		std::lock_guard<std::mutex> lk(m_owner_mtx);
		return m_owner_names.intern(name);
	}

	std::string owner_name(OwnerId owner) const
	{
		std::lock_guard<std::mutex> lk(m_owner_mtx);
		return m_owner_names.str(owner);
	}

	// ====== TICK CLOCK ======
	uint64_t current_tick() const { return m_tick.load(std::memory_order_acquire); }
	uint64_t advance_tick() { return m_tick.fetch_add(1, std::memory_order_acq_rel) + 1; }

	uint32_t worker_count() const { return static_cast<uint32_t>(m_queues.size()); }

	// Worker the calling thread is draining, NO_WORKER outside a drain.
	WorkerId current_worker() const { return m_worker_slot_fn(); }

	// True if the calling thread is draining the worker that owns `target`
	// right now.
	bool is_owned_by_current_thread(const Target &target) const
	{
		WorkerId me = current_worker();
		if (me == NO_WORKER)
			return false;
		Resolution r = m_resolver.resolve(target);
		return r.kind == Resolution::Kind::Owned && r.worker == me;
	}

	// ====== SUBMISSION ======

	TaskPtr make_task(OwnerId owner, TaskKind kind, Target target, TaskFn fn,
		RetiredFn retired = {}, uint64_t period = 0)
	{
		TaskPtr t = m_alloc_fn();
		t->id = m_next_task_id.fetch_add(1, std::memory_order_relaxed);
		t->owner = owner;
		t->kind = kind;
		t->created_tick = current_tick();
		t->target = target;
		t->period = period;
		t->fn = std::move(fn);
		t->retired = std::move(retired);
		t->set_terminal_hook(m_terminal_fn, this);
		return t;
	}

	// Region-bound submission. delay_ticks == 0 means "on the owner's next
	// drain"; facades normalize every other delay to >= 1 before calling.
	// *queued (if given) is false when the target was already retired and
	// the task retired on the spot instead of being queued.
	TaskHandle submit(TaskPtr task, uint64_t delay_ticks, bool *queued = nullptr)
	{
		if (!task->fn)
			throw std::invalid_argument("rsched: task submitted without a callback");

		uint64_t due = current_tick() + delay_ticks;
		m_registry.add(task);
		if (const auto *et = std::get_if<EntityTarget>(&task->target))
			m_retirement.add(et->entity, task);

		TaskHandle handle(task);
		RegionQueue *q = route(task, due);
		if (queued)
			*queued = q != nullptr;
		return handle;
	}

	TaskHandle submit_async(TaskPtr task, std::chrono::milliseconds delay)
	{
		if (!task->fn)
			throw std::invalid_argument("rsched: task submitted without a callback");

		m_registry.add(task);
		TaskHandle handle(task);
		async_executor().submit(std::move(task), delay);
		return handle;
	}

	// ====== WORKER SIDE ======

	// Drains worker `w` for the current tick on the calling thread.
	// Returns the number of due entries processed.
	size_t tick_worker(WorkerId w)
	{
		return drain(worker_queue(w));
	}

	size_t tick_global()
	{
		return drain(m_global);
	}

	// Single-threaded drive: every region worker in order, then global.
	size_t tick_all()
	{
		size_t n = 0;
		for (auto &q : m_queues)
			n += drain(*q);
		n += drain(m_global);
		return n;
	}

	// Re-resolves everything held by `w` (due or not) and moves it to the
	// current owners. Call from the thread that owns `w` (or while `w` is
	// not being drained), after its regions were reassigned.
	size_t rehome(WorkerId w)
	{
		RegionQueue &q = (w == GLOBAL_WORKER) ? m_global : worker_queue(w);
		size_t moved = 0;
		for (auto &e : q.take_all())
		{
			if (e.task->state() != ExecutionState::IDLE)
			{
				q.stats().dropped.fetch_add(1, std::memory_order_relaxed);
				continue;
			}
			RegionQueue *dst = route(e.task, e.due);
			if (dst && dst != &q)
				moved++;
		}
		if (moved)
			printf("[sched] rehomed %zu task(s) off worker %u\n", moved, w);
		return moved;
	}

	// ====== RETIREMENT ======

	// The entity is gone for good: retire every task still waiting on it.
	// Retirement callbacks run synchronously on the calling thread.
	size_t retire_entity(EntityRef entity)
	{
		size_t fired = 0;
		m_retirement.retire(entity, [this, &fired](const TaskPtr &t) {
			if (retire_task(t) == RetireResult::RETIRED)
				fired++;
		});
		return fired;
	}

	// GridRegionMap::RetireHook trampoline.
	static void on_entity_retired(void *ctx, EntityRef entity)
	{
		static_cast<Scheduler *>(ctx)->retire_entity(entity);
	}

	// ====== CANCELLATION ======

	// Cancels every live task of `owner` across all facades. Safe during
	// plugin unload, concurrently with execution and retirement.
	size_t cancel_all_for(OwnerId owner)
	{
		return m_registry.cancel_all(owner);
	}

	size_t cancel_kind_for(OwnerId owner, TaskKind kind)
	{
		return m_registry.cancel_all(owner, &kind);
	}

	// ====== INTROSPECTION ======
	size_t live_tasks() const { return m_registry.live(); }
	size_t live_tasks_for(OwnerId owner) const { return m_registry.live_for(owner); }
	size_t tracked_for_entity(EntityRef e) const { return m_retirement.tracked(e); }

	size_t queued(WorkerId w) const
	{
		if (w == GLOBAL_WORKER)
			return m_global.size();
		return worker_queue(w).size();
	}

	const WorkerStats &worker_stats(WorkerId w) const
	{
		if (w == GLOBAL_WORKER)
			return m_global.stats();
		return worker_queue(w).stats();
	}

	std::vector<std::string> faults() const
	{
		std::lock_guard<std::mutex> lk(m_fault_mtx);
		return m_faults;
	}

	uint64_t fault_count() const { return m_fault_count.load(std::memory_order_relaxed); }

	void clear_faults()
	{
		std::lock_guard<std::mutex> lk(m_fault_mtx);
		m_faults.clear();
	}

	// Lazily started on first use, like every other thread in here.
	AsyncExecutor &async_executor()
	{
		if (!m_async.running())
			m_async.start(m_config.async_threads);
		return m_async;
	}

	void dump_stats() const
	{
		for (auto &q : m_queues)
			print_stats(*q);
		print_stats(m_global);
		printf("[sched] tick=%llu live=%zu faults=%llu async_pending=%zu\n",
			(unsigned long long)current_tick(), live_tasks(),
			(unsigned long long)fault_count(), m_async.pending());
	}

private:
	SchedulerConfig m_config;
	RegionMap *m_map;
	TargetResolver m_resolver;

	std::vector<std::unique_ptr<RegionQueue>> m_queues;
	RegionQueue m_global;
	AsyncExecutor m_async;

	TaskRegistry m_registry;
	RetirementNotifier m_retirement;

	std::atomic<uint64_t> m_tick{0};
	std::atomic<TaskId> m_next_task_id{1};

	mutable std::mutex m_owner_mtx;
	NameTable m_owner_names;

	mutable std::mutex m_fault_mtx;
	std::vector<std::string> m_faults;
	std::atomic<uint64_t> m_fault_count{0};

	TaskPtr (*m_alloc_fn)() = nullptr;
	ScheduledTask::TerminalHook m_terminal_fn = nullptr;
	WorkerId &(*m_worker_slot_fn)() = nullptr;

	static TaskPtr alloc_task() { return std::make_shared<ScheduledTask>(); }

	RegionQueue &worker_queue(WorkerId w) const
	{
		if (w >= m_queues.size())
			throw std::out_of_range("rsched: unknown worker " + std::to_string(w));
		return *m_queues[w];
	}

	// Places `task` on the queue of whoever owns its target now. Pending and
	// unowned targets are parked on the global queue, which keeps asking.
	// Returns the queue used, or nullptr if the task retired instead.
	RegionQueue *route(const TaskPtr &task, uint64_t due)
	{
		Resolution r = m_resolver.resolve(task->target);
		switch (r.kind)
		{
		case Resolution::Kind::Owned:
		{
			RegionQueue &q = (r.worker == GLOBAL_WORKER) ? m_global : *m_queues[r.worker];
			q.push(task, due);
			return &q;
		}
		case Resolution::Kind::Pending:
		case Resolution::Kind::Unowned:
			m_global.push(task, due);
			return &m_global;
		case Resolution::Kind::Retired:
			retire_task(task);
			return nullptr;
		}
		return nullptr;
	}

	size_t drain(RegionQueue &q)
	{
		WorkerScope scope(q.worker());
		uint64_t now = current_tick();
		return q.drain(now, [this, &q, now](RegionQueue::Entry e) {
			step(q, std::move(e), now);
		});
	}

	void step(RegionQueue &q, RegionQueue::Entry e, uint64_t now)
	{
		const TaskPtr &t = e.task;
		WorkerStats &st = q.stats();

		if (t->state() != ExecutionState::IDLE)
		{
			st.dropped.fetch_add(1, std::memory_order_relaxed);
			return;
		}

		Resolution r = m_resolver.resolve(t->target);
		switch (r.kind)
		{
		case Resolution::Kind::Owned:
			if (r.worker == q.worker())
			{
				t->pending_ticks = 0;
				execute(q, t, now);
			}
			else
			{
				RegionQueue &dst = (r.worker == GLOBAL_WORKER) ? m_global : *m_queues[r.worker];
				dst.push(t, e.due);
				st.transferred.fetch_add(1, std::memory_order_relaxed);
			}
			break;

		case Resolution::Kind::Pending:
			defer(q, t, now);
			break;

		case Resolution::Kind::Unowned:
			if (&q == &m_global)
			{
				q.push(t, now + 1);
				st.deferred.fetch_add(1, std::memory_order_relaxed);
			}
			else
			{
				m_global.push(t, now + 1);
				st.transferred.fetch_add(1, std::memory_order_relaxed);
			}
			break;

		case Resolution::Kind::Retired:
			if (retire_task(t) != RetireResult::NOT_RETIRED)
				st.retired.fetch_add(1, std::memory_order_relaxed);
			break;
		}
	}

	void defer(RegionQueue &q, const TaskPtr &t, uint64_t now)
	{
		t->pending_ticks++;
		uint32_t limit = m_config.pending_retry_limit;
		if (limit && t->pending_ticks >= limit)
		{
			fprintf(stderr, "[sched] task %llu: entity still pending after %u ticks, retiring\n",
				(unsigned long long)t->id, t->pending_ticks);
			if (retire_task(t) != RetireResult::NOT_RETIRED)
				q.stats().retired.fetch_add(1, std::memory_order_relaxed);
			return;
		}
		q.push(t, now + 1);
		q.stats().deferred.fetch_add(1, std::memory_order_relaxed);
	}

	void execute(RegionQueue &q, const TaskPtr &t, uint64_t now)
	{
		if (!t->try_begin())
		{
			// Lost the race to cancel() or retirement.
			q.stats().dropped.fetch_add(1, std::memory_order_relaxed);
			return;
		}

		TaskHandle handle(t);
		try
		{
			t->fn(handle);
		}
		catch (const std::exception &ex)
		{
			record_fault(*t, ex.what());
		}
		catch (...)
		{
			record_fault(*t, "unknown exception");
		}
		q.stats().executed.fetch_add(1, std::memory_order_relaxed);

		if (t->finish_run())
		{
			q.push(t, now + t->period);
			return;
		}

		if (t->take_retire_after_run())
			fire_retired(*t);
		t->finalize();
	}

	RetireResult retire_task(const TaskPtr &t)
	{
		RetireResult r = t->try_retire();
		if (r == RetireResult::RETIRED)
		{
			fire_retired(*t);
			t->finalize();
		}
		return r;
	}

	void fire_retired(ScheduledTask &t)
	{
		if (!t.retired)
			return;
		try
		{
			t.retired();
		}
		catch (const std::exception &ex)
		{
			record_fault(t, ex.what());
		}
		catch (...)
		{
			record_fault(t, "unknown exception");
		}
	}

	void record_fault(ScheduledTask &t, const char *what)
	{
		std::string line = "task " + std::to_string(t.id) + " (" + to_string(t.kind)
			+ ", owner '" + owner_name(t.owner) + "'): " + what;
		if (m_config.log_faults)
			fprintf(stderr, "[sched] fault %s\n", line.c_str());

		m_fault_count.fetch_add(1, std::memory_order_relaxed);
		std::lock_guard<std::mutex> lk(m_fault_mtx);
		if (m_faults.size() < m_config.max_faults)
			m_faults.push_back(std::move(line));
	}

	void print_stats(const RegionQueue &q) const
	{
		const WorkerStats &s = q.stats();
		char name[16];
		if (q.worker() == GLOBAL_WORKER)
			snprintf(name, sizeof(name), "global");
		else
			snprintf(name, sizeof(name), "worker %u", q.worker());
		printf("[sched] %-9s queued=%zu run=%llu moved=%llu deferred=%llu retired=%llu dropped=%llu drain=%llu/%llu us\n",
			name, q.size(),
			(unsigned long long)s.executed.load(), (unsigned long long)s.transferred.load(),
			(unsigned long long)s.deferred.load(), (unsigned long long)s.retired.load(),
			(unsigned long long)s.dropped.load(),
			(unsigned long long)s.last_us.load(), (unsigned long long)s.max_us.load());
	}

	// --- Hook trampolines ---

	static void on_task_terminal(void *ctx, ScheduledTask &t)
	{
		auto *self = static_cast<Scheduler *>(ctx);
		self->m_registry.remove(t);
		if (const auto *et = std::get_if<EntityTarget>(&t.target))
			self->m_retirement.remove(et->entity, t);
	}

	static void on_async_fault(void *ctx, ScheduledTask &t, const char *what)
	{
		static_cast<Scheduler *>(ctx)->record_fault(t, what);
	}
};

} // namespace rsched
