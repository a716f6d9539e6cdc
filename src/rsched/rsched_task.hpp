// rsched_task.hpp — Task Record and Task Handle
//
// A ScheduledTask is one unit of scheduled work: what to run, when, against
// which target, and an atomic execution state that is the single source of
// truth for "has this run / will this run".
//
// STATE MACHINE (all transitions are compare-and-swap):
//
//   IDLE ──try_begin──▶ RUNNING ──finish_run──▶ FINISHED          (one-shot)
//                          │    ──finish_run──▶ IDLE (next period) (repeating)
//   IDLE ──cancel/retire──▶ CANCELLED
//   RUNNING ──cancel/retire──▶ CANCELLED_RUNNING ──finish_run──▶ CANCELLED
//                                                 (repeating only)
//
// Queues own records through std::shared_ptr; a TaskHandle is the caller's
// view of the same record.
//
// Depends: rsched_core.hpp

#pragma once

#include "rsched_core.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <variant>

namespace rsched
{

// =============================================================================
// Target descriptor
// =============================================================================
struct NoTarget
{
};

struct RegionTarget
{
	ChunkPos chunk;
};

struct EntityTarget
{
	EntityRef entity = NULL_ENTITY;
};

using Target = std::variant<NoTarget, RegionTarget, EntityTarget>;

class TaskHandle;
using TaskFn = std::function<void(TaskHandle &)>;
using RetiredFn = std::function<void()>;

enum class RetireResult : uint8_t
{
	NOT_RETIRED,     // already terminal, or a one-shot whose primary is running
	RETIRED,         // caller must fire the retirement callback now
	RETIRE_AFTER_RUN // repeating task mid-run, worker fires it after the run
};

// =============================================================================
// ScheduledTask
// =============================================================================
class ScheduledTask
{
public:
	TaskId id = NULL_TASK;
	OwnerId owner = NULL_OWNER;
	TaskKind kind = TaskKind::Global;
	uint64_t created_tick = 0;
	Target target;

	// 0 = one-shot. Ticks for region-bound tasks, milliseconds for async.
	uint64_t period = 0;

	TaskFn fn;
	RetiredFn retired;

	// Consecutive ticks spent deferred on a pending entity. Only touched by
	// the queue that currently holds the record.
	uint32_t pending_ticks = 0;

	// --- Terminal notification hook (optional) ---
	// Fires exactly once when the record reaches FINISHED or CANCELLED.
	// The scheduler uses it to unlink the record from its indexes.
	using TerminalHook = void (*)(void *, ScheduledTask &);
	TerminalHook terminal_fn = nullptr;
	void *terminal_ctx = nullptr;

	ScheduledTask() = default;
	ScheduledTask(const ScheduledTask &) = delete;
	ScheduledTask &operator=(const ScheduledTask &) = delete;

	bool is_repeating() const { return period != 0; }
	ExecutionState state() const { return m_state.load(std::memory_order_acquire); }
	uint64_t runs() const { return m_runs.load(std::memory_order_relaxed); }

	void set_terminal_hook(TerminalHook fn_, void *ctx)
	{
		terminal_fn = fn_;
		terminal_ctx = ctx;
	}

	// Worker side: IDLE -> RUNNING. False means the task was cancelled or
	// retired and must not run.
	bool try_begin()
	{
		ExecutionState expected = ExecutionState::IDLE;
		return m_state.compare_exchange_strong(expected, ExecutionState::RUNNING,
			std::memory_order_acq_rel, std::memory_order_acquire);
	}

	// Worker side, after the primary callback returned (or threw).
	// Returns true if a repeating task went back to IDLE and must be
	// re-enqueued for its next period. Otherwise the record is terminal and
	// the worker owes it a finalize().
	bool finish_run()
	{
		m_runs.fetch_add(1, std::memory_order_relaxed);

		ExecutionState expected = ExecutionState::RUNNING;
		ExecutionState next = is_repeating() ? ExecutionState::IDLE : ExecutionState::FINISHED;
		if (m_state.compare_exchange_strong(expected, next,
				std::memory_order_acq_rel, std::memory_order_acquire))
			return next == ExecutionState::IDLE;

		// Only CANCELLED_RUNNING can replace RUNNING behind our back.
		m_state.store(ExecutionState::CANCELLED, std::memory_order_release);
		return false;
	}

	// Any thread. Never interrupts an in-flight run.
	CancelledState cancel()
	{
		ExecutionState curr = m_state.load(std::memory_order_acquire);
		for (;;)
		{
			switch (curr)
			{
			case ExecutionState::IDLE:
				if (m_state.compare_exchange_weak(curr, ExecutionState::CANCELLED,
						std::memory_order_acq_rel, std::memory_order_acquire))
				{
					mark_dead_in_queue();
					finalize();
					return CancelledState::CANCELLED_BY_CALLER;
				}
				continue;
			case ExecutionState::RUNNING:
				if (!is_repeating())
					return CancelledState::RUNNING;
				if (m_state.compare_exchange_weak(curr, ExecutionState::CANCELLED_RUNNING,
						std::memory_order_acq_rel, std::memory_order_acquire))
					return CancelledState::NEXT_RUNS_CANCELLED;
				continue;
			case ExecutionState::CANCELLED_RUNNING:
				return CancelledState::NEXT_RUNS_CANCELLED_ALREADY;
			case ExecutionState::FINISHED:
				return CancelledState::ALREADY_EXECUTED;
			case ExecutionState::CANCELLED:
				return CancelledState::CANCELLED_ALREADY;
			}
		}
	}

	// Target gone for good. Competes with cancel() and try_begin() through
	// the same CAS, so at most one of them wins for a given occurrence.
	// RETIRED: caller fires `retired`, then finalize().
	RetireResult try_retire()
	{
		ExecutionState curr = m_state.load(std::memory_order_acquire);
		for (;;)
		{
			switch (curr)
			{
			case ExecutionState::IDLE:
				if (m_state.compare_exchange_weak(curr, ExecutionState::CANCELLED,
						std::memory_order_acq_rel, std::memory_order_acquire))
				{
					mark_dead_in_queue();
					return RetireResult::RETIRED;
				}
				continue;
			case ExecutionState::RUNNING:
				if (!is_repeating())
					return RetireResult::NOT_RETIRED;
				// Flag first: the worker may finish the run the instant the
				// CAS lands and must see it.
				m_retire_after_run.store(true, std::memory_order_release);
				if (m_state.compare_exchange_weak(curr, ExecutionState::CANCELLED_RUNNING,
						std::memory_order_acq_rel, std::memory_order_acquire))
					return RetireResult::RETIRE_AFTER_RUN;
				if (!m_retire_after_run.exchange(false, std::memory_order_acq_rel))
					return RetireResult::RETIRE_AFTER_RUN; // a worker already took it
				continue;
			default:
				return RetireResult::NOT_RETIRED;
			}
		}
	}

	// Set by RegionQueue while it holds the record, cleared when popped.
	void set_queue_counter(std::atomic<size_t> *dead)
	{
		m_queue_dead.store(dead, std::memory_order_release);
	}

	bool take_retire_after_run()
	{
		return m_retire_after_run.exchange(false, std::memory_order_acq_rel);
	}

	// Called once by whichever side moved the record to a terminal state,
	// after it is done with the callbacks. Drops them, then fires the
	// terminal hook. A plugin's closures are gone by the time the scheduler
	// stops counting the record as live.
	void finalize()
	{
		fn = nullptr;
		retired = nullptr;
		notify_terminal();
	}

private:
	std::atomic<ExecutionState> m_state{ExecutionState::IDLE};
	std::atomic<uint64_t> m_runs{0};
	std::atomic<bool> m_retire_after_run{false};
	std::atomic<bool> m_terminal_notified{false};
	std::atomic<std::atomic<size_t> *> m_queue_dead{nullptr};

	void mark_dead_in_queue()
	{
		if (auto *dead = m_queue_dead.load(std::memory_order_acquire))
			dead->fetch_add(1, std::memory_order_relaxed);
	}

	void notify_terminal()
	{
		if (m_terminal_notified.exchange(true, std::memory_order_acq_rel))
			return;
		if (terminal_fn)
			terminal_fn(terminal_ctx, *this);
	}
};

using TaskPtr = std::shared_ptr<ScheduledTask>;

// =============================================================================
// TaskHandle — caller-visible reference to a ScheduledTask
//
// Cheap to copy. A default-constructed handle refers to nothing; it reports
// CANCELLED and cancel() returns CANCELLED_ALREADY.
// =============================================================================
class TaskHandle
{
	TaskPtr m_task;

public:
	TaskHandle() = default;
	explicit TaskHandle(TaskPtr task) : m_task(std::move(task)) {}

	bool valid() const { return m_task != nullptr; }
	explicit operator bool() const { return valid(); }

	TaskId id() const { return m_task ? m_task->id : NULL_TASK; }
	OwnerId owner() const { return m_task ? m_task->owner : NULL_OWNER; }
	TaskKind kind() const { return m_task ? m_task->kind : TaskKind::Global; }
	bool is_repeating() const { return m_task && m_task->is_repeating(); }
	uint64_t runs() const { return m_task ? m_task->runs() : 0; }

	ExecutionState state() const
	{
		return m_task ? m_task->state() : ExecutionState::CANCELLED;
	}

	CancelledState cancel()
	{
		return m_task ? m_task->cancel() : CancelledState::CANCELLED_ALREADY;
	}

	ScheduledTask *get() const { return m_task.get(); }
	const TaskPtr &ptr() const { return m_task; }
};

} // namespace rsched
