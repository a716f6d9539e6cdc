// rsched_queue.hpp — Per-worker task queue
//
// One RegionQueue per region worker, plus one for the global region.
//
// Producers (any thread) append to a mutex-guarded inbox. The single
// consumer (the worker currently draining this queue) folds the inbox
// into a min-heap ordered by (due tick, sequence) and pops everything due.
// Not-yet-due work sits in the heap and costs nothing per tick beyond a
// peek at the top.
//
// Sequence numbers are assigned at push time, so tasks due on the same tick
// come out in push (FIFO) order.
//
// Entries pushed while a drain is in progress land in the inbox and are seen
// by the next drain, never the current one. A task that re-submits itself
// "immediately" therefore cannot spin a drain forever.
//
// Records cancelled or retired while they wait bump the queue's dead count.
// Once dead entries make up half the heap, the next drain sweeps them out
// instead of waiting for their due tick.
//
// Depends: rsched_task.hpp

#pragma once

#include "rsched_task.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace rsched
{

// =============================================================================
// WorkerStats — counters updated by the draining thread, readable anywhere
// =============================================================================
struct WorkerStats
{
	std::atomic<uint64_t> executed{0};
	std::atomic<uint64_t> transferred{0}; // handed to another worker
	std::atomic<uint64_t> deferred{0};    // entity pending, retried next tick
	std::atomic<uint64_t> retired{0};
	std::atomic<uint64_t> dropped{0};     // popped already cancelled
	std::atomic<uint64_t> drains{0};
	std::atomic<uint64_t> last_us{0};
	std::atomic<uint64_t> max_us{0};

	void record(uint64_t us)
	{
		last_us.store(us, std::memory_order_relaxed);
		if (us > max_us.load(std::memory_order_relaxed))
			max_us.store(us, std::memory_order_relaxed);
		drains.fetch_add(1, std::memory_order_relaxed);
	}

	void reset()
	{
		executed = 0;
		transferred = 0;
		deferred = 0;
		retired = 0;
		dropped = 0;
		drains = 0;
		last_us = 0;
		max_us = 0;
	}
};

// =============================================================================
// RegionQueue
// =============================================================================
class RegionQueue
{
public:
	struct Entry
	{
		uint64_t due = 0;
		uint64_t seq = 0;
		TaskPtr task;
	};

	explicit RegionQueue(WorkerId worker) : m_worker(worker) {}

	RegionQueue(const RegionQueue &) = delete;
	RegionQueue &operator=(const RegionQueue &) = delete;

	// Records may outlive the queue through their handles.
	~RegionQueue()
	{
		for (auto &e : m_heap)
			e.task->set_queue_counter(nullptr);
		std::lock_guard<std::mutex> lk(m_inbox_mtx);
		for (auto &e : m_inbox)
			e.task->set_queue_counter(nullptr);
	}

	WorkerId worker() const { return m_worker; }
	WorkerStats &stats() { return m_stats; }
	const WorkerStats &stats() const { return m_stats; }

	// Any thread.
	void push(TaskPtr task, uint64_t due)
	{
		task->set_queue_counter(&m_dead);
		std::lock_guard<std::mutex> lk(m_inbox_mtx);
		m_inbox.push_back({due, m_next_seq++, std::move(task)});
		m_size.fetch_add(1, std::memory_order_relaxed);
	}

	// Entries held (inbox + heap). Approximate while producers are active.
	size_t size() const { return m_size.load(std::memory_order_relaxed); }
	bool empty() const { return size() == 0; }

	// Consumer only. Calls fn(Entry&&) for every entry with due <= now, in
	// (due, seq) order. fn may push() to this or any other queue.
	// Returns the number of entries handed to fn.
	template <typename F>
	size_t drain(uint64_t now, F &&fn)
	{
		DrainGuard guard(m_draining);
		auto t0 = std::chrono::steady_clock::now();

		fold_inbox();
		sweep_dead();

		size_t n = 0;
		while (!m_heap.empty() && m_heap.front().due <= now)
		{
			Entry e = pop_top();
			m_size.fetch_sub(1, std::memory_order_relaxed);
			n++;
			fn(std::move(e));
		}

		m_stats.record(std::chrono::duration_cast<std::chrono::microseconds>(
			std::chrono::steady_clock::now() - t0).count());
		return n;
	}

	// Consumer only. Empties the queue, oldest first. Used when a worker's
	// tasks must be re-resolved to new owners.
	std::vector<Entry> take_all()
	{
		DrainGuard guard(m_draining);
		fold_inbox();

		std::vector<Entry> out;
		out.reserve(m_heap.size());
		while (!m_heap.empty())
			out.push_back(pop_top());
		m_size.fetch_sub(out.size(), std::memory_order_relaxed);
		return out;
	}

	// Consumer only. Due tick of the earliest entry, or UINT64_MAX.
	uint64_t next_due()
	{
		DrainGuard guard(m_draining);
		fold_inbox();
		return m_heap.empty() ? UINT64_MAX : m_heap.front().due;
	}

	// Records that went terminal since the last sweep, as counted by the
	// records themselves.
	size_t dead() const { return m_dead.load(std::memory_order_relaxed); }

private:
	struct Later
	{
		bool operator()(const Entry &a, const Entry &b) const
		{
			if (a.due != b.due)
				return a.due > b.due;
			return a.seq > b.seq;
		}
	};

	// Single-consumer check. Two threads draining one queue means the
	// region ownership protocol is broken upstream.
	struct DrainGuard
	{
		std::atomic<bool> &flag;
		explicit DrainGuard(std::atomic<bool> &f) : flag(f)
		{
			if (flag.exchange(true, std::memory_order_acquire))
				throw std::logic_error("RegionQueue drained by two threads at once");
		}
		~DrainGuard() { flag.store(false, std::memory_order_release); }
	};

	WorkerId m_worker;

	std::mutex m_inbox_mtx;
	std::vector<Entry> m_inbox;
	std::vector<Entry> m_scratch;
	uint64_t m_next_seq = 0;

	std::vector<Entry> m_heap; // std::push_heap / pop_heap with Later
	std::atomic<size_t> m_size{0};
	std::atomic<size_t> m_dead{0};
	std::atomic<bool> m_draining{false};

	WorkerStats m_stats;

	void fold_inbox()
	{
		{
			std::lock_guard<std::mutex> lk(m_inbox_mtx);
			m_scratch.swap(m_inbox);
		}
		for (auto &e : m_scratch)
		{
			m_heap.push_back(std::move(e));
			std::push_heap(m_heap.begin(), m_heap.end(), Later{});
		}
		m_scratch.clear();
	}

	Entry pop_top()
	{
		std::pop_heap(m_heap.begin(), m_heap.end(), Later{});
		Entry e = std::move(m_heap.back());
		m_heap.pop_back();
		e.task->set_queue_counter(nullptr);
		return e;
	}

	void sweep_dead()
	{
		size_t dead = m_dead.load(std::memory_order_relaxed);
		if (dead == 0 || dead * 2 < m_heap.size())
			return;
		m_dead.store(0, std::memory_order_relaxed);

		auto keep_end = std::remove_if(m_heap.begin(), m_heap.end(), [](const Entry &e) {
			return e.task->state() != ExecutionState::IDLE;
		});
		size_t removed = static_cast<size_t>(m_heap.end() - keep_end);
		for (auto it = keep_end; it != m_heap.end(); ++it)
			it->task->set_queue_counter(nullptr);
		m_heap.erase(keep_end, m_heap.end());
		std::make_heap(m_heap.begin(), m_heap.end(), Later{});

		m_size.fetch_sub(removed, std::memory_order_relaxed);
		m_stats.dropped.fetch_add(removed, std::memory_order_relaxed);
	}
};

} // namespace rsched
