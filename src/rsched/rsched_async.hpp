// rsched_async.hpp — Off-tick executor for simulation-independent work
//
// A plain unordered thread pool that speaks the same ScheduledTask state
// machine as the region queues, so async handles cancel exactly like region
// handles. No target resolution happens here: async work has no affinity.
//
// All workers share one mutex, a ready deque and a due-ordered multimap of
// timed entries. An idle worker sleeps until either new ready work arrives or
// the earliest timed entry falls due, moves due entries to the ready deque,
// and runs one.
//
// Repeating tasks: occurrence N+1 is only submitted after occurrence N left
// RUNNING, at previous start + period (never earlier than now).
//
// Depends: rsched_task.hpp

#pragma once

#include "rsched_task.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace rsched
{

class AsyncExecutor
{
public:
	using Clock = std::chrono::steady_clock;

	// Reports a primary or retirement callback that threw.
	using FaultHook = void (*)(void *, ScheduledTask &, const char *);

	AsyncExecutor() = default;
	AsyncExecutor(const AsyncExecutor &) = delete;
	AsyncExecutor &operator=(const AsyncExecutor &) = delete;

	~AsyncExecutor() { shutdown(); }

	void set_fault_hook(FaultHook fn, void *ctx)
	{
		m_fault_fn = fn;
		m_fault_ctx = ctx;
	}

	void start(uint32_t threads)
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		if (!m_workers.empty())
			return;
		if (threads == 0)
			threads = 1;
		m_stopping = false;
		for (uint32_t i = 0; i < threads; i++)
			m_workers.emplace_back([this]() { run(); });
	}

	// Stops the workers and cancels everything that has not started.
	// In-flight callbacks are allowed to finish.
	void shutdown()
	{
		std::vector<std::thread> workers;
		std::vector<TaskPtr> leftovers;
		{
			std::lock_guard<std::mutex> lk(m_mtx);
			m_stopping = true;
			workers.swap(m_workers);
			for (auto &t : m_ready)
				leftovers.push_back(std::move(t));
			for (auto &kv : m_timed)
				leftovers.push_back(std::move(kv.second));
			m_ready.clear();
			m_timed.clear();
		}
		m_cv.notify_all();
		for (auto &w : workers)
			w.join();

		for (auto &t : leftovers)
			t->cancel();
		if (!leftovers.empty())
			printf("[async] shutdown cancelled %zu pending task(s)\n", leftovers.size());
	}

	bool running() const
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		return !m_workers.empty() && !m_stopping;
	}

	// Any thread. delay <= 0 runs as soon as a worker is free.
	// Returns false (and cancels the task) if the executor is stopped.
	bool submit(TaskPtr task, std::chrono::milliseconds delay)
	{
		Clock::time_point due = Clock::now() + std::max(delay, std::chrono::milliseconds(0));
		bool accepted = false;
		{
			std::lock_guard<std::mutex> lk(m_mtx);
			if (!m_stopping && !m_workers.empty())
			{
				if (delay.count() <= 0)
					m_ready.push_back(std::move(task));
				else
					m_timed.emplace(due, std::move(task));
				accepted = true;
			}
		}
		if (!accepted)
		{
			fprintf(stderr, "[async] executor not running, task %llu cancelled\n",
				(unsigned long long)task->id);
			task->cancel();
			return false;
		}
		m_cv.notify_one();
		return true;
	}

	size_t pending() const
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		return m_ready.size() + m_timed.size();
	}

	uint64_t executed() const { return m_executed.load(std::memory_order_relaxed); }

private:
	mutable std::mutex m_mtx;
	std::condition_variable m_cv;
	std::deque<TaskPtr> m_ready;
	std::multimap<Clock::time_point, TaskPtr> m_timed; // equal keys keep insertion order
	std::vector<std::thread> m_workers;
	bool m_stopping = false;
	std::atomic<uint64_t> m_executed{0};

	FaultHook m_fault_fn = nullptr;
	void *m_fault_ctx = nullptr;

	void report_fault(ScheduledTask &task, const char *what)
	{
		if (m_fault_fn)
			m_fault_fn(m_fault_ctx, task, what);
		else
			fprintf(stderr, "[async] task %llu faulted: %s\n", (unsigned long long)task.id, what);
	}

	// Called with m_mtx held.
	void promote_due(Clock::time_point now)
	{
		while (!m_timed.empty() && m_timed.begin()->first <= now)
		{
			m_ready.push_back(std::move(m_timed.begin()->second));
			m_timed.erase(m_timed.begin());
		}
	}

	void run()
	{
		std::unique_lock<std::mutex> lk(m_mtx);
		while (!m_stopping)
		{
			promote_due(Clock::now());
			if (m_ready.empty())
			{
				if (m_timed.empty())
					m_cv.wait(lk);
				else
					m_cv.wait_until(lk, m_timed.begin()->first);
				continue;
			}

			TaskPtr task = std::move(m_ready.front());
			m_ready.pop_front();
			lk.unlock();
			execute(task);
			lk.lock();
		}
	}

	void execute(const TaskPtr &task)
	{
		if (!task->try_begin())
			return; // cancelled while queued

		Clock::time_point started = Clock::now();
		TaskHandle handle(task);
		try
		{
			task->fn(handle);
		}
		catch (const std::exception &e)
		{
			report_fault(*task, e.what());
		}
		catch (...)
		{
			report_fault(*task, "unknown exception");
		}
		m_executed.fetch_add(1, std::memory_order_relaxed);

		if (!task->finish_run())
		{
			task->finalize();
			return;
		}

		Clock::time_point next = started + std::chrono::milliseconds(task->period);
		Clock::time_point now = Clock::now();
		if (next < now)
			next = now;
		bool queued = false;
		{
			std::lock_guard<std::mutex> lk(m_mtx);
			if (!m_stopping)
			{
				m_timed.emplace(next, task);
				queued = true;
			}
		}
		if (queued)
			m_cv.notify_one();
		else
			task->cancel();
	}
};

} // namespace rsched
