// rsched_ticker.hpp — Tick driver
//
// WorkerPool   — one thread per region worker. Thread i is the only thread
//                that ever drains region worker i; the ticking thread
//                waits for all of them every tick.
// RegionTicker — the main loop. One tick_once():
//                  1. sleep to the loop rate
//                  2. advance the scheduler tick
//                  3. on every pool thread: region hook, then tick_worker(i)
//                  4. on the calling thread: global hook, then tick_global()
//
// Usage:
//   rsched::RegionTicker ticker(sched);
//   ticker.set_loop_rate(20.f);
//   ticker.on_region_tick([](WorkerId w, uint64_t tick) { simulate(w); });
//   ticker.run();            // until ticker.quit()
//
// Depends: rsched_scheduler.hpp

#pragma once

#include "rsched_scheduler.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace rsched
{

// =============================================================================
// WorkerPool
//
// One thread per region worker. The body is fixed at start(); run_tick()
// releases every thread for one tick and returns once all of them are back.
// The first exception a body throws during that tick is rethrown from
// run_tick(), after the other workers finished theirs.
// =============================================================================
class WorkerPool
{
public:
	using Body = std::function<void(WorkerId, uint64_t)>;

	WorkerPool() = default;
	WorkerPool(const WorkerPool &) = delete;
	WorkerPool &operator=(const WorkerPool &) = delete;

	~WorkerPool()
	{
		{
			std::lock_guard<std::mutex> lk(m_mtx);
			m_stopping = true;
		}
		m_go.notify_all();
		for (auto &t : m_threads)
			t.join();
	}

	void start(uint32_t workers, Body body)
	{
		m_body = std::move(body);
		m_threads.reserve(workers);
		for (WorkerId w = 0; w < workers; w++)
			m_threads.emplace_back([this, w]() { worker_loop(w); });
	}

	uint32_t size() const { return static_cast<uint32_t>(m_threads.size()); }

	void run_tick(uint64_t tick)
	{
		if (m_threads.empty())
			return;

		std::unique_lock<std::mutex> lk(m_mtx);
		m_tick = tick;
		m_outstanding = size();
		m_error = nullptr;
		m_round++;
		m_go.notify_all();
		m_back.wait(lk, [this] { return m_outstanding == 0; });

		if (m_error)
		{
			std::exception_ptr e = m_error;
			m_error = nullptr;
			lk.unlock();
			std::rethrow_exception(e);
		}
	}

private:
	std::vector<std::thread> m_threads;
	Body m_body;

	std::mutex m_mtx;
	std::condition_variable m_go;
	std::condition_variable m_back;
	uint64_t m_round = 0;
	uint64_t m_tick = 0;
	uint32_t m_outstanding = 0;
	std::exception_ptr m_error;
	bool m_stopping = false;

	void worker_loop(WorkerId w)
	{
		uint64_t seen = 0;
		std::unique_lock<std::mutex> lk(m_mtx);
		for (;;)
		{
			m_go.wait(lk, [&] { return m_stopping || m_round != seen; });
			if (m_stopping)
				return;
			seen = m_round;
			uint64_t tick = m_tick;
			lk.unlock();

			std::exception_ptr err;
			try
			{
				m_body(w, tick);
			}
			catch (...)
			{
				// Handed to run_tick(), which rethrows it on the ticking thread.
				err = std::current_exception();
			}

			lk.lock();
			if (err && !m_error)
				m_error = err;
			if (--m_outstanding == 0)
				m_back.notify_one();
		}
	}
};

// =============================================================================
// RegionTicker
// =============================================================================
class RegionTicker
{
public:
	using RegionHook = std::function<void(WorkerId, uint64_t)>;
	using GlobalHook = std::function<void(uint64_t)>;

	explicit RegionTicker(Scheduler &sched) : m_sched(&sched)
	{
		m_pool.start(sched.worker_count(), [this](WorkerId w, uint64_t tick) {
			Scheduler::WorkerScope scope(w);
			if (m_region_hook)
				m_region_hook(w, tick);
			m_sched->tick_worker(w);
		});
	}

	RegionTicker(const RegionTicker &) = delete;
	RegionTicker &operator=(const RegionTicker &) = delete;

	// 0 = as fast as possible.
	void set_loop_rate(float hz) { m_loop_rate = hz; }

	// Region simulation for worker w, run on w's thread before its drain.
	void on_region_tick(RegionHook fn) { m_region_hook = std::move(fn); }
	void on_global_tick(GlobalHook fn) { m_global_hook = std::move(fn); }

	void quit() { m_running.store(false, std::memory_order_release); }
	bool is_running() const { return m_running.load(std::memory_order_acquire); }
	uint64_t tick_count() const { return m_sched->current_tick(); }
	float dt() const { return m_raw_dt; }

	// Run the main loop until quit() is called.
	void run()
	{
		m_running.store(true, std::memory_order_release);
		while (is_running())
			tick_once();
	}

	// Runs n ticks, or fewer if quit() is called from a hook or task.
	void run_for(uint64_t n)
	{
		m_running.store(true, std::memory_order_release);
		for (uint64_t i = 0; i < n && is_running(); i++)
			tick_once();
	}

	// Execute one tick: sleep to rate, drain every worker, then global.
	void tick_once()
	{
		auto now = std::chrono::steady_clock::now();

		if (m_loop_rate > 0.f)
		{
			float target_us = 1e6f / m_loop_rate;
			float elapsed_us = std::chrono::duration<float, std::micro>(now - m_last_time).count();
			if (elapsed_us < target_us)
			{
				auto sleep_us = (int)(target_us - elapsed_us);
				if (sleep_us > 0)
					std::this_thread::sleep_for(std::chrono::microseconds(sleep_us));
			}
			now = std::chrono::steady_clock::now();
		}

		m_raw_dt = std::min(std::chrono::duration<float>(now - m_last_time).count(), 0.1f);
		m_last_time = now;

		uint64_t tick = m_sched->advance_tick();

		m_pool.run_tick(tick);

		Scheduler::WorkerScope scope(GLOBAL_WORKER);
		if (m_global_hook)
			m_global_hook(tick);
		m_sched->tick_global();
	}

private:
	Scheduler *m_sched;
	WorkerPool m_pool;

	RegionHook m_region_hook;
	GlobalHook m_global_hook;

	float m_loop_rate = 0.f, m_raw_dt = 0.f;
	std::atomic<bool> m_running{true};
	std::chrono::steady_clock::time_point m_last_time = std::chrono::steady_clock::now();
};

} // namespace rsched
