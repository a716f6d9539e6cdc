// region_server.cpp — Headless region-threaded simulation demo
// Build: cmake --build build --target region_server
// Run:   ./build/region_server [--workers N] [--async N] [--rate HZ] [--ticks N] [--plugin path.so]
//
// World 0 is a 4x4 grid of regions dealt out to the workers. Mobs wander
// across region borders driven by their own entity tasks, a few despawn and
// respawn every second, and every 10 seconds the global region hands one
// region to another worker (a stand-in for rebalancing).

#include "rsched.hpp"
#include "rsched_plugin.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

using namespace rsched;

// =============================================================================
// Config
// =============================================================================
struct ServerArgs
{
	uint32_t workers = 4;
	uint32_t async_threads = 2;
	float rate = 20.f;
	uint64_t ticks = 0; // 0 = run until a task calls quit
	std::vector<std::string> plugins;
};

static bool parse_args(int argc, char **argv, ServerArgs &out)
{
	for (int i = 1; i < argc; i++)
	{
		const char *a = argv[i];
		const char *v = (i + 1 < argc) ? argv[i + 1] : nullptr;
		if (!v)
		{
			fprintf(stderr, "[server] missing value for %s\n", a);
			return false;
		}
		if (strcmp(a, "--workers") == 0)
			out.workers = (uint32_t)atoi(v);
		else if (strcmp(a, "--async") == 0)
			out.async_threads = (uint32_t)atoi(v);
		else if (strcmp(a, "--rate") == 0)
			out.rate = (float)atof(v);
		else if (strcmp(a, "--ticks") == 0)
			out.ticks = strtoull(v, nullptr, 10);
		else if (strcmp(a, "--plugin") == 0)
			out.plugins.push_back(v);
		else
		{
			fprintf(stderr, "[server] unknown option %s\n", a);
			return false;
		}
		i++;
	}
	if (out.workers == 0)
		out.workers = 1;
	return true;
}

// =============================================================================
// World layout
// =============================================================================
constexpr int REGION_SHIFT = 3;                           // 8x8 chunks per region
constexpr int REGIONS = 4;                                // 4x4 regions
constexpr double REGION_BLOCKS = 16.0 * (1 << REGION_SHIFT);
constexpr double WORLD_BLOCKS = REGION_BLOCKS * REGIONS;
constexpr int MOBS = 64;

struct Rng
{
	uint32_t state;

	explicit Rng(uint32_t seed = 42) : state(seed ? seed : 1) {}

	uint32_t next()
	{
		state ^= state << 13;
		state ^= state >> 17;
		state ^= state << 5;
		return state;
	}

	// Uniform double in [lo, hi)
	double range(double lo, double hi) { return lo + (next() & 0xFFFFFF) / (double)0x1000000 * (hi - lo); }
};

struct ServerState
{
	GridRegionMap map{REGION_SHIFT};
	std::unique_ptr<Scheduler> sched;
	OwnerId core = NULL_OWNER;
	Rng rng{7};

	std::vector<EntityRef> mobs;
	std::atomic<uint64_t> mob_steps{0};
	std::atomic<uint64_t> retirements{0};
	uint32_t rebalance_from = 0;
};

static WorkerId initial_owner(int rx, int rz, uint32_t workers)
{
	return static_cast<WorkerId>((rx + rz * REGIONS) % workers);
}

static Location random_spot(Rng &rng)
{
	return {0, rng.range(0, WORLD_BLOCKS), 64.0, rng.range(0, WORLD_BLOCKS)};
}

// One wandering mob: a repeating entity task that always runs on the worker
// that ticks the mob's current region.
static void spawn_mob(ServerState &s)
{
	EntityRef e = s.map.spawn(random_spot(s.rng));
	s.mobs.push_back(e);

	Rng walk(s.rng.next());
	ServerState *sp = &s;
	s.sched->entities().run_at_fixed_rate(s.core, e,
		[sp, e, walk](TaskHandle &) mutable {
			Location at;
			if (!sp->map.location(e, at))
				return;
			at.x += walk.range(-6.0, 6.0);
			at.z += walk.range(-6.0, 6.0);
			if (at.x < 0) at.x = 0;
			if (at.z < 0) at.z = 0;
			if (at.x >= WORLD_BLOCKS) at.x = WORLD_BLOCKS - 1;
			if (at.z >= WORLD_BLOCKS) at.z = WORLD_BLOCKS - 1;
			sp->map.move(e, at);
			sp->mob_steps.fetch_add(1, std::memory_order_relaxed);
		},
		[sp] { sp->retirements.fetch_add(1, std::memory_order_relaxed); },
		1, 1);
}

static void server_init(ServerState &s, uint32_t workers)
{
	for (int rz = 0; rz < REGIONS; rz++)
		for (int rx = 0; rx < REGIONS; rx++)
			s.map.assign(0, rx, rz, initial_owner(rx, rz, workers));
	s.map.set_retire_hook(&Scheduler::on_entity_retired, s.sched.get());
	s.core = s.sched->register_owner("server");

	for (int i = 0; i < MOBS; i++)
		spawn_mob(s);

	// --- Churn: a few mobs despawn and respawn every second ---
	s.sched->global().run_at_fixed_rate(s.core, [&s](TaskHandle &) {
		for (int i = 0; i < 3 && !s.mobs.empty(); i++)
		{
			size_t pick = s.rng.next() % s.mobs.size();
			s.map.remove(s.mobs[pick]);
			s.mobs[pick] = s.mobs.back();
			s.mobs.pop_back();
			spawn_mob(s);
		}
	}, 20, 20);

	// --- Autosave stand-in: off-tick work ---
	s.sched->async().run_at_fixed_rate(s.core, [&s](TaskHandle &) {
		printf("[server] autosave: %zu entities\n", s.map.entity_count());
	}, std::chrono::seconds(5), std::chrono::seconds(5));

	// --- Status print ---
	s.sched->global().run_at_fixed_rate(s.core, [&s](TaskHandle &) {
		printf("[server] tick=%llu mobs=%zu steps=%llu retired=%llu live=%zu faults=%llu\n",
			(unsigned long long)s.sched->current_tick(), s.map.entity_count(),
			(unsigned long long)s.mob_steps.load(), (unsigned long long)s.retirements.load(),
			s.sched->live_tasks(), (unsigned long long)s.sched->fault_count());
	}, 100, 100);
}

// Global phase only: no worker is draining while this runs.
static void rebalance(ServerState &s)
{
	uint32_t workers = s.sched->worker_count();
	if (workers < 2)
		return;
	WorkerId from = s.rebalance_from % workers;
	WorkerId to = (from + 1) % workers;
	s.rebalance_from++;

	for (int rz = 0; rz < REGIONS; rz++)
		for (int rx = 0; rx < REGIONS; rx++)
			if (s.map.region_owner(0, rx, rz) == from)
			{
				s.map.assign(0, rx, rz, to);
				size_t moved = s.sched->rehome(from);
				printf("[server] region (%d,%d): worker %u -> %u, %zu task(s) rehomed\n",
					rx, rz, from, to, moved);
				return;
			}
}

// =============================================================================
// Main
// =============================================================================
int main(int argc, char **argv)
{
	ServerArgs args;
	if (!parse_args(argc, argv, args))
		return 1;

	printf("[server] starting: %u worker(s), %u async thread(s), %.0f Hz\n",
		args.workers, args.async_threads, args.rate);

	SchedulerConfig cfg;
	cfg.region_workers = args.workers;
	cfg.async_threads = args.async_threads;

	ServerState s;
	s.sched = std::make_unique<Scheduler>(s.map, cfg);
	server_init(s, args.workers);

	RegionTicker ticker(*s.sched);
	ticker.set_loop_rate(args.rate);

	PluginLoader plugins(*s.sched);
	for (auto &p : args.plugins)
		plugins.watch(p);
	plugins.load_all();

	ticker.on_global_tick([&](uint64_t tick) {
		if (tick % 20 == 0)
			plugins.poll();
		if (tick % 200 == 0)
			rebalance(s);
	});

	if (args.ticks)
		ticker.run_for(args.ticks);
	else
		ticker.run();

	plugins.unload_all();
	s.sched->dump_stats();
	printf("[server] stopped at tick %llu\n", (unsigned long long)ticker.tick_count());
	return 0;
}
