// example_plugin.cpp — Demo hot-reload plugin for region_server
//
// Schedules one task on each facade under the owner the loader hands it.
// Rebuild while the server is running to see the reload:
//   cmake --build build --target example_plugin

#include "rsched.hpp"
#include <atomic>
#include <cstdio>

using namespace rsched;

static const char *MESSAGE = "EXAMPLE PLUGIN v1";

static std::atomic<uint64_t> g_region_runs{0};

extern "C" void rsched_plugin_enable(Scheduler &sched, OwnerId owner)
{
	g_region_runs = 0;

	// Weather: owned by the global region.
	sched.global().run_at_fixed_rate(owner, [&sched](TaskHandle &self) {
		printf("[example_plugin] %s: tick %llu, region runs %llu (run %llu)\n", MESSAGE,
			(unsigned long long)sched.current_tick(),
			(unsigned long long)g_region_runs.load(),
			(unsigned long long)self.runs() + 1);
	}, 1, 100);

	// Something ticking at spawn (world 0, chunk 0,0).
	sched.regions().run_at_fixed_rate(owner, 0, 0, 0, [](TaskHandle &) {
		g_region_runs.fetch_add(1, std::memory_order_relaxed);
	}, 1, 1);

	sched.async().run_delayed(owner, [](TaskHandle &) {
		printf("[example_plugin] async hello\n");
	}, std::chrono::milliseconds(10));
}

extern "C" void rsched_plugin_disable(Scheduler &, OwnerId)
{
	printf("[example_plugin] disabled after %llu region runs\n",
		(unsigned long long)g_region_runs.load());
}
