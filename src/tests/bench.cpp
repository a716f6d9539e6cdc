// bench.cpp — rsched stress tests & benchmarks
//
// Measures ns/op for submission, draining, cancellation, cross-worker
// transfer, entity retirement, threaded ticking and the async pool.
// Raw chrono timing + printf results.
// Always writes bench_results.csv in the working directory.
//
// Build: cmake --build build --target rsched_bench
// Run:   ./build/rsched_bench

#include "rsched.hpp"
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

using namespace rsched;

// =============================================================================
// Timing helpers
// =============================================================================

struct BenchResult
{
    std::string name;
    double total_ms;
    uint64_t ops;
    double ns_per_op;
};

static std::vector<BenchResult> g_results;

template <typename F>
void bench(const char *name, uint64_t ops, F &&fn)
{
    // Warmup
    fn();

    auto t0 = std::chrono::high_resolution_clock::now();
    fn();
    auto t1 = std::chrono::high_resolution_clock::now();

    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    double ns_op = (ms * 1e6) / static_cast<double>(ops);

    printf("  %-50s %8.2f ms  %10.1f ns/op\n", name, ms, ns_op);
    g_results.push_back({name, ms, ops, ns_op});
}

template <typename T>
static void do_not_optimize(T const &val)
{
    asm volatile("" : : "r,m"(val) : "memory");
}

static SchedulerConfig bench_config(uint32_t workers)
{
    SchedulerConfig cfg;
    cfg.region_workers = workers;
    cfg.async_threads = 4;
    cfg.log_faults = false;
    return cfg;
}

// One region per worker along x: region (w, 0) -> worker w.
static void assign_strip(GridRegionMap &map, uint32_t workers)
{
    for (uint32_t w = 0; w < workers; w++)
        map.assign(0, static_cast<int32_t>(w), 0, w);
}

static int32_t chunk_for_worker(uint32_t w) { return static_cast<int32_t>(w) * 8 + 1; }

// =============================================================================
// KERNEL BENCHMARKS (single thread, tick_all)
// =============================================================================

void bench_submit()
{
    printf("\n--- Submission ---\n");
    constexpr int N = 100000;

    bench("submit 100k global one-shots", N, [] {
        GridRegionMap map(3);
        Scheduler sched(map, bench_config(1));
        OwnerId owner = sched.register_owner("bench");
        for (int i = 0; i < N; i++)
            sched.global().run_delayed(owner, [](TaskHandle &) {}, 10);
        do_not_optimize(sched.live_tasks());
    });

    bench("submit 100k region one-shots (4 workers)", N, [] {
        GridRegionMap map(3);
        assign_strip(map, 4);
        Scheduler sched(map, bench_config(4));
        OwnerId owner = sched.register_owner("bench");
        for (int i = 0; i < N; i++)
            sched.regions().run_delayed(owner, 0, chunk_for_worker(i & 3), 0, [](TaskHandle &) {}, 10);
        do_not_optimize(sched.queued(0));
    });
}

void bench_drain()
{
    printf("\n--- Drain ---\n");
    constexpr int N = 100000;

    bench("submit+drain 100k region one-shots", N, [] {
        GridRegionMap map(3);
        assign_strip(map, 1);
        Scheduler sched(map, bench_config(1));
        OwnerId owner = sched.register_owner("bench");
        uint64_t sum = 0;
        for (int i = 0; i < N; i++)
            sched.regions().run(owner, 0, 1, 1, [&sum, i](TaskHandle &) { sum += i; });
        sched.tick_all();
        do_not_optimize(sum);
    });

    bench("100k repeating x 10 ticks", N * 10, [] {
        GridRegionMap map(3);
        assign_strip(map, 1);
        Scheduler sched(map, bench_config(1));
        OwnerId owner = sched.register_owner("bench");
        uint64_t sum = 0;
        for (int i = 0; i < N; i++)
            sched.regions().run_at_fixed_rate(owner, 0, 1, 1, [&sum](TaskHandle &) { sum++; }, 1, 1);
        for (int t = 0; t < 10; t++)
        {
            sched.advance_tick();
            sched.tick_all();
        }
        do_not_optimize(sum);
    });

    bench("100k not-yet-due, 100 idle ticks", 100, [] {
        GridRegionMap map(3);
        assign_strip(map, 1);
        Scheduler sched(map, bench_config(1));
        OwnerId owner = sched.register_owner("bench");
        for (int i = 0; i < N; i++)
            sched.regions().run_delayed(owner, 0, 1, 1, [](TaskHandle &) {}, 1000);
        for (int t = 0; t < 100; t++)
        {
            sched.advance_tick();
            sched.tick_all();
        }
        do_not_optimize(sched.queued(0));
    });
}

void bench_cancel()
{
    printf("\n--- Cancellation ---\n");
    constexpr int N = 100000;

    bench("submit+cancel 100k handles", N, [] {
        GridRegionMap map(3);
        Scheduler sched(map, bench_config(1));
        OwnerId owner = sched.register_owner("bench");
        std::vector<TaskHandle> handles;
        handles.reserve(N);
        for (int i = 0; i < N; i++)
            handles.push_back(sched.global().run_delayed(owner, [](TaskHandle &) {}, 10));
        for (auto &h : handles)
            h.cancel();
        do_not_optimize(sched.live_tasks());
    });

    bench("submit+cancel_all_for 100k", N, [] {
        GridRegionMap map(3);
        Scheduler sched(map, bench_config(1));
        OwnerId owner = sched.register_owner("bench");
        for (int i = 0; i < N; i++)
            sched.global().run_delayed(owner, [](TaskHandle &) {}, 10);
        do_not_optimize(sched.cancel_all_for(owner));
    });
}

void bench_transfer()
{
    printf("\n--- Cross-worker transfer ---\n");
    constexpr int N = 100000;

    bench("100k queued on w0, region moved to w1, drain", N, [] {
        GridRegionMap map(3);
        assign_strip(map, 2);
        Scheduler sched(map, bench_config(2));
        OwnerId owner = sched.register_owner("bench");
        for (int i = 0; i < N; i++)
            sched.regions().run_delayed(owner, 0, chunk_for_worker(0), 0, [](TaskHandle &) {}, 1);
        map.reassign_worker(0, 1);
        sched.advance_tick();
        sched.tick_all();
        do_not_optimize(sched.worker_stats(1).executed.load());
    });

    bench("100k entity tasks following 1k walking entities", N, [] {
        GridRegionMap map(3);
        assign_strip(map, 2);
        Scheduler sched(map, bench_config(2));
        OwnerId owner = sched.register_owner("bench");
        std::vector<EntityRef> ents;
        for (int i = 0; i < 1000; i++)
            ents.push_back(map.spawn({0, 10.0, 64, 10.0}));
        for (int i = 0; i < N; i++)
            sched.entities().run_delayed(owner, ents[i % 1000], [](TaskHandle &) {}, {}, 1);
        for (auto e : ents)
            map.move(e, {0, 140.0, 64, 10.0});
        sched.advance_tick();
        sched.tick_all();
        do_not_optimize(sched.worker_stats(1).executed.load());
    });
}

void bench_retirement()
{
    printf("\n--- Retirement ---\n");
    constexpr int N = 100000;

    bench("100k entity tasks, 1k entities removed (eager)", N, [] {
        GridRegionMap map(3);
        assign_strip(map, 1);
        Scheduler sched(map, bench_config(1));
        map.set_retire_hook(&Scheduler::on_entity_retired, &sched);
        OwnerId owner = sched.register_owner("bench");
        std::vector<EntityRef> ents;
        for (int i = 0; i < 1000; i++)
            ents.push_back(map.spawn({0, 10.0, 64, 10.0}));
        uint64_t retired = 0;
        for (int i = 0; i < N; i++)
            sched.entities().run_delayed(owner, ents[i % 1000], [](TaskHandle &) {}, [&retired] { retired++; }, 50);
        for (auto e : ents)
            map.remove(e);
        do_not_optimize(retired);
    });

    bench("100k entity tasks, retired at drain (lazy)", N, [] {
        GridRegionMap map(3);
        assign_strip(map, 1);
        Scheduler sched(map, bench_config(1));
        OwnerId owner = sched.register_owner("bench");
        std::vector<EntityRef> ents;
        for (int i = 0; i < 1000; i++)
            ents.push_back(map.spawn({0, 10.0, 64, 10.0}));
        uint64_t retired = 0;
        for (int i = 0; i < N; i++)
            sched.entities().run_delayed(owner, ents[i % 1000], [](TaskHandle &) {}, [&retired] { retired++; }, 1);
        for (auto e : ents)
            map.remove(e);
        sched.advance_tick();
        sched.tick_all();
        do_not_optimize(retired);
    });
}

// =============================================================================
// THREADED BENCHMARKS
// =============================================================================

void bench_thread_scaling()
{
    uint32_t hw = std::thread::hardware_concurrency();
    if (hw == 0) hw = 4;

    std::vector<uint32_t> counts;
    for (uint32_t n = 1; n <= hw; n *= 2)
        counts.push_back(n);
    if (counts.back() != hw)
        counts.push_back(hw);

    printf("\n--- Thread scaling: 20k repeating region tasks x 50 ticks (sqrt work) ---\n");
    printf("  (hardware_concurrency = %u)\n", hw);

    constexpr int N = 20000;
    constexpr int TICKS = 50;
    for (uint32_t n : counts)
    {
        char label[64];
        snprintf(label, sizeof(label), "ticker 20k x 50 — %u worker%s", n, n == 1 ? "" : "s");
        bench(label, static_cast<uint64_t>(N) * TICKS, [n] {
            GridRegionMap map(3);
            assign_strip(map, n);
            Scheduler sched(map, bench_config(n));
            OwnerId owner = sched.register_owner("bench");
            std::atomic<uint64_t> total{0};
            for (int i = 0; i < N; i++)
            {
                sched.regions().run_at_fixed_rate(owner, 0, chunk_for_worker(i % n), 0, [&total, i](TaskHandle &) {
                    double acc = 0;
                    for (int k = 1; k < 64; k++)
                        acc += std::sqrt(static_cast<double>(i + k));
                    do_not_optimize(acc);
                    total.fetch_add(1, std::memory_order_relaxed);
                }, 1, 1);
            }
            RegionTicker ticker(sched);
            ticker.run_for(TICKS);
            do_not_optimize(total.load());
        });
    }
}

void bench_async()
{
    printf("\n--- Async pool ---\n");
    constexpr int N = 50000;

    bench("50k async run_now until drained", N, [] {
        GridRegionMap map(3);
        Scheduler sched(map, bench_config(1));
        OwnerId owner = sched.register_owner("bench");
        std::atomic<int> done{0};
        for (int i = 0; i < N; i++)
            sched.async().run_now(owner, [&done](TaskHandle &) { done.fetch_add(1, std::memory_order_relaxed); });
        while (done.load() < N)
            std::this_thread::yield();
    });

    bench("4 producers x 25k region submits while ticking", 100000, [] {
        GridRegionMap map(3);
        assign_strip(map, 4);
        Scheduler sched(map, bench_config(4));
        OwnerId owner = sched.register_owner("bench");
        RegionTicker ticker(sched);
        std::atomic<int> ran{0};
        std::atomic<bool> stop{false};
        std::thread driver([&] {
            while (!stop.load())
                ticker.tick_once();
        });
        std::vector<std::thread> producers;
        for (int p = 0; p < 4; p++)
            producers.emplace_back([&, p] {
                for (int i = 0; i < 25000; i++)
                    sched.regions().run(owner, 0, chunk_for_worker((i + p) & 3), 0,
                        [&ran](TaskHandle &) { ran.fetch_add(1, std::memory_order_relaxed); });
            });
        for (auto &t : producers)
            t.join();
        while (ran.load() < 100000)
            std::this_thread::yield();
        stop = true;
        driver.join();
    });
}

// =============================================================================
// MAIN
// =============================================================================

static void write_csv()
{
    const char *path = "bench_results.csv";
    FILE *f = fopen(path, "w");
    if (!f) {
        fprintf(stderr, "warning: could not write %s\n", path);
        return;
    }
    fprintf(f, "benchmark,total_ms,ops,ns_per_op\n");
    for (auto &r : g_results)
        fprintf(f, "\"%s\",%.4f,%llu,%.2f\n",
                r.name.c_str(), r.total_ms,
                (unsigned long long)r.ops, r.ns_per_op);
    fclose(f);
    printf("\nCSV written to %s\n", path);
}

int main()
{
    printf("=== rsched benchmarks ===\n");
    printf("(warmup run + timed run per bench, reporting timed run only)\n");

    bench_submit();
    bench_drain();
    bench_cancel();
    bench_transfer();
    bench_retirement();
    bench_thread_scaling();
    bench_async();

    printf("\n=== Summary ===\n");
    printf("  %-50s %10s %12s\n", "Benchmark", "Total ms", "ns/op");
    printf("  %-50s %10s %12s\n",
           "--------------------------------------------------",
           "--------", "----------");
    for (auto &r : g_results)
        printf("  %-50s %8.2f ms %10.1f\n", r.name.c_str(), r.total_ms, r.ns_per_op);
    printf("\n=== All benchmarks complete ===\n");

    write_csv();

    return 0;
}
