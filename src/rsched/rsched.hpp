// rsched.hpp — Region-affine task scheduling, everything in one include
//
//   rsched::GridRegionMap map;
//   rsched::Scheduler sched(map);
//   map.set_retire_hook(&rsched::Scheduler::on_entity_retired, &sched);
//
//   OwnerId me = sched.register_owner("my_plugin");
//   sched.regions().run_delayed(me, 0, 4, 4, [](rsched::TaskHandle &) { ... }, 20);
//
//   rsched::RegionTicker ticker(sched);
//   ticker.run();

#pragma once

#include "rsched_core.hpp"
#include "rsched_task.hpp"
#include "rsched_world.hpp"
#include "rsched_queue.hpp"
#include "rsched_async.hpp"
#include "rsched_registry.hpp"
#include "rsched_resolver.hpp"
#include "rsched_scheduler.hpp"
#include "rsched_facades.hpp"
#include "rsched_ticker.hpp"
