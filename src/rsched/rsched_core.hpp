// rsched_core.hpp — Region scheduler vocabulary
//
// Shared types for every rsched header:
//   - Names: interned plugin/world names passed around as 4-byte handles
//   - Ids: task ids, worker ids, generational entity refs
//   - Coordinates: world + chunk, block locations
//   - ExecutionState / CancelledState: the task state machine alphabet
//   - TaskFault: exception a task may throw to report a fault
//
// Nothing in here knows about queues or threads.

#pragma once

#include <vector>
#include <string>
#include <unordered_map>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <stdexcept>

namespace rsched
{

// =============================================================================
// Names — Interned into a table, passed around as 4-byte handles
// =============================================================================
using NameId = uint32_t;
constexpr NameId NULL_NAME = 0xFFFFFFFF;

// Owner names. Append-only, ids are indexes into the name list.
// Not synchronized; Scheduler guards its table with a mutex.
class NameTable
{
	std::unordered_map<std::string, NameId> m_ids;
	std::vector<std::string> m_names;

public:
	NameId intern(const char *s)
	{
		if (!s || !s[0])
			return NULL_NAME;
		auto ins = m_ids.emplace(s, static_cast<NameId>(m_names.size()));
		if (ins.second)
			m_names.push_back(ins.first->first);
		return ins.first->second;
	}

	const char *str(NameId id) const
	{
		return id < m_names.size() ? m_names[id].c_str() : "";
	}

	size_t size() const { return m_names.size(); }
};

// Plugin attribution. Obtained from Scheduler::register_owner().
using OwnerId = NameId;
constexpr OwnerId NULL_OWNER = NULL_NAME;

using WorldId = uint32_t;

// =============================================================================
// Workers
// =============================================================================
using WorkerId = uint32_t;
constexpr WorkerId NO_WORKER = 0xFFFFFFFF;     // region not ticked by anyone
constexpr WorkerId GLOBAL_WORKER = 0xFFFFFFFE; // the global region

// =============================================================================
// Tasks
// =============================================================================
using TaskId = uint64_t;
constexpr TaskId NULL_TASK = 0;

enum class TaskKind : uint8_t
{
	Global,
	Region,
	Entity,
	Async
};

inline const char *to_string(TaskKind k)
{
	switch (k)
	{
	case TaskKind::Global: return "global";
	case TaskKind::Region: return "region";
	case TaskKind::Entity: return "entity";
	case TaskKind::Async: return "async";
	}
	return "?";
}

// =============================================================================
// Entity refs — generational handles, owned by the world
//
// Layout: [63..32] generation, [31..0] slot index.
// A ref whose generation no longer matches its slot is retired.
// =============================================================================
using EntityRef = uint64_t;
constexpr EntityRef NULL_ENTITY = 0xFFFFFFFFFFFFFFFFULL;

inline uint32_t entity_index(EntityRef e) { return static_cast<uint32_t>(e & 0xFFFFFFFFULL); }
inline uint32_t entity_generation(EntityRef e) { return static_cast<uint32_t>(e >> 32); }
inline EntityRef make_entity(uint32_t idx, uint32_t gen)
{
	return (static_cast<uint64_t>(gen) << 32) | idx;
}

// =============================================================================
// Coordinates
// =============================================================================
constexpr int CHUNK_SHIFT = 4; // 16 blocks per chunk side

struct ChunkPos
{
	WorldId world = 0;
	int32_t x = 0;
	int32_t z = 0;

	bool operator==(const ChunkPos &o) const { return world == o.world && x == o.x && z == o.z; }
	bool operator!=(const ChunkPos &o) const { return !(*this == o); }
};

// Block coordinate to chunk coordinate. Blocks outside the int32 range
// (and NaN) land in the outermost chunk on that side.
inline int32_t block_to_chunk(double block)
{
	double b = std::floor(block);
	if (b >= static_cast<double>(INT32_MAX))
		return INT32_MAX >> CHUNK_SHIFT;
	if (!(b > static_cast<double>(INT32_MIN)))
		return INT32_MIN >> CHUNK_SHIFT;
	return static_cast<int32_t>(b) >> CHUNK_SHIFT;
}

struct Location
{
	WorldId world = 0;
	double x = 0, y = 0, z = 0;

	ChunkPos chunk() const { return {world, block_to_chunk(x), block_to_chunk(z)}; }
};

// =============================================================================
// State machine alphabet
// =============================================================================
enum class ExecutionState : uint8_t
{
	IDLE,
	RUNNING,
	FINISHED,
	CANCELLED,
	CANCELLED_RUNNING // executing, no further occurrences will run
};

// Outcome of TaskHandle::cancel(). Tells the caller whether side effects of
// a run are still going to happen.
enum class CancelledState : uint8_t
{
	CANCELLED_BY_CALLER,         // this call cancelled it, nothing will run
	CANCELLED_ALREADY,           // someone else cancelled (or it retired) first
	RUNNING,                     // one-shot mid-run, the run will complete
	ALREADY_EXECUTED,            // one-shot already finished
	NEXT_RUNS_CANCELLED,         // repeating: this call stopped future runs
	NEXT_RUNS_CANCELLED_ALREADY  // repeating: future runs were already stopped
};

inline const char *to_string(ExecutionState s)
{
	switch (s)
	{
	case ExecutionState::IDLE: return "IDLE";
	case ExecutionState::RUNNING: return "RUNNING";
	case ExecutionState::FINISHED: return "FINISHED";
	case ExecutionState::CANCELLED: return "CANCELLED";
	case ExecutionState::CANCELLED_RUNNING: return "CANCELLED_RUNNING";
	}
	return "?";
}

inline const char *to_string(CancelledState s)
{
	switch (s)
	{
	case CancelledState::CANCELLED_BY_CALLER: return "CANCELLED_BY_CALLER";
	case CancelledState::CANCELLED_ALREADY: return "CANCELLED_ALREADY";
	case CancelledState::RUNNING: return "RUNNING";
	case CancelledState::ALREADY_EXECUTED: return "ALREADY_EXECUTED";
	case CancelledState::NEXT_RUNS_CANCELLED: return "NEXT_RUNS_CANCELLED";
	case CancelledState::NEXT_RUNS_CANCELLED_ALREADY: return "NEXT_RUNS_CANCELLED_ALREADY";
	}
	return "?";
}

inline bool is_terminal(ExecutionState s)
{
	return s == ExecutionState::FINISHED || s == ExecutionState::CANCELLED;
}

// =============================================================================
// Faults
// =============================================================================
// Thrown by a callback to report a recoverable problem. The scheduler logs
// it as "task <id> (<kind>, owner '<name>'): <what>" and carries on.
struct TaskFault : std::runtime_error
{
	using std::runtime_error::runtime_error;
};

// Clamp a tick delay/period to the scheduler's minimum of one tick.
inline uint64_t normalize_ticks(int64_t ticks)
{
	return ticks < 1 ? 1 : static_cast<uint64_t>(ticks);
}

} // namespace rsched
