// rsched_registry.hpp — Live task indexes
//
// TaskRegistry      — every non-terminal task, keyed by owner. Backs
//                     cancel_tasks(owner) / cancel_all_for(owner), which a
//                     plugin unload calls while its tasks may be running or
//                     retiring on other threads.
// RetirementNotifier — every non-terminal entity-targeted task, keyed by
//                     entity. When the world reports an entity gone, the
//                     scheduler takes the entity's list from here and
//                     retires each task right away instead of waiting for
//                     its due tick.
//
// Both are unlinked from a task's terminal hook, so a task leaves them the
// moment it finishes, is cancelled or retires. Walks happen on snapshots
// taken under the lock and acted on outside it: cancelling a task re-enters
// the registry through the terminal hook.
//
// Depends: rsched_task.hpp

#pragma once

#include "rsched_task.hpp"
#include <algorithm>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace rsched
{

// =============================================================================
// TaskRegistry
// =============================================================================
class TaskRegistry
{
public:
	void add(const TaskPtr &task)
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		if (m_by_owner[task->owner].emplace(task->id, task).second)
			m_live++;
	}

	void remove(const ScheduledTask &task)
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		auto it = m_by_owner.find(task.owner);
		if (it == m_by_owner.end())
			return;
		if (it->second.erase(task.id))
			m_live--;
		if (it->second.empty())
			m_by_owner.erase(it);
	}

	// Live tasks of `owner`, optionally only those of one kind.
	std::vector<TaskPtr> snapshot(OwnerId owner, const TaskKind *kind = nullptr) const
	{
		std::vector<TaskPtr> out;
		std::lock_guard<std::mutex> lk(m_mtx);
		auto it = m_by_owner.find(owner);
		if (it == m_by_owner.end())
			return out;
		out.reserve(it->second.size());
		for (auto &kv : it->second)
			if (!kind || kv.second->kind == *kind)
				out.push_back(kv.second);
		// Oldest first, so bulk cancellation is deterministic.
		std::sort(out.begin(), out.end(),
			[](const TaskPtr &a, const TaskPtr &b) { return a->id < b->id; });
		return out;
	}

	// Applies cancel() to each live task of `owner`. Tasks that finish or
	// retire concurrently simply report a non-cancelling state.
	// Returns how many tasks this call stopped (fully or future runs).
	size_t cancel_all(OwnerId owner, const TaskKind *kind = nullptr)
	{
		size_t stopped = 0;
		for (auto &t : snapshot(owner, kind))
		{
			CancelledState r = t->cancel();
			if (r == CancelledState::CANCELLED_BY_CALLER || r == CancelledState::NEXT_RUNS_CANCELLED)
				stopped++;
		}
		return stopped;
	}

	// Cancels every live task of every owner. Used on scheduler teardown so
	// no terminal hook outlives the indexes.
	size_t cancel_everything()
	{
		std::vector<TaskPtr> all;
		{
			std::lock_guard<std::mutex> lk(m_mtx);
			all.reserve(m_live);
			for (auto &owner : m_by_owner)
				for (auto &kv : owner.second)
					all.push_back(kv.second);
		}
		size_t stopped = 0;
		for (auto &t : all)
		{
			CancelledState r = t->cancel();
			if (r == CancelledState::CANCELLED_BY_CALLER || r == CancelledState::NEXT_RUNS_CANCELLED)
				stopped++;
		}
		return stopped;
	}

	size_t live() const
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		return m_live;
	}

	size_t live_for(OwnerId owner) const
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		auto it = m_by_owner.find(owner);
		return it != m_by_owner.end() ? it->second.size() : 0;
	}

private:
	mutable std::mutex m_mtx;
	std::unordered_map<OwnerId, std::unordered_map<TaskId, TaskPtr>> m_by_owner;
	size_t m_live = 0;
};

// =============================================================================
// RetirementNotifier
// =============================================================================
class RetirementNotifier
{
public:
	void add(EntityRef entity, const TaskPtr &task)
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		m_by_entity[entity].push_back(task);
	}

	void remove(EntityRef entity, const ScheduledTask &task)
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		auto it = m_by_entity.find(entity);
		if (it == m_by_entity.end())
			return;
		auto &list = it->second;
		for (size_t i = 0; i < list.size(); i++)
		{
			if (list[i].get() == &task)
			{
				list[i] = std::move(list.back());
				list.pop_back();
				break;
			}
		}
		if (list.empty())
			m_by_entity.erase(it);
	}

	// Detaches every task tracked for `entity` and calls fn(TaskPtr&) on
	// each, outside the lock, in submission order.
	template <typename F>
	size_t retire(EntityRef entity, F &&fn)
	{
		std::vector<TaskPtr> list;
		{
			std::lock_guard<std::mutex> lk(m_mtx);
			auto it = m_by_entity.find(entity);
			if (it == m_by_entity.end())
				return 0;
			list.swap(it->second);
			m_by_entity.erase(it);
		}
		std::sort(list.begin(), list.end(),
			[](const TaskPtr &a, const TaskPtr &b) { return a->id < b->id; });
		for (auto &t : list)
			fn(t);
		return list.size();
	}

	size_t tracked(EntityRef entity) const
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		auto it = m_by_entity.find(entity);
		return it != m_by_entity.end() ? it->second.size() : 0;
	}

	size_t entities() const
	{
		std::lock_guard<std::mutex> lk(m_mtx);
		return m_by_entity.size();
	}

private:
	mutable std::mutex m_mtx;
	std::unordered_map<EntityRef, std::vector<TaskPtr>> m_by_entity;
};

} // namespace rsched
