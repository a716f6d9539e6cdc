// rsched_plugin.hpp — Plugin hot-reload: watch .so files and swap at runtime
//
// Plugins are shared libraries (.so) compiled against rsched headers.
// They must export:
//
//   extern "C" void rsched_plugin_enable(rsched::Scheduler &sched, rsched::OwnerId owner);
//     Called after dlopen. Schedule tasks under `owner` here.
//
// and may export:
//
//   extern "C" void rsched_plugin_disable(rsched::Scheduler &sched, rsched::OwnerId owner);
//     Called before dlclose. Drop references into the host here.
//
// The loader cancels every task of the plugin's owner after disable, waits
// for in-flight runs of those tasks to finish, and only then unloads the
// library. A plugin that is still running code after the wait stays mapped.
//
// Usage:
//   PluginLoader plugins(sched);
//   plugins.watch("plugins/example_plugin.so");
//   plugins.load_all();
//   ticker.on_global_tick([&](uint64_t) { plugins.poll(); });
//   ticker.run();
//   plugins.unload_all();
//
// Hot-reload: rebuild the .so while the server is running.
// On the next poll(), the loader detects the mtime change and reloads.
//
// Depends: rsched_scheduler.hpp, <dlfcn.h>

#pragma once

#include "rsched_scheduler.hpp"
#include <dlfcn.h>
#include <sys/stat.h>
#include <chrono>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

namespace rsched
{

struct PluginLoader
{
	explicit PluginLoader(Scheduler &sched) : m_sched(&sched) {}

	PluginLoader(const PluginLoader &) = delete;
	PluginLoader &operator=(const PluginLoader &) = delete;

	~PluginLoader() { unload_all(); }

	// How long unload waits for the plugin's running tasks to drain.
	void set_unload_timeout(std::chrono::milliseconds t) { m_unload_timeout = t; }

	void watch(std::string path)
	{
		Entry e;
		e.name = basename_noext(path);
		e.path = std::move(path);
		m_entries.push_back(std::move(e));
	}

	void load_all()
	{
		for (auto &e : m_entries)
		{
			time_t mt = file_mtime(e.path);
			if (mt != 0 && !e.handle)
				do_load(e);
		}
	}

	void poll()
	{
		for (auto &e : m_entries)
		{
			time_t mt = file_mtime(e.path);
			if (mt == 0)
				continue;
			if (mt != e.mtime)
			{
				if (e.handle && !do_unload(e))
					continue;
				do_load(e);
			}
		}
	}

	void unload_all()
	{
		for (auto &e : m_entries)
			if (e.handle)
				do_unload(e);
	}

	size_t loaded() const
	{
		size_t n = 0;
		for (auto &e : m_entries)
			if (e.handle)
				n++;
		return n;
	}

	bool is_loaded(const std::string &name) const
	{
		for (auto &e : m_entries)
			if (e.name == name)
				return e.handle != nullptr;
		return false;
	}

	// Owner the plugin's tasks are attributed to, NULL_OWNER if unknown.
	OwnerId owner_of(const std::string &name) const
	{
		for (auto &e : m_entries)
			if (e.name == name)
				return e.owner;
		return NULL_OWNER;
	}

private:
	struct Entry
	{
		std::string path;
		std::string name;
		void *handle = nullptr;
		time_t mtime = 0;
		OwnerId owner = NULL_OWNER;
	};

	Scheduler *m_sched;
	std::vector<Entry> m_entries;
	std::chrono::milliseconds m_unload_timeout{2000};

	static time_t file_mtime(const std::string &path)
	{
		struct stat st;
		return (stat(path.c_str(), &st) == 0) ? st.st_mtime : 0;
	}

	static std::string basename_noext(const std::string &path)
	{
		auto slash = path.rfind('/');
		size_t start = (slash == std::string::npos) ? 0 : slash + 1;
		auto dot = path.rfind('.');
		size_t end = (dot == std::string::npos || dot < start) ? path.size() : dot;
		return path.substr(start, end - start);
	}

	using PluginFn = void (*)(Scheduler &, OwnerId);

	void do_load(Entry &e)
	{
		void *handle = dlopen(e.path.c_str(), RTLD_NOW | RTLD_LOCAL);
		if (!handle)
		{
			fprintf(stderr, "[plugin] load failed '%s': %s\n", e.name.c_str(), dlerror());
			return;
		}

		auto *enable_fn = reinterpret_cast<PluginFn>(dlsym(handle, "rsched_plugin_enable"));
		if (!enable_fn)
		{
			fprintf(stderr, "[plugin] '%s' missing rsched_plugin_enable: %s\n", e.name.c_str(), dlerror());
			dlclose(handle);
			return;
		}

		e.handle = handle;
		e.mtime = file_mtime(e.path);
		e.owner = m_sched->register_owner(e.name.c_str());
		try
		{
			enable_fn(*m_sched, e.owner);
		}
		catch (const std::exception &ex)
		{
			fprintf(stderr, "[plugin] '%s' enable failed: %s\n", e.name.c_str(), ex.what());
			do_unload(e);
			return;
		}
		printf("[plugin] loaded: %s\n", e.name.c_str());
	}

	// False if the library had to stay mapped.
	bool do_unload(Entry &e)
	{
		auto *disable_fn = reinterpret_cast<PluginFn>(dlsym(e.handle, "rsched_plugin_disable"));
		if (disable_fn)
		{
			try
			{
				disable_fn(*m_sched, e.owner);
			}
			catch (const std::exception &ex)
			{
				fprintf(stderr, "[plugin] '%s' disable failed: %s\n", e.name.c_str(), ex.what());
			}
		}

		size_t cancelled = m_sched->cancel_all_for(e.owner);
		if (cancelled)
			printf("[plugin] %s: cancelled %zu task(s)\n", e.name.c_str(), cancelled);

		if (!wait_idle(e.owner))
		{
			fprintf(stderr, "[plugin] '%s' still has %zu running task(s), not unloading\n",
				e.name.c_str(), m_sched->live_tasks_for(e.owner));
			return false;
		}

		dlclose(e.handle);
		e.handle = nullptr;
		printf("[plugin] unloaded: %s\n", e.name.c_str());
		return true;
	}

	// Tasks caught mid-run by cancel_all_for stay live until their run ends.
	bool wait_idle(OwnerId owner) const
	{
		auto deadline = std::chrono::steady_clock::now() + m_unload_timeout;
		while (m_sched->live_tasks_for(owner) != 0)
		{
			if (std::chrono::steady_clock::now() >= deadline)
				return false;
			// A task registered mid-unload from another thread is caught here.
			m_sched->cancel_all_for(owner);
			std::this_thread::sleep_for(std::chrono::milliseconds(1));
		}
		return true;
	}
};

} // namespace rsched
