#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "source_manager.hpp"

namespace kiosk {

class ConfigManager;

struct SchedulerSettings {
	//! Time between refresh cycles
	std::chrono::milliseconds update_interval {std::chrono::seconds(300)};
	//! Time between checks whether a cycle is due
	std::chrono::milliseconds check_interval {std::chrono::seconds(30)};
	//! Wait after an iteration failed outside any single source
	std::chrono::milliseconds error_backoff {std::chrono::seconds(60)};

	static SchedulerSettings FromConfig(const ConfigManager &config);
};

//! Background loop that force-refreshes every registered source once per update interval.
//!
//! Sources are refreshed sequentially in registration order; each refresh has its own failure boundary, so one
//! broken source never keeps the others from refreshing. Stop is cooperative with a bounded wait: if the thread is
//! stuck in a slow request it is detached, and it keeps its own references to the sources until it finishes.
class RefreshScheduler {
public:
	explicit RefreshScheduler(SchedulerSettings settings);
	~RefreshScheduler();

	RefreshScheduler(const RefreshScheduler &) = delete;
	RefreshScheduler &operator=(const RefreshScheduler &) = delete;

	//! Throws InvalidInputException on a null source or a key that is already registered
	void Register(std::shared_ptr<SourceManager> source);
	std::vector<std::shared_ptr<SourceManager>> Sources() const;

	//! Start the refresh thread. The first cycle runs immediately. No-op if already running.
	void Start();
	//! Ask the thread to stop and wait up to timeout. Returns true if it exited in time.
	bool Stop(std::chrono::milliseconds timeout);
	bool IsRunning() const;

	//! Refresh every enabled source once, on the calling thread
	void RunCycle();

	//! Takes effect at the next check
	void SetUpdateInterval(std::chrono::milliseconds interval);
	std::chrono::milliseconds UpdateInterval() const;

	//! Number of completed refresh cycles (including ones run through RunCycle)
	uint64_t CycleCount() const;

	//! Called on the refresh thread after every background cycle with the new cycle count. An exception thrown
	//! from the callback fails the iteration, and the loop waits error_backoff before its next check.
	void SetCycleCallback(std::function<void(uint64_t)> callback);

private:
	struct State {
		std::mutex lock;
		std::condition_variable wakeup;
		bool stop_requested = false;
		std::atomic<bool> running {false};

		std::vector<std::shared_ptr<SourceManager>> sources;
		std::atomic<int64_t> update_interval_ms {0};
		std::chrono::milliseconds check_interval {0};
		std::chrono::milliseconds error_backoff {0};
		std::atomic<uint64_t> cycles {0};
		std::function<void(uint64_t)> on_cycle;

		std::promise<void> exited;
	};

	//! Replace state_ with a fresh one carrying over sources, settings and the cycle count
	void ResetState();

	static void Loop(std::shared_ptr<State> state);
	static void RefreshAll(State &state);

	std::shared_ptr<State> state_;
	std::future<void> exited_;
	std::thread thread_;
};

} // namespace kiosk
