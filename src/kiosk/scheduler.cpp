#include "scheduler.hpp"

#include "config.hpp"
#include "exception.hpp"

#include <spdlog/spdlog.h>

namespace kiosk {

SchedulerSettings SchedulerSettings::FromConfig(const ConfigManager &config) {
	SchedulerSettings settings;
	settings.update_interval = config.GetSeconds("app.api_update_interval", settings.update_interval);
	settings.check_interval = config.GetSeconds("app.scheduler_check_interval", settings.check_interval);
	settings.error_backoff = config.GetSeconds("app.scheduler_error_backoff", settings.error_backoff);
	return settings;
}

//======================================================================================================================
// RefreshScheduler
//======================================================================================================================

RefreshScheduler::RefreshScheduler(SchedulerSettings settings) : state_(std::make_shared<State>()) {
	state_->update_interval_ms = settings.update_interval.count();
	state_->check_interval = settings.check_interval;
	state_->error_backoff = settings.error_backoff;
}

RefreshScheduler::~RefreshScheduler() {
	if (thread_.joinable()) {
		Stop(std::chrono::seconds(2));
	}
}

void RefreshScheduler::Register(std::shared_ptr<SourceManager> source) {
	if (!source) {
		throw InvalidInputException("cannot register a null source");
	}
	std::lock_guard<std::mutex> guard(state_->lock);
	for (const auto &existing : state_->sources) {
		if (existing->Key() == source->Key()) {
			throw InvalidInputException("a source with key '" + source->Key() + "' is already registered");
		}
	}
	state_->sources.push_back(std::move(source));
}

std::vector<std::shared_ptr<SourceManager>> RefreshScheduler::Sources() const {
	std::lock_guard<std::mutex> guard(state_->lock);
	return state_->sources;
}

void RefreshScheduler::Start() {
	bool stop_requested;
	{
		std::lock_guard<std::mutex> guard(state_->lock);
		stop_requested = state_->stop_requested;
	}
	if (state_->running && !stop_requested) {
		return;
	}
	if (thread_.joinable()) {
		thread_.join();
	}
	if (stop_requested || exited_.valid()) {
		ResetState();
	}
	state_->running = true;
	exited_ = state_->exited.get_future();
	thread_ = std::thread(Loop, state_);
}

bool RefreshScheduler::Stop(std::chrono::milliseconds timeout) {
	{
		std::lock_guard<std::mutex> guard(state_->lock);
		state_->stop_requested = true;
	}
	state_->wakeup.notify_all();
	if (!thread_.joinable()) {
		return true;
	}
	if (exited_.wait_for(timeout) == std::future_status::ready) {
		thread_.join();
		return true;
	}
	spdlog::warn("Background refresh did not stop within {} ms, proceeding without it", timeout.count());
	thread_.detach();
	exited_ = std::future<void>();
	ResetState();
	return false;
}

void RefreshScheduler::ResetState() {
	auto next = std::make_shared<State>();
	{
		std::lock_guard<std::mutex> guard(state_->lock);
		next->sources = state_->sources;
		next->on_cycle = state_->on_cycle;
	}
	next->update_interval_ms = state_->update_interval_ms.load();
	next->check_interval = state_->check_interval;
	next->error_backoff = state_->error_backoff;
	next->cycles = state_->cycles.load();
	state_ = next;
}

bool RefreshScheduler::IsRunning() const {
	return state_->running;
}

void RefreshScheduler::RunCycle() {
	RefreshAll(*state_);
}

void RefreshScheduler::SetUpdateInterval(std::chrono::milliseconds interval) {
	state_->update_interval_ms = interval.count();
}

std::chrono::milliseconds RefreshScheduler::UpdateInterval() const {
	return std::chrono::milliseconds(state_->update_interval_ms.load());
}

uint64_t RefreshScheduler::CycleCount() const {
	return state_->cycles;
}

void RefreshScheduler::SetCycleCallback(std::function<void(uint64_t)> callback) {
	std::lock_guard<std::mutex> guard(state_->lock);
	state_->on_cycle = std::move(callback);
}

void RefreshScheduler::RefreshAll(State &state) {
	std::vector<std::shared_ptr<SourceManager>> sources;
	{
		std::lock_guard<std::mutex> guard(state.lock);
		sources = state.sources;
	}

	spdlog::debug("Refreshing {} sources", sources.size());
	for (auto &source : sources) {
		try {
			if (!source->IsEnabled()) {
				spdlog::debug("{}: not enabled, skipping", source->Key());
				continue;
			}
			auto result = source->GetData(true);
			spdlog::debug("{}: {}", source->Key(), FetchStatusToString(result.status));
		} catch (std::exception &e) {
			spdlog::error("Error updating {} data: {}", source->Key(), e.what());
		}
	}
	state.cycles++;
}

void RefreshScheduler::Loop(std::shared_ptr<State> state) {
	spdlog::info("Background refresh started");

	bool has_run = false;
	auto last_cycle = std::chrono::steady_clock::now();

	while (true) {
		{
			std::lock_guard<std::mutex> guard(state->lock);
			if (state->stop_requested) {
				break;
			}
		}

		auto wait = state->check_interval;
		try {
			auto now = std::chrono::steady_clock::now();
			auto interval = std::chrono::milliseconds(state->update_interval_ms.load());
			if (!has_run || now - last_cycle > interval) {
				RefreshAll(*state);
				last_cycle = now;
				has_run = true;

				std::function<void(uint64_t)> on_cycle;
				{
					std::lock_guard<std::mutex> guard(state->lock);
					on_cycle = state->on_cycle;
				}
				if (on_cycle) {
					on_cycle(state->cycles);
				}
			}
		} catch (std::exception &e) {
			spdlog::error("Error in background refresh: {}", e.what());
			wait = state->error_backoff;
		}

		std::unique_lock<std::mutex> guard(state->lock);
		state->wakeup.wait_for(guard, wait, [&state] { return state->stop_requested; });
	}

	state->running = false;
	spdlog::info("Background refresh stopped");
	state->exited.set_value();
}

} // namespace kiosk
