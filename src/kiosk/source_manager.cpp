#include "source_manager.hpp"

#include "exception.hpp"

#include <spdlog/spdlog.h>

namespace kiosk {

SourceManager::SourceManager(std::string key, std::shared_ptr<ResultCache> cache,
                             std::chrono::milliseconds refresh_interval)
    : key_(std::move(key)), cache_(std::move(cache)), refresh_interval_ms_(refresh_interval.count()) {
	if (key_.empty()) {
		throw InvalidInputException("source key cannot be empty");
	}
	if (!cache_) {
		throw InvalidInputException("source '" + key_ + "' needs a cache");
	}
}

SourceManager::~SourceManager() {
}

FetchResult SourceManager::GetData(bool force_refresh) {
	if (!force_refresh) {
		FetchResult cached;
		if (cache_->TryGet(key_, cached) && !cache_->IsExpired(key_, RefreshInterval())) {
			spdlog::debug("{}: serving cached data", key_);
			return cached;
		}
	}

	auto outcome = RunFetch();
	if (outcome.IsSuccess()) {
		FetchResult fresh;
		fresh.status = outcome.Status();
		fresh.payload = outcome.GetPayload();
		fresh.last_updated = std::chrono::system_clock::now();
		cache_->Set(key_, fresh);
		SetLastError("");
		spdlog::debug("{}: refreshed ({})", key_, FetchStatusToString(fresh.status));
		return fresh;
	}

	SetLastError(outcome.Reason());
	spdlog::warn("Error fetching {} data: {}", key_, outcome.Reason());

	FetchResult stale;
	if (cache_->TryGet(key_, stale)) {
		spdlog::info("{}: serving stale data after failed refresh", key_);
		stale.status = FetchStatus::CACHED;
		stale.error = outcome.Reason();
		return stale;
	}
	return FetchResult::Error(outcome.Reason());
}

FetchOutcome SourceManager::RunFetch() {
	try {
		return FetchData();
	} catch (SourceException &e) {
		return FetchOutcome::Failure(e.what());
	}
}

CacheInfo SourceManager::GetCacheInfo() const {
	CacheInfo info;
	info.key = key_;
	ResultCache::clock_t::duration age;
	if (cache_->TryGetAge(key_, age)) {
		info.has_age = true;
		info.age = std::chrono::duration_cast<std::chrono::milliseconds>(age);
	}
	info.is_expired = cache_->IsExpired(key_, RefreshInterval());
	info.last_error = LastError();
	return info;
}

void SourceManager::ClearCache() {
	cache_->Clear(key_);
}

FetchStatus SourceManager::GetStatus() {
	return GetData().status;
}

bool SourceManager::IsDataFresh() const {
	return !cache_->IsExpired(key_, RefreshInterval());
}

std::string SourceManager::LastError() const {
	std::lock_guard<std::mutex> lock(error_lock_);
	return last_error_;
}

void SourceManager::SetLastError(const std::string &error) {
	std::lock_guard<std::mutex> lock(error_lock_);
	last_error_ = error;
}

} // namespace kiosk
