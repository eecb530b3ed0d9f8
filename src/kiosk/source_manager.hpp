#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "cache.hpp"
#include "fetch_result.hpp"

namespace kiosk {

//! The cache shared by every source of one application instance
using ResultCache = TimedCache<FetchResult>;

//! Diagnostics for status indicators
struct CacheInfo {
	std::string key;
	//! False if nothing is cached; age is zero then
	bool has_age = false;
	std::chrono::milliseconds age {0};
	bool is_expired = true;
	std::string last_error;
};

//! Turns a flaky remote fetch into a tagged FetchResult, using the shared cache as memory between calls.
//!
//! GetData never throws for recoverable failures (SourceException): a failed refresh serves the previous entry
//! tagged CACHED, or a payload-free ERROR result if nothing was ever cached. Any other exception escaping
//! FetchData is a bug in the source and propagates.
//!
//! Each manager owns exactly one key in the cache.
class SourceManager {
public:
	virtual ~SourceManager();

	SourceManager(const SourceManager &) = delete;
	SourceManager &operator=(const SourceManager &) = delete;

	//! Cached entry if fresh and !force_refresh, otherwise fetch (falling back to the stale entry on failure)
	FetchResult GetData(bool force_refresh = false);

	//! Status tag of GetData(), for status indicators
	FetchStatus GetStatus();

	CacheInfo GetCacheInfo() const;
	//! Drop this source's cache entry
	void ClearCache();
	bool IsDataFresh() const;

	//! Last fetch failure message; empty after a successful fetch
	std::string LastError() const;

	const std::string &Key() const {
		return key_;
	}
	std::chrono::milliseconds RefreshInterval() const {
		return std::chrono::milliseconds(refresh_interval_ms_.load());
	}
	void SetRefreshInterval(std::chrono::milliseconds interval) {
		refresh_interval_ms_ = interval.count();
	}

	//! Disabled sources are skipped by the refresh scheduler
	virtual bool IsEnabled() const {
		return true;
	}

protected:
	//! Throws InvalidInputException on an empty key or a null cache
	SourceManager(std::string key, std::shared_ptr<ResultCache> cache, std::chrono::milliseconds refresh_interval);

	//! Fetch fresh data. May return FetchOutcome::Failure or throw a SourceException; both are handled the same way.
	virtual FetchOutcome FetchData() = 0;

private:
	FetchOutcome RunFetch();
	void SetLastError(const std::string &error);

	const std::string key_;
	std::shared_ptr<ResultCache> cache_;
	std::atomic<int64_t> refresh_interval_ms_;

	mutable std::mutex error_lock_;
	std::string last_error_;
};

} // namespace kiosk
