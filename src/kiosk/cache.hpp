#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace kiosk {

//! Thread-safe in-memory mapping from key to the most recently stored value and the time it was stored.
//! One lock guards the whole map. Freshness is never enforced on read; callers ask IsExpired.
template <typename VALUE>
class TimedCache {
public:
	using clock_t = std::chrono::steady_clock;

	struct CacheEntry {
		VALUE value;
		clock_t::time_point recorded_at;
	};

	//! Copy out the stored value. Returns false if the key was never set or has been cleared.
	bool TryGet(const std::string &key, VALUE &result) const;

	//! Store value with the current time, replacing any previous entry for key
	void Set(const std::string &key, VALUE value);

	//! True if the key is absent or older than max_age
	bool IsExpired(const std::string &key, std::chrono::milliseconds max_age) const;

	//! Time since the entry was stored. Returns false if the key is absent.
	bool TryGetAge(const std::string &key, clock_t::duration &result) const;

	//! Remove one key
	void Clear(const std::string &key);
	//! Remove every key
	void Clear();

	std::vector<std::string> Keys() const;
	size_t Size() const;

private:
	mutable std::mutex mutex_;
	std::unordered_map<std::string, CacheEntry> entries_;
};

//======================================================================================================================
// Implementation
//======================================================================================================================

template <typename VALUE>
bool TimedCache<VALUE>::TryGet(const std::string &key, VALUE &result) const {
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = entries_.find(key);
	if (it == entries_.end()) {
		return false;
	}
	result = it->second.value;
	return true;
}

template <typename VALUE>
void TimedCache<VALUE>::Set(const std::string &key, VALUE value) {
	CacheEntry entry;
	entry.value = std::move(value);
	std::lock_guard<std::mutex> lock(mutex_);
	entry.recorded_at = clock_t::now();
	entries_[key] = std::move(entry);
}

template <typename VALUE>
bool TimedCache<VALUE>::IsExpired(const std::string &key, std::chrono::milliseconds max_age) const {
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = entries_.find(key);
	if (it == entries_.end()) {
		return true;
	}
	return clock_t::now() - it->second.recorded_at > max_age;
}

template <typename VALUE>
bool TimedCache<VALUE>::TryGetAge(const std::string &key, clock_t::duration &result) const {
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = entries_.find(key);
	if (it == entries_.end()) {
		return false;
	}
	result = clock_t::now() - it->second.recorded_at;
	return true;
}

template <typename VALUE>
void TimedCache<VALUE>::Clear(const std::string &key) {
	std::lock_guard<std::mutex> lock(mutex_);
	entries_.erase(key);
}

template <typename VALUE>
void TimedCache<VALUE>::Clear() {
	std::lock_guard<std::mutex> lock(mutex_);
	entries_.clear();
}

template <typename VALUE>
std::vector<std::string> TimedCache<VALUE>::Keys() const {
	std::lock_guard<std::mutex> lock(mutex_);
	std::vector<std::string> keys;
	keys.reserve(entries_.size());
	for (const auto &entry : entries_) {
		keys.push_back(entry.first);
	}
	return keys;
}

template <typename VALUE>
size_t TimedCache<VALUE>::Size() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return entries_.size();
}

} // namespace kiosk
