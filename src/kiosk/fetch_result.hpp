#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "payload.hpp"

namespace kiosk {

//! Status tag carried by every result handed to the display layer
enum class FetchStatus : uint8_t {
	//! Freshly fetched
	SUCCESS,
	//! Stale cache served because the refresh failed
	CACHED,
	//! Refresh failed and nothing was cached
	ERROR,
	//! Synthetic data
	MOCK,
};

//! "success", "cached", "error" or "mock"
std::string FetchStatusToString(FetchStatus status);

//! What a source's fetch hook produces: a payload tagged SUCCESS or MOCK, or a failure reason
class FetchOutcome {
public:
	static FetchOutcome Success(Payload payload);
	static FetchOutcome Mock(Payload payload);
	static FetchOutcome Failure(const std::string &reason);

	bool IsSuccess() const {
		return ok_;
	}
	//! SUCCESS or MOCK for successful outcomes, ERROR for failures
	FetchStatus Status() const {
		return status_;
	}
	const Payload &GetPayload() const {
		return payload_;
	}
	const std::string &Reason() const {
		return reason_;
	}

private:
	FetchOutcome(bool ok, FetchStatus status, Payload payload, std::string reason);

	bool ok_;
	FetchStatus status_;
	Payload payload_;
	std::string reason_;
};

//! The value returned by SourceManager::GetData
struct FetchResult {
	FetchStatus status = FetchStatus::ERROR;
	//! Empty for ERROR results
	Payload payload;
	//! Failure message for ERROR and CACHED results, empty otherwise
	std::string error;
	//! Wall-clock time of the fetch that produced the payload (or of the failure, for ERROR)
	std::chrono::system_clock::time_point last_updated;

	bool HasPayload() const {
		return !payload.Empty();
	}

	//! Payload-free result tagged ERROR, stamped now
	static FetchResult Error(const std::string &message);

	//! {"status": ..., "last_updated": <unix seconds>, "error": ..., "data": {...}}
	std::string ToJson() const;
};

} // namespace kiosk
