#include "fetch_result.hpp"

namespace kiosk {

std::string FetchStatusToString(FetchStatus status) {
	switch (status) {
	case FetchStatus::SUCCESS:
		return "success";
	case FetchStatus::CACHED:
		return "cached";
	case FetchStatus::ERROR:
		return "error";
	case FetchStatus::MOCK:
		return "mock";
	}
	return "unknown";
}

//======================================================================================================================
// FetchOutcome
//======================================================================================================================

FetchOutcome::FetchOutcome(bool ok, FetchStatus status, Payload payload, std::string reason)
    : ok_(ok), status_(status), payload_(std::move(payload)), reason_(std::move(reason)) {
}

FetchOutcome FetchOutcome::Success(Payload payload) {
	return FetchOutcome(true, FetchStatus::SUCCESS, std::move(payload), "");
}

FetchOutcome FetchOutcome::Mock(Payload payload) {
	return FetchOutcome(true, FetchStatus::MOCK, std::move(payload), "");
}

FetchOutcome FetchOutcome::Failure(const std::string &reason) {
	return FetchOutcome(false, FetchStatus::ERROR, Payload(), reason.empty() ? "unknown error" : reason);
}

//======================================================================================================================
// FetchResult
//======================================================================================================================

FetchResult FetchResult::Error(const std::string &message) {
	FetchResult result;
	result.status = FetchStatus::ERROR;
	result.error = message.empty() ? "unknown error" : message;
	result.last_updated = std::chrono::system_clock::now();
	return result;
}

std::string FetchResult::ToJson() const {
	PayloadBuilder builder;
	builder.AddString("status", FetchStatusToString(status));
	builder.AddInt("last_updated",
	               std::chrono::duration_cast<std::chrono::seconds>(last_updated.time_since_epoch()).count());
	if (!error.empty()) {
		builder.AddString("error", error);
	}
	if (HasPayload()) {
		builder.AddValue("data", yyjson_val_mut_copy(builder.Doc(), payload.Root()));
	}
	return builder.Build().ToJson();
}

} // namespace kiosk
