#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "kiosk/http_client.hpp"
#include "kiosk/source_manager.hpp"

namespace kiosk {

class ConfigManager;

struct CalendarSettings {
	std::string endpoint = "https://www.googleapis.com/calendar/v3/calendars";
	//! OAuth bearer token; the source is disabled while it is empty
	std::string access_token;
	std::string calendar_id = "primary";
	int64_t max_results = 10;

	bool IsConfigured() const {
		return !access_token.empty();
	}

	static CalendarSettings FromConfig(const ConfigManager &config);
};

//! One event formatted for display
struct CalendarEvent {
	std::string title;
	std::string description;
	//! "HH:MM" or "All day"
	std::string time;
	//! "DD/MM"
	std::string date;
	//! Start as sent by the API (RFC 3339 date-time, or YYYY-MM-DD for all-day events)
	std::string start;
	bool is_all_day = false;
	std::string location;
	std::string url;
};

//! Upcoming events of a Google Calendar
class CalendarSource : public SourceManager {
public:
	static constexpr const char *KEY = "calendar_events";

	CalendarSource(std::shared_ptr<ResultCache> cache, std::shared_ptr<HttpClient> http, CalendarSettings settings,
	               std::chrono::milliseconds refresh_interval);

	bool IsEnabled() const override {
		return settings_.IsConfigured();
	}

	//! The first max_results events of the current payload; empty when the source is not configured
	std::vector<CalendarEvent> GetUpcomingEvents(size_t max_results = 3);
	//! Events starting on the local calendar day
	std::vector<CalendarEvent> GetTodayEvents();

	const CalendarSettings &Settings() const {
		return settings_;
	}

	//! Format one raw API event. Throws PayloadException if it has no usable start.
	static CalendarEvent FormatEvent(yyjson_val *event);

protected:
	FetchOutcome FetchData() override;

private:
	std::string BuildEventsUrl() const;
	static std::vector<CalendarEvent> ReadEvents(const Payload &payload, size_t max_results);

	std::shared_ptr<HttpClient> http_;
	CalendarSettings settings_;
};

} // namespace kiosk
