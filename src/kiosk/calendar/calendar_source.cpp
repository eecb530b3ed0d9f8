#include "calendar_source.hpp"

#include "kiosk/config.hpp"
#include "kiosk/exception.hpp"
#include "kiosk/string_util.hpp"

#include <cctype>
#include <ctime>

#include <spdlog/spdlog.h>

namespace kiosk {

constexpr const char *CalendarSource::KEY;

static std::string ObjectString(yyjson_val *obj, const char *key, const std::string &default_value = "") {
	auto val = yyjson_obj_get(obj, key);
	if (!yyjson_is_str(val)) {
		return default_value;
	}
	return std::string(yyjson_get_str(val), yyjson_get_len(val));
}

static bool AllDigits(const std::string &str, size_t pos, size_t len) {
	if (pos + len > str.size()) {
		return false;
	}
	for (size_t i = pos; i < pos + len; i++) {
		if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
			return false;
		}
	}
	return true;
}

//! YYYY-MM-DD
static bool IsDate(const std::string &str) {
	return AllDigits(str, 0, 4) && str[4] == '-' && AllDigits(str, 5, 2) && str[7] == '-' && AllDigits(str, 8, 2);
}

static std::string CurrentUtcTimestamp() {
	auto now = std::time(nullptr);
	std::tm utc {};
	gmtime_r(&now, &utc);
	char buffer[32];
	std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
	return buffer;
}

static std::string CurrentLocalDate() {
	auto now = std::time(nullptr);
	std::tm local {};
	localtime_r(&now, &local);
	char buffer[16];
	std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &local);
	return buffer;
}

CalendarSettings CalendarSettings::FromConfig(const ConfigManager &config) {
	CalendarSettings settings;
	settings.endpoint = config.GetString("calendar.endpoint", settings.endpoint);
	settings.access_token = config.GetString("calendar.access_token");
	settings.calendar_id = config.GetString("calendar.calendar_id", settings.calendar_id);
	settings.max_results = config.GetInt("calendar.max_results", settings.max_results);
	if (settings.max_results < 1) {
		settings.max_results = 1;
	}
	return settings;
}

CalendarSource::CalendarSource(std::shared_ptr<ResultCache> cache, std::shared_ptr<HttpClient> http,
                               CalendarSettings settings, std::chrono::milliseconds refresh_interval)
    : SourceManager(KEY, std::move(cache), refresh_interval), http_(std::move(http)), settings_(std::move(settings)) {
	if (!http_) {
		throw InvalidInputException("calendar source needs an HTTP client");
	}
}

std::string CalendarSource::BuildEventsUrl() const {
	auto base = settings_.endpoint + "/" + HttpClient::UrlEncode(settings_.calendar_id) + "/events";
	return HttpClient::BuildUrl(base, {{"timeMin", CurrentUtcTimestamp()},
	                                   {"maxResults", std::to_string(settings_.max_results)},
	                                   {"singleEvents", "true"},
	                                   {"orderBy", "startTime"}});
}

FetchOutcome CalendarSource::FetchData() {
	if (!settings_.IsConfigured()) {
		throw NotConfiguredException("Google Calendar access token is not configured");
	}

	HttpHeaders headers;
	headers["Authorization"] = "Bearer " + settings_.access_token;
	auto doc = http_->GetJson(BuildEventsUrl(), headers);

	auto items = doc.Get("items");
	if (items && !yyjson_is_arr(items)) {
		throw PayloadException("calendar response 'items' is not an array");
	}

	PayloadBuilder out;
	auto events = yyjson_mut_arr(out.Doc());
	int64_t total = 0;

	size_t idx, max;
	yyjson_val *item;
	yyjson_arr_foreach(items, idx, max, item) {
		CalendarEvent event;
		try {
			event = FormatEvent(item);
		} catch (PayloadException &e) {
			spdlog::warn("Skipping calendar event {}: {}", idx, e.RawMessage());
			continue;
		}
		auto obj = yyjson_mut_obj(out.Doc());
		yyjson_mut_obj_add_strncpy(out.Doc(), obj, "title", event.title.c_str(), event.title.size());
		yyjson_mut_obj_add_strncpy(out.Doc(), obj, "description", event.description.c_str(),
		                           event.description.size());
		yyjson_mut_obj_add_strncpy(out.Doc(), obj, "time", event.time.c_str(), event.time.size());
		yyjson_mut_obj_add_strncpy(out.Doc(), obj, "date", event.date.c_str(), event.date.size());
		yyjson_mut_obj_add_strncpy(out.Doc(), obj, "start", event.start.c_str(), event.start.size());
		yyjson_mut_obj_add_bool(out.Doc(), obj, "is_all_day", event.is_all_day);
		yyjson_mut_obj_add_strncpy(out.Doc(), obj, "location", event.location.c_str(), event.location.size());
		yyjson_mut_obj_add_strncpy(out.Doc(), obj, "url", event.url.c_str(), event.url.size());
		yyjson_mut_arr_append(events, obj);
		total++;
	}

	out.AddValue("events", events);
	out.AddInt("total_events", total);
	return FetchOutcome::Success(out.Build());
}

CalendarEvent CalendarSource::FormatEvent(yyjson_val *item) {
	if (!yyjson_is_obj(item)) {
		throw PayloadException("event is not an object");
	}
	auto start = yyjson_obj_get(item, "start");
	if (!yyjson_is_obj(start)) {
		throw PayloadException("event has no start");
	}

	CalendarEvent event;
	auto date_time = ObjectString(start, "dateTime");
	if (!date_time.empty()) {
		// 2024-05-01T09:30:00+02:00, kept in the event's own offset
		if (!IsDate(date_time) || date_time.size() < 16 || date_time[10] != 'T' || !AllDigits(date_time, 11, 2) ||
		    date_time[13] != ':' || !AllDigits(date_time, 14, 2)) {
			throw PayloadException("malformed start dateTime '" + date_time + "'");
		}
		event.start = date_time;
		event.time = date_time.substr(11, 5);
		event.is_all_day = false;
	} else {
		auto date = ObjectString(start, "date");
		if (date.size() != 10 || !IsDate(date)) {
			throw PayloadException("malformed start date '" + date + "'");
		}
		event.start = date;
		event.time = "All day";
		event.is_all_day = true;
	}
	event.date = event.start.substr(8, 2) + "/" + event.start.substr(5, 2);

	event.title = StringUtil::Truncate(ObjectString(item, "summary", "No title"), 50);
	event.description = StringUtil::Truncate(ObjectString(item, "description"), 100);
	event.location = ObjectString(item, "location");
	event.url = ObjectString(item, "htmlLink");
	return event;
}

std::vector<CalendarEvent> CalendarSource::ReadEvents(const Payload &payload, size_t max_results) {
	std::vector<CalendarEvent> result;
	auto events = payload.Get("events");
	size_t idx, max;
	yyjson_val *obj;
	yyjson_arr_foreach(events, idx, max, obj) {
		if (result.size() >= max_results) {
			break;
		}
		CalendarEvent event;
		event.title = ObjectString(obj, "title");
		event.description = ObjectString(obj, "description");
		event.time = ObjectString(obj, "time");
		event.date = ObjectString(obj, "date");
		event.start = ObjectString(obj, "start");
		event.is_all_day = yyjson_get_bool(yyjson_obj_get(obj, "is_all_day"));
		event.location = ObjectString(obj, "location");
		event.url = ObjectString(obj, "url");
		result.push_back(std::move(event));
	}
	return result;
}

std::vector<CalendarEvent> CalendarSource::GetUpcomingEvents(size_t max_results) {
	if (!IsEnabled()) {
		return {};
	}
	return ReadEvents(GetData().payload, max_results);
}

std::vector<CalendarEvent> CalendarSource::GetTodayEvents() {
	auto today = CurrentLocalDate();
	std::vector<CalendarEvent> result;
	for (auto &event : GetUpcomingEvents(static_cast<size_t>(settings_.max_results))) {
		if (StringUtil::StartsWith(event.start, today)) {
			result.push_back(std::move(event));
		}
	}
	return result;
}

} // namespace kiosk
