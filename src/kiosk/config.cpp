#include "config.hpp"

#include "exception.hpp"
#include "string_util.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>
#include <yyjson.h>

namespace kiosk {

//======================================================================================================================
// Defaults and environment mapping
//======================================================================================================================

struct ConfigDefault {
	const char *path;
	const char *value;
};

static const ConfigDefault DEFAULTS[] = {
    {"app.api_update_interval", "300"},
    {"app.scheduler_check_interval", "30"},
    {"app.scheduler_error_backoff", "60"},
    {"app.shutdown_timeout", "2"},
    {"app.status_interval", "5"},
    {"app.log_level", "info"},
    {"app.debug_mode", "false"},

    {"http.timeout", "10"},
    {"http.user_agent", "kiosk/1.0"},
    {"http.follow_redirects", "true"},
    {"http.verify_certificates", "true"},

    {"crypto.price_url",
     "https://api.coingecko.com/api/v3/simple/price?ids=bitcoin&vs_currencies=usd&include_24hr_change=true"},
    {"crypto.fees_url", "https://mempool.space/api/v1/fees/recommended"},
    {"crypto.difficulty_url", "https://mempool.space/api/v1/difficulty-adjustment"},
    {"crypto.hashrate_url", "https://mempool.space/api/v1/mining/hashrate/3d"},
    {"crypto.blocks_url", "https://mempool.space/api/v1/blocks"},
    {"crypto.mempool_url", "https://mempool.space/api/mempool"},
    {"crypto.recent_blocks", "3"},

    {"weather.endpoint", "https://api.openweathermap.org/data/2.5/weather"},
    {"weather.api_key", ""},
    {"weather.city", "London,UK"},
    {"weather.units", "metric"},
    {"weather.mock_mode", "true"},
    {"weather.fallback_to_mock", "true"},
    {"weather.mock_rotation", "120"},

    {"calendar.endpoint", "https://www.googleapis.com/calendar/v3/calendars"},
    {"calendar.calendar_id", "primary"},
    {"calendar.max_results", "10"},
};

struct EnvMapping {
	const char *variable;
	const char *path;
};

static const EnvMapping ENV_MAPPINGS[] = {
    {"WEATHER_API_KEY", "weather.api_key"},
    {"WEATHER_CITY", "weather.city"},
    {"WEATHER_UNITS", "weather.units"},
    {"WEATHER_MOCK_MODE", "weather.mock_mode"},
    {"API_UPDATE_INTERVAL", "app.api_update_interval"},
    {"LOG_LEVEL", "app.log_level"},
    {"DEBUG_MODE", "app.debug_mode"},
    {"HTTP_TIMEOUT", "http.timeout"},
    {"CALENDAR_ACCESS_TOKEN", "calendar.access_token"},
    {"CALENDAR_ID", "calendar.calendar_id"},
};

static const char *WEATHER_KEY_PLACEHOLDER = "YOUR_OPENWEATHERMAP_API_KEY_HERE";

//! 2^63; doubles at or beyond it do not fit in int64_t
static const double INT64_RANGE = 9223372036854775808.0;

//======================================================================================================================
// JSON flattening
//======================================================================================================================

static std::string ScalarToString(yyjson_val *val) {
	if (yyjson_is_str(val)) {
		return std::string(yyjson_get_str(val), yyjson_get_len(val));
	}
	if (yyjson_is_bool(val)) {
		return yyjson_get_bool(val) ? "true" : "false";
	}
	if (yyjson_is_uint(val)) {
		return std::to_string(yyjson_get_uint(val));
	}
	if (yyjson_is_sint(val)) {
		return std::to_string(yyjson_get_sint(val));
	}
	if (yyjson_is_real(val)) {
		char buffer[32];
		std::snprintf(buffer, sizeof(buffer), "%.15g", yyjson_get_real(val));
		return buffer;
	}
	return "";
}

static void Flatten(yyjson_val *val, const std::string &prefix, std::map<std::string, std::string> &out) {
	if (yyjson_is_obj(val)) {
		size_t idx, max;
		yyjson_val *key, *child;
		yyjson_obj_foreach(val, idx, max, key, child) {
			std::string name(yyjson_get_str(key), yyjson_get_len(key));
			Flatten(child, prefix.empty() ? name : prefix + "." + name, out);
		}
		return;
	}
	if (prefix.empty() || yyjson_is_null(val)) {
		return;
	}
	if (yyjson_is_arr(val)) {
		std::vector<std::string> items;
		size_t idx, max;
		yyjson_val *item;
		yyjson_arr_foreach(val, idx, max, item) {
			items.push_back(ScalarToString(item));
		}
		out[prefix] = StringUtil::Join(items, ",");
		return;
	}
	out[prefix] = ScalarToString(val);
}

static std::string Unquote(const std::string &value) {
	if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
		return value.substr(1, value.size() - 2);
	}
	return value;
}

//======================================================================================================================
// ConfigManager
//======================================================================================================================

ConfigManager::ConfigManager() {
	SetDefaults();
}

void ConfigManager::SetDefaults() {
	for (const auto &entry : DEFAULTS) {
		values_[entry.path] = entry.value;
	}
	sources_.push_back("defaults");
}

bool ConfigManager::LoadJsonFile(const std::string &path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		return false;
	}
	std::stringstream buffer;
	buffer << file.rdbuf();
	if (file.bad()) {
		throw ConfigException("could not read " + path);
	}
	try {
		LoadJsonString(buffer.str());
	} catch (ConfigException &e) {
		throw ConfigException(path + ": " + e.RawMessage());
	}
	std::lock_guard<std::mutex> lock(mutex_);
	sources_.push_back(path);
	return true;
}

void ConfigManager::LoadJsonString(const std::string &json) {
	yyjson_read_err err;
	auto doc = yyjson_read_opts(const_cast<char *>(json.c_str()), json.size(), YYJSON_READ_NOFLAG, nullptr, &err);
	if (!doc) {
		throw ConfigException("invalid JSON at offset " + std::to_string(err.pos) + ": " +
		                      (err.msg ? err.msg : "unknown error"));
	}
	auto root = yyjson_doc_get_root(doc);
	if (!yyjson_is_obj(root)) {
		yyjson_doc_free(doc);
		throw ConfigException("top level JSON value must be an object");
	}
	std::map<std::string, std::string> flat;
	Flatten(root, "", flat);
	yyjson_doc_free(doc);

	std::lock_guard<std::mutex> lock(mutex_);
	for (auto &entry : flat) {
		values_[entry.first] = std::move(entry.second);
	}
}

bool ConfigManager::LoadEnvFile(const std::string &path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		return false;
	}
	std::map<std::string, std::string> parsed;
	std::string line;
	int line_number = 0;
	while (std::getline(file, line)) {
		line_number++;
		auto trimmed = StringUtil::Trim(line);
		if (trimmed.empty() || trimmed[0] == '#') {
			continue;
		}
		if (StringUtil::StartsWith(trimmed, "export ")) {
			trimmed = StringUtil::Trim(trimmed.substr(7));
		}
		auto eq = trimmed.find('=');
		if (eq == std::string::npos || eq == 0) {
			spdlog::warn("{}:{}: ignoring line without KEY=VALUE", path, line_number);
			continue;
		}
		auto name = StringUtil::Trim(trimmed.substr(0, eq));
		parsed[name] = Unquote(StringUtil::Trim(trimmed.substr(eq + 1)));
	}

	std::lock_guard<std::mutex> lock(mutex_);
	for (auto &entry : parsed) {
		env_file_values_[entry.first] = std::move(entry.second);
	}
	sources_.push_back(path);
	return true;
}

bool ConfigManager::LookupEnvironment(const std::string &name, std::string &result) const {
	auto value = std::getenv(name.c_str());
	if (value && *value) {
		result = value;
		return true;
	}
	auto it = env_file_values_.find(name);
	if (it != env_file_values_.end() && !it->second.empty()) {
		result = it->second;
		return true;
	}
	return false;
}

void ConfigManager::ApplyEnvironment() {
	std::lock_guard<std::mutex> lock(mutex_);
	bool applied = false;
	for (const auto &mapping : ENV_MAPPINGS) {
		std::string value;
		if (!LookupEnvironment(mapping.variable, value)) {
			continue;
		}
		values_[mapping.path] = value;
		applied = true;
	}
	if (applied) {
		sources_.push_back("environment");
	}
}

void ConfigManager::LoadAll(const std::string &config_file, const std::string &env_file) {
	if (!config_file.empty() && !LoadJsonFile(config_file)) {
		spdlog::info("No configuration file at {}, using defaults", config_file);
	}
	if (!env_file.empty() && !LoadEnvFile(env_file)) {
		spdlog::debug("No environment file at {}", env_file);
	}
	ApplyEnvironment();
}

bool ConfigManager::Has(const std::string &path) const {
	std::lock_guard<std::mutex> lock(mutex_);
	return values_.find(path) != values_.end();
}

std::string ConfigManager::GetString(const std::string &path, const std::string &default_value) const {
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = values_.find(path);
	if (it == values_.end()) {
		return default_value;
	}
	return it->second;
}

int64_t ConfigManager::GetInt(const std::string &path, int64_t default_value) const {
	auto text = GetString(path);
	if (text.empty()) {
		return default_value;
	}
	int64_t result;
	if (StringUtil::TryParseInt(text, result)) {
		return result;
	}
	double real;
	if (StringUtil::TryParseDouble(text, real) && real > -INT64_RANGE && real < INT64_RANGE) {
		return static_cast<int64_t>(real);
	}
	spdlog::warn("Invalid integer '{}' for {}, using default {}", text, path, default_value);
	return default_value;
}

double ConfigManager::GetDouble(const std::string &path, double default_value) const {
	auto text = GetString(path);
	if (text.empty()) {
		return default_value;
	}
	double result;
	if (StringUtil::TryParseDouble(text, result)) {
		return result;
	}
	spdlog::warn("Invalid number '{}' for {}, using default {}", text, path, default_value);
	return default_value;
}

bool ConfigManager::GetBool(const std::string &path, bool default_value) const {
	auto text = GetString(path);
	if (text.empty()) {
		return default_value;
	}
	bool result;
	if (StringUtil::TryParseBool(text, result)) {
		return result;
	}
	spdlog::warn("Invalid boolean '{}' for {}, using default", text, path);
	return default_value;
}

std::chrono::milliseconds ConfigManager::GetSeconds(const std::string &path,
                                                    std::chrono::milliseconds default_value) const {
	auto seconds = GetDouble(path, static_cast<double>(default_value.count()) / 1000.0);
	if (seconds < 0) {
		spdlog::warn("Negative duration {} for {}, using default", seconds, path);
		return default_value;
	}
	if (seconds * 1000.0 >= INT64_RANGE) {
		spdlog::warn("Duration {} for {} is out of range, using default", seconds, path);
		return default_value;
	}
	return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

void ConfigManager::Set(const std::string &path, const std::string &value) {
	std::lock_guard<std::mutex> lock(mutex_);
	values_[path] = value;
}

std::string ConfigManager::Sources() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return StringUtil::Join(sources_, " -> ");
}

std::vector<std::string> ConfigManager::Validate() const {
	std::vector<std::string> warnings;

	auto weather_key = GetString("weather.api_key");
	if (weather_key.empty() || weather_key == WEATHER_KEY_PLACEHOLDER) {
		warnings.push_back("Weather API key not configured. Weather screen will show mock data.");
	} else if (GetBool("weather.mock_mode", true)) {
		warnings.push_back("Weather API key configured but mock mode is enabled.");
	}

	if (GetString("calendar.access_token").empty()) {
		warnings.push_back("Calendar access token not configured. Calendar refresh is disabled.");
	}

	auto units = GetString("weather.units", "metric");
	if (units != "metric" && units != "imperial" && units != "standard") {
		warnings.push_back("Unknown weather units '" + units + "', expected metric, imperial or standard.");
	}

	if (GetInt("app.api_update_interval", 300) < 60) {
		warnings.push_back("API update interval below 60 seconds may hit upstream rate limits.");
	}
	return warnings;
}

} // namespace kiosk
