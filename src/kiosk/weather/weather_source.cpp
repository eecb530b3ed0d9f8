#include "weather_source.hpp"

#include "kiosk/config.hpp"
#include "kiosk/exception.hpp"
#include "kiosk/string_util.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>

#include <spdlog/spdlog.h>

namespace kiosk {

constexpr const char *WeatherSource::KEY;

static const char *API_KEY_PLACEHOLDER = "YOUR_OPENWEATHERMAP_API_KEY_HERE";

//======================================================================================================================
// WeatherSettings
//======================================================================================================================

bool WeatherSettings::HasApiKey() const {
	return !api_key.empty() && api_key != API_KEY_PLACEHOLDER;
}

std::vector<MockWeatherPreset> WeatherSettings::DefaultMockPresets() {
	return {
	    {"Clear", 22.5, 45, 3.2},
	    {"Clouds", 17.8, 65, 4.5},
	    {"Rain", 13.2, 86, 6.1},
	    {"Drizzle", 14.6, 80, 3.8},
	    {"Thunderstorm", 19.4, 90, 8.7},
	    {"Snow", -1.5, 88, 2.4},
	    {"Mist", 9.1, 95, 1.2},
	};
}

WeatherSettings WeatherSettings::FromConfig(const ConfigManager &config) {
	WeatherSettings settings;
	settings.endpoint = config.GetString("weather.endpoint", settings.endpoint);
	settings.api_key = config.GetString("weather.api_key");
	settings.city = config.GetString("weather.city", settings.city);
	settings.units = config.GetString("weather.units", settings.units);
	settings.mock_mode = config.GetBool("weather.mock_mode", settings.mock_mode);
	settings.fallback_to_mock = config.GetBool("weather.fallback_to_mock", settings.fallback_to_mock);
	settings.mock_rotation = config.GetSeconds("weather.mock_rotation", settings.mock_rotation);
	settings.mock_presets = DefaultMockPresets();

	if (config.Has("weather.mock_temperature")) {
		settings.has_mock_temperature = true;
		settings.mock_temperature = config.GetDouble("weather.mock_temperature", 0);
	}
	settings.mock_condition = config.GetString("weather.mock_condition");
	if (config.Has("weather.mock_humidity")) {
		settings.has_mock_humidity = true;
		settings.mock_humidity = config.GetInt("weather.mock_humidity", 0);
	}
	if (config.Has("weather.mock_wind_speed")) {
		settings.has_mock_wind_speed = true;
		settings.mock_wind_speed = config.GetDouble("weather.mock_wind_speed", 0);
	}
	return settings;
}

//======================================================================================================================
// WeatherSource
//======================================================================================================================

WeatherSource::WeatherSource(std::shared_ptr<ResultCache> cache, std::shared_ptr<HttpClient> http,
                             WeatherSettings settings, std::chrono::milliseconds refresh_interval, uint32_t seed)
    : SourceManager(KEY, std::move(cache), refresh_interval), http_(std::move(http)), settings_(std::move(settings)),
      mock_index_(0), last_mock_change_(std::chrono::steady_clock::now()), rng_(seed) {
	if (!http_) {
		throw InvalidInputException("weather source needs an HTTP client");
	}
	if (settings_.mock_presets.empty()) {
		settings_.mock_presets = WeatherSettings::DefaultMockPresets();
	}
}

FetchOutcome WeatherSource::FetchData() {
	if (settings_.mock_mode || !settings_.HasApiKey()) {
		return FetchOutcome::Mock(BuildMockWeather());
	}
	try {
		return FetchOutcome::Success(FetchRealWeather());
	} catch (SourceException &e) {
		if (!settings_.fallback_to_mock) {
			throw;
		}
		spdlog::warn("Weather API failed, using mock data: {}", e.what());
		return FetchOutcome::Mock(BuildMockWeather());
	}
}

Payload WeatherSource::FetchRealWeather() {
	auto url = HttpClient::BuildUrl(settings_.endpoint,
	                                {{"q", settings_.city}, {"appid", settings_.api_key}, {"units", settings_.units}});
	auto doc = http_->GetJson(url);

	auto temp_val = doc.Get("main.temp");
	auto main_val = doc.Get("weather.0.main");
	if (!yyjson_is_num(temp_val) || !yyjson_is_str(main_val)) {
		throw PayloadException("weather response is missing main.temp or weather[0].main");
	}

	auto temperature = doc.GetDouble("main.temp");
	auto condition_code = doc.GetString("weather.0.main");

	PayloadBuilder out;
	out.AddDouble("temperature", temperature);
	out.AddString("temperature_formatted", FormatTemperature(temperature, settings_.units));
	out.AddString("condition", StringUtil::Title(doc.GetString("weather.0.description", condition_code)));
	out.AddString("condition_code", condition_code);
	out.AddInt("humidity", doc.GetInt("main.humidity", 0));
	out.AddInt("pressure", doc.GetInt("main.pressure", 0));
	out.AddDouble("wind_speed", doc.GetDouble("wind.speed", 0));
	out.AddInt("wind_direction", doc.GetInt("wind.deg", 0));
	out.AddDouble("visibility", doc.GetDouble("visibility", 0) / 1000.0);
	out.AddString("icon", IconFor(condition_code));
	out.AddString("units", settings_.units);
	out.AddString("city", doc.GetString("name"));
	out.AddString("country", doc.GetString("sys.country"));
	out.AddInt("sunrise", doc.GetInt("sys.sunrise", 0));
	out.AddInt("sunset", doc.GetInt("sys.sunset", 0));
	out.AddString("data_source", "openweathermap_api");
	return out.Build();
}

Payload WeatherSource::BuildMockWeather() {
	std::lock_guard<std::mutex> lock(mock_lock_);

	auto now = std::chrono::steady_clock::now();
	if (now - last_mock_change_ > settings_.mock_rotation) {
		mock_index_ = (mock_index_ + 1) % settings_.mock_presets.size();
		last_mock_change_ = now;
	}
	const auto &preset = settings_.mock_presets[mock_index_];

	auto temperature = settings_.has_mock_temperature ? settings_.mock_temperature : preset.temperature;
	auto condition = settings_.mock_condition.empty() ? preset.condition : settings_.mock_condition;
	auto humidity = settings_.has_mock_humidity ? settings_.mock_humidity : preset.humidity;
	auto wind_speed = settings_.has_mock_wind_speed ? settings_.mock_wind_speed : preset.wind_speed;

	std::uniform_real_distribution<double> temp_variation(-1.5, 1.5);
	std::uniform_int_distribution<int64_t> humidity_variation(-5, 5);
	std::uniform_real_distribution<double> wind_variation(-0.5, 0.5);
	std::uniform_int_distribution<int64_t> pressure(1010, 1020);
	std::uniform_int_distribution<int64_t> wind_direction(0, 360);
	std::uniform_real_distribution<double> visibility(8.0, 15.0);

	auto final_temp = temperature + temp_variation(rng_);
	auto final_humidity = std::max<int64_t>(0, std::min<int64_t>(100, humidity + humidity_variation(rng_)));
	auto final_wind = std::max(0.0, wind_speed + wind_variation(rng_));

	auto city_parts = StringUtil::Split(settings_.city, ',');
	auto wall_now = static_cast<int64_t>(std::time(nullptr));

	PayloadBuilder out;
	out.AddDouble("temperature", final_temp);
	out.AddString("temperature_formatted", FormatTemperature(final_temp, settings_.units));
	out.AddString("condition", condition);
	out.AddString("condition_code", condition);
	out.AddInt("humidity", final_humidity);
	out.AddInt("pressure", pressure(rng_));
	out.AddDouble("wind_speed", final_wind);
	out.AddInt("wind_direction", wind_direction(rng_));
	out.AddDouble("visibility", visibility(rng_));
	out.AddString("icon", IconFor(condition));
	out.AddString("units", settings_.units);
	out.AddString("city", StringUtil::Trim(city_parts[0]));
	out.AddString("country", city_parts.size() > 1 ? StringUtil::Trim(city_parts[1]) : "XX");
	out.AddInt("sunrise", wall_now - 3600);
	out.AddInt("sunset", wall_now + 7200);
	out.AddString("data_source", "mock_data");
	return out.Build();
}

double WeatherSource::GetTemperature() {
	return GetData().payload.GetDouble("temperature", 0);
}

std::string WeatherSource::GetFormattedTemperature() {
	return GetData().payload.GetString("temperature_formatted", FormatTemperature(0, settings_.units));
}

std::string WeatherSource::GetCondition() {
	return GetData().payload.GetString("condition", "Unknown");
}

std::string WeatherSource::GetIcon() {
	return GetData().payload.GetString("icon", "\xF0\x9F\x8C\xA4\xEF\xB8\x8F");
}

WindInfo WeatherSource::GetWindInfo() {
	auto data = GetData().payload;
	WindInfo wind;
	wind.speed = data.GetDouble("wind_speed", 0);
	wind.direction = data.GetInt("wind_direction", 0);
	auto unit = data.GetString("units", settings_.units) == "imperial" ? "mph" : "m/s";
	char buffer[32];
	std::snprintf(buffer, sizeof(buffer), "%.1f %s", wind.speed, unit);
	wind.speed_formatted = buffer;
	return wind;
}

bool WeatherSource::IsUsingMockData() {
	return GetData().payload.GetString("data_source") == "mock_data";
}

std::string WeatherSource::GetDataSourceInfo() {
	if (IsUsingMockData()) {
		return "\xF0\x9F\xA7\xAA Mock Weather Data";
	}
	return "\xF0\x9F\x8C\x90 OpenWeatherMap API";
}

std::string WeatherSource::IconFor(const std::string &condition) {
	if (condition == "Clear") {
		return "\xE2\x98\x80\xEF\xB8\x8F";
	}
	if (condition == "Clouds") {
		return "\xE2\x98\x81\xEF\xB8\x8F";
	}
	if (condition == "Rain") {
		return "\xF0\x9F\x8C\xA7\xEF\xB8\x8F";
	}
	if (condition == "Drizzle") {
		return "\xF0\x9F\x8C\xA6\xEF\xB8\x8F";
	}
	if (condition == "Thunderstorm") {
		return "\xE2\x9B\x88\xEF\xB8\x8F";
	}
	if (condition == "Snow") {
		return "\xE2\x9D\x84\xEF\xB8\x8F";
	}
	if (condition == "Mist" || condition == "Fog") {
		return "\xF0\x9F\x8C\xAB\xEF\xB8\x8F";
	}
	// sun behind small cloud
	return "\xF0\x9F\x8C\xA4\xEF\xB8\x8F";
}

std::string WeatherSource::FormatTemperature(double temperature, const std::string &units) {
	char buffer[32];
	if (units == "imperial") {
		std::snprintf(buffer, sizeof(buffer), "%.1f\xC2\xB0" "F", temperature);
	} else if (units == "standard") {
		std::snprintf(buffer, sizeof(buffer), "%.1fK", temperature);
	} else {
		std::snprintf(buffer, sizeof(buffer), "%.1f\xC2\xB0" "C", temperature);
	}
	return buffer;
}

} // namespace kiosk
