#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "kiosk/http_client.hpp"
#include "kiosk/source_manager.hpp"

namespace kiosk {

class ConfigManager;

//! One entry of the mock weather rotation
struct MockWeatherPreset {
	std::string condition;
	double temperature;
	int64_t humidity;
	double wind_speed;
};

struct WeatherSettings {
	std::string endpoint = "https://api.openweathermap.org/data/2.5/weather";
	std::string api_key;
	std::string city = "London,UK";
	//! "metric", "imperial" or "standard"
	std::string units = "metric";
	//! Always serve mock data
	bool mock_mode = true;
	//! Serve mock data when the real API fails instead of reporting the failure
	bool fallback_to_mock = true;
	//! Time between switches to the next mock preset
	std::chrono::milliseconds mock_rotation {std::chrono::seconds(120)};
	std::vector<MockWeatherPreset> mock_presets;

	//! Optional overrides applied on top of the current preset
	bool has_mock_temperature = false;
	double mock_temperature = 0;
	std::string mock_condition;
	bool has_mock_humidity = false;
	int64_t mock_humidity = 0;
	bool has_mock_wind_speed = false;
	double mock_wind_speed = 0;

	//! True if an API key other than the sample placeholder is set
	bool HasApiKey() const;

	static std::vector<MockWeatherPreset> DefaultMockPresets();
	static WeatherSettings FromConfig(const ConfigManager &config);
};

struct WindInfo {
	double speed = 0;
	int64_t direction = 0;
	//! "4.1 m/s", or "9.2 mph" for imperial units
	std::string speed_formatted;
};

//! Current weather from OpenWeatherMap, or mock data tagged MOCK when no key is configured or mock mode is on
class WeatherSource : public SourceManager {
public:
	static constexpr const char *KEY = "weather";

	WeatherSource(std::shared_ptr<ResultCache> cache, std::shared_ptr<HttpClient> http, WeatherSettings settings,
	              std::chrono::milliseconds refresh_interval, uint32_t seed = std::random_device()());

	double GetTemperature();
	std::string GetFormattedTemperature();
	std::string GetCondition();
	std::string GetIcon();
	WindInfo GetWindInfo();
	bool IsUsingMockData();
	//! Human-readable label of where the current data comes from
	std::string GetDataSourceInfo();

	//! Emoji icon for an OpenWeatherMap "main" condition
	static std::string IconFor(const std::string &condition);
	//! "12.3°C", "54.1°F" or "285.5K" depending on units
	static std::string FormatTemperature(double temperature, const std::string &units);

	const WeatherSettings &Settings() const {
		return settings_;
	}

protected:
	FetchOutcome FetchData() override;

private:
	Payload FetchRealWeather();
	Payload BuildMockWeather();

	std::shared_ptr<HttpClient> http_;
	WeatherSettings settings_;

	std::mutex mock_lock_;
	size_t mock_index_;
	std::chrono::steady_clock::time_point last_mock_change_;
	std::mt19937 rng_;
};

} // namespace kiosk
