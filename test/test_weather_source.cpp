#include <gtest/gtest.h>

#include <memory>
#include <thread>

#include "fake_http_client.hpp"
#include "kiosk/config.hpp"
#include "kiosk/weather/weather_source.hpp"

using namespace kiosk;

namespace {

const char *WEATHER_URL = "https://api.openweathermap.org/data/2.5/weather";

const char *LONDON_RESPONSE = R"({
	"weather": [{"id": 500, "main": "Rain", "description": "light rain", "icon": "10d"}],
	"main": {"temp": 11.46, "feels_like": 10.8, "pressure": 1012, "humidity": 82},
	"visibility": 10000,
	"wind": {"speed": 4.12, "deg": 250},
	"sys": {"country": "GB", "sunrise": 1714020000, "sunset": 1714072000},
	"name": "London"
})";

} // namespace

class WeatherSourceTest : public ::testing::Test {
protected:
	void SetUp() override {
		http = std::make_shared<FakeHttpClient>();
		cache = std::make_shared<ResultCache>();
	}

	std::shared_ptr<WeatherSource> MakeSource(WeatherSettings settings) {
		return std::make_shared<WeatherSource>(cache, http, std::move(settings), std::chrono::seconds(60), 42);
	}

	static WeatherSettings RealSettings() {
		WeatherSettings settings;
		settings.api_key = "abc123";
		settings.mock_mode = false;
		return settings;
	}

	std::shared_ptr<FakeHttpClient> http;
	std::shared_ptr<ResultCache> cache;
};

TEST_F(WeatherSourceTest, MockModeNeverTouchesTheNetwork) {
	auto source = MakeSource(WeatherSettings());
	auto result = source->GetData();

	EXPECT_EQ(result.status, FetchStatus::MOCK);
	EXPECT_EQ(result.payload.GetString("data_source"), "mock_data");
	EXPECT_EQ(result.payload.GetString("city"), "London");
	EXPECT_EQ(result.payload.GetString("country"), "UK");
	EXPECT_TRUE(source->IsUsingMockData());
	EXPECT_TRUE(http->Requests().empty());
}

TEST_F(WeatherSourceTest, MissingKeyMeansMockEvenWithMockModeOff) {
	auto settings = RealSettings();
	settings.api_key = "YOUR_OPENWEATHERMAP_API_KEY_HERE";
	EXPECT_FALSE(settings.HasApiKey());

	auto result = MakeSource(settings)->GetData();
	EXPECT_EQ(result.status, FetchStatus::MOCK);
	EXPECT_TRUE(http->Requests().empty());
}

TEST_F(WeatherSourceTest, MockValuesStayWithinVariation) {
	WeatherSettings settings;
	settings.mock_presets = {{"Clouds", 18.0, 65, 4.5}};
	auto source = MakeSource(settings);

	for (int i = 0; i < 20; i++) {
		auto data = source->GetData(true).payload;
		EXPECT_EQ(data.GetString("condition"), "Clouds");
		EXPECT_GE(data.GetDouble("temperature"), 16.5);
		EXPECT_LE(data.GetDouble("temperature"), 19.5);
		EXPECT_GE(data.GetInt("humidity"), 60);
		EXPECT_LE(data.GetInt("humidity"), 70);
		EXPECT_GE(data.GetDouble("wind_speed"), 4.0);
		EXPECT_LE(data.GetDouble("wind_speed"), 5.0);
		EXPECT_GE(data.GetInt("pressure"), 1010);
		EXPECT_LE(data.GetInt("pressure"), 1020);
		EXPECT_GE(data.GetDouble("visibility"), 8.0);
		EXPECT_LE(data.GetDouble("visibility"), 15.0);
		EXPECT_LT(data.GetInt("sunrise"), data.GetInt("sunset"));
	}
}

TEST_F(WeatherSourceTest, MockOverridesAndClamping) {
	WeatherSettings settings;
	settings.mock_presets = {{"Clear", 20.0, 50, 3.0}};
	settings.has_mock_temperature = true;
	settings.mock_temperature = -10;
	settings.mock_condition = "Snow";
	settings.has_mock_humidity = true;
	settings.mock_humidity = 100;
	settings.has_mock_wind_speed = true;
	settings.mock_wind_speed = 0;
	auto source = MakeSource(settings);

	for (int i = 0; i < 20; i++) {
		auto data = source->GetData(true).payload;
		EXPECT_EQ(data.GetString("condition"), "Snow");
		EXPECT_EQ(data.GetString("icon"), WeatherSource::IconFor("Snow"));
		EXPECT_LE(data.GetDouble("temperature"), -8.5);
		EXPECT_LE(data.GetInt("humidity"), 100);
		EXPECT_GE(data.GetDouble("wind_speed"), 0.0);
	}
}

TEST_F(WeatherSourceTest, MockPresetsRotate) {
	WeatherSettings settings;
	settings.mock_presets = {{"Clear", 20.0, 50, 3.0}, {"Rain", 12.0, 85, 6.0}};
	settings.mock_rotation = std::chrono::milliseconds(20);
	auto source = MakeSource(settings);

	EXPECT_EQ(source->GetData(true).payload.GetString("condition"), "Clear");
	std::this_thread::sleep_for(std::chrono::milliseconds(40));
	EXPECT_EQ(source->GetData(true).payload.GetString("condition"), "Rain");
	std::this_thread::sleep_for(std::chrono::milliseconds(40));
	EXPECT_EQ(source->GetData(true).payload.GetString("condition"), "Clear");
}

TEST_F(WeatherSourceTest, ParsesOpenWeatherMapResponse) {
	http->RespondJson(WEATHER_URL, LONDON_RESPONSE);
	auto source = MakeSource(RealSettings());

	auto result = source->GetData();
	ASSERT_EQ(result.status, FetchStatus::SUCCESS);
	auto &data = result.payload;
	EXPECT_DOUBLE_EQ(data.GetDouble("temperature"), 11.46);
	EXPECT_EQ(data.GetString("temperature_formatted"), "11.5\xC2\xB0" "C");
	EXPECT_EQ(data.GetString("condition"), "Light Rain");
	EXPECT_EQ(data.GetString("condition_code"), "Rain");
	EXPECT_EQ(data.GetInt("humidity"), 82);
	EXPECT_EQ(data.GetInt("pressure"), 1012);
	EXPECT_DOUBLE_EQ(data.GetDouble("wind_speed"), 4.12);
	EXPECT_EQ(data.GetInt("wind_direction"), 250);
	EXPECT_DOUBLE_EQ(data.GetDouble("visibility"), 10.0);
	EXPECT_EQ(data.GetString("city"), "London");
	EXPECT_EQ(data.GetString("country"), "GB");
	EXPECT_EQ(data.GetInt("sunrise"), 1714020000);
	EXPECT_EQ(data.GetString("data_source"), "openweathermap_api");
	EXPECT_FALSE(source->IsUsingMockData());

	auto requests = http->Requests();
	ASSERT_EQ(requests.size(), 1u);
	EXPECT_EQ(requests[0].url, std::string(WEATHER_URL) + "?q=London%2CUK&appid=abc123&units=metric");
}

TEST_F(WeatherSourceTest, DisplayAccessorsReadTheCurrentData) {
	http->RespondJson(WEATHER_URL, LONDON_RESPONSE);
	auto source = MakeSource(RealSettings());

	EXPECT_EQ(source->GetStatus(), FetchStatus::SUCCESS);
	EXPECT_EQ(source->GetIcon(), WeatherSource::IconFor("Rain"));
	auto wind = source->GetWindInfo();
	EXPECT_DOUBLE_EQ(wind.speed, 4.12);
	EXPECT_EQ(wind.direction, 250);
	EXPECT_EQ(wind.speed_formatted, "4.1 m/s");
	EXPECT_EQ(source->GetDataSourceInfo(), "\xF0\x9F\x8C\x90 OpenWeatherMap API");
	EXPECT_EQ(http->Requests().size(), 1u);
}

TEST_F(WeatherSourceTest, MockDisplayAccessorsUseImperialUnits) {
	WeatherSettings settings;
	settings.units = "imperial";
	settings.mock_presets = {{"Clear", 70.0, 40, 9.0}};
	auto source = MakeSource(settings);

	EXPECT_EQ(source->GetStatus(), FetchStatus::MOCK);
	EXPECT_EQ(source->GetIcon(), WeatherSource::IconFor("Clear"));
	auto wind = source->GetWindInfo();
	EXPECT_NE(wind.speed_formatted.find(" mph"), std::string::npos);
	EXPECT_EQ(source->GetDataSourceInfo(), "\xF0\x9F\xA7\xAA Mock Weather Data");
}

TEST_F(WeatherSourceTest, ApiFailureFallsBackToMock) {
	http->Respond(WEATHER_URL, 500, "oops");
	auto result = MakeSource(RealSettings())->GetData();
	EXPECT_EQ(result.status, FetchStatus::MOCK);
	EXPECT_EQ(result.payload.GetString("data_source"), "mock_data");
}

TEST_F(WeatherSourceTest, ApiFailureWithoutFallbackIsReported) {
	auto settings = RealSettings();
	settings.fallback_to_mock = false;
	auto source = MakeSource(settings);

	http->RespondJson(WEATHER_URL, R"({"cod": "404", "message": "city not found"})");
	auto result = source->GetData();
	EXPECT_EQ(result.status, FetchStatus::ERROR);
	EXPECT_NE(result.error.find("main.temp"), std::string::npos);

	http->RespondJson(WEATHER_URL, LONDON_RESPONSE);
	EXPECT_EQ(source->GetData(true).status, FetchStatus::SUCCESS);

	http->Respond(WEATHER_URL, 401, R"({"cod": 401})");
	auto stale = source->GetData(true);
	EXPECT_EQ(stale.status, FetchStatus::CACHED);
	EXPECT_DOUBLE_EQ(stale.payload.GetDouble("temperature"), 11.46);
	EXPECT_NE(stale.error.find("Not Configured"), std::string::npos);
}

TEST_F(WeatherSourceTest, FormatTemperature) {
	EXPECT_EQ(WeatherSource::FormatTemperature(21.96, "metric"), "22.0\xC2\xB0" "C");
	EXPECT_EQ(WeatherSource::FormatTemperature(71.5, "imperial"), "71.5\xC2\xB0" "F");
	EXPECT_EQ(WeatherSource::FormatTemperature(285.15, "standard"), "285.1K");
}

TEST_F(WeatherSourceTest, SettingsFromConfig) {
	ConfigManager config;
	config.Set("weather.city", "Oslo,NO");
	config.Set("weather.mock_mode", "false");
	config.Set("weather.mock_rotation", "30");
	config.Set("weather.mock_temperature", "5.5");
	auto settings = WeatherSettings::FromConfig(config);

	EXPECT_EQ(settings.city, "Oslo,NO");
	EXPECT_FALSE(settings.mock_mode);
	EXPECT_EQ(settings.mock_rotation, std::chrono::seconds(30));
	EXPECT_TRUE(settings.has_mock_temperature);
	EXPECT_DOUBLE_EQ(settings.mock_temperature, 5.5);
	EXPECT_FALSE(settings.has_mock_humidity);
	EXPECT_FALSE(settings.mock_presets.empty());
	EXPECT_FALSE(settings.HasApiKey());
}
