#include <gtest/gtest.h>

#include <memory>

#include "fake_http_client.hpp"
#include "kiosk_app.hpp"

using namespace kiosk;

TEST(KioskAppTest, BuildsSourcesFromConfig) {
	ConfigManager config;
	config.Set("weather.refresh_interval", "600");
	auto http = std::make_shared<FakeHttpClient>();
	KioskApp app(config, http);

	auto sources = app.Sources();
	ASSERT_EQ(sources.size(), 3u);
	EXPECT_EQ(sources[0]->Key(), "crypto");
	EXPECT_EQ(sources[1]->Key(), "weather");
	EXPECT_EQ(sources[2]->Key(), "calendar_events");

	EXPECT_EQ(app.FindSource("weather").get(), &app.Weather());
	EXPECT_FALSE(app.FindSource("stocks"));

	EXPECT_EQ(app.Weather().RefreshInterval(), std::chrono::seconds(600));
	EXPECT_EQ(app.Crypto().RefreshInterval(), std::chrono::seconds(300));
	EXPECT_FALSE(app.Calendar().IsEnabled());
}

TEST(KioskAppTest, OneCycleFillsTheSharedCache) {
	ConfigManager config;
	auto http = std::make_shared<FakeHttpClient>();
	http->RespondJson("https://api.coingecko.com/", R"({"bitcoin": {"usd": 50000}})");
	KioskApp app(config, http);

	app.Scheduler().RunCycle();

	// crypto (price only, the rest degraded) and mock weather; calendar is disabled without a token
	auto keys = app.Cache().Keys();
	EXPECT_EQ(keys.size(), 2u);

	auto crypto = app.Crypto().GetData();
	EXPECT_EQ(crypto.status, FetchStatus::SUCCESS);
	EXPECT_DOUBLE_EQ(crypto.payload.GetDouble("price"), 50000);
	EXPECT_EQ(app.Crypto().DegradedSections().size(), 5u);

	EXPECT_EQ(app.Weather().GetData().status, FetchStatus::MOCK);
	EXPECT_EQ(app.Calendar().GetData().status, FetchStatus::ERROR);
}

TEST(KioskAppTest, StartAndShutdown) {
	ConfigManager config;
	config.Set("app.shutdown_timeout", "2");
	auto http = std::make_shared<FakeHttpClient>();
	KioskApp app(config, http);

	app.Start();
	EXPECT_TRUE(app.Scheduler().IsRunning());
	EXPECT_TRUE(app.Shutdown());
	EXPECT_FALSE(app.Scheduler().IsRunning());
}
