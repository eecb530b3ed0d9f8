#include "kiosk_app.hpp"

#include "kiosk/string_util.hpp"

#include <spdlog/spdlog.h>

namespace kiosk {

void InitLogging(const ConfigManager &config) {
	auto level_name = StringUtil::Lower(config.GetString("app.log_level", "info"));
	if (level_name == "warning") {
		level_name = "warn";
	}
	auto level = spdlog::level::from_str(level_name);
	if (level == spdlog::level::off && level_name != "off") {
		spdlog::warn("Unknown log level '{}', using info", level_name);
		level = spdlog::level::info;
	}
	if (config.GetBool("app.debug_mode", false)) {
		level = spdlog::level::debug;
	}
	spdlog::set_level(level);
	spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
}

static std::chrono::milliseconds SourceInterval(const ConfigManager &config, const std::string &section,
                                                std::chrono::milliseconds fallback) {
	return config.GetSeconds(section + ".refresh_interval", fallback);
}

KioskApp::KioskApp(const ConfigManager &config, std::shared_ptr<HttpClient> http)
    : http_(std::move(http)), cache_(std::make_shared<ResultCache>()) {
	if (!http_) {
		http_ = std::make_shared<HttpClient>(HttpSettings::FromConfig(config));
	}

	auto scheduler_settings = SchedulerSettings::FromConfig(config);
	auto interval = scheduler_settings.update_interval;
	shutdown_timeout_ = config.GetSeconds("app.shutdown_timeout", std::chrono::seconds(2));

	crypto_ = std::make_shared<CryptoSource>(cache_, http_, CryptoEndpoints::FromConfig(config),
	                                         SourceInterval(config, "crypto", interval));
	weather_ = std::make_shared<WeatherSource>(cache_, http_, WeatherSettings::FromConfig(config),
	                                           SourceInterval(config, "weather", interval));
	calendar_ = std::make_shared<CalendarSource>(cache_, http_, CalendarSettings::FromConfig(config),
	                                             SourceInterval(config, "calendar", interval));

	scheduler_ = std::make_unique<RefreshScheduler>(scheduler_settings);
	scheduler_->Register(crypto_);
	scheduler_->Register(weather_);
	scheduler_->Register(calendar_);

	if (!calendar_->IsEnabled()) {
		spdlog::info("Calendar disabled: no access token configured");
	}
	if (weather_->Settings().mock_mode || !weather_->Settings().HasApiKey()) {
		spdlog::info("Weather running on mock data");
	}
}

KioskApp::~KioskApp() {
	if (scheduler_->IsRunning()) {
		Shutdown();
	}
}

void KioskApp::Start() {
	scheduler_->Start();
}

bool KioskApp::Shutdown() {
	spdlog::info("Shutting down");
	return scheduler_->Stop(shutdown_timeout_);
}

std::vector<std::shared_ptr<SourceManager>> KioskApp::Sources() const {
	return scheduler_->Sources();
}

std::shared_ptr<SourceManager> KioskApp::FindSource(const std::string &key) const {
	for (auto &source : Sources()) {
		if (source->Key() == key) {
			return source;
		}
	}
	return nullptr;
}

} // namespace kiosk
