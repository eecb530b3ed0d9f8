#pragma once

#include <memory>
#include <string>
#include <vector>

#include "kiosk/calendar/calendar_source.hpp"
#include "kiosk/config.hpp"
#include "kiosk/crypto/crypto_source.hpp"
#include "kiosk/http_client.hpp"
#include "kiosk/scheduler.hpp"
#include "kiosk/source_manager.hpp"
#include "kiosk/weather/weather_source.hpp"

namespace kiosk {

//! Configure spdlog from app.log_level / app.debug_mode
void InitLogging(const ConfigManager &config);

//! One application instance: a shared cache, the crypto, weather and calendar sources, and the refresh scheduler.
//! Everything is built from the configuration at construction; later config changes are not picked up.
class KioskApp {
public:
	//! Uses a real HttpClient built from the http.* settings unless one is given
	explicit KioskApp(const ConfigManager &config, std::shared_ptr<HttpClient> http = nullptr);
	~KioskApp();

	KioskApp(const KioskApp &) = delete;
	KioskApp &operator=(const KioskApp &) = delete;

	void Start();
	//! Stop the scheduler, waiting at most app.shutdown_timeout. Returns false if the thread had to be abandoned.
	bool Shutdown();

	//! In registration order: crypto, weather, calendar
	std::vector<std::shared_ptr<SourceManager>> Sources() const;
	//! nullptr if no source has that key
	std::shared_ptr<SourceManager> FindSource(const std::string &key) const;

	CryptoSource &Crypto() {
		return *crypto_;
	}
	WeatherSource &Weather() {
		return *weather_;
	}
	CalendarSource &Calendar() {
		return *calendar_;
	}
	ResultCache &Cache() {
		return *cache_;
	}
	RefreshScheduler &Scheduler() {
		return *scheduler_;
	}

private:
	std::shared_ptr<HttpClient> http_;
	std::shared_ptr<ResultCache> cache_;
	std::shared_ptr<CryptoSource> crypto_;
	std::shared_ptr<WeatherSource> weather_;
	std::shared_ptr<CalendarSource> calendar_;
	std::unique_ptr<RefreshScheduler> scheduler_;
	std::chrono::milliseconds shutdown_timeout_;
};

} // namespace kiosk
