#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "kiosk/exception.hpp"
#include "kiosk_app.hpp"

static std::atomic<bool> stop_signal {false};

static void SignalHandler(int) {
	stop_signal = true;
}

static void PrintUsage(const char *program) {
	std::cerr << "usage: " << program << " [--config FILE] [--env FILE] [--once]" << std::endl;
}

struct Arguments {
	std::string config_file = "config.json";
	std::string env_file = ".env";
	bool once = false;
};

static bool ParseArguments(int argc, char *argv[], Arguments &args) {
	for (int i = 1; i < argc; i++) {
		std::string arg = argv[i];
		if (arg == "--once") {
			args.once = true;
		} else if ((arg == "--config" || arg == "--env") && i + 1 < argc) {
			(arg == "--config" ? args.config_file : args.env_file) = argv[++i];
		} else {
			return false;
		}
	}
	return true;
}

static void LogStatus(kiosk::KioskApp &app) {
	for (auto &source : app.Sources()) {
		if (!source->IsEnabled()) {
			continue;
		}
		auto result = source->GetData(false);
		auto info = source->GetCacheInfo();
		spdlog::info("{}: {} (age {} s){}", source->Key(), kiosk::FetchStatusToString(result.status),
		             info.age.count() / 1000, result.error.empty() ? "" : " - " + result.error);
	}
}

static int Run(const Arguments &args) {
	kiosk::ConfigManager config;
	config.LoadAll(args.config_file, args.env_file);
	kiosk::InitLogging(config);

	spdlog::info("Configuration: {}", config.Sources());
	for (auto &warning : config.Validate()) {
		spdlog::warn("{}", warning);
	}

	kiosk::KioskApp app(config);

	if (args.once) {
		app.Scheduler().RunCycle();
		for (auto &source : app.Sources()) {
			std::cout << "\"" << source->Key() << "\": " << source->GetData(false).ToJson() << std::endl;
		}
		return 0;
	}

	std::signal(SIGINT, SignalHandler);
	std::signal(SIGTERM, SignalHandler);

	app.Start();
	auto status_interval = config.GetSeconds("app.status_interval", std::chrono::seconds(5));
	auto next_status = std::chrono::steady_clock::now();
	while (!stop_signal) {
		auto now = std::chrono::steady_clock::now();
		if (now >= next_status) {
			LogStatus(app);
			next_status = now + status_interval;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(100));
	}

	return app.Shutdown() ? 0 : 1;
}

int main(int argc, char *argv[]) {
	Arguments args;
	if (!ParseArguments(argc, argv, args)) {
		PrintUsage(argv[0]);
		return 2;
	}
	try {
		return Run(args);
	} catch (kiosk::Exception &e) {
		spdlog::critical("{}", e.what());
		return 1;
	}
}
