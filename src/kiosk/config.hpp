#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace kiosk {

//! Dotted-path configuration store.
//! Values are kept as strings in a flat map ("weather.city" -> "London,UK") and converted on lookup. Later loads
//! override earlier ones: built-in defaults, then a JSON file, then a .env file, then the process environment.
class ConfigManager {
public:
	//! Starts with the built-in defaults
	ConfigManager();

	ConfigManager(const ConfigManager &) = delete;
	ConfigManager &operator=(const ConfigManager &) = delete;

	//! Load a JSON configuration file. Returns false if the file does not exist.
	//! Throws ConfigException if it exists but cannot be read or parsed.
	bool LoadJsonFile(const std::string &path);
	//! Merge a JSON document given as text. Throws ConfigException on malformed input.
	void LoadJsonString(const std::string &json);

	//! Read KEY=VALUE lines from a .env file. The values are consulted by ApplyEnvironment, after the real
	//! environment. Returns false if the file does not exist.
	bool LoadEnvFile(const std::string &path);
	//! Apply the known environment variables (WEATHER_API_KEY, API_UPDATE_INTERVAL, ...)
	void ApplyEnvironment();

	//! Convenience: defaults <- config_file <- env_file <- environment. Missing files are skipped.
	void LoadAll(const std::string &config_file, const std::string &env_file);

	bool Has(const std::string &path) const;
	std::string GetString(const std::string &path, const std::string &default_value = "") const;
	//! Typed lookups. A value that does not parse logs a warning and yields the default.
	int64_t GetInt(const std::string &path, int64_t default_value) const;
	double GetDouble(const std::string &path, double default_value) const;
	bool GetBool(const std::string &path, bool default_value) const;
	//! Value interpreted as seconds (fractions allowed)
	std::chrono::milliseconds GetSeconds(const std::string &path, std::chrono::milliseconds default_value) const;

	//! In-memory only
	void Set(const std::string &path, const std::string &value);

	//! "defaults -> config.json -> .env -> environment"
	std::string Sources() const;

	//! Human readable warnings about incomplete configuration
	std::vector<std::string> Validate() const;

private:
	void SetDefaults();
	bool LookupEnvironment(const std::string &name, std::string &result) const;

	mutable std::mutex mutex_;
	std::map<std::string, std::string> values_;
	std::map<std::string, std::string> env_file_values_;
	std::vector<std::string> sources_;
};

} // namespace kiosk
