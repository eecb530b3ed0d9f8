#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace kiosk {

//! String helpers shared by the configuration layer and the sources
struct StringUtil {
	static std::string Lower(const std::string &str);
	static std::string Upper(const std::string &str);
	static std::string Trim(const std::string &str);

	//! Split on a single character. Empty fields are kept.
	static std::vector<std::string> Split(const std::string &str, char delimiter);
	static std::string Join(const std::vector<std::string> &parts, const std::string &separator);

	static bool StartsWith(const std::string &str, const std::string &prefix);

	//! Cut to at most max_len bytes without splitting a UTF-8 sequence
	static std::string Truncate(const std::string &str, size_t max_len);

	//! Title-case every word: "light rain" -> "Light Rain"
	static std::string Title(const std::string &str);

	//! Format with thousands separators and fixed decimals: 12345.6 -> "12,345.60"
	static std::string FormatThousands(double value, int decimals);

	//! Strict integer / floating point / boolean parsing. Returns false if the whole string is not consumed.
	static bool TryParseInt(const std::string &str, int64_t &result);
	static bool TryParseDouble(const std::string &str, double &result);
	//! Accepts true/false, 1/0, yes/no, on/off (case insensitive)
	static bool TryParseBool(const std::string &str, bool &result);
};

} // namespace kiosk
