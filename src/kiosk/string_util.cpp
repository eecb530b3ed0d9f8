#include "string_util.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace kiosk {

std::string StringUtil::Lower(const std::string &str) {
	std::string result;
	result.reserve(str.size());
	for (char c : str) {
		result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	return result;
}

std::string StringUtil::Upper(const std::string &str) {
	std::string result;
	result.reserve(str.size());
	for (char c : str) {
		result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
	}
	return result;
}

std::string StringUtil::Trim(const std::string &str) {
	size_t begin = 0;
	size_t end = str.size();
	while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) {
		begin++;
	}
	while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
		end--;
	}
	return str.substr(begin, end - begin);
}

std::vector<std::string> StringUtil::Split(const std::string &str, char delimiter) {
	std::vector<std::string> result;
	size_t start = 0;
	while (true) {
		auto pos = str.find(delimiter, start);
		if (pos == std::string::npos) {
			result.push_back(str.substr(start));
			break;
		}
		result.push_back(str.substr(start, pos - start));
		start = pos + 1;
	}
	return result;
}

std::string StringUtil::Join(const std::vector<std::string> &parts, const std::string &separator) {
	std::string result;
	for (size_t i = 0; i < parts.size(); i++) {
		if (i > 0) {
			result += separator;
		}
		result += parts[i];
	}
	return result;
}

bool StringUtil::StartsWith(const std::string &str, const std::string &prefix) {
	return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

std::string StringUtil::Truncate(const std::string &str, size_t max_len) {
	if (str.size() <= max_len) {
		return str;
	}
	size_t cut = max_len;
	// back off continuation bytes (10xxxxxx)
	while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
		cut--;
	}
	return str.substr(0, cut);
}

std::string StringUtil::Title(const std::string &str) {
	std::string result;
	result.reserve(str.size());
	bool capitalize_next = true;
	for (char c : str) {
		if (std::isalpha(static_cast<unsigned char>(c))) {
			if (capitalize_next) {
				result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
			} else {
				result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
			}
			capitalize_next = false;
		} else {
			result += c;
			capitalize_next = true;
		}
	}
	return result;
}

std::string StringUtil::FormatThousands(double value, int decimals) {
	if (!std::isfinite(value)) {
		return "0";
	}
	char buffer[64];
	std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, std::fabs(value));
	std::string digits(buffer);

	auto dot = digits.find('.');
	std::string integer_part = dot == std::string::npos ? digits : digits.substr(0, dot);
	std::string fraction_part = dot == std::string::npos ? "" : digits.substr(dot);

	std::string grouped;
	int count = 0;
	for (auto it = integer_part.rbegin(); it != integer_part.rend(); ++it) {
		if (count > 0 && count % 3 == 0) {
			grouped.insert(grouped.begin(), ',');
		}
		grouped.insert(grouped.begin(), *it);
		count++;
	}
	if (value < 0) {
		grouped.insert(grouped.begin(), '-');
	}
	return grouped + fraction_part;
}

bool StringUtil::TryParseInt(const std::string &str, int64_t &result) {
	auto trimmed = Trim(str);
	if (trimmed.empty()) {
		return false;
	}
	errno = 0;
	char *end = nullptr;
	auto value = std::strtoll(trimmed.c_str(), &end, 10);
	if (errno != 0 || end == trimmed.c_str() || *end != '\0') {
		return false;
	}
	result = static_cast<int64_t>(value);
	return true;
}

bool StringUtil::TryParseDouble(const std::string &str, double &result) {
	auto trimmed = Trim(str);
	if (trimmed.empty()) {
		return false;
	}
	errno = 0;
	char *end = nullptr;
	auto value = std::strtod(trimmed.c_str(), &end);
	if (errno != 0 || end == trimmed.c_str() || *end != '\0' || !std::isfinite(value)) {
		return false;
	}
	result = value;
	return true;
}

bool StringUtil::TryParseBool(const std::string &str, bool &result) {
	auto lower = Lower(Trim(str));
	if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
		result = true;
		return true;
	}
	if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
		result = false;
		return true;
	}
	return false;
}

} // namespace kiosk
