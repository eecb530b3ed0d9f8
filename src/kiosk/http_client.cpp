#include "http_client.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "string_util.hpp"

#include <cctype>

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace kiosk {

//======================================================================================================================
// Helper Functions
//======================================================================================================================

// Parse URL into host and path components
static void ParseUrl(const std::string &url, std::string &proto_host_port, std::string &path) {
	auto scheme_end = url.find("://");
	if (scheme_end == std::string::npos) {
		throw NetworkException("Invalid URL: missing scheme in '" + url + "'");
	}

	auto path_start = url.find('/', scheme_end + 3);
	if (path_start == std::string::npos) {
		proto_host_port = url;
		path = "/";
	} else {
		proto_host_port = url.substr(0, path_start);
		path = url.substr(path_start);
	}
}

// Split "http://host:port" or "host:port" into host and port
static void ParseProxyHost(const std::string &proxy, std::string &host, int &port) {
	std::string rest = proxy;
	auto scheme_end = rest.find("://");
	if (scheme_end != std::string::npos) {
		rest = rest.substr(scheme_end + 3);
	}
	while (!rest.empty() && rest.back() == '/') {
		rest.pop_back();
	}
	port = 80;
	auto colon = rest.rfind(':');
	if (colon != std::string::npos) {
		int64_t parsed;
		if (StringUtil::TryParseInt(rest.substr(colon + 1), parsed) && parsed > 0 && parsed < 65536) {
			port = static_cast<int>(parsed);
			rest = rest.substr(0, colon);
		}
	}
	host = rest;
}

// Normalize HTTP header name to Title-Case
static std::string NormalizeHeaderName(const std::string &name) {
	std::string result;
	result.reserve(name.size());
	bool capitalize_next = true;
	for (char c : name) {
		if (c == '-') {
			result += c;
			capitalize_next = true;
		} else if (capitalize_next) {
			result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
			capitalize_next = false;
		} else {
			result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
		}
	}
	return result;
}

//======================================================================================================================
// HttpSettings
//======================================================================================================================

HttpSettings HttpSettings::FromConfig(const ConfigManager &config) {
	HttpSettings settings;
	auto timeout = config.GetInt("http.timeout", 10);
	settings.timeout = timeout > 0 ? static_cast<uint64_t>(timeout) : 10;
	settings.keep_alive = config.GetBool("http.keep_alive", false);
	settings.proxy = config.GetString("http.proxy");
	settings.proxy_username = config.GetString("http.proxy_username");
	settings.proxy_password = config.GetString("http.proxy_password");
	settings.user_agent = config.GetString("http.user_agent", "kiosk/1.0");
	settings.follow_redirects = config.GetBool("http.follow_redirects", true);
	settings.verify_certificates = config.GetBool("http.verify_certificates", true);
	return settings;
}

//======================================================================================================================
// HttpClient Implementation
//======================================================================================================================

HttpClient::HttpClient(HttpSettings settings) : settings_(std::move(settings)) {
}

HttpClient::~HttpClient() {
}

HttpResponseData HttpClient::ExecuteHttpRequest(const std::string &url, const std::string &method,
                                                const HttpHeaders &headers, const std::string &request_body,
                                                const std::string &content_type) {

	HttpResponseData result;

	try {
		std::string proto_host_port, path;
		ParseUrl(url, proto_host_port, path);

		httplib::Client client(proto_host_port);
		client.set_follow_location(settings_.follow_redirects);
		client.enable_server_certificate_verification(settings_.verify_certificates);

		auto timeout_sec = static_cast<time_t>(settings_.timeout);
		client.set_read_timeout(timeout_sec, 0);
		client.set_write_timeout(timeout_sec, 0);
		client.set_connection_timeout(timeout_sec, 0);
		client.set_keep_alive(settings_.keep_alive);

		if (!settings_.proxy.empty()) {
			std::string proxy_host;
			int proxy_port;
			ParseProxyHost(settings_.proxy, proxy_host, proxy_port);
			client.set_proxy(proxy_host, proxy_port);
			if (!settings_.proxy_username.empty()) {
				client.set_proxy_basic_auth(settings_.proxy_username, settings_.proxy_password);
			}
		}

		httplib::Headers req_headers;
		for (const auto &header : headers) {
			req_headers.emplace(header.first, header.second);
		}
		if (req_headers.find("User-Agent") == req_headers.end()) {
			req_headers.emplace("User-Agent", settings_.user_agent);
		}
		if (req_headers.find("Accept") == req_headers.end()) {
			req_headers.emplace("Accept", "application/json");
		}

		auto upper_method = StringUtil::Upper(method);
		httplib::Result res(nullptr, httplib::Error::Unknown);
		if (upper_method == "POST") {
			std::string ct = content_type.empty() ? "application/octet-stream" : content_type;
			res = client.Post(path, req_headers, request_body, ct);
		} else {
			res = client.Get(path, req_headers);
		}

		if (res.error() != httplib::Error::Success) {
			result.error = "HTTP request to " + proto_host_port + " failed: " + httplib::to_string(res.error());
			return result;
		}

		result.status_code = res->status;
		result.body = res->body;

		for (auto &header : res->headers) {
			auto normalized_key = NormalizeHeaderName(header.first);
			if (normalized_key == "Content-Type") {
				result.content_type = header.second;
			} else if (normalized_key == "Content-Length") {
				int64_t length;
				if (StringUtil::TryParseInt(header.second, length)) {
					result.content_length = length;
				}
			}
			result.headers[normalized_key] = header.second;
		}

	} catch (std::exception &e) {
		result.error = e.what();
	}

	return result;
}

HttpResponseData HttpClient::Get(const std::string &url, const HttpHeaders &headers) {
	return ExecuteHttpRequest(url, "GET", headers, "", "");
}

Payload HttpClient::GetJson(const std::string &url, const HttpHeaders &headers) {
	auto response = Get(url, headers);
	if (!response.error.empty()) {
		throw NetworkException(response.error);
	}
	if (response.status_code == 401 || response.status_code == 403) {
		throw NotConfiguredException("request to " + url + " was rejected with HTTP " +
		                             std::to_string(response.status_code) + " (unauthorized)");
	}
	if (response.status_code < 200 || response.status_code >= 300) {
		throw NetworkException("request to " + url + " returned HTTP " + std::to_string(response.status_code));
	}
	spdlog::trace("GET {} -> {} ({} bytes)", url, response.status_code, response.body.size());
	return Payload::FromJson(response.body);
}

std::string HttpClient::UrlEncode(const std::string &value) {
	static const char HEX[] = "0123456789ABCDEF";
	std::string result;
	result.reserve(value.size());
	for (char ch : value) {
		auto c = static_cast<unsigned char>(ch);
		if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
			result += static_cast<char>(c);
		} else {
			result += '%';
			result += HEX[c >> 4];
			result += HEX[c & 0x0F];
		}
	}
	return result;
}

std::string HttpClient::BuildUrl(const std::string &base, const QueryParams &params) {
	std::string url = base;
	char separator = base.find('?') == std::string::npos ? '?' : '&';
	for (const auto &param : params) {
		url += separator;
		url += UrlEncode(param.first) + "=" + UrlEncode(param.second);
		separator = '&';
	}
	return url;
}

} // namespace kiosk
