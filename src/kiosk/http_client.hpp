#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "payload.hpp"

namespace kiosk {

class ConfigManager;

//! HTTP settings resolved once from configuration, safe to share with the refresh thread
struct HttpSettings {
	//! Connect, read and write timeout in seconds
	uint64_t timeout = 10;
	bool keep_alive = false;
	std::string proxy;
	std::string proxy_username;
	std::string proxy_password;
	std::string user_agent = "kiosk/1.0";
	bool follow_redirects = true;
	bool verify_certificates = true;

	static HttpSettings FromConfig(const ConfigManager &config);
};

using HttpHeaders = std::map<std::string, std::string>;
using QueryParams = std::vector<std::pair<std::string, std::string>>;

//! Struct to hold HTTP response
struct HttpResponseData {
	int32_t status_code = 0;
	std::string content_type;
	int64_t content_length = -1;
	//! Header names normalized to Title-Case
	HttpHeaders headers;
	std::string body;
	//! Non-empty if the request failed before a status was received
	std::string error;
};

//! Blocking HTTP client. Every request uses a fresh connection bounded by the configured timeout.
class HttpClient {
public:
	explicit HttpClient(HttpSettings settings);
	virtual ~HttpClient();

	//! Execute an HTTP request. Transport failures are reported in HttpResponseData::error, never thrown.
	virtual HttpResponseData ExecuteHttpRequest(const std::string &url, const std::string &method,
	                                            const HttpHeaders &headers, const std::string &request_body,
	                                            const std::string &content_type);

	//! Convenience: execute a GET request
	HttpResponseData Get(const std::string &url, const HttpHeaders &headers = HttpHeaders());

	//! GET and parse the body as JSON.
	//! Throws NetworkException on transport errors and non-2xx statuses, NotConfiguredException on 401/403,
	//! PayloadException when the body is not JSON.
	Payload GetJson(const std::string &url, const HttpHeaders &headers = HttpHeaders());

	const HttpSettings &Settings() const {
		return settings_;
	}

	//! Percent-encode a query component
	static std::string UrlEncode(const std::string &value);
	//! Append encoded query parameters to a base URL
	static std::string BuildUrl(const std::string &base, const QueryParams &params);

protected:
	HttpSettings settings_;
};

} // namespace kiosk
