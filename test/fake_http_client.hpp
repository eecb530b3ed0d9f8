#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "kiosk/http_client.hpp"

namespace kiosk {

//! HttpClient serving canned responses. A route matches a URL exactly or as a prefix (longest prefix wins);
//! unmatched URLs fail with a transport error.
class FakeHttpClient : public HttpClient {
public:
	struct Request {
		std::string url;
		HttpHeaders headers;
	};

	FakeHttpClient() : HttpClient(HttpSettings()) {
	}

	void Respond(const std::string &url_prefix, int32_t status_code, const std::string &body) {
		std::lock_guard<std::mutex> lock(mutex_);
		HttpResponseData response;
		response.status_code = status_code;
		response.content_type = "application/json";
		response.body = body;
		routes_[url_prefix] = response;
	}

	void RespondJson(const std::string &url_prefix, const std::string &body) {
		Respond(url_prefix, 200, body);
	}

	void Fail(const std::string &url_prefix, const std::string &error = "connection refused") {
		std::lock_guard<std::mutex> lock(mutex_);
		HttpResponseData response;
		response.error = error;
		routes_[url_prefix] = response;
	}

	void Clear() {
		std::lock_guard<std::mutex> lock(mutex_);
		routes_.clear();
	}

	std::vector<Request> Requests() const {
		std::lock_guard<std::mutex> lock(mutex_);
		return requests_;
	}

	size_t RequestCount(const std::string &url_prefix) const {
		std::lock_guard<std::mutex> lock(mutex_);
		size_t count = 0;
		for (auto &request : requests_) {
			if (request.url.compare(0, url_prefix.size(), url_prefix) == 0) {
				count++;
			}
		}
		return count;
	}

	HttpResponseData ExecuteHttpRequest(const std::string &url, const std::string &method,
	                                    const HttpHeaders &headers, const std::string &request_body,
	                                    const std::string &content_type) override {
		std::lock_guard<std::mutex> lock(mutex_);
		requests_.push_back(Request {url, headers});

		const HttpResponseData *match = nullptr;
		size_t match_len = 0;
		for (auto &route : routes_) {
			if (url.compare(0, route.first.size(), route.first) == 0 && route.first.size() >= match_len) {
				match = &route.second;
				match_len = route.first.size();
			}
		}
		if (!match) {
			HttpResponseData response;
			response.error = "no route for " + url;
			return response;
		}
		return *match;
	}

private:
	mutable std::mutex mutex_;
	std::map<std::string, HttpResponseData> routes_;
	std::vector<Request> requests_;
};

} // namespace kiosk
