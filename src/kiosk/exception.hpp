#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace kiosk {

enum class ExceptionType : uint8_t {
	INVALID_INPUT,
	CONFIG,
	NETWORK,
	PAYLOAD,
	NOT_CONFIGURED,
};

//! Returns the human readable name of an exception type, e.g. "Network"
std::string ExceptionTypeToString(ExceptionType type);

//! Base class of every exception thrown by the kiosk library.
//! The message is prefixed with the type name, e.g. "Network Error: timed out".
class Exception : public std::runtime_error {
public:
	Exception(ExceptionType type, const std::string &message);

	ExceptionType Type() const {
		return type_;
	}
	//! The message without the type prefix
	const std::string &RawMessage() const {
		return raw_message_;
	}

private:
	ExceptionType type_;
	std::string raw_message_;
};

//! API misuse: empty keys, duplicate registrations, null collaborators
class InvalidInputException : public Exception {
public:
	explicit InvalidInputException(const std::string &message) : Exception(ExceptionType::INVALID_INPUT, message) {
	}
};

//! Unreadable or malformed configuration file
class ConfigException : public Exception {
public:
	explicit ConfigException(const std::string &message) : Exception(ExceptionType::CONFIG, message) {
	}
};

//! A recoverable data source failure. Source managers convert these into tagged results;
//! anything that is not a SourceException is treated as a bug and propagates.
class SourceException : public Exception {
protected:
	SourceException(ExceptionType type, const std::string &message) : Exception(type, message) {
	}
};

//! Transport failure, timeout or unexpected HTTP status
class NetworkException : public SourceException {
public:
	explicit NetworkException(const std::string &message) : SourceException(ExceptionType::NETWORK, message) {
	}
};

//! Upstream returned a body that is not JSON or does not have the expected shape
class PayloadException : public SourceException {
public:
	explicit PayloadException(const std::string &message) : SourceException(ExceptionType::PAYLOAD, message) {
	}
};

//! Missing credentials or rejected authorization
class NotConfiguredException : public SourceException {
public:
	explicit NotConfiguredException(const std::string &message)
	    : SourceException(ExceptionType::NOT_CONFIGURED, message) {
	}
};

} // namespace kiosk
