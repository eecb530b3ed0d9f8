#include "exception.hpp"

namespace kiosk {

std::string ExceptionTypeToString(ExceptionType type) {
	switch (type) {
	case ExceptionType::INVALID_INPUT:
		return "Invalid Input";
	case ExceptionType::CONFIG:
		return "Configuration";
	case ExceptionType::NETWORK:
		return "Network";
	case ExceptionType::PAYLOAD:
		return "Malformed Payload";
	case ExceptionType::NOT_CONFIGURED:
		return "Not Configured";
	}
	return "Unknown";
}

Exception::Exception(ExceptionType type, const std::string &message)
    : std::runtime_error(ExceptionTypeToString(type) + " Error: " + message), type_(type), raw_message_(message) {
}

} // namespace kiosk
