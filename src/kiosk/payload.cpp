#include "payload.hpp"

#include "exception.hpp"
#include "string_util.hpp"

#include <cstdlib>

namespace kiosk {

//======================================================================================================================
// Helpers
//======================================================================================================================

static std::shared_ptr<yyjson_doc> WrapDocument(yyjson_doc *doc) {
	return std::shared_ptr<yyjson_doc>(doc, [](yyjson_doc *ptr) { yyjson_doc_free(ptr); });
}

// Parse a non-negative array index; anything else is treated as an object key
static bool TryParseIndex(const std::string &segment, size_t &index) {
	if (segment.empty()) {
		return false;
	}
	size_t result = 0;
	for (char c : segment) {
		if (c < '0' || c > '9') {
			return false;
		}
		result = result * 10 + static_cast<size_t>(c - '0');
	}
	index = result;
	return true;
}

//======================================================================================================================
// Payload
//======================================================================================================================

Payload::Payload() {
}

Payload::Payload(std::shared_ptr<yyjson_doc> doc) : doc_(std::move(doc)) {
}

Payload Payload::FromJson(const std::string &json) {
	yyjson_read_err err;
	auto doc = yyjson_read_opts(const_cast<char *>(json.c_str()), json.size(), YYJSON_READ_NOFLAG, nullptr, &err);
	if (!doc) {
		throw PayloadException("invalid JSON at offset " + std::to_string(err.pos) + ": " +
		                       (err.msg ? err.msg : "unknown error"));
	}
	return Payload(WrapDocument(doc));
}

Payload Payload::Adopt(yyjson_doc *doc) {
	if (!doc) {
		return Payload();
	}
	return Payload(WrapDocument(doc));
}

bool Payload::Empty() const {
	return !doc_;
}

yyjson_val *Payload::Root() const {
	if (!doc_) {
		return nullptr;
	}
	return yyjson_doc_get_root(doc_.get());
}

yyjson_val *Payload::Get(const std::string &path) const {
	auto current = Root();
	if (!current || path.empty()) {
		return current;
	}
	for (const auto &segment : StringUtil::Split(path, '.')) {
		if (!current) {
			return nullptr;
		}
		size_t index;
		if (yyjson_is_arr(current) && TryParseIndex(segment, index)) {
			current = yyjson_arr_get(current, index);
		} else if (yyjson_is_obj(current)) {
			current = yyjson_obj_get(current, segment.c_str());
		} else {
			return nullptr;
		}
	}
	return current;
}

bool Payload::Has(const std::string &path) const {
	return Get(path) != nullptr;
}

double Payload::GetDouble(const std::string &path, double default_value) const {
	auto val = Get(path);
	if (yyjson_is_real(val)) {
		return yyjson_get_real(val);
	}
	if (yyjson_is_uint(val)) {
		return static_cast<double>(yyjson_get_uint(val));
	}
	if (yyjson_is_sint(val)) {
		return static_cast<double>(yyjson_get_sint(val));
	}
	return default_value;
}

int64_t Payload::GetInt(const std::string &path, int64_t default_value) const {
	auto val = Get(path);
	if (yyjson_is_uint(val)) {
		return static_cast<int64_t>(yyjson_get_uint(val));
	}
	if (yyjson_is_sint(val)) {
		return yyjson_get_sint(val);
	}
	if (yyjson_is_real(val)) {
		return static_cast<int64_t>(yyjson_get_real(val));
	}
	return default_value;
}

std::string Payload::GetString(const std::string &path, const std::string &default_value) const {
	auto val = Get(path);
	if (yyjson_is_str(val)) {
		return std::string(yyjson_get_str(val), yyjson_get_len(val));
	}
	return default_value;
}

bool Payload::GetBool(const std::string &path, bool default_value) const {
	auto val = Get(path);
	if (yyjson_is_bool(val)) {
		return yyjson_get_bool(val);
	}
	return default_value;
}

std::string Payload::ToJson() const {
	if (!doc_) {
		return "{}";
	}
	size_t len = 0;
	auto json = yyjson_write(doc_.get(), YYJSON_WRITE_NOFLAG, &len);
	if (!json) {
		return "{}";
	}
	std::string result(json, len);
	free(json);
	return result;
}

bool Payload::operator==(const Payload &other) const {
	if (doc_ == other.doc_) {
		return true;
	}
	return ToJson() == other.ToJson();
}

//======================================================================================================================
// PayloadBuilder
//======================================================================================================================

PayloadBuilder::PayloadBuilder() : doc_(yyjson_mut_doc_new(nullptr)) {
	root_ = yyjson_mut_obj(doc_.get());
	yyjson_mut_doc_set_root(doc_.get(), root_);
}

yyjson_mut_val *PayloadBuilder::MakeString(const std::string &value) const {
	return yyjson_mut_strncpy(doc_.get(), value.c_str(), value.size());
}

void PayloadBuilder::AddValue(const std::string &key, yyjson_mut_val *value) {
	yyjson_mut_obj_put(root_, MakeString(key), value);
}

void PayloadBuilder::AddDouble(const std::string &key, double value) {
	AddValue(key, yyjson_mut_real(doc_.get(), value));
}

void PayloadBuilder::AddInt(const std::string &key, int64_t value) {
	AddValue(key, yyjson_mut_sint(doc_.get(), value));
}

void PayloadBuilder::AddString(const std::string &key, const std::string &value) {
	AddValue(key, MakeString(value));
}

void PayloadBuilder::AddBool(const std::string &key, bool value) {
	AddValue(key, yyjson_mut_bool(doc_.get(), value));
}

void PayloadBuilder::Merge(const PayloadBuilder &other) {
	size_t idx, max;
	yyjson_mut_val *key, *val;
	yyjson_mut_obj_foreach(other.root_, idx, max, key, val) {
		yyjson_mut_obj_put(root_, yyjson_mut_val_mut_copy(doc_.get(), key),
		                   yyjson_mut_val_mut_copy(doc_.get(), val));
	}
}

bool PayloadBuilder::Has(const std::string &key) const {
	return yyjson_mut_obj_get(root_, key.c_str()) != nullptr;
}

size_t PayloadBuilder::Size() const {
	return yyjson_mut_obj_size(root_);
}

Payload PayloadBuilder::Build() const {
	return Payload::Adopt(yyjson_mut_doc_imut_copy(doc_.get(), nullptr));
}

} // namespace kiosk
