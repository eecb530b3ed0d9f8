#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <yyjson.h>

namespace kiosk {

//! Immutable structured value backed by a yyjson document.
//! Copies share the underlying document; nothing mutates it after construction, so a Payload can be read from
//! any number of threads at once.
class Payload {
public:
	//! An empty payload (no document, no fields)
	Payload();

	//! Parse a JSON text. Throws PayloadException if the text is not valid JSON.
	static Payload FromJson(const std::string &json);
	//! Take ownership of an already parsed document
	static Payload Adopt(yyjson_doc *doc);

	bool Empty() const;

	//! Root value, or nullptr for an empty payload
	yyjson_val *Root() const;

	//! Lookup by dotted path, e.g. "main.temp" or "blocks.0.height". Returns nullptr if absent.
	yyjson_val *Get(const std::string &path) const;
	bool Has(const std::string &path) const;

	//! Typed lookups; the default is returned when the path is absent or has another type.
	//! GetDouble accepts any JSON number, GetInt accepts integers and truncates reals.
	double GetDouble(const std::string &path, double default_value = 0) const;
	int64_t GetInt(const std::string &path, int64_t default_value = 0) const;
	std::string GetString(const std::string &path, const std::string &default_value = "") const;
	bool GetBool(const std::string &path, bool default_value = false) const;

	//! Serialize to compact JSON. An empty payload serializes to "{}".
	std::string ToJson() const;

	bool operator==(const Payload &other) const;
	bool operator!=(const Payload &other) const {
		return !(*this == other);
	}

private:
	explicit Payload(std::shared_ptr<yyjson_doc> doc);

	std::shared_ptr<yyjson_doc> doc_;
};

//! Mutable builder producing a Payload with an object root
class PayloadBuilder {
public:
	PayloadBuilder();

	PayloadBuilder(const PayloadBuilder &) = delete;
	PayloadBuilder &operator=(const PayloadBuilder &) = delete;
	PayloadBuilder(PayloadBuilder &&) = default;
	PayloadBuilder &operator=(PayloadBuilder &&) = default;

	//! Raw access for arrays and nested objects. Values must be created in Doc().
	yyjson_mut_doc *Doc() const {
		return doc_.get();
	}
	yyjson_mut_val *Root() const {
		return root_;
	}

	//! Add or replace a top level field. Keys and string values are copied.
	void AddDouble(const std::string &key, double value);
	void AddInt(const std::string &key, int64_t value);
	void AddString(const std::string &key, const std::string &value);
	void AddBool(const std::string &key, bool value);
	void AddValue(const std::string &key, yyjson_mut_val *value);

	//! Make a string value owned by this builder's document
	yyjson_mut_val *MakeString(const std::string &value) const;

	//! Copy every top level field of other into this builder, replacing existing keys
	void Merge(const PayloadBuilder &other);

	bool Has(const std::string &key) const;
	size_t Size() const;

	//! Snapshot the current contents into an immutable Payload. The builder stays usable.
	Payload Build() const;

private:
	struct DocDeleter {
		void operator()(yyjson_mut_doc *doc) const {
			yyjson_mut_doc_free(doc);
		}
	};

	std::unique_ptr<yyjson_mut_doc, DocDeleter> doc_;
	yyjson_mut_val *root_;
};

} // namespace kiosk
