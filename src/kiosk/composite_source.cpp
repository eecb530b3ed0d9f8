#include "composite_source.hpp"

#include "exception.hpp"

#include <spdlog/spdlog.h>

namespace kiosk {

CompositeSource::CompositeSource(std::string key, std::shared_ptr<ResultCache> cache,
                                 std::chrono::milliseconds refresh_interval)
    : SourceManager(std::move(key), std::move(cache), refresh_interval) {
}

void CompositeSource::AddSection(std::string name, SectionWriter fetch, SectionWriter defaults) {
	if (!fetch || !defaults) {
		throw InvalidInputException("section '" + name + "' of " + Key() + " needs a fetch and a defaults writer");
	}
	Section section;
	section.name = std::move(name);
	section.fetch = std::move(fetch);
	section.defaults = std::move(defaults);
	sections_.push_back(std::move(section));
}

std::vector<std::string> CompositeSource::DegradedSections() const {
	std::lock_guard<std::mutex> lock(degraded_lock_);
	return degraded_;
}

FetchOutcome CompositeSource::FetchData() {
	if (sections_.empty()) {
		return FetchOutcome::Failure(Key() + " has no sections to fetch");
	}

	PayloadBuilder builder;
	std::vector<std::string> degraded;
	std::string last_failure;

	for (auto &section : sections_) {
		// Each section writes to scratch space so a half-written section never leaks into the payload
		PayloadBuilder scratch;
		try {
			section.fetch(scratch);
			builder.Merge(scratch);
		} catch (SourceException &e) {
			spdlog::warn("{}: section '{}' failed, using defaults: {}", Key(), section.name, e.what());
			section.defaults(builder);
			degraded.push_back(section.name);
			last_failure = e.what();
		}
	}

	{
		std::lock_guard<std::mutex> lock(degraded_lock_);
		degraded_ = degraded;
	}

	if (degraded.size() == sections_.size()) {
		return FetchOutcome::Failure("all " + std::to_string(sections_.size()) + " sections failed, last: " +
		                             last_failure);
	}

	auto names = yyjson_mut_arr(builder.Doc());
	for (const auto &name : degraded) {
		yyjson_mut_arr_append(names, builder.MakeString(name));
	}
	builder.AddValue("degraded_sections", names);
	return FetchOutcome::Success(builder.Build());
}

} // namespace kiosk
