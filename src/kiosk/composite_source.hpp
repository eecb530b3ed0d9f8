#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "source_manager.hpp"

namespace kiosk {

//! A source whose refresh is several independent sub-requests merged into one payload.
//!
//! Sections run in the order they were added. A section that throws a SourceException has its documented defaults
//! written instead, and its name is recorded in the payload's "degraded_sections" array; the refresh as a whole is
//! still a success. Only when every section fails is the refresh a failure (so the stale entry is served).
class CompositeSource : public SourceManager {
public:
	//! Writes a section's fields into the builder
	using SectionWriter = std::function<void(PayloadBuilder &)>;

	//! Names of the sections that fell back to defaults during the last refresh
	std::vector<std::string> DegradedSections() const;

protected:
	CompositeSource(std::string key, std::shared_ptr<ResultCache> cache, std::chrono::milliseconds refresh_interval);

	//! fetch may throw SourceException; defaults must not throw
	void AddSection(std::string name, SectionWriter fetch, SectionWriter defaults);

	FetchOutcome FetchData() override;

private:
	struct Section {
		std::string name;
		SectionWriter fetch;
		SectionWriter defaults;
	};

	std::vector<Section> sections_;

	mutable std::mutex degraded_lock_;
	std::vector<std::string> degraded_;
};

} // namespace kiosk
