#pragma once

#include <cstdint>
#include <source_location>
#include <string>

namespace dess {
	using source_location = std::source_location;

	/// @brief A call site, optionally tagged with the frame it was made in
	struct SourceLocationAtFrame {
		SourceLocationAtFrame(source_location loc) : location(loc) {}
		SourceLocationAtFrame(source_location loc, uint64_t absolute_frame) : location(loc), absolute_frame(absolute_frame) {}

		source_location location;
		uint64_t absolute_frame = (uint64_t)-1LL;
	};

	std::string format_source_location(const SourceLocationAtFrame& source);
	std::string to_human_readable(uint64_t bytes);
} // namespace dess

/// @cond INTERNAL
#define DESS_HERE_AND_NOW() dess::source_location::current()
/// @endcond
