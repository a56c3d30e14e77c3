#include "dess/Exception.hpp"
#include "dess/SourceLocation.hpp"

#include <fmt/format.h>

namespace dess {
	std::string format_source_location(const SourceLocationAtFrame& source) {
		auto& loc = source.location;
		if (source.absolute_frame != (uint64_t)-1LL) {
			return fmt::format("{}({}:{}): {}@{}", loc.file_name(), loc.line(), loc.column(), loc.function_name(), source.absolute_frame);
		}
		return fmt::format("{}({}:{}): {}", loc.file_name(), loc.line(), loc.column(), loc.function_name());
	}

	std::string to_human_readable(uint64_t in) {
		/*       k       M      G */
		if (in >= 1024 * 1024 * 1024) {
			return fmt::format("{} GiB", in / (1024 * 1024 * 1024));
		} else if (in >= 1024 * 1024) {
			return fmt::format("{} MiB", in / (1024 * 1024));
		} else if (in >= 1024) {
			return fmt::format("{} kiB", in / 1024);
		} else {
			return fmt::format("{} B", in);
		}
	}

	namespace {
		const char* to_string(MemoryUsage usage) {
			switch (usage) {
			case MemoryUsage::eGPUonly:
				return "GPU only";
			case MemoryUsage::eCPUtoGPU:
				return "CPU to GPU";
			case MemoryUsage::eCPUonly:
				return "CPU only";
			case MemoryUsage::eGPUtoCPU:
				return "GPU to CPU";
			}
			DESS_UNREACHABLE("unknown MemoryUsage");
			return "";
		}
	} // namespace

	MemoryAllocationException::MemoryAllocationException(VkResult res, MemoryRequest request) :
	    AllocateException(res,
	                      fmt::format("Failed to allocate {} ({} bytes, alignment {}, memory types {:#x}, {})",
	                                  to_human_readable(request.size),
	                                  request.size,
	                                  request.alignment,
	                                  request.memory_type_bits,
	                                  to_string(request.usage))),
	    request(request) {}

	DescriptorAllocationException::DescriptorAllocationException(VkResult res, DescriptorSetRequest request) :
	    AllocateException(res,
	                      fmt::format("Failed to allocate {} {}descriptor set(s) of layout {}",
	                                  request.count,
	                                  request.bindless ? "update-after-bind " : "",
	                                  fmt::ptr((const void*)request.layout_info.layout))),
	    request(request) {}
} // namespace dess
