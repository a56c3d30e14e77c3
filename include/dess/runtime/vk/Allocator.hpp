#pragma once

#include "dess/Exception.hpp"
#include "dess/Result.hpp"
#include "dess/SourceLocation.hpp"
#include "dess/Types.hpp"

#include <span>
#include <vector>

namespace dess {
	/// @brief Source of device memory blocks. Implementations need not be thread-safe, the Device serializes access.
	struct MemoryAllocator {
		virtual ~MemoryAllocator() = default;

		/// @brief Allocate a block satisfying the request
		/// @return The block, or a MemoryAllocationException carrying the request
		virtual Result<MemoryBlock, AllocateException> allocate_memory(const MemoryRequest& request, SourceLocationAtFrame loc) = 0;
		/// @brief Return blocks to the allocator. The GPU must no longer be using them.
		virtual void deallocate_memory(std::span<const MemoryBlock> src) = 0;
		/// @brief Release all backing memory. Called once at shutdown, after every block has been returned.
		virtual void cleanup() = 0;
	};

	/// @brief Source of descriptor sets. Implementations need not be thread-safe, the Device serializes access.
	struct DescriptorAllocator {
		virtual ~DescriptorAllocator() = default;

		/// @brief Allocate request.count sets of request.layout_info.layout
		/// @return The sets, or a DescriptorAllocationException carrying the request
		virtual Result<std::vector<DescriptorSet>, AllocateException> allocate_descriptor_sets(const DescriptorSetRequest& request, SourceLocationAtFrame loc) = 0;
		virtual void free_descriptor_sets(std::span<const DescriptorSet> src) = 0;
		/// @brief Destroy all pools
		virtual void cleanup() = 0;
	};
} // namespace dess
