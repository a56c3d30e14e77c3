#pragma once

#include "dess/Types.hpp"

#include <vector>

namespace dess {
	struct DeviceDispatch;
	struct MemoryAllocator;
	struct DescriptorAllocator;

	/// @brief Resources whose destruction has been requested but must wait until the GPU is done with them.
	/// Not internally synchronized.
	struct DeferredReclaimList {
		void retire_image(VkImage image);
		void retire_buffer(VkBuffer buffer);
		void retire_memory(MemoryBlock block);
		void retire_descriptor_set(DescriptorSet set);

		/// @brief Destroy every held resource, leaving the list empty. Does nothing on an empty list.
		void cleanup(const DeviceDispatch& dispatch, MemoryAllocator& memory_allocator, DescriptorAllocator& descriptor_allocator);

		bool empty() const noexcept;
		size_t size() const noexcept;

		friend void swap(DeferredReclaimList& lhs, DeferredReclaimList& rhs) noexcept {
			using std::swap;
			swap(lhs.images, rhs.images);
			swap(lhs.buffers, rhs.buffers);
			swap(lhs.memory, rhs.memory);
			swap(lhs.descriptor_sets, rhs.descriptor_sets);
		}

	private:
		std::vector<VkImage> images;
		std::vector<VkBuffer> buffers;
		std::vector<MemoryBlock> memory;
		std::vector<DescriptorSet> descriptor_sets;
	};
} // namespace dess
