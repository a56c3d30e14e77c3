#include "dess/runtime/vk/DeferredReclaimList.hpp"
#include "dess/runtime/vk/Allocator.hpp"
#include "dess/runtime/vk/FunctionPointers.hpp"

namespace dess {
	void DeferredReclaimList::retire_image(VkImage image) {
		images.push_back(image);
	}

	void DeferredReclaimList::retire_buffer(VkBuffer buffer) {
		buffers.push_back(buffer);
	}

	void DeferredReclaimList::retire_memory(MemoryBlock block) {
		memory.push_back(block);
	}

	void DeferredReclaimList::retire_descriptor_set(DescriptorSet set) {
		descriptor_sets.push_back(set);
	}

	void DeferredReclaimList::cleanup(const DeviceDispatch& dispatch, MemoryAllocator& memory_allocator, DescriptorAllocator& descriptor_allocator) {
		for (auto& image : images) {
			dispatch.vkDestroyImage(dispatch.device, image, nullptr);
		}
		images.clear();
		for (auto& buffer : buffers) {
			dispatch.vkDestroyBuffer(dispatch.device, buffer, nullptr);
		}
		buffers.clear();
		// objects first, the memory may still be bound to them
		if (!memory.empty()) {
			memory_allocator.deallocate_memory(memory);
			memory.clear();
		}
		if (!descriptor_sets.empty()) {
			descriptor_allocator.free_descriptor_sets(descriptor_sets);
			descriptor_sets.clear();
		}
	}

	bool DeferredReclaimList::empty() const noexcept {
		return images.empty() && buffers.empty() && memory.empty() && descriptor_sets.empty();
	}

	size_t DeferredReclaimList::size() const noexcept {
		return images.size() + buffers.size() + memory.size() + descriptor_sets.size();
	}
} // namespace dess
