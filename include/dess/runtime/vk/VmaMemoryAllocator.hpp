#pragma once

#include "dess/runtime/vk/Allocator.hpp"
#include "dess/runtime/vk/FunctionPointers.hpp"

#include <memory>

namespace dess {
	struct MemoryAllocatorConfig {
		/// @brief Requests of at least this size get a dedicated VkDeviceMemory
		VkDeviceSize dedicated_threshold = DESS_DEFAULT_DEDICATED_THRESHOLD;
		/// @brief Size of the blocks general allocations are suballocated from
		VkDeviceSize preferred_block_size = DESS_DEFAULT_PREFERRED_BLOCK_SIZE;
		/// @brief Size of the blocks eCPUonly allocations are suballocated from
		VkDeviceSize transient_block_size = DESS_DEFAULT_TRANSIENT_BLOCK_SIZE;
	};

	struct VmaMemoryAllocatorImpl;

	/// @brief MemoryAllocator backed by VulkanMemoryAllocator
	struct VmaMemoryAllocator : MemoryAllocator {
		static Result<std::unique_ptr<VmaMemoryAllocator>, AllocateException> create(const DeviceDispatch& dispatch, const MemoryAllocatorConfig& config = {});

		~VmaMemoryAllocator();

		VmaMemoryAllocator(const VmaMemoryAllocator&) = delete;
		VmaMemoryAllocator& operator=(const VmaMemoryAllocator&) = delete;

		Result<MemoryBlock, AllocateException> allocate_memory(const MemoryRequest& request, SourceLocationAtFrame loc) override;
		void deallocate_memory(std::span<const MemoryBlock> src) override;
		void cleanup() override;

		/// @brief Number of blocks handed out and not yet returned
		size_t live_allocations() const;

	private:
		VmaMemoryAllocator(const MemoryAllocatorConfig& config);

		MemoryAllocatorConfig config;
		std::unique_ptr<VmaMemoryAllocatorImpl> impl;
	};
} // namespace dess
