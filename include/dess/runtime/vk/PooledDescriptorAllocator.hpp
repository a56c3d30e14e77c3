#pragma once

#include "dess/runtime/vk/Allocator.hpp"
#include "dess/runtime/vk/FunctionPointers.hpp"

#include <memory>

namespace dess {
	struct DescriptorAllocatorConfig {
		/// @brief Capacity (in sets) of the first pool created for a layout shape
		uint32_t initial_sets_per_pool = DESS_DEFAULT_DESCRIPTOR_SETS_PER_POOL;
		/// @brief Pools double in capacity until they reach this many sets
		uint32_t max_sets_per_pool = DESS_MAX_DESCRIPTOR_SETS_PER_POOL;
	};

	struct PooledDescriptorAllocatorImpl;

	/// @brief DescriptorAllocator that carves sets out of growing VkDescriptorPools.
	/// Pools are shared between layouts with identical descriptor counts; bindless requests get separate update-after-bind pools.
	struct PooledDescriptorAllocator : DescriptorAllocator {
		PooledDescriptorAllocator(const DeviceDispatch& dispatch, const DescriptorAllocatorConfig& config = {});
		~PooledDescriptorAllocator();

		PooledDescriptorAllocator(const PooledDescriptorAllocator&) = delete;
		PooledDescriptorAllocator& operator=(const PooledDescriptorAllocator&) = delete;

		Result<std::vector<DescriptorSet>, AllocateException> allocate_descriptor_sets(const DescriptorSetRequest& request, SourceLocationAtFrame loc) override;
		void free_descriptor_sets(std::span<const DescriptorSet> src) override;
		void cleanup() override;

		size_t pool_count() const;
		size_t live_sets() const;

	private:
		const DeviceDispatch& dispatch;
		DescriptorAllocatorConfig config;
		std::unique_ptr<PooledDescriptorAllocatorImpl> impl;
	};
} // namespace dess
