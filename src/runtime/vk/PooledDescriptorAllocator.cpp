#include "dess/runtime/vk/PooledDescriptorAllocator.hpp"
#include "dess/Log.hpp"

#include <algorithm>
#include <limits>
#include <robin_hood.h>

namespace dess {
	/// @brief Pools are shared by every layout with the same descriptor counts
	struct PoolShape {
		std::array<uint32_t, 12> descriptor_counts;
		bool update_after_bind;

		bool operator==(const PoolShape&) const noexcept = default;
	};
} // namespace dess

namespace std {
	template<>
	struct hash<dess::PoolShape> {
		size_t operator()(dess::PoolShape const& x) const noexcept {
			size_t h = 0;
			for (auto& c : x.descriptor_counts) {
				dess::hash_combine(h, c);
			}
			dess::hash_combine(h, x.update_after_bind);
			return h;
		}
	};
} // namespace std

namespace dess {
	struct PoolEntry {
		VkDescriptorPool pool;
		uint32_t capacity;
		uint32_t allocated = 0;
		// set once the driver refused an allocation, cleared when sets are returned
		bool exhausted = false;
	};

	struct PoolBucket {
		std::vector<PoolEntry> pools;
		uint32_t next_pool_size;
	};

	struct PooledDescriptorAllocatorImpl {
		robin_hood::unordered_node_map<PoolShape, PoolBucket> buckets;
		// owning bucket and index of every pool, for freeing
		robin_hood::unordered_flat_map<VkDescriptorPool, std::pair<PoolBucket*, size_t>> pool_to_bucket;
		size_t live_sets = 0;
	};

	PooledDescriptorAllocator::PooledDescriptorAllocator(const DeviceDispatch& dispatch, const DescriptorAllocatorConfig& config) :
	    dispatch(dispatch),
	    config(config),
	    impl(new PooledDescriptorAllocatorImpl) {}

	PooledDescriptorAllocator::~PooledDescriptorAllocator() {
		cleanup();
	}

	namespace {
		/// @brief Clamp a pool capacity so that no descriptor type count overflows 32 bits
		uint32_t sets_that_fit(const std::array<uint32_t, 12>& descriptor_counts, uint64_t wanted) {
			uint64_t largest = *std::max_element(descriptor_counts.begin(), descriptor_counts.end());
			uint64_t limit = largest > 0 ? std::numeric_limits<uint32_t>::max() / largest : std::numeric_limits<uint32_t>::max();
			return (uint32_t)std::max<uint64_t>(std::min(wanted, limit), 1);
		}

		Result<VkDescriptorPool, AllocateException>
		create_pool(const DeviceDispatch& dispatch, const DescriptorSetRequest& request, uint32_t max_sets) {
			VkDescriptorPoolCreateInfo dpci{ .sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO };
			dpci.flags = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
			if (request.bindless) {
				dpci.flags |= VK_DESCRIPTOR_POOL_CREATE_UPDATE_AFTER_BIND_BIT;
			}
			dpci.maxSets = max_sets;
			std::array<VkDescriptorPoolSize, 12> descriptor_counts = {};
			uint32_t used_idx = 0;
			for (size_t i = 0; i < descriptor_counts.size(); i++) {
				if (request.layout_info.descriptor_counts[i] > 0) {
					auto& d = descriptor_counts[used_idx];
					d.type = to_vk_descriptor_type(i);
					d.descriptorCount = (uint32_t)((uint64_t)request.layout_info.descriptor_counts[i] * max_sets);
					used_idx++;
				}
			}
			dpci.pPoolSizes = descriptor_counts.data();
			dpci.poolSizeCount = used_idx;

			VkDescriptorPool pool;
			if (auto res = dispatch.vkCreateDescriptorPool(dispatch.device, &dpci, nullptr, &pool); res != VK_SUCCESS) {
				return { expected_error, DescriptorAllocationException{ res, request } };
			}
			return { expected_value, pool };
		}
	} // namespace

	Result<std::vector<DescriptorSet>, AllocateException> PooledDescriptorAllocator::allocate_descriptor_sets(const DescriptorSetRequest& request,
	                                                                                                         SourceLocationAtFrame loc) {
		std::vector<DescriptorSet> sets;
		sets.reserve(request.count);

		PoolShape shape{ request.layout_info.descriptor_counts, request.bindless };
		auto [it, inserted] = impl->buckets.try_emplace(shape);
		auto& bucket = it->second;
		if (inserted) {
			bucket.next_pool_size = sets_that_fit(shape.descriptor_counts, config.initial_sets_per_pool);
		}

		while (sets.size() < request.count) {
			auto pool_it = std::find_if(bucket.pools.begin(), bucket.pools.end(), [](const PoolEntry& pe) { return !pe.exhausted && pe.allocated < pe.capacity; });
			bool fresh_pool = false;
			if (pool_it == bucket.pools.end()) {
				auto pool = create_pool(dispatch, request, bucket.next_pool_size);
				if (!pool) {
					free_descriptor_sets(sets);
					return std::move(pool);
				}
				log_info("created descriptor pool for {} sets ({})", bucket.next_pool_size, format_source_location(loc));
				bucket.pools.push_back(PoolEntry{ .pool = *pool, .capacity = bucket.next_pool_size });
				impl->pool_to_bucket[*pool] = { &bucket, bucket.pools.size() - 1 };
				bucket.next_pool_size = sets_that_fit(shape.descriptor_counts, std::min<uint64_t>((uint64_t)bucket.next_pool_size * 2, config.max_sets_per_pool));
				pool_it = bucket.pools.end() - 1;
				fresh_pool = true;
			}

			auto& entry = *pool_it;
			uint32_t batch = std::min<uint32_t>((uint32_t)(request.count - sets.size()), entry.capacity - entry.allocated);
			std::vector<VkDescriptorSetLayout> layouts(batch, request.layout_info.layout);
			std::vector<VkDescriptorSet> allocated(batch);
			VkDescriptorSetAllocateInfo dsai{ .sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO };
			dsai.descriptorPool = entry.pool;
			dsai.descriptorSetCount = batch;
			dsai.pSetLayouts = layouts.data();
			auto res = dispatch.vkAllocateDescriptorSets(dispatch.device, &dsai, allocated.data());
			if (res == VK_SUCCESS) {
				entry.allocated += batch;
				impl->live_sets += batch;
				for (auto& ds : allocated) {
					sets.push_back(DescriptorSet{ ds, entry.pool, request.bindless });
				}
				continue;
			}

			if ((res == VK_ERROR_OUT_OF_POOL_MEMORY || res == VK_ERROR_FRAGMENTED_POOL) && !fresh_pool) {
				// this pool is spent, move on to the next one
				entry.exhausted = true;
				continue;
			}

			free_descriptor_sets(sets);
			return { expected_error, DescriptorAllocationException{ res, request } };
		}

		return { expected_value, std::move(sets) };
	}

	void PooledDescriptorAllocator::free_descriptor_sets(std::span<const DescriptorSet> src) {
		for (auto& ds : src) {
			auto it = impl->pool_to_bucket.find(ds.pool);
			if (it == impl->pool_to_bucket.end()) {
				log_error("descriptor set returned to a pool not owned by this allocator");
				continue;
			}
			auto& [bucket, index] = it->second;
			auto& entry = bucket->pools[index];
			if (auto res = dispatch.vkFreeDescriptorSets(dispatch.device, ds.pool, 1, &ds.descriptor_set); res != VK_SUCCESS) {
				log_error("vkFreeDescriptorSets failed: {}", vk_result_message(res));
			}
			entry.allocated--;
			entry.exhausted = false;
			impl->live_sets--;
		}
	}

	void PooledDescriptorAllocator::cleanup() {
		for (auto& [shape, bucket] : impl->buckets) {
			for (auto& entry : bucket.pools) {
				if (entry.allocated > 0) {
					log_warn("destroying descriptor pool with {} live sets", entry.allocated);
				}
				dispatch.vkDestroyDescriptorPool(dispatch.device, entry.pool, nullptr);
			}
		}
		impl->buckets.clear();
		impl->pool_to_bucket.clear();
		impl->live_sets = 0;
	}

	size_t PooledDescriptorAllocator::pool_count() const {
		return impl->pool_to_bucket.size();
	}

	size_t PooledDescriptorAllocator::live_sets() const {
		return impl->live_sets;
	}
} // namespace dess
