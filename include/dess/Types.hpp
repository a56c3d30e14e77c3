#pragma once

#include "dess/Config.hpp"
#include "dess/Hash.hpp"

#include <array>
#include <cstdint>
#include <type_traits>

namespace dess {
	template<typename E>
	inline constexpr auto to_integral(E e) -> typename std::underlying_type<E>::type {
		return static_cast<typename std::underlying_type<E>::type>(e);
	}

	enum class MemoryUsage {
		eGPUonly = 1 /*VMA_MEMORY_USAGE_GPU_ONLY*/,
		eCPUtoGPU = 3 /*VMA_MEMORY_USAGE_CPU_TO_GPU*/,
		eCPUonly = 2 /*VMA_MEMORY_USAGE_CPU_ONLY*/,
		eGPUtoCPU = 4 /*VMA_MEMORY_USAGE_GPU_TO_CPU*/
	};

	/// @brief Parameters of a raw device memory allocation
	struct MemoryRequest {
		VkDeviceSize size = 0;
		VkDeviceSize alignment = 1;
		/// @brief Bitmask of acceptable memory types, as reported by vkGet*MemoryRequirements
		uint32_t memory_type_bits = ~0u;
		MemoryUsage usage = MemoryUsage::eGPUonly;

		bool operator==(const MemoryRequest&) const noexcept = default;
	};

	/// @brief A range of device memory handed out by a MemoryAllocator
	struct MemoryBlock {
		VkDeviceMemory device_memory = VK_NULL_HANDLE;
		VkDeviceSize offset = 0;
		VkDeviceSize size = 0;
		/// @brief Host pointer to the start of the block, if the memory is mapped
		void* mapped_ptr = nullptr;
		/// @brief Allocator-specific payload (VmaAllocation for the default allocator)
		void* allocation = nullptr;

		bool operator==(const MemoryBlock&) const noexcept = default;
	};

	enum class DescriptorType : uint8_t {
		eSampler = VK_DESCRIPTOR_TYPE_SAMPLER,
		eCombinedImageSampler = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER,
		eSampledImage = VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE,
		eStorageImage = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE,
		eUniformTexelBuffer = VK_DESCRIPTOR_TYPE_UNIFORM_TEXEL_BUFFER,
		eStorageTexelBuffer = VK_DESCRIPTOR_TYPE_STORAGE_TEXEL_BUFFER,
		eUniformBuffer = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER,
		eStorageBuffer = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER,
		eUniformBufferDynamic = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC,
		eStorageBufferDynamic = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER_DYNAMIC,
		eInputAttachment = VK_DESCRIPTOR_TYPE_INPUT_ATTACHMENT,
		eAccelerationStructureKHR = 11
	};

	inline VkDescriptorType to_vk_descriptor_type(size_t index) {
		return index == to_integral(DescriptorType::eAccelerationStructureKHR) ? VK_DESCRIPTOR_TYPE_ACCELERATION_STRUCTURE_KHR : VkDescriptorType(index);
	}

	/// @brief Number of descriptors of each type a set of a given layout consumes
	struct DescriptorSetLayoutAllocInfo {
		std::array<uint32_t, 12> descriptor_counts = {};
		VkDescriptorSetLayout layout = VK_NULL_HANDLE;

		uint32_t& operator[](DescriptorType type) {
			return descriptor_counts[to_integral(type)];
		}

		uint32_t operator[](DescriptorType type) const {
			return descriptor_counts[to_integral(type)];
		}

		bool operator==(const DescriptorSetLayoutAllocInfo& o) const noexcept {
			return layout == o.layout && descriptor_counts == o.descriptor_counts;
		}
	};

	struct DescriptorSetRequest {
		DescriptorSetLayoutAllocInfo layout_info;
		uint32_t count = 1;
		/// @brief Allocate from update-after-bind pools
		bool bindless = false;

		bool operator==(const DescriptorSetRequest&) const noexcept = default;
	};

	struct DescriptorSet {
		VkDescriptorSet descriptor_set = VK_NULL_HANDLE;
		VkDescriptorPool pool = VK_NULL_HANDLE;
		bool update_after_bind = false;

		bool operator==(const DescriptorSet&) const noexcept = default;
	};

	enum class Filter { eNearest = VK_FILTER_NEAREST, eLinear = VK_FILTER_LINEAR };

	enum class SamplerMipmapMode { eNearest = VK_SAMPLER_MIPMAP_MODE_NEAREST, eLinear = VK_SAMPLER_MIPMAP_MODE_LINEAR };

	enum class SamplerAddressMode {
		eRepeat = VK_SAMPLER_ADDRESS_MODE_REPEAT,
		eMirroredRepeat = VK_SAMPLER_ADDRESS_MODE_MIRRORED_REPEAT,
		eClampToEdge = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE,
		eClampToBorder = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_BORDER,
		eMirrorClampToEdge = VK_SAMPLER_ADDRESS_MODE_MIRROR_CLAMP_TO_EDGE
	};

	/// @brief Key of the immutable sampler cache
	struct SamplerDesc {
		Filter filter = Filter::eLinear;
		SamplerMipmapMode mipmap_mode = SamplerMipmapMode::eLinear;
		SamplerAddressMode address_mode = SamplerAddressMode::eRepeat;

		bool operator==(const SamplerDesc&) const noexcept = default;
	};

	/// @brief A primary command buffer and the fence signaled when its last submission completes
	struct CommandBuffer {
		VkCommandBuffer command_buffer = VK_NULL_HANDLE;
		VkFence fence = VK_NULL_HANDLE;
	};
} // namespace dess

namespace std {
	template<>
	struct hash<dess::SamplerDesc> {
		size_t operator()(dess::SamplerDesc const& x) const noexcept {
			size_t h = 0;
			dess::hash_combine(h, x.filter, x.mipmap_mode, x.address_mode);
			return h;
		}
	};
} // namespace std
