#include "dess/runtime/vk/VmaMemoryAllocator.hpp"
#include "dess/Log.hpp"

#define VMA_IMPLEMENTATION
#define VMA_STATIC_VULKAN_FUNCTIONS  0
#define VMA_DYNAMIC_VULKAN_FUNCTIONS 0
#include <vk_mem_alloc.h>

namespace dess {
	struct VmaMemoryAllocatorImpl {
		VmaAllocator allocator = VK_NULL_HANDLE;
		// suballocates eCPUonly (staging) requests from small blocks
		VmaPool transient_pool = VK_NULL_HANDLE;
		uint32_t transient_memory_type = ~0u;
		size_t live_allocations = 0;
	};

	VmaMemoryAllocator::VmaMemoryAllocator(const MemoryAllocatorConfig& config) : config(config), impl(new VmaMemoryAllocatorImpl) {}

	Result<std::unique_ptr<VmaMemoryAllocator>, AllocateException> VmaMemoryAllocator::create(const DeviceDispatch& dispatch, const MemoryAllocatorConfig& config) {
		std::unique_ptr<VmaMemoryAllocator> ma{ new VmaMemoryAllocator(config) };

		VmaVulkanFunctions vulkanFunctions = {};
		vulkanFunctions.vkGetInstanceProcAddr = dispatch.vkGetInstanceProcAddr;
		vulkanFunctions.vkGetDeviceProcAddr = dispatch.vkGetDeviceProcAddr;
		vulkanFunctions.vkGetPhysicalDeviceProperties = dispatch.vkGetPhysicalDeviceProperties;
		vulkanFunctions.vkGetPhysicalDeviceMemoryProperties = dispatch.vkGetPhysicalDeviceMemoryProperties;
		vulkanFunctions.vkAllocateMemory = dispatch.vkAllocateMemory;
		vulkanFunctions.vkFreeMemory = dispatch.vkFreeMemory;
		vulkanFunctions.vkMapMemory = dispatch.vkMapMemory;
		vulkanFunctions.vkUnmapMemory = dispatch.vkUnmapMemory;
		vulkanFunctions.vkFlushMappedMemoryRanges = dispatch.vkFlushMappedMemoryRanges;
		vulkanFunctions.vkInvalidateMappedMemoryRanges = dispatch.vkInvalidateMappedMemoryRanges;
		vulkanFunctions.vkBindBufferMemory = dispatch.vkBindBufferMemory;
		vulkanFunctions.vkBindImageMemory = dispatch.vkBindImageMemory;
		vulkanFunctions.vkGetBufferMemoryRequirements = dispatch.vkGetBufferMemoryRequirements;
		vulkanFunctions.vkGetImageMemoryRequirements = dispatch.vkGetImageMemoryRequirements;
		vulkanFunctions.vkCreateBuffer = dispatch.vkCreateBuffer;
		vulkanFunctions.vkDestroyBuffer = dispatch.vkDestroyBuffer;
		vulkanFunctions.vkCreateImage = dispatch.vkCreateImage;
		vulkanFunctions.vkDestroyImage = dispatch.vkDestroyImage;
		vulkanFunctions.vkCmdCopyBuffer = dispatch.vkCmdCopyBuffer;
		vulkanFunctions.vkGetBufferMemoryRequirements2KHR = dispatch.vkGetBufferMemoryRequirements2;
		vulkanFunctions.vkGetImageMemoryRequirements2KHR = dispatch.vkGetImageMemoryRequirements2;
		vulkanFunctions.vkBindBufferMemory2KHR = dispatch.vkBindBufferMemory2;
		vulkanFunctions.vkBindImageMemory2KHR = dispatch.vkBindImageMemory2;
		vulkanFunctions.vkGetPhysicalDeviceMemoryProperties2KHR = dispatch.vkGetPhysicalDeviceMemoryProperties2;
		vulkanFunctions.vkGetDeviceBufferMemoryRequirements = dispatch.vkGetDeviceBufferMemoryRequirements;
		vulkanFunctions.vkGetDeviceImageMemoryRequirements = dispatch.vkGetDeviceImageMemoryRequirements;

		VmaAllocatorCreateInfo allocatorInfo = {};
		allocatorInfo.instance = dispatch.instance;
		allocatorInfo.physicalDevice = dispatch.physical_device;
		allocatorInfo.device = dispatch.device;
		allocatorInfo.vulkanApiVersion = VK_API_VERSION_1_3;
		allocatorInfo.preferredLargeHeapBlockSize = config.preferred_block_size;
		// the Device serializes all calls into the allocator
		allocatorInfo.flags = VMA_ALLOCATOR_CREATE_EXTERNALLY_SYNCHRONIZED_BIT | VMA_ALLOCATOR_CREATE_BUFFER_DEVICE_ADDRESS_BIT;
		allocatorInfo.pVulkanFunctions = &vulkanFunctions;

		if (auto res = vmaCreateAllocator(&allocatorInfo, &ma->impl->allocator); res != VK_SUCCESS) {
			ma->impl->allocator = VK_NULL_HANDLE;
			return { expected_error, AllocateException{ res, "vmaCreateAllocator" } };
		}

		VmaAllocationCreateInfo staging_aci = {};
		staging_aci.usage = VMA_MEMORY_USAGE_CPU_ONLY;
		if (vmaFindMemoryTypeIndex(ma->impl->allocator, ~0u, &staging_aci, &ma->impl->transient_memory_type) == VK_SUCCESS) {
			VmaPoolCreateInfo pci = {};
			pci.memoryTypeIndex = ma->impl->transient_memory_type;
			pci.blockSize = config.transient_block_size;
			if (auto res = vmaCreatePool(ma->impl->allocator, &pci, &ma->impl->transient_pool); res != VK_SUCCESS) {
				return { expected_error, AllocateException{ res, "vmaCreatePool" } };
			}
		} else {
			log_warn("no host-visible memory type for transient allocations, staging memory will come from the default pools");
		}

		return { expected_value, std::move(ma) };
	}

	VmaMemoryAllocator::~VmaMemoryAllocator() {
		cleanup();
	}

	Result<MemoryBlock, AllocateException> VmaMemoryAllocator::allocate_memory(const MemoryRequest& request, SourceLocationAtFrame loc) {
		assert(impl->allocator != VK_NULL_HANDLE && "allocate_memory after cleanup");
		VkMemoryRequirements requirements{ request.size, request.alignment, request.memory_type_bits };

		VmaAllocationCreateInfo aci = {};
		aci.usage = VmaMemoryUsage(to_integral(request.usage));
		if (request.usage != MemoryUsage::eGPUonly) {
			aci.flags |= VMA_ALLOCATION_CREATE_MAPPED_BIT;
		}
		if (request.size >= config.dedicated_threshold) {
			aci.flags |= VMA_ALLOCATION_CREATE_DEDICATED_MEMORY_BIT;
		} else if (request.usage == MemoryUsage::eCPUonly && impl->transient_pool && request.size <= config.transient_block_size &&
		           (request.memory_type_bits & (1u << impl->transient_memory_type))) {
			aci.pool = impl->transient_pool;
		}

		VmaAllocation allocation;
		VmaAllocationInfo allocation_info;
		auto res = vmaAllocateMemory(impl->allocator, &requirements, &aci, &allocation, &allocation_info);
		if (res != VK_SUCCESS) {
			return { expected_error, MemoryAllocationException{ res, request } };
		}
		vmaSetAllocationName(impl->allocator, allocation, format_source_location(loc).c_str());
		impl->live_allocations++;

		return { expected_value,
			       MemoryBlock{ .device_memory = allocation_info.deviceMemory,
			                    .offset = allocation_info.offset,
			                    .size = allocation_info.size,
			                    .mapped_ptr = allocation_info.pMappedData,
			                    .allocation = allocation } };
	}

	void VmaMemoryAllocator::deallocate_memory(std::span<const MemoryBlock> src) {
		for (auto& v : src) {
			if (v.allocation) {
				vmaFreeMemory(impl->allocator, static_cast<VmaAllocation>(v.allocation));
				impl->live_allocations--;
			}
		}
	}

	void VmaMemoryAllocator::cleanup() {
		if (impl->allocator == VK_NULL_HANDLE) {
			return;
		}
		if (impl->live_allocations > 0) {
			log_warn("destroying memory allocator with {} live allocations", impl->live_allocations);
		}
		if (impl->transient_pool) {
			vmaDestroyPool(impl->allocator, impl->transient_pool);
			impl->transient_pool = VK_NULL_HANDLE;
		}
		vmaDestroyAllocator(impl->allocator);
		impl->allocator = VK_NULL_HANDLE;
	}

	size_t VmaMemoryAllocator::live_allocations() const {
		return impl->live_allocations;
	}
} // namespace dess
