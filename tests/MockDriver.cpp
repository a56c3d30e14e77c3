#include "MockDriver.hpp"

#include <algorithm>
#include <cassert>
#include <cstring>

namespace dess::test {
	MockDriver* MockDriver::current = nullptr;

	namespace {
		MockDriver& drv() {
			return *MockDriver::current;
		}

		template<class T>
		uint64_t u64(T handle) {
			return (uint64_t)handle;
		}

		constexpr VkDeviceSize heap_size = 8ull * 1024 * 1024 * 1024;
	} // namespace

	// physical device queries

	VKAPI_ATTR void VKAPI_CALL mock_vkGetPhysicalDeviceProperties(VkPhysicalDevice, VkPhysicalDeviceProperties* p) {
		*p = {};
		p->apiVersion = VK_API_VERSION_1_3;
		p->deviceType = VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU;
		std::strncpy(p->deviceName, "dess mock device", VK_MAX_PHYSICAL_DEVICE_NAME_SIZE - 1);
		p->limits.maxSamplerAnisotropy = 16.0f;
		p->limits.bufferImageGranularity = 1;
		p->limits.nonCoherentAtomSize = 64;
		p->limits.maxMemoryAllocationCount = 4096;
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkGetPhysicalDeviceFeatures(VkPhysicalDevice, VkPhysicalDeviceFeatures* f) {
		*f = {};
		f->samplerAnisotropy = drv().anisotropy_supported ? VK_TRUE : VK_FALSE;
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkGetPhysicalDeviceMemoryProperties(VkPhysicalDevice, VkPhysicalDeviceMemoryProperties* mp) {
		*mp = {};
		mp->memoryHeapCount = 1;
		mp->memoryHeaps[0].size = heap_size;
		mp->memoryHeaps[0].flags = VK_MEMORY_HEAP_DEVICE_LOCAL_BIT;
		mp->memoryTypeCount = 1;
		mp->memoryTypes[0].heapIndex = 0;
		mp->memoryTypes[0].propertyFlags = VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT | VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkGetPhysicalDeviceMemoryProperties2(VkPhysicalDevice pd, VkPhysicalDeviceMemoryProperties2* mp) {
		mock_vkGetPhysicalDeviceMemoryProperties(pd, &mp->memoryProperties);
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkGetPhysicalDeviceQueueFamilyProperties(VkPhysicalDevice, uint32_t* count, VkQueueFamilyProperties* props) {
		auto& families = drv().queue_families;
		if (!props) {
			*count = (uint32_t)families.size();
			return;
		}
		*count = std::min(*count, (uint32_t)families.size());
		for (uint32_t i = 0; i < *count; i++) {
			props[i] = families[i];
		}
	}

	// device

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkCreateDevice(VkPhysicalDevice, const VkDeviceCreateInfo* ci, const VkAllocationCallbacks*, VkDevice* device) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		if (auto res = d.injected("vkCreateDevice"); res != VK_SUCCESS) {
			return res;
		}
		d.device_queue_family = ci->pQueueCreateInfos[0].queueFamilyIndex;
		for (auto* next = (const VkBaseInStructure*)ci->pNext; next; next = next->pNext) {
			switch (next->sType) {
			case VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2:
				d.requested_sampler_anisotropy = ((const VkPhysicalDeviceFeatures2*)next)->features.samplerAnisotropy;
				break;
			case VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES:
				d.requested_vk12 = *(const VkPhysicalDeviceVulkan12Features*)next;
				break;
			case VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES:
				d.requested_vk13 = *(const VkPhysicalDeviceVulkan13Features*)next;
				break;
			default:
				break;
			}
		}
		*device = (VkDevice)d.register_handle("device");
		return VK_SUCCESS;
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkDestroyDevice(VkDevice device, const VkAllocationCallbacks*) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		d.release_handle(u64(device), "device");
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkGetDeviceQueue(VkDevice, uint32_t, uint32_t, VkQueue* queue) {
		*queue = (VkQueue)(uintptr_t)0xC0FFEE;
	}

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkDeviceWaitIdle(VkDevice) {
		auto& d = drv();
		{
			std::scoped_lock _(d.mutex);
			if (auto res = d.injected("vkDeviceWaitIdle"); res != VK_SUCCESS) {
				return res;
			}
		}
		d.signal_all_fences();
		return VK_SUCCESS;
	}

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkQueueSubmit2(VkQueue, uint32_t count, const VkSubmitInfo2* submits, VkFence fence) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		if (auto res = d.injected("vkQueueSubmit2"); res != VK_SUCCESS) {
			return res;
		}
		for (uint32_t i = 0; i < count; i++) {
			auto& si = submits[i];
			SubmitRecord record{};
			record.command_buffer = si.commandBufferInfoCount > 0 ? si.pCommandBufferInfos[0].commandBuffer : VK_NULL_HANDLE;
			record.fence = fence;
			if (si.waitSemaphoreInfoCount > 0) {
				record.wait_semaphore = si.pWaitSemaphoreInfos[0].semaphore;
				record.wait_stage = si.pWaitSemaphoreInfos[0].stageMask;
			}
			if (si.signalSemaphoreInfoCount > 0) {
				record.signal_semaphore = si.pSignalSemaphoreInfos[0].semaphore;
				record.signal_stage = si.pSignalSemaphoreInfos[0].stageMask;
			}
			d.submits.push_back(record);
		}
		if (fence != VK_NULL_HANDLE) {
			d.pending_fences.insert(u64(fence));
		}
		if (fence != VK_NULL_HANDLE && d.auto_signal) {
			if (d.signal_delay.count() == 0) {
				d.pending_fences.erase(u64(fence));
				d.fences[u64(fence)] = true;
				d.fence_cv.notify_all();
			} else {
				d.signalers.emplace_back([&d, fence, delay = d.signal_delay] {
					std::this_thread::sleep_for(delay);
					std::scoped_lock _(d.mutex);
					if (d.pending_fences.erase(u64(fence)) > 0) {
						d.fences[u64(fence)] = true;
					}
					d.fence_cv.notify_all();
				});
			}
		}
		return VK_SUCCESS;
	}

	// command pools

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkCreateCommandPool(VkDevice, const VkCommandPoolCreateInfo*, const VkAllocationCallbacks*, VkCommandPool* pool) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		if (auto res = d.injected("vkCreateCommandPool"); res != VK_SUCCESS) {
			return res;
		}
		*pool = (VkCommandPool)d.register_handle("command_pool");
		return VK_SUCCESS;
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkDestroyCommandPool(VkDevice, VkCommandPool pool, const VkAllocationCallbacks*) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		for (auto cb : d.pool_command_buffers[u64(pool)]) {
			d.release_handle(cb, "command_buffer");
		}
		d.pool_command_buffers.erase(u64(pool));
		d.release_handle(u64(pool), "command_pool");
	}

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkResetCommandPool(VkDevice, VkCommandPool, VkCommandPoolResetFlags) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		if (auto res = d.injected("vkResetCommandPool"); res != VK_SUCCESS) {
			return res;
		}
		d.command_pool_resets++;
		return VK_SUCCESS;
	}

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkAllocateCommandBuffers(VkDevice, const VkCommandBufferAllocateInfo* ai, VkCommandBuffer* cbs) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		if (auto res = d.injected("vkAllocateCommandBuffers"); res != VK_SUCCESS) {
			return res;
		}
		for (uint32_t i = 0; i < ai->commandBufferCount; i++) {
			auto handle = d.register_handle("command_buffer");
			d.pool_command_buffers[u64(ai->commandPool)].push_back(handle);
			cbs[i] = (VkCommandBuffer)handle;
		}
		return VK_SUCCESS;
	}

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkBeginCommandBuffer(VkCommandBuffer, const VkCommandBufferBeginInfo*) {
		return VK_SUCCESS;
	}

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkEndCommandBuffer(VkCommandBuffer) {
		return VK_SUCCESS;
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkCmdCopyBuffer(VkCommandBuffer, VkBuffer, VkBuffer, uint32_t, const VkBufferCopy*) {}

	// synchronization

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkCreateFence(VkDevice, const VkFenceCreateInfo* ci, const VkAllocationCallbacks*, VkFence* fence) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		if (auto res = d.injected("vkCreateFence"); res != VK_SUCCESS) {
			return res;
		}
		auto handle = d.register_handle("fence");
		d.fences[handle] = (ci->flags & VK_FENCE_CREATE_SIGNALED_BIT) != 0;
		*fence = (VkFence)handle;
		return VK_SUCCESS;
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkDestroyFence(VkDevice, VkFence fence, const VkAllocationCallbacks*) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		d.fences.erase(u64(fence));
		d.pending_fences.erase(u64(fence));
		d.release_handle(u64(fence), "fence");
	}

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkWaitForFences(VkDevice, uint32_t count, const VkFence* fences, VkBool32 wait_all, uint64_t timeout) {
		auto& d = drv();
		std::unique_lock lock(d.mutex);
		if (auto res = d.injected("vkWaitForFences"); res != VK_SUCCESS) {
			return res;
		}
		d.fence_waits++;
		auto done = [&] {
			uint32_t signaled = 0;
			for (uint32_t i = 0; i < count; i++) {
				signaled += d.fences[u64(fences[i])] ? 1 : 0;
			}
			return wait_all ? signaled == count : signaled > 0;
		};
		if (timeout == UINT64_MAX) {
			d.fence_cv.wait(lock, done);
			return VK_SUCCESS;
		}
		return d.fence_cv.wait_for(lock, std::chrono::nanoseconds(timeout), done) ? VK_SUCCESS : VK_TIMEOUT;
	}

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkResetFences(VkDevice, uint32_t count, const VkFence* fences) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		if (auto res = d.injected("vkResetFences"); res != VK_SUCCESS) {
			return res;
		}
		for (uint32_t i = 0; i < count; i++) {
			d.fences[u64(fences[i])] = false;
		}
		return VK_SUCCESS;
	}

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkCreateSemaphore(VkDevice, const VkSemaphoreCreateInfo*, const VkAllocationCallbacks*, VkSemaphore* sema) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		if (auto res = d.injected("vkCreateSemaphore"); res != VK_SUCCESS) {
			return res;
		}
		*sema = (VkSemaphore)d.register_handle("semaphore");
		return VK_SUCCESS;
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkDestroySemaphore(VkDevice, VkSemaphore sema, const VkAllocationCallbacks*) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		d.release_handle(u64(sema), "semaphore");
	}

	// samplers

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkCreateSampler(VkDevice, const VkSamplerCreateInfo* ci, const VkAllocationCallbacks*, VkSampler* sampler) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		if (auto res = d.injected("vkCreateSampler"); res != VK_SUCCESS) {
			return res;
		}
		d.sampler_infos.push_back(*ci);
		*sampler = (VkSampler)d.register_handle("sampler");
		return VK_SUCCESS;
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkDestroySampler(VkDevice, VkSampler sampler, const VkAllocationCallbacks*) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		d.release_handle(u64(sampler), "sampler");
	}

	// descriptors

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkCreateDescriptorPool(VkDevice, const VkDescriptorPoolCreateInfo* ci, const VkAllocationCallbacks*, VkDescriptorPool* pool) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		if (auto res = d.injected("vkCreateDescriptorPool"); res != VK_SUCCESS) {
			return res;
		}
		auto handle = d.register_handle("descriptor_pool");
		DescriptorPoolRecord record{ ci->maxSets, ci->flags };
		record.sizes.assign(ci->pPoolSizes, ci->pPoolSizes + ci->poolSizeCount);
		d.descriptor_pools[handle] = std::move(record);
		*pool = (VkDescriptorPool)handle;
		return VK_SUCCESS;
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkDestroyDescriptorPool(VkDevice, VkDescriptorPool pool, const VkAllocationCallbacks*) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		if (auto it = d.descriptor_pools.find(u64(pool)); it != d.descriptor_pools.end()) {
			for (auto set : it->second.sets) {
				d.release_handle(set, "descriptor_set");
			}
			d.descriptor_pools.erase(it);
		}
		d.release_handle(u64(pool), "descriptor_pool");
	}

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkAllocateDescriptorSets(VkDevice, const VkDescriptorSetAllocateInfo* ai, VkDescriptorSet* sets) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		if (auto res = d.injected("vkAllocateDescriptorSets"); res != VK_SUCCESS) {
			return res;
		}
		auto& pool = d.descriptor_pools.at(u64(ai->descriptorPool));
		if (pool.allocated + ai->descriptorSetCount > pool.max_sets) {
			return VK_ERROR_OUT_OF_POOL_MEMORY;
		}
		for (uint32_t i = 0; i < ai->descriptorSetCount; i++) {
			auto handle = d.register_handle("descriptor_set");
			pool.sets.insert(handle);
			sets[i] = (VkDescriptorSet)handle;
		}
		pool.allocated += ai->descriptorSetCount;
		return VK_SUCCESS;
	}

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkFreeDescriptorSets(VkDevice, VkDescriptorPool pool, uint32_t count, const VkDescriptorSet* sets) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		auto& record = d.descriptor_pools.at(u64(pool));
		for (uint32_t i = 0; i < count; i++) {
			if (record.sets.erase(u64(sets[i])) > 0) {
				record.allocated--;
			}
			d.release_handle(u64(sets[i]), "descriptor_set");
		}
		return VK_SUCCESS;
	}

	// buffers, images and memory

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkCreateBuffer(VkDevice, const VkBufferCreateInfo*, const VkAllocationCallbacks*, VkBuffer* buffer) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		*buffer = (VkBuffer)d.register_handle("buffer");
		return VK_SUCCESS;
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkDestroyBuffer(VkDevice, VkBuffer buffer, const VkAllocationCallbacks*) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		d.release_handle(u64(buffer), "buffer");
	}

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkCreateImage(VkDevice, const VkImageCreateInfo*, const VkAllocationCallbacks*, VkImage* image) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		*image = (VkImage)d.register_handle("image");
		return VK_SUCCESS;
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkDestroyImage(VkDevice, VkImage image, const VkAllocationCallbacks*) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		d.release_handle(u64(image), "image");
	}

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkAllocateMemory(VkDevice, const VkMemoryAllocateInfo* ai, const VkAllocationCallbacks*, VkDeviceMemory* memory) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		if (auto res = d.injected("vkAllocateMemory"); res != VK_SUCCESS) {
			return res;
		}
		if (d.live_memory + ai->allocationSize > d.memory_budget) {
			return VK_ERROR_OUT_OF_DEVICE_MEMORY;
		}
		auto handle = d.register_handle("memory");
		d.memory_sizes[handle] = ai->allocationSize;
		d.live_memory += ai->allocationSize;
		*memory = (VkDeviceMemory)handle;
		return VK_SUCCESS;
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkFreeMemory(VkDevice, VkDeviceMemory memory, const VkAllocationCallbacks*) {
		if (memory == VK_NULL_HANDLE) {
			return;
		}
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		d.live_memory -= d.memory_sizes[u64(memory)];
		d.memory_sizes.erase(u64(memory));
		d.host_backing.erase(u64(memory));
		d.release_handle(u64(memory), "memory");
	}

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkMapMemory(VkDevice, VkDeviceMemory memory, VkDeviceSize offset, VkDeviceSize, VkMemoryMapFlags, void** data) {
		auto& d = drv();
		std::scoped_lock _(d.mutex);
		if (auto res = d.injected("vkMapMemory"); res != VK_SUCCESS) {
			return res;
		}
		auto& backing = d.host_backing[u64(memory)];
		if (!backing) {
			// left uninitialized so untouched pages are never committed
			backing.reset(new std::byte[d.memory_sizes.at(u64(memory))]);
		}
		*data = backing.get() + offset;
		return VK_SUCCESS;
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkUnmapMemory(VkDevice, VkDeviceMemory) {}

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkFlushMappedMemoryRanges(VkDevice, uint32_t, const VkMappedMemoryRange*) {
		return VK_SUCCESS;
	}

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkInvalidateMappedMemoryRanges(VkDevice, uint32_t, const VkMappedMemoryRange*) {
		return VK_SUCCESS;
	}

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkBindBufferMemory(VkDevice, VkBuffer, VkDeviceMemory, VkDeviceSize) {
		return VK_SUCCESS;
	}

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkBindImageMemory(VkDevice, VkImage, VkDeviceMemory, VkDeviceSize) {
		return VK_SUCCESS;
	}

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkBindBufferMemory2(VkDevice, uint32_t, const VkBindBufferMemoryInfo*) {
		return VK_SUCCESS;
	}

	VKAPI_ATTR VkResult VKAPI_CALL mock_vkBindImageMemory2(VkDevice, uint32_t, const VkBindImageMemoryInfo*) {
		return VK_SUCCESS;
	}

	namespace {
		void fill_requirements(VkMemoryRequirements* reqs) {
			reqs->size = 4096;
			reqs->alignment = 256;
			reqs->memoryTypeBits = 1;
		}
	} // namespace

	VKAPI_ATTR void VKAPI_CALL mock_vkGetBufferMemoryRequirements(VkDevice, VkBuffer, VkMemoryRequirements* reqs) {
		fill_requirements(reqs);
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkGetImageMemoryRequirements(VkDevice, VkImage, VkMemoryRequirements* reqs) {
		fill_requirements(reqs);
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkGetBufferMemoryRequirements2(VkDevice, const VkBufferMemoryRequirementsInfo2*, VkMemoryRequirements2* reqs) {
		fill_requirements(&reqs->memoryRequirements);
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkGetImageMemoryRequirements2(VkDevice, const VkImageMemoryRequirementsInfo2*, VkMemoryRequirements2* reqs) {
		fill_requirements(&reqs->memoryRequirements);
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkGetDeviceBufferMemoryRequirements(VkDevice, const VkDeviceBufferMemoryRequirements*, VkMemoryRequirements2* reqs) {
		fill_requirements(&reqs->memoryRequirements);
	}

	VKAPI_ATTR void VKAPI_CALL mock_vkGetDeviceImageMemoryRequirements(VkDevice, const VkDeviceImageMemoryRequirements*, VkMemoryRequirements2* reqs) {
		fill_requirements(&reqs->memoryRequirements);
	}

	// loader

	VKAPI_ATTR PFN_vkVoidFunction VKAPI_CALL mock_vkGetDeviceProcAddr(VkDevice, const char* name) {
#define DESS_X(fn)                                                                                                                                             \
	if (std::strcmp(name, #fn) == 0) {                                                                                                                           \
		return (PFN_vkVoidFunction)&mock_##fn;                                                                                                                     \
	}
#define DESS_Y(fn)
#include "dess/runtime/vk/VkPFNRequired.hpp"
#undef DESS_X
#undef DESS_Y
		return nullptr;
	}

	VKAPI_ATTR PFN_vkVoidFunction VKAPI_CALL mock_vkGetInstanceProcAddr(VkInstance, const char* name) {
		if (std::strcmp(name, "vkGetDeviceProcAddr") == 0) {
			return (PFN_vkVoidFunction)&mock_vkGetDeviceProcAddr;
		}
#define DESS_X(fn)                                                                                                                                             \
	if (std::strcmp(name, #fn) == 0) {                                                                                                                           \
		return (PFN_vkVoidFunction)&mock_##fn;                                                                                                                     \
	}
#define DESS_Y(fn) DESS_X(fn)
#include "dess/runtime/vk/VkPFNRequired.hpp"
#undef DESS_X
#undef DESS_Y
		return nullptr;
	}

	MockDriver::MockDriver() {
		assert(current == nullptr && "only one MockDriver may exist at a time");
		current = this;
		VkQueueFamilyProperties transfer_only{};
		transfer_only.queueFlags = VK_QUEUE_TRANSFER_BIT;
		transfer_only.queueCount = 1;
		VkQueueFamilyProperties universal{};
		universal.queueFlags = VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT | VK_QUEUE_TRANSFER_BIT;
		universal.queueCount = 1;
		queue_families = { transfer_only, universal };
	}

	MockDriver::~MockDriver() {
		signalers.clear();
		current = nullptr;
	}

	FunctionPointers MockDriver::pointers() const {
		FunctionPointers fps;
		fps.vkGetInstanceProcAddr = &mock_vkGetInstanceProcAddr;
		fps.vkGetDeviceProcAddr = &mock_vkGetDeviceProcAddr;
#define DESS_X(name) fps.name = &mock_##name;
#define DESS_Y(name) fps.name = &mock_##name;
#include "dess/runtime/vk/VkPFNRequired.hpp"
#undef DESS_X
#undef DESS_Y
		return fps;
	}

	FunctionPointers MockDriver::loader_only_pointers() const {
		FunctionPointers fps;
		fps.vkGetInstanceProcAddr = &mock_vkGetInstanceProcAddr;
		return fps;
	}

	DeviceCreateParameters MockDriver::device_parameters() const {
		DeviceCreateParameters params;
		params.instance = (VkInstance)(uintptr_t)0x1;
		params.physical_device = (VkPhysicalDevice)(uintptr_t)0x2;
		params.pointers = pointers();
		params.allow_dynamic_loading_of_vk_function_pointers = false;
		return params;
	}

	uint64_t MockDriver::register_handle(const char* kind) {
		auto handle = next_handle++;
		live_handles.emplace(handle, kind);
		created_count[kind]++;
		return handle;
	}

	void MockDriver::release_handle(uint64_t handle, const char* kind) {
		auto it = live_handles.find(handle);
		if (it == live_handles.end() || it->second != kind) {
			double_destroys++;
			return;
		}
		live_handles.erase(it);
		destroyed_count[kind]++;
		destroy_order.push_back(handle);
	}

	VkResult MockDriver::injected(const char* function) {
		auto it = failures.find(function);
		if (it == failures.end()) {
			return VK_SUCCESS;
		}
		auto& [after, result] = it->second;
		if (after > 0) {
			after--;
			return VK_SUCCESS;
		}
		auto res = result;
		failures.erase(it);
		return res;
	}

	void MockDriver::fail(const std::string& function, VkResult result, int after) {
		std::scoped_lock _(mutex);
		failures[function] = { after, result };
	}

	void MockDriver::signal_all_fences() {
		std::scoped_lock _(mutex);
		for (auto fence : pending_fences) {
			fences[fence] = true;
		}
		pending_fences.clear();
		fence_cv.notify_all();
	}

	bool MockDriver::fence_signaled(VkFence fence) const {
		std::scoped_lock _(mutex);
		auto it = fences.find(u64(fence));
		return it != fences.end() && it->second;
	}

	int MockDriver::created(const std::string& kind) const {
		std::scoped_lock _(mutex);
		auto it = created_count.find(kind);
		return it == created_count.end() ? 0 : it->second;
	}

	int MockDriver::destroyed(const std::string& kind) const {
		std::scoped_lock _(mutex);
		auto it = destroyed_count.find(kind);
		return it == destroyed_count.end() ? 0 : it->second;
	}

	int MockDriver::live(const std::string& kind) const {
		std::scoped_lock _(mutex);
		int count = 0;
		for (auto& [handle, k] : live_handles) {
			count += k == kind ? 1 : 0;
		}
		return count;
	}

	int MockDriver::live_total() const {
		std::scoped_lock _(mutex);
		return (int)live_handles.size();
	}

	bool MockDriver::is_live(uint64_t handle) const {
		std::scoped_lock _(mutex);
		return live_handles.contains(handle);
	}
} // namespace dess::test
