#include "dess/runtime/vk/FrameContext.hpp"
#include "dess/runtime/vk/Allocator.hpp"
#include "dess/runtime/vk/FunctionPointers.hpp"

#include <array>
#include <initializer_list>

namespace dess {
	Result<std::unique_ptr<FrameContext>, AllocateException> FrameContext::create(const DeviceDispatch& dispatch, uint32_t queue_family_index) {
		std::unique_ptr<FrameContext> fc{ new FrameContext };
		auto fail = [&](VkResult res, const char* what) -> Result<std::unique_ptr<FrameContext>, AllocateException> {
			fc->free(dispatch);
			return { expected_error, AllocateException{ res, what } };
		};

		VkCommandPoolCreateInfo cpci{ .sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO };
		cpci.queueFamilyIndex = queue_family_index;
		if (auto res = dispatch.vkCreateCommandPool(dispatch.device, &cpci, nullptr, &fc->command_pool); res != VK_SUCCESS) {
			fc->command_pool = VK_NULL_HANDLE;
			return fail(res, "vkCreateCommandPool");
		}

		std::array<VkCommandBuffer, 2> command_buffers{};
		VkCommandBufferAllocateInfo cbai{ .sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO };
		cbai.commandPool = fc->command_pool;
		cbai.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
		cbai.commandBufferCount = (uint32_t)command_buffers.size();
		if (auto res = dispatch.vkAllocateCommandBuffers(dispatch.device, &cbai, command_buffers.data()); res != VK_SUCCESS) {
			return fail(res, "vkAllocateCommandBuffers");
		}
		fc->main_command_buffer.command_buffer = command_buffers[0];
		fc->presentation_command_buffer.command_buffer = command_buffers[1];

		VkFenceCreateInfo fci{ .sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO };
		fci.flags = VK_FENCE_CREATE_SIGNALED_BIT;
		for (auto* cb : { &fc->main_command_buffer, &fc->presentation_command_buffer }) {
			if (auto res = dispatch.vkCreateFence(dispatch.device, &fci, nullptr, &cb->fence); res != VK_SUCCESS) {
				cb->fence = VK_NULL_HANDLE;
				return fail(res, "vkCreateFence");
			}
		}

		VkSemaphoreCreateInfo sci{ .sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO };
		for (auto* sema : { &fc->swapchain_acquired, &fc->rendering_finished }) {
			if (auto res = dispatch.vkCreateSemaphore(dispatch.device, &sci, nullptr, sema); res != VK_SUCCESS) {
				*sema = VK_NULL_HANDLE;
				return fail(res, "vkCreateSemaphore");
			}
		}

		return { expected_value, std::move(fc) };
	}

	Result<void> FrameContext::wait(const DeviceDispatch& dispatch) {
		std::array<VkFence, 2> fences{};
		uint32_t count = 0;
		for (auto* cb : { &main_command_buffer, &presentation_command_buffer }) {
			if (cb->fence != VK_NULL_HANDLE) {
				fences[count++] = cb->fence;
			}
		}
		if (count == 0) {
			return { expected_value };
		}
		if (auto res = dispatch.vkWaitForFences(dispatch.device, count, fences.data(), VK_TRUE, UINT64_MAX); res != VK_SUCCESS) {
			return { expected_error, VkException{ res, "vkWaitForFences" } };
		}
		return { expected_value };
	}

	Result<void> FrameContext::reset(const DeviceDispatch& dispatch, MemoryAllocator& memory_allocator, DescriptorAllocator& descriptor_allocator) {
		if (auto res = dispatch.vkResetCommandPool(dispatch.device, command_pool, 0); res != VK_SUCCESS) {
			return { expected_error, VkException{ res, "vkResetCommandPool" } };
		}
		reclaim_list.cleanup(dispatch, memory_allocator, descriptor_allocator);
		return { expected_value };
	}

	Result<void, AllocateException> FrameContext::recreate_fence(const DeviceDispatch& dispatch, CommandBuffer& cb) {
		if (cb.fence != VK_NULL_HANDLE) {
			dispatch.vkDestroyFence(dispatch.device, cb.fence, nullptr);
			cb.fence = VK_NULL_HANDLE;
		}
		VkFenceCreateInfo fci{ .sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO };
		fci.flags = VK_FENCE_CREATE_SIGNALED_BIT;
		if (auto res = dispatch.vkCreateFence(dispatch.device, &fci, nullptr, &cb.fence); res != VK_SUCCESS) {
			cb.fence = VK_NULL_HANDLE;
			return { expected_error, AllocateException{ res, "vkCreateFence" } };
		}
		return { expected_value };
	}

	void FrameContext::free(const DeviceDispatch& dispatch) {
		// destroying the pool frees the command buffers allocated from it
		if (command_pool != VK_NULL_HANDLE) {
			dispatch.vkDestroyCommandPool(dispatch.device, command_pool, nullptr);
			command_pool = VK_NULL_HANDLE;
		}
		main_command_buffer.command_buffer = VK_NULL_HANDLE;
		presentation_command_buffer.command_buffer = VK_NULL_HANDLE;
		for (auto* cb : { &main_command_buffer, &presentation_command_buffer }) {
			if (cb->fence != VK_NULL_HANDLE) {
				dispatch.vkDestroyFence(dispatch.device, cb->fence, nullptr);
				cb->fence = VK_NULL_HANDLE;
			}
		}
		for (auto* sema : { &swapchain_acquired, &rendering_finished }) {
			if (*sema != VK_NULL_HANDLE) {
				dispatch.vkDestroySemaphore(dispatch.device, *sema, nullptr);
				*sema = VK_NULL_HANDLE;
			}
		}
	}
} // namespace dess
