#pragma once

#include "dess/Result.hpp"
#include "dess/Types.hpp"
#include "dess/runtime/vk/DeferredReclaimList.hpp"

#include <memory>

namespace dess {
	struct DeviceDispatch;
	struct MemoryAllocator;
	struct DescriptorAllocator;

	/// @brief Identifies the open frame that owns a frame slot
	using FrameToken = uint64_t;

	enum class SlotState { eIdle, eOwned };

	/// @brief Command recording and synchronization resources of one in-flight frame slot.
	/// Both fences are created signaled, so the first wait on a fresh context returns immediately.
	struct FrameContext {
		/// @brief Create the pool, command buffers, fences and semaphores. Partially created objects are destroyed on failure.
		static Result<std::unique_ptr<FrameContext>, AllocateException> create(const DeviceDispatch& dispatch, uint32_t queue_family_index);

		/// @brief Block until both command buffer fences are signaled. A null fence is not waited on.
		Result<void> wait(const DeviceDispatch& dispatch);
		/// @brief Reset the command pool and destroy everything retired into this slot.
		/// The caller must have waited on the fences.
		Result<void> reset(const DeviceDispatch& dispatch, MemoryAllocator& memory_allocator, DescriptorAllocator& descriptor_allocator);
		/// @brief Replace the fence of cb with a new signaled one. On failure cb.fence is left null.
		Result<void, AllocateException> recreate_fence(const DeviceDispatch& dispatch, CommandBuffer& cb);
		/// @brief Destroy all owned Vulkan objects
		void free(const DeviceDispatch& dispatch);

		VkCommandPool command_pool = VK_NULL_HANDLE;
		CommandBuffer main_command_buffer;
		CommandBuffer presentation_command_buffer;
		VkSemaphore swapchain_acquired = VK_NULL_HANDLE;
		VkSemaphore rendering_finished = VK_NULL_HANDLE;

		DeferredReclaimList reclaim_list;

		SlotState state = SlotState::eIdle;
		FrameToken owner = 0;

		bool is_owned_by(FrameToken token) const noexcept {
			return state == SlotState::eOwned && owner == token;
		}
	};
} // namespace dess
