#pragma once

#include "dess/Result.hpp"
#include "dess/SourceLocation.hpp"
#include "dess/Types.hpp"
#include "dess/runtime/vk/Allocator.hpp"
#include "dess/runtime/vk/DeferredReclaimList.hpp"
#include "dess/runtime/vk/FrameContext.hpp"
#include "dess/runtime/vk/FunctionPointers.hpp"
#include "dess/runtime/vk/PooledDescriptorAllocator.hpp"
#include "dess/runtime/vk/VmaMemoryAllocator.hpp"

#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <robin_hood.h>

namespace dess {
	class Device;

	/// @brief Parameters used for creating a Device
	struct DeviceCreateParameters {
		/// @brief Vulkan instance
		VkInstance instance = VK_NULL_HANDLE;
		/// @brief Vulkan physical device to create the logical device on
		VkPhysicalDevice physical_device = VK_NULL_HANDLE;
		/// @brief User provided function pointers. If you want dynamic loading, you must set vkGetInstanceProcAddr
		FunctionPointers pointers;
		bool allow_dynamic_loading_of_vk_function_pointers = true;

		MemoryAllocatorConfig memory_allocator_config;
		DescriptorAllocatorConfig descriptor_allocator_config;

		/// @brief Replaces the default VmaMemoryAllocator when set
		std::function<std::unique_ptr<MemoryAllocator>(const DeviceDispatch&)> create_memory_allocator;
		/// @brief Replaces the default PooledDescriptorAllocator when set
		std::function<std::unique_ptr<DescriptorAllocator>(const DeviceDispatch&)> create_descriptor_allocator;
	};

	/// @brief The frame slot acquired by Device::begin_frame, bundled with the queue.
	/// Must be handed back through Device::end_frame (or end()) before the next begin_frame.
	struct Frame {
		Frame() = default;
		Frame(Frame&& o) noexcept;
		Frame& operator=(Frame&& o) noexcept;

		Frame(const Frame&) = delete;
		Frame& operator=(const Frame&) = delete;

		/// @brief Submit a command buffer of this frame, see Device::submit
		Result<void> submit(CommandBuffer command_buffer,
		                    VkSemaphore signal_semaphore,
		                    VkPipelineStageFlags2 signal_stage,
		                    VkSemaphore wait_semaphore,
		                    VkPipelineStageFlags2 wait_stage);
		/// @brief End the frame, see Device::end_frame
		void end();

		/// @brief Whether this handle still refers to an open frame
		bool is_open() const noexcept {
			return device != nullptr;
		}

		FrameToken token() const noexcept {
			return frame_token;
		}

		/// @brief The accessors below are contract violations on a frame that has ended or was moved from
		CommandBuffer main_command_buffer() const;
		CommandBuffer presentation_command_buffer() const;
		VkSemaphore swapchain_acquired() const;
		VkSemaphore rendering_finished() const;

		VkQueue queue() const noexcept {
			return graphics_queue;
		}

	private:
		Frame(Device* device, FrameContext* context, FrameToken token, VkQueue queue) :
		    device(device),
		    context(context),
		    frame_token(token),
		    graphics_queue(queue) {}

		const FrameContext& open_context() const;

		Device* device = nullptr;
		FrameContext* context = nullptr;
		FrameToken frame_token = 0;
		VkQueue graphics_queue = VK_NULL_HANDLE;

		friend class Device;
	};

	/// @brief Owns the logical device and paces CPU work against a two-deep pipeline of frame slots.
	/// Destruction of retired resources is deferred until the GPU has finished the two frames that could reference them.
	class Device {
	public:
		/// @brief Create the logical device and everything it owns
		/// @return The Device, or the first setup error. No partially constructed Device is ever returned.
		static Result<std::unique_ptr<Device>> create(DeviceCreateParameters params);
		~Device();

		Device(const Device&) = delete;
		Device& operator=(const Device&) = delete;

		Device(Device&&) = delete;
		Device& operator=(Device&&) = delete;

		/// @brief Acquire the next frame slot, blocking until the GPU has finished with it.
		/// Resources retired since the previous begin_frame become owned by the returned frame.
		/// Beginning a frame while another is open throws FrameContractException.
		Result<Frame> begin_frame();
		/// @brief Release the frame and rotate the slots. Ending a frame twice throws FrameContractException.
		void end_frame(Frame&& frame);

		/// @brief Submit one command buffer to the queue
		/// @param signal_semaphore Signaled at signal_stage, may be VK_NULL_HANDLE
		/// @param wait_semaphore Waited on at wait_stage, may be VK_NULL_HANDLE
		/// @return SubmitException on queue errors
		Result<void> submit(const Frame& frame,
		                    CommandBuffer command_buffer,
		                    VkSemaphore signal_semaphore,
		                    VkPipelineStageFlags2 signal_stage,
		                    VkSemaphore wait_semaphore,
		                    VkPipelineStageFlags2 wait_stage);

		// Deferred destruction

		void retire_image(VkImage image);
		void retire_buffer(VkBuffer buffer);
		void retire_memory(MemoryBlock block);
		void retire_descriptor_set(DescriptorSet set);

		/// @brief Run a callable against the current reclaim list while holding its lock
		template<class F>
		void with_reclaim_list(F&& f) {
			std::scoped_lock _(reclaim_mutex);
			f(current_reclaim_list);
		}

		// Allocation

		Result<MemoryBlock, AllocateException> allocate_memory(const MemoryRequest& request, SourceLocationAtFrame loc = DESS_HERE_AND_NOW());
		/// @param bindless Allocate update-after-bind sets
		Result<std::vector<DescriptorSet>, AllocateException> allocate_descriptor_sets(VkDescriptorSetLayout layout,
		                                                                              const std::array<uint32_t, 12>& descriptor_counts,
		                                                                              uint32_t count,
		                                                                              bool bindless,
		                                                                              SourceLocationAtFrame loc = DESS_HERE_AND_NOW());

		/// @brief Look up one of the samplers created with the device
		/// @return std::nullopt for combinations outside {nearest, linear} x {nearest, linear} x {repeat, clamp to edge}
		std::optional<VkSampler> get_sampler(SamplerDesc desc) const;

		const DeviceDispatch& dispatch() const noexcept {
			return device_dispatch;
		}

		VkDevice device() const noexcept {
			return device_dispatch.device;
		}

		VkQueue queue() const noexcept {
			return graphics_queue;
		}

		uint32_t queue_family_index() const noexcept {
			return graphics_queue_family;
		}

		const VkPhysicalDeviceProperties& physical_device_properties() const noexcept {
			return properties;
		}

		/// @brief Number of frames begun so far
		uint64_t frame_count() const noexcept {
			return frame_counter.load();
		}

	private:
		Device() = default;

		Result<void> create_samplers();
		void teardown();

		DeviceDispatch device_dispatch;
		VkPhysicalDeviceProperties properties = {};
		bool sampler_anisotropy = false;

		VkQueue graphics_queue = VK_NULL_HANDLE;
		uint32_t graphics_queue_family = 0;
		std::mutex queue_mutex;

		// slot 0 is acquired next, slot 1 is the previous frame
		std::array<std::unique_ptr<FrameContext>, 2> frames;
		std::array<std::mutex, 2> frame_mutexes;
		std::atomic<uint64_t> frame_counter = 0;

		DeferredReclaimList current_reclaim_list;
		std::mutex reclaim_mutex;

		std::unique_ptr<MemoryAllocator> memory_allocator;
		std::mutex memory_mutex;
		std::unique_ptr<DescriptorAllocator> descriptor_allocator;
		std::mutex descriptor_mutex;

		robin_hood::unordered_flat_map<SamplerDesc, VkSampler> samplers;
	};
} // namespace dess
