#include "dess/runtime/vk/Device.hpp"
#include "dess/Log.hpp"

#include <algorithm>
#include <cstdlib>
#include <utility>
#include <vector>

namespace dess {
	namespace {
		[[noreturn]] void frame_contract_violation(const char* message) {
#if DESS_USE_EXCEPTIONS
			throw FrameContractException{ message };
#else
			log_error("{}", message);
			std::abort();
#endif
		}

		constexpr VkQueueFlags required_queue_flags = VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT;
	} // namespace

	Frame::Frame(Frame&& o) noexcept :
	    device(std::exchange(o.device, nullptr)),
	    context(std::exchange(o.context, nullptr)),
	    frame_token(o.frame_token),
	    graphics_queue(o.graphics_queue) {}

	Frame& Frame::operator=(Frame&& o) noexcept {
		device = std::exchange(o.device, nullptr);
		context = std::exchange(o.context, nullptr);
		frame_token = o.frame_token;
		graphics_queue = o.graphics_queue;
		return *this;
	}

	const FrameContext& Frame::open_context() const {
		if (!context) {
			frame_contract_violation("frame resources accessed after the frame has ended");
		}
		return *context;
	}

	CommandBuffer Frame::main_command_buffer() const {
		return open_context().main_command_buffer;
	}

	CommandBuffer Frame::presentation_command_buffer() const {
		return open_context().presentation_command_buffer;
	}

	VkSemaphore Frame::swapchain_acquired() const {
		return open_context().swapchain_acquired;
	}

	VkSemaphore Frame::rendering_finished() const {
		return open_context().rendering_finished;
	}

	Result<void> Frame::submit(CommandBuffer command_buffer,
	                           VkSemaphore signal_semaphore,
	                           VkPipelineStageFlags2 signal_stage,
	                           VkSemaphore wait_semaphore,
	                           VkPipelineStageFlags2 wait_stage) {
		if (!device) {
			frame_contract_violation("submit called on a frame that has already ended");
		}
		return device->submit(*this, command_buffer, signal_semaphore, signal_stage, wait_semaphore, wait_stage);
	}

	void Frame::end() {
		if (!device) {
			frame_contract_violation("frame ended twice");
		}
		device->end_frame(std::move(*this));
	}

	Result<std::unique_ptr<Device>> Device::create(DeviceCreateParameters params) {
		auto& fps = params.pointers;
		DESS_DO_OR_RETURN(fps.load_instance_pfns(params.instance, params.allow_dynamic_loading_of_vk_function_pointers));

		uint32_t family_count = 0;
		fps.vkGetPhysicalDeviceQueueFamilyProperties(params.physical_device, &family_count, nullptr);
		std::vector<VkQueueFamilyProperties> families(family_count);
		fps.vkGetPhysicalDeviceQueueFamilyProperties(params.physical_device, &family_count, families.data());
		auto family_it =
		    std::find_if(families.begin(), families.end(), [](const VkQueueFamilyProperties& qfp) { return (qfp.queueFlags & required_queue_flags) == required_queue_flags; });
		if (family_it == families.end()) {
			return { expected_error, NoSuitableQueueException{ "No queue family supports both graphics and compute." } };
		}
		uint32_t queue_family = (uint32_t)std::distance(families.begin(), family_it);

		VkPhysicalDeviceFeatures supported_features = {};
		fps.vkGetPhysicalDeviceFeatures(params.physical_device, &supported_features);

		VkPhysicalDeviceVulkan13Features vk13features{ .sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES };
		vk13features.synchronization2 = VK_TRUE;
		vk13features.dynamicRendering = VK_TRUE;
		vk13features.maintenance4 = VK_TRUE;
		VkPhysicalDeviceVulkan12Features vk12features{ .sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES, .pNext = &vk13features };
		vk12features.bufferDeviceAddress = VK_TRUE;
		vk12features.descriptorIndexing = VK_TRUE;
		vk12features.runtimeDescriptorArray = VK_TRUE;
		vk12features.descriptorBindingSampledImageUpdateAfterBind = VK_TRUE;
		vk12features.descriptorBindingStorageBufferUpdateAfterBind = VK_TRUE;
		vk12features.shaderSampledImageArrayNonUniformIndexing = VK_TRUE;
		vk12features.shaderStorageBufferArrayNonUniformIndexing = VK_TRUE;
		VkPhysicalDeviceFeatures2 features{ .sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2, .pNext = &vk12features };
		features.features.samplerAnisotropy = supported_features.samplerAnisotropy;

		float priority = 1.0f;
		VkDeviceQueueCreateInfo qci{ .sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO, .queueFamilyIndex = queue_family, .queueCount = 1, .pQueuePriorities = &priority };
		VkDeviceCreateInfo dci{ .sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO, .pNext = &features, .queueCreateInfoCount = 1, .pQueueCreateInfos = &qci };

		VkDevice vk_device;
		if (auto res = fps.vkCreateDevice(params.physical_device, &dci, nullptr, &vk_device); res != VK_SUCCESS) {
			return { expected_error, VkException{ res, "vkCreateDevice" } };
		}

		if (auto res = fps.load_device_pfns(params.instance, vk_device, params.allow_dynamic_loading_of_vk_function_pointers); !res) {
			if (fps.vkDestroyDevice) {
				fps.vkDestroyDevice(vk_device, nullptr);
			} else {
				log_error("vkDestroyDevice could not be loaded, the VkDevice is leaked");
			}
			return std::move(res);
		}

		// from here on, failures unwind through ~Device
		std::unique_ptr<Device> device{ new Device };
		static_cast<FunctionPointers&>(device->device_dispatch) = fps;
		device->device_dispatch.instance = params.instance;
		device->device_dispatch.physical_device = params.physical_device;
		device->device_dispatch.device = vk_device;
		auto& dispatch = device->device_dispatch;

		fps.vkGetPhysicalDeviceProperties(params.physical_device, &device->properties);
		device->sampler_anisotropy = supported_features.samplerAnisotropy == VK_TRUE;
		device->graphics_queue_family = queue_family;
		dispatch.vkGetDeviceQueue(vk_device, queue_family, 0, &device->graphics_queue);
		log_info("created device on {} (queue family {})", device->properties.deviceName, queue_family);

		for (auto& frame : device->frames) {
			auto fc = FrameContext::create(dispatch, queue_family);
			if (!fc) {
				return std::move(fc);
			}
			frame = std::move(*fc);
		}

		if (params.create_memory_allocator) {
			device->memory_allocator = params.create_memory_allocator(dispatch);
		} else {
			auto ma = VmaMemoryAllocator::create(dispatch, params.memory_allocator_config);
			if (!ma) {
				return std::move(ma);
			}
			device->memory_allocator = std::move(*ma);
		}
		if (params.create_descriptor_allocator) {
			device->descriptor_allocator = params.create_descriptor_allocator(dispatch);
		} else {
			device->descriptor_allocator = std::make_unique<PooledDescriptorAllocator>(dispatch, params.descriptor_allocator_config);
		}
		if (!device->memory_allocator || !device->descriptor_allocator) {
			return { expected_error, AllocateException{ VK_ERROR_INITIALIZATION_FAILED, "allocator factory returned nothing" } };
		}

		DESS_DO_OR_RETURN(device->create_samplers());

		return { expected_value, std::move(device) };
	}

	Result<void> Device::create_samplers() {
		for (auto filter : { Filter::eNearest, Filter::eLinear }) {
			for (auto mipmap_mode : { SamplerMipmapMode::eNearest, SamplerMipmapMode::eLinear }) {
				for (auto address_mode : { SamplerAddressMode::eRepeat, SamplerAddressMode::eClampToEdge }) {
					VkSamplerCreateInfo sci{ .sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO };
					sci.magFilter = (VkFilter)filter;
					sci.minFilter = (VkFilter)filter;
					sci.mipmapMode = (VkSamplerMipmapMode)mipmap_mode;
					sci.addressModeU = (VkSamplerAddressMode)address_mode;
					sci.addressModeV = (VkSamplerAddressMode)address_mode;
					sci.addressModeW = (VkSamplerAddressMode)address_mode;
					sci.anisotropyEnable = filter == Filter::eLinear && sampler_anisotropy;
					sci.maxAnisotropy = sci.anisotropyEnable ? std::min(DESS_MAX_SAMPLER_ANISOTROPY, properties.limits.maxSamplerAnisotropy) : 1.0f;
					sci.minLod = 0.0f;
					sci.maxLod = VK_LOD_CLAMP_NONE;

					VkSampler sampler;
					if (auto res = device_dispatch.vkCreateSampler(device_dispatch.device, &sci, nullptr, &sampler); res != VK_SUCCESS) {
						return { expected_error, AllocateException{ res, "vkCreateSampler" } };
					}
					samplers.emplace(SamplerDesc{ filter, mipmap_mode, address_mode }, sampler);
				}
			}
		}
		return { expected_value };
	}

	Device::~Device() {
		teardown();
	}

	void Device::teardown() {
		if (device_dispatch.device == VK_NULL_HANDLE) {
			return;
		}
		auto& d = device_dispatch;
		if (auto res = d.vkDeviceWaitIdle(d.device); res != VK_SUCCESS) {
			log_error("vkDeviceWaitIdle failed during device teardown: {}", vk_result_message(res));
		}

		{
			std::scoped_lock _(frame_mutexes[0], frame_mutexes[1], memory_mutex, descriptor_mutex, reclaim_mutex);
			// allocators are only missing if construction failed, in which case nothing was ever retired
			bool can_reclaim = memory_allocator && descriptor_allocator;
			if (can_reclaim) {
				current_reclaim_list.cleanup(d, *memory_allocator, *descriptor_allocator);
			}
			for (auto& frame : frames) {
				if (!frame) {
					continue;
				}
				if (frame->state == SlotState::eOwned) {
					log_warn("device destroyed while frame {} is still open", frame->owner);
				}
				if (auto res = frame->wait(d); !res) {
					log_error("{}", res.error().what());
				}
				if (can_reclaim) {
					if (auto res = frame->reset(d, *memory_allocator, *descriptor_allocator); !res) {
						log_error("{}", res.error().what());
						frame->reclaim_list.cleanup(d, *memory_allocator, *descriptor_allocator);
					}
				}
				frame->free(d);
				frame.reset();
			}

			for (auto& [desc, sampler] : samplers) {
				d.vkDestroySampler(d.device, sampler, nullptr);
			}
			samplers.clear();

			// allocators outlive every cleanup that returns blocks or sets to them
			if (descriptor_allocator) {
				descriptor_allocator->cleanup();
				descriptor_allocator.reset();
			}
			if (memory_allocator) {
				memory_allocator->cleanup();
				memory_allocator.reset();
			}
		}

		d.vkDestroyDevice(d.device, nullptr);
		d.device = VK_NULL_HANDLE;
	}

	Result<Frame> Device::begin_frame() {
		std::unique_lock slot_lock(frame_mutexes[0]);
		auto& frame = *frames[0];
		if (frame.state != SlotState::eIdle) {
			frame_contract_violation("begin_frame called while a frame is still open, end_frame was never called for it");
		}

		// slot 0 was last submitted two frames ago, this should rarely block
		DESS_DO_OR_RETURN(frame.wait(device_dispatch));
		{
			std::scoped_lock _(memory_mutex, descriptor_mutex);
			DESS_DO_OR_RETURN(frame.reset(device_dispatch, *memory_allocator, *descriptor_allocator));
		}
		{
			std::scoped_lock _(reclaim_mutex);
			swap(frame.reclaim_list, current_reclaim_list);
		}

		FrameToken token = ++frame_counter;
		frame.state = SlotState::eOwned;
		frame.owner = token;
		return { expected_value, Frame{ this, &frame, token, graphics_queue } };
	}

	void Device::end_frame(Frame&& frame) {
		if (frame.device != this) {
			frame_contract_violation("end_frame called with a frame that is not open on this device");
		}
		{
			std::scoped_lock _(frame_mutexes[0], frame_mutexes[1]);
			if (frames[0].get() != frame.context || !frames[0]->is_owned_by(frame.frame_token)) {
				frame_contract_violation("end_frame called with a stale frame");
			}
			frames[0]->state = SlotState::eIdle;
			frames[0]->owner = 0;
			std::swap(frames[0], frames[1]);
		}
		frame.device = nullptr;
		frame.context = nullptr;
	}

	Result<void> Device::submit(const Frame& frame,
	                            CommandBuffer command_buffer,
	                            VkSemaphore signal_semaphore,
	                            VkPipelineStageFlags2 signal_stage,
	                            VkSemaphore wait_semaphore,
	                            VkPipelineStageFlags2 wait_stage) {
		if (frame.device != this || !frame.context->is_owned_by(frame.frame_token)) {
			frame_contract_violation("submit called with a frame that is not open on this device");
		}
		auto& ctx = *frame.context;
		CommandBuffer* slot_cb = nullptr;
		if (command_buffer.command_buffer == ctx.main_command_buffer.command_buffer) {
			slot_cb = &ctx.main_command_buffer;
		} else if (command_buffer.command_buffer == ctx.presentation_command_buffer.command_buffer) {
			slot_cb = &ctx.presentation_command_buffer;
		} else {
			frame_contract_violation("submit called with a command buffer that does not belong to the frame");
		}

		auto& d = device_dispatch;
		// a previous failed submit could not restore this fence
		if (slot_cb->fence == VK_NULL_HANDLE) {
			if (auto res = ctx.recreate_fence(d, *slot_cb); !res) {
				return { expected_error, SubmitException{ res.error().code(), "vkCreateFence" } };
			}
		}
		// the fence stays signaled between frames so an unused command buffer never stalls begin_frame
		if (auto res = d.vkResetFences(d.device, 1, &slot_cb->fence); res != VK_SUCCESS) {
			return { expected_error, SubmitException{ res, "vkResetFences" } };
		}

		VkCommandBufferSubmitInfo cbsi{ .sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO, .commandBuffer = slot_cb->command_buffer };
		VkSemaphoreSubmitInfo wait_info{ .sType = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO, .semaphore = wait_semaphore, .stageMask = wait_stage };
		VkSemaphoreSubmitInfo signal_info{ .sType = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO, .semaphore = signal_semaphore, .stageMask = signal_stage };

		VkSubmitInfo2 si{ .sType = VK_STRUCTURE_TYPE_SUBMIT_INFO_2 };
		si.waitSemaphoreInfoCount = wait_semaphore != VK_NULL_HANDLE ? 1 : 0;
		si.pWaitSemaphoreInfos = &wait_info;
		si.commandBufferInfoCount = 1;
		si.pCommandBufferInfos = &cbsi;
		si.signalSemaphoreInfoCount = signal_semaphore != VK_NULL_HANDLE ? 1 : 0;
		si.pSignalSemaphoreInfos = &signal_info;

		VkResult res;
		{
			std::scoped_lock _(queue_mutex);
			res = d.vkQueueSubmit2(graphics_queue, 1, &si, slot_cb->fence);
		}
		if (res != VK_SUCCESS) {
			// nothing will ever signal the reset fence, replace it with a signaled one so waits on this slot return
			if (auto restored = ctx.recreate_fence(d, *slot_cb); !restored) {
				log_error("could not restore the fence after a failed submit: {}", restored.error().what());
			}
			return { expected_error, SubmitException{ res, "vkQueueSubmit2" } };
		}
		return { expected_value };
	}

	void Device::retire_image(VkImage image) {
		std::scoped_lock _(reclaim_mutex);
		current_reclaim_list.retire_image(image);
	}

	void Device::retire_buffer(VkBuffer buffer) {
		std::scoped_lock _(reclaim_mutex);
		current_reclaim_list.retire_buffer(buffer);
	}

	void Device::retire_memory(MemoryBlock block) {
		std::scoped_lock _(reclaim_mutex);
		current_reclaim_list.retire_memory(block);
	}

	void Device::retire_descriptor_set(DescriptorSet set) {
		std::scoped_lock _(reclaim_mutex);
		current_reclaim_list.retire_descriptor_set(set);
	}

	Result<MemoryBlock, AllocateException> Device::allocate_memory(const MemoryRequest& request, SourceLocationAtFrame loc) {
		if (loc.absolute_frame == (uint64_t)-1LL) {
			loc.absolute_frame = frame_count();
		}
		std::scoped_lock _(memory_mutex);
		return memory_allocator->allocate_memory(request, loc);
	}

	Result<std::vector<DescriptorSet>, AllocateException> Device::allocate_descriptor_sets(VkDescriptorSetLayout layout,
	                                                                                      const std::array<uint32_t, 12>& descriptor_counts,
	                                                                                      uint32_t count,
	                                                                                      bool bindless,
	                                                                                      SourceLocationAtFrame loc) {
		if (loc.absolute_frame == (uint64_t)-1LL) {
			loc.absolute_frame = frame_count();
		}
		DescriptorSetRequest request{ .layout_info = { .descriptor_counts = descriptor_counts, .layout = layout }, .count = count, .bindless = bindless };
		std::scoped_lock _(descriptor_mutex);
		return descriptor_allocator->allocate_descriptor_sets(request, loc);
	}

	std::optional<VkSampler> Device::get_sampler(SamplerDesc desc) const {
		if (auto it = samplers.find(desc); it != samplers.end()) {
			return it->second;
		}
		return std::nullopt;
	}
} // namespace dess
