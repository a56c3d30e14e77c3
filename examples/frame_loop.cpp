#include "dess/runtime/vk/Device.hpp"

#include <VkBootstrap.h>
#include <fmt/format.h>

#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

// Runs a headless frame loop: every frame uploads through a staging buffer that is retired right away.
int main(int argc, char** argv) {
	int frame_total = argc > 1 ? std::atoi(argv[1]) : 120;

	vkb::InstanceBuilder builder;
	builder.request_validation_layers()
	    .set_debug_callback([](VkDebugUtilsMessageSeverityFlagBitsEXT messageSeverity,
	                           VkDebugUtilsMessageTypeFlagsEXT messageType,
	                           const VkDebugUtilsMessengerCallbackDataEXT* pCallbackData,
	                           void* pUserData) -> VkBool32 {
		    auto ms = vkb::to_string_message_severity(messageSeverity);
		    auto mt = vkb::to_string_message_type(messageType);
		    fmt::print("[{}: {}]\n{}\n", ms, mt, pCallbackData->pMessage);
		    return VK_FALSE;
	    })
	    .set_app_name("dess_frame_loop")
	    .set_engine_name("dess")
	    .set_headless()
	    .require_api_version(1, 3, 0);
	auto inst_ret = builder.build();
	if (!inst_ret) {
		throw std::runtime_error("Couldn't initialise instance: " + inst_ret.error().message());
	}
	vkb::Instance vkbinstance = inst_ret.value();

	vkb::PhysicalDeviceSelector selector{ vkbinstance };
	auto phys_ret = selector.set_minimum_version(1, 3).select();
	if (!phys_ret) {
		vkb::destroy_instance(vkbinstance);
		throw std::runtime_error("Couldn't select a physical device: " + phys_ret.error().message());
	}
	vkb::PhysicalDevice vkbphysical_device = phys_ret.value();

	dess::DeviceCreateParameters params{ .instance = vkbinstance.instance, .physical_device = vkbphysical_device.physical_device };
	params.pointers.vkGetInstanceProcAddr = vkbinstance.fp_vkGetInstanceProcAddr;
	{
		auto device_ret = dess::Device::create(std::move(params));
		if (!device_ret) {
			fmt::print(stderr, "Couldn't create device: {}\n", device_ret.error().what());
			vkb::destroy_instance(vkbinstance);
			return 1;
		}
		auto& device = **device_ret;
		auto& d = device.dispatch();

		for (int i = 0; i < frame_total; i++) {
			auto frame_ret = device.begin_frame();
			if (!frame_ret) {
				fmt::print(stderr, "begin_frame failed: {}\n", frame_ret.error().what());
				break;
			}
			auto frame = std::move(*frame_ret);

			// frame work that fails ends the frame so teardown finds every slot idle
			auto abandon = [&](const char* what, VkResult res) {
				fmt::print(stderr, "{} failed: {}\n", what, dess::vk_result_message(res));
				frame.end();
			};

			VkBufferCreateInfo bci{ .sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO, .size = 4096, .usage = VK_BUFFER_USAGE_TRANSFER_SRC_BIT };
			VkBuffer staging;
			if (auto res = d.vkCreateBuffer(d.device, &bci, nullptr, &staging); res != VK_SUCCESS) {
				abandon("vkCreateBuffer", res);
				break;
			}
			VkMemoryRequirements reqs;
			d.vkGetBufferMemoryRequirements(d.device, staging, &reqs);
			auto block = device.allocate_memory(
			    dess::MemoryRequest{ .size = reqs.size, .alignment = reqs.alignment, .memory_type_bits = reqs.memoryTypeBits, .usage = dess::MemoryUsage::eCPUonly });
			if (!block) {
				fmt::print(stderr, "{}\n", block.error().what());
				device.retire_buffer(staging);
				frame.end();
				break;
			}

			// the GPU may still read the buffer after this frame ends, it is destroyed two frames later
			device.with_reclaim_list([&](dess::DeferredReclaimList& list) {
				list.retire_buffer(staging);
				list.retire_memory(*block);
			});

			if (auto res = d.vkBindBufferMemory(d.device, staging, block->device_memory, block->offset); res != VK_SUCCESS) {
				abandon("vkBindBufferMemory", res);
				break;
			}
			std::memset(block->mapped_ptr, i & 0xff, 4096);

			auto cb = frame.main_command_buffer();
			VkCommandBufferBeginInfo cbbi{ .sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO, .flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT };
			if (auto res = d.vkBeginCommandBuffer(cb.command_buffer, &cbbi); res != VK_SUCCESS) {
				abandon("vkBeginCommandBuffer", res);
				break;
			}
			if (auto res = d.vkEndCommandBuffer(cb.command_buffer); res != VK_SUCCESS) {
				abandon("vkEndCommandBuffer", res);
				break;
			}
			if (auto res = frame.submit(cb, VK_NULL_HANDLE, 0, VK_NULL_HANDLE, 0); !res) {
				fmt::print(stderr, "{}\n", res.error().what());
				frame.end();
				break;
			}
			frame.end();
		}
		fmt::print("ran {} frames on {}\n", device.frame_count(), device.physical_device_properties().deviceName);
	}

	vkb::destroy_instance(vkbinstance);
}
