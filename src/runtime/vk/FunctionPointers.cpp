#include "dess/runtime/vk/FunctionPointers.hpp"

namespace {
	void load_instance_pfns_dynamic(VkInstance instance, dess::FunctionPointers& pfns) {
		if (pfns.vkGetDeviceProcAddr == nullptr) {
			pfns.vkGetDeviceProcAddr = (PFN_vkGetDeviceProcAddr)pfns.vkGetInstanceProcAddr(instance, "vkGetDeviceProcAddr");
		}
#define DESS_X(name)
#define DESS_Y(name)                                                                                                                                           \
	if (pfns.name == nullptr) {                                                                                                                                  \
		pfns.name = (PFN_##name)pfns.vkGetInstanceProcAddr(instance, #name);                                                                                       \
	}
#include "dess/runtime/vk/VkPFNRequired.hpp"
#undef DESS_X
#undef DESS_Y
	}

	void load_device_pfns_dynamic(VkInstance instance, VkDevice device, dess::FunctionPointers& pfns) {
		if (pfns.vkGetDeviceProcAddr == nullptr) {
			pfns.vkGetDeviceProcAddr = (PFN_vkGetDeviceProcAddr)pfns.vkGetInstanceProcAddr(instance, "vkGetDeviceProcAddr");
		}
		if (pfns.vkGetDeviceProcAddr == nullptr) {
			return;
		}
#define DESS_X(name)                                                                                                                                           \
	if (pfns.name == nullptr) {                                                                                                                                  \
		pfns.name = (PFN_##name)pfns.vkGetDeviceProcAddr(device, #name);                                                                                           \
	}
#define DESS_Y(name)
#include "dess/runtime/vk/VkPFNRequired.hpp"
#undef DESS_X
#undef DESS_Y
	}
} // namespace

namespace dess {
	bool FunctionPointers::check_instance_pfns() const {
		bool valid = true;
#define DESS_X(name)
#define DESS_Y(name) valid = valid && name;
#include "dess/runtime/vk/VkPFNRequired.hpp"
#undef DESS_X
#undef DESS_Y
		return valid;
	}

	bool FunctionPointers::check_device_pfns() const {
		bool valid = true;
#define DESS_X(name) valid = valid && name;
#define DESS_Y(name)
#include "dess/runtime/vk/VkPFNRequired.hpp"
#undef DESS_X
#undef DESS_Y
		return valid;
	}

	bool FunctionPointers::check_pfns() const {
		return check_instance_pfns() && check_device_pfns();
	}

	Result<void> FunctionPointers::load_instance_pfns(VkInstance instance, bool allow_dynamic_loading_of_vk_function_pointers) {
		// if the user passes in PFNs, those will be used, always
		if (check_instance_pfns()) {
			return { expected_value };
		}
		if (vkGetInstanceProcAddr && allow_dynamic_loading_of_vk_function_pointers) {
			load_instance_pfns_dynamic(instance, *this);
			if (!check_instance_pfns()) {
				return { expected_error, RequiredPFNMissingException{ "An instance-level Vulkan PFN is required, but was not provided and dynamic loading could not load it." } };
			}
		} else {
			return { expected_error, RequiredPFNMissingException{ "An instance-level Vulkan PFN is required, but was not provided and dynamic loading was not allowed." } };
		}
		return { expected_value };
	}

	Result<void> FunctionPointers::load_device_pfns(VkInstance instance, VkDevice device, bool allow_dynamic_loading_of_vk_function_pointers) {
		if (check_device_pfns()) {
			return { expected_value };
		}
		if ((vkGetDeviceProcAddr || vkGetInstanceProcAddr) && allow_dynamic_loading_of_vk_function_pointers) {
			load_device_pfns_dynamic(instance, device, *this);
			if (!check_device_pfns()) {
				return { expected_error, RequiredPFNMissingException{ "A device-level Vulkan PFN is required, but was not provided and dynamic loading could not load it." } };
			}
		} else {
			return { expected_error, RequiredPFNMissingException{ "A device-level Vulkan PFN is required, but was not provided and dynamic loading was not allowed." } };
		}
		return { expected_value };
	}
} // namespace dess
