#pragma once

#include "dess/Config.hpp"
#include "dess/Result.hpp"

namespace dess {
#define DESS_X(name) PFN_##name name = nullptr;
#define DESS_Y(name) PFN_##name name = nullptr;

	/// @brief Vulkan entry points used by dess. Every call into the driver goes through this table.
	struct FunctionPointers {
		PFN_vkGetInstanceProcAddr vkGetInstanceProcAddr = nullptr;
		PFN_vkGetDeviceProcAddr vkGetDeviceProcAddr = nullptr;
#include "dess/runtime/vk/VkPFNRequired.hpp"

		/// @brief Check if all required instance-level function pointers are available
		bool check_instance_pfns() const;
		/// @brief Check if all required device-level function pointers are available
		bool check_device_pfns() const;
		/// @brief Check if all required function pointers are available (if providing them externally)
		bool check_pfns() const;

		/// @brief Load the instance-level function pointers that are not yet filled in
		/// @param allow_dynamic_loading_of_vk_function_pointers If true, then this function will attempt dynamic loading through vkGetInstanceProcAddr
		/// If this is false, then you must fill in all required function pointers
		Result<void> load_instance_pfns(VkInstance instance, bool allow_dynamic_loading_of_vk_function_pointers);
		/// @brief Load the device-level function pointers that are not yet filled in
		Result<void> load_device_pfns(VkInstance instance, VkDevice device, bool allow_dynamic_loading_of_vk_function_pointers);
	};
#undef DESS_X
#undef DESS_Y

	/// @brief A logical device together with the entry points bound to it
	struct DeviceDispatch : FunctionPointers {
		VkInstance instance = VK_NULL_HANDLE;
		VkPhysicalDevice physical_device = VK_NULL_HANDLE;
		VkDevice device = VK_NULL_HANDLE;
	};
} // namespace dess
