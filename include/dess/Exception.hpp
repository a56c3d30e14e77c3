#pragma once

#include "dess/Config.hpp"
#include "dess/Types.hpp"

#include <exception>
#include <string>

namespace dess {
	struct Exception : std::exception {
		std::string error_message;

		Exception() {}
		Exception(std::string message) : error_message(std::move(message)) {}

		const char* what() const noexcept override {
			return error_message.c_str();
		}

		virtual void throw_this() = 0;
	};

	inline const char* vk_result_message(VkResult res) {
		switch (res) {
		case VK_NOT_READY:
			return "Not ready.";
		case VK_TIMEOUT:
			return "Timeout.";
		case VK_ERROR_OUT_OF_HOST_MEMORY:
			return "Out of host memory.";
		case VK_ERROR_OUT_OF_DEVICE_MEMORY:
			return "Out of device memory.";
		case VK_ERROR_INITIALIZATION_FAILED:
			return "Initialization failed.";
		case VK_ERROR_DEVICE_LOST:
			return "Device lost.";
		case VK_ERROR_MEMORY_MAP_FAILED:
			return "Memory map failed.";
		case VK_ERROR_LAYER_NOT_PRESENT:
			return "Layer not present.";
		case VK_ERROR_EXTENSION_NOT_PRESENT:
			return "Extension not present.";
		case VK_ERROR_FEATURE_NOT_PRESENT:
			return "Feature not present.";
		case VK_ERROR_INCOMPATIBLE_DRIVER:
			return "Incompatible driver.";
		case VK_ERROR_TOO_MANY_OBJECTS:
			return "Too many objects.";
		case VK_ERROR_FORMAT_NOT_SUPPORTED:
			return "Format not supported.";
		case VK_ERROR_FRAGMENTED_POOL:
			return "Fragmented pool.";
		case VK_ERROR_OUT_OF_POOL_MEMORY:
			return "Out of pool memory.";
		case VK_ERROR_FRAGMENTATION:
			return "Fragmentation.";
		case VK_ERROR_INVALID_OPAQUE_CAPTURE_ADDRESS:
			return "Invalid opaque capture address.";
		case VK_ERROR_UNKNOWN:
			return "Error unknown.";
		default:
			return "Unrecognized error.";
		}
	}

	/// @brief A Vulkan call returned a non-success status
	struct VkException : Exception {
		VkResult error_code = VK_ERROR_UNKNOWN;

		using Exception::Exception;

		VkException(VkResult res) : Exception(vk_result_message(res)), error_code(res) {}
		VkException(VkResult res, std::string context) : Exception(context + ": " + vk_result_message(res)), error_code(res) {}

		VkResult code() const {
			return error_code;
		}

		void throw_this() override {
			throw *this;
		}
	};

	/// @brief Creating a Vulkan object or allocating from a pool failed
	struct AllocateException : VkException {
		using VkException::VkException;

		void throw_this() override {
			throw *this;
		}
	};

	/// @brief A MemoryAllocator could not satisfy a request
	struct MemoryAllocationException : AllocateException {
		MemoryRequest request;

		MemoryAllocationException(VkResult res, MemoryRequest request);

		void throw_this() override {
			throw *this;
		}
	};

	/// @brief A DescriptorAllocator could not satisfy a request
	struct DescriptorAllocationException : AllocateException {
		DescriptorSetRequest request;

		DescriptorAllocationException(VkResult res, DescriptorSetRequest request);

		void throw_this() override {
			throw *this;
		}
	};

	/// @brief Queue submission failed. The frame's work was not enqueued.
	struct SubmitException : VkException {
		using VkException::VkException;

		void throw_this() override {
			throw *this;
		}
	};

	struct RequiredPFNMissingException : Exception {
		using Exception::Exception;

		void throw_this() override {
			throw *this;
		}
	};

	struct NoSuitableQueueException : Exception {
		using Exception::Exception;

		void throw_this() override {
			throw *this;
		}
	};

	/// @brief Misuse of the frame API (beginning a frame while one is open, ending a frame twice)
	struct FrameContractException : Exception {
		using Exception::Exception;

		void throw_this() override {
			throw *this;
		}
	};
} // namespace dess
