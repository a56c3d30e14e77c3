#pragma once

#ifndef DESS_CUSTOM_VULKAN_HEADER
#include <vulkan/vulkan.h>
#else
#include DESS_CUSTOM_VULKAN_HEADER
#endif

#include <cassert>

// upper bound for sampler anisotropy, further clamped to the device limit
#ifndef DESS_MAX_SAMPLER_ANISOTROPY
#define DESS_MAX_SAMPLER_ANISOTROPY 16.0f
#endif

// allocations at or above this size get their own VkDeviceMemory
#ifndef DESS_DEFAULT_DEDICATED_THRESHOLD
#define DESS_DEFAULT_DEDICATED_THRESHOLD (32ull * 1024 * 1024)
#endif

// size of the VkDeviceMemory blocks suballocated from
#ifndef DESS_DEFAULT_PREFERRED_BLOCK_SIZE
#define DESS_DEFAULT_PREFERRED_BLOCK_SIZE (256ull * 1024 * 1024)
#endif

// block size of the pool serving CPU-only (staging) allocations
#ifndef DESS_DEFAULT_TRANSIENT_BLOCK_SIZE
#define DESS_DEFAULT_TRANSIENT_BLOCK_SIZE (8ull * 1024 * 1024)
#endif

// number of sets the first descriptor pool of a bucket can hold
#ifndef DESS_DEFAULT_DESCRIPTOR_SETS_PER_POOL
#define DESS_DEFAULT_DESCRIPTOR_SETS_PER_POOL 64u
#endif

// descriptor pools grow geometrically up to this many sets
#ifndef DESS_MAX_DESCRIPTOR_SETS_PER_POOL
#define DESS_MAX_DESCRIPTOR_SETS_PER_POOL 4096u
#endif

// 0 = silent, 1 = errors, 2 = warnings, 3 = info
#ifndef DESS_LOG_LEVEL
#define DESS_LOG_LEVEL 2
#endif

#ifndef DESS_FAIL_FAST
#define DESS_FAIL_FAST 0
#endif

#ifndef DESS_DISABLE_EXCEPTIONS
#define DESS_USE_EXCEPTIONS 1
#else
#define DESS_USE_EXCEPTIONS 0
#endif

#if defined(__clang__) || defined(__GNUC__)
#define DESS_UNREACHABLE(msg) (assert(false && msg), __builtin_unreachable())
#elif defined(_MSC_VER)
#define DESS_UNREACHABLE(msg) (assert(false && msg), __assume(0))
#else
#define DESS_UNREACHABLE(msg) assert(false && msg)
#endif
