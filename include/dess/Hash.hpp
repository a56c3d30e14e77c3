#pragma once

#include <cstddef>
#include <functional>
#include <type_traits>

namespace dess {
	template<typename T>
	inline void hash_combine(size_t& seed, const T& v) noexcept {
		if constexpr (std::is_enum_v<T>) {
			std::hash<std::underlying_type_t<T>> hasher;
			seed ^= hasher(static_cast<std::underlying_type_t<T>>(v)) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
		} else {
			std::hash<T> hasher;
			seed ^= hasher(v) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
		}
	}

	template<typename T, typename... Rest>
	inline void hash_combine(size_t& seed, const T& v, const Rest&... rest) noexcept {
		hash_combine(seed, v);
		(hash_combine(seed, rest), ...);
	}
} // namespace dess
