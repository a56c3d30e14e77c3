#pragma once

#include "dess/Config.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <utility>

namespace dess {
	template<typename... Args>
	void log_error(fmt::format_string<Args...> fmt, Args&&... args) {
#if DESS_LOG_LEVEL >= 1
		fmt::print(stderr, "[dess] error: {}\n", fmt::format(fmt, std::forward<Args>(args)...));
#endif
	}

	template<typename... Args>
	void log_warn(fmt::format_string<Args...> fmt, Args&&... args) {
#if DESS_LOG_LEVEL >= 2
		fmt::print(stderr, "[dess] warning: {}\n", fmt::format(fmt, std::forward<Args>(args)...));
#endif
	}

	template<typename... Args>
	void log_info(fmt::format_string<Args...> fmt, Args&&... args) {
#if DESS_LOG_LEVEL >= 3
		fmt::print(stderr, "[dess] {}\n", fmt::format(fmt, std::forward<Args>(args)...));
#endif
	}
} // namespace dess
