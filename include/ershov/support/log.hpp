/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <utility>
#include <spdlog/spdlog.h>

namespace ershov
{
	/**
	 * @brief Library-wide logger
	 *
	 * Created on first use as a stderr sink named `ershov`. The level is read
	 * once from `ERSHOV_LOGLEVEL` (trace, debug, info, warn, error, critical)
	 * and defaults to warn.
	 */
	spdlog::logger &logger();

	/**
	 * @brief Override the level picked up from the environment
	 */
	void set_log_level(spdlog::level::level_enum level);

	template<typename... Args>
	void log_trace(spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		logger().trace(fmt, std::forward<Args>(args)...);
	}

	template<typename... Args>
	void log_debug(spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		logger().debug(fmt, std::forward<Args>(args)...);
	}

	template<typename... Args>
	void log_info(spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		logger().info(fmt, std::forward<Args>(args)...);
	}

	template<typename... Args>
	void log_warn(spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		logger().warn(fmt, std::forward<Args>(args)...);
	}
}
