/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#include <cstdlib>
#include <mutex>
#include <string_view>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <ershov/support/log.hpp>

namespace ershov
{
	namespace
	{
		spdlog::level::level_enum level_from_env()
		{
			const char *env = std::getenv("ERSHOV_LOGLEVEL");
			if (!env)
				return spdlog::level::warn;

			const std::string_view name(env);
			if (name == "trace")
				return spdlog::level::trace;
			if (name == "debug")
				return spdlog::level::debug;
			if (name == "info")
				return spdlog::level::info;
			if (name == "error")
				return spdlog::level::err;
			if (name == "critical")
				return spdlog::level::critical;
			return spdlog::level::warn;
		}

		std::shared_ptr<spdlog::logger> make_logger()
		{
			/* another component may have registered the name already */
			if (auto existing = spdlog::get("ershov"))
				return existing;

			auto created = spdlog::stderr_color_mt("ershov");
			created->set_pattern("%^[%L %X.%e] %n: %v%$");
			created->set_level(level_from_env());
			return created;
		}
	}

	spdlog::logger &logger()
	{
		static std::once_flag once;
		static std::shared_ptr<spdlog::logger> instance;
		std::call_once(once, [] { instance = make_logger(); });
		return *instance;
	}

	void set_log_level(const spdlog::level::level_enum level)
	{
		logger().set_level(level);
	}
}
