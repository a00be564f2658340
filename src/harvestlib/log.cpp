#include "log.h"

#include "Exception.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

std::shared_ptr<spdlog::logger> Log::logger;

void Log::init(spdlog::level::level_enum log_level, const std::optional<std::filesystem::path>& log_file) {
	std::vector<spdlog::sink_ptr> sinks;
	sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
	if (log_file.has_value()) {
		// appends, so consecutive runs of the same project end up in one file
		try {
			sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file->string(), false));
		} catch (const spdlog::spdlog_ex& e) {
			throw ConfigurationError(fmt::format("Cannot open log file {}: {}", log_file->string(), e.what()));
		}
	}

	spdlog::drop("LOG");

	Log::logger = std::make_shared<spdlog::logger>("LOG", sinks.begin(), sinks.end());
	Log::logger->set_pattern("[%Y-%m-%d %T.%e] [%=3n] [%^%l%$] %v");
	Log::logger->set_level(log_level);
	spdlog::register_logger(Log::logger);
}
