#include "logger.hpp"

#include <filesystem>
#include <system_error>

#include <log4cplus/configurator.h>
#include <log4cplus/helpers/loglog.h>
#include <log4cplus/hierarchy.h>

log4cplus::Logger& core_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("opencode_sidecar"));
	return logger;
}

log4cplus::Logger& launcher_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("opencode_sidecar.launcher"));
	return logger;
}

log4cplus::Logger& client_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("opencode_sidecar.client"));
	return logger;
}

log4cplus::Logger& dispatch_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("opencode_sidecar.dispatch"));
	return logger;
}

static std::filesystem::path resolve_config_path(const std::string& config_path) {
	std::filesystem::path path(config_path);
	if (path.is_absolute()) {
		return path;
	}

	std::error_code ec;
	std::filesystem::path base = std::filesystem::current_path(ec);
	if (ec) {
		return path;
	}
	return base / path;
}

void init_logging(const std::string& config_path) {
	if (!config_path.empty()) {
		try {
			auto resolved = resolve_config_path(config_path);
			if (std::filesystem::exists(resolved)) {
				log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(resolved.string()));
				return;
			}
		} catch (const std::exception& exc) {
			log4cplus::helpers::LogLog::getLogLog()->error(
				LOG4CPLUS_TEXT("Failed to load logging config: ") + LOG4CPLUS_STRING_TO_TSTRING(std::string(exc.what())));
		}
	}

	// stdout carries the protocol, so the fallback appender must write to stderr
	log4cplus::BasicConfigurator fallback(log4cplus::Logger::getDefaultHierarchy(), true);
	fallback.configure();
	log4cplus::Logger::getRoot().setLogLevel(log4cplus::INFO_LOG_LEVEL);
}
