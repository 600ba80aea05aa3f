#include "vine/log.hpp"

#include <filesystem>

#include <log4cplus/configurator.h>
#include <log4cplus/helpers/loglog.h>

namespace vine {
namespace log {

log4cplus::Logger& process_logger() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("vine.process"));
    return logger;
}

log4cplus::Logger& protocol_logger() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("vine.protocol"));
    return logger;
}

log4cplus::Logger& engine_logger() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("vine.engine"));
    return logger;
}

log4cplus::Logger& backend_logger() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("vine.backend"));
    return logger;
}

void init_logging(const std::string& config_path, log4cplus::LogLevel fallback_level) {
    if (!config_path.empty()) {
        std::error_code ec;
        std::filesystem::path path(config_path);
        if (path.is_relative()) {
            path = std::filesystem::current_path(ec) / path;
        }
        if (!ec && std::filesystem::exists(path, ec)) {
            log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(path.string()));
            return;
        }
        log4cplus::helpers::LogLog::getLogLog()->warn(
            LOG4CPLUS_TEXT("Logging config not found, using console fallback"));
    }

    // Console output goes to stderr so it never mixes with program output.
    log4cplus::Logger::getDefaultHierarchy().resetConfiguration();
    log4cplus::BasicConfigurator fallback(log4cplus::Logger::getDefaultHierarchy(), true);
    fallback.configure();
    log4cplus::Logger::getRoot().setLogLevel(fallback_level);
}

} // namespace log
} // namespace vine
