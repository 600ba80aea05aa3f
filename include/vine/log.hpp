#pragma once

#include <string>
#include <log4cplus/logger.h>
#include <log4cplus/loggingmacros.h>

namespace vine {
namespace log {

/// Child process lifecycle, pipes and server stderr.
log4cplus::Logger& process_logger();

/// Request/response correlation on the wire.
log4cplus::Logger& protocol_logger();

/// Tool catalog and orchestration loop.
log4cplus::Logger& engine_logger();

/// Hosted language-model transport.
log4cplus::Logger& backend_logger();

/**
 * @brief Configure log4cplus once for the process
 *
 * Loads a property file when @p config_path names an existing file,
 * otherwise replaces any earlier configuration with a stderr console
 * appender on the root logger at @p fallback_level (a log4cplus level
 * such as WARN_LOG_LEVEL).
 *
 * Callers own the log4cplus::Initializer; construct one in main().
 */
void init_logging(const std::string& config_path = "",
                  log4cplus::LogLevel fallback_level = log4cplus::WARN_LOG_LEVEL);

} // namespace log
} // namespace vine
