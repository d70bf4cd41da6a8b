#ifndef TOOLBRIDGE_UTILS_LOGGING_HPP_
#define TOOLBRIDGE_UTILS_LOGGING_HPP_

#include <functional>
#include <string>

namespace toolbridge {
namespace logging {

/**
 * @brief Log levels
 */
enum class Level { Trace, Debug, Info, Warning, Error, Fatal };

/**
 * @brief Convert a log level to a string
 *
 * @param level The log level
 * @return std::string The string representation
 */
std::string levelToString(Level level);

/**
 * @brief Parse a log level from a string
 *
 * Matching is case-insensitive and "warn" is accepted for Warning.
 *
 * @param level_str The string representation
 * @return Level The log level
 * @throws std::invalid_argument if the string is not a valid log level
 */
Level levelFromString(const std::string &level_str);

/**
 * @brief Log handler function type
 */
using LogHandler = std::function<void(Level level, const std::string &message,
                                      const std::string &file, int line)>;

void setLevel(Level level);

Level getLevel();

/**
 * @brief Set the global log handler
 *
 * Passing an empty handler restores the default handler.
 */
void setHandler(LogHandler handler);

/**
 * @brief Log a message
 *
 * @param level The log level
 * @param message The log message
 * @param file The source file
 * @param line The source line
 */
void log(Level level, const std::string &message, const std::string &file = "",
         int line = 0);

bool isEnabled(Level level);

/**
 * @brief Default log handler that logs to stderr
 *
 * Format: [LEVEL] [YYYY-mm-dd HH:MM:SS.mmm] [file:line] message
 */
void defaultHandler(Level level, const std::string &message,
                    const std::string &file, int line);

/**
 * @brief Prefix identifying a tool server in log lines, "[server <id>] "
 */
std::string serverTag(const std::string &server_id);

} // namespace logging
} // namespace toolbridge

// Convenience macros for logging
#define TOOLBRIDGE_LOG_AT(lvl, msg)                                            \
  do {                                                                         \
    if (toolbridge::logging::isEnabled(lvl)) {                                 \
      toolbridge::logging::log(lvl, msg, __FILE__, __LINE__);                  \
    }                                                                          \
  } while (0)

#define TOOLBRIDGE_LOG_TRACE(msg)                                              \
  TOOLBRIDGE_LOG_AT(toolbridge::logging::Level::Trace, msg)
#define TOOLBRIDGE_LOG_DEBUG(msg)                                              \
  TOOLBRIDGE_LOG_AT(toolbridge::logging::Level::Debug, msg)
#define TOOLBRIDGE_LOG_INFO(msg)                                               \
  TOOLBRIDGE_LOG_AT(toolbridge::logging::Level::Info, msg)
#define TOOLBRIDGE_LOG_WARNING(msg)                                            \
  TOOLBRIDGE_LOG_AT(toolbridge::logging::Level::Warning, msg)
#define TOOLBRIDGE_LOG_ERROR(msg)                                              \
  TOOLBRIDGE_LOG_AT(toolbridge::logging::Level::Error, msg)
#define TOOLBRIDGE_LOG_FATAL(msg)                                              \
  TOOLBRIDGE_LOG_AT(toolbridge::logging::Level::Fatal, msg)

#endif // TOOLBRIDGE_UTILS_LOGGING_HPP_
