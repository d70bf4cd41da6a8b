#include "toolbridge/utils/logging.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace toolbridge {
namespace logging {

namespace {
// Global log level
std::atomic<Level> g_level{Level::Info};

// Global log handler
std::mutex g_handler_mutex;
LogHandler g_handler = defaultHandler;

// Serializes writes from the default handler across threads
std::mutex g_output_mutex;

std::string baseName(const std::string &path) {
  auto pos = path.find_last_of("/\\");
  return pos == std::string::npos ? path : path.substr(pos + 1);
}
} // namespace

std::string levelToString(Level level) {
  switch (level) {
  case Level::Trace:
    return "TRACE";
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warning:
    return "WARNING";
  case Level::Error:
    return "ERROR";
  case Level::Fatal:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

Level levelFromString(const std::string &level_str) {
  std::string lower = level_str;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "trace") {
    return Level::Trace;
  } else if (lower == "debug") {
    return Level::Debug;
  } else if (lower == "info") {
    return Level::Info;
  } else if (lower == "warning" || lower == "warn") {
    return Level::Warning;
  } else if (lower == "error") {
    return Level::Error;
  } else if (lower == "fatal") {
    return Level::Fatal;
  } else {
    throw std::invalid_argument("Invalid log level: " + level_str);
  }
}

void setLevel(Level level) { g_level = level; }

Level getLevel() { return g_level; }

void setHandler(LogHandler handler) {
  std::lock_guard<std::mutex> lock(g_handler_mutex);
  g_handler = handler ? handler : defaultHandler;
}

void log(Level level, const std::string &message, const std::string &file,
         int line) {
  if (level >= g_level) {
    LogHandler handler;
    {
      std::lock_guard<std::mutex> lock(g_handler_mutex);
      handler = g_handler;
    }
    handler(level, message, file, line);
  }
}

bool isEnabled(Level level) { return level >= g_level; }

void defaultHandler(Level level, const std::string &message,
                    const std::string &file, int line) {
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch()) %
                1000;
  std::tm tm{};
  localtime_r(&t, &tm);

  std::stringstream ss;
  ss << "[" << levelToString(level) << "] ["
     << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0')
     << std::setw(3) << millis.count() << "] ";

  if (!file.empty()) {
    ss << "[" << baseName(file) << ":" << line << "] ";
  }

  ss << message << '\n';

  std::lock_guard<std::mutex> lock(g_output_mutex);
  std::cerr << ss.str() << std::flush;
}

std::string serverTag(const std::string &server_id) {
  return "[server " + server_id + "] ";
}

} // namespace logging
} // namespace toolbridge
