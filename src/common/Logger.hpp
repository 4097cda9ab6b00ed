#pragma once

#include "common/Config.hpp"
#include "common/EnumClass.hpp"

#include <string>

namespace TrieKit {
class Logger {
public:
  // Calling Init again replaces the previous sink.
  static void Init(const std::string &log_file = DEFAULT_LOG_FILE,
                   LogLevel level = LogLevel::Info);
  static void Shutdown();

  static void SetLevel(LogLevel level);

  static void Info(const char *file, int line, const std::string &msg);
  static void Warn(const char *file, int line, const std::string &msg);
  static void Error(const char *file, int line, const std::string &msg);
  static void Debug(const char *file, int line, const std::string &msg);
};
} // namespace TrieKit

#include "fmt/format.h"

#define LOG_INFO(...)                                                          \
  TrieKit::Logger::Info(__FILE__, __LINE__, fmt::format(__VA_ARGS__))
#define LOG_WARN(...)                                                          \
  TrieKit::Logger::Warn(__FILE__, __LINE__, fmt::format(__VA_ARGS__))
#define LOG_ERROR(...)                                                         \
  TrieKit::Logger::Error(__FILE__, __LINE__, fmt::format(__VA_ARGS__))
#define LOG_DEBUG(...)                                                         \
  TrieKit::Logger::Debug(__FILE__, __LINE__, fmt::format(__VA_ARGS__))
