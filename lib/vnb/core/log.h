#pragma once

#include "vnb/defines.h"
#include "vnb/pch.h"

#include <cstdint>
#include <string>

namespace vnb {

enum class LogLevel : uint8_t {
  Trace,
  Debug,
  Info,
  Warning,
  Fatal,
};

struct LogConfig {
  std::string filePath;
  LogLevel logLevel = LogLevel::Debug;
  LogLevel consoleLevel = LogLevel::Info;
  bool forceFlush = true;
  bool writeIntro = false;
  bool writeOutro = false;
  bool coloredConsole = true;
  bool threadNames = false;
};

class VNB_API Log {
public:
  static std::unique_ptr<Log> create();
  static std::unique_ptr<Log> create(const LogConfig &config);
  static void initialize();
  static void initialize(const LogConfig &config);
  // Replaces the active sink. Passing nullptr reverts to lazy default creation.
  static void install(std::unique_ptr<Log> log);
  static void shutdown();
  static Log *get();

  virtual ~Log() = default;
  Log(const Log &) = delete;
  Log &operator=(const Log &) = delete;
  Log(Log &&) = delete;
  Log &operator=(Log &&) = delete;

  virtual void write(LogLevel level, std::string_view message) = 0;

protected:
  Log() = default;
};

VNB_API void logMessage(LogLevel level, std::string_view message);
VNB_API void logMessagef(LogLevel level, const char *fmt, ...);

[[nodiscard]] VNB_API std::string_view logLevelName(LogLevel level) noexcept;

#define VNB_LOG_TRACE(fmt, ...)                                                \
  do {                                                                         \
    vnb::logMessagef(vnb::LogLevel::Trace, fmt __VA_OPT__(,) __VA_ARGS__);     \
  } while (false)

#define VNB_LOG_DEBUG(fmt, ...)                                                \
  do {                                                                         \
    vnb::logMessagef(vnb::LogLevel::Debug, fmt __VA_OPT__(,) __VA_ARGS__);     \
  } while (false)

#define VNB_LOG_INFO(fmt, ...)                                                 \
  do {                                                                         \
    vnb::logMessagef(vnb::LogLevel::Info, fmt __VA_OPT__(,) __VA_ARGS__);      \
  } while (false)

#define VNB_LOG_WARNING(fmt, ...)                                              \
  do {                                                                         \
    vnb::logMessagef(vnb::LogLevel::Warning, fmt __VA_OPT__(,) __VA_ARGS__);   \
  } while (false)

#define VNB_LOG_FATAL(fmt, ...)                                                \
  do {                                                                         \
    vnb::logMessagef(vnb::LogLevel::Fatal, fmt __VA_OPT__(,) __VA_ARGS__);     \
  } while (false)

#define VNB_ASSERT(condition, fmt, ...)                                        \
  do {                                                                         \
    if (!(condition)) {                                                        \
      VNB_LOG_FATAL("Assertion failed: " #condition " " fmt                    \
                        __VA_OPT__(,) __VA_ARGS__);                            \
      std::terminate();                                                        \
    }                                                                          \
  } while (false)

} // namespace vnb
