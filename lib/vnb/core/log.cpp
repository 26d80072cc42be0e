#include "vnb/core/log.h"

#include <atomic>
#include <memory>
#include <mutex>

namespace vnb {

namespace {

void writeFallback(LogLevel level, std::string_view message) {
  if (message.empty()) {
    return;
  }
  const std::string_view levelName = logLevelName(level);
  std::fprintf(stderr, "[%.*s] %.*s\n", static_cast<int>(levelName.size()),
               levelName.data(), static_cast<int>(message.size()),
               message.data());
}

struct LoggerState {
  std::shared_ptr<Log> loadOrCreate() {
    std::shared_ptr<Log> current = instance.load(std::memory_order_acquire);
    if (current) {
      return current;
    }

    std::scoped_lock lock(controlMutex);
    current = instance.load(std::memory_order_acquire);
    if (current) {
      return current;
    }

    std::shared_ptr<Log> created =
        hasConfig ? Log::create(config) : Log::create();
    instance.store(created, std::memory_order_release);
    return created;
  }

  void initializeWithConfig(const LogConfig &newConfig) {
    std::scoped_lock lock(controlMutex);
    if (instance.load(std::memory_order_acquire)) {
      return;
    }

    config = newConfig;
    hasConfig = true;

    std::shared_ptr<Log> created = Log::create(config);
    instance.store(created, std::memory_order_release);
  }

  void install(std::unique_ptr<Log> log) {
    std::shared_ptr<Log> oldInstance;
    {
      std::scoped_lock lock(controlMutex);
      std::shared_ptr<Log> replacement = std::move(log);
      oldInstance =
          instance.exchange(std::move(replacement), std::memory_order_acq_rel);
    }
    oldInstance.reset();
  }

  void shutdown() {
    std::shared_ptr<Log> oldInstance;
    {
      std::scoped_lock lock(controlMutex);
      oldInstance =
          instance.exchange(std::shared_ptr<Log>{}, std::memory_order_acq_rel);
      config = {};
      hasConfig = false;
    }
    oldInstance.reset();
  }

  std::mutex controlMutex;
  std::atomic<std::shared_ptr<Log>> instance;
  LogConfig config;
  bool hasConfig = false;
};

LoggerState &loggerState() {
  static LoggerState state;
  return state;
}

} // namespace

void Log::initialize() { (void)loggerState().loadOrCreate(); }

void Log::initialize(const LogConfig &config) {
  loggerState().initializeWithConfig(config);
}

void Log::install(std::unique_ptr<Log> log) {
  loggerState().install(std::move(log));
}

void Log::shutdown() { loggerState().shutdown(); }

Log *Log::get() { return loggerState().loadOrCreate().get(); }

std::string_view logLevelName(LogLevel level) noexcept {
  switch (level) {
  case LogLevel::Trace:
    return "trace";
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warning:
    return "warning";
  case LogLevel::Fatal:
    return "fatal";
  }
  return "info";
}

void logMessage(LogLevel level, std::string_view message) {
  std::shared_ptr<Log> log = loggerState().loadOrCreate();
  if (!log) {
    writeFallback(level, message);
    return;
  }
  log->write(level, message);
}

void logMessagef(LogLevel level, const char *fmt, ...) {
  if (!fmt) {
    return;
  }

  va_list args;
  va_start(args, fmt);

  va_list argsCopy;
  va_copy(argsCopy, args);
  const int required = std::vsnprintf(nullptr, 0, fmt, argsCopy);
  va_end(argsCopy);

  if (required < 0) {
    va_end(args);
    return;
  }

  std::string buffer;
  buffer.resize(static_cast<size_t>(required) + 1);
  std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
  buffer.resize(static_cast<size_t>(required));
  va_end(args);

  logMessage(level, buffer);
}

} // namespace vnb
