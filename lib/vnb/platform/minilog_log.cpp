#include "vnb/platform/minilog_log.h"

#include <atomic>

#include <minilog/minilog.h>

namespace vnb {

namespace {

// minilog keeps process-wide state; only one sink may own it at a time.
std::atomic<bool> gMinilogOwned{false};

minilog::eLogLevel toMinilogLevel(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return minilog::Paranoid;
  case LogLevel::Debug:
    return minilog::Debug;
  case LogLevel::Info:
    return minilog::Log;
  case LogLevel::Warning:
    return minilog::Warning;
  case LogLevel::Fatal:
    return minilog::FatalError;
  }
  return minilog::Log;
}

minilog::LogConfig toMinilogConfig(const LogConfig &userConfig) {
  minilog::LogConfig config{};
  config.logLevel = toMinilogLevel(userConfig.logLevel);
  config.logLevelPrintToConsole = toMinilogLevel(userConfig.consoleLevel);
  if (config.logLevelPrintToConsole < config.logLevel) {
    config.logLevelPrintToConsole = config.logLevel;
  }
  config.forceFlush = userConfig.forceFlush;
  config.writeIntro = userConfig.writeIntro;
  config.writeOutro = userConfig.writeOutro;
  config.coloredConsole = userConfig.coloredConsole;
  config.htmlLog = false;
  config.threadNames = userConfig.threadNames;
  return config;
}

} // namespace

struct MinilogLog::Impl {
  bool ownsBackend = false;
  bool initialized = false;
  std::string filePath;
};

MinilogLog::MinilogLog(const LogConfig &userConfig)
    : impl_(std::make_unique<Impl>()) {
  bool expected = false;
  if (!gMinilogOwned.compare_exchange_strong(expected, true,
                                             std::memory_order_acq_rel)) {
    return;
  }
  impl_->ownsBackend = true;

  // A null file name keeps minilog console-only.
  const char *fileName = nullptr;
  if (!userConfig.filePath.empty()) {
    impl_->filePath = userConfig.filePath;
    fileName = impl_->filePath.c_str();
  }

  impl_->initialized =
      minilog::initialize(fileName, toMinilogConfig(userConfig));
}

MinilogLog::~MinilogLog() {
  if (!impl_ || !impl_->ownsBackend) {
    return;
  }
  if (impl_->initialized) {
    minilog::deinitialize();
  }
  gMinilogOwned.store(false, std::memory_order_release);
}

std::unique_ptr<MinilogLog> MinilogLog::create(const LogConfig &config) {
  auto log = std::unique_ptr<MinilogLog>(new MinilogLog(config));
  if (!log->impl_ || !log->impl_->initialized) {
    return nullptr;
  }
  return log;
}

void MinilogLog::write(LogLevel level, std::string_view message) {
  const int length = static_cast<int>(message.size());
  minilog::log(toMinilogLevel(level), "%.*s", length, message.data());
}

std::unique_ptr<Log> Log::create() {
  LogConfig config{};
  return MinilogLog::create(config);
}

std::unique_ptr<Log> Log::create(const LogConfig &config) {
  return MinilogLog::create(config);
}

} // namespace vnb
