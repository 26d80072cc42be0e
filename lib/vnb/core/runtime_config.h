#pragma once

#include "vnb/core/log.h"
#include "vnb/core/result.h"
#include "vnb/defines.h"
#include "vnb/resources/storage/vnb/vnb_texture_resolver.h"

#include <filesystem>
#include <string>
#include <vector>

namespace vnb {

struct VNB_API RuntimeLogConfig {
  LogLevel level = LogLevel::Debug;
  LogLevel consoleLevel = LogLevel::Info;
  // Empty disables the file sink.
  std::filesystem::path file;
};

struct VNB_API RuntimeTextureConfig {
  std::vector<std::filesystem::path> searchRoots;
  UnresolvedTexturePolicy unresolvedPolicy =
      UnresolvedTexturePolicy::PassThrough;
};

struct VNB_API RuntimeConfig {
  // Empty when built-in defaults are in use.
  std::filesystem::path sourcePath;
  RuntimeLogConfig log;
  RuntimeTextureConfig textures;

  [[nodiscard]] LogConfig toLogConfig() const;
};

// Parses a config document. Relative paths resolve against baseDir.
[[nodiscard]] VNB_API Result<RuntimeConfig, std::string>
parseRuntimeConfig(std::string_view jsonText,
                   const std::filesystem::path &baseDir);

[[nodiscard]] VNB_API Result<RuntimeConfig, std::string>
loadRuntimeConfig(const std::filesystem::path &configPath);
// Loads vnb.config.json from the working directory, or defaults when absent.
[[nodiscard]] VNB_API Result<RuntimeConfig, std::string> loadRuntimeConfig();
[[nodiscard]] VNB_API Result<RuntimeConfig, std::string>
loadRuntimeConfigFromEnvOrDefault();

} // namespace vnb
