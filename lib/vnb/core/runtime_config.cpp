#include "vnb/pch.h"

#include "vnb/core/profiling.h"
#include "vnb/core/runtime_config.h"

#include <yyjson.h>

namespace vnb {
namespace {

constexpr std::string_view kDefaultConfigPath = "vnb.config.json";
constexpr const char kToolConfigEnvVarCStr[] = "VNB_TOOL_CONFIG";
constexpr std::string_view kToolConfigEnvVar = kToolConfigEnvVarCStr;

constexpr std::array<std::string_view, 2> kRootObjectKeys = {"log",
                                                             "textures"};
constexpr std::array<std::string_view, 3> kLogKeys = {"level", "console_level",
                                                      "file"};
constexpr std::array<std::string_view, 2> kTexturesKeys = {
    "search_roots", "unresolved_policy"};

template <typename T>
[[nodiscard]] Result<T, std::string> makeError(std::string message) {
  return Result<T, std::string>::makeError(std::move(message));
}

[[nodiscard]] std::filesystem::path
normalizePath(const std::filesystem::path &filePath) {
  std::error_code ec;
  auto normalized = std::filesystem::weakly_canonical(filePath, ec);
  if (ec) {
    normalized = std::filesystem::absolute(filePath, ec);
  }
  if (ec) {
    return filePath.lexically_normal();
  }
  return normalized.lexically_normal();
}

[[nodiscard]] std::string fieldPath(std::string_view parent,
                                    std::string_view child) {
  if (parent.empty()) {
    return std::string(child);
  }
  return std::string(parent) + "." + std::string(child);
}

[[nodiscard]] Result<std::string, std::string>
readTextFile(const std::filesystem::path &path) {
  std::ifstream input(path, std::ios::binary);
  if (!input.is_open()) {
    return makeError<std::string>("Failed to open config file '" +
                                  path.string() + "'");
  }
  std::ostringstream stream;
  stream << input.rdbuf();
  if (input.bad()) {
    return makeError<std::string>("Failed to read config file '" +
                                  path.string() + "'");
  }
  return Result<std::string, std::string>::makeResult(stream.str());
}

template <size_t N>
[[nodiscard]] Result<bool, std::string>
validateUnknownKeys(yyjson_val *obj, std::string_view objectName,
                    const std::array<std::string_view, N> &allowedKeys) {
  if (!yyjson_is_obj(obj)) {
    return makeError<bool>("Config field '" + std::string(objectName) +
                           "' must be a JSON object");
  }

  size_t idx = 0;
  size_t max = 0;
  yyjson_val *key = nullptr;
  yyjson_val *value = nullptr;
  yyjson_obj_foreach(obj, idx, max, key, value) {
    (void)value;
    const char *keyRaw = yyjson_get_str(key);
    if (!keyRaw) {
      continue;
    }
    const std::string_view keyView{keyRaw};
    if (std::find(allowedKeys.begin(), allowedKeys.end(), keyView) ==
        allowedKeys.end()) {
      return makeError<bool>("Unknown config field '" +
                             fieldPath(objectName, keyView) + "'");
    }
  }
  return Result<bool, std::string>::makeResult(true);
}

// Returns nullptr when the field is absent.
[[nodiscard]] Result<yyjson_val *, std::string>
optionalObjectField(yyjson_val *obj, const char *key,
                    std::string_view objectName) {
  yyjson_val *value = yyjson_obj_get(obj, key);
  if (!value) {
    return Result<yyjson_val *, std::string>::makeResult(nullptr);
  }
  if (!yyjson_is_obj(value)) {
    return makeError<yyjson_val *>("Config field '" +
                                   fieldPath(objectName, key) +
                                   "' must be a JSON object");
  }
  return Result<yyjson_val *, std::string>::makeResult(value);
}

[[nodiscard]] Result<std::optional<std::string>, std::string>
optionalStringField(yyjson_val *obj, const char *key,
                    std::string_view objectName) {
  using StringResult = Result<std::optional<std::string>, std::string>;
  if (obj == nullptr) {
    return StringResult::makeResult(std::nullopt);
  }
  yyjson_val *value = yyjson_obj_get(obj, key);
  if (!value) {
    return StringResult::makeResult(std::nullopt);
  }
  if (!yyjson_is_str(value)) {
    return makeError<std::optional<std::string>>(
        "Config field '" + fieldPath(objectName, key) + "' must be a string");
  }
  return StringResult::makeResult(
      std::optional<std::string>(yyjson_get_str(value)));
}

[[nodiscard]] Result<LogLevel, std::string>
parseLogLevel(std::string_view text, std::string_view fieldName) {
  constexpr std::array<LogLevel, 5> kLevels = {
      LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warning,
      LogLevel::Fatal};
  for (const LogLevel level : kLevels) {
    if (text == logLevelName(level)) {
      return Result<LogLevel, std::string>::makeResult(level);
    }
  }
  return makeError<LogLevel>("Invalid " + std::string(fieldName) + " '" +
                             std::string(text) +
                             "'. Allowed values: trace, debug, info, "
                             "warning, fatal");
}

[[nodiscard]] Result<UnresolvedTexturePolicy, std::string>
parseUnresolvedPolicy(std::string_view text) {
  if (text == "pass_through") {
    return Result<UnresolvedTexturePolicy, std::string>::makeResult(
        UnresolvedTexturePolicy::PassThrough);
  }
  if (text == "fail") {
    return Result<UnresolvedTexturePolicy, std::string>::makeResult(
        UnresolvedTexturePolicy::Fail);
  }
  return makeError<UnresolvedTexturePolicy>(
      "Invalid textures.unresolved_policy '" + std::string(text) +
      "'. Allowed values: pass_through, fail");
}

[[nodiscard]] std::filesystem::path
resolvePath(std::string_view rawPath, const std::filesystem::path &baseDir) {
  std::filesystem::path resolved = std::filesystem::path(rawPath);
  if (!resolved.is_absolute()) {
    resolved = baseDir / resolved;
  }
  return normalizePath(resolved);
}

[[nodiscard]] Result<std::filesystem::path, std::string>
resolveDirectory(std::string_view rawPath, const std::filesystem::path &baseDir,
                 std::string_view fieldName) {
  if (rawPath.empty()) {
    return makeError<std::filesystem::path>(
        "Config field '" + std::string(fieldName) + "' must not be empty");
  }
  const std::filesystem::path resolved = resolvePath(rawPath, baseDir);

  std::error_code ec;
  const bool exists = std::filesystem::exists(resolved, ec);
  if (ec || !exists) {
    return makeError<std::filesystem::path>(
        "Config field '" + std::string(fieldName) + "' resolves to '" +
        resolved.string() + "' but it does not exist");
  }
  if (!std::filesystem::is_directory(resolved, ec) || ec) {
    return makeError<std::filesystem::path>(
        "Config field '" + std::string(fieldName) + "' resolves to '" +
        resolved.string() + "' but it is not a directory");
  }
  return Result<std::filesystem::path, std::string>::makeResult(resolved);
}

[[nodiscard]] Result<bool, std::string>
parseLogSection(yyjson_val *logObj, const std::filesystem::path &baseDir,
                RuntimeLogConfig &out) {
  if (logObj == nullptr) {
    return Result<bool, std::string>::makeResult(true);
  }
  auto keysResult = validateUnknownKeys(logObj, "log", kLogKeys);
  if (keysResult.hasError()) {
    return keysResult;
  }

  auto levelText = optionalStringField(logObj, "level", "log");
  if (levelText.hasError()) {
    return makeError<bool>(levelText.error());
  }
  if (levelText.value()) {
    auto level = parseLogLevel(*levelText.value(), "log.level");
    if (level.hasError()) {
      return makeError<bool>(level.error());
    }
    out.level = level.value();
  }

  auto consoleText = optionalStringField(logObj, "console_level", "log");
  if (consoleText.hasError()) {
    return makeError<bool>(consoleText.error());
  }
  if (consoleText.value()) {
    auto level = parseLogLevel(*consoleText.value(), "log.console_level");
    if (level.hasError()) {
      return makeError<bool>(level.error());
    }
    out.consoleLevel = level.value();
  }

  auto fileText = optionalStringField(logObj, "file", "log");
  if (fileText.hasError()) {
    return makeError<bool>(fileText.error());
  }
  if (fileText.value() && !fileText.value()->empty()) {
    out.file = resolvePath(*fileText.value(), baseDir);
  }
  return Result<bool, std::string>::makeResult(true);
}

[[nodiscard]] Result<bool, std::string>
parseTexturesSection(yyjson_val *texturesObj,
                     const std::filesystem::path &baseDir,
                     RuntimeTextureConfig &out) {
  if (texturesObj == nullptr) {
    return Result<bool, std::string>::makeResult(true);
  }
  auto keysResult = validateUnknownKeys(texturesObj, "textures", kTexturesKeys);
  if (keysResult.hasError()) {
    return keysResult;
  }

  yyjson_val *rootsVal = yyjson_obj_get(texturesObj, "search_roots");
  if (rootsVal != nullptr) {
    if (!yyjson_is_arr(rootsVal)) {
      return makeError<bool>(
          "Config field 'textures.search_roots' must be an array of strings");
    }
    size_t idx = 0;
    size_t max = 0;
    yyjson_val *entry = nullptr;
    yyjson_arr_foreach(rootsVal, idx, max, entry) {
      const std::string entryName =
          "textures.search_roots[" + std::to_string(idx) + "]";
      if (!yyjson_is_str(entry)) {
        return makeError<bool>("Config field '" + entryName +
                               "' must be a string");
      }
      auto rootResult =
          resolveDirectory(yyjson_get_str(entry), baseDir, entryName);
      if (rootResult.hasError()) {
        return makeError<bool>(rootResult.error());
      }
      out.searchRoots.push_back(std::move(rootResult.value()));
    }
  }

  auto policyText =
      optionalStringField(texturesObj, "unresolved_policy", "textures");
  if (policyText.hasError()) {
    return makeError<bool>(policyText.error());
  }
  if (policyText.value()) {
    auto policy = parseUnresolvedPolicy(*policyText.value());
    if (policy.hasError()) {
      return makeError<bool>(policy.error());
    }
    out.unresolvedPolicy = policy.value();
  }
  return Result<bool, std::string>::makeResult(true);
}

} // namespace

LogConfig RuntimeConfig::toLogConfig() const {
  LogConfig config{};
  config.filePath = log.file.string();
  config.logLevel = log.level;
  config.consoleLevel = log.consoleLevel;
  return config;
}

Result<RuntimeConfig, std::string>
parseRuntimeConfig(std::string_view jsonText,
                   const std::filesystem::path &baseDir) {
  yyjson_read_err parseError{};
  yyjson_doc *rawDoc =
      yyjson_read_opts(const_cast<char *>(jsonText.data()), jsonText.size(), 0,
                       nullptr, &parseError);
  if (!rawDoc) {
    const std::string message =
        parseError.msg != nullptr ? parseError.msg : "unknown parse error";
    return makeError<RuntimeConfig>("Failed to parse config at byte " +
                                    std::to_string(parseError.pos) + ": " +
                                    message);
  }
  std::unique_ptr<yyjson_doc, decltype(&yyjson_doc_free)> doc(rawDoc,
                                                              &yyjson_doc_free);

  yyjson_val *root = yyjson_doc_get_root(doc.get());
  if (!yyjson_is_obj(root)) {
    return makeError<RuntimeConfig>("Config root must be a JSON object");
  }
  auto rootKeysResult = validateUnknownKeys(root, "", kRootObjectKeys);
  if (rootKeysResult.hasError()) {
    return makeError<RuntimeConfig>(rootKeysResult.error());
  }

  auto logObjResult = optionalObjectField(root, "log", "");
  if (logObjResult.hasError()) {
    return makeError<RuntimeConfig>(logObjResult.error());
  }
  auto texturesObjResult = optionalObjectField(root, "textures", "");
  if (texturesObjResult.hasError()) {
    return makeError<RuntimeConfig>(texturesObjResult.error());
  }

  RuntimeConfig config{};
  auto logResult = parseLogSection(logObjResult.value(), baseDir, config.log);
  if (logResult.hasError()) {
    return makeError<RuntimeConfig>(logResult.error());
  }
  auto texturesResult =
      parseTexturesSection(texturesObjResult.value(), baseDir, config.textures);
  if (texturesResult.hasError()) {
    return makeError<RuntimeConfig>(texturesResult.error());
  }
  return Result<RuntimeConfig, std::string>::makeResult(std::move(config));
}

Result<RuntimeConfig, std::string>
loadRuntimeConfig(const std::filesystem::path &configPath) {
  VNB_PROFILER_FUNCTION();

  const std::filesystem::path normalizedConfigPath = normalizePath(configPath);
  std::error_code ec;
  if (!std::filesystem::exists(normalizedConfigPath, ec) || ec) {
    return makeError<RuntimeConfig>("Config file does not exist: '" +
                                    normalizedConfigPath.string() + "'");
  }
  if (!std::filesystem::is_regular_file(normalizedConfigPath, ec) || ec) {
    return makeError<RuntimeConfig>("Config path is not a file: '" +
                                    normalizedConfigPath.string() + "'");
  }

  auto textResult = readTextFile(normalizedConfigPath);
  if (textResult.hasError()) {
    return makeError<RuntimeConfig>(textResult.error());
  }

  auto configResult = parseRuntimeConfig(textResult.value(),
                                         normalizedConfigPath.parent_path());
  if (configResult.hasError()) {
    return makeError<RuntimeConfig>("'" + normalizedConfigPath.string() +
                                    "': " + configResult.error());
  }
  configResult.value().sourcePath = normalizedConfigPath;
  return configResult;
}

Result<RuntimeConfig, std::string> loadRuntimeConfig() {
  const std::filesystem::path defaultPath{kDefaultConfigPath};
  std::error_code ec;
  if (!std::filesystem::exists(defaultPath, ec)) {
    return Result<RuntimeConfig, std::string>::makeResult(RuntimeConfig{});
  }
  return loadRuntimeConfig(defaultPath);
}

Result<RuntimeConfig, std::string> loadRuntimeConfigFromEnvOrDefault() {
#if defined(_WIN32)
  struct CFreeDeleter {
    void operator()(char *value) const noexcept { std::free(value); }
  };

  char *envConfigPathRaw = nullptr;
  size_t envConfigPathSize = 0;
  const int envReadError =
      _dupenv_s(&envConfigPathRaw, &envConfigPathSize, kToolConfigEnvVarCStr);
  std::unique_ptr<char, CFreeDeleter> envConfigPath(envConfigPathRaw);
  if (envReadError != 0) {
    return makeError<RuntimeConfig>("Failed to read environment variable '" +
                                    std::string(kToolConfigEnvVar) +
                                    "' (error " + std::to_string(envReadError) +
                                    ")");
  }
  if (envConfigPath != nullptr && envConfigPath.get()[0] != '\0') {
    return loadRuntimeConfig(std::filesystem::path{envConfigPath.get()});
  }
#else
  const char *envConfigPath = std::getenv(kToolConfigEnvVarCStr);
  if (envConfigPath != nullptr && envConfigPath[0] != '\0') {
    return loadRuntimeConfig(std::filesystem::path{envConfigPath});
  }
#endif
  return loadRuntimeConfig();
}

} // namespace vnb
