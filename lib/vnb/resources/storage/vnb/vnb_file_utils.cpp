#include "vnb/pch.h"

#include "vnb/resources/storage/vnb/vnb_file_utils.h"

#include "vnb/core/profiling.h"

#include <atomic>
#include <format>
#include <thread>

namespace vnb {
namespace {

template <typename T, typename... Args>
[[nodiscard]] Result<T, std::string> makeFileError(Args &&...args) {
  std::ostringstream oss;
  (oss << ... << std::forward<Args>(args));
  return Result<T, std::string>::makeError(oss.str());
}

[[nodiscard]] std::filesystem::path
makeTempSibling(const std::filesystem::path &path) {
  static std::atomic<uint64_t> counter{0};
  const size_t threadHash =
      std::hash<std::thread::id>{}(std::this_thread::get_id());
  return path.string() +
         std::format(".tmp.{:x}.{}", threadHash,
                     counter.fetch_add(1, std::memory_order_relaxed));
}

} // namespace

Result<std::vector<std::byte>, std::string>
readBinaryFile(const std::filesystem::path &path, uint64_t maxBytes) {
  VNB_PROFILER_FUNCTION_COLOR(VNB_PROFILER_COLOR_IO);
  using ReadResult = Result<std::vector<std::byte>, std::string>;

  std::ifstream input(path, std::ios::binary | std::ios::ate);
  if (!input.is_open()) {
    return makeFileError<std::vector<std::byte>>(
        "readBinaryFile: failed to open '", path.string(), "'");
  }

  const std::streampos end = input.tellg();
  if (end < 0) {
    return makeFileError<std::vector<std::byte>>(
        "readBinaryFile: failed to query size of '", path.string(), "'");
  }
  const uint64_t fileSize = static_cast<uint64_t>(end);
  if (fileSize > maxBytes ||
      fileSize > static_cast<uint64_t>(std::numeric_limits<size_t>::max())) {
    return makeFileError<std::vector<std::byte>>(
        "readBinaryFile: '", path.string(), "' is ", fileSize,
        " bytes, limit is ", maxBytes);
  }

  std::vector<std::byte> bytes(static_cast<size_t>(fileSize));
  input.seekg(0, std::ios::beg);
  if (input.fail()) {
    return makeFileError<std::vector<std::byte>>(
        "readBinaryFile: failed to seek in '", path.string(), "'");
  }
  if (!bytes.empty()) {
    input.read(reinterpret_cast<char *>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    if (input.gcount() != static_cast<std::streamsize>(bytes.size())) {
      return makeFileError<std::vector<std::byte>>(
          "readBinaryFile: short read from '", path.string(), "'");
    }
  }
  if (input.bad()) {
    return makeFileError<std::vector<std::byte>>(
        "readBinaryFile: failed to read '", path.string(), "'");
  }
  return ReadResult::makeResult(std::move(bytes));
}

Result<bool, std::string>
writeBinaryFileAtomic(const std::filesystem::path &path,
                      std::span<const std::byte> bytes) {
  VNB_PROFILER_FUNCTION_COLOR(VNB_PROFILER_COLOR_IO);
  if (path.empty()) {
    return makeFileError<bool>("writeBinaryFileAtomic: destination is empty");
  }

  std::error_code ec;
  const std::filesystem::path parent = path.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return makeFileError<bool>(
          "writeBinaryFileAtomic: cannot create '", parent.string(),
          "': ", ec.message());
    }
  }

  const std::filesystem::path tempPath = makeTempSibling(path);
  {
    std::ofstream output(tempPath, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
      return makeFileError<bool>("writeBinaryFileAtomic: cannot open '",
                                 tempPath.string(), "'");
    }
    if (!bytes.empty()) {
      output.write(reinterpret_cast<const char *>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
    }
    output.flush();
    if (!output.good()) {
      output.close();
      std::filesystem::remove(tempPath, ec);
      return makeFileError<bool>("writeBinaryFileAtomic: failed writing '",
                                 tempPath.string(), "'");
    }
  }

  std::filesystem::rename(tempPath, path, ec);
  if (ec) {
    // Some platforms refuse to rename over an existing file.
    ec.clear();
    std::filesystem::remove(path, ec);
    ec.clear();
    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
      const std::string reason = ec.message();
      std::filesystem::remove(tempPath, ec);
      return makeFileError<bool>("writeBinaryFileAtomic: cannot move '",
                                 tempPath.string(), "' to '", path.string(),
                                 "': ", reason);
    }
  }
  return Result<bool, std::string>::makeResult(true);
}

} // namespace vnb
