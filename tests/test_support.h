#pragma once

#include "vnb/core/log.h"
#include "vnb/pch.h"
#include "vnb/resources/cpu/mesh_container.h"

namespace vnb::test {

struct CapturedLine {
  LogLevel level;
  std::string message;
};

// Log sink recording every line. Lines are shared with the installing test so
// they stay readable after the sink is uninstalled.
class CapturingLog final : public Log {
public:
  explicit CapturingLog(std::shared_ptr<std::vector<CapturedLine>> lines)
      : lines_(std::move(lines)) {}

  void write(LogLevel level, std::string_view message) override {
    std::scoped_lock lock(mutex_);
    lines_->push_back(CapturedLine{level, std::string(message)});
  }

private:
  std::mutex mutex_;
  std::shared_ptr<std::vector<CapturedLine>> lines_;
};

// Installs a CapturingLog for the lifetime of the guard.
class ScopedLogCapture {
public:
  ScopedLogCapture();
  ~ScopedLogCapture();

  ScopedLogCapture(const ScopedLogCapture &) = delete;
  ScopedLogCapture &operator=(const ScopedLogCapture &) = delete;

  [[nodiscard]] bool contains(LogLevel level, std::string_view needle) const;
  [[nodiscard]] const std::vector<CapturedLine> &lines() const {
    return *lines_;
  }

private:
  std::shared_ptr<std::vector<CapturedLine>> lines_;
};

class ScopedTempDir {
public:
  ScopedTempDir();
  ~ScopedTempDir();

  ScopedTempDir(const ScopedTempDir &) = delete;
  ScopedTempDir &operator=(const ScopedTempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

  void writeFile(const std::filesystem::path &relative,
                 std::span<const std::byte> bytes) const;
  void writeText(const std::filesystem::path &relative,
                 std::string_view text) const;

private:
  std::filesystem::path path_;
};

// Little-endian byte builder for hand-written fixtures.
class ByteBuilder {
public:
  ByteBuilder &u8(uint8_t value) { return pod(value); }
  ByteBuilder &u16(uint16_t value) { return pod(value); }
  ByteBuilder &u32(uint32_t value) { return pod(value); }
  ByteBuilder &i32(int32_t value) { return pod(value); }
  ByteBuilder &f32(float value) { return pod(value); }
  ByteBuilder &floats(std::initializer_list<float> values) {
    for (const float value : values) {
      f32(value);
    }
    return *this;
  }
  ByteBuilder &text(std::string_view value) {
    for (const char c : value) {
      bytes_.push_back(static_cast<std::byte>(c));
    }
    return *this;
  }

  [[nodiscard]] const std::vector<std::byte> &bytes() const { return bytes_; }

private:
  template <typename T> ByteBuilder &pod(const T &value) {
    const auto *raw = reinterpret_cast<const std::byte *>(&value);
    bytes_.insert(bytes_.end(), raw, raw + sizeof(T));
    return *this;
  }

  std::vector<std::byte> bytes_;
};

[[nodiscard]] std::vector<std::byte> bytesOf(std::string_view text);
[[nodiscard]] std::vector<std::byte> bytesOf(std::initializer_list<int> values);

// Positions-only triangle with 32-bit indices and one untextured submesh.
[[nodiscard]] MeshContainer makeTriangle();

// Quad with every optional stream, 16-bit indices, bounds, two submeshes and
// two materials, one of them textured with transforms and samplers.
[[nodiscard]] MeshContainer makeFullQuad();

} // namespace vnb::test
