#pragma once

#include "vnb/defines.h"
#include "vnb/pch.h"
#include "vnb/resources/storage/vnb/vnb_format_error.h"

namespace vnb {

[[nodiscard]] VNB_API bool vnbIsLittleEndianHost() noexcept;

[[nodiscard]] bool checkedAddToU64(uint64_t a, uint64_t b, uint64_t &out);
[[nodiscard]] bool checkedMulToU64(uint64_t a, uint64_t b, uint64_t &out);

// Appends little-endian primitives to an owned byte buffer. Bulk writers emit
// no framing; the element count travels elsewhere.
class VNB_API VnbByteWriter {
public:
  VnbByteWriter() = default;
  explicit VnbByteWriter(size_t reserveBytes) { bytes_.reserve(reserveBytes); }

  void writeU8(uint8_t value) { appendPod(value); }
  void writeU16(uint16_t value) { appendPod(value); }
  void writeU32(uint32_t value) { appendPod(value); }
  void writeI32(int32_t value) { appendPod(value); }
  void writeF32(float value) { appendPod(value); }

  template <typename T> void writePod(const T &value) { appendPod(value); }

  void writeBytes(std::span<const std::byte> bytes);
  void writeZeros(size_t count);
  void writeFloatArray(std::span<const float> values);
  void writeU16Array(std::span<const uint16_t> values);
  void writeU32Array(std::span<const uint32_t> values);

  // u16 byte length followed by the raw UTF-8 bytes.
  [[nodiscard]] Result<bool, VnbFormatError>
  writeLengthPrefixedUtf8(std::string_view text);

  [[nodiscard]] size_t size() const noexcept { return bytes_.size(); }
  [[nodiscard]] std::span<const std::byte> bytes() const noexcept {
    return bytes_;
  }
  [[nodiscard]] std::vector<std::byte> release() && {
    return std::move(bytes_);
  }

private:
  template <typename T> void appendPod(const T &value) {
    static_assert(std::is_trivially_copyable_v<T>);
    const size_t offset = bytes_.size();
    bytes_.resize(offset + sizeof(T));
    std::memcpy(bytes_.data() + offset, &value, sizeof(T));
  }

  template <typename T> void appendPodArray(std::span<const T> values) {
    static_assert(std::is_trivially_copyable_v<T>);
    if (values.empty()) {
      return;
    }
    const size_t byteCount = values.size_bytes();
    const size_t offset = bytes_.size();
    bytes_.resize(offset + byteCount);
    std::memcpy(bytes_.data() + offset, values.data(), byteCount);
  }

  std::vector<std::byte> bytes_;
};

// Cursor over a borrowed byte span. Every read either fully succeeds and
// advances, or returns false and leaves the cursor untouched.
class VNB_API VnbByteReader {
public:
  explicit VnbByteReader(std::span<const std::byte> bytes) : bytes_(bytes) {}

  [[nodiscard]] bool readU8(uint8_t &out) { return readPod(out); }
  [[nodiscard]] bool readU16(uint16_t &out) { return readPod(out); }
  [[nodiscard]] bool readU32(uint32_t &out) { return readPod(out); }
  [[nodiscard]] bool readI32(int32_t &out) { return readPod(out); }
  [[nodiscard]] bool readF32(float &out) { return readPod(out); }

  template <typename T> [[nodiscard]] bool readPod(T &out) {
    static_assert(std::is_trivially_copyable_v<T>);
    if (remaining() < sizeof(T)) {
      return false;
    }
    std::memcpy(&out, bytes_.data() + offset_, sizeof(T));
    offset_ += sizeof(T);
    return true;
  }

  [[nodiscard]] bool readBytes(size_t count, std::vector<std::byte> &out);
  [[nodiscard]] bool readLengthPrefixedUtf8(std::string &out);
  [[nodiscard]] bool skip(size_t count);

  // Bulk readers validate the byte budget before resizing the destination.
  template <typename T, typename Allocator>
  [[nodiscard]] bool readPodArray(uint64_t count,
                                  std::vector<T, Allocator> &out) {
    static_assert(std::is_trivially_copyable_v<T>);
    uint64_t byteCount = 0;
    if (!checkedMulToU64(count, sizeof(T), byteCount) ||
        byteCount > static_cast<uint64_t>(remaining())) {
      return false;
    }
    out.resize(static_cast<size_t>(count));
    if (byteCount > 0) {
      std::memcpy(out.data(), bytes_.data() + offset_,
                  static_cast<size_t>(byteCount));
    }
    offset_ += static_cast<size_t>(byteCount);
    return true;
  }

  [[nodiscard]] bool readFloatArray(uint64_t count, std::vector<float> &out) {
    return readPodArray(count, out);
  }
  [[nodiscard]] bool readU16Array(uint64_t count, std::vector<uint16_t> &out) {
    return readPodArray(count, out);
  }
  [[nodiscard]] bool readU32Array(uint64_t count, std::vector<uint32_t> &out) {
    return readPodArray(count, out);
  }

  [[nodiscard]] bool canRead(uint64_t byteCount) const noexcept {
    return byteCount <= static_cast<uint64_t>(remaining());
  }
  [[nodiscard]] size_t offset() const noexcept { return offset_; }
  [[nodiscard]] size_t remaining() const noexcept {
    return bytes_.size() - offset_;
  }
  [[nodiscard]] bool atEnd() const noexcept { return offset_ == bytes_.size(); }

private:
  std::span<const std::byte> bytes_;
  size_t offset_ = 0;
};

} // namespace vnb
