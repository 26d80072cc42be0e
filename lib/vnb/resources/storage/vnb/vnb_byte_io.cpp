#include "vnb/pch.h"

#include "vnb/resources/storage/vnb/vnb_byte_io.h"

#include "vnb/resources/storage/vnb/vnb_binary_format.h"

namespace vnb {

bool vnbIsLittleEndianHost() noexcept {
  return std::endian::native == std::endian::little;
}

bool checkedAddToU64(uint64_t a, uint64_t b, uint64_t &out) {
  if (a > (std::numeric_limits<uint64_t>::max() - b)) {
    return false;
  }
  out = a + b;
  return true;
}

bool checkedMulToU64(uint64_t a, uint64_t b, uint64_t &out) {
  if (a == 0 || b == 0) {
    out = 0;
    return true;
  }
  if (a > (std::numeric_limits<uint64_t>::max() / b)) {
    return false;
  }
  out = a * b;
  return true;
}

void VnbByteWriter::writeBytes(std::span<const std::byte> bytes) {
  appendPodArray(bytes);
}

void VnbByteWriter::writeZeros(size_t count) {
  bytes_.resize(bytes_.size() + count, std::byte{0});
}

void VnbByteWriter::writeFloatArray(std::span<const float> values) {
  appendPodArray(values);
}

void VnbByteWriter::writeU16Array(std::span<const uint16_t> values) {
  appendPodArray(values);
}

void VnbByteWriter::writeU32Array(std::span<const uint32_t> values) {
  appendPodArray(values);
}

Result<bool, VnbFormatError>
VnbByteWriter::writeLengthPrefixedUtf8(std::string_view text) {
  if (text.size() > kVnbMaxStringBytes) {
    return makeVnbError<bool>(VnbErrorCode::StringTooLong,
                              "writeLengthPrefixedUtf8: string of ",
                              text.size(), " bytes exceeds ",
                              kVnbMaxStringBytes);
  }
  writeU16(static_cast<uint16_t>(text.size()));
  writeBytes(std::as_bytes(std::span<const char>(text.data(), text.size())));
  return Result<bool, VnbFormatError>::makeResult(true);
}

bool VnbByteReader::readBytes(size_t count, std::vector<std::byte> &out) {
  return readPodArray(count, out);
}

bool VnbByteReader::readLengthPrefixedUtf8(std::string &out) {
  uint16_t length = 0;
  if (remaining() < sizeof(length)) {
    return false;
  }
  std::memcpy(&length, bytes_.data() + offset_, sizeof(length));
  if (remaining() - sizeof(length) < length) {
    return false;
  }
  offset_ += sizeof(length);
  out.assign(reinterpret_cast<const char *>(bytes_.data() + offset_), length);
  offset_ += length;
  return true;
}

bool VnbByteReader::skip(size_t count) {
  if (remaining() < count) {
    return false;
  }
  offset_ += count;
  return true;
}

} // namespace vnb
