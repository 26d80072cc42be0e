#include "vnb/pch.h"

#include "vnb/resources/storage/vnb/vnb_submesh_codec.h"

#include "vnb/resources/storage/vnb/vnb_binary_format.h"

namespace vnb {
namespace {

[[nodiscard]] bool isKnownTopology(uint8_t value) {
  return value <= static_cast<uint8_t>(Topology::Lines);
}

} // namespace

Result<bool, VnbFormatError>
vnbWriteSubMeshes(VnbByteWriter &writer,
                  std::span<const SubMeshRange> subMeshes) {
  for (size_t i = 0; i < subMeshes.size(); ++i) {
    const SubMeshRange &range = subMeshes[i];
    if (range.materialIndex && *range.materialIndex == kVnbNoMaterialIndex) {
      return makeVnbError<bool>(VnbErrorCode::InvariantViolation,
                                "vnbWriteSubMeshes: submesh ", i,
                                " material index collides with the no-material "
                                "sentinel");
    }

    VnbBinarySubMeshRecord record{};
    record.topology = static_cast<uint8_t>(range.topology);
    record.materialIndex = range.materialIndex.value_or(kVnbNoMaterialIndex);
    record.startIndex = range.startIndex;
    record.indexCount = range.indexCount;
    record.baseVertex = range.baseVertex;
    record.firstVertex = range.firstVertex;
    record.vertexCount = range.vertexCount;
    writer.writePod(record);
  }
  return Result<bool, VnbFormatError>::makeResult(true);
}

Result<bool, VnbFormatError> vnbReadSubMeshes(VnbByteReader &reader,
                                              uint32_t count,
                                              std::vector<SubMeshRange> &out) {
  uint64_t byteCount = 0;
  if (!checkedMulToU64(count, sizeof(VnbBinarySubMeshRecord), byteCount) ||
      !reader.canRead(byteCount)) {
    return makeVnbError<bool>(VnbErrorCode::TruncatedInput,
                              "vnbReadSubMeshes: ", count,
                              " records need ", byteCount, " bytes, have ",
                              reader.remaining());
  }

  out.clear();
  out.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    VnbBinarySubMeshRecord record{};
    if (!reader.readPod(record)) {
      return makeVnbError<bool>(VnbErrorCode::TruncatedInput,
                                "vnbReadSubMeshes: truncated record ", i);
    }
    if (!isKnownTopology(record.topology)) {
      return makeVnbError<bool>(VnbErrorCode::UnknownEnumValue,
                                "vnbReadSubMeshes: submesh ", i,
                                " has unknown topology ",
                                static_cast<unsigned>(record.topology));
    }

    SubMeshRange range{};
    range.topology = static_cast<Topology>(record.topology);
    if (record.materialIndex != kVnbNoMaterialIndex) {
      range.materialIndex = record.materialIndex;
    }
    range.startIndex = record.startIndex;
    range.indexCount = record.indexCount;
    range.baseVertex = record.baseVertex;
    range.firstVertex = record.firstVertex;
    range.vertexCount = record.vertexCount;
    out.push_back(range);
  }
  return Result<bool, VnbFormatError>::makeResult(true);
}

} // namespace vnb
