#include "vnb/pch.h"

#include "vnb/resources/storage/vnb/vnb_legacy_parser.h"

#include "vnb/core/log.h"
#include "vnb/core/pmr_scratch.h"
#include "vnb/core/profiling.h"
#include "vnb/resources/storage/vnb/vnb_byte_io.h"

namespace vnb {
namespace {

template <typename T, typename... Args>
[[nodiscard]] Result<T, VnbFormatError> makeLegacyError(Args &&...args) {
  return makeVnbError<T>(VnbErrorCode::LegacyParseFailure, "vnbDecodeLegacy: ",
                         std::forward<Args>(args)...);
}

// Reads `count` signed element counts, rejecting negatives, and returns their
// sum. The sum is capped at 32 bits since it becomes a header-sized count.
[[nodiscard]] Result<uint32_t, VnbFormatError>
readCounts(VnbByteReader &reader, uint32_t count, std::string_view what,
           std::pmr::vector<int32_t> &out) {
  if (!reader.readPodArray(count, out)) {
    return makeLegacyError<uint32_t>("truncated ", what, " counts");
  }
  uint64_t total = 0;
  for (size_t i = 0; i < out.size(); ++i) {
    if (out[i] < 0) {
      return makeLegacyError<uint32_t>("negative ", what, " count ", out[i],
                                       " for submesh ", i);
    }
    total += static_cast<uint64_t>(out[i]);
  }
  if (total > std::numeric_limits<uint32_t>::max()) {
    return makeLegacyError<uint32_t>(what, " total ", total,
                                     " is implausible");
  }
  return Result<uint32_t, VnbFormatError>::makeResult(
      static_cast<uint32_t>(total));
}

[[nodiscard]] bool readFloats(VnbByteReader &reader, uint64_t vectorCount,
                              uint32_t components, std::vector<float> &out) {
  uint64_t floatCount = 0;
  return checkedMulToU64(vectorCount, components, floatCount) &&
         reader.readFloatArray(floatCount, out);
}

} // namespace

Result<MeshContainer, VnbFormatError>
vnbDecodeLegacy(std::span<const std::byte> bytes) {
  VNB_PROFILER_FUNCTION_COLOR(VNB_PROFILER_COLOR_LEGACY);
  ScratchArena scratch;
  ScopedScratch scopedScratch(scratch);

  if (!vnbIsLittleEndianHost()) {
    return makeLegacyError<MeshContainer>("unsupported host endianness");
  }

  VnbByteReader reader(bytes);
  int32_t subMeshCount = 0;
  if (!reader.readI32(subMeshCount)) {
    return makeLegacyError<MeshContainer>("missing submesh count");
  }
  // Each submesh carries at least a color and three counts.
  constexpr uint64_t kMinBytesPerSubMesh =
      kVnbColorComponents * sizeof(float) + 3 * sizeof(int32_t);
  if (subMeshCount <= 0 ||
      static_cast<uint64_t>(subMeshCount) * kMinBytesPerSubMesh >
          reader.remaining()) {
    return makeLegacyError<MeshContainer>("implausible submesh count ",
                                          subMeshCount);
  }
  const uint32_t count = static_cast<uint32_t>(subMeshCount);

  std::pmr::vector<float> subMeshColors(scopedScratch.resource());
  if (!reader.readPodArray(static_cast<uint64_t>(count) * kVnbColorComponents,
                           subMeshColors)) {
    return makeLegacyError<MeshContainer>("truncated submesh colors");
  }

  std::pmr::vector<int32_t> vertexCounts(scopedScratch.resource());
  auto vertexTotalResult = readCounts(reader, count, "vertex", vertexCounts);
  if (vertexTotalResult.hasError()) {
    return std::move(vertexTotalResult).forwardError<MeshContainer>();
  }
  const uint32_t vertexTotal = vertexTotalResult.value();

  MeshContainer mesh{};
  if (!readFloats(reader, vertexTotal, kVnbPositionComponents,
                  mesh.positions)) {
    return makeLegacyError<MeshContainer>("truncated positions for ",
                                          vertexTotal, " vertices");
  }
  if (!readFloats(reader, vertexTotal, kVnbNormalComponents, mesh.normals)) {
    return makeLegacyError<MeshContainer>("truncated normals for ",
                                          vertexTotal, " vertices");
  }

  std::pmr::vector<int32_t> indexCounts(scopedScratch.resource());
  auto indexTotalResult = readCounts(reader, count, "index", indexCounts);
  if (indexTotalResult.hasError()) {
    return std::move(indexTotalResult).forwardError<MeshContainer>();
  }
  const uint32_t indexTotal = indexTotalResult.value();
  std::vector<uint32_t> indices;
  if (!reader.readU32Array(indexTotal, indices)) {
    return makeLegacyError<MeshContainer>("truncated indices, expected ",
                                          indexTotal);
  }

  std::pmr::vector<int32_t> uvCounts(scopedScratch.resource());
  auto uvTotalResult = readCounts(reader, count, "uv", uvCounts);
  if (uvTotalResult.hasError()) {
    return std::move(uvTotalResult).forwardError<MeshContainer>();
  }
  const uint32_t uvTotal = uvTotalResult.value();
  if (uvTotal != vertexTotal) {
    return makeLegacyError<MeshContainer>("uv total ", uvTotal,
                                          " differs from vertex total ",
                                          vertexTotal);
  }
  if (!readFloats(reader, uvTotal, kVnbUvComponents, mesh.uv0)) {
    return makeLegacyError<MeshContainer>("truncated uvs for ", uvTotal,
                                          " vertices");
  }

  if (!reader.atEnd()) {
    VNB_LOG_DEBUG("vnbDecodeLegacy: ignoring %zu trailing bytes",
                  reader.remaining());
  }

  mesh.colors.resize(static_cast<size_t>(vertexTotal) * kVnbColorComponents);
  size_t cursor = 0;
  for (uint32_t s = 0; s < count; ++s) {
    const float *color = subMeshColors.data() + s * kVnbColorComponents;
    const size_t rangeCount = static_cast<size_t>(vertexCounts[s]);
    for (size_t v = 0; v < rangeCount; ++v) {
      std::copy_n(color, kVnbColorComponents,
                  mesh.colors.data() + (cursor + v) * kVnbColorComponents);
    }
    cursor += rangeCount;
  }

  mesh.indices = std::move(indices);
  mesh.featureFlags = kVnbMeshFlagHasPositions | kVnbMeshFlagHasNormals |
                      kVnbMeshFlagHasUv0 | kVnbMeshFlagHasVertexColors;
  mesh.subMeshes.push_back(SubMeshRange{
      .topology = Topology::Triangles,
      .materialIndex = std::nullopt,
      .startIndex = 0,
      .indexCount = indexTotal,
      .baseVertex = 0,
      .firstVertex = 0,
      .vertexCount = vertexTotal,
  });

  VNB_LOG_DEBUG("vnbDecodeLegacy: recovered %u submeshes into %u vertices, "
                "%u indices",
                count, vertexTotal, indexTotal);
  return Result<MeshContainer, VnbFormatError>::makeResult(std::move(mesh));
}

} // namespace vnb
