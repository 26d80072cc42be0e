#include "vnb/pch.h"

#include "vnb/resources/storage/vnb/vnb_serializer.h"

#include "vnb/core/log.h"
#include "vnb/core/profiling.h"
#include "vnb/resources/storage/vnb/vnb_binary_format.h"
#include "vnb/resources/storage/vnb/vnb_byte_io.h"
#include "vnb/resources/storage/vnb/vnb_header_codec.h"
#include "vnb/resources/storage/vnb/vnb_legacy_parser.h"
#include "vnb/resources/storage/vnb/vnb_material_codec.h"
#include "vnb/resources/storage/vnb/vnb_mesh_stream_codec.h"
#include "vnb/resources/storage/vnb/vnb_submesh_codec.h"

namespace vnb {
namespace {

[[nodiscard]] uint64_t estimateEncodedSize(const MeshContainer &mesh) {
  uint64_t floats = mesh.positions.size() + mesh.normals.size() +
                    mesh.tangents.size() + mesh.colors.size() +
                    mesh.uv0.size() + mesh.uv1.size();
  const uint64_t indexBytes =
      mesh.indexCount() * (mesh.usesU16Indices() ? sizeof(uint16_t)
                                                 : sizeof(uint32_t));
  return sizeof(VnbBinaryHeader) + sizeof(uint16_t) + mesh.name.size() +
         floats * sizeof(float) + indexBytes +
         mesh.subMeshes.size() * sizeof(VnbBinarySubMeshRecord);
}

} // namespace

Result<std::vector<std::byte>, VnbFormatError>
vnbEncode(const MeshContainer &mesh) {
  VNB_PROFILER_FUNCTION_COLOR(VNB_PROFILER_COLOR_ENCODE);
  using EncodeResult = Result<std::vector<std::byte>, VnbFormatError>;

  if (!vnbIsLittleEndianHost()) {
    return makeVnbError<std::vector<std::byte>>(
        VnbErrorCode::InvariantViolation,
        "vnbEncode: unsupported host endianness");
  }

  auto validResult = vnbValidateMeshStreams(mesh);
  if (validResult.hasError()) {
    return std::move(validResult).forwardError<std::vector<std::byte>>();
  }
  auto headerResult = vnbMakeHeader(mesh);
  if (headerResult.hasError()) {
    return std::move(headerResult).forwardError<std::vector<std::byte>>();
  }

  const uint64_t estimate = estimateEncodedSize(mesh);
  VnbByteWriter writer(
      estimate > std::numeric_limits<size_t>::max() ? 0 : estimate);
  vnbWriteHeader(writer, headerResult.value());

  auto streamsResult = vnbWriteMeshStreams(writer, mesh);
  if (streamsResult.hasError()) {
    return std::move(streamsResult).forwardError<std::vector<std::byte>>();
  }
  auto subMeshResult = vnbWriteSubMeshes(writer, mesh.subMeshes);
  if (subMeshResult.hasError()) {
    return std::move(subMeshResult).forwardError<std::vector<std::byte>>();
  }
  auto materialResult = vnbWriteMaterials(writer, mesh.materials);
  if (materialResult.hasError()) {
    return std::move(materialResult).forwardError<std::vector<std::byte>>();
  }

  VNB_LOG_TRACE("vnbEncode: '%s' %zu vertices, %zu indices -> %zu bytes",
                mesh.name.c_str(), mesh.vertexCount(), mesh.indexCount(),
                writer.size());
  return EncodeResult::makeResult(std::move(writer).release());
}

Result<std::optional<MeshContainer>, VnbFormatError>
vnbDecodeCurrent(std::span<const std::byte> bytes) {
  VNB_PROFILER_FUNCTION_COLOR(VNB_PROFILER_COLOR_DECODE);
  using DecodeResult = Result<std::optional<MeshContainer>, VnbFormatError>;

  if (!vnbIsLittleEndianHost()) {
    return makeVnbError<std::optional<MeshContainer>>(
        VnbErrorCode::InvariantViolation,
        "vnbDecodeCurrent: unsupported host endianness");
  }

  VnbByteReader reader(bytes);
  auto probeResult = vnbReadHeader(reader);
  if (probeResult.hasError()) {
    return std::move(probeResult).forwardError<std::optional<MeshContainer>>();
  }
  const VnbHeaderProbe &probe = probeResult.value();
  if (!probe.isCurrent()) {
    return DecodeResult::makeResult(std::nullopt);
  }
  const VnbBinaryHeader &header = probe.header;

  MeshContainer mesh{};
  auto streamsResult = vnbReadMeshStreams(reader, header, mesh);
  if (streamsResult.hasError()) {
    return std::move(streamsResult)
        .forwardError<std::optional<MeshContainer>>();
  }
  auto subMeshResult =
      vnbReadSubMeshes(reader, header.subMeshCount, mesh.subMeshes);
  if (subMeshResult.hasError()) {
    return std::move(subMeshResult)
        .forwardError<std::optional<MeshContainer>>();
  }
  auto materialResult =
      vnbReadMaterials(reader, header.materialCount, mesh.materials);
  if (materialResult.hasError()) {
    return std::move(materialResult)
        .forwardError<std::optional<MeshContainer>>();
  }

  if (!reader.atEnd()) {
    VNB_LOG_DEBUG("vnbDecodeCurrent: ignoring %zu trailing bytes",
                  reader.remaining());
  }
  return DecodeResult::makeResult(std::optional<MeshContainer>(std::move(mesh)));
}

Result<MeshContainer, VnbFormatError>
vnbDecode(std::span<const std::byte> bytes) {
  VNB_PROFILER_FUNCTION_COLOR(VNB_PROFILER_COLOR_DECODE);

  if (bytes.size() < sizeof(VnbBinaryHeader)) {
    VNB_LOG_DEBUG("vnbDecode: %zu bytes cannot hold a header, trying legacy",
                  bytes.size());
    return vnbDecodeLegacy(bytes);
  }

  auto currentResult = vnbDecodeCurrent(bytes);
  if (currentResult.hasError()) {
    return std::move(currentResult).forwardError<MeshContainer>();
  }
  std::optional<MeshContainer> &current = currentResult.value();
  if (!current) {
    VNB_LOG_DEBUG("vnbDecode: header is not VNB2, trying legacy");
    return vnbDecodeLegacy(bytes);
  }
  return Result<MeshContainer, VnbFormatError>::makeResult(
      std::move(*current));
}

Result<MeshContainer, VnbFormatError>
vnbDecode(std::span<const std::byte> bytes, const TextureResolver &resolver,
          UnresolvedTexturePolicy policy) {
  auto decodeResult = vnbDecode(bytes);
  if (decodeResult.hasError()) {
    return decodeResult;
  }
  auto resolveResult =
      vnbResolveExternalTextures(decodeResult.value(), resolver, policy);
  if (resolveResult.hasError()) {
    return std::move(resolveResult).forwardError<MeshContainer>();
  }
  return Result<MeshContainer, VnbFormatError>::makeResult(
      std::move(resolveResult.value().mesh));
}

} // namespace vnb
