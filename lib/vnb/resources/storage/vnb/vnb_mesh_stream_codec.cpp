#include "vnb/pch.h"

#include "vnb/resources/storage/vnb/vnb_mesh_stream_codec.h"

namespace vnb {
namespace {

struct StreamDesc {
  uint32_t flag;
  uint32_t components;
  std::vector<float> MeshContainer::*member;
  std::string_view name;
};

// Wire order after positions.
constexpr std::array<StreamDesc, 5> kOptionalStreams = {{
    {kVnbMeshFlagHasNormals, kVnbNormalComponents, &MeshContainer::normals,
     "normals"},
    {kVnbMeshFlagHasTangents, kVnbTangentComponents, &MeshContainer::tangents,
     "tangents"},
    {kVnbMeshFlagHasVertexColors, kVnbColorComponents, &MeshContainer::colors,
     "colors"},
    {kVnbMeshFlagHasUv0, kVnbUvComponents, &MeshContainer::uv0, "uv0"},
    {kVnbMeshFlagHasUv1, kVnbUvComponents, &MeshContainer::uv1, "uv1"},
}};

template <typename T>
[[nodiscard]] Result<T, VnbFormatError> truncated(std::string_view what,
                                                  uint64_t needBytes,
                                                  size_t haveBytes) {
  return makeVnbError<T>(VnbErrorCode::TruncatedInput,
                         "vnbReadMeshStreams: truncated ", what, " (need ",
                         needBytes, " bytes, have ", haveBytes, ")");
}

[[nodiscard]] Result<bool, VnbFormatError>
readStream(VnbByteReader &reader, uint64_t vertexCount, uint32_t components,
           std::string_view name, std::vector<float> &out) {
  uint64_t floatCount = 0;
  uint64_t byteCount = 0;
  if (!checkedMulToU64(vertexCount, components, floatCount) ||
      !checkedMulToU64(floatCount, sizeof(float), byteCount)) {
    return makeVnbError<bool>(VnbErrorCode::TruncatedInput,
                              "vnbReadMeshStreams: ", name,
                              " size overflows");
  }
  if (!reader.readFloatArray(floatCount, out)) {
    return truncated<bool>(name, byteCount, reader.remaining());
  }
  return Result<bool, VnbFormatError>::makeResult(true);
}

} // namespace

Result<bool, VnbFormatError> vnbValidateMeshStreams(const MeshContainer &mesh) {
  if (!mesh.hasFeature(kVnbMeshFlagHasPositions)) {
    return makeVnbError<bool>(VnbErrorCode::InvariantViolation,
                              "vnbValidateMeshStreams: HasPositions is clear");
  }
  if ((mesh.positions.size() % kVnbPositionComponents) != 0u) {
    return makeVnbError<bool>(
        VnbErrorCode::InvariantViolation,
        "vnbValidateMeshStreams: positions length ", mesh.positions.size(),
        " is not a multiple of ", kVnbPositionComponents);
  }

  const uint64_t vertexCount = mesh.vertexCount();
  for (const StreamDesc &stream : kOptionalStreams) {
    const std::vector<float> &values = mesh.*(stream.member);
    if (!mesh.hasFeature(stream.flag)) {
      if (!values.empty()) {
        return makeVnbError<bool>(VnbErrorCode::InvariantViolation,
                                  "vnbValidateMeshStreams: ", stream.name,
                                  " holds data but its flag is clear");
      }
      continue;
    }
    const uint64_t expected = vertexCount * stream.components;
    if (values.size() != expected) {
      return makeVnbError<bool>(
          VnbErrorCode::InvariantViolation, "vnbValidateMeshStreams: ",
          stream.name, " has ", values.size(), " floats, expected ", expected);
    }
  }

  if (mesh.hasFeature(kVnbMeshFlagHasBounds) != mesh.bounds.has_value()) {
    return makeVnbError<bool>(
        VnbErrorCode::InvariantViolation,
        "vnbValidateMeshStreams: HasBounds disagrees with bounds presence");
  }
  if (mesh.hasFeature(kVnbMeshFlagIndicesU16) != mesh.usesU16Indices()) {
    return makeVnbError<bool>(
        VnbErrorCode::InvariantViolation,
        "vnbValidateMeshStreams: IndicesU16 disagrees with held index width");
  }
  return Result<bool, VnbFormatError>::makeResult(true);
}

Result<bool, VnbFormatError> vnbWriteMeshStreams(VnbByteWriter &writer,
                                                 const MeshContainer &mesh) {
  auto nameResult = writer.writeLengthPrefixedUtf8(mesh.name);
  if (nameResult.hasError()) {
    return nameResult;
  }

  writer.writeFloatArray(mesh.positions);
  for (const StreamDesc &stream : kOptionalStreams) {
    if (mesh.hasFeature(stream.flag)) {
      writer.writeFloatArray(mesh.*(stream.member));
    }
  }

  if (mesh.bounds) {
    const BoundingBox &bounds = *mesh.bounds;
    const std::array<float, 6> packed = {bounds.min_.x, bounds.min_.y,
                                         bounds.min_.z, bounds.max_.x,
                                         bounds.max_.y, bounds.max_.z};
    writer.writeFloatArray(packed);
  }

  if (const auto *u16 = std::get_if<std::vector<uint16_t>>(&mesh.indices)) {
    writer.writeU16Array(*u16);
  } else {
    writer.writeU32Array(std::get<std::vector<uint32_t>>(mesh.indices));
  }
  return Result<bool, VnbFormatError>::makeResult(true);
}

Result<bool, VnbFormatError> vnbReadMeshStreams(VnbByteReader &reader,
                                                const VnbBinaryHeader &header,
                                                MeshContainer &mesh) {
  if ((header.featureFlags & kVnbMeshFlagHasPositions) == 0u) {
    return makeVnbError<bool>(VnbErrorCode::InvariantViolation,
                              "vnbReadMeshStreams: header lacks HasPositions");
  }

  mesh.featureFlags = header.featureFlags;
  if (!reader.readLengthPrefixedUtf8(mesh.name)) {
    return truncated<bool>("name", sizeof(uint16_t), reader.remaining());
  }

  const uint64_t vertexCount = header.vertexCount;
  auto positionsResult = readStream(reader, vertexCount,
                                    kVnbPositionComponents, "positions",
                                    mesh.positions);
  if (positionsResult.hasError()) {
    return positionsResult;
  }
  for (const StreamDesc &stream : kOptionalStreams) {
    std::vector<float> &values = mesh.*(stream.member);
    values.clear();
    if ((header.featureFlags & stream.flag) == 0u) {
      continue;
    }
    auto streamResult =
        readStream(reader, vertexCount, stream.components, stream.name, values);
    if (streamResult.hasError()) {
      return streamResult;
    }
  }

  mesh.bounds.reset();
  if ((header.featureFlags & kVnbMeshFlagHasBounds) != 0u) {
    std::array<float, 6> packed{};
    if (!reader.readPod(packed)) {
      return truncated<bool>("bounds", sizeof(packed), reader.remaining());
    }
    mesh.bounds = BoundingBox(glm::vec3(packed[0], packed[1], packed[2]),
                              glm::vec3(packed[3], packed[4], packed[5]));
  }

  const uint64_t indexCount = header.indexCount;
  if ((header.featureFlags & kVnbMeshFlagIndicesU16) != 0u) {
    std::vector<uint16_t> indices;
    if (!reader.readU16Array(indexCount, indices)) {
      return truncated<bool>("16-bit indices", indexCount * sizeof(uint16_t),
                             reader.remaining());
    }
    mesh.indices = std::move(indices);
  } else {
    std::vector<uint32_t> indices;
    if (!reader.readU32Array(indexCount, indices)) {
      return truncated<bool>("32-bit indices", indexCount * sizeof(uint32_t),
                             reader.remaining());
    }
    mesh.indices = std::move(indices);
  }
  return Result<bool, VnbFormatError>::makeResult(true);
}

} // namespace vnb
