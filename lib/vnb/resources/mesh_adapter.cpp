#include "vnb/pch.h"

#include "vnb/resources/mesh_adapter.h"

#include "vnb/resources/storage/vnb/vnb_binary_format.h"
#include "vnb/resources/storage/vnb/vnb_mesh_stream_codec.h"

namespace vnb {
namespace {

template <typename T>
void appendComponents(std::vector<float> &out, const T &value) {
  for (glm::length_t i = 0; i < T::length(); ++i) {
    out.push_back(value[i]);
  }
}

template <typename T>
[[nodiscard]] T loadComponents(const std::vector<float> &values,
                               size_t vertexIndex) {
  T out{};
  const size_t base = vertexIndex * static_cast<size_t>(T::length());
  for (glm::length_t i = 0; i < T::length(); ++i) {
    out[i] = values[base + static_cast<size_t>(i)];
  }
  return out;
}

[[nodiscard]] std::vector<uint32_t> widenIndices(const IndexBuffer &indices) {
  if (const auto *u16 = std::get_if<std::vector<uint16_t>>(&indices)) {
    return std::vector<uint32_t>(u16->begin(), u16->end());
  }
  return std::get<std::vector<uint32_t>>(indices);
}

[[nodiscard]] BoundingBox computeBounds(std::span<const Vertex> vertices) {
  if (vertices.empty()) {
    return BoundingBox(glm::vec3(0.0f), glm::vec3(0.0f));
  }
  BoundingBox bounds(vertices.front().position, vertices.front().position);
  for (const Vertex &vertex : vertices) {
    bounds.expand(vertex.position);
  }
  return bounds;
}

} // namespace

Result<MeshContainer, VnbFormatError>
meshContainerFromMeshData(const MeshData &data,
                          const MeshContainerBuildOptions &options) {
  const size_t vertexCount = data.vertices.size();
  if (vertexCount > std::numeric_limits<uint32_t>::max() ||
      data.indices.size() > std::numeric_limits<uint32_t>::max()) {
    return makeVnbError<MeshContainer>(
        VnbErrorCode::InvariantViolation,
        "meshContainerFromMeshData: mesh '", data.name,
        "' exceeds 32-bit element counts");
  }

  MeshContainer mesh{};
  mesh.name = std::string(data.name);
  mesh.featureFlags = kVnbMeshFlagHasPositions;

  const bool normals =
      options.includeNormals && data.hasAttribute(kMeshAttributeNormal);
  const bool tangents =
      options.includeTangents && data.hasAttribute(kMeshAttributeTangent);
  const bool colors =
      options.includeColors && data.hasAttribute(kMeshAttributeColor);
  const bool uv0 = options.includeUv0 && data.hasAttribute(kMeshAttributeUv0);
  const bool uv1 = options.includeUv1 && data.hasAttribute(kMeshAttributeUv1);

  mesh.positions.reserve(vertexCount * kVnbPositionComponents);
  for (const Vertex &vertex : data.vertices) {
    appendComponents(mesh.positions, vertex.position);
    if (normals) {
      appendComponents(mesh.normals, vertex.normal);
    }
    if (tangents) {
      appendComponents(mesh.tangents, vertex.tangent);
    }
    if (colors) {
      appendComponents(mesh.colors, vertex.color);
    }
    if (uv0) {
      appendComponents(mesh.uv0, vertex.uv0);
    }
    if (uv1) {
      appendComponents(mesh.uv1, vertex.uv1);
    }
  }
  if (options.includeBounds && vertexCount > 0) {
    mesh.bounds = computeBounds(data.vertices);
  }

  const bool fitsU16 =
      vertexCount <= std::numeric_limits<uint16_t>::max() &&
      std::all_of(data.indices.begin(), data.indices.end(), [](uint32_t index) {
        return index <= std::numeric_limits<uint16_t>::max();
      });
  if (options.compactIndices && fitsU16) {
    mesh.indices =
        std::vector<uint16_t>(data.indices.begin(), data.indices.end());
  } else {
    mesh.indices = std::vector<uint32_t>(data.indices.begin(), data.indices.end());
  }

  mesh.subMeshes.reserve(data.submeshes.size());
  for (size_t i = 0; i < data.submeshes.size(); ++i) {
    const Submesh &submesh = data.submeshes[i];
    uint64_t end = 0;
    if (!checkedAddToU64(submesh.indexOffset, submesh.indexCount, end) ||
        end > data.indices.size()) {
      return makeVnbError<MeshContainer>(
          VnbErrorCode::InvariantViolation, "meshContainerFromMeshData: submesh ",
          i, " index range exceeds ", data.indices.size(), " indices");
    }
    if (submesh.materialIndex && *submesh.materialIndex >= kVnbNoMaterialIndex) {
      return makeVnbError<MeshContainer>(
          VnbErrorCode::InvariantViolation, "meshContainerFromMeshData: submesh ",
          i, " material index ", *submesh.materialIndex,
          " does not fit in 16 bits");
    }

    SubMeshRange range{};
    range.topology = submesh.topology;
    if (submesh.materialIndex) {
      range.materialIndex = static_cast<uint16_t>(*submesh.materialIndex);
    }
    range.startIndex = submesh.indexOffset;
    range.indexCount = submesh.indexCount;
    range.baseVertex = submesh.baseVertex;

    // Referenced vertex window, for consumers that upload per range.
    if (submesh.indexCount > 0) {
      const auto first = data.indices.begin() + submesh.indexOffset;
      const auto [minIt, maxIt] =
          std::minmax_element(first, first + submesh.indexCount);
      const int64_t lo = static_cast<int64_t>(*minIt) + submesh.baseVertex;
      const int64_t hi = static_cast<int64_t>(*maxIt) + submesh.baseVertex;
      if (lo >= 0 && hi >= lo) {
        range.firstVertex = static_cast<uint32_t>(lo);
        range.vertexCount = static_cast<uint32_t>(hi - lo + 1);
      }
    }
    mesh.subMeshes.push_back(range);
  }

  syncFeatureFlags(mesh);
  return Result<MeshContainer, VnbFormatError>::makeResult(std::move(mesh));
}

Result<MeshData, VnbFormatError>
meshDataFromContainer(const MeshContainer &mesh,
                      std::pmr::memory_resource *mem) {
  auto validResult = vnbValidateMeshStreams(mesh);
  if (validResult.hasError()) {
    return std::move(validResult).forwardError<MeshData>();
  }

  const size_t vertexCount = mesh.vertexCount();
  MeshData data(mem);
  data.name = mesh.name;
  data.attributes = 0;
  if (mesh.hasFeature(kVnbMeshFlagHasNormals)) {
    data.attributes |= kMeshAttributeNormal;
  }
  if (mesh.hasFeature(kVnbMeshFlagHasTangents)) {
    data.attributes |= kMeshAttributeTangent;
  }
  if (mesh.hasFeature(kVnbMeshFlagHasVertexColors)) {
    data.attributes |= kMeshAttributeColor;
  }
  if (mesh.hasFeature(kVnbMeshFlagHasUv0)) {
    data.attributes |= kMeshAttributeUv0;
  }
  if (mesh.hasFeature(kVnbMeshFlagHasUv1)) {
    data.attributes |= kMeshAttributeUv1;
  }

  data.vertices.resize(vertexCount);
  for (size_t v = 0; v < vertexCount; ++v) {
    Vertex &vertex = data.vertices[v];
    vertex.position = loadComponents<glm::vec3>(mesh.positions, v);
    if (data.hasAttribute(kMeshAttributeNormal)) {
      vertex.normal = loadComponents<glm::vec3>(mesh.normals, v);
    }
    if (data.hasAttribute(kMeshAttributeTangent)) {
      vertex.tangent = loadComponents<glm::vec4>(mesh.tangents, v);
    }
    if (data.hasAttribute(kMeshAttributeColor)) {
      vertex.color = loadComponents<glm::vec4>(mesh.colors, v);
    }
    if (data.hasAttribute(kMeshAttributeUv0)) {
      vertex.uv0 = loadComponents<glm::vec2>(mesh.uv0, v);
    }
    if (data.hasAttribute(kMeshAttributeUv1)) {
      vertex.uv1 = loadComponents<glm::vec2>(mesh.uv1, v);
    }
  }

  const std::vector<uint32_t> indices = widenIndices(mesh.indices);
  data.indices.assign(indices.begin(), indices.end());
  data.bounds = mesh.bounds ? *mesh.bounds : computeBounds(data.vertices);

  data.submeshes.reserve(mesh.subMeshes.size());
  for (size_t i = 0; i < mesh.subMeshes.size(); ++i) {
    const SubMeshRange &range = mesh.subMeshes[i];
    uint64_t end = 0;
    if (!checkedAddToU64(range.startIndex, range.indexCount, end) ||
        end > indices.size()) {
      return makeVnbError<MeshData>(
          VnbErrorCode::InvariantViolation, "meshDataFromContainer: submesh ",
          i, " index range [", range.startIndex, ", ", end,
          ") exceeds ", indices.size(), " indices");
    }
    if (range.materialIndex && *range.materialIndex >= mesh.materials.size()) {
      return makeVnbError<MeshData>(
          VnbErrorCode::InvariantViolation, "meshDataFromContainer: submesh ",
          i, " references material ", *range.materialIndex, " of ",
          mesh.materials.size());
    }

    Submesh submesh{};
    submesh.topology = range.topology;
    submesh.indexOffset = range.startIndex;
    submesh.indexCount = range.indexCount;
    submesh.baseVertex = range.baseVertex;
    if (range.materialIndex) {
      submesh.materialIndex = *range.materialIndex;
    }

    bool first = true;
    for (uint32_t k = 0; k < range.indexCount; ++k) {
      const int64_t vertexIndex =
          static_cast<int64_t>(indices[range.startIndex + k]) +
          range.baseVertex;
      if (vertexIndex < 0 ||
          vertexIndex >= static_cast<int64_t>(vertexCount)) {
        return makeVnbError<MeshData>(
            VnbErrorCode::InvariantViolation,
            "meshDataFromContainer: submesh ", i, " references vertex ",
            vertexIndex, " of ", vertexCount);
      }
      const glm::vec3 &position =
          data.vertices[static_cast<size_t>(vertexIndex)].position;
      if (first) {
        submesh.bounds = BoundingBox(position, position);
        first = false;
      } else {
        submesh.bounds.expand(position);
      }
    }
    data.submeshes.push_back(submesh);
  }

  return Result<MeshData, VnbFormatError>::makeResult(std::move(data));
}

} // namespace vnb
