#pragma once

#include "vnb/math/types.h"
#include "vnb/pch.h"
#include "vnb/resources/cpu/mesh_container.h"

namespace vnb {

// Optional vertex attributes carried by a MeshData. Position is implied.
enum MeshAttribute : uint32_t {
  kMeshAttributeNormal = 1u << 0u,
  kMeshAttributeTangent = 1u << 1u,
  kMeshAttributeColor = 1u << 2u,
  kMeshAttributeUv0 = 1u << 3u,
  kMeshAttributeUv1 = 1u << 4u,
};

struct Vertex {
  glm::vec3 position{};
  glm::vec3 normal{};
  glm::vec4 tangent{};
  glm::vec4 color{1.0f};
  glm::vec2 uv0{};
  glm::vec2 uv1{};
};

struct Submesh {
  Topology topology = Topology::Triangles;
  uint32_t indexOffset = 0;
  uint32_t indexCount = 0;
  int32_t baseVertex = 0;
  std::optional<uint32_t> materialIndex;
  BoundingBox bounds{glm::vec3(0.0f), glm::vec3(0.0f)};
};

struct MeshData {
  std::pmr::vector<Vertex> vertices;
  std::pmr::vector<uint32_t> indices;
  std::pmr::vector<Submesh> submeshes;
  std::pmr::string name;
  uint32_t attributes = kMeshAttributeNormal | kMeshAttributeUv0;
  BoundingBox bounds{glm::vec3(0.0f), glm::vec3(0.0f)};

  explicit MeshData(
      std::pmr::memory_resource *mem = std::pmr::get_default_resource())
      : vertices(mem), indices(mem), submeshes(mem), name(mem) {}

  [[nodiscard]] bool hasAttribute(uint32_t attribute) const noexcept {
    return (attributes & attribute) != 0u;
  }
};

} // namespace vnb
