#pragma once

#include "vnb/defines.h"
#include "vnb/math/types.h"
#include "vnb/pch.h"

namespace vnb {

// Container feature flags. Bits that gate a stream must agree with the
// stream contents on encode; EmbedTextures and unknown bits are carried as-is.
constexpr uint32_t kVnbMeshFlagHasPositions = 1u << 0u;
constexpr uint32_t kVnbMeshFlagHasNormals = 1u << 1u;
constexpr uint32_t kVnbMeshFlagHasTangents = 1u << 2u;
constexpr uint32_t kVnbMeshFlagHasVertexColors = 1u << 3u;
constexpr uint32_t kVnbMeshFlagHasUv0 = 1u << 4u;
constexpr uint32_t kVnbMeshFlagHasUv1 = 1u << 5u;
constexpr uint32_t kVnbMeshFlagHasBounds = 1u << 6u;
constexpr uint32_t kVnbMeshFlagIndicesU16 = 1u << 7u;
constexpr uint32_t kVnbMeshFlagEmbedTextures = 1u << 8u;

// Material flags. Factor bits and Sampler gate bytes on the wire; texture
// slot bits and TilingOffset are hints.
constexpr uint32_t kVnbMaterialFlagBaseColorFactor = 1u << 0u;
constexpr uint32_t kVnbMaterialFlagMetallicFactor = 1u << 1u;
constexpr uint32_t kVnbMaterialFlagRoughnessFactor = 1u << 2u;
constexpr uint32_t kVnbMaterialFlagEmissiveFactor = 1u << 3u;
constexpr uint32_t kVnbMaterialFlagAlphaMode = 1u << 4u;
constexpr uint32_t kVnbMaterialFlagDoubleSided = 1u << 5u;
constexpr uint32_t kVnbMaterialFlagBaseColorTex = 1u << 6u;
constexpr uint32_t kVnbMaterialFlagMetalRoughTex = 1u << 7u;
constexpr uint32_t kVnbMaterialFlagNormalTex = 1u << 8u;
constexpr uint32_t kVnbMaterialFlagOcclusionTex = 1u << 9u;
constexpr uint32_t kVnbMaterialFlagEmissiveTex = 1u << 10u;
constexpr uint32_t kVnbMaterialFlagTilingOffset = 1u << 11u;
constexpr uint32_t kVnbMaterialFlagSampler = 1u << 12u;

constexpr uint32_t kVnbMaterialGatingFlags =
    kVnbMaterialFlagBaseColorFactor | kVnbMaterialFlagMetallicFactor |
    kVnbMaterialFlagRoughnessFactor | kVnbMaterialFlagEmissiveFactor |
    kVnbMaterialFlagAlphaMode | kVnbMaterialFlagDoubleSided |
    kVnbMaterialFlagSampler;

constexpr uint32_t kVnbPositionComponents = 3;
constexpr uint32_t kVnbNormalComponents = 3;
constexpr uint32_t kVnbTangentComponents = 4;
constexpr uint32_t kVnbColorComponents = 4;
constexpr uint32_t kVnbUvComponents = 2;

enum class Topology : uint8_t { Triangles = 0, Lines = 1 };

enum class TextureSlot : uint8_t {
  BaseColor = 0,
  MetalRough = 1,
  Normal = 2,
  Occlusion = 3,
  Emissive = 4,
};

enum class TextureRefKind : uint8_t { External = 0, Embedded = 1 };

enum class AlphaMode : uint8_t { Opaque = 0, Mask = 1, Blend = 2 };

enum class TextureMime : uint8_t { Png = 0, Jpg = 1, Ktx2 = 2 };

enum class TextureWrap : uint8_t { Repeat = 0, Clamp = 1, Mirror = 2 };

enum class TextureFilter : uint8_t { Point = 0, Bilinear = 1, Trilinear = 2 };

struct SubMeshRange {
  Topology topology = Topology::Triangles;
  std::optional<uint16_t> materialIndex;
  uint32_t startIndex = 0;
  uint32_t indexCount = 0;
  int32_t baseVertex = 0;
  uint32_t firstVertex = 0;
  uint32_t vertexCount = 0;

  bool operator==(const SubMeshRange &) const = default;
};

struct TextureSampler {
  TextureWrap wrapU = TextureWrap::Repeat;
  TextureWrap wrapV = TextureWrap::Repeat;
  TextureFilter minFilter = TextureFilter::Bilinear;
  TextureFilter magFilter = TextureFilter::Bilinear;

  bool operator==(const TextureSampler &) const = default;
};

struct ExternalTexture {
  std::string uri;

  bool operator==(const ExternalTexture &) const = default;
};

struct EmbeddedTexture {
  TextureMime mime = TextureMime::Png;
  std::vector<std::byte> bytes;

  bool operator==(const EmbeddedTexture &) const = default;
};

using TexturePayload = std::variant<ExternalTexture, EmbeddedTexture>;

struct TextureRef {
  TextureSlot slot = TextureSlot::BaseColor;
  uint8_t uvSet = 0;
  std::optional<glm::vec2> offset;
  std::optional<glm::vec2> scale;
  std::optional<float> rotation;
  // Present for every texture of a material carrying the Sampler flag.
  std::optional<TextureSampler> sampler;
  TexturePayload payload;

  [[nodiscard]] TextureRefKind kind() const noexcept {
    return std::holds_alternative<EmbeddedTexture>(payload)
               ? TextureRefKind::Embedded
               : TextureRefKind::External;
  }

  bool operator==(const TextureRef &) const = default;
};

struct AlphaSettings {
  AlphaMode mode = AlphaMode::Opaque;
  // Only serialized, and only compared, when mode is Mask.
  float cutoff = 0.5f;

  bool operator==(const AlphaSettings &other) const {
    if (mode != other.mode) {
      return false;
    }
    return mode != AlphaMode::Mask || cutoff == other.cutoff;
  }
};

struct PbrMaterial {
  std::string name;
  uint32_t flags = 0;
  std::optional<glm::vec4> baseColorFactor;
  std::optional<float> metallicFactor;
  std::optional<float> roughnessFactor;
  std::optional<glm::vec3> emissiveFactor;
  std::optional<AlphaSettings> alpha;
  std::optional<bool> doubleSided;
  std::vector<TextureRef> textures;

  [[nodiscard]] bool hasFlag(uint32_t flag) const noexcept {
    return (flags & flag) != 0u;
  }

  bool operator==(const PbrMaterial &) const = default;
};

using IndexBuffer = std::variant<std::vector<uint32_t>, std::vector<uint16_t>>;

struct MeshContainer {
  std::string name;
  uint32_t featureFlags = kVnbMeshFlagHasPositions;
  std::vector<float> positions;
  std::vector<float> normals;
  std::vector<float> tangents;
  std::vector<float> colors;
  std::vector<float> uv0;
  std::vector<float> uv1;
  std::optional<BoundingBox> bounds;
  IndexBuffer indices;
  std::vector<SubMeshRange> subMeshes;
  std::vector<PbrMaterial> materials;

  [[nodiscard]] bool hasFeature(uint32_t flag) const noexcept {
    return (featureFlags & flag) != 0u;
  }

  [[nodiscard]] size_t vertexCount() const noexcept {
    return positions.size() / kVnbPositionComponents;
  }

  [[nodiscard]] size_t indexCount() const noexcept {
    return std::visit([](const auto &values) { return values.size(); },
                      indices);
  }

  [[nodiscard]] bool usesU16Indices() const noexcept {
    return std::holds_alternative<std::vector<uint16_t>>(indices);
  }

  bool operator==(const MeshContainer &) const = default;
};

// Recomputes the stream, bounds and index-width bits of featureFlags from the
// container contents. HasPositions is always set; other bits are kept.
VNB_API void syncFeatureFlags(MeshContainer &mesh);

// Recomputes the gating bits of material.flags from its typed fields, plus the
// texture slot and TilingOffset hints. Other bits are kept.
VNB_API void syncMaterialFlags(PbrMaterial &material);

[[nodiscard]] VNB_API std::string_view topologyName(Topology topology) noexcept;
[[nodiscard]] VNB_API std::string_view
textureSlotName(TextureSlot slot) noexcept;
[[nodiscard]] VNB_API std::string_view alphaModeName(AlphaMode mode) noexcept;
[[nodiscard]] VNB_API std::string_view textureMimeName(TextureMime mime) noexcept;

} // namespace vnb
