#include "vnb/pch.h"

#include "vnb/resources/cpu/mesh_container.h"

namespace vnb {
namespace {

void setFlag(uint32_t &flags, uint32_t flag, bool enabled) {
  if (enabled) {
    flags |= flag;
  } else {
    flags &= ~flag;
  }
}

[[nodiscard]] uint32_t textureSlotFlag(TextureSlot slot) {
  switch (slot) {
  case TextureSlot::BaseColor:
    return kVnbMaterialFlagBaseColorTex;
  case TextureSlot::MetalRough:
    return kVnbMaterialFlagMetalRoughTex;
  case TextureSlot::Normal:
    return kVnbMaterialFlagNormalTex;
  case TextureSlot::Occlusion:
    return kVnbMaterialFlagOcclusionTex;
  case TextureSlot::Emissive:
    return kVnbMaterialFlagEmissiveTex;
  }
  return 0u;
}

} // namespace

void syncFeatureFlags(MeshContainer &mesh) {
  uint32_t flags = mesh.featureFlags;
  flags |= kVnbMeshFlagHasPositions;
  setFlag(flags, kVnbMeshFlagHasNormals, !mesh.normals.empty());
  setFlag(flags, kVnbMeshFlagHasTangents, !mesh.tangents.empty());
  setFlag(flags, kVnbMeshFlagHasVertexColors, !mesh.colors.empty());
  setFlag(flags, kVnbMeshFlagHasUv0, !mesh.uv0.empty());
  setFlag(flags, kVnbMeshFlagHasUv1, !mesh.uv1.empty());
  setFlag(flags, kVnbMeshFlagHasBounds, mesh.bounds.has_value());
  setFlag(flags, kVnbMeshFlagIndicesU16, mesh.usesU16Indices());
  mesh.featureFlags = flags;
}

void syncMaterialFlags(PbrMaterial &material) {
  uint32_t flags = material.flags;
  setFlag(flags, kVnbMaterialFlagBaseColorFactor,
          material.baseColorFactor.has_value());
  setFlag(flags, kVnbMaterialFlagMetallicFactor,
          material.metallicFactor.has_value());
  setFlag(flags, kVnbMaterialFlagRoughnessFactor,
          material.roughnessFactor.has_value());
  setFlag(flags, kVnbMaterialFlagEmissiveFactor,
          material.emissiveFactor.has_value());
  setFlag(flags, kVnbMaterialFlagAlphaMode, material.alpha.has_value());
  setFlag(flags, kVnbMaterialFlagDoubleSided, material.doubleSided.has_value());

  const bool anyTexture = !material.textures.empty();
  const bool allSampled =
      anyTexture &&
      std::all_of(material.textures.begin(), material.textures.end(),
                  [](const TextureRef &texture) {
                    return texture.sampler.has_value();
                  });
  setFlag(flags, kVnbMaterialFlagSampler, allSampled);

  bool tilingOffset = false;
  for (const TextureRef &texture : material.textures) {
    flags |= textureSlotFlag(texture.slot);
    tilingOffset =
        tilingOffset || texture.offset.has_value() || texture.scale.has_value();
  }
  if (tilingOffset) {
    flags |= kVnbMaterialFlagTilingOffset;
  }
  material.flags = flags;
}

std::string_view topologyName(Topology topology) noexcept {
  switch (topology) {
  case Topology::Triangles:
    return "triangles";
  case Topology::Lines:
    return "lines";
  }
  return "unknown";
}

std::string_view textureSlotName(TextureSlot slot) noexcept {
  switch (slot) {
  case TextureSlot::BaseColor:
    return "base_color";
  case TextureSlot::MetalRough:
    return "metal_rough";
  case TextureSlot::Normal:
    return "normal";
  case TextureSlot::Occlusion:
    return "occlusion";
  case TextureSlot::Emissive:
    return "emissive";
  }
  return "unknown";
}

std::string_view alphaModeName(AlphaMode mode) noexcept {
  switch (mode) {
  case AlphaMode::Opaque:
    return "opaque";
  case AlphaMode::Mask:
    return "mask";
  case AlphaMode::Blend:
    return "blend";
  }
  return "unknown";
}

std::string_view textureMimeName(TextureMime mime) noexcept {
  switch (mime) {
  case TextureMime::Png:
    return "image/png";
  case TextureMime::Jpg:
    return "image/jpeg";
  case TextureMime::Ktx2:
    return "image/ktx2";
  }
  return "application/octet-stream";
}

} // namespace vnb
