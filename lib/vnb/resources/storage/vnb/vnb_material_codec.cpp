#include "vnb/pch.h"

#include "vnb/resources/storage/vnb/vnb_material_codec.h"

#include "vnb/resources/storage/vnb/vnb_binary_format.h"

namespace vnb {
namespace {

// name length + flags + texture count
constexpr uint64_t kMinMaterialRecordBytes = 2 + 4 + 1;

constexpr uint8_t kMaxUvSet = 1;

template <typename T>
[[nodiscard]] Result<T, VnbFormatError> truncated(std::string_view what,
                                                  const VnbByteReader &reader) {
  return makeVnbError<T>(VnbErrorCode::TruncatedInput,
                         "vnbReadMaterial: truncated ", what, " at offset ",
                         reader.offset());
}

template <typename T>
[[nodiscard]] Result<T, VnbFormatError> unknownEnum(std::string_view what,
                                                    uint8_t value) {
  return makeVnbError<T>(VnbErrorCode::UnknownEnumValue,
                         "vnbReadMaterial: unknown ", what, " value ",
                         static_cast<unsigned>(value));
}

[[nodiscard]] Result<bool, VnbFormatError>
checkGate(const PbrMaterial &material, uint32_t flag, bool present,
          std::string_view field) {
  if (material.hasFlag(flag) != present) {
    return makeVnbError<bool>(VnbErrorCode::InvariantViolation,
                              "vnbWriteMaterial: material '", material.name,
                              "' flag for ", field,
                              " disagrees with field presence");
  }
  return Result<bool, VnbFormatError>::makeResult(true);
}

[[nodiscard]] Result<bool, VnbFormatError>
validateMaterial(const PbrMaterial &material) {
  const std::array<std::pair<uint32_t, bool>, 6> gates = {{
      {kVnbMaterialFlagBaseColorFactor, material.baseColorFactor.has_value()},
      {kVnbMaterialFlagMetallicFactor, material.metallicFactor.has_value()},
      {kVnbMaterialFlagRoughnessFactor, material.roughnessFactor.has_value()},
      {kVnbMaterialFlagEmissiveFactor, material.emissiveFactor.has_value()},
      {kVnbMaterialFlagAlphaMode, material.alpha.has_value()},
      {kVnbMaterialFlagDoubleSided, material.doubleSided.has_value()},
  }};
  constexpr std::array<std::string_view, 6> gateNames = {
      "base color factor", "metallic factor", "roughness factor",
      "emissive factor",   "alpha mode",      "double sided"};
  for (size_t i = 0; i < gates.size(); ++i) {
    auto gateResult =
        checkGate(material, gates[i].first, gates[i].second, gateNames[i]);
    if (gateResult.hasError()) {
      return gateResult;
    }
  }

  if (material.textures.size() > kVnbMaxTexturesPerMaterial) {
    return makeVnbError<bool>(VnbErrorCode::InvariantViolation,
                              "vnbWriteMaterial: material '", material.name,
                              "' has ", material.textures.size(),
                              " textures, limit is ",
                              kVnbMaxTexturesPerMaterial);
  }

  const bool sampled = material.hasFlag(kVnbMaterialFlagSampler);
  for (size_t i = 0; i < material.textures.size(); ++i) {
    const TextureRef &texture = material.textures[i];
    if (texture.sampler.has_value() != sampled) {
      return makeVnbError<bool>(
          VnbErrorCode::InvariantViolation, "vnbWriteMaterial: material '",
          material.name, "' texture ", i,
          sampled ? " lacks a sampler while the Sampler flag is set"
                  : " has a sampler while the Sampler flag is clear");
    }
    if (texture.uvSet > kMaxUvSet) {
      return makeVnbError<bool>(VnbErrorCode::InvariantViolation,
                                "vnbWriteMaterial: material '", material.name,
                                "' texture ", i, " uses uv set ",
                                static_cast<unsigned>(texture.uvSet));
    }
    if (const auto *embedded = std::get_if<EmbeddedTexture>(&texture.payload);
        embedded != nullptr &&
        static_cast<uint64_t>(embedded->bytes.size()) >
            std::numeric_limits<uint32_t>::max()) {
      return makeVnbError<bool>(VnbErrorCode::InvariantViolation,
                                "vnbWriteMaterial: material '", material.name,
                                "' texture ", i,
                                " embedded payload exceeds 32-bit length");
    }
  }
  return Result<bool, VnbFormatError>::makeResult(true);
}

[[nodiscard]] Result<bool, VnbFormatError>
writeTextureRef(VnbByteWriter &writer, const TextureRef &texture) {
  uint8_t transformFlags = 0;
  if (texture.offset) {
    transformFlags |= kVnbTextureTransformOffset;
  }
  if (texture.scale) {
    transformFlags |= kVnbTextureTransformScale;
  }
  if (texture.rotation) {
    transformFlags |= kVnbTextureTransformRotation;
  }

  writer.writeU8(static_cast<uint8_t>(texture.slot));
  writer.writeU8(texture.uvSet);
  writer.writeU8(static_cast<uint8_t>(texture.kind()));
  writer.writeU8(transformFlags);
  if (texture.offset) {
    writer.writeF32(texture.offset->x);
    writer.writeF32(texture.offset->y);
  }
  if (texture.scale) {
    writer.writeF32(texture.scale->x);
    writer.writeF32(texture.scale->y);
  }
  if (texture.rotation) {
    writer.writeF32(*texture.rotation);
  }
  if (texture.sampler) {
    VnbBinarySamplerRecord sampler{};
    sampler.wrapU = static_cast<uint8_t>(texture.sampler->wrapU);
    sampler.wrapV = static_cast<uint8_t>(texture.sampler->wrapV);
    sampler.minFilter = static_cast<uint8_t>(texture.sampler->minFilter);
    sampler.magFilter = static_cast<uint8_t>(texture.sampler->magFilter);
    writer.writePod(sampler);
  }

  if (const auto *external = std::get_if<ExternalTexture>(&texture.payload)) {
    return writer.writeLengthPrefixedUtf8(external->uri);
  }
  const EmbeddedTexture &embedded = std::get<EmbeddedTexture>(texture.payload);
  writer.writeU8(static_cast<uint8_t>(embedded.mime));
  writer.writeU32(static_cast<uint32_t>(embedded.bytes.size()));
  writer.writeBytes(embedded.bytes);
  return Result<bool, VnbFormatError>::makeResult(true);
}

[[nodiscard]] Result<TextureRef, VnbFormatError>
readTextureRef(VnbByteReader &reader, bool sampled) {
  uint8_t slot = 0;
  uint8_t uvSet = 0;
  uint8_t refKind = 0;
  uint8_t transformFlags = 0;
  if (!reader.readU8(slot) || !reader.readU8(uvSet) ||
      !reader.readU8(refKind) || !reader.readU8(transformFlags)) {
    return truncated<TextureRef>("texture ref header", reader);
  }
  if (slot > static_cast<uint8_t>(TextureSlot::Emissive)) {
    return unknownEnum<TextureRef>("texture slot", slot);
  }
  if (uvSet > kMaxUvSet) {
    return unknownEnum<TextureRef>("uv set", uvSet);
  }
  if (refKind > static_cast<uint8_t>(TextureRefKind::Embedded)) {
    return unknownEnum<TextureRef>("texture ref kind", refKind);
  }
  if ((transformFlags & ~kVnbTextureTransformMask) != 0u) {
    return unknownEnum<TextureRef>("texture transform flags", transformFlags);
  }

  TextureRef texture{};
  texture.slot = static_cast<TextureSlot>(slot);
  texture.uvSet = uvSet;
  if ((transformFlags & kVnbTextureTransformOffset) != 0u) {
    glm::vec2 offset{};
    if (!reader.readF32(offset.x) || !reader.readF32(offset.y)) {
      return truncated<TextureRef>("texture offset", reader);
    }
    texture.offset = offset;
  }
  if ((transformFlags & kVnbTextureTransformScale) != 0u) {
    glm::vec2 scale{};
    if (!reader.readF32(scale.x) || !reader.readF32(scale.y)) {
      return truncated<TextureRef>("texture scale", reader);
    }
    texture.scale = scale;
  }
  if ((transformFlags & kVnbTextureTransformRotation) != 0u) {
    float rotation = 0.0f;
    if (!reader.readF32(rotation)) {
      return truncated<TextureRef>("texture rotation", reader);
    }
    texture.rotation = rotation;
  }

  if (sampled) {
    VnbBinarySamplerRecord record{};
    if (!reader.readPod(record)) {
      return truncated<TextureRef>("texture sampler", reader);
    }
    constexpr uint8_t kMaxWrap = static_cast<uint8_t>(TextureWrap::Mirror);
    constexpr uint8_t kMaxFilter =
        static_cast<uint8_t>(TextureFilter::Trilinear);
    if (record.wrapU > kMaxWrap) {
      return unknownEnum<TextureRef>("sampler wrap u", record.wrapU);
    }
    if (record.wrapV > kMaxWrap) {
      return unknownEnum<TextureRef>("sampler wrap v", record.wrapV);
    }
    if (record.minFilter > kMaxFilter) {
      return unknownEnum<TextureRef>("sampler min filter", record.minFilter);
    }
    if (record.magFilter > kMaxFilter) {
      return unknownEnum<TextureRef>("sampler mag filter", record.magFilter);
    }
    texture.sampler = TextureSampler{
        .wrapU = static_cast<TextureWrap>(record.wrapU),
        .wrapV = static_cast<TextureWrap>(record.wrapV),
        .minFilter = static_cast<TextureFilter>(record.minFilter),
        .magFilter = static_cast<TextureFilter>(record.magFilter),
    };
  }

  if (static_cast<TextureRefKind>(refKind) == TextureRefKind::External) {
    ExternalTexture external{};
    if (!reader.readLengthPrefixedUtf8(external.uri)) {
      return truncated<TextureRef>("external texture uri", reader);
    }
    texture.payload = std::move(external);
    return Result<TextureRef, VnbFormatError>::makeResult(std::move(texture));
  }

  uint8_t mime = 0;
  uint32_t length = 0;
  if (!reader.readU8(mime)) {
    return truncated<TextureRef>("embedded texture mime", reader);
  }
  if (mime > static_cast<uint8_t>(TextureMime::Ktx2)) {
    return unknownEnum<TextureRef>("embedded texture mime", mime);
  }
  if (!reader.readU32(length)) {
    return truncated<TextureRef>("embedded texture length", reader);
  }
  EmbeddedTexture embedded{};
  embedded.mime = static_cast<TextureMime>(mime);
  if (!reader.readBytes(length, embedded.bytes)) {
    return truncated<TextureRef>("embedded texture payload", reader);
  }
  texture.payload = std::move(embedded);
  return Result<TextureRef, VnbFormatError>::makeResult(std::move(texture));
}

} // namespace

Result<bool, VnbFormatError> vnbWriteMaterial(VnbByteWriter &writer,
                                              const PbrMaterial &material) {
  auto validResult = validateMaterial(material);
  if (validResult.hasError()) {
    return validResult;
  }

  auto nameResult = writer.writeLengthPrefixedUtf8(material.name);
  if (nameResult.hasError()) {
    return nameResult;
  }
  writer.writeU32(material.flags);

  if (material.baseColorFactor) {
    const glm::vec4 &color = *material.baseColorFactor;
    writer.writeF32(color.r);
    writer.writeF32(color.g);
    writer.writeF32(color.b);
    writer.writeF32(color.a);
  }
  if (material.metallicFactor) {
    writer.writeF32(*material.metallicFactor);
  }
  if (material.roughnessFactor) {
    writer.writeF32(*material.roughnessFactor);
  }
  if (material.emissiveFactor) {
    const glm::vec3 &emissive = *material.emissiveFactor;
    writer.writeF32(emissive.r);
    writer.writeF32(emissive.g);
    writer.writeF32(emissive.b);
  }
  if (material.alpha) {
    writer.writeU8(static_cast<uint8_t>(material.alpha->mode));
    if (material.alpha->mode == AlphaMode::Mask) {
      writer.writeF32(material.alpha->cutoff);
    }
  }
  if (material.doubleSided) {
    writer.writeU8(*material.doubleSided ? uint8_t{1} : uint8_t{0});
  }

  writer.writeU8(static_cast<uint8_t>(material.textures.size()));
  for (const TextureRef &texture : material.textures) {
    auto textureResult = writeTextureRef(writer, texture);
    if (textureResult.hasError()) {
      return textureResult;
    }
  }
  return Result<bool, VnbFormatError>::makeResult(true);
}

Result<PbrMaterial, VnbFormatError> vnbReadMaterial(VnbByteReader &reader) {
  PbrMaterial material{};
  if (!reader.readLengthPrefixedUtf8(material.name)) {
    return truncated<PbrMaterial>("material name", reader);
  }
  if (!reader.readU32(material.flags)) {
    return truncated<PbrMaterial>("material flags", reader);
  }

  if (material.hasFlag(kVnbMaterialFlagBaseColorFactor)) {
    glm::vec4 color{};
    if (!reader.readF32(color.r) || !reader.readF32(color.g) ||
        !reader.readF32(color.b) || !reader.readF32(color.a)) {
      return truncated<PbrMaterial>("base color factor", reader);
    }
    material.baseColorFactor = color;
  }
  if (material.hasFlag(kVnbMaterialFlagMetallicFactor)) {
    float metallic = 0.0f;
    if (!reader.readF32(metallic)) {
      return truncated<PbrMaterial>("metallic factor", reader);
    }
    material.metallicFactor = metallic;
  }
  if (material.hasFlag(kVnbMaterialFlagRoughnessFactor)) {
    float roughness = 0.0f;
    if (!reader.readF32(roughness)) {
      return truncated<PbrMaterial>("roughness factor", reader);
    }
    material.roughnessFactor = roughness;
  }
  if (material.hasFlag(kVnbMaterialFlagEmissiveFactor)) {
    glm::vec3 emissive{};
    if (!reader.readF32(emissive.r) || !reader.readF32(emissive.g) ||
        !reader.readF32(emissive.b)) {
      return truncated<PbrMaterial>("emissive factor", reader);
    }
    material.emissiveFactor = emissive;
  }
  if (material.hasFlag(kVnbMaterialFlagAlphaMode)) {
    uint8_t mode = 0;
    if (!reader.readU8(mode)) {
      return truncated<PbrMaterial>("alpha mode", reader);
    }
    if (mode > static_cast<uint8_t>(AlphaMode::Blend)) {
      return unknownEnum<PbrMaterial>("alpha mode", mode);
    }
    AlphaSettings alpha{};
    alpha.mode = static_cast<AlphaMode>(mode);
    if (alpha.mode == AlphaMode::Mask && !reader.readF32(alpha.cutoff)) {
      return truncated<PbrMaterial>("alpha cutoff", reader);
    }
    material.alpha = alpha;
  }
  if (material.hasFlag(kVnbMaterialFlagDoubleSided)) {
    uint8_t doubleSided = 0;
    if (!reader.readU8(doubleSided)) {
      return truncated<PbrMaterial>("double sided", reader);
    }
    material.doubleSided = doubleSided != 0u;
  }

  uint8_t textureCount = 0;
  if (!reader.readU8(textureCount)) {
    return truncated<PbrMaterial>("texture count", reader);
  }
  const bool sampled = material.hasFlag(kVnbMaterialFlagSampler);
  material.textures.reserve(textureCount);
  for (uint32_t i = 0; i < textureCount; ++i) {
    auto textureResult = readTextureRef(reader, sampled);
    if (textureResult.hasError()) {
      return std::move(textureResult).forwardError<PbrMaterial>();
    }
    material.textures.push_back(std::move(textureResult.value()));
  }
  return Result<PbrMaterial, VnbFormatError>::makeResult(std::move(material));
}

Result<bool, VnbFormatError>
vnbWriteMaterials(VnbByteWriter &writer,
                  std::span<const PbrMaterial> materials) {
  for (const PbrMaterial &material : materials) {
    auto materialResult = vnbWriteMaterial(writer, material);
    if (materialResult.hasError()) {
      return materialResult;
    }
  }
  return Result<bool, VnbFormatError>::makeResult(true);
}

Result<bool, VnbFormatError> vnbReadMaterials(VnbByteReader &reader,
                                              uint32_t count,
                                              std::vector<PbrMaterial> &out) {
  out.clear();
  uint64_t minimumBytes = 0;
  if (!checkedMulToU64(count, kMinMaterialRecordBytes, minimumBytes) ||
      !reader.canRead(minimumBytes)) {
    return makeVnbError<bool>(VnbErrorCode::TruncatedInput,
                              "vnbReadMaterials: ", count,
                              " materials cannot fit in ", reader.remaining(),
                              " bytes");
  }
  out.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    auto materialResult = vnbReadMaterial(reader);
    if (materialResult.hasError()) {
      return std::move(materialResult).forwardError<bool>();
    }
    out.push_back(std::move(materialResult.value()));
  }
  return Result<bool, VnbFormatError>::makeResult(true);
}

} // namespace vnb
