#pragma once

#include <array>
#include <cstdint>
#include <type_traits>

namespace vnb {

// 'VNB2' read as a little-endian uint32.
constexpr uint32_t kVnbBinaryMagic = 0x564E4232u;
constexpr uint16_t kVnbBinaryFormatVersion = 2;

constexpr uint8_t kVnbEndiannessLittle = 0;
constexpr uint8_t kVnbCoordinateSystemYUp = 0;
constexpr float kVnbDefaultUnitScale = 1.0f;

constexpr uint16_t kVnbNoMaterialIndex = 0xFFFFu;
constexpr uint32_t kVnbMaxStringBytes = 0xFFFFu;
constexpr uint32_t kVnbMaxTexturesPerMaterial = 0xFFu;

// Per-texture transform presence bits.
constexpr uint8_t kVnbTextureTransformOffset = 1u << 0u;
constexpr uint8_t kVnbTextureTransformScale = 1u << 1u;
constexpr uint8_t kVnbTextureTransformRotation = 1u << 2u;
constexpr uint8_t kVnbTextureTransformMask = kVnbTextureTransformOffset |
                                             kVnbTextureTransformScale |
                                             kVnbTextureTransformRotation;

#pragma pack(push, 1)
struct VnbBinaryHeader {
  uint32_t magic = 0;
  uint16_t version = 0;
  uint8_t endianness = 0;
  uint8_t coordinateSystem = 0;
  float unitScale = 0.0f;
  uint32_t featureFlags = 0;
  uint32_t vertexCount = 0;
  uint32_t indexCount = 0;
  uint32_t subMeshCount = 0;
  uint32_t materialCount = 0;
  std::array<uint8_t, 16> reserved{};
};

struct VnbBinarySubMeshRecord {
  uint8_t topology = 0;
  uint16_t materialIndex = kVnbNoMaterialIndex;
  uint32_t startIndex = 0;
  uint32_t indexCount = 0;
  int32_t baseVertex = 0;
  uint32_t firstVertex = 0;
  uint32_t vertexCount = 0;
};

struct VnbBinarySamplerRecord {
  uint8_t wrapU = 0;
  uint8_t wrapV = 0;
  uint8_t minFilter = 0;
  uint8_t magFilter = 0;
};
#pragma pack(pop)

static_assert(sizeof(VnbBinaryHeader) == 48);
static_assert(sizeof(VnbBinarySubMeshRecord) == 23);
static_assert(sizeof(VnbBinarySamplerRecord) == 4);
static_assert(std::is_standard_layout_v<VnbBinaryHeader>);
static_assert(std::is_standard_layout_v<VnbBinarySubMeshRecord>);
static_assert(std::is_standard_layout_v<VnbBinarySamplerRecord>);
static_assert(std::is_trivially_copyable_v<VnbBinaryHeader>);
static_assert(std::is_trivially_copyable_v<VnbBinarySubMeshRecord>);
static_assert(std::is_trivially_copyable_v<VnbBinarySamplerRecord>);

} // namespace vnb
