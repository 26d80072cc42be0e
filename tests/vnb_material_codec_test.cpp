#include "test_support.h"

#include "vnb/resources/storage/vnb/vnb_material_codec.h"

#include <gtest/gtest.h>

namespace vnb {
namespace {

using test::ByteBuilder;

[[nodiscard]] PbrMaterial makeEmbeddedBaseColorMaterial() {
  PbrMaterial material{};
  material.name = "m";
  material.baseColorFactor = glm::vec4(1.0f, 0.5f, 0.25f, 1.0f);
  TextureRef texture{};
  texture.slot = TextureSlot::BaseColor;
  texture.payload = EmbeddedTexture{.mime = TextureMime::Png,
                                    .bytes = test::bytesOf({1, 2, 3, 4})};
  material.textures.push_back(texture);
  syncMaterialFlags(material);
  return material;
}

[[nodiscard]] Result<PbrMaterial, VnbFormatError>
readOne(std::span<const std::byte> bytes) {
  VnbByteReader reader(bytes);
  return vnbReadMaterial(reader);
}

// Material header with no factors and a single texture entry follows.
[[nodiscard]] ByteBuilder bareMaterialHeader(uint32_t flags) {
  ByteBuilder builder;
  builder.u16(1).text("t").u32(flags).u8(1);
  return builder;
}

TEST(VnbMaterialCodecTest, EmbeddedTextureWithoutExtrasHasMinimalRecord) {
  const PbrMaterial material = makeEmbeddedBaseColorMaterial();
  VnbByteWriter writer;
  ASSERT_TRUE(vnbWriteMaterial(writer, material).hasValue());

  ByteBuilder expected;
  expected.u16(1)
      .text("m")
      .u32(kVnbMaterialFlagBaseColorFactor | kVnbMaterialFlagBaseColorTex)
      .floats({1.0f, 0.5f, 0.25f, 1.0f})
      .u8(1);
  // slot, uv set, ref kind, transform flags, mime, length, data
  expected.u8(0).u8(0).u8(1).u8(0).u8(0).u32(4).u8(1).u8(2).u8(3).u8(4);
  EXPECT_EQ(std::vector<std::byte>(writer.bytes().begin(), writer.bytes().end()),
            expected.bytes());

  auto decoded = readOne(writer.bytes());
  ASSERT_TRUE(decoded.hasValue()) << decoded.error().message;
  ASSERT_EQ(decoded.value().textures.size(), 1u);
  const TextureRef &texture = decoded.value().textures[0];
  EXPECT_FALSE(texture.offset.has_value());
  EXPECT_FALSE(texture.scale.has_value());
  EXPECT_FALSE(texture.rotation.has_value());
  EXPECT_FALSE(texture.sampler.has_value());
  EXPECT_EQ(texture.kind(), TextureRefKind::Embedded);
  EXPECT_EQ(decoded.value(), material);
}

TEST(VnbMaterialCodecTest, TransformPresenceIsPerComponent) {
  PbrMaterial material{};
  material.name = "transforms";
  TextureRef texture{};
  texture.slot = TextureSlot::Occlusion;
  texture.scale = glm::vec2(3.0f, 4.0f);
  texture.payload = ExternalTexture{"ao.png"};
  material.textures.push_back(texture);
  syncMaterialFlags(material);
  EXPECT_TRUE(material.hasFlag(kVnbMaterialFlagTilingOffset));
  EXPECT_TRUE(material.hasFlag(kVnbMaterialFlagOcclusionTex));

  VnbByteWriter writer;
  ASSERT_TRUE(vnbWriteMaterial(writer, material).hasValue());
  // name + flags + count + ref header + scale + uri
  EXPECT_EQ(writer.size(), 2u + 10u + 4u + 1u + 4u + 8u + 2u + 6u);

  auto decoded = readOne(writer.bytes());
  ASSERT_TRUE(decoded.hasValue());
  const TextureRef &result = decoded.value().textures[0];
  EXPECT_FALSE(result.offset.has_value());
  ASSERT_TRUE(result.scale.has_value());
  EXPECT_EQ(*result.scale, glm::vec2(3.0f, 4.0f));
  EXPECT_FALSE(result.rotation.has_value());
  EXPECT_EQ(std::get<ExternalTexture>(result.payload).uri, "ao.png");
}

TEST(VnbMaterialCodecTest, AlphaCutoffOnlyTravelsWithMask) {
  PbrMaterial blend{};
  blend.alpha = AlphaSettings{.mode = AlphaMode::Blend, .cutoff = 0.9f};
  syncMaterialFlags(blend);
  VnbByteWriter writer;
  ASSERT_TRUE(vnbWriteMaterial(writer, blend).hasValue());
  EXPECT_EQ(writer.size(), 2u + 4u + 1u + 1u);

  auto decoded = readOne(writer.bytes());
  ASSERT_TRUE(decoded.hasValue());
  ASSERT_TRUE(decoded.value().alpha.has_value());
  EXPECT_EQ(decoded.value().alpha->mode, AlphaMode::Blend);
  EXPECT_EQ(decoded.value(), blend);
}

TEST(VnbMaterialCodecTest, NonZeroDoubleSidedByteReadsTrue) {
  ByteBuilder bytes;
  bytes.u16(0).u32(kVnbMaterialFlagDoubleSided).u8(7).u8(0);

  auto decoded = readOne(bytes.bytes());
  ASSERT_TRUE(decoded.hasValue());
  ASSERT_TRUE(decoded.value().doubleSided.has_value());
  EXPECT_TRUE(*decoded.value().doubleSided);
}

TEST(VnbMaterialCodecTest, SamplerMustCoverEveryTexture) {
  PbrMaterial material = test::makeFullQuad().materials[1];
  material.textures[1].sampler.reset();
  syncMaterialFlags(material);
  EXPECT_FALSE(material.hasFlag(kVnbMaterialFlagSampler));

  VnbByteWriter writer;
  auto written = vnbWriteMaterial(writer, material);
  ASSERT_TRUE(written.hasError());
  EXPECT_TRUE(written.error().is(VnbErrorCode::InvariantViolation));
}

TEST(VnbMaterialCodecTest, GatingFlagMustMatchField) {
  PbrMaterial material{};
  material.name = "liar";
  material.flags = kVnbMaterialFlagMetallicFactor;

  VnbByteWriter writer;
  auto written = vnbWriteMaterial(writer, material);
  ASSERT_TRUE(written.hasError());
  EXPECT_TRUE(written.error().is(VnbErrorCode::InvariantViolation));

  material.flags = 0;
  material.roughnessFactor = 0.5f;
  written = vnbWriteMaterial(writer, material);
  ASSERT_TRUE(written.hasError());
  EXPECT_TRUE(written.error().is(VnbErrorCode::InvariantViolation));
}

TEST(VnbMaterialCodecTest, TooManyTexturesIsRejected) {
  PbrMaterial material{};
  TextureRef texture{};
  texture.payload = ExternalTexture{"a.png"};
  material.textures.assign(kVnbMaxTexturesPerMaterial + 1, texture);
  syncMaterialFlags(material);

  VnbByteWriter writer;
  auto written = vnbWriteMaterial(writer, material);
  ASSERT_TRUE(written.hasError());
  EXPECT_TRUE(written.error().is(VnbErrorCode::InvariantViolation));
}

TEST(VnbMaterialCodecTest, OversizedUriIsStringTooLong) {
  PbrMaterial material{};
  TextureRef texture{};
  texture.payload = ExternalTexture{std::string(kVnbMaxStringBytes + 1, 'u')};
  material.textures.push_back(texture);
  syncMaterialFlags(material);

  VnbByteWriter writer;
  auto written = vnbWriteMaterial(writer, material);
  ASSERT_TRUE(written.hasError());
  EXPECT_TRUE(written.error().is(VnbErrorCode::StringTooLong));
}

TEST(VnbMaterialCodecTest, UnknownEnumsAreRejected) {
  struct Case {
    const char *label;
    ByteBuilder bytes;
  };
  std::vector<Case> cases;

  ByteBuilder alpha;
  alpha.u16(0).u32(kVnbMaterialFlagAlphaMode).u8(3).u8(0);
  cases.push_back({"alpha mode", alpha});

  ByteBuilder slot = bareMaterialHeader(0);
  slot.u8(5).u8(0).u8(0).u8(0);
  cases.push_back({"slot", slot});

  ByteBuilder uvSet = bareMaterialHeader(0);
  uvSet.u8(0).u8(2).u8(0).u8(0);
  cases.push_back({"uv set", uvSet});

  ByteBuilder refKind = bareMaterialHeader(0);
  refKind.u8(0).u8(0).u8(2).u8(0);
  cases.push_back({"ref kind", refKind});

  ByteBuilder transform = bareMaterialHeader(0);
  transform.u8(0).u8(0).u8(0).u8(0x08);
  cases.push_back({"transform flags", transform});

  ByteBuilder wrap = bareMaterialHeader(kVnbMaterialFlagSampler);
  wrap.u8(0).u8(0).u8(0).u8(0).u8(3).u8(0).u8(0).u8(0);
  cases.push_back({"wrap", wrap});

  ByteBuilder filter = bareMaterialHeader(kVnbMaterialFlagSampler);
  filter.u8(0).u8(0).u8(0).u8(0).u8(0).u8(0).u8(0).u8(9);
  cases.push_back({"filter", filter});

  ByteBuilder mime = bareMaterialHeader(0);
  mime.u8(0).u8(0).u8(1).u8(0).u8(3).u32(0);
  cases.push_back({"mime", mime});

  for (const Case &c : cases) {
    auto decoded = readOne(c.bytes.bytes());
    ASSERT_TRUE(decoded.hasError()) << c.label;
    EXPECT_TRUE(decoded.error().is(VnbErrorCode::UnknownEnumValue))
        << c.label << ": " << decoded.error().message;
  }
}

TEST(VnbMaterialCodecTest, TruncatedEmbeddedPayloadFails) {
  ByteBuilder bytes = bareMaterialHeader(0);
  bytes.u8(0).u8(0).u8(1).u8(0).u8(0).u32(16).u8(1).u8(2);

  auto decoded = readOne(bytes.bytes());
  ASSERT_TRUE(decoded.hasError());
  EXPECT_TRUE(decoded.error().is(VnbErrorCode::TruncatedInput));
}

TEST(VnbMaterialCodecTest, MaterialCountBeyondInputFailsUpFront) {
  ByteBuilder bytes;
  bytes.u16(0).u32(0).u8(0);
  VnbByteReader reader(bytes.bytes());
  std::vector<PbrMaterial> materials;

  auto read = vnbReadMaterials(reader, 1000000u, materials);
  ASSERT_TRUE(read.hasError());
  EXPECT_TRUE(read.error().is(VnbErrorCode::TruncatedInput));
  EXPECT_TRUE(materials.empty());
}

TEST(VnbMaterialCodecTest, UnknownMaterialBitsRoundTrip) {
  PbrMaterial material = makeEmbeddedBaseColorMaterial();
  material.flags |= 1u << 30u;

  VnbByteWriter writer;
  ASSERT_TRUE(vnbWriteMaterial(writer, material).hasValue());
  auto decoded = readOne(writer.bytes());
  ASSERT_TRUE(decoded.hasValue());
  EXPECT_EQ(decoded.value().flags, material.flags);
}

} // namespace
} // namespace vnb
