#include "test_support.h"

#include "vnb/resources/storage/vnb/vnb_serializer.h"
#include "vnb/resources/storage/vnb/vnb_texture_resolver.h"

#include <gtest/gtest.h>

namespace vnb {
namespace {

[[nodiscard]] MeshContainer makeExternalOnlyMesh() {
  MeshContainer mesh = test::makeTriangle();
  PbrMaterial material{};
  material.name = "external";
  for (const char *uri : {"a.png", "nested/b.png"}) {
    TextureRef texture{};
    texture.slot = TextureSlot::Emissive;
    texture.rotation = 0.5f;
    texture.payload = ExternalTexture{uri};
    material.textures.push_back(texture);
  }
  syncMaterialFlags(material);
  mesh.materials.push_back(material);
  mesh.subMeshes[0].materialIndex = uint16_t{0};
  return mesh;
}

[[nodiscard]] std::vector<std::byte> encode(const MeshContainer &mesh) {
  auto encoded = vnbEncode(mesh);
  EXPECT_TRUE(encoded.hasValue());
  return encoded.hasValue() ? std::move(encoded).value()
                            : std::vector<std::byte>{};
}

TEST(VnbTextureResolverTest, ResolvingEveryUriEmbedsEveryTexture) {
  const std::vector<std::byte> bytes = encode(makeExternalOnlyMesh());
  std::vector<std::string> requested;
  const TextureResolver resolver =
      [&](std::string_view uri) -> std::optional<std::vector<std::byte>> {
    requested.emplace_back(uri);
    return test::bytesOf(uri);
  };

  auto decoded = vnbDecode(bytes, resolver);
  ASSERT_TRUE(decoded.hasValue()) << decoded.error().message;
  EXPECT_EQ(requested, (std::vector<std::string>{"a.png", "nested/b.png"}));
  EXPECT_TRUE(vnbAllTexturesEmbedded(decoded.value()));
  for (const TextureRef &texture : decoded.value().materials[0].textures) {
    const auto &embedded = std::get<EmbeddedTexture>(texture.payload);
    EXPECT_EQ(embedded.mime, TextureMime::Png);
    EXPECT_FALSE(embedded.bytes.empty());
    EXPECT_EQ(texture.slot, TextureSlot::Emissive);
    ASSERT_TRUE(texture.rotation.has_value());
    EXPECT_EQ(*texture.rotation, 0.5f);
  }
}

TEST(VnbTextureResolverTest, AbsentResultsLeaveUrisIntact) {
  const MeshContainer mesh = makeExternalOnlyMesh();
  const std::vector<std::byte> bytes = encode(mesh);
  const TextureResolver resolver =
      [](std::string_view) -> std::optional<std::vector<std::byte>> {
    return std::nullopt;
  };

  auto decoded = vnbDecode(bytes, resolver);
  ASSERT_TRUE(decoded.hasValue());
  EXPECT_EQ(decoded.value(), mesh);
  EXPECT_FALSE(vnbAllTexturesEmbedded(decoded.value()));
}

TEST(VnbTextureResolverTest, OutcomeReportsPartialResolution) {
  test::ScopedLogCapture capture;
  const MeshContainer mesh = makeExternalOnlyMesh();
  const TextureResolver resolver =
      [](std::string_view uri) -> std::optional<std::vector<std::byte>> {
    if (uri == "a.png") {
      return test::bytesOf({0x89, 0x50, 0x4E, 0x47});
    }
    return std::nullopt;
  };

  auto outcome = vnbResolveExternalTextures(mesh, resolver);
  ASSERT_TRUE(outcome.hasValue());
  EXPECT_EQ(outcome.value().resolvedCount, 1u);
  EXPECT_EQ(outcome.value().unresolvedUris,
            (std::vector<std::string>{"nested/b.png"}));
  EXPECT_TRUE(capture.contains(LogLevel::Warning, "nested/b.png"));

  // The input container is not touched.
  EXPECT_EQ(mesh.materials[0].textures[0].kind(), TextureRefKind::External);
}

TEST(VnbTextureResolverTest, FailPolicyNamesTheUri) {
  const TextureResolver resolver =
      [](std::string_view) -> std::optional<std::vector<std::byte>> {
    return std::nullopt;
  };

  auto outcome = vnbResolveExternalTextures(makeExternalOnlyMesh(), resolver,
                                            UnresolvedTexturePolicy::Fail);
  ASSERT_TRUE(outcome.hasError());
  EXPECT_TRUE(outcome.error().is(VnbErrorCode::UnresolvedTexture));
  EXPECT_NE(outcome.error().message.find("a.png"), std::string::npos);
}

TEST(VnbTextureResolverTest, EmptyResolverResolvesNothing) {
  const MeshContainer mesh = makeExternalOnlyMesh();
  auto outcome = vnbResolveExternalTextures(mesh, TextureResolver{});
  ASSERT_TRUE(outcome.hasValue());
  EXPECT_EQ(outcome.value().resolvedCount, 0u);
  EXPECT_EQ(outcome.value().mesh, mesh);
}

TEST(VnbTextureResolverTest, EmbeddedTexturesNeverReachTheResolver) {
  MeshContainer mesh = test::makeFullQuad();
  int calls = 0;
  const TextureResolver resolver =
      [&](std::string_view) -> std::optional<std::vector<std::byte>> {
    ++calls;
    return std::nullopt;
  };

  auto outcome = vnbResolveExternalTextures(mesh, resolver);
  ASSERT_TRUE(outcome.hasValue());
  EXPECT_EQ(calls, 1);
}

TEST(VnbTextureResolverTest, DirectoryResolverSearchesRootsInOrder) {
  test::ScopedTempDir first;
  test::ScopedTempDir second;
  first.writeFile("shared.png", test::bytesOf({1}));
  second.writeFile("shared.png", test::bytesOf({2}));
  second.writeFile("only/second.png", test::bytesOf({3, 3}));

  const TextureResolver resolver =
      makeDirectoryTextureResolver({first.path(), second.path()});

  const auto shared = resolver("shared.png");
  ASSERT_TRUE(shared.has_value());
  EXPECT_EQ(*shared, test::bytesOf({1}));

  const auto nested = resolver("only/./second.png");
  ASSERT_TRUE(nested.has_value());
  EXPECT_EQ(nested->size(), 2u);

  EXPECT_FALSE(resolver("missing.png").has_value());
}

TEST(VnbTextureResolverTest, DirectoryResolverRefusesEscapingUris) {
  test::ScopedTempDir root;
  root.writeFile("inner/tex.png", test::bytesOf({7}));
  const std::filesystem::path inner = root.path() / "inner";
  const TextureResolver resolver = makeDirectoryTextureResolver({inner});

  EXPECT_TRUE(resolver("tex.png").has_value());
  EXPECT_FALSE(resolver("../inner/tex.png").has_value());
  EXPECT_FALSE(resolver("a/../../inner/tex.png").has_value());
  EXPECT_FALSE(resolver((inner / "tex.png").string()).has_value());
  EXPECT_FALSE(resolver("").has_value());
}

TEST(VnbTextureResolverTest, DirectoryResolverHonorsSizeLimit) {
  test::ScopedTempDir root;
  root.writeFile("big.png", test::bytesOf({1, 2, 3, 4, 5, 6, 7, 8}));
  const TextureResolver resolver =
      makeDirectoryTextureResolver({root.path()}, 4);

  EXPECT_FALSE(resolver("big.png").has_value());
}

TEST(VnbTextureResolverTest, MeshWithoutMaterialsIsFullyEmbedded) {
  EXPECT_TRUE(vnbAllTexturesEmbedded(test::makeTriangle()));
  EXPECT_FALSE(vnbAllTexturesEmbedded(test::makeFullQuad()));
}

} // namespace
} // namespace vnb
