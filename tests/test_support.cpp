#include "test_support.h"

#include <gtest/gtest.h>

#include <atomic>

namespace vnb::test {

ScopedLogCapture::ScopedLogCapture()
    : lines_(std::make_shared<std::vector<CapturedLine>>()) {
  Log::install(std::make_unique<CapturingLog>(lines_));
}

ScopedLogCapture::~ScopedLogCapture() { Log::install(nullptr); }

bool ScopedLogCapture::contains(LogLevel level, std::string_view needle) const {
  return std::any_of(lines_->begin(), lines_->end(),
                     [&](const CapturedLine &line) {
                       return line.level == level &&
                              line.message.find(needle) != std::string::npos;
                     });
}

ScopedTempDir::ScopedTempDir() {
  static std::atomic<uint32_t> counter{0};
  const ::testing::TestInfo *info =
      ::testing::UnitTest::GetInstance()->current_test_info();
  std::string name = "vnb_test";
  if (info != nullptr) {
    name += std::string("_") + info->test_suite_name() + "_" + info->name();
  }
  name += "_" + std::to_string(counter.fetch_add(1));
  path_ = std::filesystem::temp_directory_path() / name;
  std::filesystem::remove_all(path_);
  std::filesystem::create_directories(path_);
}

ScopedTempDir::~ScopedTempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void ScopedTempDir::writeFile(const std::filesystem::path &relative,
                              std::span<const std::byte> bytes) const {
  const std::filesystem::path target = path_ / relative;
  std::filesystem::create_directories(target.parent_path());
  std::ofstream output(target, std::ios::binary | std::ios::trunc);
  output.write(reinterpret_cast<const char *>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
  ASSERT_TRUE(output.good()) << target;
}

void ScopedTempDir::writeText(const std::filesystem::path &relative,
                              std::string_view text) const {
  writeFile(relative, bytesOf(text));
}

std::vector<std::byte> bytesOf(std::string_view text) {
  std::vector<std::byte> out;
  out.reserve(text.size());
  for (const char c : text) {
    out.push_back(static_cast<std::byte>(c));
  }
  return out;
}

std::vector<std::byte> bytesOf(std::initializer_list<int> values) {
  std::vector<std::byte> out;
  out.reserve(values.size());
  for (const int value : values) {
    out.push_back(static_cast<std::byte>(value));
  }
  return out;
}

MeshContainer makeTriangle() {
  MeshContainer mesh{};
  mesh.featureFlags = kVnbMeshFlagHasPositions;
  mesh.positions = {0.0f, 0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f};
  mesh.indices = std::vector<uint32_t>{0, 1, 2};
  mesh.subMeshes.push_back(SubMeshRange{
      .topology = Topology::Triangles,
      .materialIndex = std::nullopt,
      .startIndex = 0,
      .indexCount = 3,
      .baseVertex = 0,
      .firstVertex = 0,
      .vertexCount = 3,
  });
  return mesh;
}

MeshContainer makeFullQuad() {
  MeshContainer mesh{};
  mesh.name = "quad";
  mesh.positions = {-1.0f, -1.0f, 0.0f, 1.0f,  -1.0f, 0.0f,
                    1.0f,  1.0f,  0.0f, -1.0f, 1.0f,  0.0f};
  mesh.normals = {0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 1.0f,
                  0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 1.0f};
  mesh.tangents = {1.0f, 0.0f, 0.0f, 1.0f, 1.0f, 0.0f, 0.0f, 1.0f,
                   1.0f, 0.0f, 0.0f, 1.0f, 1.0f, 0.0f, 0.0f, -1.0f};
  mesh.colors = {1.0f, 0.0f, 0.0f, 1.0f, 0.0f, 1.0f, 0.0f, 1.0f,
                 0.0f, 0.0f, 1.0f, 1.0f, 1.0f, 1.0f, 1.0f, 0.5f};
  mesh.uv0 = {0.0f, 0.0f, 1.0f, 0.0f, 1.0f, 1.0f, 0.0f, 1.0f};
  mesh.uv1 = {0.0f, 0.0f, 0.5f, 0.0f, 0.5f, 0.5f, 0.0f, 0.5f};
  mesh.bounds = BoundingBox(glm::vec3(-1.0f, -1.0f, 0.0f),
                            glm::vec3(1.0f, 1.0f, 0.0f));
  mesh.indices = std::vector<uint16_t>{0, 1, 2, 1, 2, 3};
  mesh.subMeshes.push_back(SubMeshRange{
      .topology = Topology::Triangles,
      .materialIndex = uint16_t{1},
      .startIndex = 0,
      .indexCount = 3,
      .baseVertex = 0,
      .firstVertex = 0,
      .vertexCount = 3,
  });
  mesh.subMeshes.push_back(SubMeshRange{
      .topology = Topology::Lines,
      .materialIndex = std::nullopt,
      .startIndex = 3,
      .indexCount = 3,
      .baseVertex = -1,
      .firstVertex = 0,
      .vertexCount = 3,
  });

  PbrMaterial plain{};
  plain.name = "plain";
  plain.roughnessFactor = 0.25f;
  plain.doubleSided = false;
  syncMaterialFlags(plain);
  mesh.materials.push_back(plain);

  PbrMaterial textured{};
  textured.name = "textured";
  textured.baseColorFactor = glm::vec4(0.8f, 0.7f, 0.6f, 1.0f);
  textured.metallicFactor = 1.0f;
  textured.emissiveFactor = glm::vec3(0.1f, 0.2f, 0.3f);
  textured.alpha = AlphaSettings{.mode = AlphaMode::Mask, .cutoff = 0.3f};

  TextureRef baseColor{};
  baseColor.slot = TextureSlot::BaseColor;
  baseColor.uvSet = 0;
  baseColor.offset = glm::vec2(0.5f, 0.25f);
  baseColor.rotation = 1.5f;
  baseColor.sampler = TextureSampler{.wrapU = TextureWrap::Clamp,
                                     .wrapV = TextureWrap::Mirror,
                                     .minFilter = TextureFilter::Trilinear,
                                     .magFilter = TextureFilter::Point};
  baseColor.payload = ExternalTexture{"textures/albedo.png"};
  textured.textures.push_back(baseColor);

  TextureRef normal{};
  normal.slot = TextureSlot::Normal;
  normal.uvSet = 1;
  normal.scale = glm::vec2(2.0f, 2.0f);
  normal.sampler = TextureSampler{};
  normal.payload = EmbeddedTexture{.mime = TextureMime::Ktx2,
                                   .bytes = bytesOf({0xAB, 0x4B, 0x54, 0x58})};
  textured.textures.push_back(normal);
  syncMaterialFlags(textured);
  mesh.materials.push_back(textured);

  syncFeatureFlags(mesh);
  return mesh;
}

} // namespace vnb::test
