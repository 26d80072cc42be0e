#include "vnb/pch.h"

#include "vnb/core/log.h"
#include "vnb/core/profiling.h"
#include "vnb/core/runtime_config.h"
#include "vnb/resources/cpu/mesh_container.h"
#include "vnb/resources/storage/vnb/vnb_file_utils.h"
#include "vnb/resources/storage/vnb/vnb_serializer.h"
#include "vnb/resources/storage/vnb/vnb_texture_resolver.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

struct CommandLine {
  std::optional<std::filesystem::path> configPath;
  std::string command;
  std::vector<std::string> arguments;
};

struct CommandSpec {
  std::string_view name;
  size_t argumentCount;
};

constexpr std::array<CommandSpec, 3> kCommands = {{
    {"inspect", 1},
    {"upgrade", 2},
    {"embed", 2},
}};

void printUsage() {
  std::fprintf(stderr,
               "usage: vnb_tool [--config <path>] <command> [args]\n"
               "\n"
               "commands:\n"
               "  inspect <file>        print container contents\n"
               "  upgrade <in> <out>    rewrite legacy or current input as "
               "VNB2\n"
               "  embed <in> <out>      embed external textures from the "
               "configured search roots\n");
}

[[nodiscard]] std::optional<CommandLine> parseCommandLine(int argc,
                                                          char **argv) {
  CommandLine commandLine{};
  int i = 1;
  for (; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) {
        return std::nullopt;
      }
      commandLine.configPath = std::filesystem::path(argv[++i]);
      continue;
    }
    if (arg == "-h" || arg == "--help" || arg.starts_with("-")) {
      return std::nullopt;
    }
    break;
  }
  if (i >= argc) {
    return std::nullopt;
  }

  commandLine.command = argv[i++];
  for (; i < argc; ++i) {
    commandLine.arguments.emplace_back(argv[i]);
  }

  const auto spec =
      std::find_if(kCommands.begin(), kCommands.end(),
                   [&](const CommandSpec &candidate) {
                     return candidate.name == commandLine.command;
                   });
  if (spec == kCommands.end() ||
      spec->argumentCount != commandLine.arguments.size()) {
    return std::nullopt;
  }
  return commandLine;
}

[[nodiscard]] std::string describeFlags(uint32_t flags) {
  constexpr std::array<std::pair<uint32_t, std::string_view>, 9> kNames = {{
      {vnb::kVnbMeshFlagHasPositions, "positions"},
      {vnb::kVnbMeshFlagHasNormals, "normals"},
      {vnb::kVnbMeshFlagHasTangents, "tangents"},
      {vnb::kVnbMeshFlagHasVertexColors, "colors"},
      {vnb::kVnbMeshFlagHasUv0, "uv0"},
      {vnb::kVnbMeshFlagHasUv1, "uv1"},
      {vnb::kVnbMeshFlagHasBounds, "bounds"},
      {vnb::kVnbMeshFlagIndicesU16, "u16_indices"},
      {vnb::kVnbMeshFlagEmbedTextures, "embedded_textures"},
  }};
  std::string out;
  for (const auto &[flag, name] : kNames) {
    if ((flags & flag) == 0u) {
      continue;
    }
    if (!out.empty()) {
      out += ' ';
    }
    out += name;
  }
  return out;
}

[[nodiscard]] std::optional<vnb::MeshContainer>
loadContainer(const std::filesystem::path &path) {
  auto bytesResult = vnb::readBinaryFile(path);
  if (bytesResult.hasError()) {
    VNB_LOG_FATAL("%s", bytesResult.error().c_str());
    return std::nullopt;
  }
  auto decodeResult = vnb::vnbDecode(bytesResult.value());
  if (decodeResult.hasError()) {
    const vnb::VnbFormatError &error = decodeResult.error();
    const std::string_view code = vnb::vnbErrorCodeName(error.code);
    VNB_LOG_FATAL("'%s': %.*s: %s", path.string().c_str(),
                  static_cast<int>(code.size()), code.data(),
                  error.message.c_str());
    return std::nullopt;
  }
  return std::move(decodeResult.value());
}

[[nodiscard]] int storeContainer(const vnb::MeshContainer &mesh,
                                 const std::filesystem::path &path) {
  auto encodeResult = vnb::vnbEncode(mesh);
  if (encodeResult.hasError()) {
    VNB_LOG_FATAL("encode failed: %s", encodeResult.error().message.c_str());
    return kExitError;
  }
  auto writeResult = vnb::writeBinaryFileAtomic(path, encodeResult.value());
  if (writeResult.hasError()) {
    VNB_LOG_FATAL("%s", writeResult.error().c_str());
    return kExitError;
  }
  VNB_LOG_INFO("wrote '%s' (%zu bytes)", path.string().c_str(),
               encodeResult.value().size());
  return kExitOk;
}

void printTexture(const vnb::TextureRef &texture) {
  const std::string_view slot = vnb::textureSlotName(texture.slot);
  std::printf("      %.*s uv%u", static_cast<int>(slot.size()), slot.data(),
              static_cast<unsigned>(texture.uvSet));
  if (const auto *external =
          std::get_if<vnb::ExternalTexture>(&texture.payload)) {
    std::printf(" external '%s'", external->uri.c_str());
  } else {
    const auto &embedded = std::get<vnb::EmbeddedTexture>(texture.payload);
    const std::string_view mime = vnb::textureMimeName(embedded.mime);
    std::printf(" embedded %.*s %zu bytes", static_cast<int>(mime.size()),
                mime.data(), embedded.bytes.size());
  }
  if (texture.offset) {
    std::printf(" offset=(%g, %g)", texture.offset->x, texture.offset->y);
  }
  if (texture.scale) {
    std::printf(" scale=(%g, %g)", texture.scale->x, texture.scale->y);
  }
  if (texture.rotation) {
    std::printf(" rotation=%g", *texture.rotation);
  }
  if (texture.sampler) {
    std::printf(" sampler=%u/%u/%u/%u",
                static_cast<unsigned>(texture.sampler->wrapU),
                static_cast<unsigned>(texture.sampler->wrapV),
                static_cast<unsigned>(texture.sampler->minFilter),
                static_cast<unsigned>(texture.sampler->magFilter));
  }
  std::printf("\n");
}

[[nodiscard]] int runInspect(const std::filesystem::path &input) {
  const std::optional<vnb::MeshContainer> mesh = loadContainer(input);
  if (!mesh) {
    return kExitError;
  }

  std::printf("name: '%s'\n", mesh->name.c_str());
  std::printf("flags: 0x%08x [%s]\n", mesh->featureFlags,
              describeFlags(mesh->featureFlags).c_str());
  std::printf("vertices: %zu\n", mesh->vertexCount());
  std::printf("indices: %zu (%s)\n", mesh->indexCount(),
              mesh->usesU16Indices() ? "u16" : "u32");
  if (mesh->bounds) {
    const vnb::BoundingBox &bounds = *mesh->bounds;
    std::printf("bounds: (%g, %g, %g) - (%g, %g, %g)\n", bounds.min_.x,
                bounds.min_.y, bounds.min_.z, bounds.max_.x, bounds.max_.y,
                bounds.max_.z);
  }

  std::printf("submeshes: %zu\n", mesh->subMeshes.size());
  for (size_t i = 0; i < mesh->subMeshes.size(); ++i) {
    const vnb::SubMeshRange &range = mesh->subMeshes[i];
    const std::string_view topology = vnb::topologyName(range.topology);
    std::printf("  [%zu] %.*s start=%u count=%u base=%d first=%u verts=%u",
                i, static_cast<int>(topology.size()), topology.data(),
                range.startIndex, range.indexCount, range.baseVertex,
                range.firstVertex, range.vertexCount);
    if (range.materialIndex) {
      std::printf(" material=%u\n",
                  static_cast<unsigned>(*range.materialIndex));
    } else {
      std::printf(" material=none\n");
    }
  }

  std::printf("materials: %zu\n", mesh->materials.size());
  for (size_t i = 0; i < mesh->materials.size(); ++i) {
    const vnb::PbrMaterial &material = mesh->materials[i];
    std::printf("  [%zu] '%s' flags=0x%08x\n", i, material.name.c_str(),
                material.flags);
    if (material.baseColorFactor) {
      const glm::vec4 &c = *material.baseColorFactor;
      std::printf("    base_color=(%g, %g, %g, %g)\n", c.r, c.g, c.b, c.a);
    }
    if (material.metallicFactor) {
      std::printf("    metallic=%g\n", *material.metallicFactor);
    }
    if (material.roughnessFactor) {
      std::printf("    roughness=%g\n", *material.roughnessFactor);
    }
    if (material.emissiveFactor) {
      const glm::vec3 &e = *material.emissiveFactor;
      std::printf("    emissive=(%g, %g, %g)\n", e.r, e.g, e.b);
    }
    if (material.alpha) {
      const std::string_view mode = vnb::alphaModeName(material.alpha->mode);
      std::printf("    alpha=%.*s", static_cast<int>(mode.size()), mode.data());
      if (material.alpha->mode == vnb::AlphaMode::Mask) {
        std::printf(" cutoff=%g", material.alpha->cutoff);
      }
      std::printf("\n");
    }
    if (material.doubleSided) {
      std::printf("    double_sided=%s\n",
                  *material.doubleSided ? "true" : "false");
    }
    std::printf("    textures: %zu\n", material.textures.size());
    for (const vnb::TextureRef &texture : material.textures) {
      printTexture(texture);
    }
  }
  return kExitOk;
}

[[nodiscard]] int runUpgrade(const std::filesystem::path &input,
                             const std::filesystem::path &output) {
  std::optional<vnb::MeshContainer> mesh = loadContainer(input);
  if (!mesh) {
    return kExitError;
  }
  return storeContainer(*mesh, output);
}

[[nodiscard]] int runEmbed(const std::filesystem::path &input,
                           const std::filesystem::path &output,
                           const vnb::RuntimeConfig &config) {
  std::optional<vnb::MeshContainer> mesh = loadContainer(input);
  if (!mesh) {
    return kExitError;
  }

  // Texture URIs are relative to the input file first, then the configured
  // roots.
  std::vector<std::filesystem::path> roots;
  const std::filesystem::path inputDir = input.parent_path();
  roots.push_back(inputDir.empty() ? std::filesystem::path(".") : inputDir);
  roots.insert(roots.end(), config.textures.searchRoots.begin(),
               config.textures.searchRoots.end());

  auto resolveResult = vnb::vnbResolveExternalTextures(
      *mesh, vnb::makeDirectoryTextureResolver(std::move(roots)),
      config.textures.unresolvedPolicy);
  if (resolveResult.hasError()) {
    VNB_LOG_FATAL("%s", resolveResult.error().message.c_str());
    return kExitError;
  }

  vnb::TextureResolveOutcome &outcome = resolveResult.value();
  if (vnb::vnbAllTexturesEmbedded(outcome.mesh)) {
    outcome.mesh.featureFlags |= vnb::kVnbMeshFlagEmbedTextures;
  }
  VNB_LOG_INFO("embedded %u textures, %zu left external",
               outcome.resolvedCount, outcome.unresolvedUris.size());
  return storeContainer(outcome.mesh, output);
}

} // namespace

int main(int argc, char **argv) {
  VNB_PROFILER_THREAD("Main");

  const std::optional<CommandLine> commandLine = parseCommandLine(argc, argv);
  if (!commandLine) {
    printUsage();
    return kExitUsage;
  }

  auto configResult = commandLine->configPath
                          ? vnb::loadRuntimeConfig(*commandLine->configPath)
                          : vnb::loadRuntimeConfigFromEnvOrDefault();
  if (configResult.hasError()) {
    VNB_LOG_FATAL("Failed to load tool config: %s",
                  configResult.error().c_str());
    return kExitError;
  }
  const vnb::RuntimeConfig &config = configResult.value();
  vnb::Log::initialize(config.toLogConfig());
  if (!config.sourcePath.empty()) {
    VNB_LOG_DEBUG("using config '%s'", config.sourcePath.string().c_str());
  }

  const std::vector<std::string> &args = commandLine->arguments;
  int exitCode = kExitUsage;
  if (commandLine->command == "inspect") {
    exitCode = runInspect(args[0]);
  } else if (commandLine->command == "upgrade") {
    exitCode = runUpgrade(args[0], args[1]);
  } else if (commandLine->command == "embed") {
    exitCode = runEmbed(args[0], args[1], config);
  }

  vnb::Log::shutdown();
  return exitCode;
}
