#include "vnb/pch.h"

#include "vnb/resources/storage/vnb/vnb_texture_resolver.h"

#include "vnb/core/log.h"
#include "vnb/core/profiling.h"
#include "vnb/resources/storage/vnb/vnb_file_utils.h"

namespace vnb {
namespace {

// Rejects URIs that would leave the search root once joined.
[[nodiscard]] std::optional<std::filesystem::path>
relativeTexturePath(std::string_view uri) {
  if (uri.empty()) {
    return std::nullopt;
  }
  const std::filesystem::path raw{std::string(uri)};
  if (raw.is_absolute() || raw.has_root_name() || raw.has_root_directory()) {
    return std::nullopt;
  }
  const std::filesystem::path normalized = raw.lexically_normal();
  if (normalized.empty() || normalized == ".") {
    return std::nullopt;
  }
  const auto first = normalized.begin();
  if (first != normalized.end() && *first == "..") {
    return std::nullopt;
  }
  return normalized;
}

} // namespace

Result<TextureResolveOutcome, VnbFormatError>
vnbResolveExternalTextures(const MeshContainer &mesh,
                           const TextureResolver &resolver,
                           UnresolvedTexturePolicy policy) {
  VNB_PROFILER_FUNCTION_COLOR(VNB_PROFILER_COLOR_RESOLVE);

  TextureResolveOutcome outcome{};
  outcome.mesh = mesh;
  for (PbrMaterial &material : outcome.mesh.materials) {
    for (TextureRef &texture : material.textures) {
      const auto *external = std::get_if<ExternalTexture>(&texture.payload);
      if (external == nullptr) {
        continue;
      }

      std::optional<std::vector<std::byte>> bytes;
      if (resolver) {
        bytes = resolver(external->uri);
      }
      if (!bytes) {
        if (policy == UnresolvedTexturePolicy::Fail) {
          return makeVnbError<TextureResolveOutcome>(
              VnbErrorCode::UnresolvedTexture,
              "vnbResolveExternalTextures: material '", material.name,
              "' texture '", external->uri, "' could not be resolved");
        }
        VNB_LOG_WARNING("vnbResolveExternalTextures: '%s' left external",
                        external->uri.c_str());
        outcome.unresolvedUris.push_back(external->uri);
        continue;
      }

      VNB_LOG_DEBUG("vnbResolveExternalTextures: embedded '%s' (%zu bytes)",
                    external->uri.c_str(), bytes->size());
      texture.payload = EmbeddedTexture{.mime = TextureMime::Png,
                                        .bytes = std::move(*bytes)};
      ++outcome.resolvedCount;
    }
  }
  return Result<TextureResolveOutcome, VnbFormatError>::makeResult(
      std::move(outcome));
}

bool vnbAllTexturesEmbedded(const MeshContainer &mesh) {
  return std::all_of(
      mesh.materials.begin(), mesh.materials.end(),
      [](const PbrMaterial &material) {
        return std::all_of(material.textures.begin(), material.textures.end(),
                           [](const TextureRef &texture) {
                             return texture.kind() == TextureRefKind::Embedded;
                           });
      });
}

TextureResolver
makeDirectoryTextureResolver(std::vector<std::filesystem::path> searchRoots,
                             uint64_t maxTextureBytes) {
  return [roots = std::move(searchRoots), maxTextureBytes](
             std::string_view uri) -> std::optional<std::vector<std::byte>> {
    const std::optional<std::filesystem::path> relative =
        relativeTexturePath(uri);
    if (!relative) {
      VNB_LOG_WARNING("makeDirectoryTextureResolver: refusing uri '%.*s'",
                      static_cast<int>(uri.size()), uri.data());
      return std::nullopt;
    }

    for (const std::filesystem::path &root : roots) {
      const std::filesystem::path candidate = root / *relative;
      std::error_code ec;
      if (!std::filesystem::is_regular_file(candidate, ec)) {
        continue;
      }
      auto bytesResult = readBinaryFile(candidate, maxTextureBytes);
      if (bytesResult.hasError()) {
        VNB_LOG_WARNING("makeDirectoryTextureResolver: %s",
                        bytesResult.error().c_str());
        continue;
      }
      return std::move(bytesResult.value());
    }
    return std::nullopt;
  };
}

std::string_view
unresolvedTexturePolicyName(UnresolvedTexturePolicy policy) noexcept {
  switch (policy) {
  case UnresolvedTexturePolicy::PassThrough:
    return "pass_through";
  case UnresolvedTexturePolicy::Fail:
    return "fail";
  }
  return "pass_through";
}

} // namespace vnb
