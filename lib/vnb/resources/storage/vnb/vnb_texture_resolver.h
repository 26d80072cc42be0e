#pragma once

#include "vnb/defines.h"
#include "vnb/resources/cpu/mesh_container.h"
#include "vnb/resources/storage/vnb/vnb_format_error.h"

namespace vnb {

// Returns the payload for an external URI, or nullopt when it cannot be found.
using TextureResolver = std::function<std::optional<std::vector<std::byte>>(
    std::string_view uri)>;

enum class UnresolvedTexturePolicy : uint8_t {
  PassThrough = 0,
  Fail = 1,
};

struct TextureResolveOutcome {
  MeshContainer mesh;
  std::vector<std::string> unresolvedUris;
  uint32_t resolvedCount = 0;
};

// Returns a copy of mesh where every External texture the resolver can serve
// is replaced by an Embedded PNG payload. Slot, uv set, transform and sampler
// are kept. An empty resolver resolves nothing.
[[nodiscard]] VNB_API Result<TextureResolveOutcome, VnbFormatError>
vnbResolveExternalTextures(
    const MeshContainer &mesh, const TextureResolver &resolver,
    UnresolvedTexturePolicy policy = UnresolvedTexturePolicy::PassThrough);

[[nodiscard]] VNB_API bool vnbAllTexturesEmbedded(const MeshContainer &mesh);

// Looks up relative URIs under each root in order. Absolute URIs and URIs
// that normalize outside of a root are never resolved.
[[nodiscard]] VNB_API TextureResolver
makeDirectoryTextureResolver(std::vector<std::filesystem::path> searchRoots,
                             uint64_t maxTextureBytes = 256ull << 20u);

[[nodiscard]] VNB_API std::string_view
unresolvedTexturePolicyName(UnresolvedTexturePolicy policy) noexcept;

} // namespace vnb
