#pragma once

#include "vnb/defines.h"
#include "vnb/resources/cpu/mesh_container.h"
#include "vnb/resources/storage/vnb/vnb_format_error.h"
#include "vnb/resources/storage/vnb/vnb_texture_resolver.h"

namespace vnb {

// Validates flag/stream agreement and writes header, name, streams, indices,
// submeshes and materials in that order.
[[nodiscard]] VNB_API Result<std::vector<std::byte>, VnbFormatError>
vnbEncode(const MeshContainer &mesh);

// Parses the current format. Returns nullopt when the header magic or version
// does not match, so the caller may try another parser. Every other failure
// is reported as an error.
[[nodiscard]] VNB_API Result<std::optional<MeshContainer>, VnbFormatError>
vnbDecodeCurrent(std::span<const std::byte> bytes);

// Decodes the current format, falling back once to the legacy parser when the
// preamble is unreadable or does not identify the current format.
[[nodiscard]] VNB_API Result<MeshContainer, VnbFormatError>
vnbDecode(std::span<const std::byte> bytes);

// vnbDecode followed by vnbResolveExternalTextures.
[[nodiscard]] VNB_API Result<MeshContainer, VnbFormatError>
vnbDecode(std::span<const std::byte> bytes, const TextureResolver &resolver,
          UnresolvedTexturePolicy policy = UnresolvedTexturePolicy::PassThrough);

} // namespace vnb
