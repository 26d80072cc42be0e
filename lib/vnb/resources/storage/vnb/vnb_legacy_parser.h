#pragma once

#include "vnb/defines.h"
#include "vnb/resources/cpu/mesh_container.h"
#include "vnb/resources/storage/vnb/vnb_format_error.h"

namespace vnb {

// Parses the flag-less revision-1 layout: per-submesh flat colors, vertex
// counts, positions, normals, index counts and indices, UV counts and UVs.
// Produces positions, normals, broadcast vertex colors, uv0 and 32-bit
// indices under a single untextured triangle submesh. Any inconsistency
// fails the whole parse with LegacyParseFailure.
[[nodiscard]] VNB_API Result<MeshContainer, VnbFormatError>
vnbDecodeLegacy(std::span<const std::byte> bytes);

} // namespace vnb
