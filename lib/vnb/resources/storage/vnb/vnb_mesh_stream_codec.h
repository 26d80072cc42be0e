#pragma once

#include "vnb/defines.h"
#include "vnb/resources/cpu/mesh_container.h"
#include "vnb/resources/storage/vnb/vnb_binary_format.h"
#include "vnb/resources/storage/vnb/vnb_byte_io.h"
#include "vnb/resources/storage/vnb/vnb_format_error.h"

namespace vnb {

// Checks that every gating feature flag agrees with the container contents:
// positions are present and whole, each flagged stream holds exactly
// vertexCount * width floats, unflagged streams are empty, and the bounds and
// index-width bits match the held values.
[[nodiscard]] VNB_API Result<bool, VnbFormatError>
vnbValidateMeshStreams(const MeshContainer &mesh);

// Writes name, vertex streams, bounds and indices in wire order.
[[nodiscard]] VNB_API Result<bool, VnbFormatError>
vnbWriteMeshStreams(VnbByteWriter &writer, const MeshContainer &mesh);

// Reads name, vertex streams, bounds and indices as gated by the header.
[[nodiscard]] VNB_API Result<bool, VnbFormatError>
vnbReadMeshStreams(VnbByteReader &reader, const VnbBinaryHeader &header,
                   MeshContainer &mesh);

} // namespace vnb
