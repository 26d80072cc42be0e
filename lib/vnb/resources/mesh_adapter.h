#pragma once

#include "vnb/defines.h"
#include "vnb/resources/cpu/mesh_container.h"
#include "vnb/resources/cpu/mesh_data.h"
#include "vnb/resources/storage/vnb/vnb_format_error.h"

namespace vnb {

struct MeshContainerBuildOptions {
  bool includeNormals = true;
  bool includeTangents = true;
  bool includeColors = true;
  bool includeUv0 = true;
  bool includeUv1 = true;
  bool includeBounds = true;
  // Emit 16-bit indices when the vertex count and every index fit.
  bool compactIndices = true;
};

// Splits interleaved vertices into flag-gated streams. An attribute is
// written only when both the option and the MeshData attribute are set.
[[nodiscard]] VNB_API Result<MeshContainer, VnbFormatError>
meshContainerFromMeshData(const MeshData &data,
                          const MeshContainerBuildOptions &options = {});

// Interleaves a container for CPU consumers. Absent colors default to white,
// other absent attributes to zero. Submesh index ranges, referenced vertices
// and material indices are validated here, not in the codec.
[[nodiscard]] VNB_API Result<MeshData, VnbFormatError>
meshDataFromContainer(
    const MeshContainer &mesh,
    std::pmr::memory_resource *mem = std::pmr::get_default_resource());

} // namespace vnb
