#pragma once

#include "vnb/defines.h"
#include "vnb/resources/cpu/mesh_container.h"
#include "vnb/resources/storage/vnb/vnb_byte_io.h"
#include "vnb/resources/storage/vnb/vnb_format_error.h"

namespace vnb {

// Material records carry their own flags word; the factor bits and Sampler
// decide which bytes follow. Texture slot bits are informational.
[[nodiscard]] VNB_API Result<bool, VnbFormatError>
vnbWriteMaterial(VnbByteWriter &writer, const PbrMaterial &material);

[[nodiscard]] VNB_API Result<PbrMaterial, VnbFormatError>
vnbReadMaterial(VnbByteReader &reader);

[[nodiscard]] VNB_API Result<bool, VnbFormatError>
vnbWriteMaterials(VnbByteWriter &writer,
                  std::span<const PbrMaterial> materials);

[[nodiscard]] VNB_API Result<bool, VnbFormatError>
vnbReadMaterials(VnbByteReader &reader, uint32_t count,
                 std::vector<PbrMaterial> &out);

} // namespace vnb
