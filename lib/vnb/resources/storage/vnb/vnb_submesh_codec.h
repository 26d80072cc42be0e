#pragma once

#include "vnb/defines.h"
#include "vnb/resources/cpu/mesh_container.h"
#include "vnb/resources/storage/vnb/vnb_byte_io.h"
#include "vnb/resources/storage/vnb/vnb_format_error.h"

namespace vnb {

[[nodiscard]] VNB_API Result<bool, VnbFormatError>
vnbWriteSubMeshes(VnbByteWriter &writer,
                  std::span<const SubMeshRange> subMeshes);

[[nodiscard]] VNB_API Result<bool, VnbFormatError>
vnbReadSubMeshes(VnbByteReader &reader, uint32_t count,
                 std::vector<SubMeshRange> &out);

} // namespace vnb
