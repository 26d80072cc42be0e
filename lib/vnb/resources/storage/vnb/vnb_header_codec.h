#pragma once

#include "vnb/defines.h"
#include "vnb/resources/cpu/mesh_container.h"
#include "vnb/resources/storage/vnb/vnb_binary_format.h"
#include "vnb/resources/storage/vnb/vnb_byte_io.h"
#include "vnb/resources/storage/vnb/vnb_format_error.h"

namespace vnb {

enum class VnbHeaderStatus : uint8_t {
  Current = 0,
  // Magic or version mismatch. A dispatch signal, not an error.
  NotCurrentFormat = 1,
};

struct VnbHeaderProbe {
  VnbHeaderStatus status = VnbHeaderStatus::NotCurrentFormat;
  VnbBinaryHeader header{};

  [[nodiscard]] bool isCurrent() const noexcept {
    return status == VnbHeaderStatus::Current;
  }
};

// Fills magic, version and metadata from constants and counts from the
// container. Fails when a count does not fit the 32-bit header field.
[[nodiscard]] VNB_API Result<VnbBinaryHeader, VnbFormatError>
vnbMakeHeader(const MeshContainer &mesh);

VNB_API void vnbWriteHeader(VnbByteWriter &writer,
                            const VnbBinaryHeader &header);

[[nodiscard]] VNB_API Result<VnbHeaderProbe, VnbFormatError>
vnbReadHeader(VnbByteReader &reader);

} // namespace vnb
