#include "vnb/pch.h"

#include "vnb/resources/storage/vnb/vnb_header_codec.h"

#include "vnb/core/log.h"

namespace vnb {
namespace {

[[nodiscard]] bool fitsU32(size_t value) {
  return static_cast<uint64_t>(value) <= std::numeric_limits<uint32_t>::max();
}

} // namespace

Result<VnbBinaryHeader, VnbFormatError>
vnbMakeHeader(const MeshContainer &mesh) {
  const size_t vertexCount = mesh.vertexCount();
  const size_t indexCount = mesh.indexCount();
  if (!fitsU32(vertexCount) || !fitsU32(indexCount) ||
      !fitsU32(mesh.subMeshes.size()) || !fitsU32(mesh.materials.size())) {
    return makeVnbError<VnbBinaryHeader>(
        VnbErrorCode::InvariantViolation,
        "vnbMakeHeader: element count exceeds 32-bit header field");
  }

  VnbBinaryHeader header{};
  header.magic = kVnbBinaryMagic;
  header.version = kVnbBinaryFormatVersion;
  header.endianness = kVnbEndiannessLittle;
  header.coordinateSystem = kVnbCoordinateSystemYUp;
  header.unitScale = kVnbDefaultUnitScale;
  header.featureFlags = mesh.featureFlags;
  header.vertexCount = static_cast<uint32_t>(vertexCount);
  header.indexCount = static_cast<uint32_t>(indexCount);
  header.subMeshCount = static_cast<uint32_t>(mesh.subMeshes.size());
  header.materialCount = static_cast<uint32_t>(mesh.materials.size());
  return Result<VnbBinaryHeader, VnbFormatError>::makeResult(header);
}

void vnbWriteHeader(VnbByteWriter &writer, const VnbBinaryHeader &header) {
  VnbBinaryHeader out = header;
  out.reserved.fill(0);
  writer.writePod(out);
}

Result<VnbHeaderProbe, VnbFormatError> vnbReadHeader(VnbByteReader &reader) {
  VnbHeaderProbe probe{};
  if (!reader.readPod(probe.header)) {
    return makeVnbError<VnbHeaderProbe>(
        VnbErrorCode::TruncatedInput, "vnbReadHeader: need ",
        sizeof(VnbBinaryHeader), " bytes, have ", reader.remaining());
  }

  const VnbBinaryHeader &header = probe.header;
  if (header.magic != kVnbBinaryMagic ||
      header.version != kVnbBinaryFormatVersion) {
    probe.status = VnbHeaderStatus::NotCurrentFormat;
    return Result<VnbHeaderProbe, VnbFormatError>::makeResult(probe);
  }

  if (header.endianness != kVnbEndiannessLittle) {
    VNB_LOG_WARNING("vnbReadHeader: endianness tag %u is not little-endian, "
                    "decoding as little-endian",
                    static_cast<unsigned>(header.endianness));
  }
  probe.status = VnbHeaderStatus::Current;
  return Result<VnbHeaderProbe, VnbFormatError>::makeResult(probe);
}

} // namespace vnb
