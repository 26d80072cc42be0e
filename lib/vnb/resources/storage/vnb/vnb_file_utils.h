#pragma once

#include "vnb/core/result.h"
#include "vnb/defines.h"
#include "vnb/pch.h"

namespace vnb {

constexpr uint64_t kVnbUnlimitedFileBytes = std::numeric_limits<uint64_t>::max();

// Reads a whole file. Files larger than maxBytes are refused before any
// payload allocation.
[[nodiscard]] VNB_API Result<std::vector<std::byte>, std::string>
readBinaryFile(const std::filesystem::path &path,
               uint64_t maxBytes = kVnbUnlimitedFileBytes);

// Writes to a sibling temp file and renames it over the destination, creating
// parent directories as needed.
[[nodiscard]] VNB_API Result<bool, std::string>
writeBinaryFileAtomic(const std::filesystem::path &path,
                      std::span<const std::byte> bytes);

} // namespace vnb
