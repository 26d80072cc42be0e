#pragma once

#include "vnb/core/result.h"
#include "vnb/defines.h"

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

namespace vnb {

enum class VnbErrorCode : uint8_t {
  TruncatedInput = 0,
  LegacyParseFailure = 1,
  InvariantViolation = 2,
  StringTooLong = 3,
  UnknownEnumValue = 4,
  UnresolvedTexture = 5,
};

struct VnbFormatError {
  VnbErrorCode code = VnbErrorCode::InvariantViolation;
  std::string message;

  [[nodiscard]] bool is(VnbErrorCode expected) const noexcept {
    return code == expected;
  }
};

[[nodiscard]] VNB_API std::string_view
vnbErrorCodeName(VnbErrorCode code) noexcept;

template <typename T, typename... Args>
[[nodiscard]] Result<T, VnbFormatError> makeVnbError(VnbErrorCode code,
                                                     Args &&...args) {
  std::ostringstream oss;
  (oss << ... << std::forward<Args>(args));
  return Result<T, VnbFormatError>::makeError(
      VnbFormatError{.code = code, .message = oss.str()});
}

} // namespace vnb
