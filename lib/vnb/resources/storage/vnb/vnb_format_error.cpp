#include "vnb/pch.h"

#include "vnb/resources/storage/vnb/vnb_format_error.h"

namespace vnb {

std::string_view vnbErrorCodeName(VnbErrorCode code) noexcept {
  switch (code) {
  case VnbErrorCode::TruncatedInput:
    return "TruncatedInput";
  case VnbErrorCode::LegacyParseFailure:
    return "LegacyParseFailure";
  case VnbErrorCode::InvariantViolation:
    return "InvariantViolation";
  case VnbErrorCode::StringTooLong:
    return "StringTooLong";
  case VnbErrorCode::UnknownEnumValue:
    return "UnknownEnumValue";
  case VnbErrorCode::UnresolvedTexture:
    return "UnresolvedTexture";
  }
  return "Unknown";
}

} // namespace vnb
