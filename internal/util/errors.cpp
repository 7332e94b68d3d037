#include "errors.hpp"

namespace cloudstrap::util {

const char* ToString(ProviderErrorKind kind) {
  switch (kind) {
    case ProviderErrorKind::kCapacityExhausted:
      return "capacity_exhausted";
    case ProviderErrorKind::kInvalidZone:
      return "invalid_zone";
    case ProviderErrorKind::kNotFound:
      return "not_found";
    case ProviderErrorKind::kAuthFailure:
      return "auth_failure";
    case ProviderErrorKind::kTransport:
      return "transport";
    case ProviderErrorKind::kOther:
    default:
      return "other";
  }
}

} // namespace cloudstrap::util
