#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace cloudstrap::util {

/*
  Central error types.

  Provider failures are classified once, at the adapter boundary, into
  ProviderErrorKind. Provisioners never inspect provider message text.
*/

class CredentialsMissing : public std::runtime_error {
 public:
  explicit CredentialsMissing(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidResourceSpec : public std::runtime_error {
 public:
  explicit InvalidResourceSpec(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NetworkProvisioningFailed : public std::runtime_error {
 public:
  explicit NetworkProvisioningFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NoZoneAvailable : public std::runtime_error {
 public:
  explicit NoZoneAvailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ProvisioningTimeout : public std::runtime_error {
 public:
  explicit ProvisioningTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Interrupted : public std::runtime_error {
 public:
  explicit Interrupted(const std::string& msg) : std::runtime_error(msg) {
  }
};

enum class ProviderErrorKind {
  kCapacityExhausted,
  kInvalidZone,
  kNotFound,
  kAuthFailure,
  kTransport,
  kOther,
};

const char* ToString(ProviderErrorKind kind);

class ProviderError : public std::runtime_error {
 public:
  ProviderError(ProviderErrorKind kind, std::string code, const std::string& msg, std::string request_id = {})
      : std::runtime_error(msg), kind_(kind), code_(std::move(code)), request_id_(std::move(request_id)) {
  }

  ProviderErrorKind kind() const {
    return kind_;
  }
  const std::string& code() const {
    return code_;
  }
  const std::string& request_id() const {
    return request_id_;
  }

 private:
  ProviderErrorKind kind_;
  std::string       code_;
  std::string       request_id_;
};

// Zone-level failures that justify trying the next zone.
inline bool IsZoneRetryable(ProviderErrorKind kind) {
  return kind == ProviderErrorKind::kCapacityExhausted || kind == ProviderErrorKind::kInvalidZone;
}

} // namespace cloudstrap::util
