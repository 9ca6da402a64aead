#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace keyshop::provisioning {

struct ProvisionRequest {
  std::string host;
  std::string identity;

  // Added to the later of the current remote expiry and now.
  int64_t days_to_add = 0;
  // Overrides days_to_add when set.
  std::optional<int64_t> absolute_expiry_ms;

  std::optional<uint64_t> traffic_limit_bytes;
  std::optional<uint32_t> device_limit;

  std::chrono::milliseconds timeout{15000};
};

struct ProvisionedCredential {
  std::string remote_uuid;
  int64_t     expires_at_ms = 0;
  std::string connection_info;
};

struct ProvisionResult {
  std::optional<ProvisionedCredential> credential;
  // Raw upstream text when credential is empty.
  std::string error;

  bool ok() const {
    return credential.has_value();
  }
};

enum class Presence { Present, Absent, Unknown };

const char* ToString(Presence presence);

/*
  Client of the external provisioning panel.

  Implementations must not throw for upstream failures: CreateOrExtend
  reports them in ProvisionResult::error and Exists answers Unknown.
*/
class ProvisioningClient {
 public:
  virtual ~ProvisioningClient() = default;

  virtual ProvisionResult CreateOrExtend(const ProvisionRequest& request) = 0;

  // remote_uuid is preferred when non-empty.
  virtual Presence Exists(const std::string& identity, const std::string& remote_uuid, const std::string& host) = 0;

  virtual bool Delete(const std::string& host, const std::string& identity) = 0;
};

} // namespace keyshop::provisioning
