#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/provisioning/provisioning_client.hpp"
#include "internal/util/http_client.hpp"
#include "internal/util/time.hpp"

namespace keyshop::provisioning {

struct PanelHost {
  std::string name;
  std::string base_url;
  std::string api_token;
};

/*
  REST adapter for the provisioning panel.

  Users are addressed by uuid; lookups by identity go through the
  by-email endpoint. Expiry is exchanged as ISO-8601 UTC. Every request
  carries the host's bearer token.
*/
class PanelProvisioningClient final : public ProvisioningClient {
 public:
  PanelProvisioningClient(std::vector<PanelHost> hosts, std::chrono::milliseconds timeout, std::shared_ptr<util::HttpClient> http,
                          util::NowFn now = util::SystemNow());

  static std::shared_ptr<PanelProvisioningClient> FromConfig(const keyshop::runtime::config::ProvisioningConfig& config,
                                                             std::shared_ptr<util::HttpClient> http);

  ProvisionResult CreateOrExtend(const ProvisionRequest& request) override;
  Presence        Exists(const std::string& identity, const std::string& remote_uuid, const std::string& host) override;
  bool            Delete(const std::string& host, const std::string& identity) override;

 private:
  struct Lookup;

  const PanelHost*  FindHost(const std::string& name) const;
  util::HttpResponse Call(const PanelHost& host, const std::string& method, const std::string& path, const std::string& body,
                          std::chrono::milliseconds timeout);
  Lookup            FindByIdentity(const PanelHost& host, const std::string& identity, std::chrono::milliseconds timeout);

  std::vector<PanelHost>            hosts_;
  std::chrono::milliseconds         timeout_;
  std::shared_ptr<util::HttpClient> http_;
  util::NowFn                       now_;
};

} // namespace keyshop::provisioning
