#include "panel_client.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace keyshop::provisioning {

using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

constexpr int64_t kDayMs = 24LL * 3600 * 1000;

bool IsSuccess(long status) {
  return status >= 200 && status < 300;
}

bool ParseJson(const std::string& body, Struct* out) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return google::protobuf::util::JsonStringToMessage(body, out, options).ok();
}

std::string ToJson(const Struct& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) throw std::runtime_error("failed to encode panel request: " + std::string(status.message()));
  return json;
}

std::string TextField(const Struct& object, const char* name) {
  auto it = object.fields().find(name);
  if (it == object.fields().end() || it->second.kind_case() != Value::kStringValue) return {};
  return it->second.string_value();
}

// Panel responses wrap the payload in {"response": ...}; the payload is a
// user object or, for lookups, a list of them. Only an empty list says "no
// such user"; an envelope of any other shape is unreadable.
enum class Envelope { User, Empty, Unreadable };

Envelope ReadEnvelope(const Struct& envelope, const Struct** user) {
  *user   = nullptr;
  auto it = envelope.fields().find("response");
  if (it == envelope.fields().end()) return Envelope::Unreadable;

  const Value& payload = it->second;
  if (payload.kind_case() == Value::kStructValue) {
    *user = &payload.struct_value();
    return Envelope::User;
  }
  if (payload.kind_case() == Value::kListValue) {
    if (payload.list_value().values_size() == 0) return Envelope::Empty;
    const Value& first = payload.list_value().values(0);
    if (first.kind_case() != Value::kStructValue) return Envelope::Unreadable;
    *user = &first.struct_value();
    return Envelope::User;
  }
  return Envelope::Unreadable;
}

const Struct* FirstUser(const Struct& envelope) {
  const Struct* user = nullptr;
  ReadEnvelope(envelope, &user);
  return user;
}

std::string UsernameFor(const std::string& identity) {
  std::string name = identity.substr(0, identity.find('@'));
  std::replace_if(
      name.begin(), name.end(), [](char c) { return !((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-'); },
      '_');
  return name;
}

std::string UpstreamError(const util::HttpResponse& resp) {
  return "panel returned " + std::to_string(resp.status) + ": " + resp.body;
}

} // namespace

struct PanelProvisioningClient::Lookup {
  enum class State { Found, Missing, Failed } state = State::Failed;
  Struct      user;
  std::string error;
};

const char* ToString(Presence presence) {
  switch (presence) {
    case Presence::Present:
      return "present";
    case Presence::Absent:
      return "absent";
    case Presence::Unknown:
      return "unknown";
  }
  return "unknown";
}

PanelProvisioningClient::PanelProvisioningClient(std::vector<PanelHost> hosts, std::chrono::milliseconds timeout, std::shared_ptr<util::HttpClient> http,
                                                 util::NowFn now)
    : hosts_(std::move(hosts)), timeout_(timeout), http_(std::move(http)), now_(std::move(now)) {
}

std::shared_ptr<PanelProvisioningClient> PanelProvisioningClient::FromConfig(const keyshop::runtime::config::ProvisioningConfig& config,
                                                                             std::shared_ptr<util::HttpClient> http) {
  std::vector<PanelHost> hosts;
  for (const auto& host : config.hosts()) {
    std::string base_url = host.base_url();
    while (!base_url.empty() && base_url.back() == '/') base_url.pop_back();
    hosts.push_back({host.name(), base_url, host.api_token()});
  }
  return std::make_shared<PanelProvisioningClient>(std::move(hosts), std::chrono::milliseconds(config.timeout_ms()), std::move(http));
}

const PanelHost* PanelProvisioningClient::FindHost(const std::string& name) const {
  for (const auto& host : hosts_) {
    if (host.name == name) return &host;
  }
  return nullptr;
}

util::HttpResponse PanelProvisioningClient::Call(const PanelHost& host, const std::string& method, const std::string& path, const std::string& body,
                                                 std::chrono::milliseconds timeout) {
  std::vector<std::string> headers = {"Authorization: Bearer " + host.api_token, "Accept: application/json"};
  if (!body.empty()) headers.push_back("Content-Type: application/json");
  return http_->Perform(method, host.base_url + path, headers, body, timeout);
}

PanelProvisioningClient::Lookup PanelProvisioningClient::FindByIdentity(const PanelHost& host, const std::string& identity,
                                                                        std::chrono::milliseconds timeout) {
  Lookup lookup;
  auto   resp = Call(host, "GET", "/api/users/by-email/" + util::UrlEncode(identity), "", timeout);
  if (resp.status == 404) {
    lookup.state = Lookup::State::Missing;
    return lookup;
  }
  if (!IsSuccess(resp.status)) {
    lookup.error = UpstreamError(resp);
    return lookup;
  }

  Struct envelope;
  if (!ParseJson(resp.body, &envelope)) {
    lookup.error = "panel returned malformed JSON";
    return lookup;
  }
  const Struct* user = nullptr;
  switch (ReadEnvelope(envelope, &user)) {
    case Envelope::User:
      lookup.state = Lookup::State::Found;
      lookup.user  = *user;
      break;
    case Envelope::Empty:
      lookup.state = Lookup::State::Missing;
      break;
    case Envelope::Unreadable:
      lookup.error = "panel returned an unrecognized lookup body: " + resp.body;
      break;
  }
  return lookup;
}

ProvisionResult PanelProvisioningClient::CreateOrExtend(const ProvisionRequest& request) {
  ProvisionResult result;

  const PanelHost* host = FindHost(request.host);
  if (!host) {
    result.error = "host not found: " + request.host;
    return result;
  }

  try {
    auto lookup = FindByIdentity(*host, request.identity, request.timeout);
    if (lookup.state == Lookup::State::Failed) {
      result.error = lookup.error;
      return result;
    }

    const int64_t now_ms = util::ToUnixMillis(now_());
    Struct        body;
    auto&         fields = *body.mutable_fields();

    util::HttpResponse resp;
    if (lookup.state == Lookup::State::Found) {
      const int64_t current = util::ParseIso8601(TextField(lookup.user, "expireAt")).value_or(now_ms);
      const int64_t expiry  = request.absolute_expiry_ms.value_or(std::max(current, now_ms) + request.days_to_add * kDayMs);

      fields["uuid"].set_string_value(TextField(lookup.user, "uuid"));
      fields["expireAt"].set_string_value(util::FormatIso8601(expiry));
      if (request.traffic_limit_bytes) fields["trafficLimitBytes"].set_number_value(static_cast<double>(*request.traffic_limit_bytes));
      if (request.device_limit) fields["hwidDeviceLimit"].set_number_value(*request.device_limit);
      resp = Call(*host, "PATCH", "/api/users", ToJson(body), request.timeout);
    } else {
      const int64_t expiry = request.absolute_expiry_ms.value_or(now_ms + request.days_to_add * kDayMs);

      fields["username"].set_string_value(UsernameFor(request.identity));
      fields["email"].set_string_value(request.identity);
      fields["expireAt"].set_string_value(util::FormatIso8601(expiry));
      if (request.traffic_limit_bytes) fields["trafficLimitBytes"].set_number_value(static_cast<double>(*request.traffic_limit_bytes));
      if (request.device_limit) fields["hwidDeviceLimit"].set_number_value(*request.device_limit);
      resp = Call(*host, "POST", "/api/users", ToJson(body), request.timeout);
    }

    if (!IsSuccess(resp.status)) {
      result.error = UpstreamError(resp);
      return result;
    }

    Struct        envelope;
    const Struct* user = ParseJson(resp.body, &envelope) ? FirstUser(envelope) : nullptr;
    if (!user || TextField(*user, "uuid").empty()) {
      result.error = "panel response carried no user uuid";
      return result;
    }

    ProvisionedCredential credential;
    credential.remote_uuid     = TextField(*user, "uuid");
    credential.expires_at_ms   = util::ParseIso8601(TextField(*user, "expireAt")).value_or(0);
    credential.connection_info = TextField(*user, "subscriptionUrl");
    result.credential          = std::move(credential);
    return result;
  } catch (const util::HttpError& e) {
    result.error = e.what();
    return result;
  }
}

Presence PanelProvisioningClient::Exists(const std::string& identity, const std::string& remote_uuid, const std::string& host_name) {
  const PanelHost* host = FindHost(host_name);
  if (!host) return Presence::Unknown;

  try {
    if (!remote_uuid.empty()) {
      auto resp = Call(*host, "GET", "/api/users/" + util::UrlEncode(remote_uuid), "", timeout_);
      if (resp.status == 404) return Presence::Absent;
      if (!IsSuccess(resp.status)) return Presence::Unknown;

      Struct envelope;
      if (!ParseJson(resp.body, &envelope)) return Presence::Unknown;
      const Struct* user = nullptr;
      switch (ReadEnvelope(envelope, &user)) {
        case Envelope::User:
          return Presence::Present;
        case Envelope::Empty:
          return Presence::Absent;
        case Envelope::Unreadable:
          return Presence::Unknown;
      }
      return Presence::Unknown;
    }

    auto lookup = FindByIdentity(*host, identity, timeout_);
    switch (lookup.state) {
      case Lookup::State::Found:
        return Presence::Present;
      case Lookup::State::Missing:
        return Presence::Absent;
      case Lookup::State::Failed:
        return Presence::Unknown;
    }
    return Presence::Unknown;
  } catch (const util::HttpError& e) {
    KEYSHOP_LOG_WARN("panel existence check failed",
                     {observability::StringField("host", host_name), observability::StringField("identity", identity), observability::StringField("error", e.what())});
    return Presence::Unknown;
  }
}

bool PanelProvisioningClient::Delete(const std::string& host_name, const std::string& identity) {
  const PanelHost* host = FindHost(host_name);
  if (!host) return false;

  try {
    auto lookup = FindByIdentity(*host, identity, timeout_);
    if (lookup.state == Lookup::State::Missing) return true;
    if (lookup.state == Lookup::State::Failed) return false;

    auto resp = Call(*host, "DELETE", "/api/users/" + util::UrlEncode(TextField(lookup.user, "uuid")), "", timeout_);
    return IsSuccess(resp.status) || resp.status == 404;
  } catch (const util::HttpError& e) {
    KEYSHOP_LOG_WARN("panel delete failed",
                     {observability::StringField("host", host_name), observability::StringField("identity", identity), observability::StringField("error", e.what())});
    return false;
  }
}

} // namespace keyshop::provisioning
