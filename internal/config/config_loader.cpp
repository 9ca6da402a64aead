#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace keyshop::config {

using keyshop::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars carry the non-specific tag "!" and always stay strings,
  // so amounts like "150.00" survive as decimal strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50061");

  auto* ledger = config.mutable_ledger();
  if (ledger->retry_attempts() == 0) ledger->set_retry_attempts(5);
  if (ledger->retry_base_delay_ms() == 0) ledger->set_retry_base_delay_ms(50);

  auto* fulfillment = config.mutable_fulfillment();
  if (fulfillment->workers() == 0) fulfillment->set_workers(2);
  if (fulfillment->days_per_month() == 0) fulfillment->set_days_per_month(30);
  if (fulfillment->identity_domain().empty()) fulfillment->set_identity_domain("keyshop.local");
  if (fulfillment->balance_payment_methods_size() == 0) fulfillment->add_balance_payment_methods("balance");

  auto* franchise = fulfillment->mutable_franchise();
  if (franchise->card_payment_methods_size() == 0) {
    for (const char* method : {"yookassa", "platega", "heleket", "yoomoney"}) {
      franchise->add_card_payment_methods(method);
    }
  }

  auto* provisioning = config.mutable_provisioning();
  if (provisioning->timeout_ms() == 0) provisioning->set_timeout_ms(15000);

  auto* reconciliation = config.mutable_reconciliation();
  if (reconciliation->interval_sec() == 0) reconciliation->set_interval_sec(3600);
  if (reconciliation->grace_window_sec() == 0) reconciliation->set_grace_window_sec(24 * 3600);
  if (reconciliation->max_concurrency() == 0) reconciliation->set_max_concurrency(8);
  if (reconciliation->stalled_claim_after_sec() == 0) reconciliation->set_stalled_claim_after_sec(900);

  auto* observability = config.mutable_observability();
  if (observability->service_name().empty()) observability->set_service_name("keyshop-ledger");
  if (observability->transport() == keyshop::runtime::config::OTLP_TRANSPORT_UNSPECIFIED) {
    observability->set_transport(keyshop::runtime::config::OTLP_TRANSPORT_GRPC);
  }
  if (observability->metrics().collection_interval_ms() == 0) observability->mutable_metrics()->set_collection_interval_ms(10000);

  auto* telegram = config.mutable_notifications()->mutable_telegram();
  if (telegram->api_base_url().empty()) telegram->set_api_base_url("https://api.telegram.org");
  if (telegram->timeout_ms() == 0) telegram->set_timeout_ms(10000);
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // an empty file is a valid, all-defaults config
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(config);
  return config;
}

} // namespace keyshop::config
