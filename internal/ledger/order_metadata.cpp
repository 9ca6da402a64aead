#include "order_metadata.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/money.hpp"

namespace keyshop::ledger {

using keyshop::ledger::v1::OrderMetadata;

std::string ToJson(const google::protobuf::Message& message) {
  std::string                              json;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

bool FromJson(std::string_view json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return google::protobuf::util::JsonStringToMessage(std::string(json), message, options).ok();
}

std::string EncodeMetadata(const OrderMetadata& metadata) {
  return ToJson(metadata);
}

OrderMetadata DecodeMetadata(std::string_view json) {
  OrderMetadata metadata;
  if (!FromJson(json, &metadata)) {
    throw util::InvalidState("stored order metadata is unreadable");
  }
  return metadata;
}

int64_t AmountMinor(const OrderMetadata& metadata) {
  auto minor = util::ParseMinorUnits(metadata.amount());
  if (!minor) {
    throw util::InvalidArgument("malformed amount: '" + metadata.amount() + "'");
  }
  return *minor;
}

const v1::PlanSelection* PlanOf(const OrderMetadata& metadata) {
  switch (metadata.order_case()) {
    case OrderMetadata::kNewKey:
      return &metadata.new_key().plan();
    case OrderMetadata::kExtendKey:
      return &metadata.extend_key().plan();
    case OrderMetadata::kGiftKey:
      return &metadata.gift_key().plan();
    case OrderMetadata::kTopUp:
    case OrderMetadata::ORDER_NOT_SET:
      return nullptr;
  }
  return nullptr;
}

const char* ActionName(const OrderMetadata& metadata) {
  switch (metadata.order_case()) {
    case OrderMetadata::kNewKey:
      return "new";
    case OrderMetadata::kExtendKey:
      return "extend";
    case OrderMetadata::kGiftKey:
      return "gift";
    case OrderMetadata::kTopUp:
      return "top_up";
    case OrderMetadata::ORDER_NOT_SET:
      return "unset";
  }
  return "unset";
}

void ValidateMetadata(const OrderMetadata& metadata) {
  if (metadata.payment_id().empty()) throw util::InvalidArgument("payment_id is required");
  if (metadata.owner_id() <= 0) throw util::InvalidArgument("owner_id must be positive");
  if (AmountMinor(metadata) <= 0) throw util::InvalidArgument("amount must be positive");
  if (metadata.order_case() == OrderMetadata::ORDER_NOT_SET) throw util::InvalidArgument("order kind is required");

  if (const auto* plan = PlanOf(metadata)) {
    if (plan->duration_days() == 0 && plan->months() == 0) {
      throw util::InvalidArgument("plan must carry duration_days or months");
    }
  }

  if (metadata.has_extend_key() && metadata.extend_key().credential_id() <= 0) {
    throw util::InvalidArgument("extend order requires credential_id");
  }

  if (!metadata.promo_discount().empty() && !util::ParseMinorUnits(metadata.promo_discount())) {
    throw util::InvalidArgument("malformed promo_discount: '" + metadata.promo_discount() + "'");
  }
}

} // namespace keyshop::ledger
