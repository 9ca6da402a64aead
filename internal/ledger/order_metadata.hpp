#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <google/protobuf/message.h>

#include "keyshop/ledger/v1.hpp"

namespace keyshop::ledger {

/*
  OrderMetadata helpers.

  Metadata is stored in the ledger as the JSON form of the protobuf
  message. It is validated when it enters the ledger or the orchestrator;
  the orchestrator then switches on the oneof case.
*/

// Canonical JSON (proto field names) of any message stored in a JSON column.
std::string ToJson(const google::protobuf::Message& message);

// Unknown fields are ignored. Returns false when the JSON does not parse.
bool FromJson(std::string_view json, google::protobuf::Message* message);

std::string EncodeMetadata(const keyshop::ledger::v1::OrderMetadata& metadata);

// Throws util::InvalidState when the stored JSON does not parse.
keyshop::ledger::v1::OrderMetadata DecodeMetadata(std::string_view json);

// Throws util::InvalidArgument describing the first problem found.
void ValidateMetadata(const keyshop::ledger::v1::OrderMetadata& metadata);

// Amount in minor units. Throws util::InvalidArgument on a malformed amount.
int64_t AmountMinor(const keyshop::ledger::v1::OrderMetadata& metadata);

// Plan of a key order, nullptr for top-ups.
const keyshop::ledger::v1::PlanSelection* PlanOf(const keyshop::ledger::v1::OrderMetadata& metadata);

// "new", "extend", "gift", "top_up"
const char* ActionName(const keyshop::ledger::v1::OrderMetadata& metadata);

} // namespace keyshop::ledger
