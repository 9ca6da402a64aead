#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace keyshop::util {

/*
  UUID helpers

  Payment ids handed out before a provider redirect are random RFC4122
  version 4 UUIDs in their canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Accepts the canonical form with or without dashes. Throws util::InvalidArgument.
UUID FromString(const std::string& str);

// ToString(GenerateUUID())
std::string NewPaymentId();

} // namespace keyshop::util
