#pragma once

#include <string>

#include "internal/payments/payment_verifier.hpp"

namespace keyshop::payments {

/*
  Notifications forwarded by a trusted relay that already checked the
  provider signature.

  The relay authenticates with "Authorization: Bearer <token>" and posts

    {"provider_payment_id": "...", "payment_id": "...",
     "amount": "300.00", "currency": "RUB"}
*/
class RelayTokenVerifier final : public PaymentVerifier {
 public:
  explicit RelayTokenVerifier(std::string token);

  std::optional<VerifiedPayment> Verify(const RawNotification& notification) const override;

 private:
  std::string token_;
};

// Compares without an early exit on the first differing byte.
bool ConstantTimeEquals(const std::string& a, const std::string& b);

} // namespace keyshop::payments
