#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace keyshop::payments {

// A provider callback as it arrived. Header names are lowercased.
struct RawNotification {
  std::string                        provider;
  std::map<std::string, std::string> headers;
  std::string                        body;
};

// The only fields the ledger trusts from a provider.
struct VerifiedPayment {
  std::string provider_payment_id;
  std::string internal_payment_id;
  int64_t     amount_minor = 0;
  std::string currency;
};

/*
  One implementation per provider. Signature checks and amount
  normalization live behind this interface.
*/
class PaymentVerifier {
 public:
  virtual ~PaymentVerifier() = default;

  // nullopt rejects the notification
  virtual std::optional<VerifiedPayment> Verify(const RawNotification& notification) const = 0;
};

// Provider name -> verifier.
class VerifierRegistry {
 public:
  void Register(const std::string& provider, std::shared_ptr<PaymentVerifier> verifier);

  bool Contains(const std::string& provider) const;

  // Throws util::Rejected for an unknown provider or a failed verification.
  VerifiedPayment Verify(const RawNotification& notification) const;

 private:
  std::map<std::string, std::shared_ptr<PaymentVerifier>> verifiers_;
};

} // namespace keyshop::payments
