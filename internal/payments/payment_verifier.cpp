#include "payment_verifier.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace keyshop::payments {

void VerifierRegistry::Register(const std::string& provider, std::shared_ptr<PaymentVerifier> verifier) {
  if (provider.empty() || !verifier) throw util::InvalidArgument("verifier needs a provider name");
  if (!verifiers_.emplace(provider, std::move(verifier)).second) throw util::AlreadyExists("verifier already registered: " + provider);
}

bool VerifierRegistry::Contains(const std::string& provider) const {
  return verifiers_.count(provider) > 0;
}

VerifiedPayment VerifierRegistry::Verify(const RawNotification& notification) const {
  auto it = verifiers_.find(notification.provider);
  if (it == verifiers_.end()) throw util::Rejected("unknown payment provider: " + notification.provider);

  auto verified = it->second->Verify(notification);
  if (!verified) {
    KEYSHOP_LOG_WARN("provider notification rejected", {observability::StringField("provider", notification.provider)});
    throw util::Rejected("notification failed verification");
  }
  return *verified;
}

} // namespace keyshop::payments
