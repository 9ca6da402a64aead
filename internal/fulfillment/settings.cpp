#include "settings.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/util/money.hpp"

namespace keyshop::fulfillment {

namespace runtime_config = keyshop::runtime::config;

bool FulfillmentSettings::IsBalanceMethod(const std::string& method) const {
  return std::find(balance_methods.begin(), balance_methods.end(), method) != balance_methods.end();
}

bool FulfillmentSettings::IsCardMethod(const std::string& method) const {
  return std::find(card_methods.begin(), card_methods.end(), method) != card_methods.end();
}

FulfillmentSettings SettingsFromConfig(const keyshop::runtime::config::RuntimeConfig& config) {
  const auto& fulfillment = config.fulfillment();

  FulfillmentSettings settings;
  settings.identity_domain = fulfillment.identity_domain();
  settings.days_per_month  = fulfillment.days_per_month();
  if (config.provisioning().hosts_size() > 0) settings.default_host = config.provisioning().hosts(0).name();
  settings.provisioning_timeout = std::chrono::milliseconds(config.provisioning().timeout_ms());

  settings.balance_methods.assign(fulfillment.balance_payment_methods().begin(), fulfillment.balance_payment_methods().end());

  const auto& referral      = fulfillment.referral();
  settings.referral.enabled = referral.enabled();
  settings.referral.percent = referral.percent();
  switch (referral.scheme()) {
    case runtime_config::REFERRAL_SCHEME_FIXED_PER_PURCHASE:
      settings.referral.scheme = ReferralScheme::FixedPerPurchase;
      break;
    case runtime_config::REFERRAL_SCHEME_FIXED_AT_START:
      settings.referral.scheme = ReferralScheme::FixedAtStart;
      break;
    default:
      settings.referral.scheme = ReferralScheme::PercentOfPrice;
      break;
  }
  if (!referral.fixed_amount().empty()) {
    auto fixed = util::ParseMinorUnits(referral.fixed_amount());
    if (!fixed) throw util::InvalidArgument("fulfillment.referral.fixed_amount is not a decimal amount");
    settings.referral.fixed_minor = *fixed;
  }

  settings.franchise_percent = fulfillment.franchise().commission_percent();
  settings.card_methods.assign(fulfillment.franchise().card_payment_methods().begin(), fulfillment.franchise().card_payment_methods().end());
  return settings;
}

StaticSettingsProvider::StaticSettingsProvider(FulfillmentSettings settings) : settings_(std::move(settings)) {
}

FulfillmentSettings StaticSettingsProvider::Snapshot() const {
  std::lock_guard lock(mutex_);
  return settings_;
}

void StaticSettingsProvider::Update(FulfillmentSettings settings) {
  std::lock_guard lock(mutex_);
  settings_ = std::move(settings);
}

} // namespace keyshop::fulfillment
