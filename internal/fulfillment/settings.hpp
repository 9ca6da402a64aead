#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace keyshop::fulfillment {

enum class ReferralScheme { PercentOfPrice, FixedPerPurchase, FixedAtStart };

struct ReferralSettings {
  bool           enabled     = false;
  ReferralScheme scheme      = ReferralScheme::PercentOfPrice;
  double         percent     = 0.0;
  int64_t        fixed_minor = 0;
};

/*
  Immutable view of everything a fulfillment run reads from configuration.
  Taken once per run.
*/
struct FulfillmentSettings {
  std::string identity_domain = "keyshop.local";
  uint32_t    days_per_month  = 30;
  // used when a plan names no host
  std::string default_host;

  std::vector<std::string> balance_methods{"balance"};
  ReferralSettings         referral;

  double                   franchise_percent = 0.0;
  std::vector<std::string> card_methods;

  std::chrono::milliseconds provisioning_timeout{15000};

  bool IsBalanceMethod(const std::string& method) const;
  bool IsCardMethod(const std::string& method) const;
};

FulfillmentSettings SettingsFromConfig(const keyshop::runtime::config::RuntimeConfig& config);

class SettingsProvider {
 public:
  virtual ~SettingsProvider() = default;

  virtual FulfillmentSettings Snapshot() const = 0;
};

// Holds the current settings; operators may swap them at runtime.
class StaticSettingsProvider final : public SettingsProvider {
 public:
  explicit StaticSettingsProvider(FulfillmentSettings settings);

  FulfillmentSettings Snapshot() const override;

  void Update(FulfillmentSettings settings);

 private:
  mutable std::mutex  mutex_;
  FulfillmentSettings settings_;
};

} // namespace keyshop::fulfillment
