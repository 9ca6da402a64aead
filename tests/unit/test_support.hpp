#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/retry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/fulfillment/fulfillment_guard.hpp"
#include "internal/fulfillment/orchestrator.hpp"
#include "internal/fulfillment/settings.hpp"
#include "internal/notify/notification_sink.hpp"
#include "internal/provisioning/provisioning_client.hpp"
#include "internal/util/time.hpp"
#include "keyshop/ledger/v1.hpp"

namespace keyshop::testing {

// 2026-10-18T00:00:00Z
inline constexpr int64_t kEpochMs = 1792281600000LL;
inline constexpr int64_t kDayMs   = 24LL * 3600 * 1000;

class ManualClock {
 public:
  explicit ManualClock(int64_t start_ms = kEpochMs) : now_ms_(std::make_shared<std::atomic<int64_t>>(start_ms)) {
  }

  util::NowFn Fn() const {
    auto now_ms = now_ms_;
    return [now_ms] { return util::FromUnixMillis(now_ms->load()); };
  }

  int64_t Ms() const {
    return now_ms_->load();
  }

  void Advance(std::chrono::milliseconds delta) {
    now_ms_->fetch_add(delta.count());
  }

 private:
  std::shared_ptr<std::atomic<int64_t>> now_ms_;
};

/*
  Scripted provisioning panel.

  CreateOrExtend succeeds unless a failure was queued. Exists answers from
  a per-identity script first, then from the sticky presence map
  (Present when nothing was set).
*/
class FakeProvisioningClient final : public provisioning::ProvisioningClient {
 public:
  explicit FakeProvisioningClient(util::NowFn now) : now_(std::move(now)) {
  }

  void FailNext(std::string upstream_error) {
    std::lock_guard lock(mutex_);
    failures_.push_back(std::move(upstream_error));
  }

  void SetPresence(const std::string& identity, provisioning::Presence presence) {
    std::lock_guard lock(mutex_);
    presence_[identity] = presence;
  }

  void ScriptPresence(const std::string& identity, std::vector<provisioning::Presence> answers) {
    std::lock_guard lock(mutex_);
    auto&           script = scripted_[identity];
    script.insert(script.end(), answers.begin(), answers.end());
  }

  provisioning::ProvisionResult CreateOrExtend(const provisioning::ProvisionRequest& request) override {
    std::lock_guard lock(mutex_);
    requests_.push_back(request);

    provisioning::ProvisionResult result;
    if (!failures_.empty()) {
      result.error = failures_.front();
      failures_.pop_front();
      return result;
    }

    const int64_t now_ms = util::ToUnixMillis(now_());
    const int64_t base   = std::max(now_ms, expiry_[request.identity]);

    provisioning::ProvisionedCredential credential;
    credential.remote_uuid     = "uuid-" + request.identity;
    credential.expires_at_ms   = request.absolute_expiry_ms.value_or(base + request.days_to_add * kDayMs);
    credential.connection_info = "vless://" + request.identity;
    expiry_[request.identity]  = credential.expires_at_ms;
    result.credential          = credential;
    return result;
  }

  provisioning::Presence Exists(const std::string& identity, const std::string&, const std::string&) override {
    std::lock_guard lock(mutex_);
    ++exists_calls_;
    auto scripted = scripted_.find(identity);
    if (scripted != scripted_.end() && !scripted->second.empty()) {
      auto answer = scripted->second.front();
      scripted->second.pop_front();
      return answer;
    }
    auto it = presence_.find(identity);
    return it == presence_.end() ? provisioning::Presence::Present : it->second;
  }

  bool Delete(const std::string& host, const std::string& identity) override {
    std::lock_guard lock(mutex_);
    deletions_.emplace_back(host, identity);
    return true;
  }

  std::vector<provisioning::ProvisionRequest> Requests() const {
    std::lock_guard lock(mutex_);
    return requests_;
  }

  std::vector<std::pair<std::string, std::string>> Deletions() const {
    std::lock_guard lock(mutex_);
    return deletions_;
  }

  int ExistsCalls() const {
    std::lock_guard lock(mutex_);
    return exists_calls_;
  }

 private:
  util::NowFn                                               now_;
  mutable std::mutex                                        mutex_;
  std::deque<std::string>                                   failures_;
  std::map<std::string, provisioning::Presence>             presence_;
  std::map<std::string, std::deque<provisioning::Presence>> scripted_;
  std::map<std::string, int64_t>                            expiry_;
  std::vector<provisioning::ProvisionRequest>               requests_;
  std::vector<std::pair<std::string, std::string>>          deletions_;
  int                                                       exists_calls_ = 0;
};

class RecordingNotificationSink final : public notify::NotificationSink {
 public:
  bool NotifyPayer(int64_t chat_id, const std::string& message) override {
    std::lock_guard lock(mutex_);
    payer_.emplace_back(chat_id, message);
    return deliver_;
  }

  bool NotifyOperators(const std::string& message) override {
    std::lock_guard lock(mutex_);
    operators_.push_back(message);
    return deliver_;
  }

  bool DeleteMessage(int64_t chat_id, int64_t message_id) override {
    std::lock_guard lock(mutex_);
    deleted_.emplace_back(chat_id, message_id);
    return deliver_;
  }

  void SetDeliver(bool deliver) {
    std::lock_guard lock(mutex_);
    deliver_ = deliver;
  }

  std::vector<std::pair<int64_t, std::string>> Payer() const {
    std::lock_guard lock(mutex_);
    return payer_;
  }

  std::vector<std::string> Operators() const {
    std::lock_guard lock(mutex_);
    return operators_;
  }

  std::vector<std::pair<int64_t, int64_t>> Deleted() const {
    std::lock_guard lock(mutex_);
    return deleted_;
  }

 private:
  mutable std::mutex                           mutex_;
  bool                                         deliver_ = true;
  std::vector<std::pair<int64_t, std::string>> payer_;
  std::vector<std::string>                     operators_;
  std::vector<std::pair<int64_t, int64_t>>     deleted_;
};

// Short backoff so conflict retries do not slow the suite down.
inline db::RetryPolicy FastRetry() {
  return db::RetryPolicy{.attempts = 8, .base_delay = std::chrono::milliseconds(1)};
}

inline fulfillment::FulfillmentSettings DefaultSettings() {
  fulfillment::FulfillmentSettings settings;
  settings.identity_domain = "keyshop.local";
  settings.days_per_month  = 30;
  settings.default_host    = "de-1";
  settings.balance_methods = {"balance"};
  settings.card_methods    = {"yookassa", "platega"};
  return settings;
}

inline keyshop::ledger::v1::PlanSelection MonthlyPlan(const std::string& host = {}) {
  keyshop::ledger::v1::PlanSelection plan;
  plan.set_plan_id("m1");
  plan.set_plan_name("Monthly");
  plan.set_months(1);
  plan.set_host_name(host);
  return plan;
}

inline keyshop::ledger::v1::OrderMetadata BaseOrder(const std::string& payment_id, int64_t owner_id, const std::string& amount,
                                                    const std::string& method) {
  keyshop::ledger::v1::OrderMetadata metadata;
  metadata.set_payment_id(payment_id);
  metadata.set_owner_id(owner_id);
  metadata.set_amount(amount);
  metadata.set_currency("RUB");
  metadata.set_payment_method(method);
  return metadata;
}

inline keyshop::ledger::v1::OrderMetadata NewKeyOrder(const std::string& payment_id, int64_t owner_id, const std::string& amount = "300.00",
                                                      const std::string& method = "yookassa") {
  auto metadata                               = BaseOrder(payment_id, owner_id, amount, method);
  *metadata.mutable_new_key()->mutable_plan() = MonthlyPlan();
  return metadata;
}

inline keyshop::ledger::v1::OrderMetadata TopUpOrder(const std::string& payment_id, int64_t owner_id, const std::string& amount = "500.00",
                                                     const std::string& method = "yookassa") {
  auto metadata = BaseOrder(payment_id, owner_id, amount, method);
  metadata.mutable_top_up();
  return metadata;
}

inline keyshop::ledger::v1::OrderMetadata ExtendOrder(const std::string& payment_id, int64_t owner_id, int64_t credential_id,
                                                      const std::string& target_host = {}, const std::string& method = "yookassa") {
  auto  metadata = BaseOrder(payment_id, owner_id, "300.00", method);
  auto* order    = metadata.mutable_extend_key();
  *order->mutable_plan() = MonthlyPlan();
  order->set_credential_id(credential_id);
  order->set_target_host(target_host);
  return metadata;
}

inline keyshop::ledger::v1::OrderMetadata GiftOrder(const std::string& payment_id, int64_t owner_id, const std::string& recipient_handle = {},
                                                    const std::string& method = "yookassa") {
  auto  metadata = BaseOrder(payment_id, owner_id, "300.00", method);
  auto* order    = metadata.mutable_gift_key();
  *order->mutable_plan() = MonthlyPlan();
  order->set_recipient_handle(recipient_handle);
  return metadata;
}

// Orchestrator wired to the in-memory repository and the fakes above.
struct FulfillmentHarness {
  ManualClock                                           clock;
  std::shared_ptr<db::memory::MemoryRepository>         repository;
  std::shared_ptr<FakeProvisioningClient>               provisioning;
  std::shared_ptr<RecordingNotificationSink>            notifications;
  std::shared_ptr<fulfillment::StaticSettingsProvider>  settings;
  std::shared_ptr<fulfillment::FulfillmentGuard>        guard;
  std::shared_ptr<fulfillment::FulfillmentOrchestrator> orchestrator;

  explicit FulfillmentHarness(fulfillment::FulfillmentSettings initial = DefaultSettings())
      : repository(std::make_shared<db::memory::MemoryRepository>()),
        provisioning(std::make_shared<FakeProvisioningClient>(clock.Fn())),
        notifications(std::make_shared<RecordingNotificationSink>()),
        settings(std::make_shared<fulfillment::StaticSettingsProvider>(std::move(initial))),
        guard(std::make_shared<fulfillment::FulfillmentGuard>(repository, FastRetry(), clock.Fn())),
        orchestrator(std::make_shared<fulfillment::FulfillmentOrchestrator>(repository, guard, provisioning, notifications, settings, FastRetry(),
                                                                            clock.Fn())) {
  }
};

} // namespace keyshop::testing
