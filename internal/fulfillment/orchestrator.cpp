#include "orchestrator.hpp"

#include <algorithm>
#include <cctype>

#include "internal/ledger/order_metadata.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/provisioning/error_classifier.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/money.hpp"

namespace keyshop::fulfillment {

using keyshop::ledger::v1::FulfillmentReport;
using keyshop::ledger::v1::OrderMetadata;
using keyshop::ledger::v1::PlanSelection;
using keyshop::ledger::v1::StepStatus;

namespace v1 = keyshop::ledger::v1;

namespace {

constexpr int64_t kDayMs = 24LL * 3600 * 1000;

constexpr const char* kCredentialNotFound = "credential_not_found";
constexpr const char* kStorageError       = "storage_error";

void Check(const db::Result& result, const char* what) {
  if (!result) throw db::DatabaseError(result.code, std::string(what) + ": " + result.message);
}

std::string IdSuffix(const std::string& payment_id) {
  std::string clean;
  for (unsigned char c : payment_id) {
    if (std::isalnum(c)) clean.push_back(static_cast<char>(std::tolower(c)));
  }
  if (clean.size() > 8) clean = clean.substr(clean.size() - 8);
  return clean;
}

const char* StatusName(StepStatus status) {
  switch (status) {
    case v1::STEP_STATUS_OK:
      return "ok";
    case v1::STEP_STATUS_SKIPPED:
      return "skipped";
    case v1::STEP_STATUS_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

StepStatus StatusFromName(const std::string& name) {
  if (name == "ok") return v1::STEP_STATUS_OK;
  if (name == "skipped") return v1::STEP_STATUS_SKIPPED;
  if (name == "failed") return v1::STEP_STATUS_FAILED;
  return v1::STEP_STATUS_UNSPECIFIED;
}

std::string DurationLabel(const PlanSelection& plan, int64_t days) {
  if (plan.duration_days() == 0 && plan.months() > 0) return std::to_string(plan.months()) + " mo";
  return std::to_string(days) + " d";
}

void WritePaymentLog(db::Repository& repository, db::Transaction& tx, const OrderMetadata& metadata, int64_t amount_minor, const std::string& action,
                     const std::string& status, int64_t now_ms) {
  db::model::PaymentLogRecord entry;
  entry.owner_id       = metadata.owner_id();
  entry.payment_id     = metadata.payment_id();
  entry.payment_method = metadata.payment_method();
  entry.amount_minor   = amount_minor;
  entry.currency       = metadata.currency();
  entry.action         = action;
  entry.status         = status;
  entry.metadata_json  = ledger::EncodeMetadata(metadata);
  entry.created_at_ms  = now_ms;
  Check(repository.InsertPaymentLog(tx, entry), "payment log");
}

} // namespace

int64_t ResolveDays(const PlanSelection& plan, uint32_t days_per_month) {
  if (plan.duration_days() > 0) return plan.duration_days();
  return static_cast<int64_t>(plan.months()) * days_per_month;
}

std::string DeriveIdentity(int64_t owner_id, const std::string& payment_id, const std::string& domain) {
  return "u" + std::to_string(owner_id) + "-" + IdSuffix(payment_id) + "@" + domain;
}

std::string DeriveGiftIdentity(const std::string& recipient_handle, const std::string& payment_id, const std::string& domain) {
  std::string handle;
  for (unsigned char c : recipient_handle) {
    if (std::isalnum(c) || c == '_') handle.push_back(static_cast<char>(std::tolower(c)));
  }
  if (handle.empty()) handle = "gift";
  return handle + "-gift-" + IdSuffix(payment_id) + "@" + domain;
}

// ------------------------------------------------------------------
// Per-run state
// ------------------------------------------------------------------

struct FulfillmentOrchestrator::Execution {
  OrderMetadata       metadata;
  FulfillmentSettings settings;
  int64_t             amount_minor = 0;
  int64_t             now_ms       = 0;
  FulfillmentReport   report;

  // false while completing a gift: a failed completion keeps the gift
  bool refund_on_failure = true;

  std::string identity;
  int64_t     expires_at_ms = 0;
  std::string connection_info;
  std::string promo_outcome;

  void Step(const std::string& name, StepStatus status, const std::string& detail = {}) {
    auto* step = report.add_steps();
    step->set_step(name);
    step->set_status(status);
    step->set_detail(detail);
  }

  bool PaidFromBalance() const {
    return settings.IsBalanceMethod(metadata.payment_method());
  }

  int64_t PayerChat() const {
    return metadata.notify().chat_id() != 0 ? metadata.notify().chat_id() : metadata.owner_id();
  }
};

namespace {

provisioning::ProvisionRequest RequestFor(const PlanSelection& plan, const std::string& host, const std::string& identity,
                                          const FulfillmentSettings& settings) {
  provisioning::ProvisionRequest request;
  request.host        = host;
  request.identity    = identity;
  request.days_to_add = ResolveDays(plan, settings.days_per_month);
  if (plan.traffic_limit_bytes() > 0) request.traffic_limit_bytes = plan.traffic_limit_bytes();
  if (plan.device_limit() > 0) request.device_limit = plan.device_limit();
  request.timeout = settings.provisioning_timeout;
  return request;
}

} // namespace

FulfillmentOrchestrator::FulfillmentOrchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<FulfillmentGuard> guard,
                                                 std::shared_ptr<provisioning::ProvisioningClient> provisioning,
                                                 std::shared_ptr<notify::NotificationSink> notifications, std::shared_ptr<SettingsProvider> settings,
                                                 db::RetryPolicy retry, util::NowFn now)
    : repository_(std::move(repository)),
      guard_(std::move(guard)),
      provisioning_(std::move(provisioning)),
      notifications_(std::move(notifications)),
      settings_(std::move(settings)),
      retry_(retry),
      now_(std::move(now)) {
}

// ------------------------------------------------------------------
// Entry points
// ------------------------------------------------------------------

FulfillmentReport FulfillmentOrchestrator::Run(const OrderMetadata& metadata) {
  ledger::ValidateMetadata(metadata);

  if (!guard_->Claim(metadata.payment_id())) {
    FulfillmentReport report;
    report.set_payment_id(metadata.payment_id());
    report.set_result(v1::FULFILLMENT_RESULT_DUPLICATE);
    return report;
  }
  return ExecuteClaimed(metadata);
}

FulfillmentReport FulfillmentOrchestrator::ExecuteClaimed(const OrderMetadata& metadata) {
  observability::SpanScope span("fulfillment.execute");
  span.SetAttribute("payment.id", metadata.payment_id());
  span.SetAttribute("order.action", ledger::ActionName(metadata));

  Execution run;
  run.metadata     = metadata;
  run.settings     = settings_->Snapshot();
  run.amount_minor = ledger::AmountMinor(metadata);
  run.now_ms       = util::ToUnixMillis(now_());
  run.report.set_payment_id(metadata.payment_id());
  run.Step("claim", v1::STEP_STATUS_OK);

  try {
    switch (metadata.order_case()) {
      case OrderMetadata::kTopUp:
        TopUp(run);
        break;
      case OrderMetadata::kNewKey:
        ProvisionNew(run);
        break;
      case OrderMetadata::kExtendKey:
        Extend(run);
        break;
      case OrderMetadata::kGiftKey:
        Gift(run);
        break;
      case OrderMetadata::ORDER_NOT_SET:
        run.Step("validate", v1::STEP_STATUS_FAILED, "order kind missing");
        run.report.set_result(v1::FULFILLMENT_RESULT_REJECTED);
        run.report.set_error_code("order_not_set");
        break;
    }
  } catch (const db::DatabaseError& e) {
    // the claim is spent; the missing result row makes the stalled-claim audit report it
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordFulfillment(ledger::ActionName(metadata), "interrupted");
    KEYSHOP_LOG_ERROR("fulfillment interrupted",
                      {observability::StringField("payment_id", metadata.payment_id()), observability::StringField("error", e.what())});
    notifications_->NotifyOperators("Fulfillment interrupted by a storage error: payment=" + metadata.payment_id() + " detail=" + e.what());
    throw;
  }

  const auto result = run.report.result();
  if (result == v1::FULFILLMENT_RESULT_FULFILLED || result == v1::FULFILLMENT_RESULT_AWAITING_RECIPIENT) {
    PayReferral(run);
    RedeemPromo(run);
    Commission(run);
  }
  if (result == v1::FULFILLMENT_RESULT_FULFILLED) NotifySuccess(run);

  Persist(run);

  span.SetAttribute("fulfillment.result", v1::FulfillmentResult_Name(result));
  observability::Metrics::Instance().RecordFulfillment(ledger::ActionName(metadata), v1::FulfillmentResult_Name(result));
  KEYSHOP_LOG_INFO("fulfillment finished", {observability::StringField("payment_id", metadata.payment_id()),
                                            observability::StringField("action", ledger::ActionName(metadata)),
                                            observability::StringField("result", v1::FulfillmentResult_Name(result)),
                                            observability::StringField("error_code", run.report.error_code())});
  return run.report;
}

FulfillmentReport FulfillmentOrchestrator::CompleteGift(const std::string& payment_id, const std::string& recipient_handle, int64_t recipient_owner_id) {
  if (recipient_handle.empty() && recipient_owner_id <= 0) throw util::InvalidArgument("a recipient handle or owner id is required");

  // taking the record first keeps concurrent completions from both provisioning
  auto gift = db::RunWithRetry(retry_, "TakePendingGift", [&]() -> std::optional<db::model::PendingGiftRecord> {
    auto tx      = repository_->Begin();
    auto pending = repository_->GetPendingGift(*tx, payment_id);
    if (!pending || !repository_->DeletePendingGift(*tx, payment_id)) {
      tx->Rollback();
      return std::nullopt;
    }
    tx->Commit();
    return pending;
  });
  if (!gift) throw util::NotFound("no gift awaiting a recipient for payment " + payment_id);

  Execution run;
  run.metadata = ledger::DecodeMetadata(gift->metadata_json);
  run.metadata.set_payment_id(payment_id);
  run.metadata.mutable_gift_key()->set_recipient_handle(recipient_handle);
  run.metadata.mutable_gift_key()->set_recipient_owner_id(recipient_owner_id);
  run.settings          = settings_->Snapshot();
  run.amount_minor      = ledger::AmountMinor(run.metadata);
  run.now_ms            = util::ToUnixMillis(now_());
  run.refund_on_failure = false;
  run.report.set_payment_id(payment_id);

  ProvisionGift(run, recipient_handle, recipient_owner_id);

  if (run.report.result() == v1::FULFILLMENT_RESULT_FULFILLED) {
    NotifySuccess(run);
  } else {
    db::RunWithRetry(retry_, "RestorePendingGift", [&] {
      auto tx       = repository_->Begin();
      auto restored = repository_->InsertPendingGift(*tx, *gift);
      if (!restored && restored.code != db::ErrorCode::AlreadyExists) Check(restored, "restore pending gift");
      tx->Commit();
    });
    run.Step("pending_gift", v1::STEP_STATUS_OK, "restored for retry");
  }

  Persist(run);
  return run.report;
}

FulfillmentReport FulfillmentOrchestrator::GetReport(const std::string& payment_id) {
  auto rows = db::RunWithRetry(retry_, "GetReport", [&] {
    auto tx      = repository_->Begin();
    auto records = repository_->ListFulfillmentOutcomes(*tx, payment_id);
    tx->Commit();
    return records;
  });
  if (rows.empty()) throw util::NotFound("no fulfillment recorded for payment " + payment_id);

  FulfillmentReport report;
  for (const auto& row : rows) {
    if (row.step == "result") {
      FulfillmentReport summary;
      if (!ledger::FromJson(row.detail, &summary)) throw util::InvalidState("fulfillment summary is unreadable for payment " + payment_id);
      report.set_result(summary.result());
      report.set_error_code(summary.error_code());
      report.set_credential_id(summary.credential_id());
      continue;
    }
    auto* step = report.add_steps();
    step->set_step(row.step);
    step->set_status(StatusFromName(row.status));
    step->set_detail(row.detail);
  }
  report.set_payment_id(payment_id);
  return report;
}

bool FulfillmentOrchestrator::AccrueCommission(const std::string& instance_id, const std::string& payment_id, int64_t owner_id, int64_t amount_minor,
                                               double percent, const std::string& payment_method) {
  db::model::CommissionRecord record;
  record.instance_id      = instance_id;
  record.payment_id       = payment_id;
  record.owner_id         = owner_id;
  record.amount_minor     = amount_minor;
  record.percent          = percent;
  record.commission_minor = util::PercentOf(amount_minor, percent);
  record.payment_method   = payment_method;
  record.created_at_ms    = util::ToUnixMillis(now_());

  return db::RunWithRetry(retry_, "AccrueCommission", [&] {
    auto tx       = repository_->Begin();
    auto inserted = repository_->InsertCommission(*tx, record);
    if (!inserted) {
      tx->Rollback();
      if (inserted.code == db::ErrorCode::AlreadyExists) return false;
      Check(inserted, "commission");
    }
    tx->Commit();
    return true;
  });
}

// ------------------------------------------------------------------
// Primary actions
// ------------------------------------------------------------------

void FulfillmentOrchestrator::TopUp(Execution& run) {
  db::RunWithRetry(retry_, "TopUp", [&] {
    auto tx = repository_->Begin();
    Check(repository_->AdjustBalance(*tx, run.metadata.owner_id(), run.amount_minor), "balance credit");
    WritePaymentLog(*repository_, *tx, run.metadata, run.amount_minor, "top_up", "paid", run.now_ms);
    tx->Commit();
  });

  run.Step("balance_credit", v1::STEP_STATUS_OK, util::FormatMinorUnits(run.amount_minor));
  run.report.set_result(v1::FULFILLMENT_RESULT_FULFILLED);
}

void FulfillmentOrchestrator::ProvisionNew(Execution& run) {
  const auto&       order    = run.metadata.new_key();
  const std::string host     = order.plan().host_name().empty() ? run.settings.default_host : order.plan().host_name();
  const std::string identity = order.identity().empty() ? DeriveIdentity(run.metadata.owner_id(), run.metadata.payment_id(), run.settings.identity_domain)
                                                        : order.identity();
  if (host.empty()) {
    FailProvisioning(run, provisioning::kHostNotFound, "no provisioning host configured");
    return;
  }

  auto result = provisioning_->CreateOrExtend(RequestFor(order.plan(), host, identity, run.settings));
  if (!result.ok()) {
    FailProvisioning(run, provisioning::ClassifyError(result.error), result.error);
    return;
  }
  run.Step("provision", v1::STEP_STATUS_OK, host + "/" + identity);

  StoreCredential(run, *result.credential, host, identity, run.metadata.owner_id(), "purchase", 0);
}

void FulfillmentOrchestrator::Extend(Execution& run) {
  const auto& order   = run.metadata.extend_key();
  auto        current = db::RunWithRetry(retry_, "GetCredential", [&] {
    auto tx         = repository_->Begin();
    auto credential = repository_->GetCredential(*tx, order.credential_id());
    tx->Commit();
    return credential;
  });
  if (!current || current->owner_id != run.metadata.owner_id()) {
    FailProvisioning(run, kCredentialNotFound, "credential " + std::to_string(order.credential_id()) + " not found for owner");
    return;
  }

  const std::string target  = order.target_host().empty() ? current->provider_host : order.target_host();
  const bool        switching = target != current->provider_host;

  auto request = RequestFor(order.plan(), target, current->unique_identity, run.settings);
  if (switching) {
    // the new host has no record of the old expiry
    request.absolute_expiry_ms = std::max(current->expires_at_ms, run.now_ms) + request.days_to_add * kDayMs;
  }

  auto result = provisioning_->CreateOrExtend(request);
  if (!result.ok()) {
    FailProvisioning(run, provisioning::ClassifyError(result.error), result.error);
    return;
  }
  run.Step("provision", v1::STEP_STATUS_OK, target + "/" + current->unique_identity);

  StoreCredential(run, *result.credential, target, current->unique_identity, current->owner_id, "extend", current->credential_id);

  if (switching && run.report.result() == v1::FULFILLMENT_RESULT_FULFILLED) {
    const bool removed = provisioning_->Delete(current->provider_host, current->unique_identity);
    run.Step("previous_host_cleanup", removed ? v1::STEP_STATUS_OK : v1::STEP_STATUS_FAILED, current->provider_host);
  }
}

void FulfillmentOrchestrator::Gift(Execution& run) {
  const auto& order = run.metadata.gift_key();
  if (!order.recipient_handle().empty() || order.recipient_owner_id() > 0) {
    ProvisionGift(run, order.recipient_handle(), order.recipient_owner_id());
    return;
  }

  db::model::PendingGiftRecord gift;
  gift.payment_id    = run.metadata.payment_id();
  gift.payer_id      = run.metadata.owner_id();
  gift.metadata_json = ledger::EncodeMetadata(run.metadata);
  gift.created_at_ms = run.now_ms;

  db::RunWithRetry(retry_, "StorePendingGift", [&] {
    auto tx       = repository_->Begin();
    auto inserted = repository_->InsertPendingGift(*tx, gift);
    if (!inserted) {
      tx->Rollback();
      if (inserted.code == db::ErrorCode::AlreadyExists) return;
      Check(inserted, "pending gift");
    }
    WritePaymentLog(*repository_, *tx, run.metadata, run.amount_minor, "gift", "awaiting_recipient", run.now_ms);
    tx->Commit();
  });

  run.Step("pending_gift", v1::STEP_STATUS_OK, "awaiting recipient");
  run.report.set_result(v1::FULFILLMENT_RESULT_AWAITING_RECIPIENT);

  const bool asked = notifications_->NotifyPayer(run.PayerChat(), "Payment received. Send the recipient's handle to finish the gift.");
  run.Step("notify_payer", asked ? v1::STEP_STATUS_OK : v1::STEP_STATUS_FAILED);
  DeletePendingMessage(run);
}

void FulfillmentOrchestrator::ProvisionGift(Execution& run, const std::string& recipient_handle, int64_t recipient_owner_id) {
  const auto&       plan     = run.metadata.gift_key().plan();
  const std::string host     = plan.host_name().empty() ? run.settings.default_host : plan.host_name();
  const std::string handle   = recipient_handle.empty() ? "u" + std::to_string(recipient_owner_id) : recipient_handle;
  const std::string identity = DeriveGiftIdentity(handle, run.metadata.payment_id(), run.settings.identity_domain);
  const int64_t     owner_id = recipient_owner_id > 0 ? recipient_owner_id : run.metadata.owner_id();

  if (host.empty()) {
    FailProvisioning(run, provisioning::kHostNotFound, "no provisioning host configured");
    return;
  }

  auto result = provisioning_->CreateOrExtend(RequestFor(plan, host, identity, run.settings));
  if (!result.ok()) {
    FailProvisioning(run, provisioning::ClassifyError(result.error), result.error);
    return;
  }
  run.Step("provision", v1::STEP_STATUS_OK, host + "/" + identity);

  StoreCredential(run, *result.credential, host, identity, owner_id, "gift", 0);

  if (run.report.result() == v1::FULFILLMENT_RESULT_FULFILLED && recipient_owner_id > 0) {
    const bool told = notifications_->NotifyPayer(recipient_owner_id, "You received a gift key " + identity + ".\n" + run.connection_info);
    run.Step("notify_recipient", told ? v1::STEP_STATUS_OK : v1::STEP_STATUS_FAILED);
  }
}

void FulfillmentOrchestrator::StoreCredential(Execution& run, const provisioning::ProvisionedCredential& credential, const std::string& host,
                                              const std::string& identity, int64_t owner_id, const std::string& kind, int64_t existing_id) {
  const PlanSelection* plan = ledger::PlanOf(run.metadata);
  const int64_t        days = plan ? ResolveDays(*plan, run.settings.days_per_month) : 0;

  v1::CredentialOrigin origin;
  origin.set_kind(kind);
  origin.set_payment_id(run.metadata.payment_id());
  if (plan) {
    origin.set_plan_id(plan->plan_id());
    origin.set_plan_name(plan->plan_name());
    origin.set_days(static_cast<uint32_t>(days));
    origin.set_label(DurationLabel(*plan, days));
  }

  db::model::CredentialRecord record;
  record.owner_id        = owner_id;
  record.provider_host   = host;
  record.remote_uuid     = credential.remote_uuid;
  record.unique_identity = identity;
  record.expires_at_ms   = credential.expires_at_ms;
  record.origin_json     = ledger::ToJson(origin);
  record.created_at_ms   = run.now_ms;
  record.updated_at_ms   = run.now_ms;

  db::Result stored;
  try {
    stored = db::RunWithRetry(retry_, "StoreCredential", [&]() -> db::Result {
      auto tx  = repository_->Begin();
      auto row = record;

      // extensions re-read by primary key; a row deleted meanwhile is recreated
      auto current = existing_id > 0 ? repository_->GetCredential(*tx, existing_id) : repository_->GetCredentialByIdentity(*tx, identity);

      db::Result result;
      if (current && existing_id == 0 && current->owner_id != owner_id) {
        result = db::Result::Err(db::ErrorCode::ConstraintViolation, "identity belongs to another owner: " + identity);
      } else if (current) {
        row.credential_id = current->credential_id;
        row.created_at_ms = current->created_at_ms;
        result            = repository_->UpdateCredential(*tx, row);
        if (result) result = repository_->SetCredentialMissingSince(*tx, row.credential_id, std::nullopt);
      } else {
        result = repository_->InsertCredential(*tx, row);
      }

      if (!result) {
        tx->Rollback();
        return result;
      }
      WritePaymentLog(*repository_, *tx, run.metadata, run.amount_minor, ledger::ActionName(run.metadata), "paid", run.now_ms);
      tx->Commit();
      record.credential_id = row.credential_id;
      return result;
    });
  } catch (const db::DatabaseError& e) {
    stored = db::Result::Err(e.code(), e.what());
  }

  if (!stored) {
    run.Step("credential", v1::STEP_STATUS_FAILED, stored.message);
    const char* code = stored.code == db::ErrorCode::ConstraintViolation ? provisioning::kIdentityTaken : kStorageError;
    FailProvisioning(run, code, "provisioned on " + host + " but not stored locally: " + stored.message);
    return;
  }

  run.Step("credential", v1::STEP_STATUS_OK, "credential_id=" + std::to_string(record.credential_id));
  run.report.set_credential_id(record.credential_id);
  run.report.set_result(v1::FULFILLMENT_RESULT_FULFILLED);
  run.identity        = identity;
  run.expires_at_ms   = credential.expires_at_ms;
  run.connection_info = credential.connection_info;
}

void FulfillmentOrchestrator::FailProvisioning(Execution& run, const std::string& code, const std::string& detail) {
  run.Step("provision", v1::STEP_STATUS_FAILED, code);
  run.report.set_result(v1::FULFILLMENT_RESULT_PROVISIONING_FAILED);
  run.report.set_error_code(code);

  std::string payer_message = "We could not issue your key (" + code + "). ";
  if (!run.refund_on_failure) {
    run.Step("refund", v1::STEP_STATUS_SKIPPED, "gift kept for retry");
    payer_message = "We could not issue the gift (" + code + "). Please try again later.";
  } else if (run.PaidFromBalance()) {
    try {
      db::RunWithRetry(retry_, "Refund", [&] {
        auto tx = repository_->Begin();
        Check(repository_->AdjustBalance(*tx, run.metadata.owner_id(), run.amount_minor), "refund");
        WritePaymentLog(*repository_, *tx, run.metadata, run.amount_minor, "refund", "refunded", run.now_ms);
        tx->Commit();
      });
      run.Step("refund", v1::STEP_STATUS_OK, "credited " + util::FormatMinorUnits(run.amount_minor) + " to balance");
      payer_message += "The amount was returned to your balance.";
    } catch (const db::DatabaseError& e) {
      run.Step("refund", v1::STEP_STATUS_FAILED, e.what());
      payer_message += "Support will refund the payment.";
    }
  } else {
    run.Step("refund", v1::STEP_STATUS_SKIPPED, "manual refund required");
    payer_message += "Support will refund the payment.";
  }

  const bool payer_told = notifications_->NotifyPayer(run.PayerChat(), payer_message);
  run.Step("notify_payer", payer_told ? v1::STEP_STATUS_OK : v1::STEP_STATUS_FAILED);

  const bool operators_told = notifications_->NotifyOperators("Fulfillment failed: payment=" + run.metadata.payment_id() +
                                                              " owner=" + std::to_string(run.metadata.owner_id()) + " action=" +
                                                              ledger::ActionName(run.metadata) + " code=" + code + " detail=" + detail);
  run.Step("notify_operators", operators_told ? v1::STEP_STATUS_OK : v1::STEP_STATUS_FAILED);

  KEYSHOP_LOG_WARN("provisioning failed", {observability::StringField("payment_id", run.metadata.payment_id()),
                                           observability::StringField("code", code), observability::StringField("detail", detail)});
}

// ------------------------------------------------------------------
// Side effects
// ------------------------------------------------------------------

void FulfillmentOrchestrator::PayReferral(Execution& run) {
  const auto& referral = run.settings.referral;
  if (run.PaidFromBalance()) {
    run.Step("referral", v1::STEP_STATUS_SKIPPED, "paid from balance");
    return;
  }
  if (!referral.enabled) {
    run.Step("referral", v1::STEP_STATUS_SKIPPED, "disabled");
    return;
  }
  if (referral.scheme == ReferralScheme::FixedAtStart) {
    run.Step("referral", v1::STEP_STATUS_SKIPPED, "paid at referral start");
    return;
  }

  const int64_t reward =
      referral.scheme == ReferralScheme::PercentOfPrice ? util::PercentOf(run.amount_minor, referral.percent) : referral.fixed_minor;
  if (reward <= 0) {
    run.Step("referral", v1::STEP_STATUS_SKIPPED, "zero reward");
    return;
  }

  try {
    std::optional<int64_t> referrer;
    auto                   credited = db::RunWithRetry(retry_, "PayReferral", [&]() -> db::Result {
      referrer.reset();
      auto tx      = repository_->Begin();
      auto account = repository_->GetAccount(*tx, run.metadata.owner_id());
      if (!account || !account->referrer_id) {
        tx->Rollback();
        return db::Result::Ok();
      }
      referrer    = account->referrer_id;
      auto result = repository_->AdjustReferralBalance(*tx, *referrer, reward);
      if (!result) {
        tx->Rollback();
        return result;
      }
      tx->Commit();
      return result;
    });

    if (!referrer) {
      run.Step("referral", v1::STEP_STATUS_SKIPPED, "no referrer");
    } else if (!credited) {
      run.Step("referral", v1::STEP_STATUS_FAILED, credited.message);
    } else {
      run.Step("referral", v1::STEP_STATUS_OK, "referrer=" + std::to_string(*referrer) + " reward=" + util::FormatMinorUnits(reward));
    }
  } catch (const db::DatabaseError& e) {
    run.Step("referral", v1::STEP_STATUS_FAILED, e.what());
    KEYSHOP_LOG_ERROR("referral payout failed",
                      {observability::StringField("payment_id", run.metadata.payment_id()), observability::StringField("error", e.what())});
  }
}

void FulfillmentOrchestrator::RedeemPromo(Execution& run) {
  const std::string& code = run.metadata.promo_code();
  if (code.empty()) {
    run.Step("promo", v1::STEP_STATUS_SKIPPED, "no promo code");
    return;
  }
  const int64_t applied = util::ParseMinorUnits(run.metadata.promo_discount()).value_or(0);

  try {
    run.promo_outcome = db::RunWithRetry(retry_, "RedeemPromo", [&]() -> std::string {
      auto tx    = repository_->Begin();
      auto promo = repository_->GetPromoCode(*tx, code);
      if (!promo) {
        tx->Rollback();
        return "unknown_code";
      }

      const bool expired = promo->valid_until_ms && run.now_ms > *promo->valid_until_ms;
      const bool used_up = promo->usage_limit_total > 0 && promo->used_total >= promo->usage_limit_total;
      if (expired || used_up || !promo->is_active) {
        if (promo->is_active) {
          Check(repository_->SetPromoActive(*tx, code, false), "promo deactivate");
          tx->Commit();
        } else {
          tx->Rollback();
        }
        return expired ? "expired" : "exhausted";
      }

      if (promo->usage_limit_per_owner > 0 && repository_->CountPromoUsagesByOwner(*tx, code, run.metadata.owner_id()) >= promo->usage_limit_per_owner) {
        tx->Rollback();
        return "exhausted";
      }

      db::model::PromoUsageRecord usage;
      usage.code          = code;
      usage.owner_id      = run.metadata.owner_id();
      usage.applied_minor = applied;
      usage.order_id      = run.metadata.payment_id();
      usage.used_at_ms    = run.now_ms;

      auto inserted = repository_->InsertPromoUsage(*tx, usage);
      if (inserted.code == db::ErrorCode::AlreadyExists) {
        tx->Rollback();
        return "already_redeemed";
      }
      Check(inserted, "promo usage");
      Check(repository_->IncrementPromoUsage(*tx, code), "promo counter");

      const bool limit_reached = promo->usage_limit_total > 0 && promo->used_total + 1 >= promo->usage_limit_total;
      if (limit_reached) Check(repository_->SetPromoActive(*tx, code, false), "promo deactivate");
      tx->Commit();
      return limit_reached ? "redeemed_and_deactivated" : "redeemed";
    });

    const bool redeemed = run.promo_outcome.rfind("redeemed", 0) == 0;
    run.Step("promo", redeemed ? v1::STEP_STATUS_OK : v1::STEP_STATUS_SKIPPED, code + ": " + run.promo_outcome);
  } catch (const db::DatabaseError& e) {
    run.promo_outcome = "error";
    run.Step("promo", v1::STEP_STATUS_FAILED, code + ": " + e.what());
    KEYSHOP_LOG_ERROR("promo redemption failed",
                      {observability::StringField("payment_id", run.metadata.payment_id()), observability::StringField("error", e.what())});
  }
}

void FulfillmentOrchestrator::Commission(Execution& run) {
  const std::string& instance = run.metadata.franchise_instance_id();
  if (instance.empty()) {
    run.Step("commission", v1::STEP_STATUS_SKIPPED, "direct sale");
    return;
  }
  if (!run.settings.IsCardMethod(run.metadata.payment_method())) {
    run.Step("commission", v1::STEP_STATUS_SKIPPED, "not a card payment");
    return;
  }
  if (run.settings.franchise_percent <= 0) {
    run.Step("commission", v1::STEP_STATUS_SKIPPED, "commission disabled");
    return;
  }

  try {
    const bool accrued = AccrueCommission(instance, run.metadata.payment_id(), run.metadata.owner_id(), run.amount_minor, run.settings.franchise_percent,
                                          run.metadata.payment_method());
    run.Step("commission", v1::STEP_STATUS_OK,
             accrued ? instance + ": " + util::FormatMinorUnits(util::PercentOf(run.amount_minor, run.settings.franchise_percent)) : instance + ": already accrued");
  } catch (const db::DatabaseError& e) {
    run.Step("commission", v1::STEP_STATUS_FAILED, e.what());
    KEYSHOP_LOG_ERROR("commission accrual failed",
                      {observability::StringField("payment_id", run.metadata.payment_id()), observability::StringField("error", e.what())});
  }
}

void FulfillmentOrchestrator::NotifySuccess(Execution& run) {
  std::string payer_message;
  if (run.metadata.has_top_up()) {
    payer_message = "Your balance was topped up by " + util::FormatMinorUnits(run.amount_minor) + " " + run.metadata.currency() + ".";
  } else {
    payer_message = "Your key " + run.identity + " is active until " + util::FormatIso8601(run.expires_at_ms).substr(0, 10) + ".";
    if (!run.connection_info.empty()) payer_message += "\n" + run.connection_info;
  }
  const bool payer_told = notifications_->NotifyPayer(run.PayerChat(), payer_message);
  run.Step("notify_payer", payer_told ? v1::STEP_STATUS_OK : v1::STEP_STATUS_FAILED);

  std::string operator_message = "Order fulfilled: payment=" + run.metadata.payment_id() + " owner=" + std::to_string(run.metadata.owner_id()) +
                                 " action=" + ledger::ActionName(run.metadata) + " amount=" + util::FormatMinorUnits(run.amount_minor) + " " +
                                 run.metadata.currency() + " method=" + run.metadata.payment_method();
  if (!run.promo_outcome.empty()) operator_message += " promo=" + run.metadata.promo_code() + ":" + run.promo_outcome;
  const bool operators_told = notifications_->NotifyOperators(operator_message);
  run.Step("notify_operators", operators_told ? v1::STEP_STATUS_OK : v1::STEP_STATUS_FAILED);

  DeletePendingMessage(run);
}

void FulfillmentOrchestrator::DeletePendingMessage(Execution& run) {
  const int64_t message_id = run.metadata.notify().pending_message_id();
  if (message_id <= 0) return;
  const bool deleted = notifications_->DeleteMessage(run.PayerChat(), message_id);
  run.Step("delete_pending_message", deleted ? v1::STEP_STATUS_OK : v1::STEP_STATUS_FAILED);
}

// ------------------------------------------------------------------
// Report persistence
// ------------------------------------------------------------------

void FulfillmentOrchestrator::Persist(Execution& run) {
  FulfillmentReport summary = run.report;
  summary.clear_steps();
  const std::string summary_json = ledger::ToJson(summary);

  try {
    db::RunWithRetry(retry_, "PersistOutcomes", [&] {
      auto tx       = repository_->Begin();
      auto existing = repository_->ListFulfillmentOutcomes(*tx, run.metadata.payment_id());
      int32_t seq   = existing.empty() ? 0 : existing.back().sequence + 1;

      db::model::FulfillmentOutcomeRecord record;
      record.payment_id     = run.metadata.payment_id();
      record.recorded_at_ms = run.now_ms;
      for (const auto& step : run.report.steps()) {
        record.step     = step.step();
        record.sequence = seq++;
        record.status   = StatusName(step.status());
        record.detail   = step.detail();
        Check(repository_->UpsertFulfillmentOutcome(*tx, record), "fulfillment outcome");
      }

      record.step     = "result";
      record.sequence = seq++;
      record.status   = "ok";
      record.detail   = summary_json;
      Check(repository_->UpsertFulfillmentOutcome(*tx, record), "fulfillment result");
      tx->Commit();
    });
  } catch (const db::DatabaseError& e) {
    // no result row: the stalled-claim audit picks this payment up
    KEYSHOP_LOG_ERROR("fulfillment report not persisted",
                      {observability::StringField("payment_id", run.metadata.payment_id()), observability::StringField("error", e.what())});
  }
}

} // namespace keyshop::fulfillment
