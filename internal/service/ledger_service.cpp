#include "ledger_service.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <string_view>

#include "internal/fulfillment/balance_payments.hpp"
#include "internal/fulfillment/fulfillment_guard.hpp"
#include "internal/fulfillment/orchestrator.hpp"
#include "internal/ledger/completion_coordinator.hpp"
#include "internal/ledger/pending_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/payments/payment_intake.hpp"
#include "internal/util/errors.hpp"

namespace keyshop::service {

using namespace keyshop::ledger::v1;

namespace {

void RequirePaymentId(const std::string& payment_id) {
  if (payment_id.empty()) throw util::InvalidArgument("payment_id is required");
}

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view payment_id, Fn&& fn) {
  observability::SpanScope span(route);
  if (!payment_id.empty()) {
    span.SetAttribute("payment.id", payment_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    observability::Metrics::Instance().RecordRequest(route, true);
    observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    KEYSHOP_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("payment_id", payment_id),
                                     observability::StringField("error", ex.what())});
    observability::Metrics::Instance().RecordRequest(route, false);
    observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

} // namespace

LedgerService::LedgerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateOrRefreshIntentResponse LedgerService::CreateOrRefreshIntent(const CreateOrRefreshIntentRequest& req) {
  return ObserveRpc("LedgerService.CreateOrRefreshIntent", req.metadata().payment_id(), [&] {
    CreateOrRefreshIntentResponse resp;
    resp.set_accepted(ctx_.ledger->CreateOrRefreshIntent(req.metadata()));
    return resp;
  });
}

GetStatusResponse LedgerService::GetStatus(const GetStatusRequest& req) {
  return ObserveRpc("LedgerService.GetStatus", req.payment_id(), [&] {
    RequirePaymentId(req.payment_id());
    GetStatusResponse resp;
    resp.set_status(ctx_.ledger->GetStatus(req.payment_id()));
    return resp;
  });
}

PeekMetadataResponse LedgerService::PeekMetadata(const PeekMetadataRequest& req) {
  return ObserveRpc("LedgerService.PeekMetadata", req.payment_id(), [&] {
    RequirePaymentId(req.payment_id());
    PeekMetadataResponse resp;
    if (auto metadata = ctx_.ledger->PeekMetadata(req.payment_id())) {
      resp.set_found(true);
      *resp.mutable_metadata() = std::move(*metadata);
    }
    return resp;
  });
}

MostRecentPendingResponse LedgerService::MostRecentPending(const MostRecentPendingRequest& req) {
  return ObserveRpc("LedgerService.MostRecentPending", "", [&] {
    if (req.owner_id() <= 0) throw util::InvalidArgument("owner_id must be positive");
    MostRecentPendingResponse resp;
    if (auto metadata = ctx_.ledger->MostRecentPendingFor(req.owner_id())) {
      resp.set_found(true);
      *resp.mutable_metadata() = std::move(*metadata);
    }
    return resp;
  });
}

CompleteIfPendingResponse LedgerService::CompleteIfPending(const CompleteIfPendingRequest& req) {
  return ObserveRpc("LedgerService.CompleteIfPending", req.payment_id(), [&] {
    RequirePaymentId(req.payment_id());
    CompleteIfPendingResponse resp;
    if (auto metadata = ctx_.coordinator->CompleteIfPending(req.payment_id())) {
      resp.set_completed(true);
      *resp.mutable_metadata() = std::move(*metadata);
    }
    return resp;
  });
}

ClaimResponse LedgerService::Claim(const ClaimRequest& req) {
  return ObserveRpc("LedgerService.Claim", req.payment_id(), [&] {
    ClaimResponse resp;
    resp.set_claimed(ctx_.guard->Claim(req.payment_id()));
    return resp;
  });
}

RunFulfillmentResponse LedgerService::RunFulfillment(const RunFulfillmentRequest& req) {
  return ObserveRpc("LedgerService.RunFulfillment", req.metadata().payment_id(), [&] {
    RunFulfillmentResponse resp;
    *resp.mutable_report() = ctx_.orchestrator->Run(req.metadata());
    return resp;
  });
}

SubmitProviderNotificationResponse LedgerService::SubmitProviderNotification(const SubmitProviderNotificationRequest& req) {
  return ObserveRpc("LedgerService.SubmitProviderNotification", "", [&] {
    if (req.provider().empty()) throw util::InvalidArgument("provider is required");

    payments::RawNotification notification;
    notification.provider = req.provider();
    notification.body     = req.body();
    for (const auto& [name, value] : req.headers()) {
      std::string key = name;
      std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      notification.headers[key] = value;
    }

    auto result = ctx_.intake->Submit(notification);

    SubmitProviderNotificationResponse resp;
    resp.set_outcome(result.outcome);
    resp.set_payment_id(result.payment_id);
    return resp;
  });
}

PayFromBalanceResponse LedgerService::PayFromBalance(const PayFromBalanceRequest& req) {
  return ObserveRpc("LedgerService.PayFromBalance", req.metadata().payment_id(), [&] {
    PayFromBalanceResponse resp;
    *resp.mutable_report() = ctx_.balance_payments->Pay(req.metadata());
    return resp;
  });
}

CompleteGiftResponse LedgerService::CompleteGift(const CompleteGiftRequest& req) {
  return ObserveRpc("LedgerService.CompleteGift", req.payment_id(), [&] {
    RequirePaymentId(req.payment_id());
    CompleteGiftResponse resp;
    *resp.mutable_report() = ctx_.orchestrator->CompleteGift(req.payment_id(), req.recipient_handle(), req.recipient_owner_id());
    return resp;
  });
}

GetFulfillmentReportResponse LedgerService::GetFulfillmentReport(const GetFulfillmentReportRequest& req) {
  return ObserveRpc("LedgerService.GetFulfillmentReport", req.payment_id(), [&] {
    RequirePaymentId(req.payment_id());
    GetFulfillmentReportResponse resp;
    *resp.mutable_report() = ctx_.orchestrator->GetReport(req.payment_id());
    return resp;
  });
}

} // namespace keyshop::service
