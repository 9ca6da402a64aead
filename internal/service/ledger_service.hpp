#pragma once

#include "keyshop/ledger/v1.hpp"
#include "service_context.hpp"

namespace keyshop::service {

/*
  Transport-independent handlers of KeyshopLedgerService.

  Errors are thrown as util/db exceptions; the gRPC adapter maps them.
*/
class LedgerService {
 public:
  explicit LedgerService(ServiceContext ctx);

  keyshop::ledger::v1::CreateOrRefreshIntentResponse CreateOrRefreshIntent(const keyshop::ledger::v1::CreateOrRefreshIntentRequest& req);

  keyshop::ledger::v1::GetStatusResponse GetStatus(const keyshop::ledger::v1::GetStatusRequest& req);

  keyshop::ledger::v1::PeekMetadataResponse PeekMetadata(const keyshop::ledger::v1::PeekMetadataRequest& req);

  keyshop::ledger::v1::MostRecentPendingResponse MostRecentPending(const keyshop::ledger::v1::MostRecentPendingRequest& req);

  keyshop::ledger::v1::CompleteIfPendingResponse CompleteIfPending(const keyshop::ledger::v1::CompleteIfPendingRequest& req);

  keyshop::ledger::v1::ClaimResponse Claim(const keyshop::ledger::v1::ClaimRequest& req);

  keyshop::ledger::v1::RunFulfillmentResponse RunFulfillment(const keyshop::ledger::v1::RunFulfillmentRequest& req);

  keyshop::ledger::v1::SubmitProviderNotificationResponse SubmitProviderNotification(
      const keyshop::ledger::v1::SubmitProviderNotificationRequest& req);

  keyshop::ledger::v1::PayFromBalanceResponse PayFromBalance(const keyshop::ledger::v1::PayFromBalanceRequest& req);

  keyshop::ledger::v1::CompleteGiftResponse CompleteGift(const keyshop::ledger::v1::CompleteGiftRequest& req);

  keyshop::ledger::v1::GetFulfillmentReportResponse GetFulfillmentReport(const keyshop::ledger::v1::GetFulfillmentReportRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace keyshop::service
