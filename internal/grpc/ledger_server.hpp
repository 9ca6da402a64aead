#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/ledger_service.hpp"
#include "keyshop/ledger/v1/ledger_service.grpc.pb.h"

namespace keyshop::grpc {

class LedgerServer final : public keyshop::ledger::v1::KeyshopLedgerService::Service {
 public:
  explicit LedgerServer(std::shared_ptr<keyshop::service::LedgerService> svc);

  ::grpc::Status CreateOrRefreshIntent(::grpc::ServerContext*, const keyshop::ledger::v1::CreateOrRefreshIntentRequest*,
                                       keyshop::ledger::v1::CreateOrRefreshIntentResponse*) override;

  ::grpc::Status GetStatus(::grpc::ServerContext*, const keyshop::ledger::v1::GetStatusRequest*, keyshop::ledger::v1::GetStatusResponse*) override;

  ::grpc::Status PeekMetadata(::grpc::ServerContext*, const keyshop::ledger::v1::PeekMetadataRequest*,
                              keyshop::ledger::v1::PeekMetadataResponse*) override;

  ::grpc::Status MostRecentPending(::grpc::ServerContext*, const keyshop::ledger::v1::MostRecentPendingRequest*,
                                   keyshop::ledger::v1::MostRecentPendingResponse*) override;

  ::grpc::Status CompleteIfPending(::grpc::ServerContext*, const keyshop::ledger::v1::CompleteIfPendingRequest*,
                                   keyshop::ledger::v1::CompleteIfPendingResponse*) override;

  ::grpc::Status Claim(::grpc::ServerContext*, const keyshop::ledger::v1::ClaimRequest*, keyshop::ledger::v1::ClaimResponse*) override;

  ::grpc::Status RunFulfillment(::grpc::ServerContext*, const keyshop::ledger::v1::RunFulfillmentRequest*,
                                keyshop::ledger::v1::RunFulfillmentResponse*) override;

  ::grpc::Status SubmitProviderNotification(::grpc::ServerContext*, const keyshop::ledger::v1::SubmitProviderNotificationRequest*,
                                            keyshop::ledger::v1::SubmitProviderNotificationResponse*) override;

  ::grpc::Status PayFromBalance(::grpc::ServerContext*, const keyshop::ledger::v1::PayFromBalanceRequest*,
                                keyshop::ledger::v1::PayFromBalanceResponse*) override;

  ::grpc::Status CompleteGift(::grpc::ServerContext*, const keyshop::ledger::v1::CompleteGiftRequest*,
                              keyshop::ledger::v1::CompleteGiftResponse*) override;

  ::grpc::Status GetFulfillmentReport(::grpc::ServerContext*, const keyshop::ledger::v1::GetFulfillmentReportRequest*,
                                      keyshop::ledger::v1::GetFulfillmentReportResponse*) override;

 private:
  std::shared_ptr<keyshop::service::LedgerService> service_;
};

} // namespace keyshop::grpc
