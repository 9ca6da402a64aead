#include "ledger_server.hpp"

#include "grpc_error.hpp"

namespace keyshop::grpc {

using namespace keyshop::ledger::v1;

LedgerServer::LedgerServer(std::shared_ptr<keyshop::service::LedgerService> svc) : service_(std::move(svc)) {
}

::grpc::Status LedgerServer::CreateOrRefreshIntent(::grpc::ServerContext*, const CreateOrRefreshIntentRequest* req, CreateOrRefreshIntentResponse* resp) {
  try {
    *resp = service_->CreateOrRefreshIntent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::GetStatus(::grpc::ServerContext*, const GetStatusRequest* req, GetStatusResponse* resp) {
  try {
    *resp = service_->GetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::PeekMetadata(::grpc::ServerContext*, const PeekMetadataRequest* req, PeekMetadataResponse* resp) {
  try {
    *resp = service_->PeekMetadata(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::MostRecentPending(::grpc::ServerContext*, const MostRecentPendingRequest* req, MostRecentPendingResponse* resp) {
  try {
    *resp = service_->MostRecentPending(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::CompleteIfPending(::grpc::ServerContext*, const CompleteIfPendingRequest* req, CompleteIfPendingResponse* resp) {
  try {
    *resp = service_->CompleteIfPending(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::Claim(::grpc::ServerContext*, const ClaimRequest* req, ClaimResponse* resp) {
  try {
    *resp = service_->Claim(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::RunFulfillment(::grpc::ServerContext*, const RunFulfillmentRequest* req, RunFulfillmentResponse* resp) {
  try {
    *resp = service_->RunFulfillment(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::SubmitProviderNotification(::grpc::ServerContext*, const SubmitProviderNotificationRequest* req, SubmitProviderNotificationResponse* resp) {
  try {
    *resp = service_->SubmitProviderNotification(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::PayFromBalance(::grpc::ServerContext*, const PayFromBalanceRequest* req, PayFromBalanceResponse* resp) {
  try {
    *resp = service_->PayFromBalance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::CompleteGift(::grpc::ServerContext*, const CompleteGiftRequest* req, CompleteGiftResponse* resp) {
  try {
    *resp = service_->CompleteGift(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::GetFulfillmentReport(::grpc::ServerContext*, const GetFulfillmentReportRequest* req, GetFulfillmentReportResponse* resp) {
  try {
    *resp = service_->GetFulfillmentReport(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace keyshop::grpc
