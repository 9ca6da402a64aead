#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/reconcile_service.hpp"
#include "keyshop/ledger/v1/ledger_service.grpc.pb.h"

namespace keyshop::grpc {

class ReconcileServer final : public keyshop::ledger::v1::KeyshopReconcileService::Service {
 public:
  explicit ReconcileServer(std::shared_ptr<keyshop::service::ReconcileService> svc);

  ::grpc::Status ReconcileOwner(::grpc::ServerContext*, const keyshop::ledger::v1::ReconcileOwnerRequest*,
                                keyshop::ledger::v1::ReconcileResponse*) override;

  ::grpc::Status ReconcileAll(::grpc::ServerContext*, const keyshop::ledger::v1::ReconcileAllRequest*, keyshop::ledger::v1::ReconcileResponse*) override;

 private:
  std::shared_ptr<keyshop::service::ReconcileService> service_;
};

} // namespace keyshop::grpc
