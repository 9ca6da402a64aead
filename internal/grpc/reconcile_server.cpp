#include "reconcile_server.hpp"

#include "grpc_error.hpp"

namespace keyshop::grpc {

using namespace keyshop::ledger::v1;

ReconcileServer::ReconcileServer(std::shared_ptr<keyshop::service::ReconcileService> svc) : service_(std::move(svc)) {
}

::grpc::Status ReconcileServer::ReconcileOwner(::grpc::ServerContext*, const ReconcileOwnerRequest* req, ReconcileResponse* resp) {
  try {
    *resp = service_->ReconcileOwner(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ReconcileServer::ReconcileAll(::grpc::ServerContext*, const ReconcileAllRequest* req, ReconcileResponse* resp) {
  try {
    *resp = service_->ReconcileAll(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace keyshop::grpc
