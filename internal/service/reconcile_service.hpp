#pragma once

#include "keyshop/ledger/v1.hpp"
#include "service_context.hpp"

namespace keyshop::service {

class ReconcileService {
 public:
  explicit ReconcileService(ServiceContext ctx);

  keyshop::ledger::v1::ReconcileResponse ReconcileOwner(const keyshop::ledger::v1::ReconcileOwnerRequest& req);

  keyshop::ledger::v1::ReconcileResponse ReconcileAll(const keyshop::ledger::v1::ReconcileAllRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace keyshop::service
