#include "reconcile_service.hpp"

#include <chrono>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/reconcile/reconciler.hpp"
#include "internal/util/errors.hpp"

namespace keyshop::service {

using namespace keyshop::ledger::v1;

namespace {

template <typename Fn>
ReconcileResponse ObserveRpc(std::string_view route, int64_t owner_id, Fn&& fn) {
  observability::SpanScope span(route);
  if (owner_id > 0) {
    span.SetAttribute("owner.id", static_cast<std::int64_t>(owner_id));
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    ReconcileResponse resp;
    *resp.mutable_report() = fn();
    span.SetAttribute("reconcile.checked", static_cast<std::int64_t>(resp.report().checked()));
    observability::Metrics::Instance().RecordRequest(route, true);
    observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    KEYSHOP_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::IntField("owner_id", owner_id),
                                     observability::StringField("error", ex.what())});
    observability::Metrics::Instance().RecordRequest(route, false);
    observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

} // namespace

ReconcileService::ReconcileService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ReconcileResponse ReconcileService::ReconcileOwner(const ReconcileOwnerRequest& req) {
  return ObserveRpc("ReconcileService.ReconcileOwner", req.owner_id(), [&] {
    if (req.owner_id() <= 0) throw util::InvalidArgument("owner_id must be positive");
    return ctx_.reconciler->ReconcileOwner(req.owner_id());
  });
}

ReconcileResponse ReconcileService::ReconcileAll(const ReconcileAllRequest&) {
  return ObserveRpc("ReconcileService.ReconcileAll", 0, [&] { return ctx_.reconciler->ReconcileAll(); });
}

} // namespace keyshop::service
