#include "reconcile_worker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace keyshop::reconcile {

ReconcileWorker::ReconcileWorker(std::shared_ptr<Reconciler> reconciler, std::chrono::milliseconds interval)
    : reconciler_(std::move(reconciler)), interval_(interval.count() > 0 ? interval : std::chrono::minutes(10)) {
}

ReconcileWorker::~ReconcileWorker() {
  Stop();
}

void ReconcileWorker::Start() {
  if (thread_.joinable()) return;
  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
  }
  thread_ = std::thread(&ReconcileWorker::Loop, this);
}

void ReconcileWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void ReconcileWorker::Loop() {
  std::unique_lock lock(mutex_);
  while (!cv_.wait_for(lock, interval_, [&] { return stopping_; })) {
    lock.unlock();
    observability::SpanScope span("reconcile.sweep");
    try {
      const auto report = reconciler_->ReconcileAll();
      span.SetAttribute("reconcile.checked", static_cast<std::int64_t>(report.checked()));
      span.SetAttribute("reconcile.deleted", static_cast<std::int64_t>(report.deleted()));
    } catch (const std::exception& e) {
      span.RecordException(e.what());
      KEYSHOP_LOG_ERROR("reconciliation sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace keyshop::reconcile
