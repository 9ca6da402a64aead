#include "fulfillment_worker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace keyshop::fulfillment {

FulfillmentWorker::FulfillmentWorker(std::shared_ptr<FulfillmentQueue> queue, std::shared_ptr<FulfillmentOrchestrator> orchestrator, unsigned threads)
    : queue_(std::move(queue)), orchestrator_(std::move(orchestrator)), thread_count_(threads == 0 ? 1 : threads) {
}

FulfillmentWorker::~FulfillmentWorker() {
  Stop();
}

void FulfillmentWorker::Start() {
  if (!threads_.empty()) return;
  for (unsigned i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&FulfillmentWorker::Run, this);
  }
}

void FulfillmentWorker::Stop() {
  queue_->Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void FulfillmentWorker::Run() {
  while (true) {
    auto order = queue_->Dequeue();
    if (!order) break;

    observability::SpanScope span("fulfillment.dequeue");
    span.SetAttribute("payment.id", order->payment_id());
    try {
      orchestrator_->Run(*order);
    } catch (const std::exception& e) {
      span.RecordException(e.what());
      // the claim may already be spent; the stalled-claim audit reports it
      KEYSHOP_LOG_ERROR("queued fulfillment failed",
                        {observability::StringField("payment_id", order->payment_id()), observability::StringField("error", e.what())});
    }
  }
}

} // namespace keyshop::fulfillment
