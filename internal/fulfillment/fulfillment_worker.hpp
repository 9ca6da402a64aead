#pragma once

#include <memory>
#include <thread>
#include <vector>

#include "internal/fulfillment/fulfillment_queue.hpp"
#include "internal/fulfillment/orchestrator.hpp"

namespace keyshop::fulfillment {

/*
  Background workers that run queued orders through the orchestrator.

  Stop drains the queue before joining, so every order accepted by intake
  is attempted.
*/
class FulfillmentWorker {
 public:
  FulfillmentWorker(std::shared_ptr<FulfillmentQueue> queue, std::shared_ptr<FulfillmentOrchestrator> orchestrator, unsigned threads = 1);
  ~FulfillmentWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<FulfillmentQueue>        queue_;
  std::shared_ptr<FulfillmentOrchestrator> orchestrator_;
  unsigned                                 thread_count_;

  std::vector<std::thread> threads_;
};

} // namespace keyshop::fulfillment
