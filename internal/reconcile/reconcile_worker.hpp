#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/reconcile/reconciler.hpp"

namespace keyshop::reconcile {

/*
  Runs Reconciler::ReconcileAll every interval until stopped.
*/
class ReconcileWorker {
 public:
  ReconcileWorker(std::shared_ptr<Reconciler> reconciler, std::chrono::milliseconds interval);
  ~ReconcileWorker();

  void Start();
  void Stop();

 private:
  void Loop();

  std::shared_ptr<Reconciler> reconciler_;
  std::chrono::milliseconds   interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
  std::thread             thread_;
};

} // namespace keyshop::reconcile
