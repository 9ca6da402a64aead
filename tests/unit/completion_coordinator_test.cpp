#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/fulfillment/fulfillment_guard.hpp"
#include "internal/ledger/completion_coordinator.hpp"
#include "internal/ledger/pending_ledger.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using keyshop::db::memory::MemoryRepository;
using keyshop::fulfillment::FulfillmentGuard;
using keyshop::ledger::CompletionCoordinator;
using keyshop::ledger::PendingLedger;
using namespace keyshop::testing;

namespace v1 = keyshop::ledger::v1;

constexpr int kCallers = 16;

void TestSecondCompletionReturnsNothing() {
  auto repository  = std::make_shared<MemoryRepository>();
  auto ledger      = std::make_shared<PendingLedger>(repository, FastRetry());
  auto coordinator = std::make_shared<CompletionCoordinator>(repository, FastRetry());

  assert(ledger->CreateOrRefreshIntent(NewKeyOrder("p1", 42, "300.00")));

  auto first = coordinator->CompleteIfPending("p1");
  assert(first.has_value());
  assert(first->payment_id() == "p1");
  assert(first->owner_id() == 42);
  assert(first->amount() == "300.00");

  assert(!coordinator->CompleteIfPending("p1").has_value());
  assert(ledger->GetStatus("p1") == v1::INTENT_STATUS_PAID);

  assert(!coordinator->CompleteIfPending("never-created").has_value());
  assert(!coordinator->CompleteIfPending("").has_value());
}

void TestConcurrentCompletionsHaveOneWinner() {
  auto repository  = std::make_shared<MemoryRepository>();
  auto ledger      = std::make_shared<PendingLedger>(repository, FastRetry());
  auto coordinator = std::make_shared<CompletionCoordinator>(repository, FastRetry());
  assert(ledger->CreateOrRefreshIntent(NewKeyOrder("race", 42)));

  std::atomic<int>         winners{0};
  std::atomic<bool>        go{false};
  std::vector<std::thread> callers;
  for (int i = 0; i < kCallers; ++i) {
    callers.emplace_back([&] {
      while (!go.load()) std::this_thread::yield();
      if (coordinator->CompleteIfPending("race")) winners.fetch_add(1);
    });
  }
  go.store(true);
  for (auto& caller : callers) caller.join();

  assert(winners.load() == 1);
  assert(ledger->GetStatus("race") == v1::INTENT_STATUS_PAID);
}

void TestGuardClaimsOncePerPaymentId() {
  auto repository = std::make_shared<MemoryRepository>();
  auto guard      = std::make_shared<FulfillmentGuard>(repository, FastRetry());

  assert(guard->Claim("p2"));
  assert(!guard->Claim("p2"));
  assert(guard->Claim("p3"));

  bool threw = false;
  try {
    (void)guard->Claim("");
  } catch (const keyshop::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestGuardClaimWithinRollsBackWithCaller() {
  auto repository = std::make_shared<MemoryRepository>();
  auto guard      = std::make_shared<FulfillmentGuard>(repository, FastRetry());

  {
    auto tx = repository->Begin();
    assert(guard->ClaimWithin(*tx, "p4"));
    tx->Rollback();
  }
  // the rolled-back claim left no trace
  assert(guard->Claim("p4"));
}

void TestConcurrentClaimsHaveOneWinner() {
  auto repository = std::make_shared<MemoryRepository>();
  auto guard      = std::make_shared<FulfillmentGuard>(repository, FastRetry());

  std::atomic<int>         winners{0};
  std::atomic<bool>        go{false};
  std::vector<std::thread> callers;
  for (int i = 0; i < kCallers; ++i) {
    callers.emplace_back([&] {
      while (!go.load()) std::this_thread::yield();
      if (guard->Claim("contended")) winners.fetch_add(1);
    });
  }
  go.store(true);
  for (auto& caller : callers) caller.join();

  assert(winners.load() == 1);
}

} // namespace

int main() {
  TestSecondCompletionReturnsNothing();
  TestConcurrentCompletionsHaveOneWinner();
  TestGuardClaimsOncePerPaymentId();
  TestGuardClaimWithinRollsBackWithCaller();
  TestConcurrentClaimsHaveOneWinner();

  std::cout << "keyshop_unit_completion_coordinator: pass\n";
  return 0;
}
