#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/completion_coordinator.hpp"
#include "internal/ledger/pending_ledger.hpp"
#include "test_support.hpp"

namespace {

using keyshop::db::memory::MemoryRepository;
using keyshop::ledger::CompletionCoordinator;
using keyshop::ledger::PendingLedger;
using namespace keyshop::testing;

namespace v1 = keyshop::ledger::v1;

struct Fixture {
  ManualClock                            clock;
  std::shared_ptr<MemoryRepository>      repository  = std::make_shared<MemoryRepository>();
  std::shared_ptr<PendingLedger>         ledger      = std::make_shared<PendingLedger>(repository, FastRetry(), clock.Fn());
  std::shared_ptr<CompletionCoordinator> coordinator = std::make_shared<CompletionCoordinator>(repository, FastRetry(), clock.Fn());
};

void TestIntentLifecycle() {
  Fixture f;

  assert(f.ledger->GetStatus("p1") == v1::INTENT_STATUS_NOT_FOUND);
  assert(f.ledger->CreateOrRefreshIntent(NewKeyOrder("p1", 42, "300.00")));
  assert(f.ledger->GetStatus("p1") == v1::INTENT_STATUS_PENDING);

  auto peeked = f.ledger->PeekMetadata("p1");
  assert(peeked.has_value());
  assert(peeked->owner_id() == 42);
  assert(peeked->has_new_key());

  // refresh while pending replaces amount and metadata
  auto repriced = NewKeyOrder("p1", 42, "350.00");
  repriced.set_promo_code("SPRING");
  assert(f.ledger->CreateOrRefreshIntent(repriced));
  auto row = f.ledger->Find("p1");
  assert(row.has_value());
  assert(row->amount_minor == 35000);
  assert(f.ledger->PeekMetadata("p1")->promo_code() == "SPRING");
}

void TestPaidIntentIsNeverRevived() {
  Fixture f;
  assert(f.ledger->CreateOrRefreshIntent(NewKeyOrder("p1", 42, "300.00")));
  assert(f.coordinator->CompleteIfPending("p1").has_value());

  // a late refresh (user re-opened the payment page) must not reset status
  assert(!f.ledger->CreateOrRefreshIntent(NewKeyOrder("p1", 42, "999.00")));
  assert(f.ledger->GetStatus("p1") == v1::INTENT_STATUS_PAID);
  assert(f.ledger->Find("p1")->amount_minor == 30000);
  assert(!f.ledger->PeekMetadata("p1").has_value());
}

void TestInvalidMetadataIsRejectedWithoutThrowing() {
  Fixture f;
  auto    metadata = NewKeyOrder("p1", 42);
  metadata.set_amount("-5");
  assert(!f.ledger->CreateOrRefreshIntent(metadata));
  assert(f.ledger->GetStatus("p1") == v1::INTENT_STATUS_NOT_FOUND);
  assert(!f.ledger->PeekMetadata("").has_value());
}

void TestMostRecentPendingPrefersLatestUpdate() {
  Fixture f;
  assert(!f.ledger->MostRecentPendingFor(42).has_value());

  assert(f.ledger->CreateOrRefreshIntent(NewKeyOrder("older", 42)));
  f.clock.Advance(std::chrono::seconds(5));
  assert(f.ledger->CreateOrRefreshIntent(NewKeyOrder("newer", 42)));
  f.clock.Advance(std::chrono::seconds(5));
  assert(f.ledger->CreateOrRefreshIntent(NewKeyOrder("other-owner", 43)));

  assert(f.ledger->MostRecentPendingFor(42)->payment_id() == "newer");

  f.clock.Advance(std::chrono::seconds(5));
  assert(f.ledger->CreateOrRefreshIntent(NewKeyOrder("older", 42, "310.00")));
  assert(f.ledger->MostRecentPendingFor(42)->payment_id() == "older");

  assert(f.coordinator->CompleteIfPending("older").has_value());
  assert(f.ledger->MostRecentPendingFor(42)->payment_id() == "newer");
  assert(f.ledger->MostRecentPendingFor(43)->payment_id() == "other-owner");
}

} // namespace

int main() {
  TestIntentLifecycle();
  TestPaidIntentIsNeverRevived();
  TestInvalidMetadataIsRejectedWithoutThrowing();
  TestMostRecentPendingPrefersLatestUpdate();

  std::cout << "keyshop_unit_pending_ledger: pass\n";
  return 0;
}
