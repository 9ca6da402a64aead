#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/fulfillment/fulfillment_guard.hpp"
#include "internal/ledger/completion_coordinator.hpp"
#include "internal/ledger/pending_ledger.hpp"
#include "test_support.hpp"

#if KEYSHOP_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if KEYSHOP_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using keyshop::db::ErrorCode;
using keyshop::db::Repository;
using keyshop::db::memory::MemoryRepository;
using keyshop::db::model::CommissionRecord;
using keyshop::db::model::CredentialRecord;
using keyshop::db::model::FulfillmentOutcomeRecord;
using keyshop::db::model::IntentStatus;
using keyshop::db::model::PaymentLogRecord;
using keyshop::db::model::PendingGiftRecord;
using keyshop::db::model::PendingTransactionRecord;
using keyshop::db::model::ProcessedPaymentRecord;
using keyshop::db::model::PromoCodeRecord;
using keyshop::db::model::PromoUsageRecord;

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

// Postgres keeps rows between runs; every key carries a per-run suffix.
struct Keys {
  std::string tag;
  int64_t     owner_base;

  std::string Id(const std::string& name) const {
    return name + "-" + tag;
  }

  int64_t Owner(int64_t n) const {
    return owner_base + n;
  }
};

void VerifyPendingLedgerLifecycle(Repository& repo, const Keys& k) {
  const auto id = k.Id("intent");
  {
    auto                     tx = repo.Begin();
    PendingTransactionRecord row{.payment_id    = id,
                                 .owner_id      = k.Owner(1),
                                 .amount_minor  = 30000,
                                 .currency      = "RUB",
                                 .metadata_json = R"({"payment_id":"x"})",
                                 .status        = IntentStatus::Pending,
                                 .created_at_ms = 1000,
                                 .updated_at_ms = 1000};
    assert(repo.UpsertPendingIntent(*tx, row));

    row.amount_minor  = 45000;
    row.updated_at_ms = 2000;
    row.created_at_ms = 9999;
    assert(repo.UpsertPendingIntent(*tx, row));

    auto read = repo.GetPendingTransaction(*tx, id);
    assert(read.has_value());
    assert(read->amount_minor == 45000);
    assert(read->created_at_ms == 1000);
    assert(read->updated_at_ms == 2000);
    assert(read->status == IntentStatus::Pending);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.MarkPaid(*tx, id, 3000));
    auto again = repo.MarkPaid(*tx, id, 4000);
    assert(!again);
    assert(again.code == ErrorCode::Conflict);
    assert(!repo.MarkPaid(*tx, k.Id("never-created"), 4000));
    tx->Commit();
  }

  {
    auto                     tx = repo.Begin();
    PendingTransactionRecord revive{.payment_id = id, .owner_id = k.Owner(1), .amount_minor = 1, .currency = "RUB", .metadata_json = "{}"};
    auto                     result = repo.UpsertPendingIntent(*tx, revive);
    assert(!result);
    assert(result.code == ErrorCode::Conflict);
    tx->Rollback();
  }

  auto tx   = repo.Begin();
  auto paid = repo.GetPendingTransaction(*tx, id);
  assert(paid->status == IntentStatus::Paid);
  assert(paid->amount_minor == 45000);
  assert(!repo.LatestPendingForOwner(*tx, k.Owner(1)).has_value());
  tx->Commit();

  auto listed = [&](int64_t paid_before_ms) {
    auto audit_tx = repo.Begin();
    bool found    = false;
    for (const auto& row : repo.ListPaidWithoutClaim(*audit_tx, paid_before_ms)) {
      assert(row.status == IntentStatus::Paid);
      if (row.payment_id == id) found = true;
    }
    audit_tx->Commit();
    return found;
  };
  assert(!listed(3000));
  assert(listed(3001));

  auto claim_tx = repo.Begin();
  assert(repo.InsertProcessedPayment(*claim_tx, ProcessedPaymentRecord{id, 3500}));
  claim_tx->Commit();
  assert(!listed(3001));
}

void VerifyLatestPendingOrdering(Repository& repo, const Keys& k) {
  auto tx = repo.Begin();
  for (const auto& [name, updated] : std::vector<std::pair<std::string, int64_t>>{{"older", 100}, {"newest", 300}, {"middle", 200}}) {
    PendingTransactionRecord row{
        .payment_id = k.Id(name), .owner_id = k.Owner(2), .amount_minor = 100, .currency = "RUB", .metadata_json = "{}", .created_at_ms = 50,
        .updated_at_ms = updated};
    assert(repo.UpsertPendingIntent(*tx, row));
  }
  auto latest = repo.LatestPendingForOwner(*tx, k.Owner(2));
  assert(latest.has_value());
  assert(latest->payment_id == k.Id("newest"));
  tx->Commit();
}

void VerifyClaimsAndOutcomes(Repository& repo, const Keys& k) {
  const auto done  = k.Id("claim-done");
  const auto stuck = k.Id("claim-stuck");

  auto tx = repo.Begin();
  assert(repo.InsertProcessedPayment(*tx, ProcessedPaymentRecord{done, 100}));
  assert(repo.InsertProcessedPayment(*tx, ProcessedPaymentRecord{stuck, 200}));
  auto duplicate = repo.InsertProcessedPayment(*tx, ProcessedPaymentRecord{done, 300});
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  assert(repo.UpsertFulfillmentOutcome(*tx, FulfillmentOutcomeRecord{done, "provision", 2, "ok", "de-1", 110}));
  assert(repo.UpsertFulfillmentOutcome(*tx, FulfillmentOutcomeRecord{done, "claim", 1, "ok", "", 105}));
  assert(repo.UpsertFulfillmentOutcome(*tx, FulfillmentOutcomeRecord{done, "provision", 3, "failed", "timeout", 120}));
  assert(repo.UpsertFulfillmentOutcome(*tx, FulfillmentOutcomeRecord{done, "result", 4, "ok", "{}", 130}));
  // same sequence: replaced, not appended
  assert(repo.UpsertFulfillmentOutcome(*tx, FulfillmentOutcomeRecord{done, "result", 4, "ok", R"({"result":1})", 140}));

  auto outcomes = repo.ListFulfillmentOutcomes(*tx, done);
  assert(outcomes.size() == 4);
  assert(outcomes[0].step == "claim");
  assert(outcomes[1].step == "provision");
  assert(outcomes[1].status == "ok");
  assert(outcomes[2].step == "provision");
  assert(outcomes[2].status == "failed");
  assert(outcomes[2].detail == "timeout");
  assert(outcomes[3].detail == R"({"result":1})");

  bool saw_stuck = false;
  for (const auto& claim : repo.ListClaimsWithoutResult(*tx, 1000)) {
    assert(claim.payment_id != done);
    if (claim.payment_id == stuck) saw_stuck = true;
  }
  assert(saw_stuck);
  for (const auto& claim : repo.ListClaimsWithoutResult(*tx, 150)) assert(claim.payment_id != stuck);
  tx->Commit();
}

void VerifyCredentialLifecycle(Repository& repo, const Keys& k) {
  const auto identity = k.Id("cred") + "@keyshop.local";

  CredentialRecord record;
  record.owner_id        = k.Owner(3);
  record.provider_host   = "de-1";
  record.remote_uuid     = "uuid-1";
  record.unique_identity = identity;
  record.expires_at_ms   = 5000;
  record.origin_json     = R"({"kind":"new"})";
  record.created_at_ms   = 100;
  record.updated_at_ms   = 100;

  {
    auto tx = repo.Begin();
    assert(repo.InsertCredential(*tx, record));
    assert(record.credential_id > 0);

    CredentialRecord clash = record;
    clash.owner_id         = k.Owner(4);
    auto taken             = repo.InsertCredential(*tx, clash);
    assert(!taken);
    assert(taken.code == ErrorCode::ConstraintViolation);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.SetCredentialMissingSince(*tx, record.credential_id, 700));

    auto row = repo.GetCredentialByIdentity(*tx, identity);
    assert(row.has_value());
    assert(row->credential_id == record.credential_id);
    assert(row->missing_since_ms == 700);
    assert(row->origin_json == R"({"kind":"new"})");

    row->provider_host = "nl-1";
    row->expires_at_ms = 9000;
    row->updated_at_ms = 800;
    assert(repo.UpdateCredential(*tx, *row));

    auto updated = repo.GetCredential(*tx, record.credential_id);
    assert(updated->provider_host == "nl-1");
    assert(updated->expires_at_ms == 9000);
    assert(updated->missing_since_ms == 700);
    assert(updated->created_at_ms == 100);

    assert(repo.SetCredentialMissingSince(*tx, record.credential_id, std::nullopt));
    assert(!repo.GetCredential(*tx, record.credential_id)->missing_since_ms.has_value());
    assert(repo.ListCredentialsForOwner(*tx, k.Owner(3)).size() == 1);
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.DeleteCredential(*tx, record.credential_id));
  assert(!repo.GetCredential(*tx, record.credential_id).has_value());
  assert(repo.ListCredentialsForOwner(*tx, k.Owner(3)).empty());
  tx->Commit();
}

void VerifyAccountsAndLog(Repository& repo, const Keys& k) {
  auto tx = repo.Begin();

  assert(!repo.GetAccount(*tx, k.Owner(5)).has_value());
  assert(repo.AdjustBalance(*tx, k.Owner(5), 10000));
  assert(repo.GetAccount(*tx, k.Owner(5))->balance_minor == 10000);

  auto overdraft = repo.AdjustBalance(*tx, k.Owner(5), -20000);
  assert(!overdraft);
  assert(overdraft.code == ErrorCode::Conflict);
  assert(repo.AdjustBalance(*tx, k.Owner(5), -10000));
  assert(repo.GetAccount(*tx, k.Owner(5))->balance_minor == 0);
  assert(!repo.AdjustBalance(*tx, k.Owner(6), -1));

  assert(!repo.AdjustReferralBalance(*tx, k.Owner(6), 100));
  assert(repo.UpsertAccount(*tx, {.owner_id = k.Owner(6), .referrer_id = k.Owner(5), .created_at_ms = 10}));
  assert(repo.AdjustReferralBalance(*tx, k.Owner(6), 3000));
  assert(repo.AdjustReferralBalance(*tx, k.Owner(6), 2000));
  auto referrer = repo.GetAccount(*tx, k.Owner(6));
  assert(referrer->referrer_id == k.Owner(5));
  assert(referrer->referral_balance_minor == 5000);
  assert(referrer->referral_total_minor == 5000);

  PaymentLogRecord first{.owner_id = k.Owner(5), .payment_id = k.Id("log-1"), .payment_method = "yookassa", .amount_minor = 30000,
                         .currency = "RUB", .action = "new", .status = "paid", .metadata_json = "{}", .created_at_ms = 10};
  PaymentLogRecord second = first;
  second.payment_id       = k.Id("log-2");
  second.action           = "refund";
  second.status           = "refunded";
  assert(repo.InsertPaymentLog(*tx, first));
  assert(repo.InsertPaymentLog(*tx, second));
  assert(second.log_id > first.log_id);

  auto log = repo.ListPaymentLogForOwner(*tx, k.Owner(5));
  assert(log.size() == 2);
  assert(log[0].action == "new");
  assert(log[1].status == "refunded");
  tx->Commit();
}

void VerifyPromoAndCommission(Repository& repo, const Keys& k) {
  const auto code = k.Id("SPRING");
  auto       tx   = repo.Begin();

  assert(!repo.GetPromoCode(*tx, code).has_value());
  assert(repo.UpsertPromoCode(*tx, PromoCodeRecord{.code = code, .discount_minor = 5000, .usage_limit_total = 2, .usage_limit_per_owner = 1}));

  PromoUsageRecord usage{.code = code, .owner_id = k.Owner(7), .applied_minor = 5000, .order_id = k.Id("order-1"), .used_at_ms = 10};
  assert(repo.InsertPromoUsage(*tx, usage));
  assert(usage.usage_id > 0);
  auto again = repo.InsertPromoUsage(*tx, usage);
  assert(!again);
  assert(again.code == ErrorCode::AlreadyExists);

  assert(repo.CountPromoUsagesByOwner(*tx, code, k.Owner(7)) == 1);
  assert(repo.CountPromoUsagesByOwner(*tx, code, k.Owner(8)) == 0);

  assert(repo.IncrementPromoUsage(*tx, code));
  assert(repo.SetPromoActive(*tx, code, false));
  auto promo = repo.GetPromoCode(*tx, code);
  assert(promo->used_total == 1);
  assert(!promo->is_active);
  assert(!promo->valid_until_ms.has_value());
  assert(!repo.IncrementPromoUsage(*tx, k.Id("NOPE")));

  const auto instance = k.Id("fr");
  CommissionRecord commission{.instance_id = instance, .payment_id = k.Id("order-1"), .owner_id = k.Owner(7), .amount_minor = 30000,
                              .percent = 10.0, .commission_minor = 3000, .payment_method = "yookassa", .created_at_ms = 10};
  assert(repo.InsertCommission(*tx, commission));
  auto repeated = repo.InsertCommission(*tx, commission);
  assert(!repeated);
  assert(repeated.code == ErrorCode::AlreadyExists);

  auto commissions = repo.ListCommissions(*tx, instance);
  assert(commissions.size() == 1);
  assert(commissions[0].commission_minor == 3000);
  assert(commissions[0].percent == 10.0);
  tx->Commit();
}

void VerifyPendingGifts(Repository& repo, const Keys& k) {
  const auto id = k.Id("gift");
  auto       tx = repo.Begin();
  assert(repo.InsertPendingGift(*tx, PendingGiftRecord{id, k.Owner(9), R"({"payment_id":"g"})", 10}));
  assert(!repo.InsertPendingGift(*tx, PendingGiftRecord{id, k.Owner(9), "{}", 20}));

  auto gift = repo.GetPendingGift(*tx, id);
  assert(gift.has_value());
  assert(gift->payer_id == k.Owner(9));
  assert(gift->metadata_json == R"({"payment_id":"g"})");

  assert(repo.DeletePendingGift(*tx, id));
  assert(!repo.GetPendingGift(*tx, id).has_value());
  assert(!repo.DeletePendingGift(*tx, id));
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const Keys& k) {
  const auto id = k.Id("rollback");
  {
    auto tx = repo.Begin();
    assert(repo.InsertProcessedPayment(*tx, ProcessedPaymentRecord{id, 1}));
    assert(repo.AdjustBalance(*tx, k.Owner(10), 500));
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(repo.InsertProcessedPayment(*check_tx, ProcessedPaymentRecord{id, 2}));
  assert(!repo.GetAccount(*check_tx, k.Owner(10)).has_value());
  check_tx->Commit();
}

// Two transactions race for the same claim; exactly one may commit it.
void VerifyConcurrentClaims(Repository& repo, const Keys& k, bool supports_parallel_transactions) {
  if (!supports_parallel_transactions) return;

  const auto id  = k.Id("race");
  auto       tx1 = repo.Begin();
  auto       tx2 = repo.Begin();

  assert(repo.InsertProcessedPayment(*tx1, ProcessedPaymentRecord{id, 1}));
  tx1->Commit();

  int winners = 1;
  try {
    if (repo.InsertProcessedPayment(*tx2, ProcessedPaymentRecord{id, 2})) {
      tx2->Commit();
      ++winners;
    } else {
      tx2->Rollback();
    }
  } catch (const keyshop::db::DatabaseError& e) {
    assert(e.retryable());
  }
  assert(winners == 1);
}

// Many callers complete and claim the same payment at once; the ledger flips
// exactly once and exactly one claim wins.
void VerifyConcurrentCompletionAndClaim(const std::shared_ptr<Repository>& repo, const Keys& k) {
  constexpr int kCallers = 16;

  const keyshop::db::RetryPolicy retry{.attempts = 12, .base_delay = std::chrono::milliseconds(1)};
  keyshop::ledger::PendingLedger         ledger(repo, retry);
  keyshop::ledger::CompletionCoordinator coordinator(repo, retry);
  keyshop::fulfillment::FulfillmentGuard guard(repo, retry);

  const auto id = k.Id("complete-race");
  assert(ledger.CreateOrRefreshIntent(keyshop::testing::NewKeyOrder(id, k.Owner(12))));

  std::atomic<int>         completions{0};
  std::atomic<int>         claims{0};
  std::atomic<int>         errors{0};
  std::atomic<bool>        go{false};
  std::vector<std::thread> callers;
  for (int i = 0; i < kCallers; ++i) {
    callers.emplace_back([&] {
      while (!go.load()) std::this_thread::yield();
      try {
        if (coordinator.CompleteIfPending(id)) completions.fetch_add(1);
        if (guard.Claim(id)) claims.fetch_add(1);
      } catch (const std::exception& e) {
        std::cerr << "caller failed: " << e.what() << "\n";
        errors.fetch_add(1);
      }
    });
  }
  go.store(true);
  for (auto& caller : callers) caller.join();

  assert(errors.load() == 0);
  assert(completions.load() == 1);
  assert(claims.load() == 1);
  assert(ledger.GetStatus(id) == keyshop::ledger::v1::INTENT_STATUS_PAID);
}

void VerifyRestartDurability(BackendFactory& backend, const Keys& k) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo     = backend.make_repository();
  auto identity = k.Id("durable") + "@keyshop.local";
  {
    auto tx = repo->Begin();
    assert(repo->UpsertPendingIntent(*tx, PendingTransactionRecord{.payment_id = k.Id("durable"), .owner_id = k.Owner(11), .amount_minor = 100,
                                                                   .currency = "RUB", .metadata_json = "{}", .created_at_ms = 1,
                                                                   .updated_at_ms = 1}));
    assert(repo->MarkPaid(*tx, k.Id("durable"), 2));
    assert(repo->InsertProcessedPayment(*tx, ProcessedPaymentRecord{k.Id("durable"), 3}));

    CredentialRecord credential;
    credential.owner_id        = k.Owner(11);
    credential.provider_host   = "de-1";
    credential.remote_uuid     = "uuid-d";
    credential.unique_identity = identity;
    credential.expires_at_ms   = 10;
    credential.created_at_ms   = 4;
    credential.updated_at_ms   = 4;
    assert(repo->InsertCredential(*tx, credential));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetPendingTransaction(*tx, k.Id("durable"))->status == IntentStatus::Paid);
  assert(!repo->InsertProcessedPayment(*tx, ProcessedPaymentRecord{k.Id("durable"), 5}));
  assert(repo->GetCredentialByIdentity(*tx, identity).has_value());
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if KEYSHOP_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("keyshop_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db   = std::make_shared<keyshop::db::sqlite::SqliteDB>(db_path);
    auto repo = std::make_shared<keyshop::db::sqlite::SqliteRepository>(std::move(db));
    repo->Bootstrap();
    return repo;
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() { std::filesystem::remove(db_path); },
      .supports_parallel_transactions = false,
  };
}
#endif

#if KEYSHOP_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("KEYSHOP_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("KEYSHOP_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<keyshop::db::postgres::PgPool>(conninfo);
    auto repo = std::make_shared<keyshop::db::postgres::PgRepository>(std::move(pool));
    repo->Bootstrap();
    return repo;
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  const int64_t now = NowMs();
  const Keys    keys{backend.name + "-" + std::to_string(now), (now % 1'000'000'000) * 100};

  VerifyPendingLedgerLifecycle(*repo, keys);
  VerifyLatestPendingOrdering(*repo, keys);
  VerifyClaimsAndOutcomes(*repo, keys);
  VerifyCredentialLifecycle(*repo, keys);
  VerifyAccountsAndLog(*repo, keys);
  VerifyPromoAndCommission(*repo, keys);
  VerifyPendingGifts(*repo, keys);
  VerifyRollbackBehavior(*repo, keys);
  VerifyConcurrentClaims(*repo, keys, backend.supports_parallel_transactions);
  VerifyConcurrentCompletionAndClaim(repo, keys);

  repo.reset();
  VerifyRestartDurability(backend, keys);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if KEYSHOP_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if KEYSHOP_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "keyshop_integration_repository_parity: pass\n";
  return 0;
}
