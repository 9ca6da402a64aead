#include <cassert>
#include <iostream>
#include <memory>

#include "internal/fulfillment/balance_payments.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using keyshop::db::memory::MemoryRepository;
using keyshop::fulfillment::BalancePayments;
using namespace keyshop::testing;

namespace v1 = keyshop::ledger::v1;

void SeedBalance(MemoryRepository& repo, int64_t owner_id, int64_t balance_minor) {
  auto tx = repo.Begin();
  assert(repo.AdjustBalance(*tx, owner_id, balance_minor));
  tx->Commit();
}

int64_t Balance(MemoryRepository& repo, int64_t owner_id) {
  auto tx      = repo.Begin();
  auto account = repo.GetAccount(*tx, owner_id);
  tx->Commit();
  return account ? account->balance_minor : 0;
}

std::shared_ptr<BalancePayments> MakePayments(FulfillmentHarness& h) {
  return std::make_shared<BalancePayments>(h.repository, h.guard, h.orchestrator, h.settings, FastRetry());
}

void TestDebitThenFulfill() {
  FulfillmentHarness h;
  SeedBalance(*h.repository, 42, 50000);
  auto payments = MakePayments(h);

  auto report = payments->Pay(NewKeyOrder("b1", 42, "300.00", ""));
  assert(report.result() == v1::FULFILLMENT_RESULT_FULFILLED);
  assert(Balance(*h.repository, 42) == 20000);
  assert(h.provisioning->Requests().size() == 1);

  // same id again: claimed already, nothing is debited twice
  auto again = payments->Pay(NewKeyOrder("b1", 42, "300.00", "balance"));
  assert(again.result() == v1::FULFILLMENT_RESULT_DUPLICATE);
  assert(Balance(*h.repository, 42) == 20000);
}

void TestInsufficientFundsLeavesIdUnclaimed() {
  FulfillmentHarness h;
  SeedBalance(*h.repository, 42, 10000);
  auto payments = MakePayments(h);

  auto report = payments->Pay(NewKeyOrder("b2", 42, "300.00", "balance"));
  assert(report.result() == v1::FULFILLMENT_RESULT_INSUFFICIENT_FUNDS);
  assert(report.error_code() == "insufficient_funds");
  assert(Balance(*h.repository, 42) == 10000);
  assert(h.provisioning->Requests().empty());

  // the payer tops up and retries the same order
  SeedBalance(*h.repository, 42, 20000);
  assert(payments->Pay(NewKeyOrder("b2", 42, "300.00", "balance")).result() == v1::FULFILLMENT_RESULT_FULFILLED);
  assert(Balance(*h.repository, 42) == 0);

  // no account at all
  assert(payments->Pay(NewKeyOrder("b3", 77, "1.00", "balance")).result() == v1::FULFILLMENT_RESULT_INSUFFICIENT_FUNDS);
}

void TestProvisioningFailureRefundsBalance() {
  FulfillmentHarness h;
  SeedBalance(*h.repository, 42, 50000);
  auto payments = MakePayments(h);

  h.provisioning->FailNext("403 Forbidden");
  auto report = payments->Pay(NewKeyOrder("b4", 42, "300.00", "balance"));
  assert(report.result() == v1::FULFILLMENT_RESULT_PROVISIONING_FAILED);
  assert(report.error_code() == "unauthorized");
  assert(Balance(*h.repository, 42) == 50000);

  auto tx  = h.repository->Begin();
  auto log = h.repository->ListPaymentLogForOwner(*tx, 42);
  tx->Commit();
  assert(log.size() == 1);
  assert(log[0].action == "refund");
  assert(log[0].status == "refunded");

  assert(h.notifications->Payer()[0].second.find("returned to your balance") != std::string::npos);
}

void TestRejectsNonBalanceOrders() {
  FulfillmentHarness h;
  auto               payments = MakePayments(h);

  bool threw = false;
  try {
    (void)payments->Pay(TopUpOrder("b5", 42, "100.00", "balance"));
  } catch (const keyshop::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)payments->Pay(NewKeyOrder("b6", 42, "100.00", "yookassa"));
  } catch (const keyshop::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  // rejected orders never consumed their id
  assert(h.guard->Claim("b5"));
  assert(h.guard->Claim("b6"));
}

} // namespace

int main() {
  TestDebitThenFulfill();
  TestInsufficientFundsLeavesIdUnclaimed();
  TestProvisioningFailureRefundsBalance();
  TestRejectsNonBalanceOrders();

  std::cout << "keyshop_unit_balance_payments: pass\n";
  return 0;
}
