#include <cassert>
#include <functional>
#include <iostream>
#include <string>

#include "internal/fulfillment/orchestrator.hpp"
#include "internal/ledger/order_metadata.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using keyshop::ledger::v1::OrderMetadata;
using namespace keyshop::testing;

bool RejectsWith(const std::function<void(OrderMetadata&)>& mutate) {
  auto metadata = NewKeyOrder("pay-1", 42);
  mutate(metadata);
  try {
    keyshop::ledger::ValidateMetadata(metadata);
  } catch (const keyshop::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestValidationRejectsIncompleteOrders() {
  keyshop::ledger::ValidateMetadata(NewKeyOrder("pay-1", 42));
  keyshop::ledger::ValidateMetadata(TopUpOrder("pay-2", 42));

  assert(RejectsWith([](OrderMetadata& m) { m.clear_payment_id(); }));
  assert(RejectsWith([](OrderMetadata& m) { m.set_owner_id(0); }));
  assert(RejectsWith([](OrderMetadata& m) { m.set_amount("0"); }));
  assert(RejectsWith([](OrderMetadata& m) { m.set_amount("three hundred"); }));
  assert(RejectsWith([](OrderMetadata& m) { m.clear_order(); }));
  assert(RejectsWith([](OrderMetadata& m) { m.mutable_new_key()->mutable_plan()->set_months(0); }));
  assert(RejectsWith([](OrderMetadata& m) { m.set_promo_discount("10%"); }));
  assert(RejectsWith([](OrderMetadata& m) { m = ExtendOrder("pay-1", 42, 0); }));
}

void TestJsonCodecKeepsOrderKind() {
  auto metadata = GiftOrder("pay-gift", 7, "@friend");
  metadata.set_promo_code("SPRING");
  metadata.mutable_notify()->set_chat_id(700);

  const auto json = keyshop::ledger::EncodeMetadata(metadata);
  assert(json.find("\"gift_key\"") != std::string::npos);
  assert(json.find("\"payment_id\"") != std::string::npos);

  auto decoded = keyshop::ledger::DecodeMetadata(json);
  assert(decoded.has_gift_key());
  assert(decoded.gift_key().recipient_handle() == "@friend");
  assert(decoded.promo_code() == "SPRING");
  assert(decoded.notify().chat_id() == 700);

  // unknown fields written by a newer producer are tolerated
  auto tolerant = keyshop::ledger::DecodeMetadata(R"({"payment_id":"p","owner_id":"5","top_up":{},"future_field":1})");
  assert(tolerant.has_top_up());
  assert(tolerant.owner_id() == 5);

  bool threw = false;
  try {
    (void)keyshop::ledger::DecodeMetadata("not json");
  } catch (const keyshop::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestPlanHelpers() {
  assert(std::string(keyshop::ledger::ActionName(NewKeyOrder("a", 1))) == "new");
  assert(std::string(keyshop::ledger::ActionName(ExtendOrder("b", 1, 3))) == "extend");
  assert(std::string(keyshop::ledger::ActionName(GiftOrder("c", 1))) == "gift");
  assert(std::string(keyshop::ledger::ActionName(TopUpOrder("d", 1))) == "top_up");

  assert(keyshop::ledger::PlanOf(TopUpOrder("d", 1)) == nullptr);
  assert(keyshop::ledger::AmountMinor(NewKeyOrder("a", 1, "150.5")) == 15050);

  auto plan = MonthlyPlan();
  plan.set_months(3);
  assert(keyshop::fulfillment::ResolveDays(plan, 30) == 90);
  plan.set_duration_days(7);
  assert(keyshop::fulfillment::ResolveDays(plan, 30) == 7);
}

void TestIdentityDerivation() {
  assert(keyshop::fulfillment::DeriveIdentity(42, "a1b2-c3d4-e5f6-7890-ABCD", "keyshop.local") == "u42-7890abcd@keyshop.local");
  assert(keyshop::fulfillment::DeriveIdentity(42, "p1", "keyshop.local") == "u42-p1@keyshop.local");
  assert(keyshop::fulfillment::DeriveGiftIdentity("@Alice", "pay-1234ABCD", "keyshop.local") == "alice-gift-1234abcd@keyshop.local");
  assert(keyshop::fulfillment::DeriveGiftIdentity("@@", "pay-1234ABCD", "keyshop.local") == "gift-gift-1234abcd@keyshop.local");
}

} // namespace

int main() {
  TestValidationRejectsIncompleteOrders();
  TestJsonCodecKeepsOrderKind();
  TestPlanHelpers();
  TestIdentityDerivation();

  std::cout << "keyshop_unit_order_metadata: pass\n";
  return 0;
}
