#include "internal/treasury/account_ledger.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

namespace {

using pagereg::model::Payout;

void TestTransferCreditsEveryRecipient() {
  pagereg::treasury::AccountLedger ledger;

  const auto outcome = ledger.Transfer({{"a", 10}, {"b", 20}, {"a", 5}});
  assert(outcome.accepted);
  assert(ledger.Balance("a") == 15);
  assert(ledger.Balance("b") == 20);
  assert(ledger.Balance("nobody") == 0);
}

void TestRejectedAccountFailsWholeBatch() {
  pagereg::treasury::AccountLedger ledger(std::vector<std::string>{"blocked"});

  const auto outcome = ledger.Transfer({{"a", 10}, {"blocked", 20}});
  assert(!outcome.accepted);
  assert(!outcome.reason.empty());
  assert(ledger.Balance("a") == 0);
  assert(ledger.Balance("blocked") == 0);

  ledger.Accept("blocked");
  assert(ledger.Transfer({{"blocked", 20}}).accepted);
  assert(ledger.Balance("blocked") == 20);

  ledger.Reject("a");
  assert(!ledger.Transfer({{"a", 1}}).accepted);
}

void TestOverflowingBalanceIsRefused() {
  pagereg::treasury::AccountLedger ledger;
  const auto                       max = std::numeric_limits<pagereg::model::Amount>::max();

  assert(ledger.Transfer({{"a", max}}).accepted);
  assert(!ledger.Transfer({{"b", 1}, {"a", 1}}).accepted);
  assert(ledger.Balance("a") == max);
  assert(ledger.Balance("b") == 0);

  assert(!ledger.Transfer({{"c", max}, {"c", 1}}).accepted);
  assert(ledger.Balance("c") == 0);
}

void TestEmptyBatchIsAccepted() {
  pagereg::treasury::AccountLedger ledger;
  assert(ledger.Transfer(std::vector<Payout>{}).accepted);
}

} // namespace

int main() {
  TestTransferCreditsEveryRecipient();
  TestRejectedAccountFailsWholeBatch();
  TestOverflowingBalanceIsRefused();
  TestEmptyBatchIsAccepted();

  std::cout << "pagereg_unit_account_ledger: pass\n";
  return 0;
}
