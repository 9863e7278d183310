#include "internal/registry/page_registry.hpp"

#include <atomic>
#include <cassert>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/treasury/account_ledger.hpp"
#include "internal/util/errors.hpp"

namespace {

using pagereg::model::OwnershipKind;
using pagereg::model::ProposedFields;
using pagereg::util::ErrorCode;

pagereg::registry::NewPage MakeNewPage(pagereg::model::OwnershipConfig ownership, pagereg::model::Amount fee) {
  pagereg::registry::NewPage page;
  page.name       = "atomic";
  page.thumbnail  = "https://thumb";
  page.content    = "<html>a</html>";
  page.ownership  = std::move(ownership);
  page.update_fee = fee;
  return page;
}

ProposedFields Content(const std::string& content) {
  ProposedFields proposed;
  proposed.content = content;
  return proposed;
}

std::shared_ptr<pagereg::registry::PageRegistry> MakeRegistry(std::shared_ptr<pagereg::treasury::PayoutGateway> gateway) {
  return std::make_shared<pagereg::registry::PageRegistry>(
      std::make_shared<pagereg::db::memory::MemoryRepository>(), std::make_shared<pagereg::content::MarkerContentValidator>(),
      std::move(gateway), std::make_shared<pagereg::treasury::FixedEnvironment>());
}

// Calls back into the registry from inside the payout, the way a hostile
// recipient would.
class ReentrantGateway final : public pagereg::treasury::PayoutGateway {
 public:
  pagereg::treasury::TransferOutcome Transfer(const std::vector<pagereg::model::Payout>& batch) override {
    calls++;
    try {
      (void)registry->WithdrawPageFees(page_id, batch.front().recipient);
      reentered = true;
    } catch (const pagereg::util::InvalidState& e) {
      refused_with = e.code();
    }
    try {
      observed_balance = registry->GetBalance(page_id);
    } catch (const pagereg::util::InvalidState& e) {
      read_refused_with = e.code();
    }
    return pagereg::treasury::TransferOutcome::Accepted();
  }

  std::shared_ptr<pagereg::registry::PageRegistry> registry;
  pagereg::model::PageId                           page_id = 0;
  int                                              calls   = 0;
  bool                                             reentered = false;
  ErrorCode                                        refused_with      = ErrorCode::kInternal;
  ErrorCode                                        read_refused_with = ErrorCode::kInternal;
  pagereg::model::Amount                           observed_balance  = 0;
};

void TestRejectedPayoutRollsBackWithdrawal() {
  auto ledger   = std::make_shared<pagereg::treasury::AccountLedger>();
  auto registry = MakeRegistry(ledger);

  const auto page_id = registry->CreatePage(MakeNewPage({OwnershipKind::kMultiSig, {"a", "b", "c"}, 1}, 0), "a");
  (void)registry->RequestUpdate(page_id, Content("<html>b</html>"), 1001, "payer");

  ledger->Reject("b");
  bool threw = false;
  try {
    (void)registry->WithdrawPageFees(page_id, "a");
  } catch (const pagereg::util::TransferFailed& e) {
    threw = e.code() == ErrorCode::kTransferFailed;
  }
  assert(threw);

  const auto info = registry->GetPageInfo(page_id);
  assert(info.balance == 1001);
  assert(info.retained_remainder == 0);
  assert(ledger->Balance("a") == 0);
  assert(ledger->Balance("c") == 0);

  ledger->Accept("b");
  const auto split = registry->WithdrawPageFees(page_id, "a");
  assert(split.Total() == 999);
  assert(registry->GetPageInfo(page_id).retained_remainder == 2);
  assert(ledger->Balance("b") == 333);
}

void TestRejectedPayoutRollsBackDistribution() {
  auto ledger   = std::make_shared<pagereg::treasury::AccountLedger>();
  auto registry = MakeRegistry(ledger);

  const auto page_id = registry->CreatePage(MakeNewPage({OwnershipKind::kPermissionless, {}, 0}, 3), "x");
  (void)registry->RequestUpdate(page_id, Content("<html>b</html>"), 3, "only");

  ledger->Reject("only");
  bool threw = false;
  try {
    (void)registry->DistributePageTreasury(page_id, "x");
  } catch (const pagereg::util::TransferFailed&) {
    threw = true;
  }
  assert(threw);
  assert(registry->GetBalance(page_id) == 3);
  assert(registry->GetParticipants(page_id).size() == 1);

  ledger->Accept("only");
  assert(registry->DistributePageTreasury(page_id, "x").recipient == "only");
  assert(registry->GetBalance(page_id) == 0);
  assert(ledger->Balance("only") == 3);
}

void TestGatewayCannotReenter() {
  auto gateway  = std::make_shared<ReentrantGateway>();
  auto registry = MakeRegistry(gateway);
  gateway->registry = registry;

  const auto page_id = registry->CreatePage(MakeNewPage({OwnershipKind::kSingle, {"owner"}, 1}, 50), "owner");
  gateway->page_id   = page_id;
  (void)registry->RequestUpdate(page_id, Content("<html>b</html>"), 50, "payer");

  const auto split = registry->WithdrawPageFees(page_id, "owner");
  assert(split.Total() == 50);
  assert(gateway->calls == 1);
  assert(!gateway->reentered);
  assert(gateway->refused_with == ErrorCode::kReentrantCall);
  assert(gateway->read_refused_with == ErrorCode::kReentrantCall);
  assert(registry->GetBalance(page_id) == 0);

  // The registry is usable again once the operation finished.
  assert(registry->GetPageCount() == 1);
  gateway->registry.reset();
}

void TestConcurrentSubmissionsAreSerialized() {
  auto ledger   = std::make_shared<pagereg::treasury::AccountLedger>();
  auto registry = MakeRegistry(ledger);

  const auto page_id = registry->CreatePage(MakeNewPage({OwnershipKind::kPermissionless, {}, 0}, 1), "x");

  constexpr int            kThreads    = 8;
  constexpr int            kPerThread  = 25;
  std::atomic<int>         failures{0};
  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      const auto caller = "user-" + std::to_string(t);
      for (int i = 0; i < kPerThread; ++i) {
        try {
          (void)registry->RequestUpdate(page_id, Content("<html>" + caller + "</html>"), 2, caller);
        } catch (const std::exception&) {
          failures++;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  assert(failures.load() == 0);
  assert(registry->GetBalance(page_id) == 2ULL * kThreads * kPerThread);
  assert(registry->GetParticipants(page_id).size() == kThreads);
}

} // namespace

int main() {
  TestRejectedPayoutRollsBackWithdrawal();
  TestRejectedPayoutRollsBackDistribution();
  TestGatewayCannotReenter();
  TestConcurrentSubmissionsAreSerialized();

  std::cout << "pagereg_unit_page_registry_atomicity: pass\n";
  return 0;
}
