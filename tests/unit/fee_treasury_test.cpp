#include "internal/treasury/fee_treasury.hpp"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>

#include "internal/treasury/entropy.hpp"
#include "internal/util/errors.hpp"

namespace {

using pagereg::model::OwnershipConfig;
using pagereg::model::OwnershipKind;
using pagereg::participants::ParticipantLedger;
using pagereg::treasury::BlockContext;
using pagereg::util::ErrorCode;

template <typename Exception, typename Fn>
ErrorCode ExpectError(Fn&& fn) {
  try {
    fn();
  } catch (const Exception& e) {
    return e.code();
  }
  assert(false && "expected an error");
  return ErrorCode::kInternal;
}

void TestCreditRejectsOverflow() {
  assert(pagereg::treasury::Credit(0, 0) == 0);
  assert(pagereg::treasury::Credit(10, 5) == 15);

  const auto max = std::numeric_limits<pagereg::model::Amount>::max();
  assert(pagereg::treasury::Credit(max - 1, 1) == max);
  assert(ExpectError<pagereg::util::InvalidArgument>([&] { (void)pagereg::treasury::Credit(max, 1); }) ==
         ErrorCode::kBalanceOverflow);
}

void TestWithdrawalCheckOrder() {
  auto permissionless = pagereg::policy::MakePolicy({OwnershipKind::kPermissionless, {}, 0});
  // The variant check wins over an empty balance.
  assert(ExpectError<pagereg::util::InvalidState>(
             [&] { (void)pagereg::treasury::PlanWithdrawal(*permissionless, 0, "anyone"); }) == ErrorCode::kNotWithdrawable);

  auto single = pagereg::policy::MakePolicy({OwnershipKind::kSingle, {"alice"}, 1});
  // Empty balance is reported even to a stranger.
  assert(ExpectError<pagereg::util::InvalidState>([&] { (void)pagereg::treasury::PlanWithdrawal(*single, 0, "mallory"); }) ==
         ErrorCode::kNothingToWithdraw);
  assert(ExpectError<pagereg::util::PermissionDenied>(
             [&] { (void)pagereg::treasury::PlanWithdrawal(*single, 10, "mallory"); }) == ErrorCode::kUnauthorized);

  const auto split = pagereg::treasury::PlanWithdrawal(*single, 10, "alice");
  assert(split.payouts.size() == 1);
  assert(split.payouts[0].recipient == "alice");
  assert(split.payouts[0].amount == 10);
}

void TestMultiSigWithdrawalByAnyOwner() {
  auto       multisig = pagereg::policy::MakePolicy({OwnershipKind::kMultiSig, {"a", "b", "c"}, 2});
  const auto split    = pagereg::treasury::PlanWithdrawal(*multisig, 100, "c");
  assert(split.payouts.size() == 3);
  assert(split.Total() == 99);
  assert(split.remainder == 1);
}

void TestDistributionCheckOrder() {
  const BlockContext context{7, "hash", 1000};
  ParticipantLedger  empty;
  ParticipantLedger  one({"p1"});

  auto single = pagereg::policy::MakePolicy({OwnershipKind::kSingle, {"alice"}, 1});
  assert(ExpectError<pagereg::util::InvalidState>(
             [&] { (void)pagereg::treasury::PlanDistribution(*single, 0, empty, context, "x"); }) == ErrorCode::kNotPermissionless);

  auto permissionless = pagereg::policy::MakePolicy({OwnershipKind::kPermissionless, {}, 0});
  assert(ExpectError<pagereg::util::InvalidState>([&] {
           (void)pagereg::treasury::PlanDistribution(*permissionless, 0, empty, context, "x");
         }) == ErrorCode::kNothingToDistribute);
  assert(ExpectError<pagereg::util::InvalidState>([&] {
           (void)pagereg::treasury::PlanDistribution(*permissionless, 5, empty, context, "x");
         }) == ErrorCode::kNoParticipants);

  const auto payout = pagereg::treasury::PlanDistribution(*permissionless, 5, one, context, "x");
  assert(payout.recipient == "p1");
  assert(payout.amount == 5);
}

void TestSelectionIsDeterministicForFixedInputs() {
  const BlockContext context{42, "0000abcd", 1'700'000'000'000ULL};

  const auto first  = pagereg::treasury::SelectParticipantIndex(context, "caller", 500, 10);
  const auto second = pagereg::treasury::SelectParticipantIndex(context, "caller", 500, 10);
  assert(first == second);
  assert(first < 10);

  // Every input takes part in the draw.
  std::set<std::size_t> seen;
  for (std::uint64_t ts = 0; ts < 64; ++ts) {
    seen.insert(pagereg::treasury::SelectParticipantIndex({42, "0000abcd", ts}, "caller", 500, 10));
  }
  assert(seen.size() > 1);

  assert(pagereg::treasury::SelectParticipantIndex(context, "caller", 500, 1) == 0);

  bool threw = false;
  try {
    (void)pagereg::treasury::SelectParticipantIndex(context, "caller", 500, 0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestFnvMatchesReferenceVectors() {
  assert(pagereg::treasury::Fnv1a64(std::string_view{}) == pagereg::treasury::kFnvOffsetBasis);
  assert(pagereg::treasury::Fnv1a64(std::string_view{"a"}) == 0xaf63dc4c8601ec8cULL);
  assert(pagereg::treasury::Fnv1a64(std::string_view{"foobar"}) == 0x85944171f73967e8ULL);
}

void TestEnvironments() {
  pagereg::treasury::FixedEnvironment fixed({1, "h", 2});
  assert(fixed.Current().height == 1);
  fixed.Set({9, "z", 3});
  const auto context = fixed.Current();
  assert(context.height == 9);
  assert(context.previous_hash == "z");
  assert(context.timestamp_ms == 3);

  pagereg::treasury::SystemEnvironment system;
  const auto                           a = system.Current();
  const auto                           b = system.Current();
  assert(b.height == a.height + 1);
  assert(a.previous_hash == "genesis");
  assert(b.previous_hash != a.previous_hash);
  assert(b.previous_hash.size() == 16);
}

} // namespace

int main() {
  TestCreditRejectsOverflow();
  TestWithdrawalCheckOrder();
  TestMultiSigWithdrawalByAnyOwner();
  TestDistributionCheckOrder();
  TestSelectionIsDeterministicForFixedInputs();
  TestFnvMatchesReferenceVectors();
  TestEnvironments();

  std::cout << "pagereg_unit_fee_treasury: pass\n";
  return 0;
}
