#pragma once

#include <vector>

#include "internal/model/ownership.hpp"

namespace pagereg::model {

struct Payout {
  Principal recipient;
  Amount    amount = 0;
};

// Result of splitting a treasury balance. remainder is what stays behind
// unpaid (MultiSig integer division dust).
struct PayoutSplit {
  std::vector<Payout> payouts;
  Amount              remainder = 0;

  Amount Total() const {
    Amount total = 0;
    for (const auto& payout : payouts) total += payout.amount;
    return total;
  }
};

}  // namespace pagereg::model
