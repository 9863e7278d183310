#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/treasury/payout_gateway.hpp"

namespace pagereg::treasury {

/*
  In-process PayoutGateway. Credits recipient accounts and refuses batches
  that name a rejected account or would overflow a recipient balance.
*/
class AccountLedger final : public PayoutGateway {
 public:
  AccountLedger() = default;
  explicit AccountLedger(const std::vector<std::string>& rejected_accounts);

  TransferOutcome Transfer(const std::vector<model::Payout>& batch) override;

  model::Amount Balance(const model::Principal& account) const;

  void Reject(const model::Principal& account);
  void Accept(const model::Principal& account);

 private:
  mutable std::mutex                                        mutex_;
  std::unordered_set<model::Principal>                      rejected_;
  std::unordered_map<model::Principal, model::Amount>       balances_;
};

} // namespace pagereg::treasury
