#include "account_ledger.hpp"

#include <limits>

#include "internal/observability/logging.hpp"

namespace pagereg::treasury {

AccountLedger::AccountLedger(const std::vector<std::string>& rejected_accounts)
    : rejected_(rejected_accounts.begin(), rejected_accounts.end()) {
}

TransferOutcome AccountLedger::Transfer(const std::vector<model::Payout>& batch) {
  std::lock_guard<std::mutex> lock(mutex_);

  // Validate the whole batch before touching any balance.
  std::unordered_map<model::Principal, model::Amount> pending;
  for (const auto& payout : batch) {
    if (rejected_.contains(payout.recipient)) {
      PAGEREG_LOG_WARN("payout refused", {observability::StringField("recipient", payout.recipient),
                                          observability::UintField("amount", payout.amount)});
      return TransferOutcome::Rejected("account " + payout.recipient + " refuses transfers");
    }

    auto& sum = pending[payout.recipient];
    if (sum > std::numeric_limits<model::Amount>::max() - payout.amount) {
      return TransferOutcome::Rejected("transfer to " + payout.recipient + " overflows");
    }
    sum += payout.amount;

    const auto current = balances_.contains(payout.recipient) ? balances_.at(payout.recipient) : 0;
    if (current > std::numeric_limits<model::Amount>::max() - sum) {
      return TransferOutcome::Rejected("account " + payout.recipient + " balance overflows");
    }
  }

  for (const auto& [recipient, amount] : pending) {
    balances_[recipient] += amount;
  }
  return TransferOutcome::Accepted();
}

model::Amount AccountLedger::Balance(const model::Principal& account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto                  it = balances_.find(account);
  return it == balances_.end() ? 0 : it->second;
}

void AccountLedger::Reject(const model::Principal& account) {
  std::lock_guard<std::mutex> lock(mutex_);
  rejected_.insert(account);
}

void AccountLedger::Accept(const model::Principal& account) {
  std::lock_guard<std::mutex> lock(mutex_);
  rejected_.erase(account);
}

} // namespace pagereg::treasury
