#include "ownership_policy.hpp"

#include <algorithm>
#include <string>

#include "internal/util/errors.hpp"

namespace pagereg::policy {

using model::Amount;
using model::OwnershipConfig;
using model::OwnershipKind;
using model::PayoutSplit;
using model::Principal;
using util::ErrorCode;

namespace {

class SinglePolicy final : public OwnershipPolicy {
 public:
  explicit SinglePolicy(OwnershipConfig config) : OwnershipPolicy(std::move(config)) {
  }

  OwnershipKind Kind() const override {
    return OwnershipKind::kSingle;
  }

  bool IsAuthorized(const Principal& principal) const override {
    return principal == config_.owners.front();
  }

  std::uint32_t RequiredApprovals() const override {
    return 1;
  }

  PayoutSplit PayoutShares(Amount balance) const override {
    PayoutSplit split;
    split.payouts.push_back({config_.owners.front(), balance});
    return split;
  }

  bool AllowsTransition() const override {
    return true;
  }
};

class MultiSigPolicy final : public OwnershipPolicy {
 public:
  explicit MultiSigPolicy(OwnershipConfig config) : OwnershipPolicy(std::move(config)) {
  }

  OwnershipKind Kind() const override {
    return OwnershipKind::kMultiSig;
  }

  bool IsAuthorized(const Principal& principal) const override {
    return std::find(config_.owners.begin(), config_.owners.end(), principal) != config_.owners.end();
  }

  std::uint32_t RequiredApprovals() const override {
    return config_.threshold;
  }

  // Every listed owner entry gets balance / n. The remainder is not paid to
  // anyone; it stays with the page.
  PayoutSplit PayoutShares(Amount balance) const override {
    const Amount count = static_cast<Amount>(config_.owners.size());
    const Amount share = balance / count;

    PayoutSplit split;
    split.remainder = balance % count;
    if (share == 0) {
      split.remainder = balance;
      return split;
    }
    split.payouts.reserve(config_.owners.size());
    for (const auto& owner : config_.owners) {
      split.payouts.push_back({owner, share});
    }
    return split;
  }

  bool AllowsTransition() const override {
    return false;
  }
};

class PermissionlessPolicy final : public OwnershipPolicy {
 public:
  explicit PermissionlessPolicy(OwnershipConfig config) : OwnershipPolicy(std::move(config)) {
  }

  OwnershipKind Kind() const override {
    return OwnershipKind::kPermissionless;
  }

  bool IsAuthorized(const Principal&) const override {
    return true;
  }

  std::uint32_t RequiredApprovals() const override {
    return 0;
  }

  PayoutSplit PayoutShares(Amount) const override {
    throw util::InvalidState(ErrorCode::kNotWithdrawable, "permissionless page fees can only leave through distribution");
  }

  bool AllowsTransition() const override {
    return false;
  }
};

[[noreturn]] void ThrowInvalidConfig(const OwnershipConfig& config, const std::string& why) {
  throw util::InvalidArgument(ErrorCode::kInvalidConfig, std::string("invalid ") + model::OwnershipKindName(config.kind) +
                                                            " ownership config: " + why);
}

} // namespace

void ValidateNew(const OwnershipConfig& config) {
  const auto owner_count = config.owners.size();

  switch (config.kind) {
    case OwnershipKind::kSingle:
      if (owner_count != 1) ThrowInvalidConfig(config, "exactly one owner required");
      if (config.threshold != 1) ThrowInvalidConfig(config, "threshold must be 1");
      break;

    case OwnershipKind::kMultiSig:
      if (owner_count == 0) ThrowInvalidConfig(config, "at least one owner required");
      if (config.threshold == 0 || config.threshold > owner_count) {
        ThrowInvalidConfig(config, "threshold must be in [1, " + std::to_string(owner_count) + "]");
      }
      break;

    case OwnershipKind::kPermissionless:
      if (owner_count != 0) ThrowInvalidConfig(config, "owners must be empty");
      if (config.threshold != 0) ThrowInvalidConfig(config, "threshold must be 0");
      break;

    default:
      throw util::InvalidArgument(ErrorCode::kInvalidVariant,
                                  "unknown ownership kind " + std::to_string(static_cast<int>(config.kind)));
  }

  for (const auto& owner : config.owners) {
    if (owner.empty()) ThrowInvalidConfig(config, "owner address must not be empty");
  }
}

std::unique_ptr<OwnershipPolicy> MakePolicy(OwnershipConfig config) {
  ValidateNew(config);

  switch (config.kind) {
    case OwnershipKind::kSingle:
      return std::make_unique<SinglePolicy>(std::move(config));
    case OwnershipKind::kMultiSig:
      return std::make_unique<MultiSigPolicy>(std::move(config));
    case OwnershipKind::kPermissionless:
    default:
      return std::make_unique<PermissionlessPolicy>(std::move(config));
  }
}

std::unique_ptr<OwnershipPolicy> Transition(const OwnershipPolicy& current, OwnershipConfig next) {
  if (!current.AllowsTransition()) {
    throw util::InvalidState(ErrorCode::kTransitionNotAllowed,
                             std::string("ownership of a ") + model::OwnershipKindName(current.Kind()) + " page cannot change");
  }
  // The previous owners and threshold are dropped entirely; nothing carries over.
  return MakePolicy(std::move(next));
}

} // namespace pagereg::policy
