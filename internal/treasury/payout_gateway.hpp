#pragma once

#include <string>
#include <utility>
#include <vector>

#include "internal/model/payout.hpp"

namespace pagereg::treasury {

struct TransferOutcome {
  bool        accepted = false;
  std::string reason;

  static TransferOutcome Accepted() {
    return {true, {}};
  }

  static TransferOutcome Rejected(std::string why) {
    return {false, std::move(why)};
  }
};

/*
  External value-transfer collaborator.

  A batch is all-or-nothing: either every payout in it is delivered or none
  is. The registry calls Transfer() with its transaction still open and
  commits only when the batch was accepted.
*/
class PayoutGateway {
 public:
  virtual ~PayoutGateway() = default;

  virtual TransferOutcome Transfer(const std::vector<model::Payout>& batch) = 0;
};

} // namespace pagereg::treasury
