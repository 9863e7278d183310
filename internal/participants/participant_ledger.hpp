#pragma once

#include <cstddef>
#include <unordered_set>
#include <vector>

#include "internal/model/ownership.hpp"

namespace pagereg::participants {

/*
  Principals that ever submitted an update to a permissionless page.

  Insertion ordered, deduplicated, append only. Index order is what the
  treasury distribution draws from.
*/
class ParticipantLedger {
 public:
  ParticipantLedger() = default;
  explicit ParticipantLedger(std::vector<model::Principal> ordered);

  // Returns false if the principal was already recorded.
  bool Record(const model::Principal& principal);

  bool Contains(const model::Principal& principal) const;

  const model::Principal& At(std::size_t index) const;

  std::size_t Size() const {
    return ordered_.size();
  }
  bool Empty() const {
    return ordered_.empty();
  }

  const std::vector<model::Principal>& Entries() const {
    return ordered_;
  }

 private:
  std::vector<model::Principal>        ordered_;
  std::unordered_set<model::Principal> index_;
};

} // namespace pagereg::participants
