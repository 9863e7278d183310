#include "participant_ledger.hpp"

#include <stdexcept>
#include <string>

namespace pagereg::participants {

ParticipantLedger::ParticipantLedger(std::vector<model::Principal> ordered) {
  ordered_.reserve(ordered.size());
  for (auto& principal : ordered) {
    if (index_.insert(principal).second) {
      ordered_.push_back(std::move(principal));
    }
  }
}

bool ParticipantLedger::Record(const model::Principal& principal) {
  if (!index_.insert(principal).second) {
    return false;
  }
  ordered_.push_back(principal);
  return true;
}

bool ParticipantLedger::Contains(const model::Principal& principal) const {
  return index_.contains(principal);
}

const model::Principal& ParticipantLedger::At(std::size_t index) const {
  if (index >= ordered_.size()) {
    throw std::out_of_range("participant index " + std::to_string(index) + " out of range");
  }
  return ordered_[index];
}

} // namespace pagereg::participants
