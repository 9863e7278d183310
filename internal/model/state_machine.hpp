#pragma once

#include <cstdint>

namespace pagereg::model {

enum class RequestState : std::uint8_t {
  kPending  = 0,
  kExecuted = 1,
};

constexpr bool IsTerminal(RequestState state) {
  return state == RequestState::kExecuted;
}

constexpr bool CanTransition(RequestState from, RequestState to) {
  if (from == to) {
    return !IsTerminal(from);
  }
  if (IsTerminal(from)) {
    return false;
  }
  return to == RequestState::kExecuted;
}

}  // namespace pagereg::model
