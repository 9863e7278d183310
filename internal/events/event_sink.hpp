#pragma once

#include <cstdint>
#include <string>

#include "internal/model/ownership.hpp"

namespace pagereg::events {

enum class EventKind : std::uint8_t {
  kPageCreated,
  kUpdateRequested,
  kApprovalRecorded,
  kUpdateExecuted,
  kFeesWithdrawn,
  kOwnershipChanged,
  kTreasuryDistributed,
  kVoteChanged,
};

const char* EventKindName(EventKind kind);

struct PageEvent {
  EventKind        kind       = EventKind::kPageCreated;
  model::PageId    page_id    = 0;
  model::RequestId request_id = 0;
  bool             has_request = false;
  model::Principal principal;
  model::Amount    amount = 0;
  // Free-form extra facts, e.g. the new ownership kind or the reaction.
  std::string detail;
};

/*
  Side-channel notifications. Emitted only after the operation committed;
  a sink must not call back into the registry and cannot affect the outcome.
*/
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Emit(const PageEvent& event) = 0;
};

class LoggingEventSink final : public EventSink {
 public:
  void Emit(const PageEvent& event) override;
};

} // namespace pagereg::events
