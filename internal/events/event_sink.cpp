#include "event_sink.hpp"

#include "internal/observability/logging.hpp"

namespace pagereg::events {

const char* EventKindName(EventKind kind) {
  switch (kind) {
    case EventKind::kPageCreated:
      return "page_created";
    case EventKind::kUpdateRequested:
      return "update_requested";
    case EventKind::kApprovalRecorded:
      return "approval_recorded";
    case EventKind::kUpdateExecuted:
      return "update_executed";
    case EventKind::kFeesWithdrawn:
      return "fees_withdrawn";
    case EventKind::kOwnershipChanged:
      return "ownership_changed";
    case EventKind::kTreasuryDistributed:
      return "treasury_distributed";
    case EventKind::kVoteChanged:
      return "vote_changed";
  }
  return "unknown";
}

void LoggingEventSink::Emit(const PageEvent& event) {
  using observability::StringField;
  using observability::UintField;

  if (event.has_request) {
    PAGEREG_LOG_INFO("page event", {StringField("event", EventKindName(event.kind)), UintField("page_id", event.page_id),
                                    UintField("request_id", event.request_id), StringField("principal", event.principal),
                                    UintField("amount", event.amount), StringField("detail", event.detail)});
    return;
  }
  PAGEREG_LOG_INFO("page event", {StringField("event", EventKindName(event.kind)), UintField("page_id", event.page_id),
                                  StringField("principal", event.principal), UintField("amount", event.amount),
                                  StringField("detail", event.detail)});
}

} // namespace pagereg::events
