#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace pagereg::db::model {

// Voters are stored separately (InsertApproval / ListApprovals).
struct UpdateRequestRecord {
  uint64_t    page_id    = 0;
  uint64_t    request_id = 0;
  std::string proposer;

  std::optional<std::string> content;
  std::optional<std::string> name;
  std::optional<std::string> thumbnail;

  bool     executed       = false;
  uint32_t approval_count = 0;

  uint64_t created_at_ms  = 0;
  uint64_t executed_at_ms = 0;
};

} // namespace pagereg::db::model
