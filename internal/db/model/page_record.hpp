#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pagereg::db::model {

/*
  Persistent page row.

  IMPORTANT:
  - ownership_kind holds the pagereg::model::OwnershipKind wire value.
  - owners keep their configured order; MultiSig payouts follow it.
  - next_request_id only ever grows.
*/

struct PageRecord {
  uint64_t    id = 0;
  std::string name;
  std::string thumbnail;
  std::string content;

  bool     immutable  = false;
  uint64_t update_fee = 0;

  int                      ownership_kind = 0;
  std::vector<std::string> owners;
  uint32_t                 threshold = 0;

  uint64_t balance            = 0;
  uint64_t retained_remainder = 0;
  uint64_t next_request_id    = 0;

  uint64_t likes    = 0;
  uint64_t dislikes = 0;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

}
