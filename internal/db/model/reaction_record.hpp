#pragma once

#include <cstdint>
#include <string>

namespace pagereg::db::model {

struct ReactionRecord {
  uint64_t    page_id = 0;
  std::string principal;
  bool        liked    = false;
  bool        disliked = false;
};

} // namespace pagereg::db::model
