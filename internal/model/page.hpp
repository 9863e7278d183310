#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>

#include "internal/model/ownership.hpp"
#include "internal/model/state_machine.hpp"

namespace pagereg::model {

struct Page {
  PageId      id = 0;
  std::string name;
  std::string thumbnail;
  std::string content;

  // Once set the page rejects every update submission.
  bool   immutable  = false;
  Amount update_fee = 0;

  OwnershipConfig ownership;

  Amount balance = 0;
  // MultiSig division remainder left behind by withdrawals. Never paid out.
  Amount retained_remainder = 0;

  RequestId next_request_id = 0;

  std::uint64_t likes    = 0;
  std::uint64_t dislikes = 0;

  std::uint64_t created_at_ms = 0;
  std::uint64_t updated_at_ms = 0;
};

// Each field is independently optional. An empty string counts as absent.
struct ProposedFields {
  std::optional<std::string> content;
  std::optional<std::string> name;
  std::optional<std::string> thumbnail;

  bool HasContent() const {
    return content.has_value() && !content->empty();
  }
  bool HasName() const {
    return name.has_value() && !name->empty();
  }
  bool HasThumbnail() const {
    return thumbnail.has_value() && !thumbnail->empty();
  }
  bool Empty() const {
    return !HasContent() && !HasName() && !HasThumbnail();
  }
};

struct UpdateRequest {
  PageId         page_id    = 0;
  RequestId      request_id = 0;
  Principal      proposer;
  ProposedFields proposed;

  RequestState state          = RequestState::kPending;
  std::uint32_t approval_count = 0;
  std::unordered_set<Principal> voters;

  std::uint64_t created_at_ms  = 0;
  std::uint64_t executed_at_ms = 0;

  bool executed() const {
    return state == RequestState::kExecuted;
  }
};

enum class ReactionKind : std::uint8_t {
  kLike    = 1,
  kDislike = 2,
};

// Per page, per principal. liked and disliked are mutually exclusive.
struct VoteRecord {
  PageId    page_id = 0;
  Principal principal;
  bool      liked    = false;
  bool      disliked = false;
};

}  // namespace pagereg::model
