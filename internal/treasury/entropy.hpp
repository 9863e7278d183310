#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "internal/model/ownership.hpp"

namespace pagereg::treasury {

// What the surrounding environment exposes to an operation in flight.
struct BlockContext {
  std::uint64_t height = 0;
  std::string   previous_hash;
  std::uint64_t timestamp_ms = 0;
};

class Environment {
 public:
  virtual ~Environment() = default;

  // Called once per operation that needs it.
  virtual BlockContext Current() = 0;
};

// Height advances per call; the previous hash chains over the prior height and
// timestamp; the timestamp is wall clock.
class SystemEnvironment final : public Environment {
 public:
  BlockContext Current() override;

 private:
  std::mutex    mutex_;
  std::uint64_t height_ = 0;
  std::string   last_hash_{"genesis"};
};

// Returns whatever it was last given. Tests steer the selection with it.
class FixedEnvironment final : public Environment {
 public:
  explicit FixedEnvironment(BlockContext context = {}) : context_(std::move(context)) {
  }

  BlockContext Current() override {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_;
  }

  void Set(BlockContext context) {
    std::lock_guard<std::mutex> lock(mutex_);
    context_ = std::move(context);
  }

 private:
  std::mutex   mutex_;
  BlockContext context_;
};

inline constexpr std::uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
inline constexpr std::uint64_t kFnvPrime       = 1099511628211ULL;

std::uint64_t Fnv1a64(std::string_view data, std::uint64_t seed = kFnvOffsetBasis);
std::uint64_t Fnv1a64(std::uint64_t value, std::uint64_t seed);

/*
  Picks the distribution winner.

  WARNING: not secure. Every input is visible to, and most are chosen by,
  whoever drives the environment. A block producer can bias the outcome.

  count must be non-zero.
*/
std::size_t SelectParticipantIndex(const BlockContext& context, const model::Principal& caller, model::Amount balance,
                                   std::size_t count);

} // namespace pagereg::treasury
