#include "entropy.hpp"

#include <cstdio>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace pagereg::treasury {

namespace {

std::string Hex64(std::uint64_t value) {
  char buffer[17];
  std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(value));
  return buffer;
}

} // namespace

std::uint64_t Fnv1a64(std::string_view data, std::uint64_t seed) {
  std::uint64_t hash = seed;
  for (const unsigned char byte : data) {
    hash ^= byte;
    hash *= kFnvPrime;
  }
  return hash;
}

std::uint64_t Fnv1a64(std::uint64_t value, std::uint64_t seed) {
  std::uint64_t hash = seed;
  for (int i = 0; i < 8; ++i) {
    hash ^= (value >> (i * 8)) & 0xFF;
    hash *= kFnvPrime;
  }
  return hash;
}

BlockContext SystemEnvironment::Current() {
  std::lock_guard<std::mutex> lock(mutex_);

  BlockContext context;
  context.height        = ++height_;
  context.timestamp_ms  = util::NowMs();
  context.previous_hash = last_hash_;

  last_hash_ = Hex64(Fnv1a64(context.timestamp_ms, Fnv1a64(context.height, Fnv1a64(last_hash_))));
  return context;
}

std::size_t SelectParticipantIndex(const BlockContext& context, const model::Principal& caller, model::Amount balance,
                                   std::size_t count) {
  if (count == 0) {
    throw std::invalid_argument("participant count must be non-zero");
  }

  std::uint64_t hash = Fnv1a64(context.previous_hash);
  hash               = Fnv1a64(context.timestamp_ms, hash);
  hash               = Fnv1a64(caller, hash);
  hash               = Fnv1a64(balance, hash);
  hash               = Fnv1a64(static_cast<std::uint64_t>(count), hash);
  return static_cast<std::size_t>(hash % count);
}

} // namespace pagereg::treasury
