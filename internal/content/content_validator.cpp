#include "content_validator.hpp"

#include <utility>

#include "config/config.pb.h"

namespace pagereg::content {

MarkerContentValidator::MarkerContentValidator(ContentRules rules) : rules_(std::move(rules)) {
}

bool MarkerContentValidator::IsValidContent(std::string_view content) const {
  if (content.empty()) {
    return false;
  }
  if (rules_.max_bytes > 0 && content.size() > rules_.max_bytes) {
    return false;
  }
  // A single marker occurrence cannot serve as both prefix and suffix.
  if (content.size() < rules_.prefix.size() + rules_.suffix.size()) {
    return false;
  }
  return content.starts_with(rules_.prefix) && content.ends_with(rules_.suffix);
}

bool MarkerContentValidator::IsValidThumbnail(std::string_view thumbnail) const {
  for (const auto& prefix : rules_.thumbnail_prefixes) {
    if (thumbnail.size() > prefix.size() && thumbnail.starts_with(prefix)) {
      return true;
    }
  }
  return false;
}

ContentRules RulesFromConfig(const pagereg::runtime::config::ContentConfig& config) {
  ContentRules rules;
  if (!config.prefix().empty()) {
    rules.prefix = config.prefix();
  }
  if (!config.suffix().empty()) {
    rules.suffix = config.suffix();
  }
  rules.max_bytes = config.max_bytes();
  if (config.thumbnail_prefixes_size() > 0) {
    rules.thumbnail_prefixes.assign(config.thumbnail_prefixes().begin(), config.thumbnail_prefixes().end());
  }
  return rules;
}

} // namespace pagereg::content
