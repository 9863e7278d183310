#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pagereg::runtime::config {
class ContentConfig;
}

namespace pagereg::content {

/*
  Stateless format predicates for page content and thumbnails.

  The registry only asks yes/no; it never inspects content itself.
*/
class ContentValidator {
 public:
  virtual ~ContentValidator() = default;

  virtual bool IsValidContent(std::string_view content) const = 0;

  virtual bool IsValidThumbnail(std::string_view thumbnail) const = 0;
};

struct ContentRules {
  std::string              prefix{"<html"};
  std::string              suffix{"</html>"};
  std::uint64_t            max_bytes = 0;  // 0 = unlimited
  std::vector<std::string> thumbnail_prefixes{"ipfs://", "https://"};
};

// Content must start/end with fixed markers; thumbnails must start with one of
// the allowed prefixes.
class MarkerContentValidator final : public ContentValidator {
 public:
  explicit MarkerContentValidator(ContentRules rules = {});

  bool IsValidContent(std::string_view content) const override;
  bool IsValidThumbnail(std::string_view thumbnail) const override;

  const ContentRules& Rules() const {
    return rules_;
  }

 private:
  ContentRules rules_;
};

// Empty config fields keep the defaults.
ContentRules RulesFromConfig(const pagereg::runtime::config::ContentConfig& config);

} // namespace pagereg::content
