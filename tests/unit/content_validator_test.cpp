#include "internal/content/content_validator.hpp"

#include <cassert>
#include <iostream>

#include "config/config.pb.h"

namespace {

void TestDefaultMarkers() {
  pagereg::content::MarkerContentValidator validator;

  assert(validator.IsValidContent("<html><body>hi</body></html>"));
  assert(validator.IsValidContent("<html></html>"));
  assert(!validator.IsValidContent(""));
  assert(!validator.IsValidContent("plain text"));
  assert(!validator.IsValidContent("<html>no closing tag"));
  assert(!validator.IsValidContent("leading junk <html></html>"));
}

void TestContentSizeLimit() {
  pagereg::content::ContentRules rules;
  rules.max_bytes = 16;
  pagereg::content::MarkerContentValidator validator(rules);

  assert(validator.IsValidContent("<html>ab</html>"));
  assert(!validator.IsValidContent("<html>abcdef</html>"));
}

void TestThumbnailPrefixes() {
  pagereg::content::MarkerContentValidator validator;

  assert(validator.IsValidThumbnail("ipfs://Qm123"));
  assert(validator.IsValidThumbnail("https://example.org/a.png"));
  assert(!validator.IsValidThumbnail("ipfs://"));
  assert(!validator.IsValidThumbnail("http://example.org/a.png"));
  assert(!validator.IsValidThumbnail(""));
}

void TestRulesFromConfig() {
  pagereg::runtime::config::ContentConfig config;
  auto defaults = pagereg::content::RulesFromConfig(config);
  assert(defaults.prefix == "<html");
  assert(defaults.suffix == "</html>");
  assert(defaults.thumbnail_prefixes.size() == 2);

  config.set_prefix("{");
  config.set_suffix("}");
  config.set_max_bytes(64);
  config.add_thumbnail_prefixes("ar://");

  pagereg::content::MarkerContentValidator validator(pagereg::content::RulesFromConfig(config));
  assert(validator.IsValidContent("{\"a\":1}"));
  assert(!validator.IsValidContent("<html></html>"));
  assert(validator.IsValidThumbnail("ar://tx"));
  assert(!validator.IsValidThumbnail("ipfs://Qm123"));
}

} // namespace

int main() {
  TestDefaultMarkers();
  TestContentSizeLimit();
  TestThumbnailPrefixes();
  TestRulesFromConfig();

  std::cout << "pagereg_unit_content_validator: pass\n";
  return 0;
}
