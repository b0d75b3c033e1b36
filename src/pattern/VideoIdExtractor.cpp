// ============================================================================
// VIDEO ID EXTRACTOR IMPLEMENTATION
// ============================================================================

#include "pattern/VideoIdExtractor.h"
#include <array>
#include <regex>

namespace {

const std::array<std::regex, 13>& sitePatterns() {
  static const std::array<std::regex, 13> patterns = {
    std::regex(R"(adulttime\.com/.*?/([0-9]+))"),
    std::regex(R"(members\.adulttime\.com/.*?/([0-9]+))"),
    std::regex(R"(switch\.com/.*?/([0-9]+))"),
    std::regex(R"(howwomenorgasm\.com/.*?/([0-9]+))"),
    std::regex(R"(getupclose\.com/.*?/([0-9]+))"),
    std::regex(R"(milfoverload\.net/.*?/([0-9]+))"),
    std::regex(R"(dareweshare\.net/.*?/([0-9]+))"),
    std::regex(R"(jerkbuddies\.com/.*?/([0-9]+))"),
    std::regex(R"(adulttime\.studio/.*?/([0-9]+))"),
    std::regex(R"(oopsie\.tube/.*?/([0-9]+))"),
    std::regex(R"(adulttimepilots\.com/.*?/([0-9]+))"),
    std::regex(R"(kissmefuckme\.net/.*?/([0-9]+))"),
    std::regex(R"(youngerloverofmine\.com/.*?/([0-9]+))"),
  };
  return patterns;
}

} // namespace

namespace VideoIdExtractor {

std::optional<std::string> extractId(const std::string& url) {
  std::smatch match;
  for (const auto& pattern : sitePatterns()) {
    if (std::regex_search(url, match, pattern)) {
      return match[1].str();
    }
  }
  return std::nullopt;
}

} // namespace VideoIdExtractor
