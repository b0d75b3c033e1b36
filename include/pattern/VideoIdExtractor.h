// ============================================================================
// VIDEO ID EXTRACTOR - Numeric video id from a partner-site URL
// ============================================================================
// Patterns are tried in order, first match wins:
//   adulttime.com/<anything>/<digits>   →  "<digits>"
// ============================================================================

#ifndef VIDEO_ID_EXTRACTOR_H
#define VIDEO_ID_EXTRACTOR_H

#include <optional>
#include <string>

namespace VideoIdExtractor {

std::optional<std::string> extractId(const std::string& url);

} // namespace VideoIdExtractor

#endif // VIDEO_ID_EXTRACTOR_H
