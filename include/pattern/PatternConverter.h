// ============================================================================
// PATTERN CONVERTER - Vendor pattern data → Script
// ============================================================================
// Descriptor: {"code": 0, "data": {"pattern": "<body url>"}}  (code 0 = available,
//             missing code = unavailable)
// Body:       [{"t": <ms>, "v": <percent>}, ...]
//
// Conversion per raw action:
//   t == 0            → skipped (sentinel)
//   pos = v == 0 ? 0 : v × 6.25, at = t, both rounded half-up: floor(x + 0.5)
//   pos clamped to [0,100] before the integer cast
//   |t| > 2^53 or non-finite → body rejected
// then a stable sort by `at`.
// ============================================================================

#ifndef PATTERN_CONVERTER_H
#define PATTERN_CONVERTER_H

#include <cstdint>
#include <string>
#include <vector>
#include "pattern/Script.h"

constexpr int DESCRIPTOR_CODE_MISSING = -1;

struct PatternDescriptor {
  int code = DESCRIPTOR_CODE_MISSING;
  std::string patternUrl;   // empty when absent
};

struct RawPatternAction {
  double t = 0.0;
  double v = 0.0;
};

namespace PatternConverter {

/** floor(x + 0.5), saturated to ±2^53 */
int64_t roundHalfUp(double x);

/** Finite and within ±2^53 ms */
bool isValidTimestamp(double t);

/** Raw percent → script position (0 stays 0, else v × 6.25, rounded, clamped) */
int positionFromPercent(double v);

bool parseDescriptor(const std::string& body, PatternDescriptor& out, std::string& errorMsg);

bool parseBody(const std::string& body, std::vector<RawPatternAction>& out, std::string& errorMsg);

/** Convert + stable sort */
std::vector<ScriptAction> convertActions(const std::vector<RawPatternAction>& raw);

Script buildScript(const std::vector<RawPatternAction>& raw, const std::string& title, int64_t durationMs);

} // namespace PatternConverter

#endif // PATTERN_CONVERTER_H
