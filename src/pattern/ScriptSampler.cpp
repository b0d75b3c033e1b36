// ============================================================================
// SCRIPT SAMPLER IMPLEMENTATION
// ============================================================================

#include "pattern/ScriptSampler.h"
#include <algorithm>
#include <iterator>

namespace ScriptSampler {

std::optional<float> intensityAt(const Script& script, int64_t timeMs) {
  const auto& actions = script.actions;
  if (actions.empty()) return std::nullopt;

  auto toUnit = [&script](double pos) {
    float range = script.range > 0 ? static_cast<float>(script.range) : 100.0f;
    return std::clamp(static_cast<float>(pos) / range, 0.0f, 1.0f);
  };

  if (timeMs <= actions.front().at) return toUnit(actions.front().pos);
  if (timeMs >= actions.back().at) return toUnit(actions.back().pos);

  // First action strictly after timeMs; its predecessor is at or before
  auto next = std::upper_bound(actions.begin(), actions.end(), timeMs,
                               [](int64_t t, const ScriptAction& a) { return t < a.at; });
  auto prev = std::prev(next);

  int64_t span = next->at - prev->at;
  if (span <= 0) return toUnit(next->pos);

  double fraction = static_cast<double>(timeMs - prev->at) / static_cast<double>(span);
  double pos = prev->pos + (next->pos - prev->pos) * fraction;
  return toUnit(pos);
}

} // namespace ScriptSampler
