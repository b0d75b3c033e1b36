// ============================================================================
// SCRIPT SAMPLER - Script intensity at a playback position
// ============================================================================
// Linear interpolation between neighbouring actions, normalized to [0,1].
// Before the first action: first pos. After the last: last pos.
// ============================================================================

#ifndef SCRIPT_SAMPLER_H
#define SCRIPT_SAMPLER_H

#include <cstdint>
#include <optional>
#include "pattern/Script.h"

namespace ScriptSampler {

/** @return nullopt for a script without actions */
std::optional<float> intensityAt(const Script& script, int64_t timeMs);

} // namespace ScriptSampler

#endif // SCRIPT_SAMPLER_H
