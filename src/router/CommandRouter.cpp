// ============================================================================
// COMMAND ROUTER IMPLEMENTATION
// ============================================================================

#include "router/CommandRouter.h"
#include "link/DeviceLinkClient.h"
#include "core/logger/Logger.h"
#include <algorithm>
#include <array>

namespace {

struct SceneLevel {
  const char* label;
  float strength;
};

constexpr std::array<SceneLevel, 4> SCENE_LEVELS = {{
  {"low", 0.3f},
  {"medium", 0.6f},
  {"high", 0.9f},
  {"climax", 1.0f},
}};

} // namespace

CommandRouter::CommandRouter(DeviceLinkClient& link, float intensityScale)
  : _link(link),
    _intensityScale(intensityScale) {}

// ============================================================================
// EVENTS
// ============================================================================

void CommandRouter::onPlay() {
  Log.info("▶️ Video started playing");
  broadcastStrength(PLAY_BASE_STRENGTH * _intensityScale);
}

void CommandRouter::onPause() {
  Log.info("⏸️ Video paused");
  broadcastStrength(0.0f);
}

void CommandRouter::onSceneChange(const std::string& label) {
  float strength = sceneStrength(label) * _intensityScale;
  Log.info("🎬 Scene change: " + label + " -> strength " + std::to_string(strength));
  broadcastStrength(strength);
}

void CommandRouter::onAudioLevel(float level) {
  float strength = std::min(level * AUDIO_LEVEL_GAIN * _intensityScale, 1.0f);
  broadcastStrength(strength);
}

void CommandRouter::onScriptIntensity(float intensity) {
  broadcastStrength(std::min(intensity * _intensityScale, 1.0f));
}

float CommandRouter::sceneStrength(const std::string& label) {
  for (const auto& level : SCENE_LEVELS) {
    if (label == level.label) return level.strength;
  }
  return UNKNOWN_SCENE_STRENGTH;
}

// ============================================================================
// FAN-OUT
// ============================================================================

size_t CommandRouter::broadcastStrength(float strength) {
  strength = (strength >= 0.0f) ? std::min(strength, 1.0f) : 0.0f;  // NaN → 0

  // Snapshot first: registry changes during fan-out must not affect this pass
  const std::vector<int> ids = _link.deviceIds();
  for (int id : ids) {
    _link.vibrate(id, strength);
  }
  return ids.size();
}
