// ============================================================================
// COMMAND ROUTER - Playback events → per-device vibrate commands
// ============================================================================
// Stateless apart from the fixed intensity scale. Each event computes one
// strength, clamps it to [0,1] and sends it to every device in a snapshot
// of the registry taken at call time (ascending id order).
//
//   onPlay()            0.2 × scale
//   onPause()           0.0
//   onSceneChange(lbl)  {low 0.3, medium 0.6, high 0.9, climax 1.0, else 0.5} × scale
//   onAudioLevel(lvl)   min(lvl × 0.8 × scale, 1.0)
//   onScriptIntensity(i) min(i × scale, 1.0)      (sampled funscript position)
// ============================================================================

#ifndef COMMAND_ROUTER_H
#define COMMAND_ROUTER_H

#include <string>
#include "core/Config.h"

class DeviceLinkClient;

class CommandRouter {
public:
  explicit CommandRouter(DeviceLinkClient& link, float intensityScale = DEFAULT_INTENSITY_SCALE);

  void onPlay();
  void onPause();
  void onSceneChange(const std::string& label);
  void onAudioLevel(float level);
  void onScriptIntensity(float intensity);

  /** Base strength for a scene label (unknown → UNKNOWN_SCENE_STRENGTH) */
  static float sceneStrength(const std::string& label);

private:
  DeviceLinkClient& _link;
  const float _intensityScale;

  /** @return number of devices addressed */
  size_t broadcastStrength(float strength);
};

#endif // COMMAND_ROUTER_H
