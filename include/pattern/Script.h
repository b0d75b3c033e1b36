// ============================================================================
// SCRIPT - Normalized timed-action script (funscript)
// ============================================================================
// On disk (cache terminal artifact):
//   {"version":"1.0","range":100,"inverted":false,
//    "metadata":{"title":...,"duration":...,...},
//    "actions":[{"pos":0,"at":120},{"pos":50,"at":480},...]}
//
// Invariants: actions sorted by `at` (stable), pos in [0,100].
// ============================================================================

#ifndef SCRIPT_H
#define SCRIPT_H

#include <cstdint>
#include <string>
#include <vector>
#include "core/Config.h"

struct ScriptAction {
  int pos = 0;        // 0-100
  int64_t at = 0;     // milliseconds from video start
};

struct ScriptMetadata {
  std::string title;
  std::string creator = SCRIPT_CREATOR;
  std::string description = SCRIPT_DESCRIPTION;
  int64_t durationMs = 0;
  std::string license = SCRIPT_LICENSE;
  std::string scriptUrl;
  std::string type = "basic";
  std::string videoUrl;
  std::string notes = SCRIPT_NOTES;
};

struct Script {
  std::string version = "1.0";
  int range = 100;
  bool inverted = false;
  ScriptMetadata metadata;
  std::vector<ScriptAction> actions;
};

#endif // SCRIPT_H
