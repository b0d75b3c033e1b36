// ============================================================================
// PATTERN CONVERTER IMPLEMENTATION
// ============================================================================

#include "pattern/PatternConverter.h"
#include "core/logger/Logger.h"
#include <ArduinoJson.h>
#include <algorithm>
#include <cmath>

namespace PatternConverter {

// Largest magnitude a double holds as an exact integer (2^53)
constexpr double MAX_EXACT_TIMESTAMP = 9007199254740992.0;

bool isValidTimestamp(double t) {
  return std::isfinite(t) && std::fabs(t) <= MAX_EXACT_TIMESTAMP;
}

int64_t roundHalfUp(double x) {
  double rounded = std::floor(x + 0.5);
  if (!(rounded > -MAX_EXACT_TIMESTAMP)) return static_cast<int64_t>(-MAX_EXACT_TIMESTAMP);
  if (!(rounded < MAX_EXACT_TIMESTAMP)) return static_cast<int64_t>(MAX_EXACT_TIMESTAMP);
  return static_cast<int64_t>(rounded);
}

int positionFromPercent(double v) {
  if (v == 0.0) return 0;
  // Clamp before the integer cast
  double pos = std::floor(v * PATTERN_POSITION_FACTOR + 0.5);
  if (!(pos > 0.0)) return 0;
  if (pos >= 100.0) return 100;
  return static_cast<int>(pos);
}

// ============================================================================
// PARSING
// ============================================================================

bool parseDescriptor(const std::string& body, PatternDescriptor& out, std::string& errorMsg) {
  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, body);
  if (err) {
    errorMsg = std::string("Descriptor is not valid JSON: ") + err.c_str();
    return false;
  }
  if (!doc.is<JsonObjectConst>()) {
    errorMsg = "Descriptor is not an object";
    return false;
  }

  // A missing or non-integer code means "no content", not a corrupt descriptor
  PatternDescriptor descriptor;
  descriptor.code = doc["code"].is<int>() ? doc["code"].as<int>() : DESCRIPTOR_CODE_MISSING;
  descriptor.patternUrl = doc["data"]["pattern"] | "";
  out = descriptor;
  return true;
}

bool parseBody(const std::string& body, std::vector<RawPatternAction>& out, std::string& errorMsg) {
  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, body);
  if (err) {
    errorMsg = std::string("Pattern body is not valid JSON: ") + err.c_str();
    return false;
  }

  JsonArrayConst list = doc.as<JsonArrayConst>();
  if (list.isNull()) {
    errorMsg = "Pattern body is not an array";
    return false;
  }

  std::vector<RawPatternAction> actions;
  actions.reserve(list.size());
  for (JsonVariantConst item : list) {
    if (!item.is<JsonObjectConst>()) {
      errorMsg = "Pattern action is not an object";
      return false;
    }
    JsonVariantConst t = item["t"];
    JsonVariantConst v = item["v"];
    if ((!t.isNull() && !t.is<double>()) || (!v.isNull() && !v.is<double>())) {
      errorMsg = "Pattern action has non-numeric t/v";
      return false;
    }
    // Missing t or v counts as 0
    RawPatternAction action{t | 0.0, v | 0.0};
    if (!isValidTimestamp(action.t)) {
      errorMsg = "Pattern action timestamp out of range";
      return false;
    }
    actions.push_back(action);
  }

  out = std::move(actions);
  return true;
}

// ============================================================================
// CONVERSION
// ============================================================================

std::vector<ScriptAction> convertActions(const std::vector<RawPatternAction>& raw) {
  std::vector<ScriptAction> actions;
  actions.reserve(raw.size());

  for (const auto& action : raw) {
    if (action.t == 0.0) continue;  // Sentinel / invalid timestamp
    actions.push_back(ScriptAction{positionFromPercent(action.v), roundHalfUp(action.t)});
  }

  std::stable_sort(actions.begin(), actions.end(),
                   [](const ScriptAction& a, const ScriptAction& b) { return a.at < b.at; });
  return actions;
}

Script buildScript(const std::vector<RawPatternAction>& raw, const std::string& title, int64_t durationMs) {
  Script script;
  script.metadata.title = title;
  script.metadata.durationMs = durationMs;
  script.actions = convertActions(raw);

  Log.info("🔁 Converted " + std::to_string(script.actions.size()) + " actions to funscript");
  return script;
}

} // namespace PatternConverter
