// ============================================================================
// SCRIPT CODEC IMPLEMENTATION
// ============================================================================

#include "pattern/ScriptCodec.h"
#include <ArduinoJson.h>

namespace ScriptCodec {

std::string serialize(const Script& script) {
  JsonDocument doc;
  doc["version"] = script.version;
  doc["range"] = script.range;
  doc["inverted"] = script.inverted;

  JsonObject meta = doc["metadata"].to<JsonObject>();
  meta["bookmarks"].to<JsonObject>();
  meta["chapters"].to<JsonObject>();
  meta["performers"].to<JsonObject>();
  meta["tags"].to<JsonObject>();
  meta["title"] = script.metadata.title;
  meta["creator"] = script.metadata.creator;
  meta["description"] = script.metadata.description;
  meta["duration"] = script.metadata.durationMs;
  meta["license"] = script.metadata.license;
  meta["script_url"] = script.metadata.scriptUrl;
  meta["type"] = script.metadata.type;
  meta["video_url"] = script.metadata.videoUrl;
  meta["notes"] = script.metadata.notes;

  JsonArray actions = doc["actions"].to<JsonArray>();
  for (const auto& action : script.actions) {
    JsonObject item = actions.add<JsonObject>();
    item["pos"] = action.pos;
    item["at"] = action.at;
  }

  std::string out;
  serializeJson(doc, out);
  return out;
}

bool parse(const std::string& json, Script& out, std::string& errorMsg) {
  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, json);
  if (err) {
    errorMsg = std::string("Script is not valid JSON: ") + err.c_str();
    return false;
  }

  JsonVariantConst root = doc.as<JsonVariantConst>();
  JsonArrayConst actions = root["actions"].as<JsonArrayConst>();
  if (actions.isNull()) {
    errorMsg = "Script has no \"actions\" array";
    return false;
  }

  Script script;
  script.version = root["version"] | "1.0";
  script.range = root["range"] | 100;
  script.inverted = root["inverted"] | false;

  JsonVariantConst meta = root["metadata"];
  script.metadata.title = meta["title"] | "";
  script.metadata.creator = meta["creator"] | SCRIPT_CREATOR;
  script.metadata.description = meta["description"] | SCRIPT_DESCRIPTION;
  script.metadata.durationMs = meta["duration"] | static_cast<int64_t>(0);
  script.metadata.license = meta["license"] | SCRIPT_LICENSE;
  script.metadata.scriptUrl = meta["script_url"] | "";
  script.metadata.type = meta["type"] | "basic";
  script.metadata.videoUrl = meta["video_url"] | "";
  script.metadata.notes = meta["notes"] | SCRIPT_NOTES;

  script.actions.reserve(actions.size());
  for (JsonVariantConst item : actions) {
    if (!item["pos"].is<int>() || !item["at"].is<int64_t>()) {
      errorMsg = "Script action without integer pos/at";
      return false;
    }
    int pos = item["pos"].as<int>();
    if (pos < 0 || pos > 100) {
      errorMsg = "Script action pos out of range: " + std::to_string(pos);
      return false;
    }
    script.actions.push_back(ScriptAction{pos, item["at"].as<int64_t>()});
  }

  out = std::move(script);
  return true;
}

} // namespace ScriptCodec
