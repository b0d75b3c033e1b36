/**
 * ============================================================================
 * PlaybackEventDispatcher.cpp - Companion Event Routing Implementation
 * ============================================================================
 */

#include "communication/PlaybackEventDispatcher.h"
#include "communication/StatusReport.h"
#include "link/DeviceLinkClient.h"
#include "pattern/PatternCache.h"
#include "pattern/ScriptCodec.h"
#include "pattern/ScriptSampler.h"
#include "router/CommandRouter.h"
#include "core/logger/Logger.h"
#include <ArduinoJson.h>
#include <cstring>

using enum PlaybackEventType;

namespace {

struct EventName {
    const char* name;
    PlaybackEventType type;
};

constexpr EventName EVENT_NAMES[] = {
    {"play", EVENT_PLAY},
    {"pause", EVENT_PAUSE},
    {"scene_change", EVENT_SCENE_CHANGE},
    {"audio_level", EVENT_AUDIO_LEVEL},
    {"test", EVENT_TEST},
    {"time_update", EVENT_TIME_UPDATE},
    {"load_script", EVENT_LOAD_SCRIPT},
    {"clear_script", EVENT_CLEAR_SCRIPT},
    {"get_script", EVENT_GET_SCRIPT},
    {"connect", EVENT_CONNECT},
    {"scan", EVENT_SCAN},
    {"status", EVENT_STATUS},
};

std::string okReply() {
    return R"({"status":"ok"})";
}

std::string errorReply(const std::string& error) {
    JsonDocument doc;
    doc["status"] = "error";
    doc["error"] = error;
    std::string out;
    serializeJson(doc, out);
    return out;
}

} // namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

PlaybackEventDispatcher::PlaybackEventDispatcher(CommandRouter& router, DeviceLinkClient& link, PatternCache& cache)
    : _router(router), _link(link), _cache(cache) {}

// ============================================================================
// DECODE
// ============================================================================

bool PlaybackEventDispatcher::decode(const std::string& json, PlaybackEvent& out, std::string& errorMsg) {
    JsonDocument doc;
    DeserializationError error = deserializeJson(doc, json);
    if (error) {
        errorMsg = std::string("Invalid JSON: ") + error.c_str();
        return false;
    }

    const char* type = doc["type"];
    if (!type) {
        errorMsg = "Event without 'type' field";
        return false;
    }

    PlaybackEvent event;
    event.typeName = type;
    for (const auto& entry : EVENT_NAMES) {
        if (strcmp(type, entry.name) == 0) {
            event.type = entry.type;
            break;
        }
    }

    event.intensity = doc["intensity"] | "medium";
    event.level = doc["level"] | 0.0f;
    event.timestampMs = doc["timestamp"] | static_cast<int64_t>(0);
    event.videoId = doc["video_id"] | "";
    event.url = doc["url"] | "";
    event.title = doc["title"] | "";
    event.durationMs = doc["duration"] | static_cast<int64_t>(0);

    out = std::move(event);
    return true;
}

// ============================================================================
// MAIN EVENT ROUTER
// ============================================================================

std::string PlaybackEventDispatcher::handleFrame(const std::string& json) {
    PlaybackEvent event;
    std::string errorMsg;
    if (!decode(json, event, errorMsg)) {
        Log.warn("⚠️ Companion frame dropped: " + errorMsg);
        return errorReply(errorMsg);
    }
    return dispatch(event);
}

std::string PlaybackEventDispatcher::dispatch(const PlaybackEvent& event) {
    switch (event.type) {
        case EVENT_PLAY:
            _router.onPlay();
            return okReply();

        case EVENT_PAUSE:
            _router.onPause();
            return okReply();

        case EVENT_SCENE_CHANGE:
            _router.onSceneChange(event.intensity);
            return okReply();

        case EVENT_TEST:
            _router.onSceneChange(event.intensity);
            Log.info("🧪 Test command sent with intensity: " + event.intensity);
            return okReply();

        case EVENT_AUDIO_LEVEL:
            _router.onAudioLevel(event.level);
            return okReply();

        case EVENT_TIME_UPDATE:
            return handleTimeUpdate(event);

        case EVENT_LOAD_SCRIPT:
            return handleLoadScript(event);

        case EVENT_CLEAR_SCRIPT: {
            std::lock_guard<std::mutex> lock(_scriptMutex);
            _scriptActive = false;
            _activeScript = Script();
            _activeVideoId.clear();
            Log.info("🗑️ Active script cleared");
            return okReply();
        }

        case EVENT_GET_SCRIPT:
            return handleGetScript(event);

        case EVENT_CONNECT:
            return handleConnect();

        case EVENT_SCAN:
            if (!_link.isReady()) return errorReply("Not connected to device server");
            _link.scanDevices();
            return okReply();

        case EVENT_STATUS:
            return StatusReport::build(_link, hasActiveScript(), activeVideoId());

        case EVENT_UNKNOWN:
            break;
    }

    Log.warn("⚠️ Unknown event type: " + event.typeName);
    return errorReply("Unknown event type: " + event.typeName);
}

// ============================================================================
// HANDLERS
// ============================================================================

std::string PlaybackEventDispatcher::handleTimeUpdate(const PlaybackEvent& event) {
    std::optional<float> intensity;
    {
        std::lock_guard<std::mutex> lock(_scriptMutex);
        if (_scriptActive) {
            intensity = ScriptSampler::intensityAt(_activeScript, event.timestampMs);
        }
    }

    // No script loaded: time updates carry no intensity
    if (intensity) {
        _router.onScriptIntensity(*intensity);
    }
    return okReply();
}

std::string PlaybackEventDispatcher::handleLoadScript(const PlaybackEvent& event) {
    ResolveResult result;
    if (!event.videoId.empty()) {
        result = _cache.resolve(event.videoId, event.title, event.durationMs);
    } else if (!event.url.empty()) {
        result = _cache.resolveUrl(event.url, event.title, event.durationMs);
    } else {
        return errorReply("Missing video_id or url");
    }

    JsonDocument doc;
    if (!result.videoId.empty()) doc["video_id"] = result.videoId;
    doc["result"] = PatternCache::statusName(result.status);

    if (result.ok()) {
        doc["status"] = "ok";
        doc["actions"] = result.script.actions.size();
        doc["cached"] = result.fromCache;

        std::lock_guard<std::mutex> lock(_scriptMutex);
        _activeScript = std::move(result.script);
        _activeVideoId = result.videoId;
        _scriptActive = true;
        Log.info("📜 Script active for video ID " + _activeVideoId + " (" +
                 std::to_string(_activeScript.actions.size()) + " actions)");
    } else {
        doc["status"] = "error";
        doc["error"] = result.status == ResolveStatus::RESOLVE_NOT_FOUND
                           ? std::string("No interactive content available for this video")
                           : result.message;
    }

    std::string out;
    serializeJson(doc, out);
    return out;
}

// Cached funscript only, never downloads
std::string PlaybackEventDispatcher::handleGetScript(const PlaybackEvent& event) {
    std::string videoId = event.videoId;
    if (videoId.empty() && !event.url.empty()) {
        videoId = PatternCache::extractId(event.url).value_or("");
    }
    if (videoId.empty()) return errorReply("Missing video_id or url");

    ResolveResult result = _cache.loadCached(videoId);

    JsonDocument doc;
    doc["video_id"] = videoId;
    doc["result"] = PatternCache::statusName(result.status);
    if (result.ok()) {
        doc["status"] = "ok";
        doc["script"] = serialized(ScriptCodec::serialize(result.script));
    } else {
        doc["status"] = "error";
        doc["error"] = result.message;
    }

    std::string out;
    serializeJson(doc, out);
    return out;
}

std::string PlaybackEventDispatcher::handleConnect() {
    if (_link.isReady()) {
        Log.info("Already connected to device server");
        return R"({"status":"connected"})";
    }

    if (!_link.connect()) {
        return errorReply("Could not connect to device server");
    }
    _link.scanDevices();
    return R"({"status":"connected"})";
}

// ============================================================================
// ACCESSORS
// ============================================================================

bool PlaybackEventDispatcher::hasActiveScript() const {
    std::lock_guard<std::mutex> lock(_scriptMutex);
    return _scriptActive;
}

std::string PlaybackEventDispatcher::activeVideoId() const {
    std::lock_guard<std::mutex> lock(_scriptMutex);
    return _activeVideoId;
}
