/**
 * ============================================================================
 * PlaybackEventDispatcher.h - Companion Event Decoding & Routing
 * ============================================================================
 *
 * Text frames from the browser companion are decoded once into a tagged
 * PlaybackEvent, then routed with a single switch:
 *
 *   {"type":"play"}                               → CommandRouter::onPlay
 *   {"type":"pause"}                              → CommandRouter::onPause
 *   {"type":"scene_change","intensity":"high"}    → CommandRouter::onSceneChange
 *   {"type":"test","intensity":"low"}             → CommandRouter::onSceneChange
 *   {"type":"audio_level","level":0.7}            → CommandRouter::onAudioLevel
 *   {"type":"time_update","timestamp":12345}      → sampled script intensity
 *   {"type":"load_script","video_id":"123"}       → PatternCache::resolve
 *   {"type":"load_script","url":"https://..."}    → PatternCache::resolveUrl
 *   {"type":"clear_script"}                       → drop active script
 *   {"type":"get_script","video_id":"123"}        → PatternCache::loadCached
 *   {"type":"connect"} / {"type":"scan"}          → DeviceLinkClient
 *   {"type":"status"}                             → StatusReport
 *
 * Every handled frame yields a JSON reply for the sender.
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include "pattern/Script.h"

class CommandRouter;
class DeviceLinkClient;
class PatternCache;

// ============================================================================
// EVENT TYPES
// ============================================================================

enum class PlaybackEventType {
    EVENT_PLAY,
    EVENT_PAUSE,
    EVENT_SCENE_CHANGE,
    EVENT_AUDIO_LEVEL,
    EVENT_TEST,
    EVENT_TIME_UPDATE,
    EVENT_LOAD_SCRIPT,
    EVENT_CLEAR_SCRIPT,
    EVENT_GET_SCRIPT,
    EVENT_CONNECT,
    EVENT_SCAN,
    EVENT_STATUS,
    EVENT_UNKNOWN
};

struct PlaybackEvent {
    PlaybackEventType type = PlaybackEventType::EVENT_UNKNOWN;
    std::string typeName;

    std::string intensity = "medium";   // scene_change / test
    float level = 0.0f;                 // audio_level
    int64_t timestampMs = 0;            // time_update

    // load_script / get_script
    std::string videoId;
    std::string url;
    std::string title;
    int64_t durationMs = 0;
};

// ============================================================================
// DISPATCHER CLASS
// ============================================================================

class PlaybackEventDispatcher {
public:
    PlaybackEventDispatcher(CommandRouter& router, DeviceLinkClient& link, PatternCache& cache);

    /**
     * Decode a companion frame
     * @return false for malformed JSON or a frame without "type"
     */
    static bool decode(const std::string& json, PlaybackEvent& out, std::string& errorMsg);

    /** Decode + dispatch, returns the JSON reply */
    std::string handleFrame(const std::string& json);

    /** Route one decoded event, returns the JSON reply */
    std::string dispatch(const PlaybackEvent& event);

    bool hasActiveScript() const;
    std::string activeVideoId() const;

private:
    CommandRouter& _router;
    DeviceLinkClient& _link;
    PatternCache& _cache;

    mutable std::mutex _scriptMutex;
    bool _scriptActive = false;
    Script _activeScript;
    std::string _activeVideoId;

    std::string handleTimeUpdate(const PlaybackEvent& event);
    std::string handleLoadScript(const PlaybackEvent& event);
    std::string handleGetScript(const PlaybackEvent& event);
    std::string handleConnect();
};
