#include "MqttRouter.h"

#include <algorithm>
#include <ctype.h>
#include <errno.h>
#include <stdlib.h>

#include "Log.h"

static const char* TOPIC_GLOBAL_CONFIG_ROOT = MEDIADECK_TOPIC_ROOT "/config";
static const char* TOPIC_ALL_CMD            = MEDIADECK_TOPIC_ROOT "/all/cmd";

// ---------- Helpers -------------------------------------------------

static std::string toLowerCopy(const std::string& in) {
    std::string s = in;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(tolower(c)); });
    return s;
}

static std::string trimCopy(const std::string& in) {
    size_t b = 0;
    size_t e = in.size();
    while (b < e && isspace(static_cast<unsigned char>(in[b]))) ++b;
    while (e > b && isspace(static_cast<unsigned char>(in[e - 1]))) --e;
    return in.substr(b, e - b);
}

static bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Whole payload must be a decimal integer.
static bool parseLong(const std::string& payload, long& out) {
    const std::string s = trimCopy(payload);
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long v = strtol(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    out = v;
    return true;
}

static bool parseFloat(const std::string& payload, float& out) {
    const std::string s = trimCopy(payload);
    if (s.empty()) return false;
    char* end = nullptr;
    float v = strtof(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0') return false;
    out = v;
    return true;
}

static bool parseInRange(const std::string& payload, long lo, long hi, long& out) {
    long v;
    if (!parseLong(payload, v) || v < lo || v > hi) {
        return false;
    }
    out = v;
    return true;
}

static bool rejected(const std::string& key, const std::string& payload) {
    logf(LogLevel::Warn, "[MQTT] config/%s: value '%s' out of range, ignored",
         key.c_str(), payload.c_str());
    return false;
}

LogLevel parseLogLevel(const std::string& s) {
    std::string v = toLowerCopy(trimCopy(s));
    if (v == "none")  return LogLevel::None;
    if (v == "error") return LogLevel::Error;
    if (v == "warn")  return LogLevel::Warn;
    if (v == "info")  return LogLevel::Info;
    if (v == "debug") return LogLevel::Debug;
    return LogLevel::Info;
}

static MqttCommandType parseCommand(const std::string& payload) {
    std::string v = toLowerCopy(trimCopy(payload));
    if (v == "play_pause")        return MqttCommandType::PlayPause;
    if (v == "pause")             return MqttCommandType::Pause;
    if (v == "resume")            return MqttCommandType::Resume;
    if (v == "stop")              return MqttCommandType::Stop;
    if (v == "next_track")        return MqttCommandType::NextTrack;
    if (v == "previous_track")    return MqttCommandType::PreviousTrack;
    if (v == "carousel_next")     return MqttCommandType::CarouselNext;
    if (v == "carousel_previous") return MqttCommandType::CarouselPrevious;
    if (v == "reboot")            return MqttCommandType::Reboot;
    if (v == "resync_time")       return MqttCommandType::ResyncTime;
    return MqttCommandType::None;
}

const char* mqttCommandName(MqttCommandType type) {
    switch (type) {
        case MqttCommandType::PlayPause:        return "play_pause";
        case MqttCommandType::Pause:            return "pause";
        case MqttCommandType::Resume:           return "resume";
        case MqttCommandType::Stop:             return "stop";
        case MqttCommandType::NextTrack:        return "next_track";
        case MqttCommandType::PreviousTrack:    return "previous_track";
        case MqttCommandType::CarouselNext:     return "carousel_next";
        case MqttCommandType::CarouselPrevious: return "carousel_previous";
        case MqttCommandType::PlayIndex:        return "play";
        case MqttCommandType::Reboot:           return "reboot";
        case MqttCommandType::ResyncTime:       return "resync_time";
        case MqttCommandType::None:
        default:
            return "none";
    }
}

std::string deviceRootTopic(const std::string& deviceId) {
    return std::string(MEDIADECK_TOPIC_ROOT) + "/" + deviceId;
}

// ---------- Global config routing -----------------------------------

static bool handleGlobalConfig(ConfigState& cfg, const std::string& key, const std::string& payload) {
    // key is the part after mediadeck/config/
    long v = 0;

    if (key == "mqtt_server") {
        cfg.global.mqttServer = trimCopy(payload);
    } else if (key == "mqtt_port") {
        if (!parseInRange(payload, 1, 65535, v)) return rejected(key, payload);
        cfg.global.mqttPort = static_cast<uint16_t>(v);
    } else if (key == "mqtt_username") {
        cfg.global.mqttUsername = payload;
    } else if (key == "mqtt_password") {
        cfg.global.mqttPassword = payload;
    } else if (key == "ntp_server") {
        cfg.global.ntpServer = trimCopy(payload);
    } else if (key == "timezone") {
        cfg.global.timeZone = trimCopy(payload);
    }

    // Display / audio
    else if (key == "brightness") {
        if (!parseInRange(payload, 0, 100, v)) return rejected(key, payload);
        cfg.global.brightness = static_cast<uint8_t>(v);
    } else if (key == "volume") {
        float f;
        if (!parseFloat(payload, f) || f < 0.0f || f > 1.0f) return rejected(key, payload);
        cfg.global.volume = f;
    }

    // Key timing
    else if (key == "long_press_ms") {
        if (!parseInRange(payload, 100, 10000, v)) return rejected(key, payload);
        cfg.global.longPressMs = static_cast<uint32_t>(v);
    } else if (key == "repeat_interval_ms") {
        if (!parseInRange(payload, 50, 10000, v)) return rejected(key, payload);
        cfg.global.repeatIntervalMs = static_cast<uint32_t>(v);
    } else if (key == "carousel_reset_sec") {
        if (!parseInRange(payload, 1, 3600, v)) return rejected(key, payload);
        cfg.global.carouselResetSec = static_cast<uint16_t>(v);
    }

    else if (key == "status_interval") {
        if (!parseInRange(payload, 0, 65535, v)) return rejected(key, payload);
        if (v == 0) v = DEFAULT_STATUS_INTERVAL_SEC;
        cfg.global.statusIntervalSec = static_cast<uint16_t>(v);
    }

    // Logging
    else if (key == "log_level") {
        cfg.global.logLevel = parseLogLevel(payload);
    }

    else {
        logf(LogLevel::Debug, "[MQTT] Unknown global config key '%s'", key.c_str());
        return false;
    }
    return true;
}

bool applyGlobalConfigKey(ConfigState& cfg, const std::string& key, const std::string& value) {
    return handleGlobalConfig(cfg, key, value);
}

// ---------- Per-device config routing -------------------------------

static bool handleDeviceConfig(ConfigState& cfg, const std::string& key, const std::string& payload) {
    // key is the part after mediadeck/{device}/config/
    long v = 0;

    if (key == "name") {
        cfg.device.friendlyName = trimCopy(payload);
    } else if (key == "brightness") {
        // Empty payload clears the override.
        if (trimCopy(payload).empty()) {
            cfg.device.brightnessOverride = 0xFF;
        } else {
            if (!parseInRange(payload, 0, 100, v)) return rejected(key, payload);
            cfg.device.brightnessOverride = static_cast<uint8_t>(v);
        }
    } else if (key == "log_level") {
        if (trimCopy(payload).empty()) {
            cfg.device.hasLogLevelOverride = false;
        } else {
            cfg.device.hasLogLevelOverride = true;
            cfg.device.logLevelOverride    = parseLogLevel(payload);
        }
    } else {
        // Everything else may also be set for a single device.
        return handleGlobalConfig(cfg, key, payload);
    }
    return true;
}

// ---------- Main router ---------------------------------------------

bool handleMqttMessage(
    ConfigState& cfg,
    const std::string& topic,
    const std::string& payload,
    MqttCommand& outCommand
) {
    outCommand = MqttCommand();

    // 1) Global config: mediadeck/config/...
    const std::string globalRoot = std::string(TOPIC_GLOBAL_CONFIG_ROOT) + "/";
    if (startsWith(topic, globalRoot)) {
        std::string key = topic.substr(globalRoot.length()); // part after config/
        return handleGlobalConfig(cfg, key, payload);
    }

    // 2) Commands (global / per-device)
    if (topic == TOPIC_ALL_CMD) {
        outCommand.type = parseCommand(payload);
        return false;
    }

    // Per-device base: mediadeck/{device}
    const std::string devRoot = deviceRootTopic(cfg.device.deviceId);

    // 2a) Per-device command: mediadeck/{device}/cmd
    if (topic == devRoot + "/cmd") {
        outCommand.type = parseCommand(payload);
        if (outCommand.type == MqttCommandType::None) {
            logf(LogLevel::Warn, "[MQTT] Unknown command '%s'", payload.c_str());
        }
        return false;
    }

    // 2b) mediadeck/{device}/cmd/play <index>
    if (topic == devRoot + "/cmd/play") {
        long v = -1;
        outCommand.type  = MqttCommandType::PlayIndex;
        outCommand.index = (parseLong(payload, v) && v >= 0 && v <= INT32_MAX)
                               ? static_cast<int32_t>(v) : -1;
        return false;
    }

    // 3) Per-device config: mediadeck/{device}/config/...
    const std::string devCfgRoot = devRoot + "/config/";
    if (startsWith(topic, devCfgRoot)) {
        std::string key = topic.substr(devCfgRoot.length()); // part after config/
        return handleDeviceConfig(cfg, key, payload);
    }

    // Anything else can be ignored or logged by caller if desired.
    return false;
}
