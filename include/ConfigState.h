#pragma once

#include <stdint.h>
#include <string>


#ifdef BUILD_DATETIME
static constexpr uint32_t kBuildUnixTime = static_cast<uint32_t>(BUILD_DATETIME);
#else
static constexpr uint32_t kBuildUnixTime = 0;
#endif


// How often we publish status by default (seconds)
constexpr uint16_t DEFAULT_STATUS_INTERVAL_SEC = 60;

// --- Enums ---------------------------------------------------

enum class LogLevel : uint8_t {
    None,
    Error,
    Warn,
    Info,
    Debug
};

namespace ConfigDefaults {
    // MQTT / network / time
    constexpr const char* MQTT_SERVER   = "127.0.0.1";
    constexpr const uint16_t MQTT_PORT  = 1883;
    constexpr const char* MQTT_USERNAME = "";
    constexpr const char* MQTT_PASSWORD = "";
    constexpr const char* NTP_SERVER_DEFAULT = "pool.ntp.org";
    constexpr const char* TIMEZONE      = "Etc/UTC";

    // Display / audio
    constexpr uint8_t BRIGHTNESS = 70;     // surface brightness in percent
    constexpr float   VOLUME     = 1.0f;   // 0.0 .. 1.0

    // Key timing
    constexpr uint32_t LONG_PRESS_MS         = 1000;  // hold time before a press counts as long
    constexpr uint32_t REPEAT_INTERVAL_MS    = 400;   // carousel scroll rate while held
    constexpr uint16_t CAROUSEL_RESET_SEC    = 30;    // idle time before the carousel snaps back
    constexpr uint32_t SETTLE_DELAY_MS       = 100;   // engine state-transition latency

    // Catalog locations on the SD card
    constexpr const char* MEDIA_FILE   = "/media.json";
    constexpr const char* MUSIC_FOLDER = "/music";

    // Device-specific
    constexpr const char* FRIENDLY_NAME = "MediaDeck";

    // Status interval (seconds)
    constexpr uint16_t STATUS_INTERVAL_SEC = DEFAULT_STATUS_INTERVAL_SEC;

    // Logging
    constexpr LogLevel LOG_LEVEL = LogLevel::Info;
}

// --- Global (shared) config ---------------------------------

struct GlobalConfig {
    // Network / MQTT / time
    std::string mqttServer   = ConfigDefaults::MQTT_SERVER;
    uint16_t    mqttPort     = ConfigDefaults::MQTT_PORT;
    std::string mqttUsername = ConfigDefaults::MQTT_USERNAME;
    std::string mqttPassword = ConfigDefaults::MQTT_PASSWORD;
    std::string ntpServer    = ConfigDefaults::NTP_SERVER_DEFAULT;
    std::string timeZone     = ConfigDefaults::TIMEZONE;

    // Display / audio
    uint8_t brightness = ConfigDefaults::BRIGHTNESS;
    float   volume     = ConfigDefaults::VOLUME;

    // Key timing
    uint32_t longPressMs       = ConfigDefaults::LONG_PRESS_MS;
    uint32_t repeatIntervalMs  = ConfigDefaults::REPEAT_INTERVAL_MS;
    uint16_t carouselResetSec  = ConfigDefaults::CAROUSEL_RESET_SEC;
    uint32_t settleDelayMs     = ConfigDefaults::SETTLE_DELAY_MS;

    // Catalog
    std::string mediaFile   = ConfigDefaults::MEDIA_FILE;
    std::string musicFolder = ConfigDefaults::MUSIC_FOLDER;

    uint16_t statusIntervalSec = ConfigDefaults::STATUS_INTERVAL_SEC;

    // Logging
    LogLevel logLevel = ConfigDefaults::LOG_LEVEL;
};

// --- Per-device config ---------------------------------------

struct DeviceConfig {
    // Fixed identity for this build
    std::string deviceId;
    std::string deviceName;

    // Raw Unix time from the build (-DBUILD_DATETIME=$UNIX_TIME)
    uint32_t    buildUnixTime = kBuildUnixTime;
    std::string buildDateTime = std::to_string(kBuildUnixTime);

    // Mutable from MQTT
    std::string friendlyName = ConfigDefaults::FRIENDLY_NAME;
    bool mqtt_isConnected   = false;
    bool ntp_isSynchronized = false;

    // Per-device brightness override:
    //  - 0xFF   => no override, use global brightness
    //  - 0..100 => override value in percent
    uint8_t brightnessOverride = 0xFF;

    // Logging (per-device override of the global level)
    bool     hasLogLevelOverride = false;
    LogLevel logLevelOverride    = ConfigDefaults::LOG_LEVEL;
};

// --- Effective config (merged view) --------------------------

struct EffectiveConfig {
    // Identity
    std::string deviceId;
    std::string deviceName;
    std::string friendlyName;
    std::string buildDateTime;

    // Network
    std::string mqttServer;
    uint16_t    mqttPort;
    std::string mqttUsername;
    std::string mqttPassword;
    std::string ntpServer;
    std::string timeZone;

    // Display / audio
    uint8_t brightness;
    float   volume;

    // Key timing
    uint32_t longPressMs;
    uint32_t repeatIntervalMs;
    uint32_t carouselResetMs;
    uint32_t settleDelayMs;

    // Catalog
    std::string mediaFile;
    std::string musicFolder;

    uint16_t statusIntervalSec;

    bool mqtt_isConnected;
    bool ntp_isSynchronized;

    // Logging
    LogLevel logLevel;
};

// --- Top-level state container -------------------------------

struct ConfigState {
    GlobalConfig global;
    DeviceConfig device;

    EffectiveConfig effective() const {
        EffectiveConfig e;

        e.deviceId      = device.deviceId;
        e.deviceName    = device.deviceName;
        e.friendlyName  = device.friendlyName;
        e.buildDateTime = device.buildDateTime;

        e.mqttServer   = global.mqttServer;
        e.mqttPort     = global.mqttPort;
        e.mqttUsername = global.mqttUsername;
        e.mqttPassword = global.mqttPassword;
        e.ntpServer    = global.ntpServer;
        e.timeZone     = global.timeZone;

        // Per-device brightness override: 0xFF means "no override, use global".
        if (device.brightnessOverride == 0xFF) {
            e.brightness = global.brightness;
        } else {
            e.brightness = device.brightnessOverride;
        }
        e.volume = global.volume;

        e.longPressMs      = global.longPressMs;
        e.repeatIntervalMs = global.repeatIntervalMs;
        e.carouselResetMs  = static_cast<uint32_t>(global.carouselResetSec) * 1000UL;
        e.settleDelayMs    = global.settleDelayMs;

        e.mediaFile   = global.mediaFile;
        e.musicFolder = global.musicFolder;

        e.statusIntervalSec = global.statusIntervalSec;

        e.mqtt_isConnected   = device.mqtt_isConnected;
        e.ntp_isSynchronized = device.ntp_isSynchronized;

        e.logLevel = device.hasLogLevelOverride ? device.logLevelOverride : global.logLevel;

        return e;
    }
};
