#pragma once

#include <stdint.h>
#include <string>
#include "ConfigState.h"

// Topic scheme
//   mediadeck/config/<key>           global config
//   mediadeck/all/cmd                broadcast command
//   mediadeck/{device}/cmd           per-device command
//   mediadeck/{device}/cmd/play      play album by index
//   mediadeck/{device}/config/<key>  per-device config
#define MEDIADECK_TOPIC_ROOT "mediadeck"

// Commands that higher-level code should respond to
enum class MqttCommandType : uint8_t {
    None,
    PlayPause,
    Pause,
    Resume,
    Stop,
    NextTrack,
    PreviousTrack,
    CarouselNext,
    CarouselPrevious,
    PlayIndex,
    Reboot,
    ResyncTime
};

struct MqttCommand {
    MqttCommandType type  = MqttCommandType::None;
    int32_t         index = -1;   // PlayIndex only; -1 when the payload was not a number
};

const char* mqttCommandName(MqttCommandType type);

// "mediadeck/{deviceId}"
std::string deviceRootTopic(const std::string& deviceId);

LogLevel parseLogLevel(const std::string& s);

// One global config key, as published to mediadeck/config/<key>. The
// captive portal feeds its fields through here too. Returns true when the
// value was accepted.
bool applyGlobalConfigKey(ConfigState& cfg, const std::string& key, const std::string& value);

// Route and handle a single MQTT message.
// - Updates cfg in-place (out-of-range values are ignored)
// - Fills outCommand if a command was received
// Returns true when cfg changed.
bool handleMqttMessage(
    ConfigState& cfg,
    const std::string& topic,
    const std::string& payload,
    MqttCommand& outCommand
);
