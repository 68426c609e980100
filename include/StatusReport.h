#pragma once

#include <stdint.h>
#include <string>

#include "MediaItem.h"
#include "PlaybackController.h"

// Device health, published every status interval.
struct StatusSnapshot {
    uint32_t    uptimeSec    = 0;
    int8_t      rssi         = 0;
    uint32_t    freeHeap     = 0;
    uint8_t     brightness   = 0;
    float       volume       = 0.0f;
    std::string firmwareVersion;
    std::string buildDateTime;
    std::string hwRevision;
};

// JSON payloads for the status topics.

// status/state
std::string buildStateJson(const SessionSnapshot& session, size_t carouselStart,
                           bool isConnected);
// status/albums
std::string buildAlbumsJson(const MediaLibrary& library);
// status/reply
std::string buildReplyJson(bool success, const std::string& message);
// status/device
std::string buildDeviceJson(const StatusSnapshot& status);
