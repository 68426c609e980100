#include <ArduinoJson.h>
#include "StatusReport.h"

static void writeItem(JsonObject obj, const MediaItem& item) {
    obj["name"] = item.name();
    obj["path"] = item.path();
    obj["type"] = mediaTypeName(item.type());
}

std::string buildStateJson(const SessionSnapshot& session, size_t carouselStart,
                           bool isConnected) {
    JsonDocument doc;

    if (session.item) {
        writeItem(doc["current_playing_album"].to<JsonObject>(), *session.item);
    } else {
        doc["current_playing_album"] = nullptr;
    }

    if (session.item && session.trackIndex >= 0) {
        doc["track_index"] = session.trackIndex;
        const Track* track = session.item->currentTrack();
        if (track) {
            doc["track_name"] = track->name;
        }
    } else {
        doc["track_index"] = nullptr;
    }

    doc["session"]        = sessionStateName(session.state);
    doc["player_state"]   = playerStateName(session.engineState);
    doc["is_connected"]   = isConnected;
    doc["carousel_start"] = static_cast<uint32_t>(carouselStart);

    if (session.lastError.empty()) {
        doc["error"] = nullptr;
    } else {
        doc["error"] = session.lastError;
    }

    std::string out;
    serializeJson(doc, out);
    return out;
}

std::string buildAlbumsJson(const MediaLibrary& library) {
    JsonDocument doc;
    JsonArray arr = doc.to<JsonArray>();

    const std::vector<MediaItemPtr>& items = library.items();
    for (size_t i = 0; i < items.size(); ++i) {
        JsonObject obj = arr.add<JsonObject>();
        obj["index"] = static_cast<uint32_t>(i);
        writeItem(obj, *items[i]);
        if (items[i]->hasTracks()) {
            obj["tracks"] = static_cast<uint32_t>(items[i]->tracks().size());
        }
    }

    std::string out;
    serializeJson(doc, out);
    return out;
}

std::string buildReplyJson(bool success, const std::string& message) {
    JsonDocument doc;
    doc["status"]  = success ? "success" : "error";
    doc["message"] = message;

    std::string out;
    serializeJson(doc, out);
    return out;
}

std::string buildDeviceJson(const StatusSnapshot& st) {
    JsonDocument doc;
    doc["uptime"]     = st.uptimeSec;
    doc["rssi"]       = st.rssi;
    doc["free_heap"]  = st.freeHeap;
    doc["brightness"] = st.brightness;
    doc["volume"]     = st.volume;
    if (!st.firmwareVersion.empty()) doc["firmware_version"] = st.firmwareVersion;
    if (!st.buildDateTime.empty())   doc["build"]            = st.buildDateTime;
    if (!st.hwRevision.empty())      doc["hw_revision"]      = st.hwRevision;

    std::string out;
    serializeJson(doc, out);
    return out;
}
