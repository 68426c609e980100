#include <ArduinoJson.h>
#include "CatalogLoader.h"

#include <algorithm>
#include <ctype.h>

#include "Log.h"

static const char* const AUDIO_EXTENSIONS[] = {
    ".mp3", ".aiff", ".ogg", ".mp4", ".aac", ".m4a", ".flac",
};

// Priority order when a directory holds several images.
static const char* const IMAGE_EXTENSIONS[] = {
    ".jpg", ".jpeg", ".png",
};

// ---------- Helpers -------------------------------------------------

static std::string lowerExtension(const std::string& path) {
    const size_t slash = path.find_last_of('/');
    const size_t dot   = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return std::string();
    }
    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(tolower(c)); });
    return ext;
}

template <size_t N>
static bool hasExtension(const std::string& path, const char* const (&list)[N]) {
    const std::string ext = lowerExtension(path);
    if (ext.empty()) return false;
    for (const char* candidate : list) {
        if (ext == candidate) return true;
    }
    return false;
}

static std::string joinPath(const std::string& dir, const std::string& file) {
    if (file.empty() || file[0] == '/') return file;   // already absolute
    if (dir.empty() || dir[dir.size() - 1] == '/') return dir + file;
    return dir + "/" + file;
}

bool isAudioFile(const std::string& path) {
    return hasExtension(path, AUDIO_EXTENSIONS);
}

bool isImageFile(const std::string& path) {
    return hasExtension(path, IMAGE_EXTENSIONS);
}

// ---------- media.json ----------------------------------------------

static std::vector<Track> parseTracks(JsonArrayConst arr) {
    std::vector<Track> tracks;
    for (JsonVariantConst v : arr) {
        Track t;
        if (v.is<const char*>()) {
            t.path = v.as<const char*>();
        } else if (v.is<JsonObjectConst>()) {
            t.path       = v["path"] | "";
            t.artworkRef = v["artwork"] | "";
            t.name       = v["name"] | "";
        }
        if (t.path.empty()) {
            logf(LogLevel::Warn, "[Catalog] Track entry without a path skipped");
            continue;
        }
        tracks.push_back(t);
    }
    return tracks;
}

std::vector<MediaItemPtr> parseCatalogJson(const std::string& json) {
    std::vector<MediaItemPtr> items;

    JsonDocument doc;  // ArduinoJson 7: elastic capacity on heap
    DeserializationError err = deserializeJson(doc, json);
    if (err) {
        logf(LogLevel::Error, "[Catalog] media.json parse failed: %s (len=%u)",
             err.c_str(), static_cast<unsigned>(json.size()));
        return items;
    }

    JsonArrayConst albums = doc["albums"].as<JsonArrayConst>();
    if (albums.isNull()) {
        logf(LogLevel::Warn, "[Catalog] media.json has no \"albums\" array");
        return items;
    }

    for (JsonVariantConst entry : albums) {
        JsonObjectConst album = entry.as<JsonObjectConst>();
        if (album.isNull()) {
            logf(LogLevel::Warn, "[Catalog] Non-object album entry skipped");
            continue;
        }
        const std::string name    = album["name"] | "Unknown Album";
        const std::string path    = album["path"] | "";
        const std::string type    = album["type"] | "stream";
        const std::string artwork = album["artwork"] | "";
        std::vector<Track> tracks = parseTracks(album["tracks"].as<JsonArrayConst>());

        if (path.empty() && tracks.empty()) {
            logf(LogLevel::Warn, "[Catalog] %s: nothing to play, skipped", name.c_str());
            continue;
        }

        items.push_back(std::make_shared<MediaItem>(name, path, parseMediaType(type),
                                                    artwork, std::move(tracks)));
        logf(LogLevel::Debug, "[Catalog] %s (%s)", name.c_str(), type.c_str());
    }

    logf(LogLevel::Info, "[Catalog] %u items from media.json", static_cast<unsigned>(items.size()));
    return items;
}

// ---------- Music folder --------------------------------------------

MediaItemPtr albumFromDirectory(const std::string& dirPath,
                                const std::vector<std::string>& files) {
    std::vector<std::string> audio;
    std::string artwork;
    size_t artworkRank = sizeof(IMAGE_EXTENSIONS) / sizeof(IMAGE_EXTENSIONS[0]);

    for (const std::string& f : files) {
        const std::string full = joinPath(dirPath, f);
        if (isAudioFile(full)) {
            audio.push_back(full);
            continue;
        }
        const std::string ext = lowerExtension(full);
        for (size_t rank = 0; rank < artworkRank; ++rank) {
            if (ext == IMAGE_EXTENSIONS[rank]) {
                artwork     = full;
                artworkRank = rank;
                break;
            }
        }
    }

    size_t nameStart = dirPath.find_last_of('/');
    nameStart = (nameStart == std::string::npos) ? 0 : nameStart + 1;
    const std::string name = dirPath.substr(nameStart);

    if (audio.empty()) {
        logf(LogLevel::Warn, "[Catalog] No audio tracks found in album %s. Skipping.", name.c_str());
        return MediaItemPtr();
    }

    std::sort(audio.begin(), audio.end());

    std::vector<Track> tracks;
    tracks.reserve(audio.size());
    for (const std::string& p : audio) {
        Track t;
        t.path = p;
        tracks.push_back(t);
    }

    return std::make_shared<MediaItem>(name, dirPath, MediaType::Album, artwork, std::move(tracks));
}
