#pragma once

#include <stdint.h>
#include <memory>
#include <string>
#include <vector>

enum class MediaType : uint8_t {
    Album,
    Playlist,
    Stream,
    Podcast,
};

const char* mediaTypeName(MediaType type);
// Unknown names fall back to Stream.
MediaType parseMediaType(const std::string& name);

struct Track {
    std::string path;
    std::string name;        // file stem unless the catalog provides one
    std::string artworkRef;  // empty = use the item's artwork
};

// A playable unit from the catalog. Everything except the track cursor is
// fixed after loading; the cursor is only moved by the playback controller.
class MediaItem {
public:
    MediaItem(std::string name, std::string path, MediaType type,
              std::string artworkRef = std::string(),
              std::vector<Track> tracks = std::vector<Track>());

    const std::string& name() const       { return _name; }
    const std::string& path() const       { return _path; }
    const std::string& artworkRef() const { return _artworkRef; }
    MediaType          type() const       { return _type; }
    const std::vector<Track>& tracks() const { return _tracks; }

    // Albums and podcasts support track navigation.
    bool isMultiTrack() const;
    bool hasTracks() const { return !_tracks.empty(); }

    // -1 when the item has no tracks.
    int currentTrackIndex() const { return _currentTrack; }
    const Track* currentTrack() const;

    // Path handed to the media engine: the current track, or the item itself.
    const std::string& currentPath() const;
    // Current track artwork, falling back to the item's.
    const std::string& currentArtworkRef() const;

    void resetCurrentTrack();
    // Return false (cursor unchanged) at either end of the track list.
    bool nextTrack();
    bool previousTrack();

    bool hasNextTrack() const;
    bool currentTrackIsLast() const;

private:
    std::string        _name;
    std::string        _path;
    MediaType          _type;
    std::string        _artworkRef;
    std::vector<Track> _tracks;
    int                _currentTrack = -1;
};

using MediaItemPtr = std::shared_ptr<MediaItem>;

// Ordered, logically circular list of items. Filled once at boot.
class MediaLibrary {
public:
    // Catalog entries: always appended, in order.
    bool add(const MediaItemPtr& item);
    size_t addAll(const std::vector<MediaItemPtr>& items);
    // Scanned folders: skipped when a non-empty path is already present.
    bool addIfNew(const MediaItemPtr& item);
    bool containsPath(const std::string& path) const;

    size_t size() const { return _items.size(); }
    bool   empty() const { return _items.empty(); }

    MediaItemPtr at(size_t index) const;
    // Index is reduced modulo size(); null when empty.
    MediaItemPtr wrapped(size_t index) const;
    // -1 when the item is not in the library.
    int indexOf(const MediaItem* item) const;

    const std::vector<MediaItemPtr>& items() const { return _items; }

private:
    std::vector<MediaItemPtr> _items;
};

// Track display name from a path: "/music/a/01 Intro.mp3" -> "01 Intro".
std::string trackNameFromPath(const std::string& path);
