#include "MediaItem.h"

#include <utility>
#include "Log.h"

const char* mediaTypeName(MediaType type) {
    switch (type) {
        case MediaType::Album:    return "album";
        case MediaType::Playlist: return "playlist";
        case MediaType::Podcast:  return "podcast";
        case MediaType::Stream:
        default:
            return "stream";
    }
}

MediaType parseMediaType(const std::string& name) {
    if (name == "album")    return MediaType::Album;
    if (name == "playlist") return MediaType::Playlist;
    if (name == "podcast")  return MediaType::Podcast;
    return MediaType::Stream;
}

std::string trackNameFromPath(const std::string& path) {
    size_t start = path.find_last_of('/');
    start = (start == std::string::npos) ? 0 : start + 1;

    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || dot < start) {
        return path.substr(start);
    }
    return path.substr(start, dot - start);
}

// --- MediaItem ---------------------------------------------------

MediaItem::MediaItem(std::string name, std::string path, MediaType type,
                     std::string artworkRef, std::vector<Track> tracks)
: _name(std::move(name)),
  _path(std::move(path)),
  _type(type),
  _artworkRef(std::move(artworkRef)),
  _tracks(std::move(tracks))
{
    for (auto& t : _tracks) {
        if (t.name.empty()) {
            t.name = trackNameFromPath(t.path);
        }
    }
    resetCurrentTrack();
}

bool MediaItem::isMultiTrack() const {
    return _type == MediaType::Album || _type == MediaType::Podcast;
}

const Track* MediaItem::currentTrack() const {
    if (_currentTrack < 0 || _currentTrack >= static_cast<int>(_tracks.size())) {
        return nullptr;
    }
    return &_tracks[_currentTrack];
}

const std::string& MediaItem::currentPath() const {
    const Track* t = currentTrack();
    return t ? t->path : _path;
}

const std::string& MediaItem::currentArtworkRef() const {
    const Track* t = currentTrack();
    return (t && !t->artworkRef.empty()) ? t->artworkRef : _artworkRef;
}

void MediaItem::resetCurrentTrack() {
    _currentTrack = _tracks.empty() ? -1 : 0;
}

bool MediaItem::hasNextTrack() const {
    return _currentTrack >= 0 && _currentTrack + 1 < static_cast<int>(_tracks.size());
}

bool MediaItem::currentTrackIsLast() const {
    return _currentTrack >= 0 && _currentTrack == static_cast<int>(_tracks.size()) - 1;
}

bool MediaItem::nextTrack() {
    if (!hasNextTrack()) {
        logf(LogLevel::Warn, "%s: no more tracks available", _name.c_str());
        return false;
    }
    ++_currentTrack;
    return true;
}

bool MediaItem::previousTrack() {
    if (_currentTrack <= 0) {
        logf(LogLevel::Warn, "%s: no previous track available", _name.c_str());
        return false;
    }
    --_currentTrack;
    return true;
}

// --- MediaLibrary ------------------------------------------------

bool MediaLibrary::add(const MediaItemPtr& item) {
    if (!item) return false;
    _items.push_back(item);
    return true;
}

bool MediaLibrary::containsPath(const std::string& path) const {
    if (path.empty()) return false;
    for (const auto& existing : _items) {
        if (existing->path() == path) return true;
    }
    return false;
}

bool MediaLibrary::addIfNew(const MediaItemPtr& item) {
    if (!item) return false;
    if (containsPath(item->path())) {
        logf(LogLevel::Debug, "Library already has %s, skipping", item->path().c_str());
        return false;
    }
    _items.push_back(item);
    return true;
}

size_t MediaLibrary::addAll(const std::vector<MediaItemPtr>& items) {
    size_t added = 0;
    for (const auto& item : items) {
        if (add(item)) {
            ++added;
        }
    }
    return added;
}

MediaItemPtr MediaLibrary::at(size_t index) const {
    return (index < _items.size()) ? _items[index] : MediaItemPtr();
}

MediaItemPtr MediaLibrary::wrapped(size_t index) const {
    if (_items.empty()) return MediaItemPtr();
    return _items[index % _items.size()];
}

int MediaLibrary::indexOf(const MediaItem* item) const {
    for (size_t i = 0; i < _items.size(); ++i) {
        if (_items[i].get() == item) {
            return static_cast<int>(i);
        }
    }
    return -1;
}
