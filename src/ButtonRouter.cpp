#include "ButtonRouter.h"

#include <stdio.h>

#include "Log.h"

ButtonRouter::ButtonRouter(ButtonManager& buttons, KeySurface& surface,
                           Carousel& carousel, PlaybackController& playback,
                           Callbacks callbacks, uint32_t repeatIntervalMs)
    : _buttons(buttons),
      _surface(surface),
      _carousel(carousel),
      _playback(playback),
      _callbacks(std::move(callbacks)),
      _repeatIntervalMs(repeatIntervalMs),
      _faces(DECK_KEY_COUNT) {
}

void ButtonRouter::setRepeatInterval(uint32_t ms) {
    std::lock_guard<std::mutex> lock(_configMutex);
    _repeatIntervalMs = ms;
}

// --------------------------------------------------------------
// Faces
// --------------------------------------------------------------

KeyFace ButtonRouter::mediaFace(const MediaItemPtr& item) {
    KeyFace face;
    face.background = KEY_BG_TEAL;
    if (item) {
        face.artworkRef = item->artworkRef();
        face.title      = item->name();
    }
    return face;
}

KeyFace ButtonRouter::nowPlayingFace(const SessionSnapshot& session) {
    KeyFace face;
    if (!session.item || session.state == SessionState::NoSession) {
        face.background = KEY_BG_GRAY;
        face.glyph      = KeyGlyph::NowPlayingEmpty;
        return face;
    }

    const MediaItemPtr& item = session.item;
    face.background = KEY_BG_TEAL;
    face.title      = item->name();
    face.artworkRef = item->currentArtworkRef();

    if (session.isPaused()) {
        face.overlay = KeyOverlay::Play;
    } else if (item->hasTracks()) {
        face.overlay = KeyOverlay::Pause;
    } else {
        // Streams cannot be paused meaningfully; offer stop instead.
        face.overlay = KeyOverlay::Stop;
    }

    if (session.trackIndex >= 0) {
        char buf[8];
        snprintf(buf, sizeof(buf), "%02d", session.trackIndex + 1);
        face.label = buf;
    }
    return face;
}

KeyFace ButtonRouter::softKeyFace(uint8_t key, bool trackMode) {
    KeyFace face;
    face.background = KEY_BG_BLACK;
    if (key == KEY_SOFT_PREVIOUS) {
        face.glyph = trackMode ? KeyGlyph::PreviousTrack : KeyGlyph::CarouselPrevious;
    } else {
        face.glyph = trackMode ? KeyGlyph::NextTrack : KeyGlyph::CarouselNext;
    }
    return face;
}

bool ButtonRouter::isTrackMode(const SessionSnapshot& session) {
    return session.isPlaying() && session.item && session.item->isMultiTrack();
}

// --------------------------------------------------------------
// Refresh
// --------------------------------------------------------------

void ButtonRouter::refreshMediaKeys() {
    std::lock_guard<std::mutex> lock(_mediaKeysMutex);
    refreshMediaKeysLocked();
}

size_t ButtonRouter::stepCarousel(bool forward) {
    std::lock_guard<std::mutex> lock(_mediaKeysMutex);
    const size_t start = forward ? _carousel.next() : _carousel.previous();
    refreshMediaKeysLocked();
    return start;
}

bool ButtonRouter::resetCarousel() {
    std::lock_guard<std::mutex> lock(_mediaKeysMutex);
    if (!_carousel.resetToDefault()) {
        return false;
    }
    refreshMediaKeysLocked();
    return true;
}

void ButtonRouter::refreshMediaKeysLocked() {
    const std::vector<MediaItemPtr> window = _carousel.window(CAROUSEL_WINDOW);
    logf(LogLevel::Debug, "Refreshing media keys (start %u, %u items)",
         static_cast<unsigned>(_carousel.startIndex()),
         static_cast<unsigned>(window.size()));

    for (uint8_t i = 0; i < CAROUSEL_WINDOW; ++i) {
        const uint8_t key = KEY_MEDIA_FIRST + i;
        const MediaItemPtr item = (i < window.size()) ? window[i] : MediaItemPtr();
        bindMediaKey(key, item);
    }
}

void ButtonRouter::refreshSessionKeys(const SessionSnapshot& session) {
    const bool trackMode = isTrackMode(session);
    logf(LogLevel::Debug, "Refreshing session keys (%s, %s mode)",
         sessionStateName(session.state), trackMode ? "track" : "carousel");

    bindNowPlaying(session);
    bindSoftKey(KEY_SOFT_PREVIOUS, trackMode);
    bindSoftKey(KEY_SOFT_NEXT, trackMode);
}

void ButtonRouter::refreshAll() {
    refreshMediaKeys();
    refreshSessionKeys(_playback.snapshot());
}

// --------------------------------------------------------------
// Bindings
// --------------------------------------------------------------

void ButtonRouter::bindMediaKey(uint8_t key, const MediaItemPtr& item) {
    KeyBinding binding;
    if (item) {
        PlaybackController* playback = &_playback;
        binding.shortPress = [playback, item]() {
            logf(LogLevel::Info, "Media key -> play %s", item->name().c_str());
            playback->playItem(item);
        };
    }
    _buttons.bind(key, binding);
    render(key, item ? mediaFace(item) : KeyFace());
}

void ButtonRouter::bindNowPlaying(const SessionSnapshot& session) {
    KeyBinding binding;
    if (session.item && session.state != SessionState::NoSession) {
        PlaybackController* playback = &_playback;
        const MediaItemPtr item = session.item;
        if (session.isPlaying() && !item->hasTracks()) {
            // Matches the stop overlay from nowPlayingFace().
            binding.shortPress = [playback]() {
                logf(LogLevel::Info, "Now playing stream -> stop");
                playback->stop();
            };
        } else {
            binding.shortPress = [playback, item]() {
                playback->playPauseToggle(item);
            };
        }
        binding.hold.kind   = HoldKind::Single;
        binding.hold.action = [playback]() {
            logf(LogLevel::Info, "Now playing held -> stop");
            playback->stop();
        };
    }
    _buttons.bind(KEY_NOW_PLAYING, binding);
    render(KEY_NOW_PLAYING, nowPlayingFace(session));
}

void ButtonRouter::bindSoftKey(uint8_t key, bool trackMode) {
    uint32_t intervalMs;
    {
        std::lock_guard<std::mutex> lock(_configMutex);
        intervalMs = _repeatIntervalMs;
    }

    const bool isNext = (key == KEY_SOFT_NEXT);
    const std::function<void()> carouselNav = isNext ? _callbacks.carouselNext
                                                     : _callbacks.carouselPrevious;

    KeyBinding binding;
    if (trackMode) {
        PlaybackController* playback = &_playback;
        if (isNext) {
            binding.shortPress = [playback]() { playback->nextTrack(); };
        } else {
            binding.shortPress = [playback]() { playback->previousTrack(); };
        }
    } else {
        binding.shortPress = carouselNav;
    }

    if (carouselNav) {
        binding.hold.kind       = HoldKind::Repeating;
        binding.hold.action     = carouselNav;
        binding.hold.intervalMs = intervalMs;
    }

    _buttons.bind(key, binding);
    render(key, softKeyFace(key, trackMode));
}

// --------------------------------------------------------------
// Surface
// --------------------------------------------------------------

void ButtonRouter::render(uint8_t key, const KeyFace& face) {
    std::lock_guard<std::mutex> lock(_renderMutex);
    if (key >= _surface.keyCount()) {
        return;   // smaller surface than the deck layout
    }
    if (key < _faces.size()) {
        _faces[key] = face;
    }
    _surface.renderKey(key, face);
}

void ButtonRouter::setBrightness(uint8_t percent) {
    std::lock_guard<std::mutex> lock(_renderMutex);
    _surface.setBrightness(percent);
}

KeyFace ButtonRouter::lastFace(uint8_t key) const {
    std::lock_guard<std::mutex> lock(_renderMutex);
    return (key < _faces.size()) ? _faces[key] : KeyFace();
}
