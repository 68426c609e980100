#pragma once

#include <stdint.h>
#include <functional>
#include <mutex>
#include <vector>

#include "ButtonManager.h"
#include "Carousel.h"
#include "KeySurface.h"
#include "PlaybackController.h"

// Fixed key layout of the 3x2 deck.
constexpr uint8_t KEY_MEDIA_FIRST   = 0;   // keys 0..2 show the carousel window
constexpr uint8_t KEY_NOW_PLAYING   = 3;
constexpr uint8_t KEY_SOFT_PREVIOUS = 4;
constexpr uint8_t KEY_SOFT_NEXT     = 5;
constexpr uint8_t DECK_KEY_COUNT    = 6;

// Decides what every key looks like and does, and keeps the ButtonManager
// bindings in step with the rendered faces.
//
// Soft keys (4, 5):
// - a multi-track item is playing -> previous/next track on short press,
//   carousel navigation repeating while held
// - otherwise -> carousel navigation on short press and repeating hold
//
// Now-playing key (3): play/pause toggle (stop for a playing stream),
// hold to stop.
class ButtonRouter {
public:
    struct Callbacks {
        std::function<void()> carouselNext;
        std::function<void()> carouselPrevious;
    };

    ButtonRouter(ButtonManager& buttons, KeySurface& surface,
                 Carousel& carousel, PlaybackController& playback,
                 Callbacks callbacks, uint32_t repeatIntervalMs);

    ButtonRouter(const ButtonRouter&) = delete;
    ButtonRouter& operator=(const ButtonRouter&) = delete;

    // Keys 0..2. Carousel moves go through stepCarousel()/resetCarousel()
    // so the move and the rebind happen as one step.
    void refreshMediaKeys();
    size_t stepCarousel(bool forward);
    // False when already at the default position.
    bool   resetCarousel();
    // Session changed: keys 3..5. Takes the snapshot instead of asking the
    // controller, so it is safe to call from the session listener.
    void refreshSessionKeys(const SessionSnapshot& session);
    void refreshAll();

    // Applies at the next refresh.
    void setRepeatInterval(uint32_t ms);

    void setBrightness(uint8_t percent);

    // Face last sent to the surface (empty face when never rendered).
    KeyFace lastFace(uint8_t key) const;

    // Face builders, exposed for the status surface and tests.
    static KeyFace mediaFace(const MediaItemPtr& item);
    static KeyFace nowPlayingFace(const SessionSnapshot& session);
    static KeyFace softKeyFace(uint8_t key, bool trackMode);
    static bool    isTrackMode(const SessionSnapshot& session);

private:
    void refreshMediaKeysLocked();
    void bindMediaKey(uint8_t key, const MediaItemPtr& item);
    void bindNowPlaying(const SessionSnapshot& session);
    void bindSoftKey(uint8_t key, bool trackMode);

    void render(uint8_t key, const KeyFace& face);

    ButtonManager&      _buttons;
    KeySurface&         _surface;
    Carousel&           _carousel;
    PlaybackController& _playback;
    Callbacks           _callbacks;

    std::mutex _configMutex;

    // Held from a carousel move until keys 0..2 show the new window.
    // Lock order: idle -> media keys -> carousel -> registry -> render.
    std::mutex _mediaKeysMutex;
    uint32_t   _repeatIntervalMs;

    // Serializes every call into the surface.
    mutable std::mutex   _renderMutex;
    std::vector<KeyFace> _faces;
};
