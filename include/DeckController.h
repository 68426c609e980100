#pragma once

#include <stdint.h>
#include <functional>
#include <string>

#include "ButtonManager.h"
#include "ButtonRouter.h"
#include "Carousel.h"
#include "ConfigState.h"
#include "IdleResetTimer.h"
#include "KeySurface.h"
#include "MediaEngine.h"
#include "MediaItem.h"
#include "PlaybackController.h"
#include "TimerQueue.h"

// Owns and wires the whole input/playback core for one deck:
// library -> carousel -> idle reset -> playback -> key tracker -> router.
//
// Constructed once in setup() (or a test fixture) and passed by reference to
// whoever needs it; there is no global instance.
class DeckController {
public:
    // Called after any session or carousel change. Runs on whichever thread
    // made the change, possibly with core locks held: keep it short and do
    // not call back into the deck.
    using ChangeObserver = std::function<void()>;

    DeckController(MediaLibrary library, MediaEngine& engine,
                   KeySurface& surface, const EffectiveConfig& cfg);
    ~DeckController();

    DeckController(const DeckController&) = delete;
    DeckController& operator=(const DeckController&) = delete;

    // Draw and bind every key. Call once the surface is up.
    void begin();

    // Stop timers and notification workers. Idempotent.
    void shutdown();

    // Inbound edge from the surface driver.
    void onKeyTransition(uint8_t key, bool pressed);

    void carouselNext();
    void carouselPrevious();

    // Plays library entry index; false (with error filled) when out of range
    // or when the engine refuses.
    bool playIndex(size_t index, std::string* error = nullptr);

    // Timing, brightness and volume. Timings apply to later presses.
    void applyConfig(const EffectiveConfig& cfg);

    void setChangeObserver(ChangeObserver observer);

    const MediaLibrary& library() const { return _library; }
    Carousel&           carousel()      { return _carousel; }
    PlaybackController& playback()      { return _playback; }
    ButtonManager&      buttons()       { return _buttons; }
    ButtonRouter&       router()        { return _router; }
    IdleResetTimer&     idleTimer()     { return _idle; }
    MediaEngine&        engine()        { return _engine; }
    bool surfaceConnected() const       { return _surface.isConnected(); }

private:
    void resetCarouselOnIdle();
    void onSessionChanged(const SessionSnapshot& session);
    void notifyChange();

    MediaLibrary _library;
    MediaEngine& _engine;
    KeySurface&  _surface;

    Carousel           _carousel;
    TimerQueue         _timers;
    IdleResetTimer     _idle;
    PlaybackController _playback;
    ButtonManager      _buttons;
    ButtonRouter       _router;

    std::mutex     _observerMutex;
    ChangeObserver _observer;
};
