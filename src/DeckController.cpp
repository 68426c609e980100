#include "DeckController.h"

#include "Log.h"

DeckController::DeckController(MediaLibrary library, MediaEngine& engine,
                               KeySurface& surface, const EffectiveConfig& cfg)
    : _library(std::move(library)),
      _engine(engine),
      _surface(surface),
      _carousel(_library),
      _idle(_timers, cfg.carouselResetMs,
            [this]() { return !_carousel.isAtDefault(); },
            [this]() { resetCarouselOnIdle(); }),
      _playback(_engine, _idle, cfg.settleDelayMs),
      _buttons(_timers, DECK_KEY_COUNT, cfg.longPressMs),
      _router(_buttons, _surface, _carousel, _playback,
              ButtonRouter::Callbacks{
                  [this]() { carouselNext(); },
                  [this]() { carouselPrevious(); }},
              cfg.repeatIntervalMs) {
    _playback.setSessionListener([this](const SessionSnapshot& s) {
        onSessionChanged(s);
    });
    _engine.setVolume(cfg.volume);
}

DeckController::~DeckController() {
    shutdown();
}

void DeckController::shutdown() {
    // End-of-stream jobs may still schedule idle timers; stop them first.
    _playback.shutdown();
    _timers.shutdown();
}

void DeckController::begin() {
    logf(LogLevel::Info, "Deck ready: %u items, %u keys",
         static_cast<unsigned>(_library.size()), _surface.keyCount());
    _router.refreshAll();
}

void DeckController::onKeyTransition(uint8_t key, bool pressed) {
    _buttons.onKeyTransition(key, pressed);
}

void DeckController::carouselNext() {
    {
        IdleScope idle(_idle);
        const size_t start = _router.stepCarousel(true);
        logf(LogLevel::Debug, "Carousel next -> %u", static_cast<unsigned>(start));
    }
    notifyChange();
}

void DeckController::carouselPrevious() {
    {
        IdleScope idle(_idle);
        const size_t start = _router.stepCarousel(false);
        logf(LogLevel::Debug, "Carousel previous -> %u", static_cast<unsigned>(start));
    }
    notifyChange();
}

bool DeckController::playIndex(size_t index, std::string* error) {
    const MediaItemPtr item = _library.at(index);
    if (!item) {
        logf(LogLevel::Warn, "Album index %u out of range (%u items)",
             static_cast<unsigned>(index), static_cast<unsigned>(_library.size()));
        if (error) *error = "Album index out of range";
        return false;
    }
    if (!_playback.playItem(item)) {
        if (error) *error = _playback.lastError();
        return false;
    }
    return true;
}

void DeckController::applyConfig(const EffectiveConfig& cfg) {
    _buttons.setLongPressThreshold(cfg.longPressMs);
    _idle.setTimeout(cfg.carouselResetMs);
    _playback.setSettleDelay(cfg.settleDelayMs);
    _router.setRepeatInterval(cfg.repeatIntervalMs);

    if (!_engine.setVolume(cfg.volume)) {
        logf(LogLevel::Warn, "Volume %.2f rejected: %s", cfg.volume, _engine.errorMessage().c_str());
    }
    _router.setBrightness(cfg.brightness);

    // Rebind the soft keys so a new repeat interval takes effect.
    _router.refreshSessionKeys(_playback.snapshot());
}

void DeckController::setChangeObserver(ChangeObserver observer) {
    std::lock_guard<std::mutex> lock(_observerMutex);
    _observer = std::move(observer);
}

// Runs on the timer worker with the idle lock held.
void DeckController::resetCarouselOnIdle() {
    if (_router.resetCarousel()) {
        notifyChange();
    }
}

// Runs with the controller lock held.
void DeckController::onSessionChanged(const SessionSnapshot& session) {
    _router.refreshSessionKeys(session);
    notifyChange();
}

void DeckController::notifyChange() {
    ChangeObserver observer;
    {
        std::lock_guard<std::mutex> lock(_observerMutex);
        observer = _observer;
    }
    if (observer) {
        observer();
    }
}
