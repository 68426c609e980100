#include "PlaybackController.h"

#include <chrono>
#include <exception>
#include <thread>

#include "Log.h"

const char* sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Playing: return "playing";
        case SessionState::Paused:  return "paused";
        case SessionState::NoSession:
        default:
            return "none";
    }
}

PlaybackController::PlaybackController(MediaEngine& engine, IdleResetTimer& idle,
                                       uint32_t settleDelayMs)
: _engine(engine), _idle(idle), _settleDelayMs(settleDelayMs), _endOfStream("end-of-stream")
{
}

PlaybackController::~PlaybackController() {
    shutdown();
}

void PlaybackController::shutdown() {
    _endOfStream.shutdown();
}

void PlaybackController::setSessionListener(SessionListener listener) {
    std::lock_guard<std::mutex> lock(_mutex);
    _listener = std::move(listener);
}

void PlaybackController::setSettleDelay(uint32_t ms) {
    std::lock_guard<std::mutex> lock(_mutex);
    _settleDelayMs = ms;
}

// --- Public operations -------------------------------------------
//
// Each one opens an IdleScope before taking the controller lock, so the
// idle timer is rescheduled after the lock has been released.

bool PlaybackController::playItem(const MediaItemPtr& item) {
    IdleScope idle(_idle);
    std::lock_guard<std::mutex> lock(_mutex);
    return playItemLocked(item);
}

bool PlaybackController::pause() {
    IdleScope idle(_idle);
    std::lock_guard<std::mutex> lock(_mutex);
    return pauseLocked();
}

bool PlaybackController::resume() {
    IdleScope idle(_idle);
    std::lock_guard<std::mutex> lock(_mutex);
    return resumeLocked();
}

bool PlaybackController::stop() {
    IdleScope idle(_idle);
    std::lock_guard<std::mutex> lock(_mutex);
    return stopLocked();
}

bool PlaybackController::playPauseToggle(const MediaItemPtr& item) {
    IdleScope idle(_idle);
    std::lock_guard<std::mutex> lock(_mutex);

    switch (_state) {
        case SessionState::Playing:
            return pauseLocked();
        case SessionState::Paused:
            return resumeLocked();
        case SessionState::NoSession:
        default:
            return playItemLocked(item);
    }
}

bool PlaybackController::nextTrack() {
    IdleScope idle(_idle);
    std::lock_guard<std::mutex> lock(_mutex);

    if (!_current || !_current->isMultiTrack()) {
        _lastResult = "No album is currently playing or not an album type.";
        logf(LogLevel::Warn, "%s", _lastResult.c_str());
        return false;
    }
    if (!_current->nextTrack()) {
        _lastResult = "No next track.";
        return false;
    }
    if (!playItemLocked(_current)) {
        _current->previousTrack();   // keep the cursor on what is still playing
        return false;
    }
    _lastResult = "Skipped to next track.";
    logf(LogLevel::Info, "Playing next track: %s", _current->currentPath().c_str());
    return true;
}

bool PlaybackController::previousTrack() {
    IdleScope idle(_idle);
    std::lock_guard<std::mutex> lock(_mutex);

    if (!_current || !_current->isMultiTrack()) {
        _lastResult = "No album is currently playing or not an album type.";
        logf(LogLevel::Warn, "%s", _lastResult.c_str());
        return false;
    }
    if (!_current->previousTrack()) {
        _lastResult = "No previous track.";
        return false;
    }
    if (!playItemLocked(_current)) {
        _current->nextTrack();
        return false;
    }
    _lastResult = "Went back to previous track.";
    logf(LogLevel::Info, "Playing previous track: %s", _current->currentPath().c_str());
    return true;
}

void PlaybackController::onPlaybackEnded() {
    IdleScope idle(_idle);
    std::lock_guard<std::mutex> lock(_mutex);
    handlePlaybackEndedLocked();
}

void PlaybackController::notifyPlaybackEnded() {
    _endOfStream.post([this]() { onPlaybackEnded(); });
}

void PlaybackController::postEndOfStream(uint32_t playSerial) {
    _endOfStream.post([this, playSerial]() {
        IdleScope idle(_idle);
        std::lock_guard<std::mutex> lock(_mutex);
        if (playSerial != _playSerial) {
            // Raised by a play that has since been replaced.
            logf(LogLevel::Debug, "Ignoring end of stream from play #%u", playSerial);
            return;
        }
        handlePlaybackEndedLocked();
    });
}

void PlaybackController::waitForNotifications() {
    _endOfStream.drain();
}

SessionSnapshot PlaybackController::snapshot() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return snapshotLocked();
}

std::string PlaybackController::lastError() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _lastError;
}

std::string PlaybackController::lastResult() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _lastResult;
}

// --- Locked helpers ----------------------------------------------

void PlaybackController::handlePlaybackEndedLocked() {
    logf(LogLevel::Info, "Playback ended, handling end of playback.");

    if (!_current) {
        logf(LogLevel::Warn, "No current playing album to handle playback end.");
        stopLocked();
        return;
    }

    if (!_current->hasNextTrack()) {
        logf(LogLevel::Info, "%s: last track finished", _current->name().c_str());
        stopLocked();
        return;
    }

    _current->nextTrack();
    logf(LogLevel::Info, "Playing next track: %s", _current->currentPath().c_str());
    if (!playItemLocked(_current)) {
        // Nothing is playing any more; settle in the reset state rather than
        // claim a session the engine no longer has.
        logf(LogLevel::Error, "Auto-advance failed, ending session");
        const std::string error = _lastError;
        stopLocked();
        _lastError = error;
    }
}

bool PlaybackController::playItemLocked(const MediaItemPtr& item) {
    if (!item) {
        _lastResult = "No media item given.";
        logf(LogLevel::Warn, "playItem: no media item given");
        return false;
    }

    logf(LogLevel::Info, "Playing media: %s at path: %s",
         item->name().c_str(), item->currentPath().c_str());

    const uint32_t serial = _playSerial + 1;
    if (!_engine.play(item->currentPath(), [this, serial]() { postEndOfStream(serial); })) {
        recordErrorLocked("Failed to play media");
        return false;
    }
    _playSerial = serial;

    // Switching away from an item always rewinds it.
    if (_current && _current != item) {
        logf(LogLevel::Debug, "Resetting %s to its first track", _current->name().c_str());
        _current->resetCurrentTrack();
    }

    _current = item;
    _state   = SessionState::Playing;
    _lastError.clear();
    _lastResult = "Playing " + item->name() + ".";
    notifyLocked();
    return true;
}

bool PlaybackController::pauseLocked() {
    if (_state != SessionState::Playing) {
        _lastResult = "No media is currently playing to pause.";
        logf(LogLevel::Info, "%s", _lastResult.c_str());
        return false;
    }
    if (!_engine.pause()) {
        recordErrorLocked("Failed to pause media");
        return false;
    }

    _state = SessionState::Paused;
    _lastError.clear();
    _lastResult = "Playback paused.";
    settleLocked();
    notifyLocked();
    logf(LogLevel::Info, "Media playback paused.");
    return true;
}

bool PlaybackController::resumeLocked() {
    if (_state != SessionState::Paused || !_current) {
        _lastResult = "No media is currently paused to resume.";
        logf(LogLevel::Info, "%s", _lastResult.c_str());
        return false;
    }
    if (!_engine.resume()) {
        recordErrorLocked("Failed to resume media");
        return false;
    }

    _state = SessionState::Playing;
    _lastError.clear();
    _lastResult = "Playback resumed.";
    settleLocked();
    notifyLocked();
    logf(LogLevel::Info, "Media playback resumed.");
    return true;
}

bool PlaybackController::stopLocked() {
    if (_state == SessionState::NoSession) {
        _lastResult = "No media is currently playing to stop.";
        logf(LogLevel::Info, "%s", _lastResult.c_str());
        return false;
    }
    if (!_engine.stop()) {
        recordErrorLocked("Failed to stop media");
        return false;
    }

    if (_current) {
        _current->resetCurrentTrack();
    }
    _current.reset();
    _state = SessionState::NoSession;
    _lastError.clear();
    _lastResult = "Playback stopped.";
    settleLocked();
    notifyLocked();
    logf(LogLevel::Info, "Media playback stopped.");
    return true;
}

void PlaybackController::settleLocked() const {
    if (_settleDelayMs > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(_settleDelayMs));
    }
}

void PlaybackController::recordErrorLocked(const char* what) {
    _lastError = _engine.errorMessage();
    if (_lastError.empty()) {
        _lastError = what;
    }
    _lastResult = _lastError;
    logf(LogLevel::Error, "%s: %s", what, _lastError.c_str());
}

SessionSnapshot PlaybackController::snapshotLocked() const {
    SessionSnapshot s;
    s.state       = _state;
    s.item        = _current;
    s.trackIndex  = _current ? _current->currentTrackIndex() : -1;
    s.engineState = _engine.state();
    s.lastError   = _lastError;
    return s;
}

void PlaybackController::notifyLocked() {
    if (!_listener) return;

    const SessionSnapshot s = snapshotLocked();
    try {
        _listener(s);
    } catch (const std::exception& e) {
        logf(LogLevel::Error, "Session listener failed: %s", e.what());
    }
}
