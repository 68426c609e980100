#pragma once

#include <stdint.h>
#include <functional>
#include <mutex>
#include <string>

#include "ConfigState.h"
#include "IdleResetTimer.h"
#include "MediaEngine.h"
#include "MediaItem.h"
#include "WorkQueue.h"

// Stopped-with-an-item does not exist: stopping always ends the session.
enum class SessionState : uint8_t {
    NoSession,
    Playing,
    Paused,
};

const char* sessionStateName(SessionState state);

// Consistent copy of the session, taken under the controller lock.
struct SessionSnapshot {
    SessionState state       = SessionState::NoSession;
    MediaItemPtr item;
    int          trackIndex  = -1;      // -1 when the item has no tracks
    PlayerState  engineState = PlayerState::Stopped;
    std::string  lastError;

    bool isPlaying() const { return state == SessionState::Playing; }
    bool isPaused() const  { return state == SessionState::Paused; }
};

// Owns "what is playing" and serializes every change to it: user commands
// from key and timer threads, remote commands, and end-of-stream
// notifications from the media engine.
//
// Every public mutating operation is bracketed by the carousel idle timer.
// Engine failures leave the session as it was and are kept in lastError().
class PlaybackController {
public:
    // Invoked with the controller lock held after every session change;
    // must not call back into the controller.
    using SessionListener = std::function<void(const SessionSnapshot&)>;

    PlaybackController(MediaEngine& engine, IdleResetTimer& idle,
                       uint32_t settleDelayMs = ConfigDefaults::SETTLE_DELAY_MS);
    ~PlaybackController();

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    void setSessionListener(SessionListener listener);

    bool playItem(const MediaItemPtr& item);
    bool pause();
    bool resume();
    // True only if something was actually playing or paused.
    bool stop();
    bool playPauseToggle(const MediaItemPtr& item);
    bool nextTrack();
    bool previousTrack();

    // End of the current track. Runs synchronously on the calling thread.
    void onPlaybackEnded();
    // Hands onPlaybackEnded() to the controller's own worker and returns
    // immediately.
    void notifyPlaybackEnded();
    // Block until queued end-of-stream notifications have been handled.
    void waitForNotifications();

    SessionSnapshot snapshot() const;
    std::string     lastError() const;
    // Outcome of the most recent operation, worded for a remote reply.
    // Unlike lastError() it also covers refusals and successes.
    std::string     lastResult() const;

    void setSettleDelay(uint32_t ms);

    // Stop accepting engine notifications. Called before teardown.
    void shutdown();

private:
    // Engine handler for one play() call; stale serials are dropped.
    void postEndOfStream(uint32_t playSerial);
    void handlePlaybackEndedLocked();

    bool playItemLocked(const MediaItemPtr& item);
    bool pauseLocked();
    bool resumeLocked();
    bool stopLocked();

    void settleLocked() const;
    void recordErrorLocked(const char* what);
    SessionSnapshot snapshotLocked() const;
    void notifyLocked();

    MediaEngine&    _engine;
    IdleResetTimer& _idle;

    mutable std::mutex _mutex;
    uint32_t           _settleDelayMs;
    SessionState       _state = SessionState::NoSession;
    MediaItemPtr       _current;
    std::string        _lastError;
    std::string        _lastResult;
    uint32_t           _playSerial = 0;   // bumped by every successful play()
    SessionListener    _listener;

    WorkQueue _endOfStream;
};
