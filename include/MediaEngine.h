#pragma once

#include <stdint.h>
#include <functional>
#include <string>

enum class PlayerState : uint8_t {
    Stopped,
    Playing,
    Paused,
    Opening,
    Ended,
    Error,
    Buffering,
};

const char* playerStateName(PlayerState state);

// Audio playback back-end. Every call may fail; failures are reported through
// the return value and errorMessage(), never by throwing.
class MediaEngine {
public:
    // Raised at most once per successful play(), from an engine-owned thread.
    using EndOfStreamHandler = std::function<void()>;

    virtual ~MediaEngine() = default;

    // Starts pathRef (file path or URL). Replaces any current playback and
    // its end-of-stream handler.
    virtual bool play(const std::string& pathRef, EndOfStreamHandler onEnd) = 0;
    virtual bool pause() = 0;
    virtual bool resume() = 0;
    // Also detaches the end-of-stream handler.
    virtual bool stop() = 0;

    virtual PlayerState state() const = 0;
    virtual std::string errorMessage() const = 0;

    // 0.0 .. 1.0
    virtual bool setVolume(float volume) = 0;
    virtual float volume() const = 0;
};
