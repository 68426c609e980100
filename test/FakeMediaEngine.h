#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "MediaEngine.h"

// Scriptable MediaEngine. Records every call; end-of-stream is raised by the
// test through finish().
class FakeMediaEngine : public MediaEngine {
public:
    bool play(const std::string& pathRef, EndOfStreamHandler onEnd) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _calls.push_back("play " + pathRef);
        if (_failPlay) {
            _error = "Playback did not start successfully: error";
            return false;
        }
        _played.push_back(pathRef);
        _onEnd = onEnd;
        _state = PlayerState::Playing;
        _error.clear();
        return true;
    }

    bool pause() override {
        std::lock_guard<std::mutex> lock(_mutex);
        _calls.push_back("pause");
        if (_failPause) {
            _error = "Pause error: decoder busy";
            return false;
        }
        _state = PlayerState::Paused;
        return true;
    }

    bool resume() override {
        std::lock_guard<std::mutex> lock(_mutex);
        _calls.push_back("resume");
        if (_failResume) {
            _error = "Resume error: decoder busy";
            return false;
        }
        _state = PlayerState::Playing;
        return true;
    }

    bool stop() override {
        std::lock_guard<std::mutex> lock(_mutex);
        _calls.push_back("stop");
        if (_failStop) {
            _error = "Stop error: decoder busy";
            return false;
        }
        _onEnd = nullptr;
        _state = PlayerState::Stopped;
        return true;
    }

    PlayerState state() const override {
        std::lock_guard<std::mutex> lock(_mutex);
        return _state;
    }

    std::string errorMessage() const override {
        std::lock_guard<std::mutex> lock(_mutex);
        return _error;
    }

    bool setVolume(float volume) override {
        std::lock_guard<std::mutex> lock(_mutex);
        if (volume < 0.0f || volume > 1.0f) {
            _error = "Volume out of range";
            return false;
        }
        _volume = volume;
        return true;
    }

    float volume() const override {
        std::lock_guard<std::mutex> lock(_mutex);
        return _volume;
    }

    // Raise end-of-stream for the current play, once. Returns false when no
    // handler is registered (stopped or already finished).
    bool finish() {
        EndOfStreamHandler handler;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            handler.swap(_onEnd);
            if (handler) _state = PlayerState::Ended;
        }
        if (!handler) return false;
        handler();
        return true;
    }

    // Keep the handler of the current play so it can be raised late.
    EndOfStreamHandler takeHandler() {
        std::lock_guard<std::mutex> lock(_mutex);
        EndOfStreamHandler handler;
        handler.swap(_onEnd);
        return handler;
    }

    void failPlay(bool fail)   { std::lock_guard<std::mutex> lock(_mutex); _failPlay = fail; }
    void failPause(bool fail)  { std::lock_guard<std::mutex> lock(_mutex); _failPause = fail; }
    void failResume(bool fail) { std::lock_guard<std::mutex> lock(_mutex); _failResume = fail; }
    void failStop(bool fail)   { std::lock_guard<std::mutex> lock(_mutex); _failStop = fail; }

    std::vector<std::string> played() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _played;
    }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _calls;
    }

    std::string lastPlayed() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _played.empty() ? std::string() : _played.back();
    }

    bool hasHandler() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return static_cast<bool>(_onEnd);
    }

private:
    mutable std::mutex       _mutex;
    PlayerState              _state  = PlayerState::Stopped;
    std::string              _error;
    float                    _volume = 1.0f;
    EndOfStreamHandler       _onEnd;
    std::vector<std::string> _played;
    std::vector<std::string> _calls;
    bool _failPlay   = false;
    bool _failPause  = false;
    bool _failResume = false;
    bool _failStop   = false;
};
