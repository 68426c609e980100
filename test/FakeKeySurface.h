#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <thread>

#include "KeySurface.h"

// Records the last face drawn on every key, and counts calls that arrive
// while another surface call is still in progress.
class FakeKeySurface : public KeySurface {
public:
    explicit FakeKeySurface(uint8_t keys = 6) : _keys(keys) {}

    uint8_t keyCount() const override { return _keys; }
    bool isConnected() const override { return true; }

    void renderKey(uint8_t key, const KeyFace& face) override {
        enter();
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _faces[key] = face;
            ++_renders;
        }
        leave();
    }

    void setBrightness(uint8_t percent) override {
        enter();
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _brightness = percent;
        }
        leave();
    }

    // Every call sleeps this long, widening any overlap.
    void setCallDelayMs(int ms) { _callDelayMs = ms; }
    int overlappingCalls() const { return _overlaps.load(); }

    KeyFace face(uint8_t key) const {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _faces.find(key);
        return it == _faces.end() ? KeyFace() : it->second;
    }

    bool rendered(uint8_t key) const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _faces.count(key) != 0;
    }

    int renders() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _renders;
    }

    uint8_t brightness() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _brightness;
    }

private:
    void enter() {
        if (_busy.exchange(true)) ++_overlaps;
        const int delay = _callDelayMs.load();
        if (delay > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }
    void leave() { _busy = false; }

    const uint8_t              _keys;
    std::atomic<bool>          _busy{false};
    std::atomic<int>           _overlaps{0};
    std::atomic<int>           _callDelayMs{0};
    mutable std::mutex         _mutex;
    std::map<uint8_t, KeyFace> _faces;
    int                        _renders    = 0;
    uint8_t                    _brightness = 0;
};
