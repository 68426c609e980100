#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "Log.h"
#include "MediaItem.h"

// Poll cond until it holds or timeoutMs passes.
inline bool waitUntil(const std::function<bool()>& cond, int timeoutMs = 2000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return cond();
}

inline void sleepMs(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

inline MediaItemPtr makeAlbum(const std::string& name, size_t trackCount) {
    std::vector<Track> tracks;
    for (size_t i = 0; i < trackCount; ++i) {
        Track t;
        t.path = "/music/" + name + "/" + std::to_string(i + 1) + ".mp3";
        tracks.push_back(t);
    }
    return std::make_shared<MediaItem>(name, "/music/" + name, MediaType::Album,
                                       "/music/" + name + "/cover.jpg", tracks);
}

inline MediaItemPtr makeStream(const std::string& name) {
    return std::make_shared<MediaItem>(name, "http://radio.example/" + name, MediaType::Stream);
}

// Captures log lines for the lifetime of the object.
class LogCapture {
public:
    explicit LogCapture(LogLevel level = LogLevel::Debug) : _previous(logLevel()) {
        setLogLevel(level);
        setLogSink([this](LogLevel, const char* line) {
            std::lock_guard<std::mutex> lock(_mutex);
            _lines.push_back(line);
        });
    }
    ~LogCapture() {
        setLogSink(LogSink());
        setLogLevel(_previous);
    }

    bool contains(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(_mutex);
        for (const auto& l : _lines) {
            if (l.find(needle) != std::string::npos) return true;
        }
        return false;
    }

private:
    LogLevel                 _previous;
    mutable std::mutex       _mutex;
    std::vector<std::string> _lines;
};
