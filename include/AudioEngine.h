#pragma once

#include <Arduino.h>
#include <mutex>
#include <string>

#include "MediaEngine.h"

class Audio;

// I2S pins of the M5Stack Core2 speaker.
constexpr int AUDIO_PIN_BCLK = 12;
constexpr int AUDIO_PIN_LRCK = 0;
constexpr int AUDIO_PIN_DOUT = 2;

// ESP32-audioI2S decoder behind the MediaEngine interface.
//
// audio.loop() runs in its own task pinned to core 1; every other call into
// the decoder takes the same lock. End-of-stream arrives from that task and
// is handed to the handler registered by the last successful play().
class AudioEngine : public MediaEngine {
public:
    AudioEngine();
    ~AudioEngine() override;

    // Must be called once after SD is mounted.
    bool begin(int bclk = AUDIO_PIN_BCLK, int lrck = AUDIO_PIN_LRCK, int dout = AUDIO_PIN_DOUT);

    bool play(const std::string& pathRef, EndOfStreamHandler onEnd) override;
    bool pause() override;
    bool resume() override;
    bool stop() override;

    PlayerState state() const override;
    std::string errorMessage() const override;

    bool setVolume(float volume) override;
    float volume() const override;

    // Called from the decoder's eof callbacks.
    void onEndOfStream(const char* info);

private:
    static void audioTask(void* arg);

    void setError(const char* prefix, const char* detail);

    Audio*       _audio = nullptr;
    TaskHandle_t _task  = nullptr;

    // Guards the decoder object itself.
    mutable std::recursive_mutex _audioMutex;

    // Guards the fields below.
    mutable std::mutex  _stateMutex;
    PlayerState         _state  = PlayerState::Stopped;
    std::string         _error;
    float               _volume = 1.0f;
    EndOfStreamHandler  _onEnd;
};
