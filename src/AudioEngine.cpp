#include <Arduino.h>
#include <SD.h>
#include <Audio.h>      // https://github.com/schreibfaul1/ESP32-audioI2S

#include "AudioEngine.h"
#include "Log.h"

static constexpr uint8_t  DECODER_MAX_VOLUME   = 21;
static constexpr uint32_t START_TIMEOUT_MS     = 5000;
static constexpr uint32_t START_POLL_MS        = 100;

// The decoder reports end-of-stream through free functions.
static AudioEngine* s_engine = nullptr;

void audio_eof_mp3(const char* info) {
    if (s_engine) s_engine->onEndOfStream(info);
}

void audio_eof_stream(const char* info) {
    if (s_engine) s_engine->onEndOfStream(info);
}

void audio_info(const char* info) {
    logf(LogLevel::Debug, "[audio] %s", info);
}

static bool isUrl(const std::string& ref) {
    return ref.compare(0, 7, "http://") == 0 || ref.compare(0, 8, "https://") == 0;
}

AudioEngine::AudioEngine() {
    s_engine = this;
}

AudioEngine::~AudioEngine() {
    if (_task) {
        vTaskDelete(_task);
        _task = nullptr;
    }
    delete _audio;
    if (s_engine == this) s_engine = nullptr;
}

bool AudioEngine::begin(int bclk, int lrck, int dout) {
    std::lock_guard<std::recursive_mutex> lock(_audioMutex);
    if (_audio) return true;

    _audio = new Audio();
    _audio->setPinout(bclk, lrck, dout);
    _audio->setVolume(static_cast<uint8_t>(_volume * DECODER_MAX_VOLUME + 0.5f));
    _audio->setBalance(0);

    BaseType_t ok = xTaskCreatePinnedToCore(audioTask, "Task_Audio", 10240, this, 3, &_task, 1);
    if (ok != pdPASS) {
        setError("Audio init error", "could not start decoder task");
        return false;
    }
    logf(LogLevel::Info, "[audio] Decoder ready (bclk=%d lrck=%d dout=%d)", bclk, lrck, dout);
    return true;
}

void AudioEngine::audioTask(void* arg) {
    AudioEngine* self = static_cast<AudioEngine*>(arg);
    const TickType_t playDelay = pdMS_TO_TICKS(1);
    const TickType_t idleDelay = pdMS_TO_TICKS(20);

    while (true) {
        bool running;
        {
            std::lock_guard<std::recursive_mutex> lock(self->_audioMutex);
            self->_audio->loop();
            running = self->_audio->isRunning();
        }
        vTaskDelay(running ? playDelay : idleDelay);
    }
}

bool AudioEngine::play(const std::string& pathRef, EndOfStreamHandler onEnd) {
    if (!_audio) {
        setError("Play error", "decoder not initialized");
        return false;
    }

    {
        std::lock_guard<std::recursive_mutex> lock(_audioMutex);
        {
            std::lock_guard<std::mutex> st(_stateMutex);
            _onEnd = nullptr;           // the previous item must not report its end
            _state = PlayerState::Opening;
            _error.clear();
        }
        if (_audio->isRunning()) {
            _audio->stopSong();
        }

        bool ok;
        if (isUrl(pathRef)) {
            ok = _audio->connecttohost(pathRef.c_str());
        } else {
            ok = _audio->connecttoFS(SD, pathRef.c_str());
        }
        if (!ok) {
            setError("Play error", pathRef.c_str());
            return false;
        }

        std::lock_guard<std::mutex> st(_stateMutex);
        _onEnd = std::move(onEnd);
    }

    // Give the decoder time to open the source and start running.
    for (uint32_t waited = 0; waited < START_TIMEOUT_MS; waited += START_POLL_MS) {
        {
            std::lock_guard<std::recursive_mutex> lock(_audioMutex);
            std::lock_guard<std::mutex> st(_stateMutex);
            if (_state == PlayerState::Ended) {
                return true;            // very short source, already finished
            }
            if (_audio->isRunning()) {
                _state = PlayerState::Playing;
                logf(LogLevel::Debug, "[audio] Playing %s", pathRef.c_str());
                return true;
            }
        }
        vTaskDelay(pdMS_TO_TICKS(START_POLL_MS));
    }

    std::lock_guard<std::recursive_mutex> lock(_audioMutex);
    _audio->stopSong();
    {
        std::lock_guard<std::mutex> st(_stateMutex);
        _onEnd = nullptr;
    }
    setError("Playback did not start successfully", playerStateName(PlayerState::Opening));
    return false;
}

bool AudioEngine::pause() {
    std::lock_guard<std::recursive_mutex> lock(_audioMutex);
    {
        std::lock_guard<std::mutex> st(_stateMutex);
        if (_state != PlayerState::Playing) {
            _error = std::string("Pause error: not playing (") + playerStateName(_state) + ")";
            return false;
        }
    }
    if (!_audio->pauseResume()) {
        setError("Pause error", "decoder refused");
        return false;
    }
    std::lock_guard<std::mutex> st(_stateMutex);
    _state = PlayerState::Paused;
    return true;
}

bool AudioEngine::resume() {
    std::lock_guard<std::recursive_mutex> lock(_audioMutex);
    {
        std::lock_guard<std::mutex> st(_stateMutex);
        if (_state != PlayerState::Paused) {
            _error = std::string("Resume error: not paused (") + playerStateName(_state) + ")";
            return false;
        }
    }
    if (!_audio->pauseResume()) {
        setError("Resume error", "decoder refused");
        return false;
    }
    std::lock_guard<std::mutex> st(_stateMutex);
    _state = PlayerState::Playing;
    return true;
}

bool AudioEngine::stop() {
    std::lock_guard<std::recursive_mutex> lock(_audioMutex);
    {
        std::lock_guard<std::mutex> st(_stateMutex);
        _onEnd = nullptr;
    }
    if (_audio) {
        _audio->stopSong();
    }
    std::lock_guard<std::mutex> st(_stateMutex);
    _state = PlayerState::Stopped;
    _error.clear();
    return true;
}

PlayerState AudioEngine::state() const {
    std::lock_guard<std::mutex> st(_stateMutex);
    return _state;
}

std::string AudioEngine::errorMessage() const {
    std::lock_guard<std::mutex> st(_stateMutex);
    return _error;
}

bool AudioEngine::setVolume(float volume) {
    if (volume < 0.0f || volume > 1.0f) {
        std::lock_guard<std::mutex> st(_stateMutex);
        _error = "Volume error: out of range";
        return false;
    }
    {
        std::lock_guard<std::mutex> st(_stateMutex);
        _volume = volume;
    }
    std::lock_guard<std::recursive_mutex> lock(_audioMutex);
    if (_audio) {
        _audio->setVolume(static_cast<uint8_t>(volume * DECODER_MAX_VOLUME + 0.5f));
    }
    return true;
}

float AudioEngine::volume() const {
    std::lock_guard<std::mutex> st(_stateMutex);
    return _volume;
}

// Decoder task, inside audio.loop().
void AudioEngine::onEndOfStream(const char* info) {
    EndOfStreamHandler handler;
    {
        std::lock_guard<std::mutex> st(_stateMutex);
        _state = PlayerState::Ended;
        handler.swap(_onEnd);       // fire once
    }
    logf(LogLevel::Info, "[audio] End of stream: %s", info ? info : "");
    if (handler) {
        handler();
    }
}

void AudioEngine::setError(const char* prefix, const char* detail) {
    std::lock_guard<std::mutex> st(_stateMutex);
    _state = PlayerState::Error;
    _error = std::string(prefix) + ": " + detail;
    logf(LogLevel::Error, "[audio] %s", _error.c_str());
}
