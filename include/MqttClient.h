#pragma once

#include <M5Unified.h>
#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include "ConfigState.h"
#include "StatusReport.h"

class WiFiClient;
class PubSubClient;

// Thin wrapper managing topics + callbacks.
//
// PubSubClient is driven from the Arduino loop task only. Other tasks
// (timers, decoder, end-of-stream worker) go through queueLog() and
// requestStatePublish(), which are safe from any thread.
class MqttClient {
public:
    using MessageHandler = std::function<void(const std::string& topic, const std::string& payload)>;
    using StateProvider  = std::function<std::string()>;

    explicit MqttClient(ConfigState& cfg);

    // Must be called from setup() after Wi-Fi is up.
    void begin();

    // Call from loop()
    void loop();

    // Publish a device status snapshot
    void publishStatus(const StatusSnapshot& status);

    // Publish availability: "online" or "offline"
    void publishAvailability(const char* state);

    // Retained album list; re-sent after every reconnect.
    void publishAlbums(const std::string& json);

    // Command result on status/reply
    void publishReply(bool success, const std::string& message);

    // Debounced status/state publish; the JSON comes from the provider.
    void setStateProvider(StateProvider provider) { _stateProvider = provider; }
    void requestStatePublish();

    // Thread-safe; flushed to status/log from loop().
    void queueLog(LogLevel level, const char* line);

    // Set callback for *all* inbound topics we care about
    void setMessageHandler(MessageHandler handler) { _onMessage = handler; }

    bool isConnected() const { return _connected; }

private:
    ConfigState& _cfg;
    WiFiClient*  _wifiClient = nullptr;
    PubSubClient* _mqtt = nullptr;
    std::string  _server;
    bool         _connected = false;
    uint32_t     _lastReconnectAttemptMs = 0;

    MessageHandler _onMessage;
    StateProvider  _stateProvider;

    std::string _albumsJson;
    bool        _albumsPublished = false;

    // Debounce state for /status/state publishes
    std::atomic<bool>     _hasPendingState{false};
    std::atomic<uint32_t> _pendingStateChangedAtMs{0};
    std::string           _lastPublishedState;

    // Log lines waiting for loop()
    std::mutex              _logMutex;
    std::deque<std::string> _logQueue;

    // Internal helpers
    void setupClient();
    void ensureConnected();
    bool connectOnce();
    void subscribeAll();
    void flushLogs();
    void publishPendingState();
    bool publish(const std::string& subtopic, const std::string& payload, bool retained = false);

    // PubSub callback
    static void _mqttCallbackThunk(char* topic, uint8_t* payload, unsigned int length);
    void handleIncoming(const char* topic, const uint8_t* payload, unsigned int length);

    // Topic builders
    std::string topicDeviceRoot() const;       // mediadeck/{device}
    std::string topicDeviceConfigRoot() const; // mediadeck/{device}/config
};
