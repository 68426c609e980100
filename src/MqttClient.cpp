#include <WiFi.h>
#include <WiFiClient.h>
#include <PubSubClient.h>

#include "MqttClient.h"
#include "MqttRouter.h"
#include "Log.h"

// --- Constants ------------------------------------------------

static const char* TOPIC_GLOBAL_CONFIG_ROOT = MEDIADECK_TOPIC_ROOT "/config";
static const char* TOPIC_ALL_CMD            = MEDIADECK_TOPIC_ROOT "/all/cmd";

static const char* AVAILABILITY_SUBTOPIC = "availability";
static const char* STATUS_ROOT_SUBTOPIC  = "status";

static const uint32_t RECONNECT_INTERVAL_MS = 5000;
static const uint32_t DEBOUNCE_STATE_MS     = 150;
static const size_t   MAX_QUEUED_LOG_LINES  = 32;
static const uint16_t MQTT_BUFFER_SIZE      = 2048;   // album list can be large

// We’ll use this static pointer so PubSubClient can call back into the instance
static MqttClient* s_instance = nullptr;

// --- Ctor -----------------------------------------------------

MqttClient::MqttClient(ConfigState& cfg)
: _cfg(cfg)
{
    s_instance = this;
}

// --- Public API -----------------------------------------------

void MqttClient::begin() {
    setupClient();
    // First connect attempt
    ensureConnected();
}

void MqttClient::loop() {
    if (!_mqtt) return;

    if (!_mqtt->loop()) {
        // Lost connection
        _connected = false;
    }

    if (!_connected) {
        _cfg.device.mqtt_isConnected = false;
        uint32_t now = millis();
        if (now - _lastReconnectAttemptMs > RECONNECT_INTERVAL_MS) {
            _lastReconnectAttemptMs = now;
            ensureConnected();
        }
    }

    if (!_connected) return;

    if (!_albumsPublished && !_albumsJson.empty()) {
        _albumsPublished = publish(std::string(STATUS_ROOT_SUBTOPIC) + "/albums", _albumsJson, true);
    }

    publishPendingState();
    flushLogs();
}

void MqttClient::publishAvailability(const char* state) {
    if (!_connected) return;
    publish(AVAILABILITY_SUBTOPIC, state, true); // retained
}

void MqttClient::publishStatus(const StatusSnapshot& st)
{
    if (!_connected) return;
    publish(std::string(STATUS_ROOT_SUBTOPIC) + "/device", buildDeviceJson(st));
}

void MqttClient::publishAlbums(const std::string& json) {
    _albumsJson      = json;
    _albumsPublished = false;   // sent from loop() once connected
}

void MqttClient::publishReply(bool success, const std::string& message) {
    if (!_connected) return;
    publish(std::string(STATUS_ROOT_SUBTOPIC) + "/reply", buildReplyJson(success, message));
}

void MqttClient::requestStatePublish() {
    // Schedule a debounced publish of the session state.
    _pendingStateChangedAtMs.store(millis());
    _hasPendingState.store(true);
}

void MqttClient::publishPendingState() {
    if (!_hasPendingState.load() || !_stateProvider) return;

    uint32_t now = millis();
    if (now - _pendingStateChangedAtMs.load() < DEBOUNCE_STATE_MS) return;

    _hasPendingState.store(false);
    const std::string json = _stateProvider();
    if (json == _lastPublishedState) return;

    if (publish(std::string(STATUS_ROOT_SUBTOPIC) + "/state", json)) {
        _lastPublishedState = json;
    }
}

void MqttClient::queueLog(LogLevel level, const char* line) {
    std::lock_guard<std::mutex> lock(_logMutex);
    if (_logQueue.size() >= MAX_QUEUED_LOG_LINES) {
        _logQueue.pop_front();   // oldest goes first
    }
    std::string entry = "[";
    entry += logLevelName(level);
    entry += "] ";
    entry += line;
    _logQueue.push_back(entry);
}

void MqttClient::flushLogs() {
    std::deque<std::string> lines;
    {
        std::lock_guard<std::mutex> lock(_logMutex);
        lines.swap(_logQueue);
    }
    const std::string sub = std::string(STATUS_ROOT_SUBTOPIC) + "/log";
    for (const std::string& line : lines) {
        publish(sub, line);
    }
}

bool MqttClient::publish(const std::string& subtopic, const std::string& payload, bool retained) {
    if (!_connected || !_mqtt) return false;
    const std::string topic = topicDeviceRoot() + "/" + subtopic;
    return _mqtt->publish(topic.c_str(), payload.c_str(), retained);
}

// --- Internal setup -------------------------------------------

void MqttClient::setupClient() {
    if (_wifiClient || _mqtt) return;

    _wifiClient = new WiFiClient();
    _mqtt = new PubSubClient(*_wifiClient);

    // PubSubClient keeps the pointer; a server change takes effect after reboot.
    _server = _cfg.global.mqttServer;
    _mqtt->setServer(_server.c_str(), _cfg.global.mqttPort);
    _mqtt->setBufferSize(MQTT_BUFFER_SIZE);
    _mqtt->setCallback(&MqttClient::_mqttCallbackThunk);
}

void MqttClient::ensureConnected() {
    if (_connected || !_mqtt) return;

    // Don’t even try if Wi-Fi is down; avoids useless DNS/TCP attempts
    if (WiFi.status() != WL_CONNECTED) {
        return;
    }

    if (connectOnce()) {
        _connected = true;
        _cfg.device.mqtt_isConnected = true;
        _albumsPublished = false;
        _lastPublishedState.clear();
        subscribeAll();
        publishAvailability("online");
        requestStatePublish();
        logf(LogLevel::Info, "MQTT connected");
    } else {
        logf(LogLevel::Warn, "MQTT connect to %s:%u failed, rc=%d",
             _server.c_str(), _cfg.global.mqttPort, _mqtt->state());
    }
}

bool MqttClient::connectOnce() {
    const auto eff = _cfg.effective();

    // Client ID = deviceId + random suffix
    char suffix[9];
    snprintf(suffix, sizeof(suffix), "%08lx", static_cast<unsigned long>(esp_random()));
    std::string clientId = eff.deviceId + "-" + suffix;

    // LWT topic
    std::string lwtTopic = topicDeviceRoot() + "/" + AVAILABILITY_SUBTOPIC;
    const char* lwtPayload = "offline";

    if (eff.mqttUsername.length() > 0) {
        return _mqtt->connect(
            clientId.c_str(),
            eff.mqttUsername.c_str(),
            eff.mqttPassword.c_str(),
            lwtTopic.c_str(),
            0,      // qos
            true,   // retained
            lwtPayload
        );
    } else {
        return _mqtt->connect(
            clientId.c_str(),
            lwtTopic.c_str(),
            0,
            true,
            lwtPayload
        );
    }
}

void MqttClient::subscribeAll() {
    // 1) Global config
    // subscribe to mediadeck/config/#
    std::string globalCfg = std::string(TOPIC_GLOBAL_CONFIG_ROOT) + "/#";
    _mqtt->subscribe(globalCfg.c_str());

    // 2) Global commands
    _mqtt->subscribe(TOPIC_ALL_CMD);

    // 3) Per-device config + commands
    std::string devConfigRoot = topicDeviceConfigRoot() + "/#";  // mediadeck/{device}/config/#
    _mqtt->subscribe(devConfigRoot.c_str());

    std::string devCmd = topicDeviceRoot() + "/cmd";
    _mqtt->subscribe(devCmd.c_str());
    std::string devPlay = devCmd + "/play";
    _mqtt->subscribe(devPlay.c_str());
}

// --- Topic helpers --------------------------------------------

std::string MqttClient::topicDeviceRoot() const {
    return deviceRootTopic(_cfg.device.deviceId);
}

std::string MqttClient::topicDeviceConfigRoot() const {
    return topicDeviceRoot() + "/config";
}

// --- Callback plumbing ----------------------------------------

void MqttClient::_mqttCallbackThunk(char* topic, uint8_t* payload, unsigned int length) {
    if (s_instance) {
        s_instance->handleIncoming(topic, payload, length);
    }
}

void MqttClient::handleIncoming(const char* topic, const uint8_t* payload, unsigned int length) {
    std::string t(topic);
    std::string p(reinterpret_cast<const char*>(payload), length);

    // Routing (config vs commands) lives in MqttRouter.
    if (_onMessage) {
        _onMessage(t, p);
    }
}
