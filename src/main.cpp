#include <SD.h>
#include <M5Unified.h>
#include <esp_task_wdt.h>
#include <millisDelay.h>
#include <WiFi.h>

#include <memory>

#include "ScreenModule.h"
#include "NetworkModule.h"
#include "PrefsModule.h"

#include "AudioEngine.h"
#include "DeckController.h"
#include "M5KeySurface.h"
#include "SdCatalog.h"

#include "ConfigState.h"
#include "Log.h"
#include "MqttClient.h"
#include "MqttRouter.h"
#include "StatusReport.h"

millisDelay ms_startup;

// Global state
ConfigState  g_config;
MqttClient   g_mqtt(g_config);
AudioEngine  g_audio;
M5KeySurface g_surface;
std::unique_ptr<DeckController> g_deck;

uint32_t g_bootMillis;

MqttCommand g_pendingCommand;


StatusSnapshot buildStatusSnapshot() {
    auto eff = g_config.effective();

    StatusSnapshot st;
    st.uptimeSec  = (millis() - g_bootMillis) / 1000;
    st.rssi       = static_cast<int8_t>(WiFi.RSSI());
    st.freeHeap   = ESP.getFreeHeap();
    st.brightness = eff.brightness;
    st.volume     = g_audio.volume();
    st.firmwareVersion = "1.0.0-mqtt";
    st.buildDateTime   = eff.buildDateTime;
    st.hwRevision      = M5.getBoard() == m5::board_t::board_M5StackCoreS3 ? "M5Stack-CoreS3" : "M5Stack-Core2";
    return st;
}


void onMqttMessage(const std::string& topic, const std::string& payload) {
    logf(LogLevel::Debug, "[MQTT] %s => %s", topic.c_str(), payload.c_str());

    // Route into ConfigState, and capture any command
    MqttCommand cmd;
    const bool changed = handleMqttMessage(g_config, topic, payload, cmd);
    if (cmd.type != MqttCommandType::None) g_pendingCommand = cmd;

    if (changed) {
        const auto eff = g_config.effective();
        setLogLevel(eff.logLevel);
        if (g_deck) g_deck->applyConfig(eff);
        g_mqtt.requestStatePublish();
    }
}


// Runs on the loop task; replies go to status/reply.
static void handlePendingCommand(const MqttCommand& cmd) {
    logf(LogLevel::Info, "[MQTT] %s command received", mqttCommandName(cmd.type));

    if (cmd.type == MqttCommandType::Reboot) {
        g_mqtt.publishReply(true, "Rebooting.");
        g_mqtt.publishAvailability("offline");
        g_mqtt.loop();
        delay(100);
        ESP.restart();
        return;
    }
    if (cmd.type == MqttCommandType::ResyncTime) {
        requestTimeResync();
        g_mqtt.publishReply(true, "Time resync requested.");
        return;
    }

    if (!g_deck) {
        g_mqtt.publishReply(false, "Deck is not ready.");
        return;
    }

    PlaybackController& playback = g_deck->playback();
    bool ok = false;

    switch (cmd.type) {
        case MqttCommandType::PlayPause: {
            const SessionSnapshot session = playback.snapshot();
            if (!session.item) {
                g_mqtt.publishReply(false, "No media is currently playing.");
                return;
            }
            ok = playback.playPauseToggle(session.item);
            g_mqtt.publishReply(ok, playback.lastResult());
            break;
        }

        case MqttCommandType::Pause:
            ok = playback.pause();
            g_mqtt.publishReply(ok, playback.lastResult());
            break;

        case MqttCommandType::Resume:
            ok = playback.resume();
            g_mqtt.publishReply(ok, playback.lastResult());
            break;

        case MqttCommandType::Stop:
            ok = playback.stop();
            g_mqtt.publishReply(ok, playback.lastResult());
            break;

        case MqttCommandType::NextTrack:
            ok = playback.nextTrack();
            g_mqtt.publishReply(ok, playback.lastResult());
            break;

        case MqttCommandType::PreviousTrack:
            ok = playback.previousTrack();
            g_mqtt.publishReply(ok, playback.lastResult());
            break;

        case MqttCommandType::CarouselNext:
            g_deck->carouselNext();
            g_mqtt.publishReply(true, "Carousel moved forward.");
            break;

        case MqttCommandType::CarouselPrevious:
            g_deck->carouselPrevious();
            g_mqtt.publishReply(true, "Carousel moved back.");
            break;

        case MqttCommandType::PlayIndex: {
            std::string error;
            if (cmd.index < 0) {
                g_mqtt.publishReply(false, "Album index out of range");
                break;
            }
            ok = g_deck->playIndex(static_cast<size_t>(cmd.index), &error);
            g_mqtt.publishReply(ok, ok ? "Playing album " + std::to_string(cmd.index) + "." : error);
            break;
        }

        default:
            break;
    }
}


void setup () {

    Serial.begin(115200);

    auto cfg = M5.config();
    M5.begin(cfg);
    M5.Display.setRotation(1);
    // The decoder drives I2S itself.
    M5.Speaker.end();

    // Log sink: console + MQTT status/log
    setLogSink([](LogLevel level, const char* line) {
        Serial.printf("[%s] %s\n", logLevelName(level), line);
        g_mqtt.queueLog(level, line);
    });

    // Set deviceId and friendly deviceName
    uint8_t macAddress[6];
    WiFi.macAddress(macAddress);

    // Build deviceId from last 3 bytes of MAC
    char id[7];
    snprintf(id, sizeof(id), "%02X%02X%02X", macAddress[3], macAddress[4], macAddress[5]);
    g_config.device.deviceId   = id;
    g_config.device.deviceName = "MediaDeck-" + g_config.device.deviceId;

    changeScreen(SCREEN_STARTUP);
    startupLog("Starting...", 1);

    // Preferences
    startupLog("Initializing preferences...", 1);
    prefs_begin(g_config);
    setLogLevel(g_config.effective().logLevel);

    // Catalog
    MediaLibrary library;
    startupLog("Mounting SD card...", 1);
    if (sdCatalog_mount()) {
        sdCatalog_load(library, g_config.effective());
        char buff[65];
        snprintf(buff, sizeof(buff), "Catalog: %u items", static_cast<unsigned>(library.size()));
        startupLog(buff, 1);
    } else {
        startupLog("No SD card, catalog is empty.", 1);
    }

    startupLog("Initializing audio...", 1);
    if (!g_audio.begin()) {
        startupLog("Audio initialization failed.", 1);
    }

    ms_startup.start(30000);
    bool wifi_isInited = false;
    bool mqtt_isInited = false;
    while (ms_startup.isRunning()) {

        if (!wifi_isInited) {
            wifi_isInited = true;
            startupLog("Initializing WiFi...", 1);
            WiFi_setup();
        }

        WiFi_onLoop();

        if (!mqtt_isInited && WiFi.status() == WL_CONNECTED) {
            mqtt_isInited = true;
            startupLog("Initializing MQTT...", 1);
            g_mqtt.setMessageHandler(onMqttMessage);
            g_mqtt.begin();
        }

        g_mqtt.loop();

        if (!g_config.device.ntp_isSynchronized) {
            // Will loop until NTP sync or timeout
            serviceTimeInit();
        }

        if (wifi_isInited && mqtt_isInited && g_config.device.ntp_isSynchronized) {
            ms_startup.stop();
            startupLog("Startup complete.", 1);
        }

        // Timeout hit?
        if (ms_startup.justFinished()) {
            ms_startup.stop();
            startupLog("Startup incomplete.", 1);
        }

        delay(10);
    }

    g_bootMillis = millis();

    // Deck
    const auto eff = g_config.effective();
    changeScreen(SCREEN_DECK);
    g_surface.begin();
    g_deck.reset(new DeckController(std::move(library), g_audio, g_surface, eff));
    g_deck->setChangeObserver([]() { g_mqtt.requestStatePublish(); });
    g_mqtt.setStateProvider([]() {
        const SessionSnapshot session = g_deck->playback().snapshot();
        return buildStateJson(session, g_deck->carousel().startIndex(), g_deck->surfaceConnected());
    });
    g_deck->begin();
    g_mqtt.publishAlbums(buildAlbumsJson(g_deck->library()));
    g_mqtt.requestStatePublish();

    // Init task watchdog: 60s timeout, panic = true (print backtrace & reset)
    esp_task_wdt_init(60, true);
    // Watch the current (Arduino) task
    esp_task_wdt_add(NULL);

    logf(LogLevel::Info, "BUILD_DATETIME from config: '%s'", eff.buildDateTime.c_str());

}


void loop () {

    // Feed the watchdog
    esp_task_wdt_reset();

    M5.update();
    WiFi_onLoop();
    g_mqtt.loop();
    serviceTimeInit();      // first time NTP
    events();               // ezTime

    // Periodic status publish
    static uint32_t lastStatusMs = 0;
    const auto eff = g_config.effective();
    uint32_t now = millis();
    if (now - lastStatusMs > (uint32_t)eff.statusIntervalSec * 1000UL) {
        lastStatusMs = now;
        g_mqtt.publishStatus(buildStatusSnapshot());
        g_mqtt.requestStatePublish();
    }

    // Handle pending command
    if (g_pendingCommand.type != MqttCommandType::None) {
        MqttCommand cmd = g_pendingCommand;
        g_pendingCommand = MqttCommand();  // consume it
        handlePendingCommand(cmd);
    }

    // Touch edges into the key tracker
    g_surface.poll([](uint8_t key, bool pressed) {
        g_deck->onKeyTransition(key, pressed);
    });

    refreshScreen();

}
