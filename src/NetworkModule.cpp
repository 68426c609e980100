#include <M5Unified.h>

#include "ConfigState.h"
#include "NetworkModule.h"
#include "PrefsModule.h"
#include "ScreenModule.h"
#include "Log.h"


extern ConfigState g_config;

WiFiManager wm;
Timezone localTime;

// NTP is attempted once per (re)connect, a little after the IP arrives.
struct TimeSync {
    bool     requested     = false;
    uint32_t requestedAtMs = 0;
    bool     done          = false;
};
static TimeSync s_timeSync;
static constexpr uint32_t TIME_SYNC_SETTLE_MS = 2000;
static constexpr uint16_t TIME_SYNC_TIMEOUT_SEC = 15;


static void bootMessage(const char* msg) {
    if (currentScreen == SCREEN_STARTUP) startupLog(msg, 1);
}


static void configurePortal(const std::string& hostname) {
    std::vector<const char*> menu = {"wifi", "info", "param", "sep", "restart", "exit"};
    wm.setMenu(menu);
    wm.setConfigPortalBlocking(false);
    wm.setDebugOutput(false);
    wm.setSaveParamsCallback(WiFi_onSaveParams);
    wm.setClass("invert");
    wm.setCountry("US");
    wm.setHostname(hostname.c_str());
    wm.setWiFiAutoReconnect(true);
    wm.setRemoveDuplicateAPs(false);
}


// Blocks while the captive portal is up; a tap on the screen gives up.
static void runPortalUntilDone() {
    bootMessage("No access point found!");
    bootMessage("Config portal started, tap to skip.");
    while (wm.getConfigPortalActive()) {
        wm.process();
        M5.update();
        if (M5.Touch.getDetail().wasReleased()) wm.stopConfigPortal();
        delay(5);
    }
    bootMessage("Config portal closed.");
}


void WiFi_setup() {

    const auto eff = g_config.effective();
    const std::string hostname = eff.deviceName.empty() ? eff.deviceId : eff.deviceName;

    WiFi.mode(WIFI_STA);
    WiFi.onEvent(WiFi_onEvent);
    WiFi.setScanMethod(WIFI_ALL_CHANNEL_SCAN);
    WiFi.setSortMethod(WIFI_CONNECT_AP_BY_SIGNAL);
    WiFi.setAutoReconnect(true);
    // Modem sleep causes audible drop-outs on streams.
    WiFi.setSleep(false);

    configurePortal(hostname);

    if (!wm.autoConnect(hostname.c_str())) {
        runPortalUntilDone();
    }

}


void WiFi_onLoop() {
    if (wm.getWebPortalActive()) wm.process();
}


static void syncTimeNow() {
    const std::string& server = g_config.global.ntpServer;
    const std::string& zone   = g_config.global.timeZone;

    logf(LogLevel::Info, "[net] NTP sync via %s, zone %s", server.c_str(), zone.c_str());
    bootMessage("Synchronizing time...");

    // ezTime keeps the pointers; the config strings outlive this call.
    setServer(server.c_str());
    if (!localTime.setCache("timezone", "localTime")) {
        localTime.setLocation(zone.c_str());
    }
    localTime.setDefault();

    if (!waitForSync(TIME_SYNC_TIMEOUT_SEC) || timeStatus() != timeSet) {
        logf(LogLevel::Warn, "[net] NTP sync failed");
        bootMessage("Time sync failed.");
        return;
    }

    s_timeSync.done = true;
    g_config.device.ntp_isSynchronized = true;

    char buff[65];
    snprintf(buff, sizeof(buff), "Local Time: %s", localTime.dateTime(ISO8601).c_str());
    logf(LogLevel::Info, "[net] %s", buff);
    bootMessage(buff);
}


void requestTimeInit() {
    s_timeSync.requested     = true;
    s_timeSync.requestedAtMs = millis();
}


void requestTimeResync() {
    s_timeSync.done = false;
    g_config.device.ntp_isSynchronized = false;
    requestTimeInit();
}


void serviceTimeInit() {
    if (!s_timeSync.requested || s_timeSync.done) return;
    if (millis() - s_timeSync.requestedAtMs < TIME_SYNC_SETTLE_MS) return;
    // Keep the request until the link is usable.
    if (WiFi.status() != WL_CONNECTED) return;

    s_timeSync.requested = false;
    syncTimeNow();
}


void WiFi_onEvent(WiFiEvent_t event) {

    switch (event) {

        case ARDUINO_EVENT_WIFI_STA_CONNECTED:
            logf(LogLevel::Info, "[WiFi] Associated with %s", WiFi.SSID().c_str());
            break;

        case ARDUINO_EVENT_WIFI_STA_GOT_IP: {
            char buff[65];
            snprintf(buff, sizeof(buff), "IP address: %s", WiFi.localIP().toString().c_str());
            logf(LogLevel::Info, "[WiFi] %s", buff);
            bootMessage(buff);
            if (!g_config.device.ntp_isSynchronized) requestTimeInit();
            break;
        }

        case ARDUINO_EVENT_WIFI_STA_DISCONNECTED:
            // Streams stall until auto-reconnect brings the link back.
            logf(LogLevel::Warn, "[WiFi] Link lost, reconnecting");
            break;

        case ARDUINO_EVENT_WIFI_AP_START:
            logf(LogLevel::Info, "[WiFi] Config portal AP up");
            break;

        default:
            logf(LogLevel::Debug, "[WiFi] event %d", static_cast<int>(event));
            break;

    }

}
