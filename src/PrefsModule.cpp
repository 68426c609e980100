#include <WiFiManager.h>
#include <Preferences.h>

#include "PrefsModule.h"
#include "MqttRouter.h"
#include "NetworkModule.h"
#include "Log.h"


static constexpr const char* PREFS_NAMESPACE = "mediadeck";
static constexpr int         FIELD_LEN       = 32;

// NVS keys double as portal field ids.
static constexpr const char* KEY_SERVER   = "mqtt_server";
static constexpr const char* KEY_PORT     = "mqtt_port";
static constexpr const char* KEY_USERNAME = "mqtt_username";
static constexpr const char* KEY_PASSWORD = "mqtt_password";

static Preferences          s_prefs;
static WiFiManagerParameter s_serverField(KEY_SERVER, "MQTT Server IP/Host", "", FIELD_LEN);
static WiFiManagerParameter s_portField(KEY_PORT, "MQTT Server Port", "", 6);
static WiFiManagerParameter s_userField(KEY_USERNAME, "MQTT Username", "", FIELD_LEN);
static WiFiManagerParameter s_passField(KEY_PASSWORD, "MQTT Password", "", FIELD_LEN);

static ConfigState* s_config = nullptr;


static void fillPortal(const GlobalConfig& global) {
    char port[8];
    snprintf(port, sizeof(port), "%u", static_cast<unsigned>(global.mqttPort));

    s_serverField.setValue(global.mqttServer.c_str(), FIELD_LEN);
    s_portField.setValue(port, sizeof(port));
    s_userField.setValue(global.mqttUsername.c_str(), FIELD_LEN);
    s_passField.setValue(global.mqttPassword.c_str(), FIELD_LEN);
}


void prefs_begin(ConfigState& cfg) {
    s_config = &cfg;
    GlobalConfig& global = cfg.global;

    if (!s_prefs.begin(PREFS_NAMESPACE, true)) {
        // First boot: the namespace does not exist until something is stored.
        logf(LogLevel::Info, "[prefs] No stored broker settings, using defaults");
    } else {
        global.mqttServer   = s_prefs.getString(KEY_SERVER, ConfigDefaults::MQTT_SERVER).c_str();
        global.mqttPort     = s_prefs.getUShort(KEY_PORT, ConfigDefaults::MQTT_PORT);
        global.mqttUsername = s_prefs.getString(KEY_USERNAME, ConfigDefaults::MQTT_USERNAME).c_str();
        global.mqttPassword = s_prefs.getString(KEY_PASSWORD, ConfigDefaults::MQTT_PASSWORD).c_str();
        s_prefs.end();
    }
    if (global.mqttPort == 0) {
        global.mqttPort = ConfigDefaults::MQTT_PORT;
    }

    wm.addParameter(&s_serverField);
    wm.addParameter(&s_portField);
    wm.addParameter(&s_userField);
    wm.addParameter(&s_passField);
    fillPortal(global);

    logf(LogLevel::Debug, "[prefs] Broker %s:%u", global.mqttServer.c_str(),
         static_cast<unsigned>(global.mqttPort));
}


void prefs_store(const GlobalConfig& global) {
    if (!s_prefs.begin(PREFS_NAMESPACE, false)) {
        logf(LogLevel::Error, "[prefs] Could not open NVS namespace %s", PREFS_NAMESPACE);
        return;
    }
    s_prefs.putString(KEY_SERVER, global.mqttServer.c_str());
    s_prefs.putUShort(KEY_PORT, global.mqttPort);
    s_prefs.putString(KEY_USERNAME, global.mqttUsername.c_str());
    s_prefs.putString(KEY_PASSWORD, global.mqttPassword.c_str());
    s_prefs.end();
}


void WiFi_onSaveParams() {
    if (!s_config) return;

    // Same validation as mediadeck/config/<key>; a rejected value keeps
    // the current one.
    applyGlobalConfigKey(*s_config, KEY_SERVER, s_serverField.getValue());
    if (!applyGlobalConfigKey(*s_config, KEY_PORT, s_portField.getValue())) {
        fillPortal(s_config->global);
    }
    applyGlobalConfigKey(*s_config, KEY_USERNAME, s_userField.getValue());
    applyGlobalConfigKey(*s_config, KEY_PASSWORD, s_passField.getValue());

    prefs_store(s_config->global);
    logf(LogLevel::Info, "[prefs] Broker settings saved, applied after reboot");
}
