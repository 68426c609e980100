#pragma once

#include "ConfigState.h"

// Broker settings (server, port, credentials) live in NVS and are edited
// from the WiFiManager captive portal. Everything else comes over MQTT.

// Load the stored broker settings into cfg.global and add the matching
// fields to the portal. cfg must outlive the portal.
void prefs_begin(ConfigState& cfg);

// Write cfg.global's broker settings back to NVS.
void prefs_store(const GlobalConfig& global);

// WiFiManager save-params callback.
void WiFi_onSaveParams();
