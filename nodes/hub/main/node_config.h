#pragma once

// Hub node build settings. NVS values override the WiFi defaults.

#define NODE_FIRMWARE_VERSION "1.0.0"
#define NODE_ID "hub"

#ifndef WIFI_SSID
#define WIFI_SSID ""
#endif

#ifndef WIFI_PASSWORD
#define WIFI_PASSWORD ""
#endif

#define WIFI_CONNECT_TIMEOUT_MS 30000

// Session worker tasks
#define SESSION_TASK_STACK 8192
#define SESSION_TASK_PRIORITY 5

// Housekeeping loop
#define HUB_LOOP_INTERVAL_MS 1000
#define HUB_STATS_INTERVAL_MS 60000
