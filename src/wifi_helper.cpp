/*
   Copyright (c) 2024. CRIDP https://github.com/cridp

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

           http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include <wifi_helper.h>
#include <mqtt_handler.h>
#include <shady_log.h>
#include <WiFiManager.h>

TimerHandle_t wifiReconnectTimer;

ConnState wifiStatus = ConnState::Disconnected;

static const char *TAG = "WiFi";

void initWifi() {
    wifiReconnectTimer = xTimerCreate(
        "wifiTimer",
        pdMS_TO_TICKS(35000),
        pdFALSE,
        nullptr,
        reinterpret_cast<TimerCallbackFunction_t>(connectToWifi)
    );
    if (!wifiReconnectTimer) {
        SHADY_LOGE(TAG, "Failed to create WiFi reconnect timer");
    }
    connectToWifi();
}

void connectToWifi() {
    SHADY_LOGI(TAG, "Connecting to Wi-Fi via WiFiManager...");
    wifiStatus = ConnState::Connecting;

    WiFi.mode(WIFI_STA);
    WiFiManager wm;
    wm.setConnectTimeout(22);
    wm.setConfigPortalTimeout(180);
    bool res = wm.autoConnect("shady-setup");

    if (!res) {
        SHADY_LOGW(TAG, "WiFiManager failed to connect");
        wifiStatus = ConnState::Disconnected;

        // Retry later
        if (wifiReconnectTimer) {
            xTimerStart(wifiReconnectTimer, 0);
        }
        return;
    }
    SHADY_LOGI(TAG, "Connected to WiFi. IP address: %s", WiFi.localIP().toString().c_str());
    wifiStatus = ConnState::Connected;
    // MQTT is only armed once a shade map was accepted
    if (mqttReconnectTimer) {
        xTimerStart(mqttReconnectTimer, 0);
    }
}

void checkWifiConnection() {
    if (WiFi.status() == WL_CONNECTED || wifiStatus != ConnState::Connected) return;

    SHADY_LOGW(TAG, "WiFi connection lost");
    wifiStatus = ConnState::Disconnected;
    if (mqttReconnectTimer) {
        xTimerStop(mqttReconnectTimer, 0);
    }
    if (wifiReconnectTimer) {
        xTimerStart(wifiReconnectTimer, 0);
    }
}
