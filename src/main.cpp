/**
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

#include <Arduino.h>
#include <interact.h>
#include <log_buffer.h>
#include <mqtt_handler.h>
#include <nvs_helpers.h>
#include <shade_config.h>
#include <shade_map.h>
#include <shade_registry.h>
#include <shade_tasks.h>
#include <shady_log.h>
#include <syslog_helper.h>
#include <user_config.h>
#include <wifi_helper.h>
#include "LittleFS.h"
#include <WiFi.h>

#include <memory>

extern "C" {
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
}

static const char *TAG = "Main";

static MqttPublisher publisher;
static std::unique_ptr<SHADY::ShadeRegistry> shades;

/**
 * @brief Builds the registry from the persisted settings and the shade map.
 * @return nullptr when anything is rejected, the gateway then only serves the console
 */
static std::unique_ptr<SHADY::ShadeRegistry> loadShades() {
    SHADY::ControllerSettings settings;
    settings.coverBase = cover_base_topic;
    settings.relayBase = relay_base_topic;
    settings.tickMs = tick_ms;
    settings.travelTimeMs = travel_time_ms;
    settings.maxPosition = max_position;
    settings.feedbackTimeoutMs = feedback_timeout_ms;

    std::string error;
    if (!SHADY::validateSettings(settings, error)) {
        SHADY_LOGE(TAG, "Invalid settings: %s", error.c_str());
        return nullptr;
    }

    SHADY::shadeMap map(SHADES_FILE);
    if (!map.load()) {
        SHADY_LOGE(TAG, "Invalid shade map %s: %s", SHADES_FILE, map.getError().c_str());
        return nullptr;
    }
    SHADY_LOGI(TAG, "%u shades configured", static_cast<unsigned>(map.getEntries().size()));
    return std::make_unique<SHADY::ShadeRegistry>(map.getEntries(), settings, publisher);
}

void setup() {
    Serial.begin(SERIALSPEED);       //Start serial connection for debug and manual input
    SHADY::setLogSink(logBufferSink);

    nvs_init();
    loadSettings();

    if (!LittleFS.begin()) {
        SHADY_LOGE(TAG, "An Error has occurred while mounting LittleFS");
    } else {
        SHADY_LOGI(TAG, "LittleFS mounted successfully");
        shades = loadShades();
    }

    Cmd::createCommands(shades.get());
    Cmd::init();

    initWifi();
    // Wait for WiFi connection before syslog and MQTT
    while (WiFi.status() != WL_CONNECTED) {
        vTaskDelay(100 / portTICK_PERIOD_MS);
    }
    initSyslog();

    if (shades) {
        initMqtt(shades.get());
    } else {
        SHADY_LOGE(TAG, "No valid configuration, not connecting to MQTT");
    }

    Serial.printf("Startup completed. type help to see what you can do!\n");
}

void loop() {
    checkWifiConnection();
    if (shades) superviseShades(*shades);
    vTaskDelay(pdMS_TO_TICKS(500));
}
