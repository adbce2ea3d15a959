#include <Preferences.h>
#include <Arduino.h>
#include "nvs_helpers.h"
#include <user_config.h>

#include <shade_config.h>

#include <limits>

static Preferences prefs;
static bool initialized = false;

bool nvs_init() {
    if (!initialized) {
        initialized = prefs.begin("shady", false);
    }
    return initialized;
}

bool nvs_read_string(const char *key, std::string &value) {
    if (!nvs_init()) return false;
    if (!prefs.isKey(key)) return false;
    value = std::string(prefs.getString(key, "").c_str());
    return true;
}

void nvs_write_string(const char *key, const std::string &value) {
    if (!nvs_init()) return;
    prefs.putString(key, value.c_str());
}

bool nvs_read_u16(const char *key, uint16_t &value) {
    if (!nvs_init()) return false;
    if (!prefs.isKey(key)) return false;
    value = prefs.getUShort(key, value);
    return true;
}

void nvs_write_u16(const char *key, uint16_t value) {
    if (!nvs_init()) return;
    prefs.putUShort(key, value);
}

bool nvs_read_u32(const char *key, uint32_t &value) {
    if (!nvs_init()) return false;
    if (!prefs.isKey(key)) return false;
    value = prefs.getULong(key, value);
    return true;
}

void nvs_write_u32(const char *key, uint32_t value) {
    if (!nvs_init()) return;
    prefs.putULong(key, value);
}

void loadSettings() {
    nvs_read_string(NVS_KEY_MQTT_SERVER, mqtt_server);
    nvs_read_string(NVS_KEY_MQTT_USER, mqtt_user);
    nvs_read_string(NVS_KEY_MQTT_PASSWORD, mqtt_password);
    nvs_read_u16(NVS_KEY_MQTT_PORT, mqtt_port);
    nvs_read_string(NVS_KEY_COVER_BASE, cover_base_topic);
    nvs_read_string(NVS_KEY_RELAY_BASE, relay_base_topic);
    nvs_read_u32(NVS_KEY_TICK_MS, tick_ms);
    nvs_read_u32(NVS_KEY_TRAVEL_MS, travel_time_ms);
    uint32_t maxPos = static_cast<uint32_t>(max_position);
    if (nvs_read_u32(NVS_KEY_MAX_POSITION, maxPos))
        max_position = static_cast<int>(maxPos);
    nvs_read_u32(NVS_KEY_FB_TIMEOUT, feedback_timeout_ms);
    nvs_read_string(NVS_KEY_SYSLOG_SERVER, syslog_server);
    nvs_read_u16(NVS_KEY_SYSLOG_PORT, syslog_port);
}

bool storeSetting(const std::string &key, const std::string &value) {
    static const char *const stringKeys[] = {
        NVS_KEY_MQTT_SERVER, NVS_KEY_MQTT_USER, NVS_KEY_MQTT_PASSWORD,
        NVS_KEY_COVER_BASE, NVS_KEY_RELAY_BASE, NVS_KEY_SYSLOG_SERVER
    };
    static const char *const u16Keys[] = {NVS_KEY_MQTT_PORT, NVS_KEY_SYSLOG_PORT};
    static const char *const u32Keys[] = {NVS_KEY_TICK_MS, NVS_KEY_TRAVEL_MS, NVS_KEY_MAX_POSITION, NVS_KEY_FB_TIMEOUT};

    for (const char *k : stringKeys) {
        if (key == k) {
            nvs_write_string(k, value);
            return true;
        }
    }
    uint32_t number = 0;
    for (const char *k : u16Keys) {
        if (key == k) {
            if (!SHADY::parseSettingNumber(value, 0xFFFF, number)) return false;
            nvs_write_u16(k, static_cast<uint16_t>(number));
            return true;
        }
    }
    for (const char *k : u32Keys) {
        if (key == k) {
            // max_position is read back as int
            const uint32_t limit = key == NVS_KEY_MAX_POSITION ? std::numeric_limits<int>::max()
                                                                : std::numeric_limits<uint32_t>::max();
            if (!SHADY::parseSettingNumber(value, limit, number)) return false;
            nvs_write_u32(k, number);
            return true;
        }
    }
    return false;
}

void printSettings() {
    Serial.printf("%-15s %s:%u\n", "mqtt", mqtt_server.c_str(), mqtt_port);
    Serial.printf("%-15s %s\n", NVS_KEY_MQTT_USER, mqtt_user.c_str());
    Serial.printf("%-15s %s\n", NVS_KEY_COVER_BASE, cover_base_topic.c_str());
    Serial.printf("%-15s %s\n", NVS_KEY_RELAY_BASE, relay_base_topic.c_str());
    Serial.printf("%-15s %u\n", NVS_KEY_TICK_MS, static_cast<unsigned>(tick_ms));
    Serial.printf("%-15s %u\n", NVS_KEY_TRAVEL_MS, static_cast<unsigned>(travel_time_ms));
    Serial.printf("%-15s %d\n", NVS_KEY_MAX_POSITION, max_position);
    Serial.printf("%-15s %u%s\n", NVS_KEY_FB_TIMEOUT, static_cast<unsigned>(feedback_timeout_ms), feedback_timeout_ms ? "" : " (wait forever)");
    Serial.printf("%-15s %s:%u\n", "syslog", syslog_server.empty() ? "-" : syslog_server.c_str(), syslog_port);
}
