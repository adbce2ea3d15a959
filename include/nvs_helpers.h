#ifndef NVS_HELPERS_H
#define NVS_HELPERS_H

#include <cstdint>
#include <string>

// NVS keys for persisted settings. Keys must be <=15 characters.
static constexpr char NVS_KEY_MQTT_SERVER[] = "mqtt_server";
static constexpr char NVS_KEY_MQTT_USER[] = "mqtt_user";
static constexpr char NVS_KEY_MQTT_PASSWORD[] = "mqtt_password";
static constexpr char NVS_KEY_MQTT_PORT[] = "mqtt_port";
static constexpr char NVS_KEY_COVER_BASE[] = "cover_base";
static constexpr char NVS_KEY_RELAY_BASE[] = "relay_base";
static constexpr char NVS_KEY_TICK_MS[] = "tick_ms";
static constexpr char NVS_KEY_TRAVEL_MS[] = "travel_ms";
static constexpr char NVS_KEY_MAX_POSITION[] = "max_position";
static constexpr char NVS_KEY_FB_TIMEOUT[] = "fb_timeout_ms";
static constexpr char NVS_KEY_SYSLOG_SERVER[] = "syslog_server";
static constexpr char NVS_KEY_SYSLOG_PORT[] = "syslog_port";

bool nvs_init();

bool nvs_read_string(const char *key, std::string &value);
void nvs_write_string(const char *key, const std::string &value);
bool nvs_read_u16(const char *key, uint16_t &value);
void nvs_write_u16(const char *key, uint16_t value);
bool nvs_read_u32(const char *key, uint32_t &value);
void nvs_write_u32(const char *key, uint32_t value);

// Overrides the user_config.h defaults with whatever is stored
void loadSettings();
// Persists one setting given by NVS key, @return false for an unknown key or value
bool storeSetting(const std::string &key, const std::string &value);
void printSettings();

#endif // NVS_HELPERS_H
