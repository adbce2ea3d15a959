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

#ifndef SHADY_USER_H
#define SHADY_USER_H

#include <cstdint>
#include <string>

// WiFi credentials are handled via WiFiManager

// Default MQTT configuration. These values can be changed at runtime through
// the interactive command interface and are then kept in NVS.
inline std::string mqtt_server = "";
inline std::string mqtt_user = "mosquitto";
inline std::string mqtt_password = "";
inline uint16_t mqtt_port = 1883;
inline std::string mqtt_client_id = "shady";

// Topic bases: {cover_base}/cover/{shade}/..., {relay_base}/relay/{relay}/...
inline std::string cover_base_topic = "homeassistant";
inline std::string relay_base_topic = "shady";

// Position estimate: a shade needs travel_time_ms to go from 0 to max_position,
// the estimate moves every tick_ms.
inline uint32_t tick_ms = 500;
inline uint32_t travel_time_ms = 30000;
inline int max_position = 100;
// 0 waits for relay feedback forever
inline uint32_t feedback_timeout_ms = 0;

#define SHADES_FILE "/shades.json"

#define SYSLOG                       // Comment out to disable remote syslog
inline std::string syslog_server = "";
inline uint16_t syslog_port = 514;

#define SERIALSPEED         115200

#endif
