#include <mqtt_handler.h>

#include <AsyncMqttClient.h>
#include <WiFi.h>
#include <interact.h>
#include <shade_tasks.h>
#include <shady_log.h>
#include <user_config.h>
#include <cstring>

AsyncMqttClient mqttClient;
TimerHandle_t mqttReconnectTimer;
TimerHandle_t heartbeatTimer;

static SHADY::ShadeRegistry *shades = nullptr;
static std::string availabilityTopic;
static bool everConnected = false;
static const char *TAG = "MQTT";

bool MqttPublisher::publish(const std::string &topic, const std::string &payload) {
    std::lock_guard<std::mutex> lock(_lock);
    if (!mqttClient.connected()) return false;
    return mqttClient.publish(topic.c_str(), 0, false, payload.c_str(), payload.size()) != 0;
}

void initMqtt(SHADY::ShadeRegistry *registry) {
    shades = registry;
    if (mqtt_server.empty()) {
        SHADY_LOGE(TAG, "MQTT server not set, use: set mqtt_server <host>");
        return;
    }
    availabilityTopic = mqtt_client_id + "/status";

    mqttClient.setWill(availabilityTopic.c_str(), 0, true, "offline");
    mqttClient.setClientId(mqtt_client_id.c_str());
    mqttClient.setCredentials(mqtt_user.c_str(), mqtt_password.c_str());
    mqttClient.setServer(mqtt_server.c_str(), mqtt_port);
    mqttClient.onConnect(onMqttConnect);
    mqttClient.onDisconnect(onMqttDisconnect);
    mqttClient.onMessage(onMqttMessage);
    mqttReconnectTimer = xTimerCreate("mqttTimer", pdMS_TO_TICKS(5000), pdFALSE,
                                      nullptr,
                                      reinterpret_cast<TimerCallbackFunction_t>(connectToMqtt));
    if (WiFi.status() == WL_CONNECTED) {
        connectToMqtt();
    }
}

void publishHeartbeat(TimerHandle_t) {
    mqttClient.publish(availabilityTopic.c_str(), 0, true, "online");
}

void connectToMqtt() {
    if (mqttClient.connected() || mqttStatus == ConnState::Connecting) {
        return;  // Avoid parallel connection attempts
    }
    if (mqttReconnectTimer) {
        xTimerStop(mqttReconnectTimer, 0);
    }
    if (WiFi.status() != WL_CONNECTED) {
        SHADY_LOGW(TAG, "WiFi not connected, delaying MQTT connection");
        if (mqttReconnectTimer) {
            xTimerStart(mqttReconnectTimer, pdMS_TO_TICKS(5000));
        }
        return;
    }
    SHADY_LOGI(TAG, "Connecting to MQTT at %s:%u...", mqtt_server.c_str(), mqtt_port);
    mqttStatus = ConnState::Connecting;
    mqttClient.connect();
}

void onMqttConnect(bool sessionPresent) {
    SHADY_LOGI(TAG, "Connected to MQTT (session present: %d)", sessionPresent);
    mqttStatus = ConnState::Connected;
    everConnected = true;

    for (const auto &topic : shades->subscriptions()) {
        SHADY_LOGD(TAG, "subscribe %s", topic.c_str());
        mqttClient.subscribe(topic.c_str(), 0);
    }

    if (!heartbeatTimer)
        heartbeatTimer = xTimerCreate("hb", pdMS_TO_TICKS(60000), pdTRUE, nullptr, publishHeartbeat);
    xTimerStart(heartbeatTimer, 0);
    publishHeartbeat(nullptr);

    startShadeTasks(*shades);
}

void onMqttDisconnect(AsyncMqttClientDisconnectReason reason) {
    mqttStatus = ConnState::Disconnected;
    if (heartbeatTimer) {
        xTimerStop(heartbeatTimer, 0);
    }
    if (everConnected) {
        // Relay feedback can no longer arrive, no shade state can be trusted
        SHADY_LOGE(TAG, "Disconnected from MQTT. Reason: %u", static_cast<unsigned>(reason));
        for (const auto &shade : shades->getShades())
            shade->fail("message bus disconnected");
        return;
    }
    SHADY_LOGW(TAG, "MQTT connection failed. Reason: %u, retrying", static_cast<unsigned>(reason));
    if (WiFi.status() == WL_CONNECTED && mqttReconnectTimer) {
        xTimerStart(mqttReconnectTimer, 0);
    }
}

void onMqttMessage(char *topic, char *payload, AsyncMqttClientMessageProperties properties,
                   size_t len, size_t index, size_t total) {
    if (!topic) return;
    // Commands and relay states are a few bytes, fragments are not ours
    if (index != 0 || len != total) return;

    std::string topicStr(topic);
    std::string payloadStr(payload ? payload : "", payload ? len : 0);

    if (!shades->dispatch(topicStr, payloadStr)) {
        SHADY_LOGD(TAG, "Unhandled MQTT %s %s", topicStr.c_str(), payloadStr.c_str());
    }
}
