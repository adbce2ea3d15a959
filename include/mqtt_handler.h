#ifndef MQTT_HANDLER_H
#define MQTT_HANDLER_H

#include <AsyncMqttClient.h>
#include <mutex>
#include <string>

#include <publisher.h>
#include <shade_registry.h>

extern "C" {
#include "freertos/FreeRTOS.h"
#include "freertos/timers.h"
}

extern AsyncMqttClient mqttClient;
extern TimerHandle_t mqttReconnectTimer;
extern TimerHandle_t heartbeatTimer;

/* Publisher handed to the shade controllers, backed by mqttClient */
class MqttPublisher : public SHADY::Publisher {
public:
    bool publish(const std::string &topic, const std::string &payload) override;

private:
    std::mutex _lock;
};

void initMqtt(SHADY::ShadeRegistry *registry);
void connectToMqtt();
void onMqttConnect(bool sessionPresent);
void onMqttDisconnect(AsyncMqttClientDisconnectReason reason);
void onMqttMessage(char *topic, char *payload,
                   AsyncMqttClientMessageProperties properties,
                   size_t len, size_t index, size_t total);
void publishHeartbeat(TimerHandle_t timer);

#endif // MQTT_HANDLER_H
