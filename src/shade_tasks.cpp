#include <shade_tasks.h>
#include <shady_log.h>
#include <Arduino.h>

extern "C" {
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
}

static const char *TAG = "Tasks";
static bool started = false;

static void shadeCommandTask(void *arg) {
    static_cast<SHADY::ShadeController *>(arg)->runCommandLoop();
    vTaskDelete(nullptr);
}

static void shadeTickTask(void *arg) {
    static_cast<SHADY::ShadeController *>(arg)->runTickLoop();
    vTaskDelete(nullptr);
}

void startShadeTasks(SHADY::ShadeRegistry &registry) {
    if (started) return;
    started = true;

    for (const auto &shade : registry.getShades()) {
        std::string cmdName = "cmd_" + shade->getName();
        std::string tickName = "pos_" + shade->getName();
        // FreeRTOS truncates names to configMAX_TASK_NAME_LEN
        BaseType_t cmdOk = xTaskCreatePinnedToCore(shadeCommandTask, cmdName.c_str(), 4096,
                                                   shade.get(), 1, nullptr, tskNO_AFFINITY);
        BaseType_t tickOk = xTaskCreatePinnedToCore(shadeTickTask, tickName.c_str(), 4096,
                                                    shade.get(), 1, nullptr, tskNO_AFFINITY);
        if (cmdOk != pdPASS || tickOk != pdPASS) {
            shade->fail("cannot create tasks");
            continue;
        }
        SHADY_LOGI(TAG, "start monitoring shade %s", shade->getName().c_str());
    }
}

void superviseShades(SHADY::ShadeRegistry &registry) {
    if (!registry.anyFailed()) return;

    for (const auto &shade : registry.getShades()) {
        if (shade->getPhase() == SHADY::Phase::Failed)
            SHADY_LOGE(TAG, "shade %s failed", shade->getName().c_str());
    }
    registry.shutdownAll();
    SHADY_LOGE(TAG, "restarting");
    vTaskDelay(pdMS_TO_TICKS(2000));   // let the log reach serial and syslog
    ESP.restart();
}
