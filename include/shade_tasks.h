#ifndef SHADY_SHADE_TASKS_H
#define SHADY_SHADE_TASKS_H

#include <shade_registry.h>

// Two FreeRTOS tasks per shade: command loop and position ticker.
// Feedback runs in the MQTT client task. Calling it again is a no-op.
void startShadeTasks(SHADY::ShadeRegistry &registry);

// A failed shade is fatal for the gateway: restart the device
void superviseShades(SHADY::ShadeRegistry &registry);

#endif // SHADY_SHADE_TASKS_H
