#ifndef SHADY_SHADE_REGISTRY_H
#define SHADY_SHADE_REGISTRY_H

#include <memory>
#include <string>
#include <vector>

#include <publisher.h>
#include <shade_config.h>
#include <shade_controller.h>

namespace SHADY {
    /* All shade controllers of this gateway. Shades share nothing but the publisher. */
    class ShadeRegistry {
    public:
        ShadeRegistry(const std::vector<ShadeEntry> &entries, const ControllerSettings &settings, Publisher &publisher);

        /// Every cover command topic plus the relay state wildcard
        std::vector<std::string> subscriptions() const;

        /// @return false for traffic no shade is interested in
        bool dispatch(const std::string &topic, const std::string &payload);

        ShadeController *find(const std::string &name) const;
        ShadeController *findByRelay(const std::string &relayId) const;
        const std::vector<std::unique_ptr<ShadeController>> &getShades() const { return _shades; }
        const ControllerSettings &getSettings() const { return _settings; }

        bool anyFailed() const;
        void shutdownAll();

    private:
        const ControllerSettings _settings;
        std::vector<std::unique_ptr<ShadeController>> _shades;
    };
}

#endif // SHADY_SHADE_REGISTRY_H
