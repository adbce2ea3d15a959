#include <shade_registry.h>
#include <shady_log.h>
#include <topic.h>

#include <algorithm>

namespace SHADY {
    static const char *TAG = "Registry";

    ShadeRegistry::ShadeRegistry(const std::vector<ShadeEntry> &entries, const ControllerSettings &settings,
                                 Publisher &publisher)
            : _settings(settings) {
        SHADY_LOGI(TAG, "building shades from config");
        for (const auto &entry : entries) {
            SHADY_LOGI(TAG, "shade %s: open relay %s, close relay %s",
                       entry.name.c_str(), entry.openRelay.c_str(), entry.closeRelay.c_str());
            _shades.push_back(std::make_unique<ShadeController>(entry, settings, publisher));
        }
    }

    std::vector<std::string> ShadeRegistry::subscriptions() const {
        std::vector<std::string> topics;
        for (const auto &shade : _shades)
            topics.push_back(shade->getCommandTopic());
        topics.push_back(topicFor(_settings.relayBase, Entity::Relay, "+", Action::State));
        return topics;
    }

    bool ShadeRegistry::dispatch(const std::string &topic, const std::string &payload) {
        TopicParts parts;
        if (!parseTopic(topic, parts)) {
            SHADY_LOGD(TAG, "ignoring topic %s", topic.c_str());
            return false;
        }

        ShadeController *shade = nullptr;
        if (parts.entity == Entity::Cover && parts.action == Action::Command && parts.base == _settings.coverBase)
            shade = find(parts.name);
        else if (parts.entity == Entity::Relay && parts.action == Action::State && parts.base == _settings.relayBase)
            shade = findByRelay(parts.name);

        if (!shade) {
            SHADY_LOGD(TAG, "no shade for %s", topic.c_str());
            return false;
        }
        return shade->onMessage(topic, payload);
    }

    ShadeController *ShadeRegistry::find(const std::string &name) const {
        auto it = std::find_if(_shades.begin(), _shades.end(), [&](const auto &s) { return s->getName() == name; });
        return it != _shades.end() ? it->get() : nullptr;
    }

    ShadeController *ShadeRegistry::findByRelay(const std::string &relayId) const {
        auto it = std::find_if(_shades.begin(), _shades.end(), [&](const auto &s) { return s->ownsRelay(relayId); });
        return it != _shades.end() ? it->get() : nullptr;
    }

    bool ShadeRegistry::anyFailed() const {
        return std::any_of(_shades.begin(), _shades.end(),
                           [](const auto &s) { return s->getPhase() == Phase::Failed; });
    }

    void ShadeRegistry::shutdownAll() {
        SHADY_LOGI(TAG, "stopping %u shades", static_cast<unsigned>(_shades.size()));
        for (auto &shade : _shades)
            shade->shutdown();
    }
}
