#ifndef SHADY_TEST_FAKE_PUBLISHER_H
#define SHADY_TEST_FAKE_PUBLISHER_H

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <publisher.h>
#include <shade_config.h>
#include <topic.h>

namespace SHADY {
    using Message = std::pair<std::string, std::string>;

    /*
        Records everything published. With echo on it plays the relay board:
        a write to {relayBase}/relay/{id}/set comes straight back as
        {relayBase}/relay/{id}/state through the delivery callback.
    */
    class FakePublisher : public Publisher {
    public:
        using Delivery = std::function<void(const std::string &, const std::string &)>;

        bool publish(const std::string &topic, const std::string &payload) override {
            if (failing.load()) return false;
            {
                std::lock_guard<std::mutex> lock(_lock);
                _messages.emplace_back(topic, payload);
            }
            TopicParts parts;
            if (echo.load() && _deliver && parseTopic(topic, parts) &&
                parts.entity == Entity::Relay && parts.action == Action::Command) {
                _deliver(topicFor(parts.base, Entity::Relay, parts.name, Action::State), payload);
            }
            return true;
        }

        void setDelivery(Delivery deliver) { _deliver = std::move(deliver); }

        std::vector<Message> messages() const {
            std::lock_guard<std::mutex> lock(_lock);
            return _messages;
        }

        std::vector<std::string> payloadsOn(const std::string &topic) const {
            std::vector<std::string> out;
            for (const auto &m : messages())
                if (m.first == topic) out.push_back(m.second);
            return out;
        }

        size_t count(const std::string &topic, const std::string &payload) const {
            size_t n = 0;
            for (const auto &m : messages())
                if (m.first == topic && m.second == payload) ++n;
            return n;
        }

        void clear() {
            std::lock_guard<std::mutex> lock(_lock);
            _messages.clear();
        }

        std::atomic<bool> echo{true};
        std::atomic<bool> failing{false};

    private:
        mutable std::mutex _lock;
        std::vector<Message> _messages;
        Delivery _deliver;
    };

    inline ControllerSettings testSettings(uint32_t feedbackTimeoutMs = 0) {
        ControllerSettings settings;
        settings.coverBase = "homeassistant";
        settings.relayBase = "shady";
        settings.tickMs = 500;
        settings.travelTimeMs = 30000;
        settings.maxPosition = 100;
        settings.feedbackTimeoutMs = feedbackTimeoutMs;
        return settings;
    }
}

#endif // SHADY_TEST_FAKE_PUBLISHER_H
