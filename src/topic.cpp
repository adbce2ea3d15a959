#include <topic.h>

#include <algorithm>
#include <cctype>
#include <vector>

namespace SHADY {
    namespace {
        constexpr char TOPIC_DELIM = '/';

        bool entityFromString(const std::string &s, Entity &out) {
            if (s == "cover") { out = Entity::Cover; return true; }
            if (s == "relay") { out = Entity::Relay; return true; }
            if (s == "input") { out = Entity::Input; return true; }
            return false;
        }

        bool actionFromString(const std::string &s, Action &out) {
            if (s == "set") { out = Action::Command; return true; }
            if (s == "state") { out = Action::State; return true; }
            if (s == "position") { out = Action::Position; return true; }
            return false;
        }
    }

    const char *entityToString(Entity entity) {
        switch (entity) {
            case Entity::Cover: return "cover";
            case Entity::Relay: return "relay";
            case Entity::Input: return "input";
        }
        return "";
    }

    const char *actionToString(Action action) {
        switch (action) {
            case Action::Command: return "set";
            case Action::State: return "state";
            case Action::Position: return "position";
        }
        return "";
    }

    const char *payloadToString(Payload payload) {
        switch (payload) {
            case Payload::On: return "ON";
            case Payload::Off: return "OFF";
            case Payload::Open: return "OPEN";
            case Payload::Close: return "CLOSE";
            case Payload::Stop: return "STOP";
            case Payload::Unknown: break;
        }
        return "";
    }

    std::string topicFor(const std::string &base, Entity entity, const std::string &name, Action action) {
        std::string topic;
        topic.reserve(base.size() + name.size() + 20);
        topic += base;
        topic += TOPIC_DELIM;
        topic += entityToString(entity);
        topic += TOPIC_DELIM;
        topic += name;
        topic += TOPIC_DELIM;
        topic += actionToString(action);
        return topic;
    }

    bool isTopicSegment(const std::string &segment) {
        if (segment.empty()) return false;
        return std::all_of(segment.begin(), segment.end(), [](unsigned char c) {
            return std::isalnum(c) || c == '_';
        });
    }

    bool parseTopic(const std::string &topic, TopicParts &out) {
        std::vector<std::string> segments;
        size_t start = 0;
        while (true) {
            size_t pos = topic.find(TOPIC_DELIM, start);
            segments.push_back(topic.substr(start, pos - start));
            if (pos == std::string::npos) break;
            if (segments.size() > 4) return false;
            start = pos + 1;
        }
        if (segments.size() != 4) return false;

        TopicParts parts;
        if (!isTopicSegment(segments[0]) || !isTopicSegment(segments[2])) return false;
        if (!entityFromString(segments[1], parts.entity)) return false;
        if (!actionFromString(segments[3], parts.action)) return false;
        parts.base = segments[0];
        parts.name = segments[2];
        out = parts;
        return true;
    }

    Payload parsePayload(const std::string &payload) {
        if (payload == "ON") return Payload::On;
        if (payload == "OFF") return Payload::Off;
        if (payload == "OPEN") return Payload::Open;
        if (payload == "CLOSE") return Payload::Close;
        if (payload == "STOP") return Payload::Stop;
        return Payload::Unknown;
    }
}
