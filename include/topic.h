#ifndef SHADY_TOPIC_H
#define SHADY_TOPIC_H

#include <cstdint>
#include <string>

/*
    Bus subjects are always "{base}/{entity}/{name}/{action}".
    Every segment is a run of word characters [A-Za-z0-9_].
*/
namespace SHADY {
    enum class Entity : uint8_t { Cover, Relay, Input };

    enum class Action : uint8_t {
        Command,    ///< "set"
        State,      ///< "state"
        Position    ///< "position"
    };

    enum class Payload : uint8_t { On, Off, Open, Close, Stop, Unknown };

    struct TopicParts {
        std::string base;
        Entity entity = Entity::Cover;
        std::string name;
        Action action = Action::Command;
    };

    const char *entityToString(Entity entity);
    const char *actionToString(Action action);
    const char *payloadToString(Payload payload);

    std::string topicFor(const std::string &base, Entity entity, const std::string &name, Action action);

    /**
     * @brief Splits a topic into its four parts.
     * @return false when the topic does not follow the pattern. Callers drop
     * such traffic, it is not an error.
     */
    bool parseTopic(const std::string &topic, TopicParts &out);

    /// Exact, case sensitive match on ON/OFF/OPEN/CLOSE/STOP
    Payload parsePayload(const std::string &payload);

    bool isTopicSegment(const std::string &segment);
}

#endif // SHADY_TOPIC_H
