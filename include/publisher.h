#ifndef SHADY_PUBLISHER_H
#define SHADY_PUBLISHER_H

#include <string>

namespace SHADY {
    /* Outbound side of the message bus, shared by every shade */
    class Publisher {
    public:
        virtual ~Publisher() = default;

        /// @return false when the message could not be handed to the bus
        virtual bool publish(const std::string &topic, const std::string &payload) = 0;
    };
}

#endif // SHADY_PUBLISHER_H
