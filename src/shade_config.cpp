#include <shade_config.h>
#include <shade_position.h>
#include <shady_log.h>
#include <topic.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <set>

namespace SHADY {
    static const char *TAG = "Config";

    static bool reject(std::string &error, const std::string &reason) {
        error = reason;
        SHADY_LOGW(TAG, "%s", reason.c_str());
        return false;
    }

    bool validateShadeMap(const RawShadeMap &raw, std::vector<ShadeEntry> &out, std::string &error) {
        std::vector<ShadeEntry> entries;
        std::set<std::string> names;
        std::set<std::string> relays;

        if (raw.empty())
            return reject(error, "no shade configured");

        for (const auto &shade : raw) {
            const std::string &name = shade.first;
            if (!isTopicSegment(name))
                return reject(error, "shade name '" + name + "' is not a valid topic segment");
            if (!names.insert(name).second)
                return reject(error, "shade " + name + " is defined twice");

            ShadeEntry entry;
            entry.name = name;
            bool hasOpen = false;
            bool hasClose = false;
            for (const auto &op : shade.second) {
                if (op.first == "open" && !hasOpen) {
                    entry.openRelay = op.second;
                    hasOpen = true;
                } else if (op.first == "close" && !hasClose) {
                    entry.closeRelay = op.second;
                    hasClose = true;
                } else if (op.first == "open" || op.first == "close") {
                    return reject(error, "op " + op.first + " given twice for cover " + name);
                } else {
                    return reject(error, "op " + op.first + " is not one of open, close");
                }
            }
            if (!hasOpen || !hasClose)
                return reject(error, "cover " + name + " needs both an open and a close relay");
            if (!isTopicSegment(entry.openRelay) || !isTopicSegment(entry.closeRelay))
                return reject(error, "relay ids of cover " + name + " are not valid topic segments");
            if (entry.openRelay == entry.closeRelay)
                return reject(error, "found duplicate relay for cover " + name);

            for (const std::string *relay : {&entry.openRelay, &entry.closeRelay}) {
                if (!relays.insert(*relay).second)
                    return reject(error, "Non-unique relay name " + *relay);
            }
            entries.push_back(entry);
        }

        out = entries;
        return true;
    }

    bool validateSettings(const ControllerSettings &settings, std::string &error) {
        if (!isTopicSegment(settings.coverBase))
            return reject(error, "cover base topic '" + settings.coverBase + "' is not a valid topic segment");
        if (!isTopicSegment(settings.relayBase))
            return reject(error, "relay base topic '" + settings.relayBase + "' is not a valid topic segment");
        if (settings.tickMs == 0)
            return reject(error, "tick period must be positive");
        if (settings.travelTimeMs == 0)
            return reject(error, "travel time must be positive");
        if (settings.maxPosition <= 0)
            return reject(error, "max position must be positive");
        const int increment = ShadePosition::computeIncrement(settings.maxPosition, settings.tickMs, settings.travelTimeMs);
        if (increment < 1)
            return reject(error, "tick period too short for the travel time, position would never move");
        if (settings.maxPosition > std::numeric_limits<int>::max() - increment)
            return reject(error, "max position too large");
        return true;
    }

    bool parseSettingNumber(const std::string &text, uint32_t limit, uint32_t &out) {
        if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) return false;
        errno = 0;
        char *end = nullptr;
        unsigned long long parsed = std::strtoull(text.c_str(), &end, 10);
        if (errno == ERANGE || *end != '\0' || parsed > limit) return false;
        out = static_cast<uint32_t>(parsed);
        return true;
    }
}
