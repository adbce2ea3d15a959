#ifndef SHADY_SHADE_CONFIG_H
#define SHADY_SHADE_CONFIG_H

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace SHADY {
    struct ShadeEntry {
        std::string name;
        std::string openRelay;
        std::string closeRelay;
    };

    // Shade map as read from storage, in file order: shade -> [(op, relay id)]
    using RawRelayMap = std::vector<std::pair<std::string, std::string>>;
    using RawShadeMap = std::vector<std::pair<std::string, RawRelayMap>>;

    struct ControllerSettings {
        std::string coverBase;
        std::string relayBase;
        uint32_t tickMs = 0;
        uint32_t travelTimeMs = 0;
        int maxPosition = 0;
        uint32_t feedbackTimeoutMs = 0;   ///< 0 waits for relay feedback forever
    };

    /**
     * @brief Checks the shade map and converts it to shade entries.
     *
     * Rejects ops other than open/close, a shade whose open and close relay
     * are the same, and any relay id used twice across the whole map.
     *
     * @return false with a human readable reason in @p error.
     */
    bool validateShadeMap(const RawShadeMap &raw, std::vector<ShadeEntry> &out, std::string &error);

    bool validateSettings(const ControllerSettings &settings, std::string &error);

    /// Decimal digits only, no sign or blanks, at most @p limit
    bool parseSettingNumber(const std::string &text, uint32_t limit, uint32_t &out);
}

#endif // SHADY_SHADE_CONFIG_H
