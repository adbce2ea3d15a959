#include <shade_map.h>
#include <shady_log.h>
#include <ArduinoJson.h>
#include <LittleFS.h>

namespace SHADY {
    static const char *TAG = "ShadeMap";

    shadeMap::shadeMap(const char *path) : _path(path) {}

    bool shadeMap::readRaw(RawShadeMap &raw) {
        if (!LittleFS.exists(_path.c_str())) {
            _error = "shade map " + _path + " not available";
            return false;
        }
        fs::File f = LittleFS.open(_path.c_str(), "r");
        if (!f) {
            _error = "cannot open " + _path;
            return false;
        }
        JsonDocument doc;
        DeserializationError error = deserializeJson(doc, f);
        f.close();
        if (error) {
            _error = std::string("failed to parse JSON: ") + error.c_str();
            return false;
        }
        if (!doc.is<JsonObject>()) {
            _error = "shade map must be a JSON object";
            return false;
        }

        for (JsonPair kv : doc.as<JsonObject>()) {
            std::string name = kv.key().c_str();
            if (!kv.value().is<JsonObject>()) {
                _error = "cover " + name + " must map to an object of relays";
                return false;
            }
            RawRelayMap relays;
            for (JsonPair op : kv.value().as<JsonObject>()) {
                if (!op.value().is<const char *>()) {
                    _error = "relay id of " + name + "." + op.key().c_str() + " must be a string";
                    return false;
                }
                relays.emplace_back(op.key().c_str(), op.value().as<std::string>());
            }
            raw.emplace_back(name, relays);
        }
        return true;
    }

    bool shadeMap::load() {
        _entries.clear();
        _error.clear();

        RawShadeMap raw;
        if (!readRaw(raw)) {
            SHADY_LOGW(TAG, "%s", _error.c_str());
            return false;
        }
        if (!validateShadeMap(raw, _entries, _error)) return false;

        SHADY_LOGI(TAG, "Loaded %u shades from %s", static_cast<unsigned>(_entries.size()), _path.c_str());
        return true;
    }
}
