//   Copyright (c) 2025. CRIDP https://github.com/cridp
//
//   Licensed under the Apache License, Version 2.0 (the "License");
//   you may not use this file except in compliance with the License.
//   You may obtain a copy of the License at
//
//           http://www.apache.org/licenses/LICENSE-2.0
//
//   Unless required by applicable law or agreed to in writing, software
//   distributed under the License is distributed on an "AS IS" BASIS,
//   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//   See the License for the specific language governing permissions and
//   limitations under the License.

#ifndef SHADY_SHADE_MAP_H
#define SHADY_SHADE_MAP_H

#include <shade_config.h>
#include <string>
#include <vector>

/*
    Shade map file on LittleFS:
    {
      "kitchen": { "open": "relay_1", "close": "relay_2" },
      "bedroom": { "open": "relay_3", "close": "relay_4" }
    }
*/
namespace SHADY {
    class shadeMap {
    public:
        explicit shadeMap(const char *path);

        /// Reads and validates the file. @return false with the reason in getError()
        bool load();

        const std::vector<ShadeEntry> &getEntries() const { return _entries; }
        const std::string &getError() const { return _error; }

    private:
        bool readRaw(RawShadeMap &raw);

        std::string _path;
        std::vector<ShadeEntry> _entries;
        std::string _error;
    };
}

#endif // SHADY_SHADE_MAP_H
