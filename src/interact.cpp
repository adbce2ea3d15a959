/*
   Copyright (c) 2024. CRIDP https://github.com/cridp

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

           http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
 */
#include <Arduino.h>
#include <interact.h>
#include <log_buffer.h>
#include <nvs_helpers.h>
#include <shade_registry.h>
#include <sstream>
#include <cstring>

ConnState mqttStatus = ConnState::Disconnected;

_cmdEntry* _cmdHandler[MAXCMDS];
uint8_t lastEntry = 0;

void tokenize(std::string const &str, const char delim, Tokens &out) {
  std::stringstream ss(str);
  std::string s;
  while (std::getline(ss, s, delim)) {
    if (!s.empty()) out.push_back(s);
  }
}

namespace Cmd {
    TimersUS::TickerUsESP32 kbd_tick;

    static SHADY::ShadeRegistry *shades = nullptr;
    static char _rxbuffer[128];
    static uint8_t _len = 0;

    static SHADY::ShadeController *shadeArg(Tokens *cmd) {
        if (!shades) {
            Serial.printf("*> No shades, configuration was rejected <*\n");
            return nullptr;
        }
        if (cmd->size() < 2) {
            Serial.printf("*> Missing shade name <*\n");
            return nullptr;
        }
        auto *shade = shades->find(cmd->at(1));
        if (!shade) Serial.printf("*> Unknown shade %s <*\n", cmd->at(1).c_str());
        return shade;
    }

    static void printStatus(const SHADY::ShadeStatus &s) {
        Serial.printf("%-12s %-8s dir %-8s pos %3d/%d  relays open %-3s close %-3s  %s%s\n",
                      s.name.c_str(), SHADY::shadeStateToString(s.state),
                      SHADY::directionToString(s.direction), s.position, s.maxPosition,
                      s.openRelayOn ? "ON" : "OFF", s.closeRelayOn ? "ON" : "OFF",
                      SHADY::phaseToString(s.phase), s.relayNotResponding ? " RELAY NOT RESPONDING" : "");
    }

    /**
     * The function `createCommands()` registers the console commands driving the
     * shades and the persisted settings.
     */
    void createCommands(SHADY::ShadeRegistry *registry) {
        shades = registry;

        Cmd::addHandler("open", "open <shade>", [](Tokens *cmd)-> void {
            if (auto *shade = shadeArg(cmd)) shade->submit(SHADY::Command::Open);
        });
        Cmd::addHandler("close", "close <shade>", [](Tokens *cmd)-> void {
            if (auto *shade = shadeArg(cmd)) shade->submit(SHADY::Command::Close);
        });
        Cmd::addHandler("stop", "stop <shade>", [](Tokens *cmd)-> void {
            if (auto *shade = shadeArg(cmd)) shade->submit(SHADY::Command::Stop);
        });
        Cmd::addHandler("status", "State, position and relays of every shade", [](Tokens *cmd)-> void {
            if (!shades) {
                Serial.printf("*> No shades, configuration was rejected <*\n");
                return;
            }
            for (const auto &shade : shades->getShades()) printStatus(shade->status());
        });
        // Settings
        Cmd::addHandler("config", "Print settings", [](Tokens *cmd)-> void { printSettings(); });
        Cmd::addHandler("set", "set <key> <value>, applied on restart", [](Tokens *cmd)-> void {
            if (cmd->size() < 3) {
                Serial.printf("*> Usage: set <key> <value> <*\n");
                return;
            }
            if (!storeSetting(cmd->at(1), cmd->at(2))) {
                Serial.printf("*> Unknown key or bad value %s <*\n", cmd->at(1).c_str());
                return;
            }
            Serial.printf("%s saved, restart to apply\n", cmd->at(1).c_str());
        });
        // Utils
        Cmd::addHandler("log", "Print recent log lines", [](Tokens *cmd)-> void {
            for (const auto &line : getLogMessages()) Serial.println(line);
        });
        Cmd::addHandler("restart", "Restart the gateway", [](Tokens *cmd)-> void {
            if (shades) shades->shutdownAll();
            ESP.restart();
        });
    }

    bool addHandler(const char *cmd, const char *description, void (*handler)(Tokens*)) {
      for (uint8_t idx = 0; idx < MAXCMDS; ++idx) {
        if (_cmdHandler[idx] != nullptr) continue;

        auto *entry = new _cmdEntry{};
        strncpy(entry->cmd, cmd, sizeof(entry->cmd) - 1);
        strncpy(entry->description, description, sizeof(entry->description) - 1);
        entry->handler = handler;
        _cmdHandler[idx] = entry;

        if (idx > lastEntry) lastEntry = idx;
        return true;
      }
      return false;
    }

    const char *cmdReceived(bool echo) {
      while (Serial.available()) {
        char c = static_cast<char>(Serial.read());
        if (echo) Serial.print(c);
        if (c == '\r') continue;
        if (c == '\n') {
          _rxbuffer[_len] = '\0';
          _len = 0;
          return _rxbuffer;
        }
        if (_len < sizeof(_rxbuffer) - 1) _rxbuffer[_len++] = c;
      }
      return nullptr;
    }

    void cmdFuncHandler() {
      constexpr char delim = ' ';
      Tokens segments;

      const auto cmd = cmdReceived(true);
      if (!cmd) return;
      if (!strlen(cmd)) return;

      tokenize(cmd, delim, segments);
      if (segments.empty()) return;
      if (strcmp("help", segments[0].c_str()) == 0) {
        Serial.printf("\nRegistered commands:\n");
        for (uint8_t idx = 0; idx <= lastEntry; ++idx) {
          if (_cmdHandler[idx] == nullptr)
            continue;
          Serial.printf("- %s\t%s\n", _cmdHandler[idx]->cmd, _cmdHandler[idx]->description);
        }
        Serial.printf("- %s\t%s\n\n", "help", "This command");
        return;
      }
      for (uint8_t idx = 0; idx <= lastEntry; ++idx) {
        if (_cmdHandler[idx] == nullptr) continue;
        if (strcmp(_cmdHandler[idx]->cmd, segments[0].c_str()) == 0) {
          _cmdHandler[idx]->handler(&segments);
          return;
        }
      }
      Serial.printf("*> Unknown <*\n");
    }

    void init() {
      kbd_tick.attach_ms(500, cmdFuncHandler);
    }
}
