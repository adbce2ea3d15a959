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

#ifndef INTERACT_H
#define INTERACT_H
/*
  Serial command line interaction
*/
#include <user_config.h>

#include <string>
#include <vector>

#include <TickerUsESP32.h>

namespace SHADY {
  class ShadeRegistry;
}

enum class ConnState { Connecting, Connected, Disconnected };
extern ConnState mqttStatus;
extern ConnState wifiStatus;

using Tokens = std::vector<std::string>;

void tokenize(std::string const &str, const char delim, Tokens &out);

#define MAXCMDS 20

struct _cmdEntry {
    char cmd[15];
    char description[61];
    void (*handler)(Tokens*);
};
extern _cmdEntry* _cmdHandler[MAXCMDS];
extern uint8_t lastEntry;

namespace Cmd {

    extern TimersUS::TickerUsESP32 kbd_tick;

    bool addHandler(const char *cmd, const char *description, void (*handler)(Tokens*));

    const char *cmdReceived(bool echo = false);
    void cmdFuncHandler();
    // registry may be null when the configuration was rejected
    void createCommands(SHADY::ShadeRegistry *registry);
    void init();

}

#endif
