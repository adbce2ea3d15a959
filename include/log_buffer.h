#ifndef LOG_BUFFER_H
#define LOG_BUFFER_H
#include <Arduino.h>
#include <vector>

#include <shady_log.h>

void addLogMessage(const String &msg);
std::vector<String> getLogMessages();

// Sink for the shade core: ESP log, the buffer above and syslog
void logBufferSink(SHADY::LogLevel level, const char *tag, const char *message);

#endif // LOG_BUFFER_H
