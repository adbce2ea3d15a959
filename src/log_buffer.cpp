#include <deque>
#include <mutex>
#include <vector>
#include <Arduino.h>
#include <esp_log.h>
#include <log_buffer.h>
#include <user_config.h>
#if defined(SYSLOG)
#include <syslog_helper.h>
#endif

namespace {
    std::deque<String> logDeque;
    std::mutex logDequeLock;
    const size_t MAX_LOG_ENTRIES = 50;

    esp_log_level_t toEspLevel(SHADY::LogLevel level) {
        switch (level) {
            case SHADY::LogLevel::Error: return ESP_LOG_ERROR;
            case SHADY::LogLevel::Warn: return ESP_LOG_WARN;
            case SHADY::LogLevel::Info: return ESP_LOG_INFO;
            case SHADY::LogLevel::Debug: return ESP_LOG_DEBUG;
        }
        return ESP_LOG_INFO;
    }
}

void addLogMessage(const String &msg) {
    std::lock_guard<std::mutex> lock(logDequeLock);
    if (logDeque.size() >= MAX_LOG_ENTRIES) {
        logDeque.pop_front();
    }
    logDeque.push_back(msg);
}

std::vector<String> getLogMessages() {
    std::lock_guard<std::mutex> lock(logDequeLock);
    return std::vector<String>(logDeque.begin(), logDeque.end());
}

void logBufferSink(SHADY::LogLevel level, const char *tag, const char *message) {
    ESP_LOG_LEVEL(toEspLevel(level), tag, "%s", message);

    String line = String(SHADY::logLevelToString(level)) + " " + tag + ": " + message;
    addLogMessage(line);
#if defined(SYSLOG)
    sendSyslog(level, tag, message);
#endif
}
