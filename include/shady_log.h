#ifndef SHADY_LOG_H
#define SHADY_LOG_H

/*
  Log hook for the shade core. The core has no idea where lines end up:
  the firmware installs a sink that forwards to ESP_LOG, the log buffer
  and syslog, tests install a capturing one.
*/

namespace SHADY {
    // Values match the syslog severities used by sendSyslog()
    enum class LogLevel : int {
        Error = 3,
        Warn = 4,
        Info = 6,
        Debug = 7
    };

    using LogSink = void (*)(LogLevel level, const char *tag, const char *message);

    void setLogSink(LogSink sink);
    void setLogLevel(LogLevel maxLevel);
    void logf(LogLevel level, const char *tag, const char *fmt, ...) __attribute__((format(printf, 3, 4)));

    const char *logLevelToString(LogLevel level);
}

#define SHADY_LOGE(tag, fmt, ...) SHADY::logf(SHADY::LogLevel::Error, tag, fmt, ##__VA_ARGS__)
#define SHADY_LOGW(tag, fmt, ...) SHADY::logf(SHADY::LogLevel::Warn, tag, fmt, ##__VA_ARGS__)
#define SHADY_LOGI(tag, fmt, ...) SHADY::logf(SHADY::LogLevel::Info, tag, fmt, ##__VA_ARGS__)
#define SHADY_LOGD(tag, fmt, ...) SHADY::logf(SHADY::LogLevel::Debug, tag, fmt, ##__VA_ARGS__)

#endif // SHADY_LOG_H
