#include <shady_log.h>

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace SHADY {
    namespace {
        std::atomic<LogSink> logSink{nullptr};
        std::atomic<int> logMaxLevel{static_cast<int>(LogLevel::Info)};
    }

    void setLogSink(LogSink sink) { logSink.store(sink); }

    void setLogLevel(LogLevel maxLevel) { logMaxLevel.store(static_cast<int>(maxLevel)); }

    void logf(LogLevel level, const char *tag, const char *fmt, ...) {
        if (static_cast<int>(level) > logMaxLevel.load()) return;
        LogSink sink = logSink.load();
        if (!sink) return;

        char buf[256];
        va_list args;
        va_start(args, fmt);
        vsnprintf(buf, sizeof(buf), fmt, args);
        va_end(args);
        sink(level, tag ? tag : "shady", buf);
    }

    const char *logLevelToString(LogLevel level) {
        switch (level) {
            case LogLevel::Error: return "E";
            case LogLevel::Warn: return "W";
            case LogLevel::Info: return "I";
            case LogLevel::Debug: return "D";
        }
        return "?";
    }
}
