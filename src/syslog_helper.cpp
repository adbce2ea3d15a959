#include <syslog_helper.h>
#include <user_config.h>

#if defined(SYSLOG)

#include <WiFi.h>
#include <WiFiUdp.h>
#include <esp_log.h>
#include <mutex>
#include <time.h>

#define SYSLOG_FACILITY 16           // local0
#define SYSLOG_APP "SHADY"

namespace {
    const char *TAG = "Syslog";

    WiFiUDP udp;
    IPAddress target;
    bool ready = false;
    std::mutex lock;

    // Caller holds lock. The server may be an address or a host name.
    bool resolve() {
        if (ready) return true;
        if (syslog_server.empty()) return false;
        if (!target.fromString(syslog_server.c_str()) &&
            !WiFi.hostByName(syslog_server.c_str(), target)) {
            ESP_LOGW(TAG, "cannot resolve syslog server %s", syslog_server.c_str());
            return false;
        }
        udp.begin(0);
        ready = true;
        ESP_LOGI(TAG, "syslog to %s:%u", target.toString().c_str(), syslog_port);
        return true;
    }

    // RFC3164 header, "<PRI>Mmm dd hh:mm:ss HOST APP: "
    String header(int severity) {
        char stamp[20];
        time_t now = time(nullptr);
        struct tm local;
        localtime_r(&now, &local);
        strftime(stamp, sizeof(stamp), "%b %e %T", &local);

        const char *host = WiFi.getHostname();
        String ident = host && *host ? String(host) : WiFi.localIP().toString();
        return "<" + String(SYSLOG_FACILITY * 8 + severity) + ">" + stamp + " " + ident + " " + SYSLOG_APP + ": ";
    }
}

void initSyslog() {
    std::lock_guard<std::mutex> guard(lock);
    resolve();
}

void sendSyslog(SHADY::LogLevel level, const char *tag, const char *message) {
    if (WiFi.status() != WL_CONNECTED) return;

    std::lock_guard<std::mutex> guard(lock);
    if (!resolve()) return;

    // LogLevel values are syslog severities
    const String line = header(static_cast<int>(level)) + tag + ": " + message;
    udp.beginPacket(target, syslog_port);
    udp.write(reinterpret_cast<const uint8_t *>(line.c_str()), line.length());
    if (!udp.endPacket())
        ESP_LOGD(TAG, "datagram dropped (%u bytes)", line.length());
}

#else

void initSyslog() {}
void sendSyslog(SHADY::LogLevel, const char *, const char *) {}

#endif // SYSLOG
