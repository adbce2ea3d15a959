#ifndef SYSLOG_HELPER_H
#define SYSLOG_HELPER_H

#include <shady_log.h>

/*
   Remote syslog (RFC3164 over UDP) for the log sink. Server and port come
   from the settings, nothing is sent while WiFi is down or no server is set.
*/
void initSyslog();

void sendSyslog(SHADY::LogLevel level, const char *tag, const char *message);

#endif // SYSLOG_HELPER_H
