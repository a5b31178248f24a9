// MediaRelay - WebRTC SFU Signaling Server
// Linux log sinks implementation

#include "mediarelay/pal/linux/linux_log_sinks.hpp"

#include <syslog.h>

#include <cstdio>

namespace mediarelay {
namespace pal {
namespace linux {

// =============================================================================
// ConsoleSink
// =============================================================================

void ConsoleSink::write(LogLevel /*level*/, const std::string& message,
                        const std::string& /*category*/, const LogContext& /*context*/) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    std::fprintf(stderr, "%s\n", message.c_str());
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(writeMutex_);
    std::fflush(stderr);
}

// =============================================================================
// SyslogSink
// =============================================================================

SyslogSink::SyslogSink(const std::string& ident) : ident_(ident) {
    openlog(ident_.c_str(), LOG_PID | LOG_NDELAY, LOG_USER);
}

SyslogSink::~SyslogSink() {
    closelog();
}

void SyslogSink::write(LogLevel level, const std::string& message,
                       const std::string& category, const LogContext& /*context*/) {
    if (level == LogLevel::Off) {
        return;
    }
    syslog(toSyslogPriority(level), "[%s] %s", category.c_str(), message.c_str());
}

int SyslogSink::toSyslogPriority(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
        case LogLevel::Debug:
            return LOG_DEBUG;
        case LogLevel::Info:
            return LOG_INFO;
        case LogLevel::Warning:
            return LOG_WARNING;
        case LogLevel::Error:
            return LOG_ERR;
        case LogLevel::Critical:
            return LOG_CRIT;
        case LogLevel::Off:
        default:
            return LOG_DEBUG;
    }
}

} // namespace linux
} // namespace pal
} // namespace mediarelay
