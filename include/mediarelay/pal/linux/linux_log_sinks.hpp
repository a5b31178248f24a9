// MediaRelay - WebRTC SFU Signaling Server
// Linux log sinks: stderr console and syslog

#ifndef MEDIARELAY_PAL_LINUX_LINUX_LOG_SINKS_HPP
#define MEDIARELAY_PAL_LINUX_LINUX_LOG_SINKS_HPP

#include "mediarelay/pal/log_pal.hpp"

#include <mutex>
#include <string>

namespace mediarelay {
namespace pal {
namespace linux {

/**
 * @brief Writes every record as one line to stderr.
 */
class ConsoleSink : public ILogSink {
public:
    ConsoleSink() = default;

    void write(LogLevel level, const std::string& message,
               const std::string& category, const LogContext& context) override;
    void flush() override;
    std::string getName() const override { return "console"; }

private:
    std::mutex writeMutex_;
};

/**
 * @brief Forwards records to syslog(3) under the given identity.
 *
 * openlog() is called on construction and closelog() on destruction, so only
 * one SyslogSink should exist per process.
 */
class SyslogSink : public ILogSink {
public:
    explicit SyslogSink(const std::string& ident = "mediarelay");
    ~SyslogSink() override;

    SyslogSink(const SyslogSink&) = delete;
    SyslogSink& operator=(const SyslogSink&) = delete;

    void write(LogLevel level, const std::string& message,
               const std::string& category, const LogContext& context) override;
    void flush() override {}
    std::string getName() const override { return "syslog"; }

private:
    static int toSyslogPriority(LogLevel level);

    // openlog keeps the pointer, so the identity must outlive the sink
    std::string ident_;
};

} // namespace linux
} // namespace pal
} // namespace mediarelay

#endif // MEDIARELAY_PAL_LINUX_LINUX_LOG_SINKS_HPP
