// MediaRelay - WebRTC SFU Signaling Server
// Platform Abstraction Layer - Log Sink Interface
//
// Formatted log records are handed to sinks; each sink owns one destination
// (stderr, syslog, an in-memory capture in tests).

#ifndef MEDIARELAY_PAL_LOG_PAL_HPP
#define MEDIARELAY_PAL_LOG_PAL_HPP

#include "mediarelay/pal/pal_types.hpp"

#include <memory>
#include <string>

namespace mediarelay {
namespace pal {

/**
 * @brief Interface for log output sinks.
 *
 * Sinks must accept concurrent write() calls; StructuredLogger serialises
 * dispatch under its own mutex but a sink may be shared by several loggers.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /**
     * @brief Write a formatted log record.
     *
     * @param level Severity of the record
     * @param message Fully formatted line (plain text or JSON)
     * @param category Component category (e.g. "Signaling", "Recorder")
     * @param context Source location, may be empty
     */
    virtual void write(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) = 0;

    /**
     * @brief Flush any buffered output.
     */
    virtual void flush() = 0;

    /**
     * @brief Sink name for diagnostics.
     */
    virtual std::string getName() const = 0;
};

} // namespace pal
} // namespace mediarelay

#endif // MEDIARELAY_PAL_LOG_PAL_HPP
