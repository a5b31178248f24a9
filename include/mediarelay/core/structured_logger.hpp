// MediaRelay - WebRTC SFU Signaling Server
// Structured Logging Component
//
// Responsibilities:
// - Filter records by configurable level (debug, info, warning, error)
// - Format records as plain text or single-line JSON
// - Attach signaling context (stream key, client id/IP, error code)
// - Fan records out to registered sinks

#ifndef MEDIARELAY_CORE_STRUCTURED_LOGGER_HPP
#define MEDIARELAY_CORE_STRUCTURED_LOGGER_HPP

#include "mediarelay/core/types.hpp"
#include "mediarelay/pal/log_pal.hpp"
#include "mediarelay/pal/pal_types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mediarelay {
namespace core {

/**
 * @brief Configurable log levels.
 *
 * Messages below the configured level are dropped before formatting.
 */
enum class LogLevelConfig {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

std::string logLevelToString(LogLevelConfig level);

/**
 * @brief Parse a level name (case-insensitive, "warn" accepted).
 * @return Parsed level, Info for unknown names
 */
LogLevelConfig stringToLogLevel(const std::string& str);

/**
 * @brief Client lifecycle events with a dedicated log format.
 */
enum class ConnectionEventType {
    Connected,
    Disconnected,
    BroadcastStart,
    BroadcastStop
};

std::string connectionEventTypeToString(ConnectionEventType eventType);

/**
 * @brief Context fields attached to contextual log records.
 */
struct LogContext {
    std::string streamKey;
    std::string clientId;
    std::string clientIP;
    int32_t errorCode = 0;

    LogContext() = default;
};

/**
 * @brief Thread-safe structured logger.
 *
 * @code
 * auto logger = std::make_shared<StructuredLogger>();
 * logger->addSink(std::make_shared<pal::linux::ConsoleSink>());
 * logger->setJsonFormat(true);
 * logger->info("Listening on port 3001", "Server");
 *
 * LogContext ctx;
 * ctx.streamKey = "stream_1700000000000";
 * ctx.errorCode = static_cast<int32_t>(ErrorCode::RecorderStartFailed);
 * logger->errorWithContext("Encoder exited during startup", ctx, "Recorder");
 * @endcode
 */
class StructuredLogger {
public:
    StructuredLogger();
    ~StructuredLogger();

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;
    StructuredLogger(StructuredLogger&&) = delete;
    StructuredLogger& operator=(StructuredLogger&&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    void setLevel(LogLevelConfig level);
    LogLevelConfig getLevel() const;

    /**
     * @brief Check whether a record at the given level would be emitted.
     */
    bool isEnabled(LogLevelConfig level) const;

    void setJsonFormat(bool enabled);
    bool isJsonFormat() const;

    // =========================================================================
    // Logging
    // =========================================================================

    void debug(const std::string& message, const std::string& category = "MediaRelay");
    void info(const std::string& message, const std::string& category = "MediaRelay");
    void warning(const std::string& message, const std::string& category = "MediaRelay");
    void error(const std::string& message, const std::string& category = "MediaRelay");

    /**
     * @brief Log a client lifecycle event at info level.
     *
     * @param eventType Lifecycle event
     * @param clientId Signaling client id
     * @param client Peer address information
     * @param streamKey Stream key for broadcast events, empty otherwise
     */
    void logConnectionEvent(
        ConnectionEventType eventType,
        const std::string& clientId,
        const ClientInfo& client,
        const std::string& streamKey = ""
    );

    /**
     * @brief Log an error record carrying signaling context.
     */
    void errorWithContext(
        const std::string& message,
        const LogContext& context,
        const std::string& category = "MediaRelay"
    );

    // =========================================================================
    // Sink Management
    // =========================================================================

    void addSink(std::shared_ptr<pal::ILogSink> sink);
    void removeSink(std::shared_ptr<pal::ILogSink> sink);
    void flush();

private:
    void log(LogLevelConfig level, const std::string& message,
             const std::string& category, const LogContext* context = nullptr);

    void dispatch(LogLevelConfig level, const std::string& formatted,
                  const std::string& category);

    std::string formatJson(LogLevelConfig level, const std::string& message,
                           const std::string& category, const LogContext* context);

    std::string formatPlainText(LogLevelConfig level, const std::string& message,
                                const std::string& category, const LogContext* context);

    static std::string getTimestamp();

    static pal::LogLevel toPalLogLevel(LogLevelConfig level);

    std::atomic<LogLevelConfig> level_{LogLevelConfig::Info};
    std::atomic<bool> jsonFormat_{false};
    mutable std::mutex sinksMutex_;
    std::vector<std::shared_ptr<pal::ILogSink>> sinks_;
};

// =============================================================================
// Convenience Macros
// =============================================================================

/**
 * Null-safe shortcuts; components hold a possibly-null shared_ptr logger.
 *
 * Usage:
 *   MEDIARELAY_LOG_INFO(logger_, "Stream", "Recorder attached to " + key);
 */

#define MEDIARELAY_LOG(logger, method, category, message) \
    do { \
        if ((logger) != nullptr) { \
            (logger)->method((message), (category)); \
        } \
    } while (0)

#define MEDIARELAY_LOG_DEBUG(logger, category, message) \
    MEDIARELAY_LOG(logger, debug, category, message)

#define MEDIARELAY_LOG_INFO(logger, category, message) \
    MEDIARELAY_LOG(logger, info, category, message)

#define MEDIARELAY_LOG_WARNING(logger, category, message) \
    MEDIARELAY_LOG(logger, warning, category, message)

#define MEDIARELAY_LOG_ERROR(logger, category, message) \
    MEDIARELAY_LOG(logger, error, category, message)

} // namespace core
} // namespace mediarelay

#endif // MEDIARELAY_CORE_STRUCTURED_LOGGER_HPP
