// MediaRelay - WebRTC SFU Signaling Server
// Structured Logging Component Implementation

#include "mediarelay/core/structured_logger.hpp"
#include "mediarelay/core/json.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mediarelay {
namespace core {

// =============================================================================
// Helper Functions
// =============================================================================

std::string logLevelToString(LogLevelConfig level) {
    switch (level) {
        case LogLevelConfig::Debug:
            return "debug";
        case LogLevelConfig::Info:
            return "info";
        case LogLevelConfig::Warning:
            return "warning";
        case LogLevelConfig::Error:
            return "error";
        default:
            return "info";
    }
}

LogLevelConfig stringToLogLevel(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        return LogLevelConfig::Debug;
    } else if (lower == "warning" || lower == "warn") {
        return LogLevelConfig::Warning;
    } else if (lower == "error") {
        return LogLevelConfig::Error;
    }
    return LogLevelConfig::Info;
}

std::string connectionEventTypeToString(ConnectionEventType eventType) {
    switch (eventType) {
        case ConnectionEventType::Connected:
            return "connected";
        case ConnectionEventType::Disconnected:
            return "disconnected";
        case ConnectionEventType::BroadcastStart:
            return "broadcast_start";
        case ConnectionEventType::BroadcastStop:
            return "broadcast_stop";
        default:
            return "unknown";
    }
}

// =============================================================================
// StructuredLogger Implementation
// =============================================================================

StructuredLogger::StructuredLogger() = default;

StructuredLogger::~StructuredLogger() {
    flush();
}

void StructuredLogger::setLevel(LogLevelConfig level) {
    level_.store(level);
}

LogLevelConfig StructuredLogger::getLevel() const {
    return level_.load();
}

bool StructuredLogger::isEnabled(LogLevelConfig level) const {
    return static_cast<int>(level) >= static_cast<int>(level_.load());
}

void StructuredLogger::setJsonFormat(bool enabled) {
    jsonFormat_.store(enabled);
}

bool StructuredLogger::isJsonFormat() const {
    return jsonFormat_.load();
}

void StructuredLogger::debug(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Debug, message, category);
}

void StructuredLogger::info(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Info, message, category);
}

void StructuredLogger::warning(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Warning, message, category);
}

void StructuredLogger::error(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Error, message, category);
}

void StructuredLogger::logConnectionEvent(
    ConnectionEventType eventType,
    const std::string& clientId,
    const ClientInfo& client,
    const std::string& streamKey)
{
    if (!isEnabled(LogLevelConfig::Info)) {
        return;
    }

    const std::string category = "Connection";
    std::string formatted;

    if (jsonFormat_.load()) {
        JsonValue record = JsonValue::object();
        record.set("timestamp", getTimestamp());
        record.set("level", "info");
        record.set("category", category);
        record.set("event", connectionEventTypeToString(eventType));
        record.set("client_id", clientId);
        record.set("client_ip", client.ip);
        record.set("client_port", client.port);
        if (!client.userAgent.empty()) {
            record.set("user_agent", client.userAgent);
        }
        if (!streamKey.empty()) {
            record.set("stream_key", streamKey);
        }
        formatted = record.dump();
    } else {
        std::ostringstream oss;
        oss << "[" << getTimestamp() << "] [info] [" << category << "] "
            << "Event: " << connectionEventTypeToString(eventType)
            << ", Client: " << clientId << " (" << client.ip << ":" << client.port << ")";
        if (!client.userAgent.empty()) {
            oss << ", UserAgent: " << client.userAgent;
        }
        if (!streamKey.empty()) {
            oss << ", StreamKey: " << streamKey;
        }
        formatted = oss.str();
    }

    dispatch(LogLevelConfig::Info, formatted, category);
}

void StructuredLogger::errorWithContext(
    const std::string& message,
    const LogContext& context,
    const std::string& category)
{
    log(LogLevelConfig::Error, message, category, &context);
}

void StructuredLogger::addSink(std::shared_ptr<pal::ILogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void StructuredLogger::removeSink(std::shared_ptr<pal::ILogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void StructuredLogger::flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        if (sink) {
            sink->flush();
        }
    }
}

void StructuredLogger::log(LogLevelConfig level, const std::string& message,
                           const std::string& category, const LogContext* context) {
    if (!isEnabled(level)) {
        return;
    }

    std::string formatted = jsonFormat_.load()
        ? formatJson(level, message, category, context)
        : formatPlainText(level, message, category, context);

    dispatch(level, formatted, category);
}

void StructuredLogger::dispatch(LogLevelConfig level, const std::string& formatted,
                                const std::string& category) {
    pal::LogContext palContext;
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        if (sink) {
            sink->write(toPalLogLevel(level), formatted, category, palContext);
        }
    }
}

std::string StructuredLogger::formatJson(
    LogLevelConfig level,
    const std::string& message,
    const std::string& category,
    const LogContext* context)
{
    JsonValue record = JsonValue::object();
    record.set("timestamp", getTimestamp());
    record.set("level", logLevelToString(level));
    record.set("category", category);
    record.set("message", message);

    if (context) {
        if (!context->streamKey.empty()) {
            record.set("stream_key", context->streamKey);
        }
        if (!context->clientId.empty()) {
            record.set("client_id", context->clientId);
        }
        if (!context->clientIP.empty()) {
            record.set("client_ip", context->clientIP);
        }
        if (context->errorCode != 0) {
            record.set("error_code", context->errorCode);
        }
    }

    return record.dump();
}

std::string StructuredLogger::formatPlainText(
    LogLevelConfig level,
    const std::string& message,
    const std::string& category,
    const LogContext* context)
{
    std::ostringstream oss;
    oss << "[" << getTimestamp() << "] ";
    oss << "[" << logLevelToString(level) << "] ";
    oss << "[" << category << "] ";
    oss << message;

    if (context) {
        if (!context->streamKey.empty()) {
            oss << " stream=" << context->streamKey;
        }
        if (!context->clientId.empty()) {
            oss << " client=" << context->clientId;
        }
        if (!context->clientIP.empty()) {
            oss << " ip=" << context->clientIP;
        }
        if (context->errorCode != 0) {
            oss << " code=" << context->errorCode;
        }
    }
    return oss.str();
}

std::string StructuredLogger::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeNow = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tmBuf;
    gmtime_r(&timeNow, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return oss.str();
}

pal::LogLevel StructuredLogger::toPalLogLevel(LogLevelConfig level) {
    switch (level) {
        case LogLevelConfig::Debug:
            return pal::LogLevel::Debug;
        case LogLevelConfig::Info:
            return pal::LogLevel::Info;
        case LogLevelConfig::Warning:
            return pal::LogLevel::Warning;
        case LogLevelConfig::Error:
            return pal::LogLevel::Error;
        default:
            return pal::LogLevel::Info;
    }
}

} // namespace core
} // namespace mediarelay
