// MediaRelay - WebRTC SFU Signaling Server
// Configuration Manager - Handles configuration loading and validation
//
// Responsibilities:
// - Parse JSON configuration files and strings
// - Support MEDIARELAY_* environment variable overrides
// - Validate configuration on startup with the offending field named
// - Apply defaults when configuration is absent
// - Log effective configuration values during initialization

#ifndef MEDIARELAY_CORE_CONFIG_MANAGER_HPP
#define MEDIARELAY_CORE_CONFIG_MANAGER_HPP

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

#include "mediarelay/core/result.hpp"
#include "mediarelay/core/structured_logger.hpp"

namespace mediarelay {
namespace core {

class JsonValue;

// =============================================================================
// Configuration Structures
// =============================================================================

/**
 * @brief Signaling listener section.
 */
struct ServerConfig {
    uint16_t port = 3001;                 ///< WebSocket and playback port
    std::string bindAddress = "0.0.0.0";
    uint32_t maxConnections = 1000;
    uint32_t workerThreads = 4;           ///< Signaling worker pool size
};

/**
 * @brief Logging section.
 */
struct LoggingConfig {
    LogLevelConfig level = LogLevelConfig::Info;
    bool json = false;                    ///< One JSON object per line
    bool syslog = false;                  ///< Add a syslog sink next to stderr
};

/**
 * @brief Media engine section (transport addressing and port range).
 */
struct EngineConfig {
    std::string listenIp = "0.0.0.0";
    std::string announcedIp;              ///< Empty: first non-loopback IPv4
    uint16_t rtcMinPort = 40000;
    uint16_t rtcMaxPort = 49999;
    bool enableUdp = true;
    bool enableTcp = true;
    bool preferUdp = true;
};

/**
 * @brief HLS recording section.
 */
struct RecordingConfig {
    std::string outputRoot;               ///< Defaults to <cwd>/public/hls
    std::string encoderPath = "ffmpeg";
    uint16_t encoderRtpPortMin = 50000;
    uint16_t encoderRtpPortMax = 50999;
    uint32_t readinessTimeoutMs = 10000;
    uint32_t readinessPollMs = 50;
    uint32_t segmentSeconds = 2;
    uint32_t playlistSize = 5;
    uint32_t videoBitrateKbps = 1000;
    uint32_t fileCheckDelayMs = 5000;
};

/**
 * @brief Playback retrieval section.
 */
struct PlaybackConfig {
    std::string pathPrefix = "/api/hls";
};

/**
 * @brief Complete server configuration.
 */
struct Configuration {
    ServerConfig server;
    LoggingConfig logging;
    EngineConfig engine;
    RecordingConfig recording;
    PlaybackConfig playback;
};

// =============================================================================
// Configuration Error
// =============================================================================

struct ConfigError {
    enum class Code {
        None,
        FileNotFound,
        ParseError,
        ValidationError,
        IOError
    };

    Code code = Code::None;
    std::string message;
    std::string field;        ///< Field that caused the error (if applicable)

    ConfigError() = default;
    ConfigError(Code c, std::string msg) : code(c), message(std::move(msg)) {}
    ConfigError(Code c, std::string msg, std::string f)
        : code(c), message(std::move(msg)), field(std::move(f)) {}
};

using ConfigLogCallback = std::function<void(const std::string&)>;

// =============================================================================
// Configuration Manager
// =============================================================================

/**
 * @brief Loads, overrides and validates the server configuration.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - getConfig() returns a snapshot copy
 *
 * @code
 * ConfigManager manager;
 * manager.setLogCallback([&](const std::string& msg) { logger->info(msg, "Config"); });
 *
 * if (!path.empty()) {
 *     auto loaded = manager.loadFromFile(path);
 *     if (loaded.isError()) { ... }
 * }
 * manager.applyEnvironmentOverrides();
 *
 * auto valid = manager.validate();
 * if (valid.isError()) {
 *     std::cerr << valid.error().field << ": " << valid.error().message;
 *     return 1;
 * }
 * Configuration config = manager.getConfig();
 * @endcode
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    // -------------------------------------------------------------------------
    // Configuration Loading
    // -------------------------------------------------------------------------

    /**
     * @brief Load configuration from a JSON file.
     *
     * Sections and keys missing from the file keep their defaults.
     */
    Result<void, ConfigError> loadFromFile(const std::string& filePath);

    Result<void, ConfigError> loadFromJsonString(const std::string& jsonContent);

    /**
     * @brief Reset every value to its default.
     */
    Result<void, ConfigError> loadDefaults();

    // -------------------------------------------------------------------------
    // Environment Variable Overrides
    // -------------------------------------------------------------------------

    /**
     * @brief Apply environment variable overrides.
     *
     * Supported environment variables:
     * - MEDIARELAY_PORT: Signaling port
     * - MEDIARELAY_BIND_ADDRESS: Bind address
     * - MEDIARELAY_LOG_LEVEL: debug|info|warning|error
     * - MEDIARELAY_LOG_JSON: true|false
     * - MEDIARELAY_ANNOUNCED_IP: Address put into ICE candidates
     * - MEDIARELAY_HLS_ROOT: HLS output root directory
     * - MEDIARELAY_ENCODER_PATH: Encoder executable
     * - MEDIARELAY_WORKER_THREADS: Signaling worker pool size
     *
     * Unparseable values are logged and ignored.
     */
    void applyEnvironmentOverrides();

    // -------------------------------------------------------------------------
    // Validation and Access
    // -------------------------------------------------------------------------

    Result<void, ConfigError> validate() const;

    Configuration getConfig() const;

    /**
     * @brief Effective configuration as pretty-printed JSON.
     */
    std::string dumpConfig() const;

    void setLogCallback(ConfigLogCallback callback);

private:
    Result<void, ConfigError> applyJson(const JsonValue& root);
    Result<std::string, ConfigError> readFile(const std::string& filePath) const;

    void log(const std::string& message) const;
    void logEffectiveConfig() const;

    std::optional<std::string> getEnvVar(const std::string& name) const;

    static std::string defaultOutputRoot();

    Configuration config_;
    mutable std::shared_mutex configMutex_;

    ConfigLogCallback logCallback_;
    mutable std::mutex logMutex_;
};

/**
 * @brief Parse a boolean environment/config string ("true", "1", "yes").
 */
bool parseBoolString(const std::string& value);

} // namespace core
} // namespace mediarelay

#endif // MEDIARELAY_CORE_CONFIG_MANAGER_HPP
