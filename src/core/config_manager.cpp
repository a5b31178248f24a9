// MediaRelay - WebRTC SFU Signaling Server
// Configuration Manager Implementation

#include "mediarelay/core/config_manager.hpp"
#include "mediarelay/core/json.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace mediarelay {
namespace core {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool isKnownLogLevel(const std::string& value) {
    std::string lower = toLower(value);
    return lower == "debug" || lower == "info" || lower == "warning" ||
           lower == "warn" || lower == "error";
}

Result<void, ConfigError> fieldError(const std::string& field, const std::string& message) {
    return Result<void, ConfigError>::error(
        ConfigError(ConfigError::Code::ValidationError, field + " " + message, field));
}

// Reads an unsigned integer member; absent members leave target untouched.
template<typename T>
Result<void, ConfigError> readUnsigned(const JsonValue& section, const char* key,
                                       const std::string& sectionName, T& target,
                                       uint64_t maxValue) {
    if (!section.contains(key)) {
        return Result<void, ConfigError>::success();
    }
    const JsonValue& value = section[key];
    std::string field = sectionName + "." + key;
    if (!value.isNumber()) {
        return fieldError(field, "must be a number");
    }
    double number = value.getDouble();
    if (number < 0 || number > static_cast<double>(maxValue) ||
        number != static_cast<double>(static_cast<uint64_t>(number))) {
        return fieldError(field, "must be an integer between 0 and " + std::to_string(maxValue));
    }
    target = static_cast<T>(number);
    return Result<void, ConfigError>::success();
}

Result<void, ConfigError> readBool(const JsonValue& section, const char* key,
                                   const std::string& sectionName, bool& target) {
    if (!section.contains(key)) {
        return Result<void, ConfigError>::success();
    }
    const JsonValue& value = section[key];
    if (!value.isBool()) {
        return fieldError(sectionName + "." + key, "must be true or false");
    }
    target = value.getBool();
    return Result<void, ConfigError>::success();
}

Result<void, ConfigError> readString(const JsonValue& section, const char* key,
                                     const std::string& sectionName, std::string& target) {
    if (!section.contains(key)) {
        return Result<void, ConfigError>::success();
    }
    const JsonValue& value = section[key];
    if (!value.isString()) {
        return fieldError(sectionName + "." + key, "must be a string");
    }
    target = value.getString();
    return Result<void, ConfigError>::success();
}

#define MEDIARELAY_CONFIG_TRY(expr) \
    do { \
        auto tryResult = (expr); \
        if (tryResult.isError()) { \
            return tryResult; \
        } \
    } while (0)

} // namespace

bool parseBoolString(const std::string& value) {
    std::string lower = toLower(value);
    return lower == "true" || lower == "1" || lower == "yes";
}

// =============================================================================
// ConfigManager Implementation
// =============================================================================

ConfigManager::ConfigManager() {
    config_ = Configuration{};
    config_.recording.outputRoot = defaultOutputRoot();
}

ConfigManager::~ConfigManager() = default;

Result<void, ConfigError> ConfigManager::loadFromFile(const std::string& filePath) {
    auto contentResult = readFile(filePath);
    if (contentResult.isError()) {
        return Result<void, ConfigError>::error(contentResult.error());
    }
    log("Loading configuration from " + filePath);
    return loadFromJsonString(contentResult.value());
}

Result<void, ConfigError> ConfigManager::loadFromJsonString(const std::string& jsonContent) {
    auto parsed = JsonValue::parse(jsonContent);
    if (parsed.isError()) {
        const JsonError& err = parsed.error();
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::ParseError,
                        err.message + " at offset " + std::to_string(err.offset)));
    }
    if (!parsed.value().isObject()) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::ParseError, "Configuration root must be an object"));
    }

    auto applied = applyJson(parsed.value());
    if (applied.isError()) {
        return applied;
    }
    logEffectiveConfig();
    return validate();
}

Result<void, ConfigError> ConfigManager::loadDefaults() {
    {
        std::unique_lock<std::shared_mutex> lock(configMutex_);
        config_ = Configuration{};
        config_.recording.outputRoot = defaultOutputRoot();
    }
    log("Configuration loaded with default values");
    logEffectiveConfig();
    return Result<void, ConfigError>::success();
}

void ConfigManager::applyEnvironmentOverrides() {
    std::unique_lock<std::shared_mutex> lock(configMutex_);

    if (auto val = getEnvVar("MEDIARELAY_PORT")) {
        try {
            int port = std::stoi(*val);
            if (port <= 0 || port > 65535) {
                throw std::out_of_range("port");
            }
            config_.server.port = static_cast<uint16_t>(port);
            log("Environment override: MEDIARELAY_PORT=" + *val);
        } catch (const std::exception&) {
            log("Warning: Invalid MEDIARELAY_PORT value: " + *val);
        }
    }

    if (auto val = getEnvVar("MEDIARELAY_BIND_ADDRESS")) {
        config_.server.bindAddress = *val;
        log("Environment override: MEDIARELAY_BIND_ADDRESS=" + *val);
    }

    if (auto val = getEnvVar("MEDIARELAY_WORKER_THREADS")) {
        try {
            config_.server.workerThreads = static_cast<uint32_t>(std::stoul(*val));
            log("Environment override: MEDIARELAY_WORKER_THREADS=" + *val);
        } catch (const std::exception&) {
            log("Warning: Invalid MEDIARELAY_WORKER_THREADS value: " + *val);
        }
    }

    if (auto val = getEnvVar("MEDIARELAY_LOG_LEVEL")) {
        if (isKnownLogLevel(*val)) {
            config_.logging.level = stringToLogLevel(*val);
            log("Environment override: MEDIARELAY_LOG_LEVEL=" + *val);
        } else {
            log("Warning: Invalid MEDIARELAY_LOG_LEVEL value: " + *val);
        }
    }

    if (auto val = getEnvVar("MEDIARELAY_LOG_JSON")) {
        config_.logging.json = parseBoolString(*val);
        log("Environment override: MEDIARELAY_LOG_JSON=" + *val);
    }

    if (auto val = getEnvVar("MEDIARELAY_ANNOUNCED_IP")) {
        config_.engine.announcedIp = *val;
        log("Environment override: MEDIARELAY_ANNOUNCED_IP=" + *val);
    }

    if (auto val = getEnvVar("MEDIARELAY_HLS_ROOT")) {
        config_.recording.outputRoot = *val;
        log("Environment override: MEDIARELAY_HLS_ROOT=" + *val);
    }

    if (auto val = getEnvVar("MEDIARELAY_ENCODER_PATH")) {
        config_.recording.encoderPath = *val;
        log("Environment override: MEDIARELAY_ENCODER_PATH=" + *val);
    }
}

Result<void, ConfigError> ConfigManager::validate() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);

    if (config_.server.port == 0) {
        return fieldError("server.port", "must be between 1 and 65535");
    }
    if (config_.server.maxConnections == 0) {
        return fieldError("server.maxConnections", "must be greater than 0");
    }
    if (config_.server.workerThreads == 0) {
        return fieldError("server.workerThreads", "must be at least 1");
    }

    if (config_.engine.rtcMinPort == 0 || config_.engine.rtcMinPort > config_.engine.rtcMaxPort) {
        return fieldError("engine.rtcMinPort", "must be non-zero and not above engine.rtcMaxPort");
    }
    if (!config_.engine.enableUdp && !config_.engine.enableTcp) {
        return fieldError("engine.enableUdp", "or engine.enableTcp must be enabled");
    }

    if (config_.recording.encoderRtpPortMin == 0 ||
        config_.recording.encoderRtpPortMin > config_.recording.encoderRtpPortMax) {
        return fieldError("recording.encoderRtpPortMin",
                          "must be non-zero and not above recording.encoderRtpPortMax");
    }
    if (config_.recording.outputRoot.empty()) {
        return fieldError("recording.outputRoot", "must not be empty");
    }
    if (config_.recording.encoderPath.empty()) {
        return fieldError("recording.encoderPath", "must not be empty");
    }
    if (config_.recording.segmentSeconds < 1) {
        return fieldError("recording.segmentSeconds", "must be at least 1");
    }
    if (config_.recording.playlistSize < 1) {
        return fieldError("recording.playlistSize", "must be at least 1");
    }
    if (config_.recording.readinessPollMs == 0 ||
        config_.recording.readinessPollMs > config_.recording.readinessTimeoutMs) {
        return fieldError("recording.readinessPollMs",
                          "must be non-zero and not above recording.readinessTimeoutMs");
    }

    if (config_.playback.pathPrefix.empty() || config_.playback.pathPrefix[0] != '/') {
        return fieldError("playback.pathPrefix", "must start with '/'");
    }

    return Result<void, ConfigError>::success();
}

Configuration ConfigManager::getConfig() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);
    return config_;
}

std::string ConfigManager::dumpConfig() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);

    std::ostringstream ss;
    ss << "{\n";
    ss << "  \"server\": {\n";
    ss << "    \"port\": " << config_.server.port << ",\n";
    ss << "    \"bindAddress\": \"" << JsonValue::escape(config_.server.bindAddress) << "\",\n";
    ss << "    \"maxConnections\": " << config_.server.maxConnections << ",\n";
    ss << "    \"workerThreads\": " << config_.server.workerThreads << "\n";
    ss << "  },\n";
    ss << "  \"logging\": {\n";
    ss << "    \"level\": \"" << logLevelToString(config_.logging.level) << "\",\n";
    ss << "    \"json\": " << (config_.logging.json ? "true" : "false") << ",\n";
    ss << "    \"syslog\": " << (config_.logging.syslog ? "true" : "false") << "\n";
    ss << "  },\n";
    ss << "  \"engine\": {\n";
    ss << "    \"listenIp\": \"" << JsonValue::escape(config_.engine.listenIp) << "\",\n";
    ss << "    \"announcedIp\": \"" << JsonValue::escape(config_.engine.announcedIp) << "\",\n";
    ss << "    \"rtcMinPort\": " << config_.engine.rtcMinPort << ",\n";
    ss << "    \"rtcMaxPort\": " << config_.engine.rtcMaxPort << ",\n";
    ss << "    \"enableUdp\": " << (config_.engine.enableUdp ? "true" : "false") << ",\n";
    ss << "    \"enableTcp\": " << (config_.engine.enableTcp ? "true" : "false") << ",\n";
    ss << "    \"preferUdp\": " << (config_.engine.preferUdp ? "true" : "false") << "\n";
    ss << "  },\n";
    ss << "  \"recording\": {\n";
    ss << "    \"outputRoot\": \"" << JsonValue::escape(config_.recording.outputRoot) << "\",\n";
    ss << "    \"encoderPath\": \"" << JsonValue::escape(config_.recording.encoderPath) << "\",\n";
    ss << "    \"encoderRtpPortMin\": " << config_.recording.encoderRtpPortMin << ",\n";
    ss << "    \"encoderRtpPortMax\": " << config_.recording.encoderRtpPortMax << ",\n";
    ss << "    \"readinessTimeoutMs\": " << config_.recording.readinessTimeoutMs << ",\n";
    ss << "    \"readinessPollMs\": " << config_.recording.readinessPollMs << ",\n";
    ss << "    \"segmentSeconds\": " << config_.recording.segmentSeconds << ",\n";
    ss << "    \"playlistSize\": " << config_.recording.playlistSize << ",\n";
    ss << "    \"videoBitrateKbps\": " << config_.recording.videoBitrateKbps << ",\n";
    ss << "    \"fileCheckDelayMs\": " << config_.recording.fileCheckDelayMs << "\n";
    ss << "  },\n";
    ss << "  \"playback\": {\n";
    ss << "    \"pathPrefix\": \"" << JsonValue::escape(config_.playback.pathPrefix) << "\"\n";
    ss << "  }\n";
    ss << "}\n";

    return ss.str();
}

void ConfigManager::setLogCallback(ConfigLogCallback callback) {
    std::lock_guard<std::mutex> lock(logMutex_);
    logCallback_ = std::move(callback);
}

// =============================================================================
// Private Implementation
// =============================================================================

Result<void, ConfigError> ConfigManager::applyJson(const JsonValue& root) {
    // Parse into a copy so a failing document leaves the current values intact
    Configuration next = getConfig();

    if (root.contains("server")) {
        const JsonValue& s = root["server"];
        MEDIARELAY_CONFIG_TRY(readUnsigned(s, "port", "server", next.server.port, 65535));
        MEDIARELAY_CONFIG_TRY(readString(s, "bindAddress", "server", next.server.bindAddress));
        MEDIARELAY_CONFIG_TRY(readUnsigned(s, "maxConnections", "server",
                                           next.server.maxConnections, UINT32_MAX));
        MEDIARELAY_CONFIG_TRY(readUnsigned(s, "workerThreads", "server",
                                           next.server.workerThreads, 256));
    }

    if (root.contains("logging")) {
        const JsonValue& l = root["logging"];
        if (l.contains("level")) {
            std::string level = l["level"].getString();
            if (!isKnownLogLevel(level)) {
                return fieldError("logging.level", "must be one of debug, info, warning, error");
            }
            next.logging.level = stringToLogLevel(level);
        }
        MEDIARELAY_CONFIG_TRY(readBool(l, "json", "logging", next.logging.json));
        MEDIARELAY_CONFIG_TRY(readBool(l, "syslog", "logging", next.logging.syslog));
    }

    if (root.contains("engine")) {
        const JsonValue& e = root["engine"];
        MEDIARELAY_CONFIG_TRY(readString(e, "listenIp", "engine", next.engine.listenIp));
        MEDIARELAY_CONFIG_TRY(readString(e, "announcedIp", "engine", next.engine.announcedIp));
        MEDIARELAY_CONFIG_TRY(readUnsigned(e, "rtcMinPort", "engine", next.engine.rtcMinPort, 65535));
        MEDIARELAY_CONFIG_TRY(readUnsigned(e, "rtcMaxPort", "engine", next.engine.rtcMaxPort, 65535));
        MEDIARELAY_CONFIG_TRY(readBool(e, "enableUdp", "engine", next.engine.enableUdp));
        MEDIARELAY_CONFIG_TRY(readBool(e, "enableTcp", "engine", next.engine.enableTcp));
        MEDIARELAY_CONFIG_TRY(readBool(e, "preferUdp", "engine", next.engine.preferUdp));
    }

    if (root.contains("recording")) {
        const JsonValue& r = root["recording"];
        RecordingConfig& rec = next.recording;
        MEDIARELAY_CONFIG_TRY(readString(r, "outputRoot", "recording", rec.outputRoot));
        MEDIARELAY_CONFIG_TRY(readString(r, "encoderPath", "recording", rec.encoderPath));
        MEDIARELAY_CONFIG_TRY(readUnsigned(r, "encoderRtpPortMin", "recording",
                                           rec.encoderRtpPortMin, 65535));
        MEDIARELAY_CONFIG_TRY(readUnsigned(r, "encoderRtpPortMax", "recording",
                                           rec.encoderRtpPortMax, 65535));
        MEDIARELAY_CONFIG_TRY(readUnsigned(r, "readinessTimeoutMs", "recording",
                                           rec.readinessTimeoutMs, UINT32_MAX));
        MEDIARELAY_CONFIG_TRY(readUnsigned(r, "readinessPollMs", "recording",
                                           rec.readinessPollMs, UINT32_MAX));
        MEDIARELAY_CONFIG_TRY(readUnsigned(r, "segmentSeconds", "recording",
                                           rec.segmentSeconds, 3600));
        MEDIARELAY_CONFIG_TRY(readUnsigned(r, "playlistSize", "recording",
                                           rec.playlistSize, 10000));
        MEDIARELAY_CONFIG_TRY(readUnsigned(r, "videoBitrateKbps", "recording",
                                           rec.videoBitrateKbps, 1000000));
        MEDIARELAY_CONFIG_TRY(readUnsigned(r, "fileCheckDelayMs", "recording",
                                           rec.fileCheckDelayMs, UINT32_MAX));
    }

    if (root.contains("playback")) {
        MEDIARELAY_CONFIG_TRY(readString(root["playback"], "pathPrefix", "playback",
                                         next.playback.pathPrefix));
    }

    std::unique_lock<std::shared_mutex> lock(configMutex_);
    config_ = std::move(next);
    return Result<void, ConfigError>::success();
}

Result<std::string, ConfigError> ConfigManager::readFile(const std::string& filePath) const {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::FileNotFound,
                        "Configuration file not found: " + filePath));
    }

    std::ostringstream ss;
    ss << file.rdbuf();

    if (file.fail() && !file.eof()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::IOError,
                        "Error reading configuration file: " + filePath));
    }

    return Result<std::string, ConfigError>::success(ss.str());
}

void ConfigManager::log(const std::string& message) const {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logCallback_) {
        logCallback_(message);
    }
}

void ConfigManager::logEffectiveConfig() const {
    Configuration snapshot = getConfig();
    log("Effective configuration:");
    log("  server.port: " + std::to_string(snapshot.server.port));
    log("  server.bindAddress: " + snapshot.server.bindAddress);
    log("  server.workerThreads: " + std::to_string(snapshot.server.workerThreads));
    log("  logging.level: " + logLevelToString(snapshot.logging.level));
    log("  engine.rtcPorts: " + std::to_string(snapshot.engine.rtcMinPort) + "-" +
        std::to_string(snapshot.engine.rtcMaxPort));
    log("  engine.announcedIp: " +
        (snapshot.engine.announcedIp.empty() ? std::string("<auto>") : snapshot.engine.announcedIp));
    log("  recording.outputRoot: " + snapshot.recording.outputRoot);
    log("  recording.encoderPath: " + snapshot.recording.encoderPath);
    log("  playback.pathPrefix: " + snapshot.playback.pathPrefix);
}

std::optional<std::string> ConfigManager::getEnvVar(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

std::string ConfigManager::defaultOutputRoot() {
    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    if (ec) {
        cwd = ".";
    }
    return (cwd / "public" / "hls").string();
}

#undef MEDIARELAY_CONFIG_TRY

} // namespace core
} // namespace mediarelay
