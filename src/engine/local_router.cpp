// MediaRelay - WebRTC SFU Signaling Server
// Local Router Implementation

#include "mediarelay/engine/local_router.hpp"

#include <arpa/inet.h>
#include <openssl/rand.h>

#include <cstdio>
#include <optional>

namespace mediarelay {
namespace engine {

namespace {

const char* LOG_CATEGORY = "Engine";
const char* LOOPBACK_IP = "127.0.0.1";
const char* ICE_ALPHABET = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

constexpr size_t ICE_UFRAG_LENGTH = 16;
constexpr size_t ICE_PASSWORD_LENGTH = 32;

// RFC 8445 host candidate type preference
constexpr uint32_t HOST_TYPE_PREFERENCE = 126;

std::optional<std::vector<unsigned char>> randomBytes(size_t count) {
    std::vector<unsigned char> bytes(count);
    if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        return std::nullopt;
    }
    return bytes;
}

/**
 * @brief Random version 4 UUID.
 */
std::optional<std::string> randomUuid() {
    auto bytes = randomBytes(16);
    if (!bytes) {
        return std::nullopt;
    }
    auto& b = *bytes;
    b[6] = static_cast<unsigned char>((b[6] & 0x0f) | 0x40);
    b[8] = static_cast<unsigned char>((b[8] & 0x3f) | 0x80);

    char text[37];
    std::snprintf(text, sizeof(text),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
                  b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return std::string(text);
}

std::optional<std::string> randomToken(size_t length) {
    auto bytes = randomBytes(length);
    if (!bytes) {
        return std::nullopt;
    }
    const size_t alphabetSize = std::char_traits<char>::length(ICE_ALPHABET);
    std::string token;
    token.reserve(length);
    for (unsigned char byte : *bytes) {
        token.push_back(ICE_ALPHABET[byte % alphabetSize]);
    }
    return token;
}

std::optional<uint32_t> randomSsrc() {
    auto bytes = randomBytes(4);
    if (!bytes) {
        return std::nullopt;
    }
    uint32_t ssrc = (static_cast<uint32_t>((*bytes)[0]) << 24) |
                    (static_cast<uint32_t>((*bytes)[1]) << 16) |
                    (static_cast<uint32_t>((*bytes)[2]) << 8) |
                    static_cast<uint32_t>((*bytes)[3]);
    return ssrc == 0 ? 1 : ssrc;
}

EngineError randomFailure() {
    return EngineError{EngineError::Code::Internal, "RAND_bytes failed"};
}

bool isValidIPv4(const std::string& ip) {
    struct in_addr addr;
    return inet_pton(AF_INET, ip.c_str(), &addr) == 1;
}

} // namespace

// =============================================================================
// Constructor / Destructor
// =============================================================================

LocalRouter::LocalRouter(
    core::EngineConfig config,
    pal::INetworkPAL& network,
    std::shared_ptr<core::StructuredLogger> logger
)
    : config_(std::move(config))
    , network_(network)
    , logger_(std::move(logger))
{
}

LocalRouter::~LocalRouter() {
    close();
}

// =============================================================================
// Lifecycle
// =============================================================================

core::Result<void, EngineError> LocalRouter::initialize() {
    if (ready_) {
        return core::Result<void, EngineError>::error(
            EngineError{EngineError::Code::InvalidState, "Router already initialized"});
    }

    auto identity = DtlsIdentity::generate();
    if (identity.isError()) {
        return core::Result<void, EngineError>::error(
            EngineError{EngineError::Code::Internal, identity.error().message});
    }

    std::string announced = resolveAnnouncedIp();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        identity_ = std::move(identity).value();
        announcedIp_ = announced;
        capabilities_ = buildRouterCapabilities(defaultMediaCodecs());
    }
    fatalReported_ = false;
    ready_ = true;

    MEDIARELAY_LOG_INFO(logger_, LOG_CATEGORY,
        "Router created, announced IP " + announced + ", RTC ports " +
        std::to_string(config_.rtcMinPort) + "-" + std::to_string(config_.rtcMaxPort));
    return core::Result<void, EngineError>::success();
}

void LocalRouter::close() {
    ready_ = false;

    std::vector<pal::SocketHandle> sockets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : transports_) {
            sockets.push_back(entry.second.socket);
        }
        transports_.clear();
        producers_.clear();
        consumers_.clear();
    }

    for (const auto& socket : sockets) {
        network_.closeSocket(socket);
    }
}

std::string LocalRouter::announcedIp() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return announcedIp_;
}

size_t LocalRouter::transportCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transports_.size();
}

size_t LocalRouter::producerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return producers_.size();
}

size_t LocalRouter::consumerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consumers_.size();
}

bool LocalRouter::isReady() const {
    return ready_;
}

core::Result<RtpCapabilities, EngineError> LocalRouter::routerCapabilities() const {
    if (!ready_) {
        return core::Result<RtpCapabilities, EngineError>::error(
            EngineError{EngineError::Code::Unavailable, "Router is not initialized"});
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return core::Result<RtpCapabilities, EngineError>::success(capabilities_);
}

// =============================================================================
// WebRTC Transports
// =============================================================================

core::Result<TransportHandle, EngineError> LocalRouter::createWebRtcTransport(
    core::TransportRole role
) {
    using R = core::Result<TransportHandle, EngineError>;

    if (!ready_) {
        return R::error(EngineError{EngineError::Code::Unavailable, "Router is not initialized"});
    }

    auto id = randomUuid();
    auto ufrag = randomToken(ICE_UFRAG_LENGTH);
    auto password = randomToken(ICE_PASSWORD_LENGTH);
    if (!id || !ufrag || !password) {
        return R::error(randomFailure());
    }

    auto reservation = reservePort(config_.listenIp);
    if (reservation.isError()) {
        return R::error(reservation.error());
    }

    TransportHandle handle;
    handle.id = *id;
    handle.iceParameters.usernameFragment = *ufrag;
    handle.iceParameters.password = *password;
    handle.iceParameters.iceLite = true;
    handle.iceCandidates = buildCandidates(reservation.value().port);

    TransportState state;
    state.id = *id;
    state.type = TransportType::WebRtc;
    state.role = role;
    state.socket = reservation.value().socket;
    state.port = reservation.value().port;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        handle.dtlsParameters.role = "auto";
        handle.dtlsParameters.fingerprints.push_back(identity_->fingerprint());
        transports_[state.id] = std::move(state);
    }

    return R::success(std::move(handle));
}

core::Result<void, EngineError> LocalRouter::connectTransport(
    const core::TransportId& transportId,
    const DtlsParameters& dtlsParameters
) {
    using R = core::Result<void, EngineError>;

    if (dtlsParameters.fingerprints.empty()) {
        return R::error(EngineError{EngineError::Code::InvalidParameters,
                                    "dtlsParameters has no fingerprints"});
    }
    for (const auto& fingerprint : dtlsParameters.fingerprints) {
        if (!isSupportedFingerprintAlgorithm(fingerprint.algorithm)) {
            return R::error(EngineError{EngineError::Code::InvalidParameters,
                                        "Unsupported fingerprint algorithm: " + fingerprint.algorithm});
        }
        if (fingerprint.value.empty()) {
            return R::error(EngineError{EngineError::Code::InvalidParameters,
                                        "Empty fingerprint value"});
        }
    }
    if (dtlsParameters.role != "auto" && dtlsParameters.role != "client" &&
        dtlsParameters.role != "server") {
        return R::error(EngineError{EngineError::Code::InvalidParameters,
                                    "Invalid DTLS role: " + dtlsParameters.role});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transports_.find(transportId);
    if (it == transports_.end()) {
        return R::error(EngineError{EngineError::Code::NotFound, "Transport not found: " + transportId});
    }
    TransportState& transport = it->second;
    if (transport.type != TransportType::WebRtc) {
        return R::error(EngineError{EngineError::Code::InvalidState,
                                    "Transport " + transportId + " is not a WebRTC transport"});
    }
    if (transport.connected) {
        return R::error(EngineError{EngineError::Code::InvalidState,
                                    "connect() already called on transport " + transportId});
    }

    transport.connected = true;
    transport.remoteDtls = dtlsParameters;
    return R::success();
}

// =============================================================================
// Producers and Consumers
// =============================================================================

core::Result<ProducerHandle, EngineError> LocalRouter::produce(
    const core::TransportId& transportId,
    core::MediaKind kind,
    const RtpParameters& rtpParameters
) {
    using R = core::Result<ProducerHandle, EngineError>;

    const RtpCodecParameters* mediaCodec = nullptr;
    for (const auto& codec : rtpParameters.codecs) {
        if (!isRtxCodec(codec.mimeType)) {
            mediaCodec = &codec;
            break;
        }
    }
    if (mediaCodec == nullptr) {
        return R::error(EngineError{EngineError::Code::InvalidParameters,
                                    "rtpParameters has no media codec"});
    }

    auto codecKind = mediaKindOfMimeType(mediaCodec->mimeType);
    if (!codecKind || *codecKind != kind) {
        return R::error(EngineError{EngineError::Code::InvalidParameters,
                                    "Codec " + mediaCodec->mimeType + " does not match kind " +
                                    core::mediaKindToString(kind)});
    }

    auto id = randomUuid();
    if (!id) {
        return R::error(randomFailure());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transports_.find(transportId);
    if (it == transports_.end()) {
        return R::error(EngineError{EngineError::Code::NotFound, "Transport not found: " + transportId});
    }
    if (it->second.type != TransportType::WebRtc ||
        it->second.role != core::TransportRole::Producing) {
        return R::error(EngineError{EngineError::Code::InvalidState,
                                    "Transport " + transportId + " is not a producing transport"});
    }

    bool supported = false;
    for (const auto& capability : capabilities_.codecs) {
        if (codecMatches(*mediaCodec, capability)) {
            supported = true;
            break;
        }
    }
    if (!supported) {
        return R::error(EngineError{EngineError::Code::InvalidParameters,
                                    "Unsupported codec " + mediaCodec->mimeType});
    }

    ProducerHandle handle;
    handle.id = *id;
    handle.kind = kind;
    handle.rtpParameters = rtpParameters;
    handle.paused = false;
    if (handle.rtpParameters.encodings.empty()) {
        auto ssrc = randomSsrc();
        if (!ssrc) {
            return R::error(randomFailure());
        }
        handle.rtpParameters.encodings.push_back(RtpEncoding{*ssrc, ""});
    }

    producers_[handle.id] = ProducerState{handle, transportId};
    return R::success(std::move(handle));
}

core::Result<void, EngineError> LocalRouter::resumeProducer(const core::ProducerId& producerId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = producers_.find(producerId);
    if (it == producers_.end()) {
        return core::Result<void, EngineError>::error(
            EngineError{EngineError::Code::NotFound, "Producer not found: " + producerId});
    }
    it->second.handle.paused = false;
    return core::Result<void, EngineError>::success();
}

core::Result<ProducerHandle, EngineError> LocalRouter::findProducer(
    const core::ProducerId& producerId
) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = producers_.find(producerId);
    if (it == producers_.end()) {
        return core::Result<ProducerHandle, EngineError>::error(
            EngineError{EngineError::Code::NotFound, "Producer not found: " + producerId});
    }
    return core::Result<ProducerHandle, EngineError>::success(it->second.handle);
}

core::Result<ConsumerHandle, EngineError> LocalRouter::consume(
    const core::TransportId& transportId,
    const core::ProducerId& producerId,
    const RtpCapabilities& capabilities,
    bool paused
) {
    using R = core::Result<ConsumerHandle, EngineError>;

    auto id = randomUuid();
    auto ssrc = randomSsrc();
    if (!id || !ssrc) {
        return R::error(randomFailure());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto transportIt = transports_.find(transportId);
    if (transportIt == transports_.end()) {
        return R::error(EngineError{EngineError::Code::NotFound, "Transport not found: " + transportId});
    }
    TransportState& transport = transportIt->second;
    if (transport.type == TransportType::WebRtc && transport.role != core::TransportRole::Consuming) {
        return R::error(EngineError{EngineError::Code::InvalidState,
                                    "Transport " + transportId + " is not a consuming transport"});
    }

    auto producerIt = producers_.find(producerId);
    if (producerIt == producers_.end()) {
        return R::error(EngineError{EngineError::Code::NotFound, "Producer not found: " + producerId});
    }
    const ProducerHandle& producer = producerIt->second.handle;

    // First producer media codec the consumer can receive, with the
    // consumer's payload type and feedback
    std::optional<RtpCodecParameters> consumerCodec;
    for (const auto& codec : producer.rtpParameters.codecs) {
        if (isRtxCodec(codec.mimeType)) {
            continue;
        }
        for (const auto& capability : capabilities.codecs) {
            if (codecMatches(codec, capability)) {
                RtpCodecParameters selected = codec;
                if (capability.preferredPayloadType >= 0) {
                    selected.payloadType = capability.preferredPayloadType;
                }
                selected.rtcpFeedback = capability.rtcpFeedback;
                consumerCodec = selected;
                break;
            }
        }
        if (consumerCodec) {
            break;
        }
    }
    if (!consumerCodec) {
        return R::error(EngineError{EngineError::Code::InvalidParameters,
                                    "Capabilities cannot receive producer " + producerId});
    }

    ConsumerHandle handle;
    handle.id = *id;
    handle.producerId = producerId;
    handle.kind = producer.kind;
    handle.paused = paused;
    handle.rtpParameters.mid = std::to_string(transport.nextMid++);
    handle.rtpParameters.codecs.push_back(*consumerCodec);
    handle.rtpParameters.encodings.push_back(RtpEncoding{*ssrc, ""});
    handle.rtpParameters.cname = producer.rtpParameters.cname;

    consumers_[handle.id] = ConsumerState{handle, transportId};
    return R::success(std::move(handle));
}

core::Result<void, EngineError> LocalRouter::resumeConsumer(const core::ConsumerId& consumerId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = consumers_.find(consumerId);
    if (it == consumers_.end()) {
        return core::Result<void, EngineError>::error(
            EngineError{EngineError::Code::NotFound, "Consumer not found: " + consumerId});
    }
    it->second.handle.paused = false;
    return core::Result<void, EngineError>::success();
}

// =============================================================================
// Plain RTP Transports
// =============================================================================

core::Result<PassiveTap, EngineError> LocalRouter::createPlainTransport(const std::string& listenIp) {
    using R = core::Result<PassiveTap, EngineError>;

    if (!ready_) {
        return R::error(EngineError{EngineError::Code::Unavailable, "Router is not initialized"});
    }
    if (!isValidIPv4(listenIp)) {
        return R::error(EngineError{EngineError::Code::InvalidParameters,
                                    "Invalid listen IP: " + listenIp});
    }

    auto id = randomUuid();
    if (!id) {
        return R::error(randomFailure());
    }

    auto reservation = reservePort(listenIp);
    if (reservation.isError()) {
        return R::error(reservation.error());
    }

    TransportState state;
    state.id = *id;
    state.type = TransportType::Plain;
    state.role = core::TransportRole::Consuming;
    state.socket = reservation.value().socket;
    state.port = reservation.value().port;

    PassiveTap tap{*id, listenIp, reservation.value().port};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transports_[state.id] = std::move(state);
    }

    MEDIARELAY_LOG_DEBUG(logger_, LOG_CATEGORY,
        "Plain transport " + tap.transportId + " bound on " + listenIp + ":" +
        std::to_string(tap.localPort));
    return R::success(std::move(tap));
}

core::Result<void, EngineError> LocalRouter::connectPlainTransport(
    const core::TransportId& transportId,
    const std::string& ip,
    uint16_t port
) {
    using R = core::Result<void, EngineError>;

    if (!isValidIPv4(ip) || port == 0) {
        return R::error(EngineError{EngineError::Code::InvalidParameters,
                                    "Invalid remote endpoint " + ip + ":" + std::to_string(port)});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transports_.find(transportId);
    if (it == transports_.end()) {
        return R::error(EngineError{EngineError::Code::NotFound, "Transport not found: " + transportId});
    }
    TransportState& transport = it->second;
    if (transport.type != TransportType::Plain) {
        return R::error(EngineError{EngineError::Code::InvalidState,
                                    "Transport " + transportId + " is not a plain transport"});
    }
    if (transport.connected) {
        return R::error(EngineError{EngineError::Code::InvalidState,
                                    "connect() already called on transport " + transportId});
    }

    transport.connected = true;
    transport.remoteIp = ip;
    transport.remotePort = port;
    return R::success();
}

// =============================================================================
// Release
// =============================================================================

template<typename Predicate>
size_t LocalRouter::eraseConsumersLocked(Predicate predicate) {
    size_t erased = 0;
    for (auto it = consumers_.begin(); it != consumers_.end();) {
        if (predicate(it->second)) {
            it = consumers_.erase(it);
            ++erased;
        } else {
            ++it;
        }
    }
    return erased;
}

core::Result<void, EngineError> LocalRouter::closeTransport(const core::TransportId& transportId) {
    pal::SocketHandle socket{pal::INVALID_SOCKET_HANDLE};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transports_.find(transportId);
        if (it == transports_.end()) {
            return core::Result<void, EngineError>::error(
                EngineError{EngineError::Code::NotFound, "Transport not found: " + transportId});
        }
        socket = it->second.socket;
        transports_.erase(it);

        std::vector<core::ProducerId> closedProducers;
        for (auto producerIt = producers_.begin(); producerIt != producers_.end();) {
            if (producerIt->second.transportId == transportId) {
                closedProducers.push_back(producerIt->first);
                producerIt = producers_.erase(producerIt);
            } else {
                ++producerIt;
            }
        }

        eraseConsumersLocked([&](const ConsumerState& consumer) {
            if (consumer.transportId == transportId) {
                return true;
            }
            for (const auto& producerId : closedProducers) {
                if (consumer.handle.producerId == producerId) {
                    return true;
                }
            }
            return false;
        });
    }

    network_.closeSocket(socket);
    return core::Result<void, EngineError>::success();
}

core::Result<void, EngineError> LocalRouter::closeProducer(const core::ProducerId& producerId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = producers_.find(producerId);
    if (it == producers_.end()) {
        return core::Result<void, EngineError>::error(
            EngineError{EngineError::Code::NotFound, "Producer not found: " + producerId});
    }
    producers_.erase(it);

    eraseConsumersLocked([&](const ConsumerState& consumer) {
        return consumer.handle.producerId == producerId;
    });
    return core::Result<void, EngineError>::success();
}

core::Result<void, EngineError> LocalRouter::closeConsumer(const core::ConsumerId& consumerId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (consumers_.erase(consumerId) == 0) {
        return core::Result<void, EngineError>::error(
            EngineError{EngineError::Code::NotFound, "Consumer not found: " + consumerId});
    }
    return core::Result<void, EngineError>::success();
}

void LocalRouter::setFatalErrorHandler(EngineFatalErrorHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    fatalHandler_ = std::move(handler);
}

// =============================================================================
// Helpers
// =============================================================================

core::Result<LocalRouter::PortReservation, EngineError> LocalRouter::reservePort(const std::string& ip) {
    using R = core::Result<PortReservation, EngineError>;

    const uint32_t range = static_cast<uint32_t>(config_.rtcMaxPort - config_.rtcMinPort) + 1;
    const uint32_t start = nextPortOffset_.fetch_add(1) % range;

    for (uint32_t i = 0; i < range; ++i) {
        uint32_t offset = (start + i) % range;
        auto port = static_cast<uint16_t>(config_.rtcMinPort + offset);

        auto bound = network_.bindUdp(ip, port);
        if (bound.isSuccess()) {
            nextPortOffset_ = offset + 1;
            return R::success(PortReservation{bound.value(), port});
        }

        switch (bound.error().code) {
            case pal::NetworkErrorCode::AddressInUse:
            case pal::NetworkErrorCode::PermissionDenied:
                continue;
            case pal::NetworkErrorCode::InvalidAddress:
            case pal::NetworkErrorCode::AddressNotAvailable:
                return R::error(EngineError{EngineError::Code::InvalidParameters,
                                            "Cannot bind " + ip + ": " + bound.error().message});
            default:
                // Out of descriptors or sockets: the worker cannot go on
                reportFatal("RTC port allocation failed: " + bound.error().message);
                return R::error(EngineError{EngineError::Code::Internal, bound.error().message});
        }
    }

    return R::error(EngineError{EngineError::Code::ResourceExhausted,
                                "No free RTC port in " + std::to_string(config_.rtcMinPort) + "-" +
                                std::to_string(config_.rtcMaxPort)});
}

std::vector<IceCandidate> LocalRouter::buildCandidates(uint16_t port) const {
    std::vector<std::string> addresses;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        addresses.push_back(announcedIp_);
    }
    if (addresses.front() != LOOPBACK_IP) {
        addresses.push_back(LOOPBACK_IP);
    }

    std::vector<std::string> protocols;
    if (config_.preferUdp || !config_.enableTcp) {
        if (config_.enableUdp) protocols.push_back("udp");
        if (config_.enableTcp) protocols.push_back("tcp");
    } else {
        protocols.push_back("tcp");
        if (config_.enableUdp) protocols.push_back("udp");
    }

    std::vector<IceCandidate> candidates;
    for (size_t p = 0; p < protocols.size(); ++p) {
        uint32_t basePreference = p == 0 ? 65535 : 32767;
        for (size_t a = 0; a < addresses.size(); ++a) {
            uint32_t localPreference = basePreference - static_cast<uint32_t>(a);

            IceCandidate candidate;
            candidate.foundation = protocols[p] + "candidate";
            candidate.priority = (HOST_TYPE_PREFERENCE << 24) + (localPreference << 8) + 255;
            candidate.ip = addresses[a];
            candidate.port = port;
            candidate.protocol = protocols[p];
            candidate.type = "host";
            if (protocols[p] == "tcp") {
                candidate.tcpType = "passive";
            }
            candidates.push_back(std::move(candidate));
        }
    }
    return candidates;
}

std::string LocalRouter::resolveAnnouncedIp() const {
    if (!config_.announcedIp.empty()) {
        return config_.announcedIp;
    }
    if (config_.listenIp != "0.0.0.0" && !config_.listenIp.empty()) {
        return config_.listenIp;
    }

    auto addresses = network_.listLocalIPv4Addresses();
    if (addresses.isSuccess() && !addresses.value().empty()) {
        return addresses.value().front();
    }
    if (addresses.isError()) {
        MEDIARELAY_LOG_WARNING(logger_, LOG_CATEGORY,
            "Interface enumeration failed, announcing loopback: " + addresses.error().message);
    }
    return LOOPBACK_IP;
}

void LocalRouter::reportFatal(const std::string& reason) {
    if (fatalReported_.exchange(true)) {
        return;
    }
    ready_ = false;

    EngineFatalErrorHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = fatalHandler_;
    }

    MEDIARELAY_LOG_ERROR(logger_, LOG_CATEGORY, "Media engine worker died: " + reason);
    if (handler) {
        handler(reason);
    }
}

} // namespace engine
} // namespace mediarelay
