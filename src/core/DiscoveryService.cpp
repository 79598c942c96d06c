/**
 * @file DiscoveryService.cpp
 * @brief Implementation of the multicast DNS discovery service
 *
 * Presence is exchanged as standard DNS records on the mDNS group. A query
 * for the service name makes every running process announce itself, so a
 * freshly started process fills its peer table within one round trip.
 */

#include "securexfer/DiscoveryService.h"
#include "securexfer/ErrorCodes.h"
#include "securexfer/FingerprintUtils.h"
#include "securexfer/SocketUtils.h"
#include "securexfer/ThreadSafeLog.h"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <iostream>

namespace SecureXfer {

namespace {
    #define LogDiscovery(msg) SecureXfer::ThreadSafeLog::log(msg)

    constexpr uint32_t LISTENER_POLL_MS = 250;

    bool startsWithIgnoreCase(const std::string& value, const char* prefix) {
        size_t i = 0;
        for (; prefix[i] != '\0'; ++i) {
            if (i >= value.size()) {
                return false;
            }
            if (std::tolower(static_cast<unsigned char>(value[i])) !=
                std::tolower(static_cast<unsigned char>(prefix[i]))) {
                return false;
            }
        }
        return true;
    }

    /**
     * Value of a `key=value` TXT token; everything after the first '='.
     */
    bool findTxtValue(const std::vector<std::string>& entries, const std::string& key,
                      std::string& value) {
        const std::string prefix = key + "=";
        for (const auto& entry : entries) {
            if (entry.compare(0, prefix.size(), prefix) == 0) {
                value = entry.substr(prefix.size());
                return true;
            }
        }
        return false;
    }

    /**
     * First record of a type, preferring one whose owner name matches.
     */
    const DnsRecord* findRecord(const DnsMessage& message, uint16_t type,
                                const std::string& preferredName) {
        const DnsRecord* fallback = nullptr;
        for (const auto* section : {&message.answers, &message.additionals}) {
            for (const auto& record : *section) {
                if (record.type != type) {
                    continue;
                }
                if (!preferredName.empty() && DnsCodec::namesEqual(record.name, preferredName)) {
                    return &record;
                }
                if (!fallback) {
                    fallback = &record;
                }
            }
        }
        return fallback;
    }
}

//=============================================================================
// Constructor / Destructor
//=============================================================================

DiscoveryService::DiscoveryService(const LocalIdentity& identity,
                                   uint32_t staleMs,
                                   PeerTable::Clock clock)
    : m_processId(identity.processId)
    , m_fingerprint(identity.fingerprint())
    , m_displayName(identity.displayName)
    , m_listenPort(identity.listenPort)
    , m_peers(staleMs, std::move(clock))
    , m_socket(INVALID_SOCKET_FD)
    , m_running(false)
    , m_stopRequested(false) {
}

DiscoveryService::~DiscoveryService() {
    stop();
}

//=============================================================================
// Service Control
//=============================================================================

bool DiscoveryService::start(std::string& errorMsg) {
    if (m_running.load()) {
        return true;
    }

    if (!initializeSocket(errorMsg)) {
        LogDiscovery("[Discovery] start failed: " + errorMsg);
        return false;
    }

    m_stopRequested = false;
    m_running = true;
    m_listenerThread = std::thread(&DiscoveryService::listenerThreadFunc, this);

    LogDiscovery("[Discovery] Started on " + std::string(MDNS_MULTICAST_GROUP) + ":" +
                 std::to_string(MDNS_PORT) + " as " + m_processId);
    return true;
}

void DiscoveryService::stop() {
    if (!m_running.load() && !m_listenerThread.joinable()) {
        return;
    }

    m_stopRequested = true;
    SocketUtils::shutdownSocket(m_socket);

    if (m_listenerThread.joinable()) {
        m_listenerThread.join();
    }

    cleanupSocket();
    m_running = false;
    LogDiscovery("[Discovery] Stopped");
}

bool DiscoveryService::initializeSocket(std::string& errorMsg) {
    SocketUtils::initializeNetworking();

    m_socket = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (m_socket < 0) {
        m_socket = INVALID_SOCKET_FD;
        errorMsg = "socket() failed: " + SocketUtils::errnoToString(errno);
        return false;
    }

    // Other mDNS responders (avahi) usually hold 5353 already
    const int reuse = 1;
    if (setsockopt(m_socket, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) != 0) {
        errorMsg = "SO_REUSEADDR failed: " + SocketUtils::errnoToString(errno);
        cleanupSocket();
        return false;
    }
#ifdef SO_REUSEPORT
    setsockopt(m_socket, SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse));
#endif

    sockaddr_in bindAddr{};
    bindAddr.sin_family = AF_INET;
    bindAddr.sin_port = htons(MDNS_PORT);
    bindAddr.sin_addr.s_addr = htonl(INADDR_ANY);
    if (::bind(m_socket, reinterpret_cast<sockaddr*>(&bindAddr), sizeof(bindAddr)) != 0) {
        errorMsg = "bind() to port " + std::to_string(MDNS_PORT) + " failed: " +
                   SocketUtils::errnoToString(errno);
        cleanupSocket();
        return false;
    }

    ip_mreq membership{};
    inet_pton(AF_INET, MDNS_MULTICAST_GROUP, &membership.imr_multiaddr);
    membership.imr_interface.s_addr = htonl(INADDR_ANY);
    if (setsockopt(m_socket, IPPROTO_IP, IP_ADD_MEMBERSHIP, &membership, sizeof(membership)) != 0) {
        errorMsg = "IP_ADD_MEMBERSHIP failed: " + SocketUtils::errnoToString(errno);
        cleanupSocket();
        return false;
    }

    const int ttl = MDNS_MULTICAST_TTL;
    setsockopt(m_socket, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));

    // Loopback on: two processes on one host must see each other
    const unsigned char loop = 1;
    setsockopt(m_socket, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop));

    return true;
}

void DiscoveryService::cleanupSocket() {
    SocketUtils::closeSocket(m_socket);
}

//=============================================================================
// Listener Thread
//=============================================================================

void DiscoveryService::listenerThreadFunc() {
    std::vector<uint8_t> buffer(MAX_MDNS_PACKET_SIZE);

    while (!m_stopRequested.load()) {
        const int ready = SocketUtils::waitReadable(m_socket, LISTENER_POLL_MS);
        if (ready == 0) {
            continue;
        }
        if (ready < 0) {
            if (!m_stopRequested.load()) {
                std::cerr << "[Discovery] poll() failed: "
                          << SocketUtils::errnoToString(errno) << "\n";
            }
            break;
        }

        sockaddr_in sender{};
        socklen_t senderLen = sizeof(sender);
        const ssize_t received = ::recvfrom(m_socket, buffer.data(), buffer.size(), 0,
                                            reinterpret_cast<sockaddr*>(&sender), &senderLen);
        if (received <= 0) {
            if (m_stopRequested.load()) {
                break;
            }
            if (received < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) {
                continue;
            }
            // Zero-length datagram, or the socket was shut down under us
            if (received == 0) {
                continue;
            }
            std::cerr << "[Discovery] recvfrom() failed: "
                      << SocketUtils::errnoToString(errno) << "\n";
            break;
        }

        processPacket(buffer.data(), static_cast<size_t>(received));
    }
}

//=============================================================================
// Discovery Operations
//=============================================================================

void DiscoveryService::processPacket(const uint8_t* data, size_t size) {
    DnsMessage message;
    std::string parseError;
    if (!DnsCodec::decode(data, size, message, parseError)) {
        // DiscoveryParseError: foreign traffic on a shared port, drop it
        LogDiscovery(ErrorCodes::format(ErrorCodes::DISCOVERY_MALFORMED_PACKET,
                                        "[Discovery] Dropped packet: " + parseError));
        return;
    }

    if (!message.isResponse()) {
        handleQuery(message);
        return;
    }

    std::string responseError;
    if (!handleResponse(message, responseError) && !responseError.empty()) {
        LogDiscovery("[Discovery] Ignored response: " + responseError);
    }
}

bool DiscoveryService::handleQuery(const DnsMessage& query) {
    const bool asksForUs = std::any_of(query.questions.begin(), query.questions.end(),
        [](const DnsQuestion& q) { return DnsCodec::namesEqual(q.name, SERVICE_NAME); });

    if (!asksForUs) {
        return false;
    }

    announce();
    return true;
}

bool DiscoveryService::handleResponse(const DnsMessage& response, std::string& errorMsg) {
    const DnsRecord* ptr = nullptr;
    for (const auto& record : response.answers) {
        if (record.type == DnsType::PTR && DnsCodec::namesEqual(record.name, SERVICE_NAME)) {
            ptr = &record;
            break;
        }
    }
    if (!ptr) {
        // Some other service's traffic
        return false;
    }

    const DnsRecord* txt = findRecord(response, DnsType::TXT, ptr->ptrName);
    const DnsRecord* srv = findRecord(response, DnsType::SRV, ptr->ptrName);
    const DnsRecord* a = findRecord(response, DnsType::A, srv ? srv->srv.target : std::string());

    if (!txt || !srv || !a) {
        errorMsg = ErrorCodes::format(ErrorCodes::DISCOVERY_INCOMPLETE_RESPONSE,
                                      std::string("Response missing ") +
                                      (!txt ? "TXT" : !srv ? "SRV" : "A") + " record");
        return false;
    }

    std::string peerId;
    std::string displayName;
    std::string fingerprint;
    if (!findTxtValue(txt->txt, "id", peerId) ||
        !findTxtValue(txt->txt, "name", displayName) ||
        !findTxtValue(txt->txt, "fp", fingerprint)) {
        errorMsg = ErrorCodes::format(ErrorCodes::DISCOVERY_INCOMPLETE_RESPONSE,
                                      "TXT record lacks id/name/fp");
        return false;
    }

    if (peerId == m_processId) {
        // Our own announcement looped back
        return false;
    }

    if (peerId.empty() || peerId.size() > MAX_ID_LENGTH) {
        errorMsg = ErrorCodes::format(ErrorCodes::DISCOVERY_MALFORMED_PACKET, "Invalid peer id");
        return false;
    }

    const std::string normalizedFp = FingerprintUtils::normalizeSha256Hex(fingerprint);
    if (normalizedFp.empty()) {
        errorMsg = ErrorCodes::format(ErrorCodes::DISCOVERY_MALFORMED_PACKET,
                                      "Invalid fingerprint from " + peerId);
        return false;
    }

    if (srv->srv.port == 0) {
        errorMsg = ErrorCodes::format(ErrorCodes::DISCOVERY_MALFORMED_PACKET,
                                      "SRV record with port 0 from " + peerId);
        return false;
    }

    if (displayName.size() > MAX_DISPLAY_NAME) {
        displayName.resize(MAX_DISPLAY_NAME);
    }

    const UpsertResult result = m_peers.upsert(peerId, displayName, a->address,
                                               srv->srv.port, normalizedFp);
    if (result == UpsertResult::Added) {
        std::cout << "[Discovery] New peer: " << displayName << " (" << a->address << ":"
                  << srv->srv.port << ")\n";
        LogDiscovery("[Discovery] Peer added: " + peerId + " " + a->address + ":" +
                     std::to_string(srv->srv.port) + " fp=" + FingerprintUtils::shortForm(normalizedFp));
    } else if (result == UpsertResult::Replaced) {
        LogDiscovery("[Discovery] Peer restarted on " + a->address + ", now " + peerId);
    }
    return true;
}

std::vector<PeerRecord> DiscoveryService::getPeers() {
    return m_peers.sweepAndSnapshot();
}

void DiscoveryService::announce() {
    sendMessage(buildAnnouncement(), "announcement");
}

void DiscoveryService::discover() {
    sendMessage(buildQuery(), "query");
}

void DiscoveryService::sendMessage(const DnsMessage& message, const char* what) {
    std::vector<uint8_t> packet;
    std::string encodeError;
    if (!DnsCodec::encode(message, packet, encodeError)) {
        LogDiscovery(std::string("[Discovery] Failed to encode ") + what + ": " + encodeError);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_senderMutex);
        if (m_packetSender) {
            if (!m_packetSender(packet)) {
                LogDiscovery(std::string("[Discovery] Packet hook rejected ") + what);
            }
            return;
        }
    }

    if (m_socket == INVALID_SOCKET_FD) {
        // Not started: nothing to send on
        return;
    }

    sockaddr_in group{};
    group.sin_family = AF_INET;
    group.sin_port = htons(MDNS_PORT);
    inet_pton(AF_INET, MDNS_MULTICAST_GROUP, &group.sin_addr);

    const ssize_t sent = ::sendto(m_socket, packet.data(), packet.size(), 0,
                                  reinterpret_cast<sockaddr*>(&group), sizeof(group));
    if (sent < 0) {
        std::cerr << "[Discovery] sendto() " << what << " failed: "
                  << SocketUtils::errnoToString(errno) << "\n";
    }
}

//=============================================================================
// Message Construction
//=============================================================================

DnsMessage DiscoveryService::buildAnnouncement() const {
    std::string displayName;
    uint16_t port;
    {
        std::lock_guard<std::mutex> lock(m_identityMutex);
        displayName = m_displayName;
        port = m_listenPort;
    }

    const std::string host = hostLabel(displayName);
    const std::string instance = host + "." + SERVICE_NAME;
    const std::string target = host + HOST_DOMAIN_SUFFIX;

    DnsMessage message;
    message.flags = DNS_FLAG_RESPONSE | DNS_FLAG_AUTHORITATIVE;

    DnsRecord ptr;
    ptr.name = SERVICE_NAME;
    ptr.type = DnsType::PTR;
    ptr.ttl = MDNS_RECORD_TTL_S;
    ptr.ptrName = instance;
    message.answers.push_back(ptr);

    DnsRecord srv;
    srv.name = instance;
    srv.type = DnsType::SRV;
    srv.ttl = MDNS_RECORD_TTL_S;
    srv.srv.port = port;
    srv.srv.target = target;
    message.additionals.push_back(srv);

    DnsRecord txt;
    txt.name = instance;
    txt.type = DnsType::TXT;
    txt.ttl = MDNS_RECORD_TTL_S;
    txt.txt = {"id=" + m_processId, "name=" + displayName, "fp=" + m_fingerprint};
    message.additionals.push_back(txt);

    DnsRecord a;
    a.name = target;
    a.type = DnsType::A;
    a.ttl = MDNS_RECORD_TTL_S;
    a.address = selectAdvertisedAddress(enumerateInterfaces());
    message.additionals.push_back(a);

    return message;
}

DnsMessage DiscoveryService::buildQuery() {
    DnsMessage message;
    DnsQuestion question;
    question.name = SERVICE_NAME;
    question.type = DnsType::PTR;
    message.questions.push_back(question);
    return message;
}

//=============================================================================
// Configuration
//=============================================================================

void DiscoveryService::setListenPort(uint16_t port) {
    std::lock_guard<std::mutex> lock(m_identityMutex);
    m_listenPort = port;
}

void DiscoveryService::setDisplayName(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_identityMutex);
    m_displayName = name.substr(0, MAX_DISPLAY_NAME);
}

void DiscoveryService::setPacketSender(PacketSender sender) {
    std::lock_guard<std::mutex> lock(m_senderMutex);
    m_packetSender = std::move(sender);
}

uint16_t DiscoveryService::getListenPort() const {
    std::lock_guard<std::mutex> lock(m_identityMutex);
    return m_listenPort;
}

std::string DiscoveryService::getDisplayName() const {
    std::lock_guard<std::mutex> lock(m_identityMutex);
    return m_displayName;
}

//=============================================================================
// Address Selection
//=============================================================================

std::string DiscoveryService::selectAdvertisedAddress(
    const std::vector<NetworkInterfaceAddress>& interfaces) {
    for (const auto& iface : interfaces) {
        if (iface.isLoopback) {
            continue;
        }
        for (const char* fragment : PHYSICAL_ADAPTER_FRAGMENTS) {
            if (startsWithIgnoreCase(iface.name, fragment)) {
                return iface.address;
            }
        }
    }

    for (const auto& iface : interfaces) {
        if (!iface.isLoopback) {
            return iface.address;
        }
    }

    return LOCALHOST_IP;
}

std::vector<NetworkInterfaceAddress> DiscoveryService::enumerateInterfaces() {
    std::vector<NetworkInterfaceAddress> result;

    ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) {
        std::cerr << "[Discovery] getifaddrs() failed: "
                  << SocketUtils::errnoToString(errno) << "\n";
        return result;
    }

    for (ifaddrs* it = list; it != nullptr; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if ((it->ifa_flags & IFF_UP) == 0) {
            continue;
        }

        char buf[INET_ADDRSTRLEN] = {};
        const auto* addr = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
        if (!inet_ntop(AF_INET, &addr->sin_addr, buf, sizeof(buf))) {
            continue;
        }

        result.emplace_back(it->ifa_name ? it->ifa_name : "", buf,
                            (it->ifa_flags & IFF_LOOPBACK) != 0);
    }

    freeifaddrs(list);
    return result;
}

std::string DiscoveryService::hostLabel(const std::string& displayName) {
    std::string label;
    label.reserve(displayName.size());
    for (char c : displayName) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-') {
            label.push_back(c);
        } else {
            label.push_back('-');
        }
    }
    if (label.size() > 63) {
        label.resize(63);
    }
    if (label.empty()) {
        label = "securexfer-host";
    }
    return label;
}

}  // namespace SecureXfer
