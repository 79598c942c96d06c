/**
 * @file SecureXferNode.cpp
 * @brief One running SecureXfer instance: identity, listener, discovery, sender
 */

#include "securexfer/SecureXferNode.h"
#include "securexfer/CertificateManager.h"
#include "securexfer/FingerprintUtils.h"
#include "securexfer/SettingsManager.h"
#include "securexfer/ThreadSafeLog.h"

#include <chrono>
#include <iostream>
#include <memory>

namespace SecureXfer {

NodeOptions NodeOptions::fromSettings(const SettingsManager& settings) {
    NodeOptions options;
    options.displayName = settings.getDisplayName();
    options.downloadDir = settings.getDownloadPath();
    options.decisionTimeoutMs = settings.getDecisionTimeoutMs();
    options.discoveryIntervalMs = settings.getDiscoveryIntervalMs();
    options.peerStaleMs = settings.getPeerStaleMs();
    options.maxIncomingSizeBytes = settings.getMaxIncomingSizeBytes();
    return options;
}

//=============================================================================
// SecureXferNode: Constructor / Destructor
//=============================================================================

SecureXferNode::SecureXferNode(const NodeOptions& options)
    : m_options(options)
    , m_running(false)
    , m_stopRequested(false)
{
}

SecureXferNode::~SecureXferNode() {
    stop();
}

//=============================================================================
// SecureXferNode: start() / stop()
//=============================================================================

bool SecureXferNode::start(std::string& errorMsg) {
    if (m_running.load()) {
        errorMsg = "Node already running";
        return false;
    }

    // 1. Identity (fatal on failure)
    if (!CertificateManager::initializeIdentity(m_identity, errorMsg)) {
        ThreadSafeLog::error("[Node] " + errorMsg);
        return false;
    }
    if (!m_options.displayName.empty()) {
        m_identity.displayName = m_options.displayName.substr(0, MAX_DISPLAY_NAME);
    }

    // 2. Transfer listener
    m_server = std::make_unique<TransferServer>(m_identity);
    m_server->setDownloadDir(m_options.downloadDir);
    m_server->setMaxIncomingSizeBytes(m_options.maxIncomingSizeBytes);
    m_server->setPendingDecisionLimitMs(m_options.decisionTimeoutMs * 2);
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_server->setIncomingRequestCallback(m_incomingRequestCallback);
        m_server->setRequestWithdrawnCallback(m_requestWithdrawnCallback);
    }
    m_server->setStatusCallback([this](const TransferStatus& status) { forwardStatus(status); });

    if (!m_server->start(errorMsg, m_options.listenPort, m_options.bindIp)) {
        ThreadSafeLog::error("[Node] Transfer listener failed: " + errorMsg);
        m_server.reset();
        return false;
    }
    m_identity.listenPort = m_server->getPort();

    m_initiator = std::make_unique<TransferInitiator>(m_identity.displayName);
    m_initiator->setDecisionTimeoutMs(m_options.decisionTimeoutMs);
    m_initiator->setStatusCallback([this](const TransferStatus& status) { forwardStatus(status); });

    // 3. Discovery
    if (m_options.enableDiscovery) {
        m_discovery = std::make_unique<DiscoveryService>(m_identity, m_options.peerStaleMs);
        std::string discoveryError;
        if (!m_discovery->start(discoveryError)) {
            // Transfers to explicitly addressed peers still work
            ThreadSafeLog::warn("[Node] Discovery unavailable: " + discoveryError);
            std::cerr << "[Node] Discovery unavailable: " << discoveryError << "\n";
            m_discovery.reset();
        }
    }

    m_stopRequested.store(false);
    m_running.store(true);

    if (m_discovery) {
        m_discovery->announce();
        m_driverThread = std::thread(&SecureXferNode::driverThreadFunc, this);
    }

    ThreadSafeLog::info("[Node] Started as " + m_identity.displayName + " (" +
                        m_identity.processId + ") on port " +
                        std::to_string(m_identity.listenPort) + ", fingerprint " +
                        FingerprintUtils::shortForm(m_identity.fingerprint()));
    return true;
}

void SecureXferNode::stop() {
    if (!m_running.load()) {
        return;
    }

    m_stopRequested.store(true);
    m_driverCv.notify_all();
    if (m_driverThread.joinable()) {
        m_driverThread.join();
    }

    // Outgoing first so no new connections target a stopping listener
    if (m_initiator) {
        m_initiator->shutdown();
    }
    if (m_discovery) {
        m_discovery->stop();
    }
    if (m_server) {
        m_server->stop();
    }

    m_running.store(false);
    ThreadSafeLog::info("[Node] Stopped");
}

//=============================================================================
// SecureXferNode: Operations
//=============================================================================

std::vector<PeerRecord> SecureXferNode::listPeers() {
    if (!m_discovery) {
        return {};
    }
    return m_discovery->getPeers();
}

bool SecureXferNode::findPeer(const std::string& peerId, PeerRecord& peer) {
    for (const auto& candidate : listPeers()) {
        if (candidate.peerId == peerId) {
            peer = candidate;
            return true;
        }
    }
    return false;
}

bool SecureXferNode::sendFiles(const PeerRecord& peer, const std::vector<std::string>& paths,
                               std::string& transferId, std::string& errorMsg) {
    if (!m_running.load() || !m_initiator) {
        errorMsg = "Node not running";
        return false;
    }

    const FileSelectionResult selection = FileSelection::processPaths(paths);
    if (selection.files.empty()) {
        errorMsg = "Nothing to send";
        if (!selection.warnings.empty()) {
            errorMsg += ": " + selection.warnings.front();
        }
        return false;
    }

    return m_initiator->sendFiles(peer, selection.files, transferId, errorMsg);
}

bool SecureXferNode::resolveIncoming(const std::string& transferId, bool allowed) {
    if (!m_server) {
        return false;
    }
    return m_server->resolveDecision(transferId, allowed);
}

bool SecureXferNode::cancelOutgoing(const std::string& transferId) {
    if (!m_initiator) {
        return false;
    }
    return m_initiator->cancelOutgoing(transferId);
}

void SecureXferNode::waitOutgoing(const std::string& transferId) {
    if (m_initiator) {
        m_initiator->wait(transferId);
    }
}

uint16_t SecureXferNode::getListenPort() const {
    return m_server ? m_server->getPort() : 0;
}

//=============================================================================
// SecureXferNode: Subscriptions
//=============================================================================

void SecureXferNode::setPeerListCallback(PeerListCallback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_peerListCallback = std::move(callback);
}

void SecureXferNode::setIncomingRequestCallback(IncomingRequestCallback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_incomingRequestCallback = callback;
    if (m_server) {
        m_server->setIncomingRequestCallback(std::move(callback));
    }
}

void SecureXferNode::setRequestWithdrawnCallback(RequestWithdrawnCallback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_requestWithdrawnCallback = callback;
    if (m_server) {
        m_server->setRequestWithdrawnCallback(std::move(callback));
    }
}

void SecureXferNode::setStatusCallback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_statusCallback = std::move(callback);
}

void SecureXferNode::forwardStatus(const TransferStatus& status) {
    StatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        callback = m_statusCallback;
    }
    if (callback) {
        callback(status);
    }
}

//=============================================================================
// SecureXferNode: Discovery driver
//=============================================================================

void SecureXferNode::driverThreadFunc() {
    while (!m_stopRequested.load()) {
        m_discovery->discover();

        const std::vector<PeerRecord> peers = m_discovery->getPeers();
        PeerListCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_peerListCallback;
        }
        if (callback) {
            callback(peers);
        }

        std::unique_lock<std::mutex> lock(m_driverMutex);
        m_driverCv.wait_for(lock, std::chrono::milliseconds(m_options.discoveryIntervalMs),
                            [this]() { return m_stopRequested.load(); });
    }
}

}  // namespace SecureXfer
