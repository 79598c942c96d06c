/**
 * @file TransferServer.cpp
 * @brief TLS transfer listener: approval handshake and upload ingestion
 */

#include "securexfer/TransferServer.h"
#include "securexfer/ErrorCodes.h"
#include "securexfer/FileTransfer.h"
#include "securexfer/SocketUtils.h"
#include "securexfer/ThreadSafeLog.h"
#include "securexfer/TlsSocket.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <vector>

namespace SecureXfer {

namespace {
    #define LogTransfer(msg) SecureXfer::ThreadSafeLog::log(msg)

    constexpr uint32_t ACCEPT_RETRY_MS = 100;
}

//=============================================================================
// TransferServer: Constructor / Destructor
//=============================================================================

TransferServer::TransferServer(const LocalIdentity& identity)
    : m_material(identity.material)
    , m_maxIncomingSizeBytes(DEFAULT_MAX_INCOMING_SIZE_BYTES)
    , m_pendingDecisionLimitMs(DECISION_TIMEOUT_MS * 2)
    , m_uploadIdleTimeoutMs(UPLOAD_IDLE_TIMEOUT_MS)
    , m_listenSocket(INVALID_SOCKET_FD)
    , m_port(0)
    , m_running(false)
    , m_stopRequested(false)
    , m_activeClientThreadCount(0)
{
}

TransferServer::~TransferServer() {
    if (m_running.load()) {
        stop();
    }
    SocketUtils::closeSocket(m_listenSocket);
}

//=============================================================================
// TransferServer: start() / stop()
//=============================================================================

bool TransferServer::start(std::string& errorMsg, uint16_t port, const std::string& bindIp) {
    if (m_running.load()) {
        errorMsg = "Transfer listener already running";
        return false;
    }

    if (!m_material.isValid()) {
        errorMsg = "Transfer listener has no certificate material";
        return false;
    }

    initOpenSsl();

    uint16_t boundPort = 0;
    if (!SocketUtils::createListener(bindIp, port, LISTEN_BACKLOG, m_listenSocket, boundPort,
                                     errorMsg)) {
        return false;
    }
    m_port.store(boundPort);

    m_stopRequested.store(false);
    m_running.store(true);

    m_listenerThread = std::thread(&TransferServer::listenerThreadFunc, this);
    m_cleanupThread = std::thread(&TransferServer::cleanupThreadFunc, this);

    LogTransfer("[TransferServer] Listening on " + bindIp + ":" + std::to_string(boundPort));
    return true;
}

void TransferServer::stop() {
    if (!m_running.load()) {
        return;
    }

    LogTransfer("=== TransferServer::stop START ===");

    m_stopRequested.store(true);
    m_cleanupCv.notify_all();

    // Unblock handler threads stuck in SSL_read
    {
        std::lock_guard<std::mutex> lock(m_activeClientsMutex);
        for (int s : m_activeClientSockets) {
            SocketUtils::shutdownSocket(s);
        }
    }

    if (m_listenerThread.joinable()) {
        m_listenerThread.join();
    }
    if (m_cleanupThread.joinable()) {
        m_cleanupThread.join();
    }

    SocketUtils::closeSocket(m_listenSocket);

    // Detached handlers touch members until they exit
    {
        std::unique_lock<std::mutex> lock(m_activeClientsCvMutex);
        m_activeClientsCv.wait(lock, [this]() {
            return m_activeClientThreadCount.load(std::memory_order_acquire) == 0;
        });
    }

    m_port.store(0);
    m_running.store(false);
    LogTransfer("=== TransferServer::stop END ===");
}

//=============================================================================
// TransferServer: Configuration
//=============================================================================

void TransferServer::setDownloadDir(const std::string& downloadDir) {
    std::lock_guard<std::mutex> lock(m_configMutex);
    m_downloadDir = downloadDir;
}

std::string TransferServer::getDownloadDir() const {
    std::lock_guard<std::mutex> lock(m_configMutex);
    return m_downloadDir;
}

void TransferServer::setUploadIdleTimeoutMs(uint32_t ms) {
    {
        std::lock_guard<std::mutex> lock(m_cleanupCvMutex);
        m_uploadIdleTimeoutMs.store(ms);
        m_cleanupRescheduled = true;
    }
    m_cleanupCv.notify_all();
}

void TransferServer::setIncomingRequestCallback(IncomingRequestCallback callback) {
    std::lock_guard<std::mutex> lock(m_configMutex);
    m_incomingRequestCallback = std::move(callback);
}

void TransferServer::setRequestWithdrawnCallback(RequestWithdrawnCallback callback) {
    std::lock_guard<std::mutex> lock(m_configMutex);
    m_requestWithdrawnCallback = std::move(callback);
}

void TransferServer::setStatusCallback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(m_configMutex);
    m_statusCallback = std::move(callback);
}

bool TransferServer::resolveDecision(const std::string& transferId, bool allowed) {
    const bool resolved = m_arbitrator.resolve(transferId, allowed);
    if (resolved) {
        LogTransfer("[TransferServer] Decision for " + transferId + ": " +
                    (allowed ? "allowed" : "denied"));
    }
    return resolved;
}

//=============================================================================
// TransferServer: Listener Thread
//=============================================================================

void TransferServer::listenerThreadFunc() {
    while (!m_stopRequested.load()) {
        sockaddr_in clientAddr{};
        socklen_t addrLen = sizeof(clientAddr);

        int clientSocket = ::accept(m_listenSocket, reinterpret_cast<sockaddr*>(&clientAddr),
                                    &addrLen);

        if (clientSocket < 0) {
            const int error = errno;
            if (m_stopRequested.load()) {
                break;
            }
            if (error != EAGAIN && error != EWOULDBLOCK && error != EINTR) {
                std::cerr << "[TransferServer] accept() failed: "
                          << SocketUtils::errnoToString(error) << "\n";
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(ACCEPT_RETRY_MS));
            continue;
        }

        // Linux accept() does not inherit O_NONBLOCK; handlers use blocking I/O
        std::string optError;
        if (!SocketUtils::setRecvTimeout(clientSocket, CONNECTION_TIMEOUT_MS, optError) ||
            !SocketUtils::setSendTimeout(clientSocket, CONNECTION_TIMEOUT_MS, optError)) {
            std::cerr << "[TransferServer] " << optError << "\n";
            SocketUtils::closeSocket(clientSocket);
            continue;
        }
        SocketUtils::tuneStreamSocket(clientSocket);

        char ipStr[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &clientAddr.sin_addr, ipStr, sizeof(ipStr));
        const std::string clientIp(ipStr);

        // Cap concurrent handler threads before spawning
        size_t prev = m_activeClientThreadCount.load(std::memory_order_relaxed);
        bool admitted = false;
        while (prev < MAX_CONCURRENT_INCOMING_CLIENT_THREADS) {
            if (m_activeClientThreadCount.compare_exchange_weak(
                    prev, prev + 1, std::memory_order_acq_rel, std::memory_order_relaxed)) {
                admitted = true;
                break;
            }
        }
        if (!admitted) {
            std::cerr << "[TransferServer] Too many connections, rejecting " << clientIp << "\n";
            SocketUtils::closeSocket(clientSocket);
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(m_activeClientsMutex);
            m_activeClientSockets.insert(clientSocket);
        }

        std::thread clientThread([this, clientSocket, clientIp]() {
            try {
                this->handleClient(clientSocket, clientIp);
            } catch (const std::exception& e) {
                LogTransfer(std::string("=== handleClient: UNCAUGHT EXCEPTION === ") + e.what());
            }

            {
                std::lock_guard<std::mutex> lock(m_activeClientsMutex);
                m_activeClientSockets.erase(clientSocket);
            }
            int fd = clientSocket;
            SocketUtils::closeSocket(fd);

            {
                // Decrement under the cv mutex so stop() cannot miss the wakeup
                std::lock_guard<std::mutex> lock(m_activeClientsCvMutex);
                m_activeClientThreadCount.fetch_sub(1, std::memory_order_acq_rel);
            }
            m_activeClientsCv.notify_all();
        });
        clientThread.detach();
    }
}

//=============================================================================
// TransferServer: Cleanup Thread
//=============================================================================

void TransferServer::cleanupThreadFunc() {
    while (!m_stopRequested.load()) {
        std::unique_lock<std::mutex> waitLock(m_cleanupCvMutex);
        const uint32_t intervalMs = std::min(SESSION_CLEANUP_INTERVAL_MS,
                                             std::max<uint32_t>(m_uploadIdleTimeoutMs.load(), 1));
        m_cleanupCv.wait_for(
            waitLock,
            std::chrono::milliseconds(intervalMs),
            [this]() { return m_stopRequested.load() || m_cleanupRescheduled; }
        );
        m_cleanupRescheduled = false;
        waitLock.unlock();

        if (m_stopRequested.load()) {
            break;
        }

        expireIdleTransfers();

        const size_t pruned = m_arbitrator.prune(TERMINAL_STATE_RETENTION_MS);
        if (pruned > 0) {
            LogTransfer("[TransferServer] Pruned " + std::to_string(pruned) + " finished transfers");
        }
    }
}

void TransferServer::expireIdleTransfers() {
    const uint32_t idleMs = m_uploadIdleTimeoutMs.load();
    for (const auto& transferId : m_arbitrator.expireIdle(idleMs)) {
        LogTransfer("[TransferServer] " + transferId + " accepted but no upload for " +
                    std::to_string(idleMs) + " ms; failing it");

        TransferStatus status;
        status.transferId = transferId;
        status.phase = StatusPhase::Error;
        status.state = TransferState::Failed;
        status.errorKind = ErrorKind::Timeout;
        status.errorCode = ErrorCodes::UPLOAD_IDLE_TIMED_OUT;
        status.message = ErrorCodes::format(ErrorCodes::UPLOAD_IDLE_TIMED_OUT,
                                            "Sender stopped uploading");
        emitStatus(status);
    }
}

//=============================================================================
// TransferServer: Connection Handling
//=============================================================================

void TransferServer::handleClient(int clientSocket, const std::string& clientIp) {
    TlsSocket tls(clientSocket, TlsRole::SERVER, &m_material);

    std::string errorMsg;
    if (!tls.handshake(errorMsg)) {
        if (!m_stopRequested.load()) {
            LogTransfer("[TransferServer] TLS handshake with " + clientIp + " failed: " + errorMsg);
        }
        return;
    }

    TlsTransportStream stream(tls);

    uint8_t prefix[4];
    if (!stream.recvExact(prefix, sizeof(prefix), errorMsg)) {
        LogTransfer("[TransferServer] " + clientIp + " closed before sending data: " + errorMsg);
        return;
    }

    if (std::memcmp(prefix, UPLOAD_METHOD_PREFIX, 4) == 0) {
        handleUploadConnection(stream, prefix, clientIp);
    } else {
        handleControlConnection(stream, prefix, clientIp);
    }

    stream.shutdown();
}

void TransferServer::handleControlConnection(TransportStream& stream, const uint8_t prefix[4],
                                             const std::string& clientIp) {
    ControlMessage message;
    std::string errorMsg;
    if (!ControlCodec::readFrameBody(stream, prefix, message, errorMsg)) {
        LogTransfer(ErrorCodes::format(ErrorCodes::TRANSFER_PROTOCOL_ERROR,
                                       "[TransferServer] Bad control frame from " + clientIp +
                                       ": " + errorMsg));
        return;
    }

    if (message.type != ControlMessageType::RequestTransfer) {
        // Decisions and cancels only make sense on a connection with a request
        LogTransfer("[TransferServer] Ignoring " +
                    std::string(controlMessageTypeToString(message.type)) +
                    " without a request from " + clientIp);
        return;
    }

    const TransferRequest request = message.request;
    const std::string& transferId = request.transferId;

    if (request.totalSize > m_maxIncomingSizeBytes.load()) {
        LogTransfer("[TransferServer] Declining " + transferId + ": " +
                    std::to_string(request.totalSize) + " bytes exceeds the incoming limit");
        if (!ControlCodec::writeFrame(stream, ControlMessage::makeDecision(transferId, false),
                                      errorMsg)) {
            LogTransfer("[TransferServer] Failed to send decline: " + errorMsg);
        }
        return;
    }

    std::future<bool> decision;
    if (!m_arbitrator.open(request, decision)) {
        LogTransfer("[TransferServer] Duplicate transfer id " + transferId + " from " + clientIp);
        if (!ControlCodec::writeFrame(stream, ControlMessage::makeDecision(transferId, false),
                                      errorMsg)) {
            LogTransfer("[TransferServer] Failed to send decline: " + errorMsg);
        }
        return;
    }

    LogTransfer("[TransferServer] Request " + transferId + " from " + request.senderName +
                " (" + clientIp + "): " + request.fileName + ", " +
                std::to_string(request.fileCount) + " file(s), " +
                std::to_string(request.totalSize) + " bytes");

    IncomingRequestCallback incoming;
    {
        std::lock_guard<std::mutex> lock(m_configMutex);
        incoming = m_incomingRequestCallback;
    }
    if (incoming) {
        incoming(request, clientIp);
    }

    const auto openedAt = std::chrono::steady_clock::now();

    while (true) {
        const DecisionWait wait = DecisionArbitrator::poll(decision, 0);
        switch (wait) {
            case DecisionWait::Accepted:
            case DecisionWait::Declined: {
                const bool allowed = (wait == DecisionWait::Accepted);
                if (!ControlCodec::writeFrame(stream, ControlMessage::makeDecision(transferId, allowed),
                                              errorMsg)) {
                    LogTransfer("[TransferServer] Failed to deliver decision for " + transferId +
                                ": " + errorMsg);
                    if (allowed) {
                        m_arbitrator.markFailed(transferId);
                    }
                }
                return;
            }
            case DecisionWait::Discarded:
                return;
            case DecisionWait::Pending:
                break;
        }

        if (m_stopRequested.load()) {
            if (m_arbitrator.discard(transferId, TransferState::Cancelled)) {
                notifyWithdrawn(transferId, TransferState::Cancelled);
            }
            return;
        }

        const auto pendingMs = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - openedAt).count();
        if (pendingMs > static_cast<int64_t>(m_pendingDecisionLimitMs.load())) {
            if (m_arbitrator.discard(transferId, TransferState::TimedOut)) {
                LogTransfer("[TransferServer] Request " + transferId + " expired while pending");
                notifyWithdrawn(transferId, TransferState::TimedOut);
            }
            return;
        }

        const WaitResult ready = stream.waitReadable(HANDLER_POLL_SLICE_MS);
        if (ready == WaitResult::Timeout) {
            continue;
        }

        ControlMessage next;
        if (ready == WaitResult::Error || !ControlCodec::readFrame(stream, next, errorMsg)) {
            // Disconnect while pending
            if (m_arbitrator.discard(transferId, TransferState::Cancelled)) {
                LogTransfer("[TransferServer] " + clientIp + " disconnected while " + transferId +
                            " was pending");
                notifyWithdrawn(transferId, TransferState::Cancelled);
            }
            return;
        }

        if (next.type == ControlMessageType::CancelTransfer && next.transferId == transferId) {
            if (m_arbitrator.discard(transferId, TransferState::Cancelled)) {
                LogTransfer("[TransferServer] Request " + transferId + " cancelled by sender");
                notifyWithdrawn(transferId, TransferState::Cancelled);
            }
            return;
        }

        LogTransfer("[TransferServer] Ignoring unexpected " +
                    std::string(controlMessageTypeToString(next.type)) + " for " + next.transferId);
    }
}

void TransferServer::handleUploadConnection(TransportStream& stream, const uint8_t prefix[4],
                                            const std::string& clientIp) {
    UploadReader reader(stream);
    UploadRequest upload;
    std::string errorMsg;
    const std::string prefixText(reinterpret_cast<const char*>(prefix), 4);
    if (!reader.readHead(prefixText, upload, errorMsg)) {
        LogTransfer("[TransferServer] Bad upload request from " + clientIp + ": " + errorMsg);
        sendUploadResponse(stream, 400, errorMsg);
        return;
    }

    const std::string& transferId = upload.transferId;
    TransferRequest request;
    if (!m_arbitrator.isUploadAllowed(transferId) || !m_arbitrator.getRequest(transferId, request)) {
        LogTransfer("[TransferServer] Rejected upload for unaccepted transfer " + transferId +
                    " from " + clientIp);
        sendUploadResponse(stream, 403, "Transfer not accepted");
        return;
    }

    if (upload.contentLength > m_maxIncomingSizeBytes.load()) {
        sendUploadResponse(stream, 413, "Upload exceeds the incoming size limit");
        return;
    }

    if (!m_arbitrator.beginUpload(transferId)) {
        // Expired or failed since the check above
        sendUploadResponse(stream, 403, "Transfer not accepted");
        return;
    }

    FileReceiver receiver(getDownloadDir());
    ThrottledProgress throttle;
    const bool success = receiver.receiveUpload(reader, upload, errorMsg,
        [&](uint64_t transferred, uint64_t total) {
            const int percentage = computePercentage(transferred, total);
            if (!throttle.shouldEmit(percentage)) {
                return;
            }
            TransferStatus status;
            status.transferId = transferId;
            status.phase = StatusPhase::Progress;
            status.state = TransferState::Transferring;
            status.percentage = percentage;
            status.bytesTransferred = transferred;
            status.totalBytes = total;
            status.fileName = upload.filename;
            emitStatus(status);
        });
    m_arbitrator.endUpload(transferId);

    if (!success) {
        LogTransfer("[TransferServer] Upload of " + upload.filename + " for " + transferId +
                    " failed: " + errorMsg);
        m_arbitrator.markFailed(transferId);

        TransferStatus status;
        status.transferId = transferId;
        status.phase = StatusPhase::Error;
        status.state = TransferState::Failed;
        status.fileName = upload.filename;
        status.savedPath = receiver.getOutputPath();
        status.bytesTransferred = receiver.getBytesReceived();
        status.errorKind = ErrorKind::TransferIO;
        status.errorCode = ErrorCodes::TRANSFER_FILE_FAILED;
        status.message = errorMsg;
        emitStatus(status);

        const bool badName = errorMsg.find(ErrorCodes::TRANSFER_PROTOCOL_ERROR) != std::string::npos;
        sendUploadResponse(stream, badName ? 400 : 500, errorMsg);
        return;
    }

    sendUploadResponse(stream, 200, "Success");

    const uint32_t done = m_arbitrator.recordUploadCompleted(transferId);
    const bool allDone = done >= request.fileCount;
    if (allDone) {
        m_arbitrator.markCompleted(transferId);
    }

    TransferStatus status;
    status.transferId = transferId;
    status.phase = StatusPhase::Completed;
    status.state = allDone ? TransferState::Completed : TransferState::Transferring;
    status.percentage = 100;
    status.bytesTransferred = receiver.getBytesReceived();
    status.totalBytes = receiver.getBytesReceived();
    status.fileName = upload.filename;
    status.savedPath = receiver.getOutputPath();
    status.message = statusTextForState(status.state);
    status.isCompleted = allDone;
    emitStatus(status);
}

void TransferServer::sendUploadResponse(TransportStream& stream, int statusCode,
                                        const std::string& message) {
    std::string errorMsg;
    if (!HttpUpload::writeResponse(stream, statusCode, message, errorMsg)) {
        LogTransfer("[TransferServer] Failed to send " + std::to_string(statusCode) +
                    " response: " + errorMsg);
    }
}

void TransferServer::notifyWithdrawn(const std::string& transferId, TransferState reason) {
    RequestWithdrawnCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_configMutex);
        callback = m_requestWithdrawnCallback;
    }
    if (callback) {
        callback(transferId, reason);
    }
}

void TransferServer::emitStatus(const TransferStatus& status) {
    StatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_configMutex);
        callback = m_statusCallback;
    }
    if (callback) {
        callback(status);
    }
}

}  // namespace SecureXfer
