/**
 * @file TransferInitiator.cpp
 * @brief Outgoing transfers: pinned TLS, approval wait, sequential uploads
 */

#include "securexfer/TransferInitiator.h"
#include "securexfer/FileTransfer.h"
#include "securexfer/FingerprintUtils.h"
#include "securexfer/SocketUtils.h"
#include "securexfer/ThreadSafeLog.h"
#include "securexfer/TlsSocket.h"
#include "securexfer/TransportStream.h"
#include "securexfer/UuidGenerator.h"

#include <chrono>
#include <iostream>
#include <memory>

namespace SecureXfer {

namespace {
    #define LogInitiator(msg) SecureXfer::ThreadSafeLog::log(msg)

    /**
     * @brief TCP socket + client TLS session whose certificate matched the pin
     *
     * Members are torn down stream first, then TLS (close_notify), then the fd.
     */
    class PinnedConnection {
    public:
        PinnedConnection() = default;

        ~PinnedConnection() {
            m_stream.reset();
            m_tls.reset();
            SocketUtils::closeSocket(m_fd);
        }

        PinnedConnection(const PinnedConnection&) = delete;
        PinnedConnection& operator=(const PinnedConnection&) = delete;

        bool open(const PeerRecord& peer, ErrorKind& kind, std::string& errorMsg) {
            kind = ErrorKind::TransferIO;

            std::string connectError;
            if (!SocketUtils::connectTcp(peer.ipAddress, peer.port, CONNECTION_TIMEOUT_MS, m_fd,
                                         connectError)) {
                m_errorCode = ErrorCodes::TRANSFER_CONNECT_FAILED;
                errorMsg = ErrorCodes::format(m_errorCode, connectError);
                return false;
            }

            std::string optError;
            if (!SocketUtils::setRecvTimeout(m_fd, CONNECTION_TIMEOUT_MS, optError) ||
                !SocketUtils::setSendTimeout(m_fd, CONNECTION_TIMEOUT_MS, optError)) {
                m_errorCode = ErrorCodes::TRANSFER_CONNECT_FAILED;
                errorMsg = ErrorCodes::format(m_errorCode, optError);
                return false;
            }
            SocketUtils::tuneStreamSocket(m_fd);

            m_tls = std::make_unique<TlsSocket>(m_fd, TlsRole::CLIENT);
            std::string tlsError;
            if (!m_tls->handshake(tlsError)) {
                m_errorCode = ErrorCodes::TRANSFER_TLS_FAILED;
                errorMsg = ErrorCodes::format(m_errorCode, tlsError);
                return false;
            }

            std::string fpError;
            const std::string presented = m_tls->getPeerFingerprint(fpError);
            if (presented.empty()) {
                kind = ErrorKind::Trust;
                m_errorCode = ErrorCodes::TRUST_NO_PEER_CERTIFICATE;
                errorMsg = ErrorCodes::format(m_errorCode,
                                              "Peer presented no certificate: " + fpError);
                return false;
            }

            if (!FingerprintUtils::matches(presented, peer.certificateFingerprint)) {
                kind = ErrorKind::Trust;
                m_errorCode = ErrorCodes::TRUST_FINGERPRINT_MISMATCH;
                errorMsg = ErrorCodes::format(m_errorCode,
                    "Certificate fingerprint mismatch for " + peer.ipAddress + ":" +
                    std::to_string(peer.port) + ". Expected=" +
                    (peer.certificateFingerprint.empty() ? "<empty>" : peer.certificateFingerprint) +
                    " Actual=" + presented);
                return false;
            }

            m_stream = std::make_unique<TlsTransportStream>(*m_tls);
            return true;
        }

        TransportStream& stream() { return *m_stream; }

        /// Code of the last open() failure
        const char* errorCode() const { return m_errorCode; }

    private:
        int m_fd = INVALID_SOCKET_FD;
        const char* m_errorCode = ErrorCodes::TRANSFER_CONNECT_FAILED;
        std::unique_ptr<TlsSocket> m_tls;
        std::unique_ptr<TlsTransportStream> m_stream;
    };
}

//=============================================================================
// TransferInitiator: Constructor / Destructor
//=============================================================================

TransferInitiator::TransferInitiator(const std::string& senderName)
    : m_senderName(senderName)
    , m_decisionTimeoutMs(DECISION_TIMEOUT_MS)
    , m_retentionMs(TERMINAL_STATE_RETENTION_MS)
{
    initOpenSsl();
}

TransferInitiator::~TransferInitiator() {
    shutdown();
}

void TransferInitiator::setStatusCallback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_statusCallback = std::move(callback);
}

//=============================================================================
// TransferInitiator: Public Operations
//=============================================================================

bool TransferInitiator::sendTransferRequest(const PeerRecord& peer, const TransferRequest& request,
                                            const std::vector<SelectedFile>& files,
                                            std::string& errorMsg) {
    std::shared_ptr<Outgoing> outgoing = registerOutgoing(request.transferId);
    if (!outgoing) {
        errorMsg = "Transfer id already in use: " + request.transferId;
        return false;
    }

    const bool success = run(peer, request, files, *outgoing, errorMsg);
    markFinished(*outgoing);
    return success;
}

bool TransferInitiator::sendFiles(const PeerRecord& peer, const std::vector<SelectedFile>& files,
                                  std::string& transferId, std::string& errorMsg) {
    if (files.empty()) {
        errorMsg = "No files to send";
        return false;
    }

    transferId = UuidGenerator::generate();
    if (transferId.empty()) {
        errorMsg = "Failed to generate a transfer id";
        return false;
    }

    const TransferRequest request = FileSelection::buildRequest(transferId, m_senderName, files);

    std::lock_guard<std::mutex> lock(m_mutex);
    reapFinishedLocked();

    auto outgoing = std::make_shared<Outgoing>();
    m_outgoing[transferId] = outgoing;

    outgoing->worker = std::thread([this, outgoing, peer, request, files]() {
        std::string workerError;
        try {
            if (!run(peer, request, files, *outgoing, workerError)) {
                LogInitiator("[TransferInitiator] " + request.transferId + " ended: " + workerError);
            }
        } catch (const std::exception& e) {
            LogInitiator(std::string("=== TransferInitiator worker: UNCAUGHT EXCEPTION === ") + e.what());
            outgoing->state.store(TransferState::Failed);
        }
        markFinished(*outgoing);
    });

    return true;
}

bool TransferInitiator::cancelOutgoing(const std::string& transferId) {
    std::shared_ptr<Outgoing> outgoing = findOutgoing(transferId);
    if (!outgoing || isTerminalState(outgoing->state.load())) {
        return false;
    }
    outgoing->cancelRequested.store(true);
    LogInitiator("[TransferInitiator] Cancel requested for " + transferId);
    return true;
}

bool TransferInitiator::getState(const std::string& transferId, TransferState& state) const {
    std::shared_ptr<Outgoing> outgoing = findOutgoing(transferId);
    if (!outgoing) {
        return false;
    }
    state = outgoing->state.load();
    return true;
}

void TransferInitiator::wait(const std::string& transferId) {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_outgoing.find(transferId);
        if (it == m_outgoing.end()) {
            return;
        }
        worker = std::move(it->second->worker);
    }
    if (worker.joinable()) {
        worker.join();
    }
}

size_t TransferInitiator::prune() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return reapFinishedLocked();
}

void TransferInitiator::shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& entry : m_outgoing) {
            entry.second->cancelRequested.store(true);
            if (entry.second->worker.joinable()) {
                workers.push_back(std::move(entry.second->worker));
            }
        }
    }
    for (auto& worker : workers) {
        worker.join();
    }
}

//=============================================================================
// TransferInitiator: Transfer Flow
//=============================================================================

bool TransferInitiator::run(const PeerRecord& peer, const TransferRequest& request,
                            const std::vector<SelectedFile>& files, Outgoing& outgoing,
                            std::string& errorMsg) {
    const std::string& transferId = request.transferId;

    if (files.size() != request.fileCount) {
        errorMsg = "Request announces " + std::to_string(request.fileCount) + " files but " +
                   std::to_string(files.size()) + " were given";
        outgoing.state.store(TransferState::Failed);
        emitError(transferId, TransferState::Failed, ErrorKind::TransferIO,
                  ErrorCodes::TRANSFER_PROTOCOL_ERROR, errorMsg);
        return false;
    }

    bool allowed = false;
    {
        PinnedConnection connection;
        ErrorKind kind = ErrorKind::TransferIO;
        if (!connection.open(peer, kind, errorMsg)) {
            LogInitiator("[TransferInitiator] " + errorMsg);
            outgoing.state.store(TransferState::Failed);
            emitError(transferId, TransferState::Failed, kind, connection.errorCode(), errorMsg);
            return false;
        }

        if (!ControlCodec::writeFrame(connection.stream(), ControlMessage::makeRequest(request),
                                      errorMsg)) {
            errorMsg = ErrorCodes::format(ErrorCodes::TRANSFER_STREAM_FAILED, errorMsg);
            outgoing.state.store(TransferState::Failed);
            emitError(transferId, TransferState::Failed, ErrorKind::TransferIO,
                      ErrorCodes::TRANSFER_STREAM_FAILED, errorMsg);
            return false;
        }

        LogInitiator("[TransferInitiator] Sent request " + transferId + " to " +
                     peer.displayName + " (" + peer.ipAddress + ":" + std::to_string(peer.port) + ")");

        TransferStatus waiting;
        waiting.transferId = transferId;
        waiting.phase = StatusPhase::Waiting;
        waiting.state = TransferState::Open;
        waiting.totalBytes = request.totalSize;
        waiting.fileName = request.fileName;
        waiting.message = statusTextForState(TransferState::Open);
        emitStatus(waiting);

        if (!awaitDecision(connection.stream(), request, outgoing, allowed, errorMsg)) {
            return false;
        }
    }

    if (!allowed) {
        outgoing.state.store(TransferState::Declined);
        errorMsg = statusTextForState(TransferState::Declined);
        LogInitiator("[TransferInitiator] " + transferId + " declined by " + peer.displayName);

        TransferStatus denied;
        denied.transferId = transferId;
        denied.phase = StatusPhase::Denied;
        denied.state = TransferState::Declined;
        denied.message = errorMsg;
        emitStatus(denied);
        return false;
    }

    outgoing.state.store(TransferState::Accepted);
    LogInitiator("[TransferInitiator] " + transferId + " accepted by " + peer.displayName);

    if (!uploadAll(peer, request, files, outgoing, errorMsg)) {
        return false;
    }

    outgoing.state.store(TransferState::Completed);

    TransferStatus completed;
    completed.transferId = transferId;
    completed.phase = StatusPhase::Completed;
    completed.state = TransferState::Completed;
    completed.percentage = 100;
    completed.bytesTransferred = request.totalSize;
    completed.totalBytes = request.totalSize;
    completed.fileName = request.fileName;
    completed.message = statusTextForState(TransferState::Completed);
    completed.isCompleted = true;
    emitStatus(completed);

    LogInitiator("[TransferInitiator] " + transferId + " completed (" +
                 std::to_string(files.size()) + " file(s))");
    return true;
}

bool TransferInitiator::awaitDecision(TransportStream& stream, const TransferRequest& request,
                                      Outgoing& outgoing, bool& allowed, std::string& errorMsg) {
    const std::string& transferId = request.transferId;
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(m_decisionTimeoutMs.load());

    auto sendCancel = [&]() {
        std::string cancelError;
        if (!ControlCodec::writeFrame(stream, ControlMessage::makeCancel(transferId), cancelError)) {
            LogInitiator("[TransferInitiator] Failed to send cancel for " + transferId + ": " +
                         cancelError);
            return;
        }
        // Let the frame reach the listener before close_notify
        std::this_thread::sleep_for(std::chrono::milliseconds(CANCEL_LINGER_MS));
    };

    while (true) {
        if (outgoing.cancelRequested.load()) {
            sendCancel();
            outgoing.state.store(TransferState::Cancelled);
            errorMsg = statusTextForState(TransferState::Cancelled);

            TransferStatus cancelled;
            cancelled.transferId = transferId;
            cancelled.phase = StatusPhase::Cancelled;
            cancelled.state = TransferState::Cancelled;
            cancelled.message = errorMsg;
            emitStatus(cancelled);
            return false;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            sendCancel();
            outgoing.state.store(TransferState::TimedOut);
            errorMsg = ErrorCodes::format(ErrorCodes::DECISION_TIMED_OUT,
                                          statusTextForState(TransferState::TimedOut));
            LogInitiator("[TransferInitiator] " + transferId + " timed out waiting for a decision");
            emitError(transferId, TransferState::TimedOut, ErrorKind::Timeout,
                      ErrorCodes::DECISION_TIMED_OUT, statusTextForState(TransferState::TimedOut));
            return false;
        }

        const WaitResult ready = stream.waitReadable(HANDLER_POLL_SLICE_MS);
        if (ready == WaitResult::Timeout) {
            continue;
        }

        ControlMessage reply;
        std::string readError;
        if (ready == WaitResult::Error || !ControlCodec::readFrame(stream, reply, readError)) {
            errorMsg = ErrorCodes::format(ErrorCodes::TRANSFER_STREAM_FAILED,
                                          "Connection lost while waiting for a decision" +
                                          (readError.empty() ? std::string() : ": " + readError));
            outgoing.state.store(TransferState::Failed);
            emitError(transferId, TransferState::Failed, ErrorKind::TransferIO,
                      ErrorCodes::TRANSFER_STREAM_FAILED, errorMsg);
            return false;
        }

        if (reply.type == ControlMessageType::TransferDecision && reply.transferId == transferId) {
            allowed = reply.allowed;
            return true;
        }

        LogInitiator("[TransferInitiator] Ignoring " +
                     std::string(controlMessageTypeToString(reply.type)) + " for " +
                     reply.transferId);
    }
}

bool TransferInitiator::uploadAll(const PeerRecord& peer, const TransferRequest& request,
                                  const std::vector<SelectedFile>& files, Outgoing& outgoing,
                                  std::string& errorMsg) {
    const std::string& transferId = request.transferId;
    const std::string host = peer.ipAddress + ":" + std::to_string(peer.port);

    outgoing.state.store(TransferState::Transferring);

    ThrottledProgress throttle;
    uint64_t completedBytes = 0;

    for (const auto& file : files) {
        FileSender sender(file.path, file.relativePath);
        if (!sender.initialize(errorMsg)) {
            outgoing.state.store(TransferState::Failed);
            emitError(transferId, TransferState::Failed, ErrorKind::TransferIO,
                      ErrorCodes::TRANSFER_FILE_FAILED, errorMsg);
            return false;
        }

        PinnedConnection connection;
        ErrorKind kind = ErrorKind::TransferIO;
        if (!connection.open(peer, kind, errorMsg)) {
            outgoing.state.store(TransferState::Failed);
            emitError(transferId, TransferState::Failed, kind, connection.errorCode(), errorMsg);
            return false;
        }

        const uint64_t base = completedBytes;
        const bool success = sender.sendUpload(connection.stream(), host, transferId, errorMsg,
            [&](uint64_t transferred, uint64_t) {
                const uint64_t cumulative = base + transferred;
                const int percentage = computePercentage(cumulative, request.totalSize);
                if (!throttle.shouldEmit(percentage)) {
                    return;
                }
                TransferStatus status;
                status.transferId = transferId;
                status.phase = StatusPhase::Progress;
                status.state = TransferState::Transferring;
                status.percentage = percentage;
                status.bytesTransferred = cumulative;
                status.totalBytes = request.totalSize;
                status.fileName = file.relativePath;
                emitStatus(status);
            },
            &outgoing.cancelRequested);

        if (!success) {
            if (outgoing.cancelRequested.load()) {
                outgoing.state.store(TransferState::Cancelled);
                TransferStatus cancelled;
                cancelled.transferId = transferId;
                cancelled.phase = StatusPhase::Cancelled;
                cancelled.state = TransferState::Cancelled;
                cancelled.fileName = file.relativePath;
                cancelled.message = statusTextForState(TransferState::Cancelled);
                emitStatus(cancelled);
            } else {
                outgoing.state.store(TransferState::Failed);
                emitError(transferId, TransferState::Failed, ErrorKind::TransferIO,
                          ErrorCodes::TRANSFER_STREAM_FAILED, errorMsg);
            }
            LogInitiator("[TransferInitiator] Upload of " + file.relativePath + " failed: " + errorMsg);
            return false;
        }

        completedBytes += sender.getFileSize();
    }

    return true;
}

//=============================================================================
// TransferInitiator: Bookkeeping
//=============================================================================

std::shared_ptr<TransferInitiator::Outgoing> TransferInitiator::registerOutgoing(
    const std::string& transferId) {
    if (transferId.empty()) {
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    reapFinishedLocked();
    if (m_outgoing.count(transferId) != 0) {
        return nullptr;
    }
    auto outgoing = std::make_shared<Outgoing>();
    m_outgoing[transferId] = outgoing;
    return outgoing;
}

std::shared_ptr<TransferInitiator::Outgoing> TransferInitiator::findOutgoing(
    const std::string& transferId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_outgoing.find(transferId);
    if (it == m_outgoing.end()) {
        return nullptr;
    }
    return it->second;
}

size_t TransferInitiator::reapFinishedLocked() {
    const auto cutoff = std::chrono::steady_clock::now() -
                        std::chrono::milliseconds(m_retentionMs.load());
    size_t removed = 0;
    for (auto it = m_outgoing.begin(); it != m_outgoing.end();) {
        Outgoing& outgoing = *it->second;
        if (!outgoing.finished.load()) {
            ++it;
            continue;
        }

        // Finished workers only return from run(); joining them is immediate
        if (outgoing.worker.joinable()) {
            outgoing.worker.join();
        }

        if (isTerminalState(outgoing.state.load()) && outgoing.finishedAt <= cutoff) {
            it = m_outgoing.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        LogInitiator("[TransferInitiator] Dropped " + std::to_string(removed) +
                     " finished transfers");
    }
    return removed;
}

void TransferInitiator::markFinished(Outgoing& outgoing) {
    outgoing.finishedAt = std::chrono::steady_clock::now();
    outgoing.finished.store(true);
}

void TransferInitiator::emitStatus(const TransferStatus& status) {
    StatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        callback = m_statusCallback;
    }
    if (callback) {
        callback(status);
    }
}

void TransferInitiator::emitError(const std::string& transferId, TransferState state,
                                  ErrorKind kind, const char* code, const std::string& message) {
    TransferStatus status;
    status.transferId = transferId;
    status.phase = StatusPhase::Error;
    status.state = state;
    status.errorKind = kind;
    status.errorCode = code;
    status.message = message;
    emitStatus(status);
}

}  // namespace SecureXfer
