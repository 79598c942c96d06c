/**
 * @file securexfer_cli.cpp
 * @brief Command-line front end: listen, list peers, send files
 *
 * Usage:
 *   securexfer listen [options]
 *   securexfer peers  [options] [--wait MS]
 *   securexfer send   [options] [--wait MS] <peer-id | ip:port:fingerprint> <path>...
 *
 * Options:
 *   --config PATH        config.json to use (default: XDG config dir)
 *   --download-dir DIR   Where received files are written
 *   --name NAME          Display name announced to peers
 *   --port PORT          Transfer listener port (default: ephemeral)
 *   --timeout MS         Decision timeout for outgoing requests
 *   --no-discovery       Do not join the multicast group
 */

#include "securexfer/AppPaths.h"
#include "securexfer/Debug.h"
#include "securexfer/FingerprintUtils.h"
#include "securexfer/SecureXferNode.h"
#include "securexfer/SettingsManager.h"
#include "securexfer/SocketUtils.h"
#include "securexfer/ThreadSafeLog.h"
#include "securexfer/config.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace SecureXfer;

//=============================================================================
// Global Variables for Signal Handling
//=============================================================================

static std::atomic<bool> g_running(true);

void signalHandler(int signal) {
    (void)signal;
    g_running.store(false);
}

//=============================================================================
// Helper Functions
//=============================================================================

namespace {

struct CliOptions {
    std::string command;
    std::string configPath;
    std::string downloadDir;
    std::string displayName;
    uint16_t port = 0;
    uint32_t timeoutMs = 0;
    uint32_t waitMs = DISCOVERY_INTERVAL_MS;
    bool discovery = true;
    std::vector<std::string> positional;
};

void printUsage(const char* program) {
    std::cout << "Usage:\n"
              << "  " << program << " listen [options]\n"
              << "  " << program << " peers  [options] [--wait MS]\n"
              << "  " << program << " send   [options] [--wait MS] <peer-id | ip:port:fingerprint> <path>...\n"
              << "Options:\n"
              << "  --config PATH        config.json to use\n"
              << "  --download-dir DIR   Directory for received files\n"
              << "  --name NAME          Display name announced to peers\n"
              << "  --port PORT          Transfer listener port (default: ephemeral)\n"
              << "  --timeout MS         Decision timeout for outgoing requests\n"
              << "  --wait MS            How long to discover before acting (default: "
              << DISCOVERY_INTERVAL_MS << ")\n"
              << "  --no-discovery       Do not join the multicast group\n"
              << "  --help, -h           Show this help message\n";
}

bool parseUnsigned(const std::string& text, uint64_t max, uint64_t& out) {
    if (text.empty() || text.size() > 20) {
        return false;
    }
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
        if (value > max) {
            return false;
        }
    }
    out = value;
    return true;
}

bool parseArgs(int argc, char* argv[], CliOptions& options, std::string& errorMsg) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        uint64_t value = 0;

        auto needValue = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                errorMsg = std::string(name) + " needs a value";
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--config") {
            const char* v = needValue("--config");
            if (!v) return false;
            options.configPath = v;
        } else if (arg == "--download-dir") {
            const char* v = needValue("--download-dir");
            if (!v) return false;
            options.downloadDir = v;
        } else if (arg == "--name") {
            const char* v = needValue("--name");
            if (!v) return false;
            options.displayName = v;
        } else if (arg == "--port") {
            const char* v = needValue("--port");
            if (!v) return false;
            if (!parseUnsigned(v, 65535, value)) {
                errorMsg = std::string("Invalid port: ") + v;
                return false;
            }
            options.port = static_cast<uint16_t>(value);
        } else if (arg == "--timeout") {
            const char* v = needValue("--timeout");
            if (!v) return false;
            if (!parseUnsigned(v, UINT32_MAX, value)) {
                errorMsg = std::string("Invalid timeout: ") + v;
                return false;
            }
            options.timeoutMs = static_cast<uint32_t>(value);
        } else if (arg == "--wait") {
            const char* v = needValue("--wait");
            if (!v) return false;
            if (!parseUnsigned(v, UINT32_MAX, value)) {
                errorMsg = std::string("Invalid wait: ") + v;
                return false;
            }
            options.waitMs = static_cast<uint32_t>(value);
        } else if (arg == "--no-discovery") {
            options.discovery = false;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            errorMsg = "Unknown option: " + arg;
            return false;
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.positional.push_back(arg);
        }
    }
    return true;
}

/**
 * @brief Format file size for display
 */
std::string formatBytes(uint64_t size) {
    const double KB = 1024.0;
    const double MB = 1024.0 * 1024.0;
    const double GB = 1024.0 * 1024.0 * 1024.0;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (size >= GB) {
        oss << (size / GB) << " GB";
    } else if (size >= MB) {
        oss << (size / MB) << " MB";
    } else if (size >= KB) {
        oss << (size / KB) << " KB";
    } else {
        oss << size << " bytes";
    }

    return oss.str();
}

void printStatus(const TransferStatus& status) {
    std::cout << "[STATUS] " << status.transferId << " "
              << statusPhaseToString(status.phase);
    if (status.phase == StatusPhase::Progress) {
        if (status.percentage >= 0) {
            std::cout << " " << status.percentage << "%";
        } else {
            std::cout << " " << formatBytes(status.bytesTransferred);
        }
    }
    if (!status.savedPath.empty()) {
        std::cout << " saved " << status.savedPath;
    }
    if (!status.message.empty() && status.phase != StatusPhase::Progress) {
        std::cout << " - " << status.message;
    }
    if (status.errorKind != ErrorKind::None) {
        std::cout << " (" << errorKindToString(status.errorKind) << ")";
    }
    std::cout << std::endl;
}

void printPeers(const std::vector<PeerRecord>& peers) {
    const auto now = std::chrono::steady_clock::now();
    std::cout << "\n--- Discovered Peers (" << peers.size() << ") ---\n";
    for (const auto& peer : peers) {
        std::cout << "  ID:   " << peer.peerId << "\n";
        std::cout << "  Name: " << peer.displayName << "\n";
        std::cout << "  Addr: " << peer.ipAddress << ":" << peer.port << "\n";
        std::cout << "  FP:   " << FingerprintUtils::formatForDisplay(peer.certificateFingerprint) << "\n";
        std::cout << "  Seen: " << peer.ageMs(now) / 1000 << "s ago\n\n";
    }
}

/**
 * @brief Parse "ip:port:fingerprint" into a peer record
 */
bool parseExplicitPeer(const std::string& target, PeerRecord& peer) {
    const size_t first = target.find(':');
    if (first == std::string::npos) {
        return false;
    }
    const size_t second = target.find(':', first + 1);
    if (second == std::string::npos) {
        return false;
    }

    uint64_t port = 0;
    if (!parseUnsigned(target.substr(first + 1, second - first - 1), 65535, port) || port == 0) {
        return false;
    }

    const std::string fingerprint = FingerprintUtils::normalizeSha256Hex(target.substr(second + 1));
    if (fingerprint.empty()) {
        return false;
    }

    peer.peerId = target;
    peer.displayName = target.substr(0, first);
    peer.ipAddress = target.substr(0, first);
    peer.port = static_cast<uint16_t>(port);
    peer.certificateFingerprint = fingerprint;
    peer.lastSeen = std::chrono::steady_clock::now();
    return true;
}

void sleepWhileRunning(uint32_t ms) {
    const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (g_running.load() && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

//=============================================================================
// Commands
//=============================================================================

int runListen(SecureXferNode& node) {
    std::mutex pendingMutex;
    std::deque<TransferRequest> pending;

    node.setIncomingRequestCallback([&](const TransferRequest& request, const std::string& peerIp) {
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            pending.push_back(request);
        }
        std::cout << "\n[INCOMING] " << request.senderName << " (" << peerIp << ") wants to send "
                  << request.fileName << " (" << formatBytes(request.totalSize) << ", "
                  << request.fileCount << " file(s))\n"
                  << "Accept " << request.transferId << "? (y/n): " << std::flush;
    });

    node.setRequestWithdrawnCallback([&](const std::string& transferId, TransferState reason) {
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            for (auto it = pending.begin(); it != pending.end(); ++it) {
                if (it->transferId == transferId) {
                    pending.erase(it);
                    break;
                }
            }
        }
        std::cout << "\n[WITHDRAWN] " << transferId << " - " << statusTextForState(reason) << "\n";
    });

    std::cout << "[INFO] Listening. Answer prompts with y/n, 'p' lists peers, Ctrl+C exits.\n";

    std::string line;
    while (g_running.load()) {
        if (SocketUtils::waitReadable(STDIN_FILENO, 200) <= 0) {
            continue;
        }
        if (!std::getline(std::cin, line)) {
            // stdin closed: keep serving, requests then wait for their timeout
            while (g_running.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            break;
        }
        if (line.empty()) {
            continue;
        }

        if (line == "p" || line == "P") {
            printPeers(node.listPeers());
            continue;
        }

        const bool yes = (line == "y" || line == "Y" || line == "yes");
        const bool no = (line == "n" || line == "N" || line == "no");
        if (!yes && !no) {
            std::cout << "[INFO] Unknown input '" << line << "'\n";
            continue;
        }

        TransferRequest request;
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            if (pending.empty()) {
                std::cout << "[INFO] No pending request\n";
                continue;
            }
            request = pending.front();
            pending.pop_front();
        }

        if (node.resolveIncoming(request.transferId, yes)) {
            std::cout << "[INCOMING] " << request.transferId << (yes ? " accepted\n" : " declined\n");
        } else {
            std::cout << "[INCOMING] " << request.transferId << " is no longer pending\n";
        }
    }
    return 0;
}

int runPeers(SecureXferNode& node, const CliOptions& options) {
    sleepWhileRunning(options.waitMs);
    printPeers(node.listPeers());
    return 0;
}

int runSend(SecureXferNode& node, const CliOptions& options) {
    if (options.positional.size() < 2) {
        LOG_ERROR("send needs a target and at least one path");
        return 2;
    }

    const std::string& target = options.positional.front();
    const std::vector<std::string> paths(options.positional.begin() + 1, options.positional.end());

    PeerRecord peer;
    if (!parseExplicitPeer(target, peer)) {
        std::cout << "[INFO] Looking for peer " << target << "...\n";
        const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(options.waitMs);
        bool found = false;
        while (g_running.load() && !found) {
            found = node.findPeer(target, peer);
            if (found || std::chrono::steady_clock::now() >= until) {
                break;
            }
            if (node.discovery()) {
                node.discovery()->discover();
            }
            sleepWhileRunning(250);
        }
        if (!found) {
            LOG_ERROR("Peer " << target << " not found");
            return 1;
        }
    }

    std::cout << "[INFO] Sending to " << peer.displayName << " (" << peer.ipAddress << ":"
              << peer.port << ")\n";

    std::atomic<bool> completed(false);
    node.setStatusCallback([&](const TransferStatus& status) {
        printStatus(status);
        if (status.isCompleted) {
            completed.store(true);
        }
    });

    std::string transferId;
    std::string errorMsg;
    if (!node.sendFiles(peer, paths, transferId, errorMsg)) {
        LOG_ERROR(errorMsg);
        return 1;
    }

    // Ctrl+C cancels the transfer; the worker then finishes on its own
    std::thread watcher([&]() {
        while (g_running.load()) {
            TransferState state = TransferState::Open;
            if (node.initiator()->getState(transferId, state) && isTerminalState(state)) {
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        node.cancelOutgoing(transferId);
    });

    node.waitOutgoing(transferId);
    g_running.store(false);
    watcher.join();

    return completed.load() ? 0 : 1;
}

}  // namespace

//=============================================================================
// Main Function
//=============================================================================

int main(int argc, char* argv[]) {
    CliOptions options;
    std::string errorMsg;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
    }

    if (!parseArgs(argc, argv, options, errorMsg) || options.command.empty()) {
        if (!errorMsg.empty()) {
            LOG_ERROR(errorMsg);
        }
        printUsage(argv[0]);
        return 2;
    }

    if (options.command != "listen" && options.command != "peers" && options.command != "send") {
        LOG_ERROR("Unknown command: " << options.command);
        printUsage(argv[0]);
        return 2;
    }

    //=========================================================================
    // Settings and logging
    //=========================================================================

    const std::filesystem::path configPath = options.configPath.empty()
        ? AppPaths::configJsonPath()
        : std::filesystem::path(options.configPath);

    SettingsManager settings(configPath);
    if (configPath.empty()) {
        LOG_WARNING("No config location ($HOME unset), using defaults");
    } else if (!settings.loadSettings(errorMsg)) {
        LOG_WARNING(errorMsg);
    }

    const std::string logPath = settings.getLogPath();
    if (!logPath.empty() && !ThreadSafeLog::initialize(logPath)) {
        LOG_WARNING("Cannot write log file " << logPath);
    }

    NodeOptions nodeOptions = NodeOptions::fromSettings(settings);
    if (!options.downloadDir.empty()) {
        nodeOptions.downloadDir = options.downloadDir;
    }
    if (!options.displayName.empty()) {
        nodeOptions.displayName = options.displayName;
    }
    if (options.timeoutMs != 0) {
        nodeOptions.decisionTimeoutMs = options.timeoutMs;
    }
    nodeOptions.listenPort = options.port;
    nodeOptions.enableDiscovery = options.discovery;

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    //=========================================================================
    // Node
    //=========================================================================

    SecureXferNode node(nodeOptions);
    node.setStatusCallback(printStatus);

    if (!node.start(errorMsg)) {
        LOG_ERROR(errorMsg);
        return 1;
    }

    const LocalIdentity& identity = node.identity();
    std::cout << "\n";
    std::cout << "========================================\n";
    std::cout << "  SecureXfer\n";
    std::cout << "========================================\n";
    std::cout << "Name:        " << identity.displayName << "\n";
    std::cout << "ID:          " << identity.processId << "\n";
    std::cout << "Port:        " << node.getListenPort() << "\n";
    std::cout << "Fingerprint: " << identity.fingerprint() << "\n";
    std::cout << "Downloads:   " << nodeOptions.downloadDir << "\n";
    std::cout << "========================================\n\n";

    int exitCode = 0;
    if (options.command == "listen") {
        exitCode = runListen(node);
    } else if (options.command == "peers") {
        exitCode = runPeers(node, options);
    } else {
        exitCode = runSend(node, options);
    }

    std::cout << "[INFO] Shutting down...\n";
    node.stop();
    ThreadSafeLog::shutdown();
    return exitCode;
}
