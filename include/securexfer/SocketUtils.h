/**
 * @file SocketUtils.h
 * @brief POSIX socket helpers shared by discovery and transfer code
 */

#pragma once

#include <cstdint>
#include <string>

namespace SecureXfer {

/**
 * @brief Sentinel for an unopened or closed socket descriptor
 */
constexpr int INVALID_SOCKET_FD = -1;

namespace SocketUtils {

/**
 * @brief Process-wide network setup (ignores SIGPIPE once)
 *
 * Writes to a socket the peer already closed must surface as an error
 * return rather than terminating the process.
 */
void initializeNetworking();

/**
 * @brief Close a descriptor and reset it to INVALID_SOCKET_FD
 */
void closeSocket(int& fd);

/**
 * @brief Shut down both directions without closing the descriptor
 *
 * Used by stop() paths to unblock a thread that owns the descriptor.
 */
void shutdownSocket(int fd);

/**
 * @brief Set SO_RCVTIMEO
 */
bool setRecvTimeout(int fd, uint32_t timeoutMs, std::string& errorMsg);

/**
 * @brief Set SO_SNDTIMEO
 */
bool setSendTimeout(int fd, uint32_t timeoutMs, std::string& errorMsg);

/**
 * @brief Enlarge kernel buffers and disable Nagle for streaming
 *
 * Best effort: failures are ignored.
 */
void tuneStreamSocket(int fd);

/**
 * @brief Connect a TCP socket with a bounded connect timeout
 * @param ip Dotted IPv4 address
 * @param port Remote port
 * @param timeoutMs Connect timeout
 * @param outFd Connected descriptor (blocking mode) on success
 * @param errorMsg Output error message on failure
 * @return true if connected
 */
bool connectTcp(const std::string& ip, uint16_t port, uint32_t timeoutMs,
                int& outFd, std::string& errorMsg);

/**
 * @brief Create a listening TCP socket
 * @param bindIp Address to bind ("0.0.0.0" for all interfaces)
 * @param port Port to bind, 0 for an ephemeral port
 * @param backlog listen() backlog
 * @param outFd Listening descriptor (non-blocking) on success
 * @param boundPort Port actually bound (read back with getsockname)
 */
bool createListener(const std::string& bindIp, uint16_t port, int backlog,
                    int& outFd, uint16_t& boundPort, std::string& errorMsg);

/**
 * @brief Wait until a descriptor is readable
 * @return 1 readable, 0 timeout, -1 error
 */
int waitReadable(int fd, uint32_t timeoutMs);

/**
 * @brief strerror() text for an errno value, thread-safe
 */
std::string errnoToString(int err);

}  // namespace SocketUtils

}  // namespace SecureXfer
