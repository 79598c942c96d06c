/**
 * @file SocketUtils.cpp
 * @brief POSIX socket helpers shared by discovery and transfer code
 */

#include "securexfer/SocketUtils.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>

namespace SecureXfer {
namespace SocketUtils {

namespace {

std::once_flag g_networkingOnce;

timeval toTimeval(uint32_t timeoutMs) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeoutMs / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeoutMs % 1000) * 1000);
    return tv;
}

bool setBlocking(int fd, bool blocking) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    const int newFlags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return fcntl(fd, F_SETFL, newFlags) == 0;
}

}  // namespace

void initializeNetworking() {
    std::call_once(g_networkingOnce, []() {
        std::signal(SIGPIPE, SIG_IGN);
    });
}

std::string errnoToString(int err) {
    char buf[256] = {};
    // GNU strerror_r may return a static string instead of filling buf
#if defined(__GLIBC__) && defined(_GNU_SOURCE)
    const char* msg = strerror_r(err, buf, sizeof(buf));
    return std::string(msg ? msg : "unknown error") + " (errno " + std::to_string(err) + ")";
#else
    if (strerror_r(err, buf, sizeof(buf)) != 0) {
        return "errno " + std::to_string(err);
    }
    return std::string(buf) + " (errno " + std::to_string(err) + ")";
#endif
}

void closeSocket(int& fd) {
    if (fd != INVALID_SOCKET_FD) {
        ::close(fd);
        fd = INVALID_SOCKET_FD;
    }
}

void shutdownSocket(int fd) {
    if (fd != INVALID_SOCKET_FD) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

bool setRecvTimeout(int fd, uint32_t timeoutMs, std::string& errorMsg) {
    const timeval tv = toTimeval(timeoutMs);
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        errorMsg = "setsockopt(SO_RCVTIMEO) failed: " + errnoToString(errno);
        return false;
    }
    return true;
}

bool setSendTimeout(int fd, uint32_t timeoutMs, std::string& errorMsg) {
    const timeval tv = toTimeval(timeoutMs);
    if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        errorMsg = "setsockopt(SO_SNDTIMEO) failed: " + errnoToString(errno);
        return false;
    }
    return true;
}

void tuneStreamSocket(int fd) {
    const int bufferSize = 1024 * 1024;
    setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &bufferSize, sizeof(bufferSize));
    setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &bufferSize, sizeof(bufferSize));

    const int noDelay = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay));
}

bool connectTcp(const std::string& ip, uint16_t port, uint32_t timeoutMs,
                int& outFd, std::string& errorMsg) {
    initializeNetworking();

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        errorMsg = "Invalid IPv4 address: " + ip;
        return false;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd < 0) {
        errorMsg = "socket() failed: " + errnoToString(errno);
        return false;
    }

    // Non-blocking connect so the timeout is ours, not the kernel's
    if (!setBlocking(fd, false)) {
        errorMsg = "fcntl(O_NONBLOCK) failed: " + errnoToString(errno);
        closeSocket(fd);
        return false;
    }

    int rc = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc != 0 && errno != EINPROGRESS) {
        errorMsg = "connect() to " + ip + ":" + std::to_string(port) + " failed: " +
                   errnoToString(errno);
        closeSocket(fd);
        return false;
    }

    if (rc != 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        do {
            rc = ::poll(&pfd, 1, static_cast<int>(timeoutMs));
        } while (rc < 0 && errno == EINTR);

        if (rc == 0) {
            errorMsg = "Connection to " + ip + ":" + std::to_string(port) + " timed out";
            closeSocket(fd);
            return false;
        }
        if (rc < 0) {
            errorMsg = "poll() failed: " + errnoToString(errno);
            closeSocket(fd);
            return false;
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) != 0 || soError != 0) {
            errorMsg = "connect() to " + ip + ":" + std::to_string(port) + " failed: " +
                       errnoToString(soError != 0 ? soError : errno);
            closeSocket(fd);
            return false;
        }
    }

    if (!setBlocking(fd, true)) {
        errorMsg = "fcntl(blocking) failed: " + errnoToString(errno);
        closeSocket(fd);
        return false;
    }

    tuneStreamSocket(fd);
    outFd = fd;
    return true;
}

bool createListener(const std::string& bindIp, uint16_t port, int backlog,
                    int& outFd, uint16_t& boundPort, std::string& errorMsg) {
    initializeNetworking();

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, bindIp.c_str(), &addr.sin_addr) != 1) {
        errorMsg = "Invalid bind address: " + bindIp;
        return false;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd < 0) {
        errorMsg = "socket() failed: " + errnoToString(errno);
        return false;
    }

    const int reuse = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        errorMsg = "bind() failed: " + errnoToString(errno);
        closeSocket(fd);
        return false;
    }

    if (::listen(fd, backlog) != 0) {
        errorMsg = "listen() failed: " + errnoToString(errno);
        closeSocket(fd);
        return false;
    }

    // Accept loop polls with a short sleep so stop() is observed promptly
    if (!setBlocking(fd, false)) {
        errorMsg = "fcntl(O_NONBLOCK) failed: " + errnoToString(errno);
        closeSocket(fd);
        return false;
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &boundLen) != 0) {
        errorMsg = "getsockname() failed: " + errnoToString(errno);
        closeSocket(fd);
        return false;
    }

    boundPort = ntohs(bound.sin_port);
    outFd = fd;
    return true;
}

int waitReadable(int fd, uint32_t timeoutMs) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;

    int rc;
    do {
        rc = ::poll(&pfd, 1, static_cast<int>(timeoutMs));
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        return -1;
    }
    if (rc == 0) {
        return 0;
    }
    // Hang-up and errors count as readable: the next read reports them
    return 1;
}

}  // namespace SocketUtils
}  // namespace SecureXfer
