/**
 * @file SocketUtils.cpp
 * @brief POSIX socket helpers (address parsing, listen, connect, timeouts)
 */

#include "filebeam/SocketUtils.h"
#include "filebeam/config.h"
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace FileBeam {

namespace {

std::string formatHostPort(const sockaddr* addr) {
    char host[INET6_ADDRSTRLEN] = {0};
    uint16_t port = 0;

    if (addr->sa_family == AF_INET) {
        const auto* in4 = reinterpret_cast<const sockaddr_in*>(addr);
        inet_ntop(AF_INET, &in4->sin_addr, host, sizeof(host));
        port = ntohs(in4->sin_port);
        return std::string(host) + ":" + std::to_string(port);
    }
    if (addr->sa_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        port = ntohs(in6->sin6_port);
        return "[" + std::string(host) + "]:" + std::to_string(port);
    }
    return {};
}

}  // namespace

std::string describeErrno(int err) {
    return std::string(std::strerror(err)) + " (errno " + std::to_string(err) + ")";
}

std::string SocketAddress::toString() const {
    if (length == 0) {
        return {};
    }
    return formatHostPort(reinterpret_cast<const sockaddr*>(&storage));
}

//=============================================================================
// Address parsing
//=============================================================================

bool parseSocketAddress(const std::string& text, SocketAddress& out, std::string& errorMsg) {
    std::string host;
    std::string portText;

    if (!text.empty() && text.front() == '[') {
        const size_t close = text.find(']');
        if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':') {
            errorMsg = "Invalid socket address: " + text;
            return false;
        }
        host = text.substr(1, close - 1);
        portText = text.substr(close + 2);
    } else {
        const size_t colon = text.rfind(':');
        if (colon == std::string::npos || text.find(':') != colon) {
            errorMsg = "Invalid socket address (expected ip:port): " + text;
            return false;
        }
        host = text.substr(0, colon);
        portText = text.substr(colon + 1);
    }

    if (host.empty() || portText.empty() || portText.size() > 5 ||
        portText.find_first_not_of("0123456789") != std::string::npos) {
        errorMsg = "Invalid socket address: " + text;
        return false;
    }

    const unsigned long port = std::stoul(portText);
    if (port > 65535) {
        errorMsg = "Port out of range: " + portText;
        return false;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICHOST | AI_NUMERICSERV;

    addrinfo* result = nullptr;
    const int rc = getaddrinfo(host.c_str(), portText.c_str(), &hints, &result);
    if (rc != 0 || !result) {
        errorMsg = "Invalid IP address '" + host + "': " + gai_strerror(rc);
        return false;
    }

    SocketAddress parsed;
    std::memcpy(&parsed.storage, result->ai_addr, result->ai_addrlen);
    parsed.length = static_cast<socklen_t>(result->ai_addrlen);
    parsed.host = host;
    parsed.port = static_cast<uint16_t>(port);
    freeaddrinfo(result);

    out = parsed;
    return true;
}

//=============================================================================
// Socket creation
//=============================================================================

int createListenSocket(const SocketAddress& address, std::string& errorMsg) {
    const int family = address.storage.ss_family;
    int fd = ::socket(family, SOCK_STREAM, IPPROTO_TCP);
    if (fd < 0) {
        errorMsg = "socket() failed: " + describeErrno(errno);
        return INVALID_SOCKET_FD;
    }

    int reuse = 1;
    (void)setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    if (::bind(fd, reinterpret_cast<const sockaddr*>(&address.storage), address.length) != 0) {
        errorMsg = "bind(" + address.toString() + ") failed: " + describeErrno(errno);
        ::close(fd);
        return INVALID_SOCKET_FD;
    }

    if (::listen(fd, LISTEN_BACKLOG) != 0) {
        errorMsg = "listen() failed: " + describeErrno(errno);
        ::close(fd);
        return INVALID_SOCKET_FD;
    }

    // Non-blocking accept lets the listener notice stop requests
    if (!setBlocking(fd, false)) {
        errorMsg = "Failed to set listen socket non-blocking: " + describeErrno(errno);
        ::close(fd);
        return INVALID_SOCKET_FD;
    }

    return fd;
}

int connectSocket(const SocketAddress& address, std::string& errorMsg) {
    int fd = ::socket(address.storage.ss_family, SOCK_STREAM, IPPROTO_TCP);
    if (fd < 0) {
        errorMsg = "socket() failed: " + describeErrno(errno);
        return INVALID_SOCKET_FD;
    }

    int rc;
    do {
        rc = ::connect(fd, reinterpret_cast<const sockaddr*>(&address.storage), address.length);
    } while (rc != 0 && errno == EINTR);

    if (rc != 0) {
        errorMsg = "connect(" + address.toString() + ") failed: " + describeErrno(errno);
        ::close(fd);
        return INVALID_SOCKET_FD;
    }

    return fd;
}

bool setBlocking(int fd, bool blocking) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    const int updated = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return fcntl(fd, F_SETFL, updated) == 0;
}

bool setSocketRecvTimeout(int fd, uint32_t timeoutMs) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeoutMs / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeoutMs % 1000) * 1000);
    return setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

uint16_t getLocalPort(int fd) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return 0;
    }
    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
    }
    return 0;
}

std::string getPeerAddress(int fd) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return {};
    }
    return formatHostPort(reinterpret_cast<const sockaddr*>(&addr));
}

std::string formatEndpoint(const std::string& host, uint16_t port) {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

void closeSocket(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

}  // namespace FileBeam
