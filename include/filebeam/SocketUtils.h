/**
 * @file SocketUtils.h
 * @brief POSIX socket helpers (address parsing, listen, connect, timeouts)
 */

#pragma once

#include <sys/socket.h>
#include <cstdint>
#include <string>

namespace FileBeam {

constexpr int INVALID_SOCKET_FD = -1;

/**
 * @brief Numeric socket address parsed from "ip:port" or "[ipv6]:port"
 */
struct SocketAddress {
    sockaddr_storage storage{};
    socklen_t length = 0;
    std::string host;   ///< Numeric host without brackets
    uint16_t port = 0;

    std::string toString() const;
};

/**
 * @brief Parse a numeric "ip:port" / "[ipv6]:port" string
 * @param text Address text (host names are not resolved)
 * @param out Parsed address
 * @param errorMsg Output error message
 * @return true on success
 */
bool parseSocketAddress(const std::string& text, SocketAddress& out, std::string& errorMsg);

/**
 * @brief Create a non-blocking listening socket bound to address
 * @return File descriptor or INVALID_SOCKET_FD
 */
int createListenSocket(const SocketAddress& address, std::string& errorMsg);

/**
 * @brief Blocking TCP connect
 * @return File descriptor or INVALID_SOCKET_FD
 */
int connectSocket(const SocketAddress& address, std::string& errorMsg);

bool setBlocking(int fd, bool blocking);

/**
 * @brief Set SO_RCVTIMEO so a silent peer surfaces as a read error
 */
bool setSocketRecvTimeout(int fd, uint32_t timeoutMs);

/**
 * @brief Port the socket is bound to (0 on failure)
 */
uint16_t getLocalPort(int fd);

/**
 * @brief "ip:port" of the connected peer (empty on failure)
 */
std::string getPeerAddress(int fd);

/**
 * @brief "host:port", bracketing IPv6 hosts
 */
std::string formatEndpoint(const std::string& host, uint16_t port);

void closeSocket(int fd);

/**
 * @brief errno as text, e.g. "Connection refused (errno 111)"
 */
std::string describeErrno(int err);

}  // namespace FileBeam
