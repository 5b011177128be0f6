#include "TcpSocket.h"

#include <cerrno>
#include <cstring>

#ifdef _WIN32
#    include <WinSock2.h>
#    include <Ws2tcpip.h>
#else
#    include <fcntl.h>
#    include <netdb.h>
#    include <netinet/in.h>
#    include <netinet/tcp.h>
#    include <poll.h>
#    include <sys/socket.h>
#    include <unistd.h>
#endif

#include "../core/Logger.h"

namespace Engine::Net {

namespace {
bool setNonBlocking(int fd, bool enable) {
#ifdef _WIN32
    u_long mode = enable ? 1 : 0;
    return ioctlsocket(fd, FIONBIO, &mode) == 0;
#else
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
#endif
}

int lastErrorCode() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

bool inProgress(int err) {
#ifdef _WIN32
    return err == WSAEWOULDBLOCK;
#else
    return err == EINPROGRESS;
#endif
}

int pollOne(int fd, short events, int timeoutMs) {
#ifdef _WIN32
    WSAPOLLFD pfd{};
    pfd.fd = static_cast<SOCKET>(fd);
    pfd.events = events;
    int rc = WSAPoll(&pfd, 1, timeoutMs);
#else
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = events;
    int rc = ::poll(&pfd, 1, timeoutMs);
#endif
    if (rc > 0 && (pfd.revents & (POLLERR | POLLNVAL)) != 0 && (pfd.revents & events) == 0) {
        return -1;
    }
    return rc;
}

void closeFd(int fd) {
#ifdef _WIN32
    closesocket(fd);
#else
    ::close(fd);
#endif
}
}  // namespace

TcpSocket::~TcpSocket() { close(); }

bool TcpSocket::connect(const NetAddress& to, double timeoutSeconds, std::string& error) {
    close();
#ifdef _WIN32
    WSADATA wsaData{};
    if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0) {
        error = "WSAStartup failed";
        return false;
    }
    wsaInit_ = true;
#endif
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    addrinfo* results = nullptr;
    const std::string port = std::to_string(to.port);
    int rc = getaddrinfo(to.host.c_str(), port.c_str(), &hints, &results);
    if (rc != 0 || !results) {
        error = "cannot resolve " + to.host + ": " + gai_strerror(rc);
        return false;
    }

    const int timeoutMs = timeoutSeconds > 0.0 ? static_cast<int>(timeoutSeconds * 1000.0) : -1;
    error = "no usable address for " + to.toString();
    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        int fd = static_cast<int>(socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (fd < 0) {
            error = "socket creation failed";
            continue;
        }
        setNonBlocking(fd, true);
        rc = ::connect(fd, ai->ai_addr, static_cast<int>(ai->ai_addrlen));
        if (rc != 0 && !inProgress(lastErrorCode())) {
            error = std::string("connect to ") + to.toString() + " failed: " + std::strerror(lastErrorCode());
            closeFd(fd);
            continue;
        }
        if (rc != 0) {
            int ready = pollOne(fd, POLLOUT, timeoutMs);
            if (ready <= 0) {
                error = ready == 0 ? "connect to " + to.toString() + " timed out"
                                   : "connect to " + to.toString() + " failed";
                closeFd(fd);
                continue;
            }
            int soError = 0;
#ifdef _WIN32
            int soLen = sizeof(soError);
#else
            socklen_t soLen = sizeof(soError);
#endif
            getsockopt(fd, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&soError), &soLen);
            if (soError != 0) {
                error = std::string("connect to ") + to.toString() + " failed: " + std::strerror(soError);
                closeFd(fd);
                continue;
            }
        }
        setNonBlocking(fd, false);
        int enable = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, reinterpret_cast<const char*>(&enable), sizeof(enable));
        fd_ = fd;
        error.clear();
        break;
    }
    freeaddrinfo(results);
    return fd_ >= 0;
}

void TcpSocket::shutdown() {
    if (fd_ >= 0) {
#ifdef _WIN32
        ::shutdown(fd_, SD_BOTH);
#else
        ::shutdown(fd_, SHUT_RDWR);
#endif
    }
}

void TcpSocket::close() {
    if (fd_ >= 0) {
        closeFd(fd_);
    }
    fd_ = -1;
#ifdef _WIN32
    if (wsaInit_) {
        WSACleanup();
        wsaInit_ = false;
    }
#endif
}

bool TcpSocket::isOpen() const { return fd_ >= 0; }

bool TcpSocket::sendAll(const uint8_t* data, std::size_t len) {
    if (fd_ < 0) return false;
    std::size_t sent = 0;
    while (sent < len) {
#ifdef _WIN32
        int n = ::send(fd_, reinterpret_cast<const char*>(data + sent), static_cast<int>(len - sent), 0);
#else
        auto n = ::send(fd_, data + sent, len - sent, MSG_NOSIGNAL);
#endif
        if (n <= 0) {
            if (n < 0 && lastErrorCode() == EINTR) continue;
            Engine::logWarn("TCP send failed: " + std::string(std::strerror(lastErrorCode())));
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

int TcpSocket::receive(uint8_t* buffer, std::size_t maxLen, int timeoutMs) {
    if (fd_ < 0) return -1;
    int ready = pollOne(fd_, POLLIN, timeoutMs);
    if (ready == 0) return 0;
    if (ready < 0) {
        return lastErrorCode() == EINTR ? 0 : -1;
    }
    int received = static_cast<int>(::recv(fd_, reinterpret_cast<char*>(buffer), static_cast<int>(maxLen), 0));
    if (received <= 0) {
        return -1;
    }
    return received;
}

}  // namespace Engine::Net
