#include "net_util.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace net {

void closeSocket(int sock) {
    if (sock >= 0) {
        close(sock);
    }
}

void shutdownSocket(int sock) {
    if (sock >= 0) {
        shutdown(sock, SHUT_RDWR);
    }
}

void setRecvTimeoutMs(int sock, int timeoutMs) {
    struct timeval tv;
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

int lastSocketError() {
    return errno;
}

bool socketInterrupted(int err) {
    return err == EINTR;
}

bool socketWouldBlock(int err) {
    return err == EAGAIN || err == EWOULDBLOCK;
}

int connectTcp(const std::string& host, uint16_t port, int timeoutMs, std::string& error) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    struct addrinfo* results = nullptr;
    const std::string portStr = std::to_string(port);
    const int gai = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &results);
    if (gai != 0 || !results) {
        error = std::string("invalid address ") + host + " (" + gai_strerror(gai) + ")";
        return -1;
    }

    int connected = -1;
    for (struct addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        const int sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            continue;
        }
        struct timeval tv;
        tv.tv_sec = timeoutMs / 1000;
        tv.tv_usec = (timeoutMs % 1000) * 1000;
        setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        if (::connect(sock, ai->ai_addr, ai->ai_addrlen) == 0) {
            connected = sock;
            break;
        }
        close(sock);
    }
    freeaddrinfo(results);

    if (connected < 0) {
        error = "failed to connect to " + host + ":" + portStr;
        return -1;
    }

    int noDelay = 1;
    setsockopt(connected, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay));
    setRecvTimeoutMs(connected, timeoutMs);
    return connected;
}

bool sendAll(int sock, const char* data, size_t len) {
    if (sock < 0) {
        return false;
    }
    size_t sent = 0;
    while (sent < len) {
        const auto n = send(sock, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0 && socketInterrupted(lastSocketError())) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool sendLine(int sock, const std::string& line) {
    const std::string payload = line + "\n";
    return sendAll(sock, payload.c_str(), payload.size());
}

bool recvLine(int sock, std::string& line, size_t maxLen) {
    line.clear();

    while (line.length() < maxLen) {
        char ch = '\0';
        const auto n = recv(sock, &ch, 1, 0);
        if (n < 0 && socketInterrupted(lastSocketError())) {
            continue;
        }
        if (n <= 0) {
            return !line.empty();
        }

        if (ch == '\n') {
            return true;
        }

        if (ch != '\r') {
            line.push_back(ch);
        }
    }

    return true;
}

std::string peerAddress(int sock) {
    struct sockaddr_storage addr;
    socklen_t len = sizeof(addr);
    if (getpeername(sock, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
        return std::string();
    }

    char buffer[INET6_ADDRSTRLEN] = {0};
    if (addr.ss_family == AF_INET) {
        const auto* v4 = reinterpret_cast<const struct sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &v4->sin_addr, buffer, sizeof(buffer));
    } else if (addr.ss_family == AF_INET6) {
        const auto* v6 = reinterpret_cast<const struct sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &v6->sin6_addr, buffer, sizeof(buffer));
    }
    return std::string(buffer);
}

}  // namespace net
