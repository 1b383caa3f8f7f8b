#include "rtl_tcp_control.h"

#include <arpa/inet.h>
#include <sys/socket.h>

#include <cstring>
#include <iostream>
#include <vector>

#include "net_util.h"

namespace {
constexpr uint8_t kCmdSetFrequency = 0x01;
constexpr size_t kHeaderLength = 12;
}  // namespace

RtlTcpControl::RtlTcpControl(const std::string& host, uint16_t port, bool verboseLogging)
    : m_host(host)
    , m_port(port)
    , m_verboseLogging(verboseLogging)
    , m_socket(-1)
    , m_connected(false)
    , m_frequency(0) {
}

RtlTcpControl::~RtlTcpControl() {
    disconnect();
}

bool RtlTcpControl::connect() {
    disconnect();

    std::string error;
    const int sock = net::connectTcp(m_host, m_port, 2000, error);
    if (sock < 0) {
        std::cerr << "[TUNER] rtl_tcp: " << error << std::endl;
        return false;
    }

    // The server greets with "RTL0" plus tuner type and gain count.
    uint8_t header[kHeaderLength];
    size_t totalRead = 0;
    while (totalRead < sizeof(header)) {
        const auto n = recv(sock, reinterpret_cast<char*>(header + totalRead), sizeof(header) - totalRead, 0);
        if (n <= 0) {
            break;
        }
        totalRead += static_cast<size_t>(n);
    }
    if (totalRead != sizeof(header) || std::memcmp(header, "RTL0", 4) != 0) {
        std::cerr << "[TUNER] rtl_tcp: invalid response from " << m_host << ":" << m_port << std::endl;
        net::closeSocket(sock);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_socketMutex);
        m_socket = sock;
    }
    net::setRecvTimeoutMs(sock, 200);
    m_connected = true;
    m_drainThread = std::thread(&RtlTcpControl::runDrain, this);

    if (m_verboseLogging) {
        std::cout << "[TUNER] rtl_tcp connected to " << m_host << ":" << m_port << std::endl;
    }
    return true;
}

void RtlTcpControl::disconnect() {
    m_connected = false;
    {
        std::lock_guard<std::mutex> lock(m_socketMutex);
        net::shutdownSocket(m_socket);
    }
    if (m_drainThread.joinable()) {
        m_drainThread.join();
    }
    std::lock_guard<std::mutex> lock(m_socketMutex);
    net::closeSocket(m_socket);
    m_socket = -1;
}

void RtlTcpControl::runDrain() {
    std::vector<char> scratch(16384);
    int sock = -1;
    {
        std::lock_guard<std::mutex> lock(m_socketMutex);
        sock = m_socket;
    }
    while (m_connected) {
        const auto n = recv(sock, scratch.data(), scratch.size(), 0);
        if (n > 0) {
            continue;
        }
        if (n < 0) {
            const int err = net::lastSocketError();
            if (net::socketWouldBlock(err) || net::socketInterrupted(err)) {
                continue;
            }
        }
        if (m_connected) {
            std::cerr << "[TUNER] rtl_tcp: server closed the connection" << std::endl;
        }
        m_connected = false;
    }
}

void RtlTcpControl::encodeCommand(uint8_t cmd, uint32_t param, uint8_t out[5]) {
    out[0] = cmd;
    const uint32_t networkOrder = htonl(param);
    std::memcpy(&out[1], &networkOrder, sizeof(networkOrder));
}

bool RtlTcpControl::sendCommand(uint8_t cmd, uint32_t param) {
    if (!m_connected && !connect()) {
        return false;
    }

    uint8_t buffer[5];
    encodeCommand(cmd, param, buffer);
    std::lock_guard<std::mutex> lock(m_socketMutex);
    return net::sendAll(m_socket, reinterpret_cast<const char*>(buffer), sizeof(buffer));
}

ControlResult RtlTcpControl::setFrequency(uint64_t frequencyHz) {
    if (frequencyHz == 0 || frequencyHz > 0xFFFFFFFFULL) {
        return ControlResult::Failed;
    }
    if (!sendCommand(kCmdSetFrequency, static_cast<uint32_t>(frequencyHz))) {
        return ControlResult::Failed;
    }
    m_frequency = frequencyHz;
    return ControlResult::Ok;
}

ControlResult RtlTcpControl::setMode(const std::string&) {
    return ControlResult::Unsupported;
}

ControlResult RtlTcpControl::setSquelch(float) {
    return ControlResult::Unsupported;
}

ControlResult RtlTcpControl::setBandwidth(uint32_t) {
    return ControlResult::Unsupported;
}

std::optional<TuningSettings> RtlTcpControl::currentSettings() {
    const uint64_t frequency = m_frequency.load();
    if (frequency == 0) {
        return std::nullopt;
    }
    TuningSettings settings;
    settings.frequencyHz = frequency;
    return settings;
}
