#include "rigctl_control.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iostream>

#include "net_util.h"

namespace {
// Hamlib error codes that mean "this rig cannot do that".
constexpr int kRigENIMPL = -4;
constexpr int kRigENAVAIL = -11;

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}
}  // namespace

RigctlControl::RigctlControl(const std::string& host, uint16_t port, bool verboseLogging)
    : m_host(host)
    , m_port(port)
    , m_verboseLogging(verboseLogging)
    , m_socket(-1) {
}

RigctlControl::~RigctlControl() {
    disconnect();
}

bool RigctlControl::connect() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return ensureConnectedLocked();
}

void RigctlControl::disconnect() {
    std::lock_guard<std::mutex> lock(m_mutex);
    net::closeSocket(m_socket);
    m_socket = -1;
}

bool RigctlControl::ensureConnectedLocked() {
    if (m_socket >= 0) {
        return true;
    }
    std::string error;
    m_socket = net::connectTcp(m_host, m_port, 2000, error);
    if (m_socket < 0) {
        std::cerr << "[TUNER] rigctl: " << error << std::endl;
        return false;
    }
    if (m_verboseLogging) {
        std::cout << "[TUNER] rigctl connected to " << m_host << ":" << m_port << std::endl;
    }
    return true;
}

std::string RigctlControl::toHamlibMode(const std::string& mode) {
    const std::string upper = toUpper(mode);
    if (upper == "NFM" || upper == "FM") {
        return "FM";
    }
    if (upper == "WFM" || upper == "WBFM") {
        return "WFM";
    }
    if (upper == "CW") {
        return "CW";
    }
    return upper;
}

ControlResult RigctlControl::parseReport(const std::string& reply) {
    int code = 0;
    if (std::sscanf(reply.c_str(), "RPRT %d", &code) != 1) {
        return ControlResult::Failed;
    }
    if (code == 0) {
        return ControlResult::Ok;
    }
    if (code == kRigENIMPL || code == kRigENAVAIL) {
        return ControlResult::Unsupported;
    }
    return ControlResult::Failed;
}

ControlResult RigctlControl::transactLocked(const std::string& command) {
    // One reconnect attempt covers a rigctld restart between scan steps.
    for (int attempt = 0; attempt < 2; attempt++) {
        if (!ensureConnectedLocked()) {
            return ControlResult::Failed;
        }
        std::string reply;
        if (net::sendLine(m_socket, command) && net::recvLine(m_socket, reply, 128)) {
            const ControlResult result = parseReport(reply);
            if (result == ControlResult::Failed && m_verboseLogging) {
                std::cerr << "[TUNER] rigctl '" << command << "' -> '" << reply << "'" << std::endl;
            }
            return result;
        }
        net::closeSocket(m_socket);
        m_socket = -1;
    }
    return ControlResult::Failed;
}

bool RigctlControl::queryLocked(const std::string& command, std::string& reply, std::string* second) {
    if (!ensureConnectedLocked()) {
        return false;
    }
    if (!net::sendLine(m_socket, command) || !net::recvLine(m_socket, reply, 128)) {
        net::closeSocket(m_socket);
        m_socket = -1;
        return false;
    }
    if (reply.rfind("RPRT", 0) == 0) {
        return false;
    }
    if (second != nullptr && !net::recvLine(m_socket, *second, 128)) {
        return false;
    }
    return true;
}

ControlResult RigctlControl::setFrequency(uint64_t frequencyHz) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return transactLocked("F " + std::to_string(frequencyHz));
}

ControlResult RigctlControl::setMode(const std::string& mode) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string hamlibMode = toHamlibMode(mode);
    // Passband 0 selects the rig's default width for the mode.
    const ControlResult result = transactLocked("M " + hamlibMode + " 0");
    if (result == ControlResult::Ok) {
        m_lastMode = hamlibMode;
    }
    return result;
}

ControlResult RigctlControl::setSquelch(float level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "L SQL %.3f", static_cast<double>(level));
    return transactLocked(buffer);
}

ControlResult RigctlControl::setBandwidth(uint32_t bandwidthHz) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_lastMode.empty()) {
        std::string mode;
        std::string passband;
        if (!queryLocked("m", mode, &passband)) {
            return ControlResult::Failed;
        }
        m_lastMode = mode;
    }
    return transactLocked("M " + m_lastMode + " " + std::to_string(bandwidthHz));
}

std::optional<TuningSettings> RigctlControl::currentSettings() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::string freqReply;
    if (!queryLocked("f", freqReply)) {
        return std::nullopt;
    }

    TuningSettings settings;
    try {
        settings.frequencyHz = static_cast<uint64_t>(std::stoull(freqReply));
    } catch (const std::exception&) {
        std::cerr << "[TUNER] rigctl: unexpected frequency reply '" << freqReply << "'" << std::endl;
        return std::nullopt;
    }

    std::string mode;
    std::string passband;
    if (queryLocked("m", mode, &passband)) {
        settings.mode = mode;
        m_lastMode = mode;
        try {
            const long width = std::stol(passband);
            if (width > 0) {
                settings.bandwidthHz = static_cast<uint32_t>(width);
            }
        } catch (const std::exception&) {
            // Mode without a numeric passband is still worth restoring.
        }
    }

    std::string squelch;
    if (queryLocked("l SQL", squelch)) {
        try {
            settings.squelch = std::stof(squelch);
        } catch (const std::exception&) {
            settings.squelch.reset();
        }
    }
    return settings;
}
