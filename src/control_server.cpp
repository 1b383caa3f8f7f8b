#include "control_server.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <strings.h>
#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <random>

#include <openssl/rand.h>
#include <openssl/sha.h>

#include "client_presence.h"
#include "net_util.h"

namespace {
constexpr size_t MAX_NOTIFY_QUEUE = 256;
constexpr size_t MAX_COMMAND_LENGTH = 8192;

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return strcasecmp(a.c_str(), b.c_str()) == 0;
}
}  // namespace

ControlServer::ControlServer(uint16_t port, ClientPresenceTracker* presence)
    : m_port(port)
    , m_presence(presence)
    , m_serverSocket(-1)
    , m_running(false)
    , m_activeClientThreads(0)
    , m_nextClientNumber(1)
    , m_guestMode(false)
    , m_verboseLogging(false) {
}

ControlServer::~ControlServer() {
    stop();
}

void ControlServer::setPassword(const std::string& password) {
    m_password = password;
}

void ControlServer::setGuestMode(bool enabled) {
    m_guestMode = enabled;
}

void ControlServer::setVerboseLogging(bool enabled) {
    m_verboseLogging = enabled;
}

void ControlServer::setStatusCallback(TextCallback cb) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_statusCallback = std::move(cb);
}

void ControlServer::setRecordingCallback(TextCallback cb) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_recordingCallback = std::move(cb);
}

void ControlServer::setStateCallback(TextCallback cb) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_stateCallback = std::move(cb);
}

void ControlServer::setDecodingCallback(DecodingCallback cb) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_decodingCallback = std::move(cb);
}

void ControlServer::addClientSocket(int clientSocket) {
    std::lock_guard<std::mutex> lock(m_clientSocketsMutex);
    m_clientSockets.push_back(clientSocket);
}

void ControlServer::removeClientSocket(int clientSocket) {
    std::lock_guard<std::mutex> lock(m_clientSocketsMutex);
    auto it = std::find(m_clientSockets.begin(), m_clientSockets.end(), clientSocket);
    if (it != m_clientSockets.end()) {
        m_clientSockets.erase(it);
    }
}

std::string ControlServer::generateSalt() {
    static const char chars[] = "QWERTYUIOPASDFGHJKLZXCVBNMqwertyuiopasdfghjklzxcvbnm0123456789_-";
    const int len = static_cast<int>(strlen(chars));
    unsigned char random_data[SALT_LENGTH];

    std::string salt;
    if (!RAND_bytes(random_data, sizeof(random_data))) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, len - 1);
        for (int i = 0; i < SALT_LENGTH; i++) {
            salt += chars[dis(gen)];
        }
        return salt;
    }

    for (int i = 0; i < SALT_LENGTH; i++) {
        salt += chars[random_data[i] % len];
    }
    return salt;
}

std::string ControlServer::computeSHA1(const std::string& salt, const std::string& password) {
    unsigned char sha[SHA_DIGEST_LENGTH];
    SHA_CTX ctx;

    SHA1_Init(&ctx);
    SHA1_Update(&ctx, salt.c_str(), salt.length());
    SHA1_Update(&ctx, password.c_str(), password.length());
    SHA1_Final(sha, &ctx);

    char sha_string[SHA_DIGEST_LENGTH * 2 + 1];
    for (int i = 0; i < SHA_DIGEST_LENGTH; i++) {
        std::snprintf(sha_string + (i * 2), 3, "%02x", sha[i]);
    }
    sha_string[SHA_DIGEST_LENGTH * 2] = '\0';
    return std::string(sha_string);
}

bool ControlServer::authenticate(const std::string& salt, const std::string& passwordHash) {
    const std::string expected = computeSHA1(salt, m_password);
    return expected.length() == passwordHash.length() && equalsIgnoreCase(expected, passwordHash);
}

bool ControlServer::parseDecodingCommand(const std::string& cmd, std::string& decoder, nlohmann::json& fields) {
    if (cmd.size() < 2 || cmd[0] != 'D') {
        return false;
    }
    const size_t comma = cmd.find(',', 1);
    if (comma == std::string::npos || comma == 1) {
        return false;
    }
    decoder = cmd.substr(1, comma - 1);
    try {
        fields = nlohmann::json::parse(cmd.substr(comma + 1));
    } catch (const nlohmann::json::parse_error&) {
        return false;
    }
    return fields.is_object();
}

void ControlServer::pushNotification(const std::string& line) {
    std::lock_guard<std::mutex> lock(m_notifyMutex);
    m_notifyQueue.emplace_back(m_notifyNextSeq++, line);
    while (m_notifyQueue.size() > MAX_NOTIFY_QUEUE) {
        m_notifyQueue.pop_front();
    }
}

std::string ControlServer::processCommand(const std::string& cmd, bool authenticated) {
    if (cmd.empty()) {
        return std::string();
    }

    TextCallback callback;
    switch (cmd[0]) {
        case 'P':
            return "P";
        case 'S': {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_statusCallback;
            break;
        }
        case 'R': {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_recordingCallback;
            break;
        }
        case 'A': {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_stateCallback;
            break;
        }
        case 'D': {
            if (!authenticated) {
                return "D0";
            }
            std::string decoder;
            nlohmann::json fields;
            if (!parseDecodingCommand(cmd, decoder, fields)) {
                if (m_verboseLogging.load()) {
                    std::cout << "[CTRL] malformed decoding command" << std::endl;
                }
                return "D0";
            }
            DecodingCallback decodingCallback;
            {
                std::lock_guard<std::mutex> lock(m_callbackMutex);
                decodingCallback = m_decodingCallback;
            }
            return (decodingCallback && decodingCallback(decoder, fields)) ? "D1" : "D0";
        }
        default:
            if (m_verboseLogging.load()) {
                std::cout << "[CTRL] unknown command '" << cmd << "'" << std::endl;
            }
            return std::string();
    }

    return callback ? callback() : std::string();
}

bool ControlServer::start() {
    if (m_running) {
        return false;
    }

    m_serverSocket = socket(AF_INET, SOCK_STREAM, 0);
    if (m_serverSocket < 0) {
        std::cerr << "[CTRL] failed to create server socket" << std::endl;
        return false;
    }

    int opt = 1;
    setsockopt(m_serverSocket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in serverAddr;
    memset(&serverAddr, 0, sizeof(serverAddr));
    serverAddr.sin_family = AF_INET;
    serverAddr.sin_addr.s_addr = INADDR_ANY;
    serverAddr.sin_port = htons(m_port);

    if (bind(m_serverSocket, (struct sockaddr*)&serverAddr, sizeof(serverAddr)) < 0) {
        std::cerr << "[CTRL] failed to bind to port " << m_port << std::endl;
        net::closeSocket(m_serverSocket);
        m_serverSocket = -1;
        return false;
    }

    if (listen(m_serverSocket, 5) < 0) {
        std::cerr << "[CTRL] failed to listen on port " << m_port << std::endl;
        net::closeSocket(m_serverSocket);
        m_serverSocket = -1;
        return false;
    }

    m_running = true;
    m_acceptThread = std::thread([this]() {
        while (m_running) {
            struct sockaddr_in clientAddr;
            socklen_t clientLen = sizeof(clientAddr);
            int clientSocket = accept(m_serverSocket, (struct sockaddr*)&clientAddr, &clientLen);

            if (clientSocket >= 0) {
                addClientSocket(clientSocket);
                const uint64_t clientNumber = m_nextClientNumber.fetch_add(1);
                m_activeClientThreads.fetch_add(1, std::memory_order_relaxed);
                std::thread([this, clientSocket, clientNumber]() {
                    try {
                        handleClient(clientSocket, clientNumber);
                    } catch (const std::exception& ex) {
                        std::cerr << "[CTRL] client handler failed: " << ex.what() << std::endl;
                    }
                    removeClientSocket(clientSocket);
                    net::closeSocket(clientSocket);
                    {
                        std::lock_guard<std::mutex> lock(m_clientThreadWaitMutex);
                        m_activeClientThreads.fetch_sub(1, std::memory_order_relaxed);
                    }
                    m_clientThreadWaitCv.notify_all();
                }).detach();
            } else if (m_running && net::socketInterrupted(net::lastSocketError())) {
                continue;
            }
        }
    });

    std::cout << "[CTRL] listening on port " << m_port << std::endl;
    return true;
}

void ControlServer::stop() {
    if (!m_running) {
        return;
    }

    m_running = false;

    if (m_serverSocket >= 0) {
        net::shutdownSocket(m_serverSocket);
        net::closeSocket(m_serverSocket);
        m_serverSocket = -1;
    }

    std::vector<int> clients;
    {
        std::lock_guard<std::mutex> lock(m_clientSocketsMutex);
        clients = m_clientSockets;
    }
    for (int sock : clients) {
        net::shutdownSocket(sock);
    }

    if (m_acceptThread.joinable()) {
        m_acceptThread.join();
    }

    std::unique_lock<std::mutex> lock(m_clientThreadWaitMutex);
    const bool drained = m_clientThreadWaitCv.wait_for(lock, std::chrono::seconds(2), [&]() {
        return m_activeClientThreads.load(std::memory_order_relaxed) == 0;
    });
    if (!drained) {
        std::cerr << "[CTRL] client threads still running after stop" << std::endl;
    }
}

void ControlServer::handleClient(int clientSocket, uint64_t clientNumber) {
    const std::string clientIP = net::peerAddress(clientSocket);
    const std::string clientId = "ctrl-" + std::to_string(clientNumber);
    std::cout << "[CTRL] client " << clientId << " connected from " << clientIP << std::endl;

    const std::string salt = generateSalt();
    if (!net::sendLine(clientSocket, salt)) {
        return;
    }

    std::string authMsg;
    net::setRecvTimeoutMs(clientSocket, 10000);
    if (!net::recvLine(clientSocket, authMsg, HASH_LENGTH + 2)) {
        if (m_verboseLogging.load()) {
            std::cout << "[CTRL] " << clientId << " disconnected before sending auth hash" << std::endl;
        }
        return;
    }

    std::string clientHash = authMsg;
    if (clientHash.length() == HASH_LENGTH + 1 && (clientHash[0] == 'P' || clientHash[0] == 'p')) {
        clientHash = clientHash.substr(1);
    }

    const bool authSuccess = authenticate(salt, clientHash);
    if (m_verboseLogging.load()) {
        std::cout << "[CTRL] authentication " << (authSuccess ? "SUCCESS" : "FAILED") << " for " << clientId
                  << std::endl;
    }
    if (!authSuccess && !m_guestMode) {
        net::sendLine(clientSocket, "a0");
        std::cout << "[CTRL] client " << clientId << " rejected" << std::endl;
        return;
    }
    if (!net::sendLine(clientSocket, authSuccess ? "a2" : "a1")) {
        return;
    }

    if (m_presence) {
        m_presence->clientConnected(clientId, clientIP, "control");
    }

    uint64_t lastNotifySeq = 0;
    {
        std::lock_guard<std::mutex> lock(m_notifyMutex);
        if (!m_notifyQueue.empty()) {
            lastNotifySeq = m_notifyQueue.back().first;
        }
    }

    char cmdBuffer[256];
    std::string command;
    net::setRecvTimeoutMs(clientSocket, 100);
    bool closeRequested = false;

    while (m_running && !closeRequested) {
        const auto n = recv(clientSocket, cmdBuffer, sizeof(cmdBuffer) - 1, 0);
        if (n < 0) {
            const int err = net::lastSocketError();
            if (net::socketInterrupted(err)) {
                continue;
            }
            if (!net::socketWouldBlock(err)) {
                break;
            }
            std::vector<std::string> lines;
            {
                std::lock_guard<std::mutex> lock(m_notifyMutex);
                for (const auto& entry : m_notifyQueue) {
                    if (entry.first > lastNotifySeq) {
                        lines.push_back(entry.second);
                        lastNotifySeq = entry.first;
                    }
                }
            }
            bool sendFailed = false;
            for (const std::string& line : lines) {
                if (!net::sendLine(clientSocket, line)) {
                    sendFailed = true;
                    break;
                }
            }
            if (sendFailed) {
                break;
            }
            continue;
        }
        if (n == 0) {
            break;
        }

        cmdBuffer[n] = '\0';
        command.append(cmdBuffer, static_cast<size_t>(n));
        if (m_presence) {
            m_presence->clientActivity(clientId);
        }

        size_t pos;
        while ((pos = command.find('\n')) != std::string::npos) {
            std::string line = command.substr(0, pos);
            command = command.substr(pos + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line == "X") {
                closeRequested = true;
                break;
            }
            const std::string response = processCommand(line, authSuccess);
            if (!response.empty() && !net::sendLine(clientSocket, response)) {
                closeRequested = true;
                break;
            }
        }
        if (command.size() > MAX_COMMAND_LENGTH) {
            std::cerr << "[CTRL] " << clientId << " sent an oversized line, closing" << std::endl;
            break;
        }
    }
    net::setRecvTimeoutMs(clientSocket, 0);

    if (m_presence) {
        m_presence->clientDisconnected(clientId);
    }
    std::cout << "[CTRL] client " << clientId << " disconnected" << std::endl;
}
