#ifndef CONTROL_SERVER_H
#define CONTROL_SERVER_H

#include <stdint.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

class ClientPresenceTracker;

// Line-oriented TCP control port. Clients authenticate with a salted SHA1 of
// the shared password; every connection is reported to the presence tracker
// so that a connected operator takes the receiver out of automatic mode.
class ControlServer {
public:
    static constexpr uint16_t DEFAULT_PORT = 7380;
    static constexpr int SALT_LENGTH = 16;
    static constexpr int HASH_LENGTH = 40;

    using TextCallback = std::function<std::string()>;
    using DecodingCallback = std::function<bool(const std::string& decoder, const nlohmann::json& fields)>;

    ControlServer(uint16_t port, ClientPresenceTracker* presence);
    ~ControlServer();

    void setPassword(const std::string& password);
    void setGuestMode(bool enabled);
    void setVerboseLogging(bool enabled);

    void setStatusCallback(TextCallback cb);
    void setRecordingCallback(TextCallback cb);
    void setStateCallback(TextCallback cb);
    void setDecodingCallback(DecodingCallback cb);

    bool start();
    void stop();
    bool isRunning() const { return m_running; }
    uint16_t port() const { return m_port; }

    // Queues a line for every connected client.
    void pushNotification(const std::string& line);

    std::string processCommand(const std::string& cmd, bool authenticated);

    static std::string computeSHA1(const std::string& salt, const std::string& password);
    static bool parseDecodingCommand(const std::string& cmd, std::string& decoder, nlohmann::json& fields);

private:
    void addClientSocket(int clientSocket);
    void removeClientSocket(int clientSocket);
    void handleClient(int clientSocket, uint64_t clientNumber);
    std::string generateSalt();
    bool authenticate(const std::string& salt, const std::string& passwordHash);

    uint16_t m_port;
    ClientPresenceTracker* m_presence;
    int m_serverSocket;
    std::atomic<bool> m_running;
    std::thread m_acceptThread;
    std::mutex m_clientSocketsMutex;
    std::vector<int> m_clientSockets;
    std::atomic<int> m_activeClientThreads;
    std::atomic<uint64_t> m_nextClientNumber;
    std::mutex m_clientThreadWaitMutex;
    std::condition_variable m_clientThreadWaitCv;

    std::string m_password;
    bool m_guestMode;
    std::atomic<bool> m_verboseLogging;

    std::deque<std::pair<uint64_t, std::string>> m_notifyQueue;
    uint64_t m_notifyNextSeq = 1;
    std::mutex m_notifyMutex;

    TextCallback m_statusCallback;
    TextCallback m_recordingCallback;
    TextCallback m_stateCallback;
    DecodingCallback m_decodingCallback;
    std::mutex m_callbackMutex;
};

#endif
