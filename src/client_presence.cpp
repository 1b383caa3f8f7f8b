#include "client_presence.h"

#include <iostream>
#include <utility>

const char* presenceEventName(PresenceEvent event) {
    switch (event) {
        case PresenceEvent::RemoteClientConnected:
            return "remote_client_connected";
        case PresenceEvent::RemoteClientDisconnected:
            return "remote_client_disconnected";
        case PresenceEvent::AllRemoteClientsGone:
            return "all_remote_clients_gone";
    }
    return "unknown";
}

ClientPresenceTracker::ClientPresenceTracker(AddressMatcher matcher, bool considerLocalClients,
                                             bool verboseLogging)
    : m_matcher(std::move(matcher))
    , m_considerLocalClients(considerLocalClients)
    , m_verboseLogging(verboseLogging)
    , m_monitorRunning(false) {
}

ClientPresenceTracker::~ClientPresenceTracker() {
    stopMonitoring();
}

ClientPresenceTracker::ListenerHandle ClientPresenceTracker::addListener(PresenceEvent event, Listener listener) {
    if (!listener) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    const ListenerHandle handle = m_nextListener++;
    m_listeners.emplace(handle, ListenerEntry{event, std::move(listener)});
    return handle;
}

void ClientPresenceTracker::removeListener(ListenerHandle handle) {
    std::lock_guard<std::mutex> dispatchLock(m_dispatchMutex);
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    m_listeners.erase(handle);
}

bool ClientPresenceTracker::isLocalAddress(const std::string& address) const {
    return m_matcher.isLocal(address);
}

bool ClientPresenceTracker::blocksAutonomyLocked(const ClientRecord& record) const {
    return m_considerLocalClients || !m_matcher.isLocal(record.address);
}

size_t ClientPresenceTracker::blockingCountLocked() const {
    size_t count = 0;
    for (const auto& entry : m_clients) {
        if (blocksAutonomyLocked(entry.second)) {
            count++;
        }
    }
    return count;
}

void ClientPresenceTracker::clientConnected(const std::string& id, const std::string& address,
                                            const std::string& userAgent) {
    std::lock_guard<std::mutex> dispatchLock(m_dispatchMutex);
    bool fireConnected = false;
    bool remote = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto now = std::chrono::system_clock::now();
        auto existing = m_clients.find(id);
        const bool wasBlocking = existing != m_clients.end() && blocksAutonomyLocked(existing->second);

        ClientRecord record;
        record.id = id;
        record.address = address;
        record.userAgent = userAgent;
        record.connectedAt = now;
        record.lastSeen = now;
        m_clients[id] = record;

        remote = !m_matcher.isLocal(address);
        if (blocksAutonomyLocked(record) && !wasBlocking) {
            fireConnected = true;
            m_goneSignalled = false;
        }
    }

    if (m_verboseLogging) {
        std::cout << "[CLIENTS] connected id=" << id << " address=" << address
                  << (remote ? " (remote)" : " (local)") << std::endl;
    }
    if (fireConnected) {
        dispatch(PresenceEvent::RemoteClientConnected, id);
    }
}

void ClientPresenceTracker::clientDisconnected(const std::string& id) {
    std::lock_guard<std::mutex> dispatchLock(m_dispatchMutex);
    bool fireDisconnected = false;
    bool fireGone = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_clients.find(id);
        if (it == m_clients.end()) {
            return;
        }
        const bool wasBlocking = blocksAutonomyLocked(it->second);
        m_clients.erase(it);
        if (wasBlocking) {
            fireDisconnected = true;
            if (blockingCountLocked() == 0) {
                fireGone = true;
                m_goneSignalled = true;
            }
        }
    }

    if (m_verboseLogging) {
        std::cout << "[CLIENTS] disconnected id=" << id << std::endl;
    }
    if (fireDisconnected) {
        dispatch(PresenceEvent::RemoteClientDisconnected, id);
    }
    if (fireGone) {
        dispatch(PresenceEvent::AllRemoteClientsGone, id);
    }
}

void ClientPresenceTracker::clientActivity(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_clients.find(id);
    if (it != m_clients.end()) {
        it->second.lastSeen = std::chrono::system_clock::now();
    }
}

bool ClientPresenceTracker::hasRemoteClients() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return blockingCountLocked() > 0;
}

ClientCounts ClientPresenceTracker::getCounts() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    ClientCounts counts;
    counts.total = m_clients.size();
    for (const auto& entry : m_clients) {
        if (m_matcher.isLocal(entry.second.address)) {
            counts.local++;
        } else {
            counts.remote++;
        }
    }
    return counts;
}

std::vector<ClientRecord> ClientPresenceTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ClientRecord> records;
    records.reserve(m_clients.size());
    for (const auto& entry : m_clients) {
        records.push_back(entry.second);
    }
    return records;
}

void ClientPresenceTracker::reconcile() {
    std::lock_guard<std::mutex> dispatchLock(m_dispatchMutex);
    bool fireGone = false;
    bool fireConnected = false;
    std::string firstBlockingId;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const size_t blocking = blockingCountLocked();
        if (blocking == 0 && !m_goneSignalled) {
            fireGone = true;
            m_goneSignalled = true;
        } else if (blocking > 0 && m_goneSignalled) {
            for (const auto& entry : m_clients) {
                if (blocksAutonomyLocked(entry.second)) {
                    firstBlockingId = entry.first;
                    break;
                }
            }
            fireConnected = true;
            m_goneSignalled = false;
        }
    }

    if (fireGone) {
        if (m_verboseLogging) {
            std::cout << "[CLIENTS] reconcile: no remote clients present" << std::endl;
        }
        dispatch(PresenceEvent::AllRemoteClientsGone, std::string());
    }
    if (fireConnected) {
        if (m_verboseLogging) {
            std::cout << "[CLIENTS] reconcile: remote client present" << std::endl;
        }
        dispatch(PresenceEvent::RemoteClientConnected, firstBlockingId);
    }
}

void ClientPresenceTracker::dispatch(PresenceEvent event, const std::string& clientId) {
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listenerMutex);
        for (const auto& entry : m_listeners) {
            if (entry.second.event == event) {
                listeners.push_back(entry.second.listener);
            }
        }
    }

    for (const Listener& listener : listeners) {
        try {
            listener(clientId);
        } catch (const std::exception& ex) {
            std::cerr << "[CLIENTS] " << presenceEventName(event) << " listener failed: " << ex.what()
                      << std::endl;
        }
    }
}

void ClientPresenceTracker::startMonitoring(std::chrono::milliseconds interval) {
    if (m_monitorRunning.exchange(true)) {
        return;
    }
    if (interval.count() <= 0) {
        interval = std::chrono::milliseconds(5000);
    }

    m_monitorThread = std::thread([this, interval]() {
        while (m_monitorRunning) {
            try {
                reconcile();
            } catch (const std::exception& ex) {
                std::cerr << "[CLIENTS] reconcile failed: " << ex.what() << std::endl;
            }
            std::unique_lock<std::mutex> lock(m_monitorMutex);
            m_monitorCv.wait_for(lock, interval, [this]() { return !m_monitorRunning.load(); });
        }
    });

    if (m_verboseLogging) {
        std::cout << "[CLIENTS] monitoring every " << interval.count() << " ms" << std::endl;
    }
}

void ClientPresenceTracker::stopMonitoring() {
    {
        std::lock_guard<std::mutex> lock(m_monitorMutex);
        if (!m_monitorRunning.exchange(false)) {
            return;
        }
    }
    m_monitorCv.notify_all();
    if (m_monitorThread.joinable()) {
        m_monitorThread.join();
    }
}
