#ifndef CLIENT_PRESENCE_H
#define CLIENT_PRESENCE_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "address_matcher.h"

struct ClientRecord {
  std::string id;
  std::string address;
  std::string userAgent;
  std::chrono::system_clock::time_point connectedAt;
  std::chrono::system_clock::time_point lastSeen;
};

struct ClientCounts {
  size_t total = 0;
  size_t local = 0;
  size_t remote = 0;
};

enum class PresenceEvent {
  RemoteClientConnected,
  RemoteClientDisconnected,
  AllRemoteClientsGone
};

const char *presenceEventName(PresenceEvent event);

// Tracks connected clients and raises edge-triggered events when a remote
// client appears or the last one leaves. Listeners run on the calling thread
// after the client map lock is released and must not call back into the
// tracker's mutating methods.
class ClientPresenceTracker {
public:
  using Listener = std::function<void(const std::string &clientId)>;
  using ListenerHandle = uint64_t;

  ClientPresenceTracker(AddressMatcher matcher, bool considerLocalClients,
                        bool verboseLogging);
  ~ClientPresenceTracker();

  ClientPresenceTracker(const ClientPresenceTracker &) = delete;
  ClientPresenceTracker &operator=(const ClientPresenceTracker &) = delete;

  ListenerHandle addListener(PresenceEvent event, Listener listener);
  // Blocks until any dispatch in progress has finished.
  void removeListener(ListenerHandle handle);

  void clientConnected(const std::string &id, const std::string &address,
                       const std::string &userAgent);
  void clientDisconnected(const std::string &id);
  void clientActivity(const std::string &id);

  bool hasRemoteClients() const;
  ClientCounts getCounts() const;
  std::vector<ClientRecord> snapshot() const;
  bool isLocalAddress(const std::string &address) const;
  bool considerLocalClients() const { return m_considerLocalClients; }

  // One reconciliation pass. Also run periodically by startMonitoring().
  void reconcile();
  void startMonitoring(std::chrono::milliseconds interval);
  void stopMonitoring();

private:
  bool blocksAutonomyLocked(const ClientRecord &record) const;
  size_t blockingCountLocked() const;
  void dispatch(PresenceEvent event, const std::string &clientId);

  AddressMatcher m_matcher;
  const bool m_considerLocalClients;
  const bool m_verboseLogging;

  mutable std::mutex m_mutex;
  std::map<std::string, ClientRecord> m_clients;
  bool m_goneSignalled = false;

  std::mutex m_dispatchMutex;
  std::mutex m_listenerMutex;
  struct ListenerEntry {
    PresenceEvent event;
    Listener listener;
  };
  std::map<ListenerHandle, ListenerEntry> m_listeners;
  ListenerHandle m_nextListener = 1;

  std::atomic<bool> m_monitorRunning;
  std::thread m_monitorThread;
  std::mutex m_monitorMutex;
  std::condition_variable m_monitorCv;
};

#endif
