#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "client_presence.h"

namespace {
AddressMatcher defaultMatcher() {
    return AddressMatcher({"127.0.0.1", "::1", "192.168.0.0/16"});
}

struct EventLog {
    std::vector<std::pair<PresenceEvent, std::string>> events;

    void attach(ClientPresenceTracker& tracker) {
        for (PresenceEvent event : {PresenceEvent::RemoteClientConnected, PresenceEvent::RemoteClientDisconnected,
                                    PresenceEvent::AllRemoteClientsGone}) {
            tracker.addListener(event, [this, event](const std::string& id) { events.emplace_back(event, id); });
        }
    }

    size_t count(PresenceEvent event) const {
        size_t n = 0;
        for (const auto& entry : events) {
            if (entry.first == event) {
                n++;
            }
        }
        return n;
    }
};
}  // namespace

TEST_CASE("Remote connect and disconnect fire edge events", "[presence]") {
    ClientPresenceTracker tracker(defaultMatcher(), false, false);
    EventLog log;
    log.attach(tracker);

    tracker.clientConnected("a", "203.0.113.5", "test");
    REQUIRE(tracker.hasRemoteClients());
    REQUIRE(log.count(PresenceEvent::RemoteClientConnected) == 1);

    tracker.clientConnected("b", "198.51.100.7", "test");
    REQUIRE(log.count(PresenceEvent::RemoteClientConnected) == 2);

    tracker.clientDisconnected("a");
    REQUIRE(tracker.hasRemoteClients());
    REQUIRE(log.count(PresenceEvent::AllRemoteClientsGone) == 0);

    tracker.clientDisconnected("b");
    REQUIRE_FALSE(tracker.hasRemoteClients());
    REQUIRE(log.count(PresenceEvent::RemoteClientDisconnected) == 2);
    REQUIRE(log.count(PresenceEvent::AllRemoteClientsGone) == 1);
    REQUIRE(log.events.back().second == "b");
}

TEST_CASE("Local clients do not block automatic mode by default", "[presence]") {
    ClientPresenceTracker tracker(defaultMatcher(), false, false);
    EventLog log;
    log.attach(tracker);

    tracker.clientConnected("local", "192.168.1.10", "test");
    REQUIRE_FALSE(tracker.hasRemoteClients());
    REQUIRE(log.events.empty());

    const ClientCounts counts = tracker.getCounts();
    REQUIRE(counts.total == 1);
    REQUIRE(counts.local == 1);
    REQUIRE(counts.remote == 0);

    tracker.clientDisconnected("local");
    REQUIRE(log.events.empty());
}

TEST_CASE("Local clients count when configured to", "[presence]") {
    ClientPresenceTracker tracker(defaultMatcher(), true, false);
    EventLog log;
    log.attach(tracker);

    tracker.clientConnected("local", "127.0.0.1", "test");
    REQUIRE(tracker.hasRemoteClients());
    REQUIRE(log.count(PresenceEvent::RemoteClientConnected) == 1);
    tracker.clientDisconnected("local");
    REQUIRE(log.count(PresenceEvent::AllRemoteClientsGone) == 1);
}

TEST_CASE("Unparsable addresses are treated as remote", "[presence]") {
    ClientPresenceTracker tracker(defaultMatcher(), false, false);
    tracker.clientConnected("odd", "not-an-ip", "test");
    REQUIRE(tracker.hasRemoteClients());
}

TEST_CASE("Unknown disconnects are ignored", "[presence]") {
    ClientPresenceTracker tracker(defaultMatcher(), false, false);
    EventLog log;
    log.attach(tracker);
    tracker.clientDisconnected("ghost");
    REQUIRE(log.events.empty());
}

TEST_CASE("A throwing listener does not stop other listeners", "[presence]") {
    ClientPresenceTracker tracker(defaultMatcher(), false, false);
    int calls = 0;
    tracker.addListener(PresenceEvent::RemoteClientConnected,
                        [](const std::string&) { throw std::runtime_error("listener failure"); });
    tracker.addListener(PresenceEvent::RemoteClientConnected, [&calls](const std::string&) { calls++; });

    tracker.clientConnected("a", "203.0.113.5", "test");
    REQUIRE(calls == 1);
    REQUIRE(tracker.hasRemoteClients());
}

TEST_CASE("Removed listeners are no longer called", "[presence]") {
    ClientPresenceTracker tracker(defaultMatcher(), false, false);
    int calls = 0;
    const auto handle =
        tracker.addListener(PresenceEvent::RemoteClientConnected, [&calls](const std::string&) { calls++; });
    tracker.clientConnected("a", "203.0.113.5", "test");
    tracker.removeListener(handle);
    tracker.clientConnected("b", "203.0.113.6", "test");
    REQUIRE(calls == 1);
}

TEST_CASE("Reconcile reports an empty tracker once", "[presence]") {
    ClientPresenceTracker tracker(defaultMatcher(), false, false);
    EventLog log;
    log.attach(tracker);

    tracker.reconcile();
    REQUIRE(log.count(PresenceEvent::AllRemoteClientsGone) == 1);
    tracker.reconcile();
    REQUIRE(log.count(PresenceEvent::AllRemoteClientsGone) == 1);

    tracker.clientConnected("a", "203.0.113.5", "test");
    tracker.reconcile();
    REQUIRE(log.count(PresenceEvent::RemoteClientConnected) == 1);

    tracker.clientDisconnected("a");
    REQUIRE(log.count(PresenceEvent::AllRemoteClientsGone) == 2);
    tracker.reconcile();
    REQUIRE(log.count(PresenceEvent::AllRemoteClientsGone) == 2);
}

TEST_CASE("Background monitoring runs reconcile", "[presence]") {
    ClientPresenceTracker tracker(defaultMatcher(), false, false);
    std::atomic<int> gone(0);
    tracker.addListener(PresenceEvent::AllRemoteClientsGone, [&gone](const std::string&) { gone++; });
    tracker.startMonitoring(std::chrono::milliseconds(20));
    for (int i = 0; i < 100 && gone.load() == 0; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    tracker.stopMonitoring();
    REQUIRE(gone.load() == 1);
}

TEST_CASE("hasRemoteClients matches the tracked remote set", "[presence]") {
    ClientPresenceTracker tracker(defaultMatcher(), false, false);
    const std::vector<std::string> addresses = {"127.0.0.1", "192.168.3.3", "203.0.113.1", "198.51.100.2",
                                                "::1", "2001:db8::5", "garbage"};
    AddressMatcher reference = defaultMatcher();
    std::mt19937 rng(1234);
    std::set<std::string> remoteIds;
    std::set<std::string> allIds;

    for (int step = 0; step < 2000; step++) {
        const std::string id = "c" + std::to_string(rng() % 12);
        if (rng() % 2 == 0) {
            const std::string& address = addresses[rng() % addresses.size()];
            tracker.clientConnected(id, address, "fuzz");
            allIds.insert(id);
            if (reference.isLocal(address)) {
                remoteIds.erase(id);
            } else {
                remoteIds.insert(id);
            }
        } else {
            tracker.clientDisconnected(id);
            allIds.erase(id);
            remoteIds.erase(id);
        }

        REQUIRE(tracker.hasRemoteClients() == !remoteIds.empty());
        const ClientCounts counts = tracker.getCounts();
        REQUIRE(counts.total == allIds.size());
        REQUIRE(counts.remote == remoteIds.size());
    }
}
