#ifndef ORCHESTRATOR_H
#define ORCHESTRATOR_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "client_presence.h"
#include "decoding_session.h"
#include "frequency_profile.h"
#include "receiver_tuner.h"
#include "signal_recorder.h"

// IDLE is reserved for "no scan, no client" and is never entered today.
enum class OrchestratorState { Manual, Idle, Auto };

const char *orchestratorStateName(OrchestratorState state);

struct OrchestratorOptions {
  bool enabled = true;
  std::chrono::milliseconds transitionDelay{2000};
  std::chrono::milliseconds tuneRetry{5000};
  std::chrono::milliseconds errorBackoff{5000};
  std::chrono::milliseconds dwellTick{1000};
  bool enableRecording = true;
  bool enableDecoders = true;
  // 0 keeps retrying the same entry forever.
  int maxTuneFailures = 0;
};

struct OrchestratorStatus {
  bool enabled = false;
  bool running = false;
  OrchestratorState state = OrchestratorState::Manual;
  std::optional<FrequencyProfile> currentFrequency;
  size_t currentIndex = 0;
  size_t totalFrequencies = 0;
  uint64_t advances = 0;
  int consecutiveTuneFailures = 0;
  uint64_t skippedFrequencies = 0;
  bool hasClientPresence = false;
  bool hasReceiver = false;
  bool hasDecoders = false;
  bool hasRecorder = false;
};

// Scans the frequency list while no remote client is connected and hands the
// receiver back, with its previous settings, as soon as one connects.
// Transitions and scan steps are serialized by m_controlMutex; the state,
// index and counters read by status queries live under m_stateMutex. Every
// entry to AUTO starts a new epoch, and a scan step only acts while the epoch
// it started in is still current.
class Orchestrator {
public:
  Orchestrator(std::vector<FrequencyProfile> frequencies,
               OrchestratorOptions options, ReceiverTuner &tuner,
               ClientPresenceTracker *presence,
               DecodingSessionManager *decoders, SignalRecorder *recorder,
               bool verboseLogging);
  ~Orchestrator();

  Orchestrator(const Orchestrator &) = delete;
  Orchestrator &operator=(const Orchestrator &) = delete;

  bool start();
  // Ends the scan loop, which leaves AUTO on its way out, and waits for it.
  // After the timeout the loop is left to finish on its own; the destructor
  // joins it.
  void stop(std::chrono::milliseconds timeout = std::chrono::seconds(10));

  bool enterAutoMode();
  // No-op unless currently in AUTO.
  bool exitAutoMode();

  // While suspended AUTO is refused. suspend() leaves AUTO; resume() enters
  // it again when no remote client is connected (without presence tracking,
  // when it was in AUTO at suspend time).
  bool suspend();
  void resume();
  bool isSuspended() const { return m_suspended; }

  OrchestratorState state() const;
  size_t currentIndex() const;
  uint64_t advanceCount() const;
  bool isRunning() const { return m_running; }
  OrchestratorStatus getStatus() const;

private:
  void runLoop();
  void runIteration();
  // Returns false if the wait was cut short by stop() or by the epoch ending.
  bool waitFor(std::chrono::milliseconds duration, uint64_t epoch);
  void backoff(std::chrono::milliseconds duration);
  bool inAuto() const;
  bool inEpoch(uint64_t epoch) const;

  const std::vector<FrequencyProfile> m_frequencies;
  const OrchestratorOptions m_options;
  ReceiverTuner &m_tuner;
  ClientPresenceTracker *m_presence;
  DecodingSessionManager *m_decoders;
  SignalRecorder *m_recorder;
  const bool m_verboseLogging;

  std::mutex m_controlMutex;
  std::optional<TuningSettings> m_savedSettings;
  bool m_recorderWasArmed = true;
  std::atomic<bool> m_suspended{false};
  bool m_resumeToAuto = false;

  mutable std::mutex m_stateMutex;
  std::condition_variable m_stateCv;
  OrchestratorState m_state = OrchestratorState::Manual;
  size_t m_index = 0;
  std::optional<FrequencyProfile> m_current;
  uint64_t m_advances = 0;
  int m_consecutiveFailures = 0;
  uint64_t m_skipped = 0;
  uint64_t m_epoch = 0;
  bool m_loopDone = true;

  std::atomic<bool> m_running;
  std::thread m_thread;
  ClientPresenceTracker::ListenerHandle m_goneListener = 0;
  ClientPresenceTracker::ListenerHandle m_connectedListener = 0;
};

#endif
