#ifndef STATUS_EXPORT_H
#define STATUS_EXPORT_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

class Orchestrator;
class ClientPresenceTracker;
class SignalRecorder;
class DecodingSessionManager;
class RecordingScheduler;

// Components present in this process. Any pointer may be null.
struct StatusSources {
  const Orchestrator *orchestrator = nullptr;
  const ClientPresenceTracker *presence = nullptr;
  const SignalRecorder *recorder = nullptr;
  const DecodingSessionManager *decoders = nullptr;
  const RecordingScheduler *scheduler = nullptr;
};

nlohmann::json buildStatusDocument(const StatusSources &sources);

// Periodically serializes a status document to a file. The document is
// written to <path>.tmp and renamed over <path>.
class StatusFileWriter {
public:
  using Builder = std::function<nlohmann::json()>;

  StatusFileWriter(std::string path, std::chrono::milliseconds interval,
                   Builder builder, bool verboseLogging);
  ~StatusFileWriter();

  StatusFileWriter(const StatusFileWriter &) = delete;
  StatusFileWriter &operator=(const StatusFileWriter &) = delete;

  bool writeOnce();
  void start();
  void stop();

  const std::string &path() const { return m_path; }

private:
  std::string m_path;
  std::chrono::milliseconds m_interval;
  Builder m_builder;
  const bool m_verboseLogging;

  std::atomic<bool> m_running;
  std::thread m_thread;
  std::mutex m_mutex;
  std::condition_variable m_cv;
};

#endif
