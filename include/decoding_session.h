#ifndef DECODING_SESSION_H
#define DECODING_SESSION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

struct DecodingSessionOptions {
  std::string outputDir = "decodings";
  size_t bufferSize = 100;
  std::chrono::milliseconds flushInterval{5000};
  bool saveJson = true;
  bool saveCsv = false;
  std::vector<std::string> enabledDecoders;
};

// Bounded-lifetime store for decoded protocol events. Each session gets its
// own directory with session.json, decodings.json and/or decodings.csv and,
// once stopped, statistics.json.
class DecodingSessionManager {
public:
  DecodingSessionManager(DecodingSessionOptions options, bool verboseLogging);
  ~DecodingSessionManager();

  DecodingSessionManager(const DecodingSessionManager &) = delete;
  DecodingSessionManager &operator=(const DecodingSessionManager &) = delete;

  // Returns the new session id, or an empty string if the session directory
  // could not be created.
  std::string startSession(uint64_t frequencyHz, const std::string &mode);
  bool addDecoding(const std::string &decoderType, nlohmann::json fields);
  bool flush();
  void stopSession();

  bool isActive() const;
  std::optional<std::string> currentSessionId() const;
  std::string sessionDirectory() const;
  nlohmann::json getStatistics() const;

  void startFlusher();
  void stopFlusher();

  static std::string csvEscape(const std::string &value);

private:
  struct Session {
    std::string id;
    std::string directory;
    std::string startTime;
    uint64_t frequencyHz = 0;
    std::string mode;
    std::vector<nlohmann::json> buffer;
    uint64_t total = 0;
    std::map<std::string, uint64_t> byDecoder;
  };

  bool flushLocked();
  bool appendJsonLocked(const std::vector<nlohmann::json> &batch);
  bool appendCsvLocked(const std::vector<nlohmann::json> &batch);
  nlohmann::json statisticsLocked() const;
  static std::string generateSessionId();

  DecodingSessionOptions m_options;
  const bool m_verboseLogging;

  mutable std::mutex m_mutex;
  std::optional<Session> m_session;

  std::atomic<bool> m_flusherRunning;
  std::thread m_flusherThread;
  std::mutex m_flusherMutex;
  std::condition_variable m_flusherCv;
};

std::string isoTimestampUtc(std::chrono::system_clock::time_point when);

#endif
