#ifndef RETENTION_H
#define RETENTION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>

class SignalRecorder;

// Deletes recordings older than the retention window. The staging file of a
// capture still being written is never touched.
class RetentionSweeper {
public:
  RetentionSweeper(std::string directory, int retentionDays,
                   std::chrono::milliseconds interval,
                   const SignalRecorder *recorder, bool verboseLogging);
  ~RetentionSweeper();

  RetentionSweeper(const RetentionSweeper &) = delete;
  RetentionSweeper &operator=(const RetentionSweeper &) = delete;

  // Returns the number of files deleted.
  size_t sweep(std::chrono::system_clock::time_point now =
                   std::chrono::system_clock::now());
  void start();
  void stop();

private:
  std::string m_directory;
  std::chrono::hours m_maxAge;
  std::chrono::milliseconds m_interval;
  const SignalRecorder *m_recorder;
  const bool m_verboseLogging;

  std::atomic<bool> m_running;
  std::thread m_thread;
  std::mutex m_mutex;
  std::condition_variable m_cv;
};

#endif
