#ifndef RECORDING_SCHEDULER_H
#define RECORDING_SCHEDULER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "receiver_control.h"

class Orchestrator;
class ReceiverTuner;
class SignalRecorder;

// Local wall-clock position within the week. weekday 0 is Monday.
struct ScheduleTime {
  int weekday = 0;
  int secondOfDay = 0;
};

ScheduleTime toScheduleTime(std::chrono::system_clock::time_point when);

// Parses "HH:MM" into minutes after midnight.
bool parseClockTime(const std::string &text, int &minuteOfDay);

struct ScheduleEntry {
  std::string id = "unnamed";
  std::string name = "Unnamed Recording";
  uint64_t frequencyHz = 0;
  std::string mode = "USB";
  bool enabled = true;
  std::vector<int> daysOfWeek = {0, 1, 2, 3, 4, 5, 6};
  int startMinute = 0;
  int durationMinutes = 60;

  // A window that runs past midnight belongs to the day it started on.
  bool isActiveAt(const ScheduleTime &now) const;
  // 0 outside any window.
  int64_t secondsRemaining(const ScheduleTime &now) const;

private:
  bool runsOn(int weekday) const;
};

// Reads {"schedules": [...]}. Entries with a zero frequency, a bad day, an
// unparsable start time or a duration outside 1..1440 minutes are skipped.
bool loadScheduleFile(const std::string &path,
                      std::vector<ScheduleEntry> &entries);
std::vector<ScheduleEntry> parseSchedules(const nlohmann::json &doc);

// Takes the receiver for fixed time windows. While a window is open the scan
// orchestrator is suspended, the receiver is tuned to the entry and the
// recorder writes a scheduled capture; afterwards the receiver settings are
// restored and the orchestrator resumed. One window runs at a time; an entry
// whose window opens while another is running waits for it to end.
class RecordingScheduler {
public:
  using Clock = std::function<ScheduleTime()>;

  RecordingScheduler(std::vector<ScheduleEntry> entries, ReceiverTuner *tuner,
                     SignalRecorder *recorder, Orchestrator *orchestrator,
                     std::chrono::milliseconds interval, bool verboseLogging,
                     Clock clock = Clock());
  ~RecordingScheduler();

  RecordingScheduler(const RecordingScheduler &) = delete;
  RecordingScheduler &operator=(const RecordingScheduler &) = delete;

  void checkOnce();
  void start();
  // Closes an open window before returning.
  void stop();

  std::optional<std::string> activeId() const;
  uint64_t windowsStarted() const;
  nlohmann::json statusJson() const;

private:
  bool beginWindowLocked(size_t index, const ScheduleTime &now);
  void endWindowLocked(const char *reason);
  void releaseReceiverLocked();

  const std::vector<ScheduleEntry> m_entries;
  ReceiverTuner *m_tuner;
  SignalRecorder *m_recorder;
  Orchestrator *m_orchestrator;
  const std::chrono::milliseconds m_interval;
  const bool m_verboseLogging;
  Clock m_clock;

  std::mutex m_controlMutex;
  std::optional<TuningSettings> m_savedSettings;

  mutable std::mutex m_stateMutex;
  std::optional<size_t> m_active;
  uint64_t m_windowsStarted = 0;

  std::atomic<bool> m_running;
  std::thread m_thread;
  std::mutex m_waitMutex;
  std::condition_variable m_cv;
};

#endif
