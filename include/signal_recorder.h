#ifndef SIGNAL_RECORDER_H
#define SIGNAL_RECORDER_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "deadline_timer.h"
#include "dsp/energy.h"
#include "recording_notifier.h"
#include "transcoder.h"
#include "wav_writer.h"

struct RecorderOptions {
  std::string outputDir = "recordings";
  std::string outputExtension = "mp3";
  uint32_t sampleRate = 12000;
  float rmsThreshold = 0.02f;
  double freqDwellSeconds = 2.0;
  double silenceTimeoutSeconds = 3.0;
  double minDurationSeconds = 5.0;
  std::chrono::milliseconds drainTimeout{std::chrono::seconds(300)};
  // A capture reaching this many PCM bytes is closed and a new one opened.
  uint64_t maxCaptureBytes = WavWriter::kMaxDataBytes;
};

struct RecorderStatus {
  bool armed = false;
  bool recording = false;
  std::optional<double> durationSeconds;
  std::optional<uint64_t> frequencyHz;
  std::string outputPath;
  // Set while a scheduled capture is running.
  std::string scheduleId;
  float lastRms = 0.0f;
  double levelDbfs = -120.0;
  uint64_t capturesStarted = 0;
  uint64_t capturesKept = 0;
  uint64_t capturesDiscarded = 0;
};

// Turns a continuous mono audio stream into discrete recordings. A capture
// starts on the first chunk above the RMS threshold once the frequency has
// been stable long enough, ends after a silence timeout or on a frequency
// change, and is handed to the conversion pipeline if it is long enough.
// At most one capture exists at a time; every start/stop decision is made
// under m_mutex. Start/stop notifications are published after m_mutex is
// released, so observers may query the recorder.
class SignalRecorder {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  SignalRecorder(RecorderOptions options,
                 std::shared_ptr<ConversionPipeline> pipeline,
                 RecordingNotifier *notifier, bool verboseLogging,
                 Clock clock = Clock());
  ~SignalRecorder();

  SignalRecorder(const SignalRecorder &) = delete;
  SignalRecorder &operator=(const SignalRecorder &) = delete;

  // Called from the audio thread for every delivered buffer. An empty
  // frequency means "unchanged since the previous chunk".
  void submitAudioChunk(const float *samples, size_t count,
                        std::optional<uint64_t> frequencyHz);

  RecorderStatus getStatus() const;

  void setArmed(bool armed);
  bool isArmed() const { return m_armed; }

  // Ends an ordinary capture. A scheduled capture is left running.
  bool stopCapture(const char *reason);

  // Records every chunk, whatever its level, until stopScheduledCapture().
  // The dwell, arming and silence rules do not apply meanwhile. An ordinary
  // capture in progress is finalized first.
  bool startScheduledCapture(const std::string &scheduleId,
                             uint64_t frequencyHz);
  bool stopScheduledCapture();

  // Silence deadline handler. Re-checks the deadline under the lock before
  // stopping, so a signal chunk that raced the timer wins.
  void checkSilence();
  // Finalizes any open capture with the normal duration policy, then waits
  // for queued conversions.
  void shutdown();

  bool isActiveStagingFile(const std::string &path) const;
  const RecorderOptions &options() const { return m_options; }

  static std::string
  buildBaseName(std::optional<uint64_t> frequencyHz,
                std::chrono::system_clock::time_point when);

private:
  using TimePoint = std::chrono::steady_clock::time_point;

  struct RecordingSession {
    std::string outputPath;
    std::string stagingPath;
    std::optional<uint64_t> frequencyHz;
    TimePoint startedAt;
    TimePoint lastSignalAt;
    WavWriter writer;
  };

  struct ScheduledCapture {
    std::string id;
    uint64_t frequencyHz = 0;
  };

  struct DwellTracker {
    bool started = false;
    std::optional<uint64_t> lastSeenFrequency;
    TimePoint stableSince;
  };

  std::unique_ptr<RecordingSession>
  openSessionLocked(TimePoint now, std::vector<RecordingStatusEvent> &events);
  std::unique_ptr<RecordingSession>
  detachSessionLocked(const char *reason,
                      std::vector<RecordingStatusEvent> &events);
  void publish(const std::vector<RecordingStatusEvent> &events);
  void finalizeCapture(std::unique_ptr<RecordingSession> session,
                       const char *reason, bool discard = false);
  void armSilenceTimerLocked();
  bool silenceExpiredLocked(TimePoint now) const;

  RecorderOptions m_options;
  std::shared_ptr<ConversionPipeline> m_pipeline;
  RecordingNotifier *m_notifier;
  const bool m_verboseLogging;
  Clock m_clock;
  uint64_t m_minFrames;

  mutable std::mutex m_mutex;
  std::unique_ptr<RecordingSession> m_session;
  DwellTracker m_dwell;
  std::optional<ScheduledCapture> m_scheduled;
  DeadlineTimer::Token m_silenceToken = DeadlineTimer::kInvalidToken;
  float m_lastRms = 0.0f;
  autoscan::dsp::LevelSmoother m_levelSmoother;
  uint64_t m_capturesStarted = 0;
  bool m_shutdown = false;

  std::mutex m_finalizeMutex;
  std::atomic<bool> m_armed;
  std::atomic<uint64_t> m_capturesKept;
  std::atomic<uint64_t> m_capturesDiscarded;

  DeadlineTimer m_timer;
};

#endif
