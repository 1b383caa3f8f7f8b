#ifndef RECEIVER_TUNER_H
#define RECEIVER_TUNER_H

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "frequency_profile.h"
#include "receiver_control.h"

// Applies scan entries to a ReceiverControl. Only a frequency failure fails a
// tune; mode, squelch and bandwidth problems are logged and tolerated.
class ReceiverTuner {
public:
  ReceiverTuner(ReceiverControl &control, bool verboseLogging);

  bool tune(uint64_t frequencyHz, const std::string &mode, float squelch,
            uint32_t bandwidthHz);
  bool tune(const FrequencyProfile &profile);

  std::optional<TuningSettings> snapshot();
  bool restore(const TuningSettings &settings);

  void beginAutonomousControl();
  void endAutonomousControl();
  bool isAutonomous() const { return m_autonomous; }

  // Last frequency successfully applied through this tuner, 0 if none.
  uint64_t currentFrequency() const { return m_currentFrequency; }
  const char *backendName() const { return m_control.name(); }

private:
  ReceiverControl &m_control;
  const bool m_verboseLogging;
  std::mutex m_mutex;
  std::atomic<bool> m_autonomous;
  std::atomic<uint64_t> m_currentFrequency;
};

#endif
