#ifndef FREQUENCY_PROFILE_H
#define FREQUENCY_PROFILE_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// One entry of the scan list. Loaded once and never mutated afterwards.
struct FrequencyProfile {
  uint64_t frequency_hz = 0;
  std::string mode = "NFM";
  float squelch = 0.0f;
  uint32_t bandwidth_hz = 12500;
  uint32_t dwell_seconds = 60;
  std::string label;

  bool valid() const { return frequency_hz > 0 && dwell_seconds > 0; }
};

// Receiver settings as read back from a backend. Fields a backend cannot
// report stay empty and are skipped on restore.
struct TuningSettings {
  uint64_t frequencyHz = 0;
  std::optional<std::string> mode;
  std::optional<float> squelch;
  std::optional<uint32_t> bandwidthHz;
};

std::vector<FrequencyProfile> defaultFrequencyProfiles();
std::string formatFrequencyMHz(uint64_t frequencyHz);

#endif
