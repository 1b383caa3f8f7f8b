#ifndef RECEIVER_CONTROL_H
#define RECEIVER_CONTROL_H

#include <cstdint>
#include <optional>
#include <string>

#include "frequency_profile.h"

enum class ControlResult { Ok = 0, Failed = 1, Unsupported = 2 };

const char *controlResultName(ControlResult result);

// Capability interface for the live receiver. A backend that cannot perform
// an operation returns Unsupported instead of pretending to succeed.
class ReceiverControl {
public:
  virtual ~ReceiverControl() = default;

  virtual const char *name() const = 0;
  virtual ControlResult setFrequency(uint64_t frequencyHz) = 0;
  virtual ControlResult setMode(const std::string &mode) = 0;
  virtual ControlResult setSquelch(float level) = 0;
  virtual ControlResult setBandwidth(uint32_t bandwidthHz) = 0;
  virtual std::optional<TuningSettings> currentSettings() = 0;

  // Hooks for suppressing manual commands upstream while scanning.
  virtual void beginAutonomousControl() {}
  virtual void endAutonomousControl() {}
};

#endif
