#ifndef RIGCTL_CONTROL_H
#define RIGCTL_CONTROL_H

#include <cstdint>
#include <mutex>
#include <string>

#include "receiver_control.h"

// Backend for a Hamlib rigctld daemon speaking its default text protocol.
class RigctlControl : public ReceiverControl {
public:
  RigctlControl(const std::string &host, uint16_t port, bool verboseLogging);
  ~RigctlControl() override;

  bool connect();
  void disconnect();

  const char *name() const override { return "rigctl"; }
  ControlResult setFrequency(uint64_t frequencyHz) override;
  ControlResult setMode(const std::string &mode) override;
  ControlResult setSquelch(float level) override;
  ControlResult setBandwidth(uint32_t bandwidthHz) override;
  std::optional<TuningSettings> currentSettings() override;

  // Scan-list mode names to Hamlib mode tokens (NFM -> FM, WFM stays WFM).
  static std::string toHamlibMode(const std::string &mode);
  // "RPRT <n>" reply code to a result. Not-implemented and not-available
  // errors map to Unsupported.
  static ControlResult parseReport(const std::string &reply);

private:
  bool ensureConnectedLocked();
  ControlResult transactLocked(const std::string &command);
  bool queryLocked(const std::string &command, std::string &reply,
                   std::string *second = nullptr);

  std::string m_host;
  uint16_t m_port;
  const bool m_verboseLogging;
  std::mutex m_mutex;
  int m_socket;
  std::string m_lastMode;
};

#endif
