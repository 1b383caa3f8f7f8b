#ifndef RTL_TCP_CONTROL_H
#define RTL_TCP_CONTROL_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "receiver_control.h"

// Frequency-only backend for an rtl_tcp server. The server streams IQ to
// every connection, so a drain thread discards it to keep the server from
// stalling on a full socket.
class RtlTcpControl : public ReceiverControl {
public:
  RtlTcpControl(const std::string &host, uint16_t port, bool verboseLogging);
  ~RtlTcpControl() override;

  bool connect();
  void disconnect();
  bool isConnected() const { return m_connected; }

  const char *name() const override { return "rtl_tcp"; }
  ControlResult setFrequency(uint64_t frequencyHz) override;
  ControlResult setMode(const std::string &mode) override;
  ControlResult setSquelch(float level) override;
  ControlResult setBandwidth(uint32_t bandwidthHz) override;
  std::optional<TuningSettings> currentSettings() override;

  // Wire encoding of one rtl_tcp command: opcode plus big-endian parameter.
  static void encodeCommand(uint8_t cmd, uint32_t param, uint8_t out[5]);

private:
  bool sendCommand(uint8_t cmd, uint32_t param);
  void runDrain();

  std::string m_host;
  uint16_t m_port;
  const bool m_verboseLogging;
  std::mutex m_socketMutex;
  int m_socket;
  std::atomic<bool> m_connected;
  std::atomic<uint64_t> m_frequency;
  std::thread m_drainThread;
};

#endif
