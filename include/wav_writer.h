#ifndef WAV_WRITER_H
#define WAV_WRITER_H

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

// Mono 16-bit PCM RIFF/WAVE writer used for staging captures. The header is
// rewritten with the final sizes on close(). The payload is capped at
// kMaxDataBytes so the 32-bit RIFF sizes never wrap.
class WavWriter {
public:
  static constexpr int CHANNELS = 1;
  static constexpr int BITS_PER_SAMPLE = 16;
  static constexpr int BYTES_PER_FRAME = CHANNELS * BITS_PER_SAMPLE / 8;
  static constexpr float kInt16Max = 32767.0f;
  static constexpr uint64_t kMaxDataBytes = 0xFFFFFFFFull - 36 - 1;

  WavWriter() = default;
  ~WavWriter();

  WavWriter(const WavWriter &) = delete;
  WavWriter &operator=(const WavWriter &) = delete;

  bool open(const std::string &path, uint32_t sampleRate);
  // Fails without writing anything if the payload would exceed kMaxDataBytes.
  bool write(const float *samples, size_t count);
  bool close();

  bool isOpen() const { return m_handle != nullptr; }
  const std::string &path() const { return m_path; }
  uint32_t sampleRate() const { return m_sampleRate; }
  uint64_t dataBytes() const { return m_dataSize; }
  uint64_t framesWritten() const { return m_dataSize / BYTES_PER_FRAME; }

  // Duration implied by a PCM payload of this many bytes.
  static double durationSeconds(uint64_t dataBytes, uint32_t sampleRate);

private:
  bool writeHeader();

  FILE *m_handle = nullptr;
  std::string m_path;
  uint32_t m_sampleRate = 0;
  uint64_t m_dataSize = 0;
};

#endif
