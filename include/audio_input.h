#ifndef AUDIO_INPUT_H
#define AUDIO_INPUT_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#if defined(AUTOSCAN_HAS_PORTAUDIO)
#include <portaudio.h>
#endif

#include "dsp/liquid_primitives.h"

class SignalRecorder;

// Blocking source of mono normalized audio.
class AudioSource {
public:
  virtual ~AudioSource() = default;
  virtual const char *name() const = 0;
  virtual bool open() = 0;
  // Fills block with up to its capacity. Returns false on end of stream or a
  // hard error; an empty block with true means "nothing yet, try again".
  virtual bool read(std::vector<float> &block) = 0;
  virtual void close() = 0;
};

// Signed 16-bit little-endian mono PCM from a file descriptor (stdin by
// default), e.g. the output of `rtl_fm -M fm -s 12k -`.
class PcmStreamSource : public AudioSource {
public:
  static constexpr float kInt16Scale = 32768.0f;

  explicit PcmStreamSource(int fd = 0, size_t blockSamples = 1200,
                           int pollTimeoutMs = 200);

  const char *name() const override { return "stdin"; }
  bool open() override;
  bool read(std::vector<float> &block) override;
  void close() override {}

private:
  int m_fd;
  size_t m_blockSamples;
  int m_pollTimeoutMs;
  std::vector<uint8_t> m_pending;
};

#if defined(AUTOSCAN_HAS_PORTAUDIO)
class PortAudioSource : public AudioSource {
public:
  PortAudioSource(std::string deviceSelector, uint32_t sampleRate,
                  size_t blockSamples, bool verboseLogging);
  ~PortAudioSource() override;

  const char *name() const override { return "portaudio"; }
  bool open() override;
  bool read(std::vector<float> &block) override;
  void close() override;

private:
  std::string m_deviceSelector;
  uint32_t m_sampleRate;
  size_t m_blockSamples;
  bool m_verboseLogging;
  PaStream *m_stream;
  bool m_initialized;
};
#endif

// Prints capture devices. Returns false if no capture backend is available.
bool listCaptureDevices();

// Pumps blocks from a source into the recorder on its own thread.
class AudioIngest {
public:
  using FrequencyProvider = std::function<std::optional<uint64_t>()>;

  AudioIngest(AudioSource &source, SignalRecorder &recorder,
              FrequencyProvider frequency, size_t blockSamples, bool dcBlock,
              bool verboseLogging);
  ~AudioIngest();

  AudioIngest(const AudioIngest &) = delete;
  AudioIngest &operator=(const AudioIngest &) = delete;

  bool start();
  void stop();
  bool isRunning() const { return m_running; }
  // Set once the source reports end of stream.
  bool finished() const { return m_finished; }
  uint64_t blocksDelivered() const { return m_blocks; }

  // Processes one block on the calling thread.
  void process(std::vector<float> &block);

private:
  void run();

  AudioSource &m_source;
  SignalRecorder &m_recorder;
  FrequencyProvider m_frequency;
  size_t m_blockSamples;
  bool m_verboseLogging;
  autoscan::dsp::liquid::DCBlocker m_dcBlocker;

  std::atomic<bool> m_running;
  std::atomic<bool> m_finished;
  std::atomic<uint64_t> m_blocks;
  std::thread m_thread;
};

#endif
