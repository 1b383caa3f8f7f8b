#ifndef TRANSCODER_H
#define TRANSCODER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class Transcoder {
public:
  virtual ~Transcoder() = default;
  // Produces outputPath from inputPath. Returns false on any failure,
  // including a timeout.
  virtual bool transcode(const std::string &inputPath,
                         const std::string &outputPath) = 0;
};

// Runs an external encoder built from a whitespace-separated template such as
// "ffmpeg -y -i {input} -b:a 128k {output}". Placeholders are substituted per
// argument, so paths containing spaces stay a single argument.
class CommandTranscoder : public Transcoder {
public:
  CommandTranscoder(std::string commandTemplate, std::chrono::seconds timeout,
                    bool verboseLogging);

  bool transcode(const std::string &inputPath,
                 const std::string &outputPath) override;

  static std::vector<std::string>
  expandArguments(const std::string &commandTemplate,
                  const std::string &inputPath, const std::string &outputPath);

private:
  std::string m_template;
  std::chrono::seconds m_timeout;
  bool m_verboseLogging;
};

struct ConversionJob {
  std::string stagingPath;
  std::string outputPath;
  uint64_t frequencyHz = 0;
  double durationSeconds = 0.0;
};

// Worker queue that converts finished captures off the audio path. On
// success the staging file is removed; on failure it is left in place.
class ConversionPipeline {
public:
  using CompletionCallback =
      std::function<void(const ConversionJob &job, bool success)>;

  ConversionPipeline(std::shared_ptr<Transcoder> transcoder,
                     bool verboseLogging);
  ~ConversionPipeline();

  ConversionPipeline(const ConversionPipeline &) = delete;
  ConversionPipeline &operator=(const ConversionPipeline &) = delete;

  bool submit(ConversionJob job);
  // Waits until every queued job has finished or the timeout passes.
  bool drain(std::chrono::milliseconds timeout);
  void stop();

  void setCompletionCallback(CompletionCallback cb);
  size_t pending() const;
  uint64_t completedCount() const { return m_completed; }
  uint64_t failedCount() const { return m_failed; }

private:
  void run();
  void process(const ConversionJob &job);

  std::shared_ptr<Transcoder> m_transcoder;
  const bool m_verboseLogging;

  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  std::condition_variable m_idleCv;
  std::deque<ConversionJob> m_queue;
  bool m_busy = false;
  bool m_running = true;
  std::thread m_worker;

  std::mutex m_callbackMutex;
  CompletionCallback m_completionCallback;

  std::atomic<uint64_t> m_completed;
  std::atomic<uint64_t> m_failed;
};

#endif
