#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "recording_notifier.h"
#include "signal_recorder.h"
#include "transcoder.h"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
constexpr uint32_t kRate = 12000;
constexpr uint64_t kFreqA = 145800000;
constexpr uint64_t kFreqB = 144800000;

class FakeTranscoder : public Transcoder {
public:
    bool transcode(const std::string& inputPath, const std::string& outputPath) override {
        std::lock_guard<std::mutex> lock(mutex);
        inputs.push_back(inputPath);
        std::ofstream out(outputPath, std::ios::binary);
        out << "encoded";
        return succeed;
    }

    std::mutex mutex;
    std::vector<std::string> inputs;
    bool succeed = true;
};

struct FakeClock {
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::time_point() + 1000s;

    SignalRecorder::Clock fn() {
        return [this]() { return now; };
    }
    void advanceMs(int64_t ms) { now += std::chrono::milliseconds(ms); }
};

struct RecorderFixture {
    explicit RecorderFixture(const std::string& name, double freqDwell = 2.0, double minDuration = 1.0,
                             double silenceTimeout = 3.0, uint64_t maxCaptureBytes = WavWriter::kMaxDataBytes)
        : dir(fs::temp_directory_path() / ("autoscan_rec_" + name)) {
        fs::remove_all(dir);
        fs::create_directories(dir);
        transcoder = std::make_shared<FakeTranscoder>();
        pipeline = std::make_shared<ConversionPipeline>(transcoder, false);
        pipeline->setCompletionCallback([this](const ConversionJob& job, bool) {
            std::lock_guard<std::mutex> lock(jobsMutex);
            jobs.push_back(job);
        });

        RecorderOptions options;
        options.outputDir = dir.string();
        options.sampleRate = kRate;
        options.rmsThreshold = 0.02f;
        options.freqDwellSeconds = freqDwell;
        options.silenceTimeoutSeconds = silenceTimeout;
        options.minDurationSeconds = minDuration;
        options.drainTimeout = 5s;
        options.maxCaptureBytes = maxCaptureBytes;
        notifier.addObserver([this](const RecordingStatusEvent& event) { events.push_back(event); });
        recorder = std::make_unique<SignalRecorder>(options, pipeline, &notifier, false, clock.fn());
    }

    ~RecorderFixture() {
        recorder.reset();
        pipeline->stop();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void feed(size_t frames, bool signal, std::optional<uint64_t> freq) {
        std::vector<float> block(frames, signal ? 0.3f : 0.0f);
        recorder->submitAudioChunk(block.data(), block.size(), freq);
    }

    size_t filesWithExtension(const std::string& ext) const {
        size_t count = 0;
        for (const auto& entry : fs::directory_iterator(dir)) {
            if (entry.path().extension() == ext) {
                count++;
            }
        }
        return count;
    }

    std::vector<ConversionJob> completedJobs() {
        pipeline->drain(5000ms);
        std::lock_guard<std::mutex> lock(jobsMutex);
        return jobs;
    }

    fs::path dir;
    FakeClock clock;
    RecordingNotifier notifier;
    std::vector<RecordingStatusEvent> events;
    std::shared_ptr<FakeTranscoder> transcoder;
    std::shared_ptr<ConversionPipeline> pipeline;
    std::mutex jobsMutex;
    std::vector<ConversionJob> jobs;
    std::unique_ptr<SignalRecorder> recorder;
};
}  // namespace

TEST_CASE("Three signal chunks after the dwell produce one capture", "[recorder]") {
    RecorderFixture f("three_chunks");

    f.feed(kRate / 2, false, kFreqA);
    f.clock.advanceMs(2000);
    for (int i = 0; i < 3; i++) {
        f.feed(kRate / 2, true, kFreqA);
        REQUIRE(f.recorder->getStatus().recording);
        f.clock.advanceMs(500);
    }

    const RecorderStatus status = f.recorder->getStatus();
    REQUIRE(status.capturesStarted == 1);
    REQUIRE(status.frequencyHz == kFreqA);
    REQUIRE(*status.durationSeconds >= 1.0);

    REQUIRE(f.recorder->stopCapture("test"));
    const std::vector<ConversionJob> jobs = f.completedJobs();
    REQUIRE(jobs.size() == 1);
    REQUIRE(jobs[0].durationSeconds >= 1.0);
    REQUIRE(jobs[0].frequencyHz == kFreqA);
    REQUIRE(fs::path(jobs[0].outputPath).filename().string().rfind("145.800MHz_", 0) == 0);
    REQUIRE(f.filesWithExtension(".mp3") == 1);
    REQUIRE(f.filesWithExtension(".wav") == 0);
}

TEST_CASE("No capture starts before the frequency dwell passes", "[recorder]") {
    RecorderFixture f("dwell_gate");

    f.feed(kRate / 10, true, kFreqA);
    REQUIRE_FALSE(f.recorder->getStatus().recording);
    f.clock.advanceMs(1900);
    f.feed(kRate / 10, true, kFreqA);
    REQUIRE_FALSE(f.recorder->getStatus().recording);
    f.clock.advanceMs(100);
    f.feed(kRate / 10, true, kFreqA);
    REQUIRE(f.recorder->getStatus().recording);
}

TEST_CASE("A frequency change stops the capture and re-arms the dwell", "[recorder]") {
    RecorderFixture f("freq_change");

    f.feed(kRate / 10, false, kFreqA);
    f.clock.advanceMs(2000);
    f.feed(kRate, true, kFreqA);
    REQUIRE(f.recorder->getStatus().recording);

    f.clock.advanceMs(1000);
    f.feed(kRate / 10, true, kFreqB);
    REQUIRE_FALSE(f.recorder->getStatus().recording);
    REQUIRE(f.events.size() == 2);
    REQUIRE(f.events[0].recording);
    REQUIRE_FALSE(f.events[1].recording);
    REQUIRE(f.events[1].frequencyHz == kFreqA);

    f.clock.advanceMs(1000);
    f.feed(kRate / 10, true, kFreqB);
    REQUIRE_FALSE(f.recorder->getStatus().recording);

    f.clock.advanceMs(1000);
    f.feed(kRate / 10, true, kFreqB);
    const RecorderStatus status = f.recorder->getStatus();
    REQUIRE(status.recording);
    REQUIRE(status.frequencyHz == kFreqB);
    REQUIRE(status.capturesStarted == 2);
}

TEST_CASE("Minimum duration boundary keeps exactly the minimum", "[recorder]") {
    RecorderFixture f("boundary", 0.0, 5.0);

    SECTION("exactly the minimum is kept") {
        for (int i = 0; i < 10; i++) {
            f.feed(6000, true, kFreqA);
        }
        REQUIRE(f.recorder->stopCapture("test"));
        const std::vector<ConversionJob> jobs = f.completedJobs();
        REQUIRE(jobs.size() == 1);
        REQUIRE(jobs[0].durationSeconds == 5.0);
        REQUIRE(f.recorder->getStatus().capturesKept == 1);
    }

    SECTION("one frame short is discarded") {
        for (int i = 0; i < 9; i++) {
            f.feed(6000, true, kFreqA);
        }
        f.feed(5999, true, kFreqA);
        REQUIRE(f.recorder->stopCapture("test"));
        REQUIRE(f.completedJobs().empty());
        REQUIRE(f.recorder->getStatus().capturesDiscarded == 1);
        REQUIRE(f.filesWithExtension(".wav") == 0);
    }
}

TEST_CASE("Silence for exactly the timeout stops the capture", "[recorder]") {
    RecorderFixture f("silence_exact", 0.0, 0.0, 3.0);

    f.feed(kRate / 10, true, kFreqA);
    REQUIRE(f.recorder->getStatus().recording);

    f.clock.advanceMs(2999);
    f.recorder->checkSilence();
    REQUIRE(f.recorder->getStatus().recording);

    f.clock.advanceMs(1);
    f.recorder->checkSilence();
    REQUIRE_FALSE(f.recorder->getStatus().recording);
    REQUIRE(f.completedJobs().size() == 1);
}

TEST_CASE("A signal just before the timeout cancels the pending stop", "[recorder]") {
    RecorderFixture f("silence_refresh", 0.0, 0.0, 3.0);

    f.feed(kRate / 10, true, kFreqA);
    f.clock.advanceMs(2999);
    f.feed(kRate / 10, true, kFreqA);

    f.clock.advanceMs(1);
    f.recorder->checkSilence();
    REQUIRE(f.recorder->getStatus().recording);

    f.clock.advanceMs(2998);
    f.recorder->checkSilence();
    REQUIRE(f.recorder->getStatus().recording);

    f.clock.advanceMs(1);
    f.recorder->checkSilence();
    REQUIRE_FALSE(f.recorder->getStatus().recording);
    REQUIRE(f.recorder->getStatus().capturesStarted == 1);
}

TEST_CASE("Silent chunks after the timeout end the capture", "[recorder]") {
    RecorderFixture f("silence_chunks", 0.0, 0.0, 3.0);

    f.feed(kRate / 10, true, kFreqA);
    f.clock.advanceMs(1000);
    f.feed(kRate / 10, false, kFreqA);
    REQUIRE(f.recorder->getStatus().recording);
    f.clock.advanceMs(2000);
    f.feed(kRate / 10, false, kFreqA);
    REQUIRE_FALSE(f.recorder->getStatus().recording);
}

TEST_CASE("At most one capture is active", "[recorder]") {
    RecorderFixture f("single_capture", 0.0, 0.0, 3.0);

    for (int i = 0; i < 50; i++) {
        f.feed(kRate / 20, true, kFreqA);
        f.clock.advanceMs(50);
    }
    REQUIRE(f.recorder->getStatus().capturesStarted == 1);
    REQUIRE(f.filesWithExtension(".wav") == 1);
}

TEST_CASE("Disarming stops the capture and blocks new ones", "[recorder]") {
    RecorderFixture f("disarm", 0.0, 0.0, 3.0);

    f.feed(kRate / 10, true, kFreqA);
    REQUIRE(f.recorder->getStatus().recording);
    f.recorder->setArmed(false);
    REQUIRE_FALSE(f.recorder->getStatus().recording);
    f.feed(kRate / 10, true, kFreqA);
    REQUIRE_FALSE(f.recorder->getStatus().recording);
    f.recorder->setArmed(true);
    f.feed(kRate / 10, true, kFreqA);
    REQUIRE(f.recorder->getStatus().recording);
}

TEST_CASE("Shutdown finalizes the open capture", "[recorder]") {
    RecorderFixture f("shutdown", 0.0, 1.0, 3.0);

    f.feed(kRate * 2, true, kFreqA);
    f.recorder->shutdown();
    REQUIRE_FALSE(f.recorder->getStatus().recording);
    REQUIRE(f.recorder->getStatus().capturesKept == 1);
    REQUIRE(f.completedJobs().size() == 1);

    f.feed(kRate, true, kFreqA);
    REQUIRE_FALSE(f.recorder->getStatus().recording);
}

TEST_CASE("Failed conversions keep the staging file", "[recorder]") {
    RecorderFixture f("convert_fail", 0.0, 0.0, 3.0);
    f.transcoder->succeed = false;

    f.feed(kRate, true, kFreqA);
    REQUIRE(f.recorder->stopCapture("test"));
    REQUIRE(f.completedJobs().size() == 1);
    REQUIRE(f.pipeline->failedCount() == 1);
    REQUIRE(f.filesWithExtension(".wav") == 1);
}

TEST_CASE("Recording names use the frequency or a REC prefix", "[recorder]") {
    const auto when = std::chrono::system_clock::from_time_t(1700000000);
    REQUIRE(SignalRecorder::buildBaseName(kFreqA, when) == "145.800MHz_20231114_221320");
    REQUIRE(SignalRecorder::buildBaseName(std::nullopt, when) == "REC_20231114_221320");
}

TEST_CASE("Recording status is serialized for broadcast", "[recorder]") {
    RecordingStatusEvent event;
    event.recording = true;
    event.frequencyHz = kFreqA;
    REQUIRE(recordingStatusJson(event) == "{\"frequency\":145800000,\"recording\":true,\"type\":\"recording_status\"}");

    event.recording = false;
    event.frequencyHz.reset();
    REQUIRE(recordingStatusJson(event) == "{\"frequency\":null,\"recording\":false,\"type\":\"recording_status\"}");
}

TEST_CASE("A throwing observer is dropped and the others still run", "[recorder]") {
    RecordingNotifier notifier;
    int calls = 0;
    notifier.addObserver([](const RecordingStatusEvent&) { throw std::runtime_error("ui gone"); });
    const RecordingNotifier::Handle kept = notifier.addObserver([&calls](const RecordingStatusEvent&) { calls++; });
    REQUIRE(notifier.addObserver(RecordingNotifier::Observer()) == 0);
    REQUIRE(notifier.observerCount() == 2);

    notifier.notify(RecordingStatusEvent());
    REQUIRE(calls == 1);
    REQUIRE(notifier.observerCount() == 1);

    notifier.notify(RecordingStatusEvent());
    REQUIRE(calls == 2);
    REQUIRE(notifier.removeObserver(kept));
    REQUIRE_FALSE(notifier.removeObserver(kept));
}

TEST_CASE("Observers can query the recorder from a notification", "[recorder]") {
    RecorderFixture f("observer_query", 0.0);
    std::vector<RecorderStatus> seen;
    f.notifier.addObserver([&f, &seen](const RecordingStatusEvent&) { seen.push_back(f.recorder->getStatus()); });

    f.feed(kRate / 4, true, kFreqA);
    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].recording);
    REQUIRE(seen[0].frequencyHz == kFreqA);

    REQUIRE(f.recorder->stopCapture("test"));
    REQUIRE(seen.size() == 2);
    REQUIRE_FALSE(seen[1].recording);
}

TEST_CASE("Silence deadline notifications run outside the recorder lock", "[recorder]") {
    RecorderFixture f("observer_silence", 0.0, 0.0);
    std::vector<bool> recordingSeen;
    f.notifier.addObserver([&f, &recordingSeen](const RecordingStatusEvent&) {
        recordingSeen.push_back(f.recorder->getStatus().recording);
    });

    f.feed(kRate / 4, true, kFreqA);
    f.clock.advanceMs(3000);
    f.recorder->checkSilence();
    REQUIRE(recordingSeen == std::vector<bool>{true, false});
}

TEST_CASE("A capture reaching the size limit rolls over to a new file", "[recorder]") {
    // Room for one and a half quarter-second chunks.
    const uint64_t limit = (kRate / 4) * WavWriter::BYTES_PER_FRAME * 3 / 2;
    RecorderFixture f("rollover", 0.0, 0.0, 3.0, limit);

    f.feed(kRate / 4, true, kFreqA);
    f.feed(kRate / 4, true, kFreqA);
    f.feed(kRate / 4, true, kFreqA);

    RecorderStatus status = f.recorder->getStatus();
    REQUIRE(status.recording);
    REQUIRE(status.capturesStarted == 3);
    REQUIRE(status.capturesKept == 2);
    REQUIRE(status.frequencyHz == kFreqA);

    REQUIRE(f.recorder->stopCapture("test"));
    const std::vector<ConversionJob> jobs = f.completedJobs();
    REQUIRE(jobs.size() == 3);
    for (const ConversionJob& job : jobs) {
        REQUIRE(job.durationSeconds == 0.25);
        REQUIRE(job.frequencyHz == kFreqA);
    }
    REQUIRE(f.events.size() == 6);
    REQUIRE(f.events[1].recording == false);
    REQUIRE(f.events[2].recording == true);
}
