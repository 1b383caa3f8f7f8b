#include "signal_recorder.h"

#include <cmath>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "frequency_profile.h"

namespace fs = std::filesystem;

namespace {
std::chrono::steady_clock::duration secondsToDuration(double seconds) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(seconds));
}

std::string formatUtcStamp(std::chrono::system_clock::time_point when) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &tm);
    return std::string(buffer);
}
}  // namespace

SignalRecorder::SignalRecorder(RecorderOptions options, std::shared_ptr<ConversionPipeline> pipeline,
                               RecordingNotifier* notifier, bool verboseLogging, Clock clock)
    : m_options(std::move(options))
    , m_pipeline(std::move(pipeline))
    , m_notifier(notifier)
    , m_verboseLogging(verboseLogging)
    , m_clock(clock ? std::move(clock) : Clock([]() { return std::chrono::steady_clock::now(); }))
    , m_minFrames(0)
    , m_armed(true)
    , m_capturesKept(0)
    , m_capturesDiscarded(0)
    , m_timer("REC") {
    if (m_options.sampleRate == 0) {
        throw std::runtime_error("recorder sample rate must be positive");
    }
    m_minFrames = static_cast<uint64_t>(
        std::llround(m_options.minDurationSeconds * static_cast<double>(m_options.sampleRate)));

    std::error_code ec;
    fs::create_directories(m_options.outputDir, ec);
    if (ec) {
        std::cerr << "[REC] cannot create output directory " << m_options.outputDir << ": " << ec.message()
                  << std::endl;
    }
}

SignalRecorder::~SignalRecorder() {
    shutdown();
}

std::string SignalRecorder::buildBaseName(std::optional<uint64_t> frequencyHz,
                                          std::chrono::system_clock::time_point when) {
    const std::string stamp = formatUtcStamp(when);
    if (!frequencyHz || *frequencyHz == 0) {
        return "REC_" + stamp;
    }
    return formatFrequencyMHz(*frequencyHz) + "MHz_" + stamp;
}

void SignalRecorder::submitAudioChunk(const float* samples, size_t count, std::optional<uint64_t> frequencyHz) {
    if (samples == nullptr || count == 0) {
        return;
    }

    const float rms = autoscan::dsp::computeRms(samples, count);
    const bool hasSignal = rms > m_options.rmsThreshold;
    std::unique_ptr<RecordingSession> finished;
    std::unique_ptr<RecordingSession> rolledOver;
    std::vector<RecordingStatusEvent> events;
    const char* finishReason = "";
    bool discard = false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const TimePoint now = m_clock();
        m_lastRms = rms;
        autoscan::dsp::smoothLevel(rms, m_levelSmoother);

        if (m_scheduled) {
            if (!m_session && !m_shutdown) {
                m_session = openSessionLocked(now, events);
            }
        } else if (!m_dwell.started) {
            m_dwell.started = true;
            m_dwell.lastSeenFrequency = frequencyHz;
            m_dwell.stableSince = now;
        } else if (frequencyHz && m_dwell.lastSeenFrequency != frequencyHz) {
            m_dwell.lastSeenFrequency = frequencyHz;
            m_dwell.stableSince = now;
            if (m_session) {
                finished = detachSessionLocked("frequency change", events);
                finishReason = "frequency change";
            }
        }

        if (m_session && !hasSignal && silenceExpiredLocked(now)) {
            finished = detachSessionLocked("silence", events);
            finishReason = "silence";
        }

        const bool dwellSatisfied = now - m_dwell.stableSince >= secondsToDuration(m_options.freqDwellSeconds);
        if (!m_scheduled && hasSignal && !m_session && !finished && m_armed && !m_shutdown && dwellSatisfied) {
            m_session = openSessionLocked(now, events);
        }

        if (m_session && m_session->writer.dataBytes() > 0 &&
            m_session->writer.dataBytes() + count * WavWriter::BYTES_PER_FRAME > m_options.maxCaptureBytes) {
            rolledOver = detachSessionLocked("size limit", events);
            m_session = openSessionLocked(now, events);
        }

        if (m_session) {
            if (!m_session->writer.write(samples, count)) {
                std::cerr << "[REC] write to " << m_session->stagingPath << " failed, aborting capture"
                          << std::endl;
                finished = detachSessionLocked("write error", events);
                finishReason = "write error";
                discard = true;
            } else if (hasSignal && !m_scheduled) {
                m_session->lastSignalAt = now;
                armSilenceTimerLocked();
            }
        }
    }

    publish(events);
    if (rolledOver) {
        finalizeCapture(std::move(rolledOver), "size limit");
    }
    if (finished) {
        finalizeCapture(std::move(finished), finishReason, discard);
    }
}

bool SignalRecorder::silenceExpiredLocked(TimePoint now) const {
    return !m_scheduled && m_session && now - m_session->lastSignalAt >= secondsToDuration(m_options.silenceTimeoutSeconds);
}

std::unique_ptr<SignalRecorder::RecordingSession> SignalRecorder::openSessionLocked(TimePoint now,
                                                                                  std::vector<RecordingStatusEvent>& events) {
    const std::optional<uint64_t> frequency =
        m_scheduled ? std::optional<uint64_t>(m_scheduled->frequencyHz) : m_dwell.lastSeenFrequency;
    std::string base = buildBaseName(frequency, std::chrono::system_clock::now());
    if (m_scheduled) {
        base = "SCHED_" + m_scheduled->id + "_" + base;
    }
    const fs::path dir(m_options.outputDir);

    std::error_code ec;
    fs::create_directories(dir, ec);

    auto session = std::make_unique<RecordingSession>();
    for (int attempt = 0; attempt < 1000; attempt++) {
        const std::string stem = attempt == 0 ? base : base + "_" + std::to_string(attempt);
        const fs::path staging = dir / (stem + ".wav");
        const fs::path output = dir / (stem + "." + m_options.outputExtension);
        if (fs::exists(staging, ec) || fs::exists(output, ec)) {
            continue;
        }
        session->stagingPath = staging.string();
        session->outputPath = output.string();
        break;
    }
    if (session->stagingPath.empty()) {
        std::cerr << "[REC] no free file name for " << base << std::endl;
        return nullptr;
    }

    if (!session->writer.open(session->stagingPath, m_options.sampleRate)) {
        return nullptr;
    }
    session->frequencyHz = frequency;
    session->startedAt = now;
    session->lastSignalAt = now;
    m_capturesStarted++;

    if (m_verboseLogging) {
        std::cout << "[REC] capture started: " << session->stagingPath << std::endl;
    }
    RecordingStatusEvent event;
    event.recording = true;
    event.frequencyHz = session->frequencyHz;
    events.push_back(event);
    return session;
}

void SignalRecorder::armSilenceTimerLocked() {
    m_timer.cancel(m_silenceToken);
    m_silenceToken = m_timer.scheduleAfter(secondsToDuration(m_options.silenceTimeoutSeconds),
                                           [this]() { checkSilence(); });
}

std::unique_ptr<SignalRecorder::RecordingSession> SignalRecorder::detachSessionLocked(const char* reason,
                                                                                    std::vector<RecordingStatusEvent>& events) {
    m_timer.cancel(m_silenceToken);
    m_silenceToken = DeadlineTimer::kInvalidToken;

    std::unique_ptr<RecordingSession> session = std::move(m_session);
    if (session) {
        RecordingStatusEvent event;
        event.recording = false;
        event.frequencyHz = session->frequencyHz;
        events.push_back(event);
    }
    if (session && m_verboseLogging) {
        std::cout << "[REC] capture stopping (" << reason << ")" << std::endl;
    }
    return session;
}

void SignalRecorder::publish(const std::vector<RecordingStatusEvent>& events) {
    if (!m_notifier) {
        return;
    }
    for (const RecordingStatusEvent& event : events) {
        m_notifier->notify(event);
    }
}

void SignalRecorder::finalizeCapture(std::unique_ptr<RecordingSession> session, const char* reason,
                                     bool discard) {
    if (!session) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_finalizeMutex);

    const bool closed = session->writer.close();
    const uint64_t dataBytes = session->writer.dataBytes();
    const uint64_t frames = session->writer.framesWritten();
    const double duration = WavWriter::durationSeconds(dataBytes, m_options.sampleRate);

    if (!closed || discard || frames < m_minFrames) {
        std::error_code ec;
        fs::remove(session->stagingPath, ec);
        if (ec) {
            std::cerr << "[REC] could not delete " << session->stagingPath << ": " << ec.message() << std::endl;
        }
        m_capturesDiscarded++;
        if (m_verboseLogging) {
            std::cout << "[REC] discarded " << session->stagingPath << " (" << duration << " s < "
                      << m_options.minDurationSeconds << " s)" << std::endl;
        }
        return;
    }

    ConversionJob job;
    job.stagingPath = session->stagingPath;
    job.outputPath = session->outputPath;
    job.frequencyHz = session->frequencyHz.value_or(0);
    job.durationSeconds = duration;
    m_capturesKept++;

    if (!m_pipeline) {
        std::cerr << "[REC] no conversion pipeline, keeping " << job.stagingPath << std::endl;
        return;
    }
    if (m_verboseLogging) {
        std::cout << "[REC] capture complete: " << job.stagingPath << " (" << duration << " s, " << reason
                  << ")" << std::endl;
    }
    m_pipeline->submit(std::move(job));
}

void SignalRecorder::checkSilence() {
    std::unique_ptr<RecordingSession> finished;
    std::vector<RecordingStatusEvent> events;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!silenceExpiredLocked(m_clock())) {
            return;
        }
        finished = detachSessionLocked("silence", events);
    }
    publish(events);
    finalizeCapture(std::move(finished), "silence");
}

bool SignalRecorder::stopCapture(const char* reason) {
    std::unique_ptr<RecordingSession> finished;
    std::vector<RecordingStatusEvent> events;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_scheduled) {
            return false;
        }
        finished = detachSessionLocked(reason, events);
    }
    publish(events);
    if (!finished) {
        return false;
    }
    finalizeCapture(std::move(finished), reason);
    return true;
}

bool SignalRecorder::startScheduledCapture(const std::string& scheduleId, uint64_t frequencyHz) {
    std::unique_ptr<RecordingSession> finished;
    std::vector<RecordingStatusEvent> events;
    bool opened = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown || m_scheduled) {
            return false;
        }
        finished = detachSessionLocked("scheduled recording", events);
        ScheduledCapture scheduled;
        scheduled.id = scheduleId;
        scheduled.frequencyHz = frequencyHz;
        m_scheduled = scheduled;
        m_session = openSessionLocked(m_clock(), events);
        opened = m_session != nullptr;
    }
    publish(events);
    finalizeCapture(std::move(finished), "scheduled recording");
    if (!opened) {
        std::cerr << "[REC] scheduled capture " << scheduleId << " could not open, retrying on the next chunk"
                  << std::endl;
    }
    return true;
}

bool SignalRecorder::stopScheduledCapture() {
    std::unique_ptr<RecordingSession> finished;
    std::vector<RecordingStatusEvent> events;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_scheduled) {
            return false;
        }
        m_scheduled.reset();
        finished = detachSessionLocked("schedule window ended", events);
        m_dwell = DwellTracker();
    }
    publish(events);
    finalizeCapture(std::move(finished), "schedule window ended");
    return true;
}

void SignalRecorder::setArmed(bool armed) {
    const bool previous = m_armed.exchange(armed);
    if (previous && !armed) {
        stopCapture("disarmed");
    }
}

RecorderStatus SignalRecorder::getStatus() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    RecorderStatus status;
    status.armed = m_armed;
    status.recording = m_session != nullptr;
    status.lastRms = m_lastRms;
    status.levelDbfs = autoscan::dsp::rmsToDbfs(m_levelSmoother.value);
    status.capturesStarted = m_capturesStarted;
    status.capturesKept = m_capturesKept;
    status.capturesDiscarded = m_capturesDiscarded;
    if (m_session) {
        status.durationSeconds = WavWriter::durationSeconds(m_session->writer.dataBytes(), m_options.sampleRate);
        status.frequencyHz = m_session->frequencyHz;
        status.outputPath = m_session->outputPath;
    }
    if (m_scheduled) {
        status.scheduleId = m_scheduled->id;
    }
    return status;
}

bool SignalRecorder::isActiveStagingFile(const std::string& path) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_session) {
        return false;
    }
    std::error_code ec;
    return fs::equivalent(fs::path(path), fs::path(m_session->stagingPath), ec);
}

void SignalRecorder::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return;
        }
        m_shutdown = true;
        m_scheduled.reset();
    }
    stopCapture("shutdown");
    m_timer.stop();

    // Wait out any finalize still running on another thread.
    { std::lock_guard<std::mutex> lock(m_finalizeMutex); }

    if (m_pipeline && !m_pipeline->drain(m_options.drainTimeout)) {
        std::cerr << "[REC] conversions still pending at shutdown, staging files kept" << std::endl;
    }
    if (m_verboseLogging) {
        std::cout << "[REC] shutdown: " << m_capturesKept << " kept, " << m_capturesDiscarded << " discarded"
                  << std::endl;
    }
}
