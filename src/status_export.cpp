#include "status_export.h"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <utility>

#include "client_presence.h"
#include "decoding_session.h"
#include "orchestrator.h"
#include "recording_scheduler.h"
#include "signal_recorder.h"

namespace {
nlohmann::json profileJson(const FrequencyProfile& profile) {
    nlohmann::json doc;
    doc["frequency_hz"] = profile.frequency_hz;
    doc["mode"] = profile.mode;
    doc["squelch"] = profile.squelch;
    doc["bandwidth_hz"] = profile.bandwidth_hz;
    doc["dwell_seconds"] = profile.dwell_seconds;
    doc["label"] = profile.label;
    return doc;
}
}  // namespace

nlohmann::json buildStatusDocument(const StatusSources& sources) {
    nlohmann::json doc;
    doc["initialized"] = true;
    doc["timestamp"] = isoTimestampUtc(std::chrono::system_clock::now());

    if (sources.orchestrator) {
        const OrchestratorStatus status = sources.orchestrator->getStatus();
        doc["enabled"] = status.enabled;
        doc["running"] = status.running;
        doc["state"] = orchestratorStateName(status.state);
        doc["current_frequency"] = status.currentFrequency ? profileJson(*status.currentFrequency) : nullptr;
        doc["current_index"] = status.currentIndex;
        doc["total_frequencies"] = status.totalFrequencies;
        doc["advances"] = status.advances;
        doc["consecutive_tune_failures"] = status.consecutiveTuneFailures;
        doc["skipped_frequencies"] = status.skippedFrequencies;
    } else {
        doc["enabled"] = false;
        doc["running"] = false;
        doc["state"] = orchestratorStateName(OrchestratorState::Manual);
        doc["current_frequency"] = nullptr;
        doc["current_index"] = 0;
        doc["total_frequencies"] = 0;
        doc["advances"] = 0;
        doc["consecutive_tune_failures"] = 0;
        doc["skipped_frequencies"] = 0;
    }

    doc["components"] = {
        {"client_presence", sources.presence != nullptr},
        {"receiver", sources.orchestrator != nullptr},
        {"decoders", sources.decoders != nullptr},
        {"recorder", sources.recorder != nullptr},
    };

    if (sources.presence) {
        const ClientCounts counts = sources.presence->getCounts();
        doc["clients"] = {{"total", counts.total}, {"local", counts.local}, {"remote", counts.remote}};
    } else {
        doc["clients"] = {{"total", 0}, {"local", 0}, {"remote", 0}};
    }

    if (sources.recorder) {
        const RecorderStatus rec = sources.recorder->getStatus();
        nlohmann::json recording;
        recording["armed"] = rec.armed;
        recording["recording"] = rec.recording;
        recording["duration_seconds"] = rec.durationSeconds ? nlohmann::json(*rec.durationSeconds) : nullptr;
        recording["frequency"] = rec.frequencyHz ? nlohmann::json(*rec.frequencyHz) : nullptr;
        recording["output_path"] = rec.outputPath;
        recording["schedule_id"] = rec.scheduleId.empty() ? nlohmann::json(nullptr) : nlohmann::json(rec.scheduleId);
        recording["level_dbfs"] = rec.levelDbfs;
        recording["captures_started"] = rec.capturesStarted;
        recording["captures_kept"] = rec.capturesKept;
        recording["captures_discarded"] = rec.capturesDiscarded;
        doc["recording"] = recording;
    } else {
        doc["recording"] = nullptr;
    }

    if (sources.decoders) {
        const auto sessionId = sources.decoders->currentSessionId();
        doc["decoding_session"] = sessionId ? nlohmann::json(*sessionId) : nullptr;
    }
    if (sources.scheduler) {
        doc["schedule"] = sources.scheduler->statusJson();
    }
    return doc;
}

StatusFileWriter::StatusFileWriter(std::string path, std::chrono::milliseconds interval, Builder builder,
                                   bool verboseLogging)
    : m_path(std::move(path))
    , m_interval(interval.count() > 0 ? interval : std::chrono::milliseconds(5000))
    , m_builder(std::move(builder))
    , m_verboseLogging(verboseLogging)
    , m_running(false) {
}

StatusFileWriter::~StatusFileWriter() {
    stop();
}

bool StatusFileWriter::writeOnce() {
    if (!m_builder || m_path.empty()) {
        return false;
    }
    const nlohmann::json doc = m_builder();
    const std::string tmp = m_path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[STATUS] cannot open " << tmp << std::endl;
            return false;
        }
        out << doc.dump(2) << "\n";
        if (!out.good()) {
            std::cerr << "[STATUS] write to " << tmp << " failed" << std::endl;
            return false;
        }
    }
    if (std::rename(tmp.c_str(), m_path.c_str()) != 0) {
        std::cerr << "[STATUS] rename " << tmp << " -> " << m_path << " failed" << std::endl;
        std::remove(tmp.c_str());
        return false;
    }
    return true;
}

void StatusFileWriter::start() {
    if (m_running.exchange(true)) {
        return;
    }
    m_thread = std::thread([this]() {
        while (m_running) {
            try {
                writeOnce();
            } catch (const std::exception& ex) {
                std::cerr << "[STATUS] export failed: " << ex.what() << std::endl;
            }
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait_for(lock, m_interval, [this]() { return !m_running.load(); });
        }
    });
    if (m_verboseLogging) {
        std::cout << "[STATUS] writing " << m_path << " every " << m_interval.count() << " ms" << std::endl;
    }
}

void StatusFileWriter::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running.exchange(false)) {
            return;
        }
    }
    m_cv.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}
