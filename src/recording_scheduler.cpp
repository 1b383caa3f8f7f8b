#include "recording_scheduler.h"

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iostream>
#include <utility>

#include "frequency_profile.h"
#include "orchestrator.h"
#include "receiver_tuner.h"
#include "signal_recorder.h"

namespace {
constexpr int kSecondsPerDay = 24 * 60 * 60;
constexpr int kMaxDurationMinutes = 24 * 60;
}  // namespace

ScheduleTime toScheduleTime(std::chrono::system_clock::time_point when) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&t, &tm);
    ScheduleTime out;
    out.weekday = (tm.tm_wday + 6) % 7;
    out.secondOfDay = tm.tm_hour * 3600 + tm.tm_min * 60 + std::min(tm.tm_sec, 59);
    return out;
}

bool parseClockTime(const std::string& text, int& minuteOfDay) {
    const size_t colon = text.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
        return false;
    }
    try {
        size_t usedHours = 0;
        size_t usedMinutes = 0;
        const std::string hoursText = text.substr(0, colon);
        const std::string minutesText = text.substr(colon + 1);
        const int hours = std::stoi(hoursText, &usedHours);
        const int minutes = std::stoi(minutesText, &usedMinutes);
        if (usedHours != hoursText.size() || usedMinutes != minutesText.size()) {
            return false;
        }
        if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
            return false;
        }
        minuteOfDay = hours * 60 + minutes;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ScheduleEntry::runsOn(int weekday) const {
    return std::find(daysOfWeek.begin(), daysOfWeek.end(), weekday) != daysOfWeek.end();
}

bool ScheduleEntry::isActiveAt(const ScheduleTime& now) const {
    return secondsRemaining(now) > 0;
}

int64_t ScheduleEntry::secondsRemaining(const ScheduleTime& now) const {
    if (!enabled) {
        return 0;
    }
    const int start = startMinute * 60;
    const int end = start + durationMinutes * 60;
    if (runsOn(now.weekday) && now.secondOfDay >= start && now.secondOfDay < end) {
        return end - now.secondOfDay;
    }
    // Tail of yesterday's window.
    const int yesterday = (now.weekday + 6) % 7;
    if (end > kSecondsPerDay && runsOn(yesterday) && now.secondOfDay < end - kSecondsPerDay) {
        return end - kSecondsPerDay - now.secondOfDay;
    }
    return 0;
}

std::vector<ScheduleEntry> parseSchedules(const nlohmann::json& doc) {
    std::vector<ScheduleEntry> entries;
    if (!doc.is_object() || !doc.contains("schedules") || !doc["schedules"].is_array()) {
        std::cerr << "[SCHED] schedule document has no \"schedules\" array" << std::endl;
        return entries;
    }

    for (const nlohmann::json& item : doc["schedules"]) {
        if (!item.is_object()) {
            std::cerr << "[SCHED] skipping non-object schedule entry" << std::endl;
            continue;
        }
        try {
            ScheduleEntry entry;
            entry.id = item.value("id", entry.id);
            entry.name = item.value("name", entry.name);
            entry.frequencyHz = item.value("frequency", static_cast<uint64_t>(0));
            entry.mode = item.value("mode", entry.mode);
            entry.enabled = item.value("enabled", true);
            if (item.contains("days_of_week")) {
                entry.daysOfWeek = item["days_of_week"].get<std::vector<int>>();
            }
            const std::string startTime = item.value("start_time", std::string("00:00"));
            entry.durationMinutes = item.value("duration_minutes", entry.durationMinutes);

            const bool daysOk = std::all_of(entry.daysOfWeek.begin(), entry.daysOfWeek.end(),
                                            [](int day) { return day >= 0 && day <= 6; });
            if (entry.frequencyHz == 0 || !daysOk || !parseClockTime(startTime, entry.startMinute) ||
                entry.durationMinutes <= 0 || entry.durationMinutes > kMaxDurationMinutes) {
                std::cerr << "[SCHED] skipping invalid schedule " << entry.id << std::endl;
                continue;
            }
            entries.push_back(std::move(entry));
        } catch (const nlohmann::json::exception& ex) {
            std::cerr << "[SCHED] skipping malformed schedule entry: " << ex.what() << std::endl;
        }
    }
    return entries;
}

bool loadScheduleFile(const std::string& path, std::vector<ScheduleEntry>& entries) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "[SCHED] cannot open schedule file " << path << std::endl;
        return false;
    }
    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "[SCHED] cannot parse " << path << ": " << ex.what() << std::endl;
        return false;
    }
    entries = parseSchedules(doc);
    return true;
}

RecordingScheduler::RecordingScheduler(std::vector<ScheduleEntry> entries, ReceiverTuner* tuner,
                                       SignalRecorder* recorder, Orchestrator* orchestrator,
                                       std::chrono::milliseconds interval, bool verboseLogging, Clock clock)
    : m_entries(std::move(entries))
    , m_tuner(tuner)
    , m_recorder(recorder)
    , m_orchestrator(orchestrator)
    , m_interval(interval.count() > 0 ? interval : std::chrono::milliseconds(10000))
    , m_verboseLogging(verboseLogging)
    , m_clock(clock ? std::move(clock)
                    : Clock([]() { return toScheduleTime(std::chrono::system_clock::now()); }))
    , m_running(false) {
}

RecordingScheduler::~RecordingScheduler() {
    stop();
}

void RecordingScheduler::checkOnce() {
    std::lock_guard<std::mutex> control(m_controlMutex);
    const ScheduleTime now = m_clock();

    std::optional<size_t> active;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        active = m_active;
    }
    if (active) {
        if (m_entries[*active].isActiveAt(now)) {
            return;
        }
        endWindowLocked("window ended");
    }

    for (size_t i = 0; i < m_entries.size(); i++) {
        if (m_entries[i].isActiveAt(now)) {
            beginWindowLocked(i, now);
            return;
        }
    }
}

bool RecordingScheduler::beginWindowLocked(size_t index, const ScheduleTime& now) {
    const ScheduleEntry& entry = m_entries[index];
    std::cout << "[SCHED] window open: " << entry.name << " (" << entry.id << ") "
              << formatFrequencyMHz(entry.frequencyHz) << " MHz " << entry.mode << ", "
              << entry.secondsRemaining(now) / 60 << " min left" << std::endl;

    if (m_orchestrator) {
        m_orchestrator->suspend();
    }
    if (m_tuner) {
        m_savedSettings = m_tuner->snapshot();
        m_tuner->beginAutonomousControl();
        bool tuned = false;
        try {
            tuned = m_tuner->tune(entry.frequencyHz, entry.mode, 0.0f, 0);
        } catch (const std::exception& ex) {
            std::cerr << "[SCHED] tune for " << entry.id << " threw: " << ex.what() << std::endl;
        }
        if (!tuned) {
            std::cerr << "[SCHED] tune for " << entry.id << " failed, retrying on the next check" << std::endl;
            releaseReceiverLocked();
            if (m_orchestrator) {
                m_orchestrator->resume();
            }
            return false;
        }
    }
    if (m_recorder) {
        m_recorder->startScheduledCapture(entry.id, entry.frequencyHz);
    }

    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_active = index;
    m_windowsStarted++;
    return true;
}

void RecordingScheduler::endWindowLocked(const char* reason) {
    std::optional<size_t> active;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        active = m_active;
        m_active.reset();
    }
    if (!active) {
        return;
    }

    if (m_recorder) {
        m_recorder->stopScheduledCapture();
    }
    releaseReceiverLocked();
    if (m_orchestrator) {
        m_orchestrator->resume();
    }
    std::cout << "[SCHED] window closed: " << m_entries[*active].id << " (" << reason << ")" << std::endl;
}

void RecordingScheduler::releaseReceiverLocked() {
    if (!m_tuner) {
        return;
    }
    if (m_savedSettings) {
        if (!m_tuner->restore(*m_savedSettings)) {
            std::cerr << "[SCHED] restoring receiver settings failed" << std::endl;
        } else if (m_verboseLogging) {
            std::cout << "[SCHED] restored " << formatFrequencyMHz(m_savedSettings->frequencyHz) << " MHz"
                      << std::endl;
        }
        m_savedSettings.reset();
    }
    m_tuner->endAutonomousControl();
}

void RecordingScheduler::start() {
    if (m_running.exchange(true)) {
        return;
    }
    size_t enabled = 0;
    for (const ScheduleEntry& entry : m_entries) {
        if (entry.enabled) {
            enabled++;
            if (m_verboseLogging) {
                std::cout << "[SCHED]   " << entry.id << ": " << formatFrequencyMHz(entry.frequencyHz) << " MHz "
                          << entry.mode << " at " << entry.startMinute / 60 << ":"
                          << (entry.startMinute % 60 < 10 ? "0" : "") << entry.startMinute % 60 << " for "
                          << entry.durationMinutes << " min" << std::endl;
            }
        }
    }
    std::cout << "[SCHED] started with " << enabled << " of " << m_entries.size() << " schedules enabled"
              << std::endl;

    m_thread = std::thread([this]() {
        while (m_running) {
            try {
                checkOnce();
            } catch (const std::exception& ex) {
                std::cerr << "[SCHED] schedule check failed: " << ex.what() << std::endl;
            }
            std::unique_lock<std::mutex> lock(m_waitMutex);
            m_cv.wait_for(lock, m_interval, [this]() { return !m_running.load(); });
        }
    });
}

void RecordingScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(m_waitMutex);
        m_running = false;
    }
    m_cv.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
    std::lock_guard<std::mutex> control(m_controlMutex);
    endWindowLocked("scheduler stopped");
}

std::optional<std::string> RecordingScheduler::activeId() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (!m_active) {
        return std::nullopt;
    }
    return m_entries[*m_active].id;
}

uint64_t RecordingScheduler::windowsStarted() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_windowsStarted;
}

nlohmann::json RecordingScheduler::statusJson() const {
    const ScheduleTime now = m_clock();
    std::optional<size_t> active;
    uint64_t started = 0;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        active = m_active;
        started = m_windowsStarted;
    }

    nlohmann::json doc;
    doc["running"] = m_running.load();
    doc["total_schedules"] = m_entries.size();
    doc["enabled_schedules"] = std::count_if(m_entries.begin(), m_entries.end(),
                                             [](const ScheduleEntry& entry) { return entry.enabled; });
    doc["active"] = active ? nlohmann::json(m_entries[*active].id) : nullptr;
    doc["windows_started"] = started;

    nlohmann::json schedules = nlohmann::json::array();
    for (size_t i = 0; i < m_entries.size(); i++) {
        const ScheduleEntry& entry = m_entries[i];
        schedules.push_back({
            {"id", entry.id},
            {"name", entry.name},
            {"frequency", entry.frequencyHz},
            {"mode", entry.mode},
            {"enabled", entry.enabled},
            {"recording", active && *active == i},
            {"should_record_now", entry.isActiveAt(now)},
            {"time_remaining", entry.secondsRemaining(now)},
        });
    }
    doc["schedules"] = schedules;
    return doc;
}
