#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "orchestrator.h"
#include "recording_scheduler.h"
#include "signal_recorder.h"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
constexpr uint64_t kSavedFrequency = 7100000;
constexpr int kMonday = 0;
constexpr int kFriday = 4;
constexpr int kSaturday = 5;

class StubReceiver : public ReceiverControl {
public:
    const char* name() const override { return "stub"; }

    ControlResult setFrequency(uint64_t frequencyHz) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (frequencyHz == refused) {
            return ControlResult::Failed;
        }
        frequency = frequencyHz;
        return ControlResult::Ok;
    }
    ControlResult setMode(const std::string& value) override {
        std::lock_guard<std::mutex> lock(mutex);
        mode = value;
        return ControlResult::Ok;
    }
    ControlResult setSquelch(float) override { return ControlResult::Unsupported; }
    ControlResult setBandwidth(uint32_t) override { return ControlResult::Unsupported; }

    std::optional<TuningSettings> currentSettings() override {
        std::lock_guard<std::mutex> lock(mutex);
        TuningSettings settings;
        settings.frequencyHz = frequency;
        settings.mode = mode;
        return settings;
    }

    uint64_t currentFrequency() {
        std::lock_guard<std::mutex> lock(mutex);
        return frequency;
    }
    std::string currentMode() {
        std::lock_guard<std::mutex> lock(mutex);
        return mode;
    }

    std::mutex mutex;
    uint64_t frequency = kSavedFrequency;
    std::string mode = "AM";
    uint64_t refused = 0;
};

ScheduleTime at(int weekday, int hour, int minute, int second = 0) {
    ScheduleTime t;
    t.weekday = weekday;
    t.secondOfDay = hour * 3600 + minute * 60 + second;
    return t;
}

ScheduleEntry entry(const std::string& id, uint64_t frequencyHz, std::vector<int> days, int startMinute,
                    int durationMinutes) {
    ScheduleEntry e;
    e.id = id;
    e.name = id;
    e.frequencyHz = frequencyHz;
    e.mode = "LSB";
    e.daysOfWeek = std::move(days);
    e.startMinute = startMinute;
    e.durationMinutes = durationMinutes;
    return e;
}

struct SchedulerFixture {
    explicit SchedulerFixture(const std::string& name) : dir(fs::temp_directory_path() / ("autoscan_sched_" + name)) {
        fs::remove_all(dir);
        RecorderOptions options;
        options.outputDir = dir.string();
        options.sampleRate = 8000;
        options.minDurationSeconds = 0.0;
        recorder = std::make_unique<SignalRecorder>(options, nullptr, nullptr, false);
    }

    ~SchedulerFixture() {
        recorder.reset();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    RecordingScheduler::Clock clock() {
        return [this]() { return now; };
    }

    void feedSilence() {
        std::vector<float> block(800, 0.0f);
        recorder->submitAudioChunk(block.data(), block.size(), std::nullopt);
    }

    std::vector<std::string> filesWithPrefix(const std::string& prefix) const {
        std::vector<std::string> names;
        for (const auto& item : fs::directory_iterator(dir)) {
            const std::string name = item.path().filename().string();
            if (name.rfind(prefix, 0) == 0) {
                names.push_back(name);
            }
        }
        return names;
    }

    fs::path dir;
    ScheduleTime now;
    std::unique_ptr<SignalRecorder> recorder;
};

bool waitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}
}  // namespace

TEST_CASE("Clock times parse as HH:MM", "[schedule]") {
    int minute = -1;
    REQUIRE(parseClockTime("19:00", minute));
    REQUIRE(minute == 19 * 60);
    REQUIRE(parseClockTime("0:05", minute));
    REQUIRE(minute == 5);
    REQUIRE_FALSE(parseClockTime("24:00", minute));
    REQUIRE_FALSE(parseClockTime("12:60", minute));
    REQUIRE_FALSE(parseClockTime("1200", minute));
    REQUIRE_FALSE(parseClockTime("ab:cd", minute));
    REQUIRE_FALSE(parseClockTime("12:30pm", minute));
}

TEST_CASE("A window is open from its start for its duration", "[schedule]") {
    const ScheduleEntry net = entry("net", 3800000, {kMonday, 2, kFriday}, 19 * 60, 60);

    REQUIRE_FALSE(net.isActiveAt(at(kMonday, 18, 59, 59)));
    REQUIRE(net.isActiveAt(at(kMonday, 19, 0)));
    REQUIRE(net.secondsRemaining(at(kMonday, 19, 30)) == 1800);
    REQUIRE(net.isActiveAt(at(kMonday, 19, 59, 59)));
    REQUIRE_FALSE(net.isActiveAt(at(kMonday, 20, 0)));
    REQUIRE_FALSE(net.isActiveAt(at(1, 19, 30)));
    REQUIRE(net.secondsRemaining(at(1, 19, 30)) == 0);
}

TEST_CASE("A window crossing midnight belongs to its start day", "[schedule]") {
    const ScheduleEntry late = entry("late", 7200000, {kFriday}, 23 * 60, 120);

    REQUIRE(late.isActiveAt(at(kFriday, 23, 30)));
    REQUIRE(late.secondsRemaining(at(kFriday, 23, 30)) == 5400);
    REQUIRE(late.isActiveAt(at(kSaturday, 0, 30)));
    REQUIRE(late.secondsRemaining(at(kSaturday, 0, 30)) == 1800);
    REQUIRE_FALSE(late.isActiveAt(at(kSaturday, 1, 0)));
    // The early hours of Friday would be Thursday's window.
    REQUIRE_FALSE(late.isActiveAt(at(kFriday, 0, 30)));
}

TEST_CASE("A disabled entry is never active", "[schedule]") {
    ScheduleEntry off = entry("off", 7200000, {0, 1, 2, 3, 4, 5, 6}, 0, 24 * 60);
    REQUIRE(off.isActiveAt(at(3, 12, 0)));
    off.enabled = false;
    REQUIRE_FALSE(off.isActiveAt(at(3, 12, 0)));
}

TEST_CASE("Schedule files skip invalid entries", "[schedule]") {
    const std::string path = (fs::temp_directory_path() / "autoscan_schedule_load.json").string();
    {
        std::ofstream out(path);
        out << R"({"version": "1.0", "schedules": [
            {"id": "net", "name": "80m Net", "frequency": 3800000, "mode": "LSB",
             "days_of_week": [0, 2, 4], "start_time": "19:00", "duration_minutes": 60},
            {"id": "no_freq", "start_time": "10:00"},
            {"id": "bad_day", "frequency": 7200000, "days_of_week": [7]},
            {"id": "bad_time", "frequency": 7200000, "start_time": "25:00"},
            {"id": "too_long", "frequency": 7200000, "duration_minutes": 1441},
            {"id": "bad_type", "frequency": "seven"},
            {"id": "defaults", "frequency": 7200000, "enabled": false}
        ]})";
    }

    std::vector<ScheduleEntry> entries;
    REQUIRE(loadScheduleFile(path, entries));
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].id == "net");
    REQUIRE(entries[0].name == "80m Net");
    REQUIRE(entries[0].daysOfWeek == std::vector<int>{0, 2, 4});
    REQUIRE(entries[0].startMinute == 19 * 60);
    REQUIRE(entries[1].id == "defaults");
    REQUIRE_FALSE(entries[1].enabled);
    REQUIRE(entries[1].mode == "USB");
    REQUIRE(entries[1].daysOfWeek.size() == 7);
    REQUIRE(entries[1].durationMinutes == 60);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    REQUIRE_FALSE(loadScheduleFile(path, entries));
    std::remove(path.c_str());
    REQUIRE_FALSE(loadScheduleFile(path, entries));
}

TEST_CASE("A scheduled window tunes, records and restores the receiver", "[schedule]") {
    SchedulerFixture f("window");
    StubReceiver receiver;
    ReceiverTuner tuner(receiver, false);
    RecordingScheduler scheduler({entry("night_net", 3800000, {kFriday}, 23 * 60, 120)}, &tuner, f.recorder.get(),
                                 nullptr, 10000ms, false, f.clock());

    f.now = at(kFriday, 22, 59);
    scheduler.checkOnce();
    REQUIRE_FALSE(scheduler.activeId().has_value());
    REQUIRE(receiver.currentFrequency() == kSavedFrequency);

    f.now = at(kFriday, 23, 0);
    scheduler.checkOnce();
    REQUIRE(scheduler.activeId() == std::optional<std::string>("night_net"));
    REQUIRE(receiver.currentFrequency() == 3800000);
    REQUIRE(receiver.currentMode() == "LSB");
    REQUIRE(tuner.isAutonomous());

    f.feedSilence();
    f.feedSilence();
    RecorderStatus status = f.recorder->getStatus();
    REQUIRE(status.recording);
    REQUIRE(status.scheduleId == "night_net");
    REQUIRE(status.frequencyHz == 3800000);
    REQUIRE_FALSE(f.recorder->stopCapture("ordinary stop"));

    const nlohmann::json doc = scheduler.statusJson();
    REQUIRE(doc["active"] == "night_net");
    REQUIRE(doc["schedules"][0]["recording"] == true);
    REQUIRE(doc["schedules"][0]["time_remaining"] == 7200);

    f.now = at(kSaturday, 0, 59);
    scheduler.checkOnce();
    REQUIRE(scheduler.activeId().has_value());

    f.now = at(kSaturday, 1, 0);
    scheduler.checkOnce();
    REQUIRE_FALSE(scheduler.activeId().has_value());
    REQUIRE(receiver.currentFrequency() == kSavedFrequency);
    REQUIRE(receiver.currentMode() == "AM");
    REQUIRE_FALSE(tuner.isAutonomous());

    status = f.recorder->getStatus();
    REQUIRE_FALSE(status.recording);
    REQUIRE(status.scheduleId.empty());
    const std::vector<std::string> files = f.filesWithPrefix("SCHED_night_net_3.800MHz_");
    REQUIRE(files.size() == 1);
    REQUIRE(fs::path(files[0]).extension() == ".wav");
    REQUIRE(scheduler.windowsStarted() == 1);
}

TEST_CASE("A failed scheduled tune is retried on the next check", "[schedule]") {
    SchedulerFixture f("retry");
    StubReceiver receiver;
    receiver.refused = 3800000;
    ReceiverTuner tuner(receiver, false);
    RecordingScheduler scheduler({entry("net", 3800000, {kMonday}, 19 * 60, 60)}, &tuner, f.recorder.get(), nullptr,
                                 10000ms, false, f.clock());

    f.now = at(kMonday, 19, 0);
    scheduler.checkOnce();
    REQUIRE_FALSE(scheduler.activeId().has_value());
    REQUIRE_FALSE(tuner.isAutonomous());
    REQUIRE(f.recorder->getStatus().scheduleId.empty());

    receiver.refused = 0;
    f.now = at(kMonday, 19, 1);
    scheduler.checkOnce();
    REQUIRE(scheduler.activeId().has_value());
    REQUIRE(receiver.currentFrequency() == 3800000);
}

TEST_CASE("Overlapping windows run one at a time in list order", "[schedule]") {
    SchedulerFixture f("overlap");
    StubReceiver receiver;
    ReceiverTuner tuner(receiver, false);
    RecordingScheduler scheduler(
        {entry("first", 3800000, {kMonday}, 19 * 60, 60), entry("second", 7200000, {kMonday}, 19 * 60 + 30, 60)},
        &tuner, f.recorder.get(), nullptr, 10000ms, false, f.clock());

    f.now = at(kMonday, 19, 45);
    scheduler.checkOnce();
    REQUIRE(scheduler.activeId() == std::optional<std::string>("first"));

    f.now = at(kMonday, 20, 0);
    scheduler.checkOnce();
    REQUIRE(scheduler.activeId() == std::optional<std::string>("second"));
    REQUIRE(receiver.currentFrequency() == 7200000);
    REQUIRE(scheduler.windowsStarted() == 2);
}

TEST_CASE("A scheduled window suspends the scan and resumes it afterwards", "[schedule]") {
    SchedulerFixture f("suspend");
    StubReceiver receiver;
    ReceiverTuner tuner(receiver, false);

    FrequencyProfile profile;
    profile.frequency_hz = 145500000;
    profile.dwell_seconds = 60;
    OrchestratorOptions options;
    options.transitionDelay = 0ms;
    options.dwellTick = 20ms;
    Orchestrator orchestrator({profile}, options, tuner, nullptr, nullptr, f.recorder.get(), false);
    REQUIRE(orchestrator.start());
    REQUIRE(orchestrator.enterAutoMode());
    REQUIRE(waitUntil([&]() { return receiver.currentFrequency() == profile.frequency_hz; }, 2000ms));

    RecordingScheduler scheduler({entry("net", 3800000, {kMonday}, 19 * 60, 60)}, &tuner, f.recorder.get(),
                                 &orchestrator, 10000ms, false, f.clock());

    f.now = at(kMonday, 19, 0);
    scheduler.checkOnce();
    REQUIRE(orchestrator.isSuspended());
    REQUIRE(orchestrator.state() == OrchestratorState::Manual);
    REQUIRE_FALSE(orchestrator.enterAutoMode());
    REQUIRE(receiver.currentFrequency() == 3800000);

    f.now = at(kMonday, 20, 0);
    scheduler.checkOnce();
    REQUIRE_FALSE(orchestrator.isSuspended());
    REQUIRE(orchestrator.state() == OrchestratorState::Auto);
    REQUIRE(waitUntil([&]() { return receiver.currentFrequency() == profile.frequency_hz; }, 2000ms));

    orchestrator.stop();
    REQUIRE(receiver.currentFrequency() == kSavedFrequency);
}

TEST_CASE("Stopping the scheduler closes an open window", "[schedule]") {
    SchedulerFixture f("stop");
    StubReceiver receiver;
    ReceiverTuner tuner(receiver, false);
    RecordingScheduler scheduler({entry("net", 3800000, {kMonday}, 19 * 60, 60)}, &tuner, f.recorder.get(), nullptr,
                                 10000ms, false, f.clock());

    f.now = at(kMonday, 19, 10);
    scheduler.start();
    REQUIRE(waitUntil([&]() { return scheduler.activeId().has_value(); }, 2000ms));
    REQUIRE(scheduler.statusJson()["running"] == true);

    scheduler.stop();
    REQUIRE_FALSE(scheduler.activeId().has_value());
    REQUIRE(receiver.currentFrequency() == kSavedFrequency);
    REQUIRE(f.recorder->getStatus().scheduleId.empty());
}
