#include "orchestrator.h"

#include <algorithm>
#include <iostream>
#include <utility>

const char* orchestratorStateName(OrchestratorState state) {
    switch (state) {
        case OrchestratorState::Manual:
            return "MANUAL";
        case OrchestratorState::Idle:
            return "IDLE";
        case OrchestratorState::Auto:
            return "AUTO";
    }
    return "UNKNOWN";
}

Orchestrator::Orchestrator(std::vector<FrequencyProfile> frequencies, OrchestratorOptions options,
                           ReceiverTuner& tuner, ClientPresenceTracker* presence,
                           DecodingSessionManager* decoders, SignalRecorder* recorder, bool verboseLogging)
    : m_frequencies(std::move(frequencies))
    , m_options(options)
    , m_tuner(tuner)
    , m_presence(presence)
    , m_decoders(decoders)
    , m_recorder(recorder)
    , m_verboseLogging(verboseLogging)
    , m_running(false) {
    if (m_presence) {
        m_goneListener = m_presence->addListener(PresenceEvent::AllRemoteClientsGone, [this](const std::string&) {
            if (state() == OrchestratorState::Manual) {
                std::cout << "[AUTO] no remote clients, entering automatic mode" << std::endl;
                enterAutoMode();
            }
        });
        m_connectedListener =
            m_presence->addListener(PresenceEvent::RemoteClientConnected, [this](const std::string& clientId) {
                if (state() == OrchestratorState::Auto) {
                    std::cout << "[AUTO] remote client " << clientId << " connected, returning to manual mode"
                              << std::endl;
                    exitAutoMode();
                }
            });
    }
}

Orchestrator::~Orchestrator() {
    if (m_presence) {
        m_presence->removeListener(m_goneListener);
        m_presence->removeListener(m_connectedListener);
    }
    stop();
    // A loop stuck in receiver I/O still uses this object; wait it out.
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

bool Orchestrator::start() {
    if (!m_options.enabled) {
        std::cout << "[AUTO] orchestrator disabled" << std::endl;
        return false;
    }
    if (m_frequencies.empty()) {
        std::cerr << "[AUTO] no frequencies configured, orchestrator not started" << std::endl;
        return false;
    }
    if (m_running) {
        return true;
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_running = true;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_loopDone = false;
    }
    m_thread = std::thread(&Orchestrator::runLoop, this);
    std::cout << "[AUTO] orchestrator started with " << m_frequencies.size() << " frequencies" << std::endl;
    return true;
}

void Orchestrator::stop(std::chrono::milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (!m_running.exchange(false) && !m_thread.joinable()) {
            return;
        }
    }
    m_stateCv.notify_all();

    bool finished = false;
    {
        std::unique_lock<std::mutex> lock(m_stateMutex);
        finished = m_stateCv.wait_for(lock, timeout, [this]() { return m_loopDone; });
    }
    if (!finished) {
        std::cerr << "[AUTO] scan loop did not stop within " << timeout.count()
                  << " ms, it will restore the receiver when it returns" << std::endl;
        return;
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }
    if (m_verboseLogging) {
        std::cout << "[AUTO] orchestrator stopped" << std::endl;
    }
}

bool Orchestrator::enterAutoMode() {
    std::lock_guard<std::mutex> control(m_controlMutex);
    if (!m_options.enabled || !m_running || m_frequencies.empty() || m_suspended) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_state == OrchestratorState::Auto) {
            return false;
        }
    }

    m_savedSettings = m_tuner.snapshot();
    if (!m_savedSettings) {
        std::cerr << "[AUTO] could not snapshot receiver settings, they will not be restored" << std::endl;
    }
    m_tuner.beginAutonomousControl();

    if (m_recorder) {
        m_recorderWasArmed = m_recorder->isArmed();
        m_recorder->setArmed(false);
    }

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_index = 0;
        m_consecutiveFailures = 0;
        m_current.reset();
        m_state = OrchestratorState::Auto;
        m_epoch++;
    }
    m_stateCv.notify_all();
    std::cout << "[AUTO] state -> AUTO" << std::endl;
    return true;
}

bool Orchestrator::exitAutoMode() {
    std::lock_guard<std::mutex> control(m_controlMutex);
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_state != OrchestratorState::Auto) {
            return false;
        }
        m_state = OrchestratorState::Manual;
        m_current.reset();
    }
    m_stateCv.notify_all();

    if (m_decoders) {
        try {
            m_decoders->stopSession();
        } catch (const std::exception& ex) {
            std::cerr << "[AUTO] stopping decoding session failed: " << ex.what() << std::endl;
        }
    }
    if (m_recorder) {
        try {
            m_recorder->stopCapture("manual mode");
            m_recorder->setArmed(m_recorderWasArmed);
        } catch (const std::exception& ex) {
            std::cerr << "[AUTO] stopping recording failed: " << ex.what() << std::endl;
        }
    }

    if (m_savedSettings) {
        if (!m_tuner.restore(*m_savedSettings)) {
            std::cerr << "[AUTO] restoring receiver settings failed" << std::endl;
        } else if (m_verboseLogging) {
            std::cout << "[AUTO] restored " << formatFrequencyMHz(m_savedSettings->frequencyHz) << " MHz"
                      << std::endl;
        }
        m_savedSettings.reset();
    }
    m_tuner.endAutonomousControl();
    std::cout << "[AUTO] state -> MANUAL" << std::endl;
    return true;
}

bool Orchestrator::suspend() {
    {
        std::lock_guard<std::mutex> control(m_controlMutex);
        if (m_suspended) {
            return false;
        }
        m_suspended = true;
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_resumeToAuto = m_state == OrchestratorState::Auto;
    }
    std::cout << "[AUTO] suspended" << std::endl;
    exitAutoMode();
    return true;
}

void Orchestrator::resume() {
    bool enter = false;
    {
        std::lock_guard<std::mutex> control(m_controlMutex);
        if (!m_suspended) {
            return;
        }
        m_suspended = false;
        enter = m_presence ? !m_presence->hasRemoteClients() : m_resumeToAuto;
    }
    std::cout << "[AUTO] resumed" << std::endl;
    if (enter) {
        enterAutoMode();
    }
}

OrchestratorState Orchestrator::state() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state;
}

bool Orchestrator::inAuto() const {
    return state() == OrchestratorState::Auto;
}

size_t Orchestrator::currentIndex() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_index;
}

uint64_t Orchestrator::advanceCount() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_advances;
}

OrchestratorStatus Orchestrator::getStatus() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    OrchestratorStatus status;
    status.enabled = m_options.enabled;
    status.running = m_running;
    status.state = m_state;
    status.currentFrequency = m_current;
    status.currentIndex = m_index;
    status.totalFrequencies = m_frequencies.size();
    status.advances = m_advances;
    status.consecutiveTuneFailures = m_consecutiveFailures;
    status.skippedFrequencies = m_skipped;
    status.hasClientPresence = m_presence != nullptr;
    status.hasReceiver = true;
    status.hasDecoders = m_decoders != nullptr;
    status.hasRecorder = m_recorder != nullptr;
    return status;
}

bool Orchestrator::inEpoch(uint64_t epoch) const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state == OrchestratorState::Auto && m_epoch == epoch;
}

bool Orchestrator::waitFor(std::chrono::milliseconds duration, uint64_t epoch) {
    std::unique_lock<std::mutex> lock(m_stateMutex);
    const bool interrupted = m_stateCv.wait_for(lock, duration, [this, epoch]() {
        return !m_running || m_state != OrchestratorState::Auto || m_epoch != epoch;
    });
    return !interrupted;
}

void Orchestrator::backoff(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(m_stateMutex);
    m_stateCv.wait_for(lock, duration, [this]() { return !m_running; });
}

void Orchestrator::runLoop() {
    while (m_running) {
        if (!inAuto()) {
            std::unique_lock<std::mutex> lock(m_stateMutex);
            m_stateCv.wait_for(lock, m_options.dwellTick, [this]() {
                return !m_running || m_state == OrchestratorState::Auto;
            });
            continue;
        }
        try {
            runIteration();
        } catch (const std::exception& ex) {
            std::cerr << "[AUTO] scan iteration failed: " << ex.what() << ", retrying in "
                      << m_options.errorBackoff.count() << " ms" << std::endl;
            backoff(m_options.errorBackoff);
        }
    }

    try {
        exitAutoMode();
    } catch (const std::exception& ex) {
        std::cerr << "[AUTO] leaving automatic mode on stop failed: " << ex.what() << std::endl;
    }
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_loopDone = true;
    }
    m_stateCv.notify_all();
}

void Orchestrator::runIteration() {
    FrequencyProfile profile;
    uint64_t epoch = 0;
    bool tuned = false;
    {
        std::lock_guard<std::mutex> control(m_controlMutex);
        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            if (m_state != OrchestratorState::Auto) {
                return;
            }
            epoch = m_epoch;
            profile = m_frequencies[m_index];
        }

        tuned = m_tuner.tune(profile);
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (tuned) {
            m_consecutiveFailures = 0;
            m_current = profile;
        } else {
            m_consecutiveFailures++;
            std::cerr << "[AUTO] tune to " << formatFrequencyMHz(profile.frequency_hz) << " MHz failed ("
                      << m_consecutiveFailures << " in a row)" << std::endl;
            if (m_options.maxTuneFailures > 0 && m_consecutiveFailures >= m_options.maxTuneFailures) {
                std::cerr << "[AUTO] skipping " << formatFrequencyMHz(profile.frequency_hz) << " MHz after "
                          << m_consecutiveFailures << " failures" << std::endl;
                m_index = (m_index + 1) % m_frequencies.size();
                m_consecutiveFailures = 0;
                m_skipped++;
                return;
            }
        }
    }

    if (!tuned) {
        waitFor(m_options.tuneRetry, epoch);
        return;
    }

    if (m_verboseLogging) {
        std::cout << "[AUTO] tuned " << formatFrequencyMHz(profile.frequency_hz) << " MHz " << profile.mode
                  << (profile.label.empty() ? "" : " (" + profile.label + ")") << ", dwell "
                  << profile.dwell_seconds << " s" << std::endl;
    }

    if (m_options.transitionDelay.count() > 0 && !waitFor(m_options.transitionDelay, epoch)) {
        return;
    }

    {
        std::lock_guard<std::mutex> control(m_controlMutex);
        if (!inEpoch(epoch)) {
            return;
        }
        if (m_decoders && m_options.enableDecoders) {
            m_decoders->startSession(profile.frequency_hz, profile.mode);
        }
        if (m_recorder && m_options.enableRecording) {
            m_recorder->setArmed(true);
        }
    }

    const auto dwellUntil = std::chrono::steady_clock::now() + std::chrono::seconds(profile.dwell_seconds);
    while (m_running && inEpoch(epoch)) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= dwellUntil) {
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(dwellUntil - now);
        waitFor(std::min(remaining + std::chrono::milliseconds(1), m_options.dwellTick), epoch);
    }

    // An exit (and possibly a re-entry) during the dwell already stopped the
    // capture and session and reset the index.
    std::lock_guard<std::mutex> control(m_controlMutex);
    if (!inEpoch(epoch)) {
        return;
    }
    if (m_recorder) {
        m_recorder->stopCapture("dwell complete");
        m_recorder->setArmed(false);
    }
    if (m_decoders) {
        m_decoders->stopSession();
    }
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_index = (m_index + 1) % m_frequencies.size();
    m_advances++;
}
