#include "receiver_tuner.h"

#include <algorithm>
#include <cctype>
#include <iostream>

const char* controlResultName(ControlResult result) {
    switch (result) {
        case ControlResult::Ok:
            return "ok";
        case ControlResult::Failed:
            return "failed";
        case ControlResult::Unsupported:
            return "unsupported";
    }
    return "failed";
}

namespace {
std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}
}  // namespace

ReceiverTuner::ReceiverTuner(ReceiverControl& control, bool verboseLogging)
    : m_control(control)
    , m_verboseLogging(verboseLogging)
    , m_autonomous(false)
    , m_currentFrequency(0) {
}

bool ReceiverTuner::tune(uint64_t frequencyHz, const std::string& mode, float squelch, uint32_t bandwidthHz) {
    std::lock_guard<std::mutex> lock(m_mutex);

    const ControlResult freqResult = m_control.setFrequency(frequencyHz);
    if (freqResult != ControlResult::Ok) {
        std::cerr << "[TUNER] " << m_control.name() << ": set frequency " << frequencyHz << " Hz "
                  << controlResultName(freqResult) << std::endl;
        return false;
    }
    m_currentFrequency = frequencyHz;

    if (!mode.empty()) {
        const std::string upper = toUpper(mode);
        const ControlResult result = m_control.setMode(upper);
        if (result == ControlResult::Failed) {
            std::cerr << "[TUNER] warning: set mode " << upper << " failed" << std::endl;
        } else if (result == ControlResult::Unsupported && m_verboseLogging) {
            std::cout << "[TUNER] " << m_control.name() << " cannot set mode, skipping" << std::endl;
        }
    }

    const float clamped = std::clamp(squelch, 0.0f, 1.0f);
    const ControlResult squelchResult = m_control.setSquelch(clamped);
    if (squelchResult == ControlResult::Failed) {
        std::cerr << "[TUNER] warning: set squelch " << clamped << " failed" << std::endl;
    } else if (squelchResult == ControlResult::Unsupported && m_verboseLogging) {
        std::cout << "[TUNER] " << m_control.name() << " cannot set squelch, skipping" << std::endl;
    }

    if (bandwidthHz > 0) {
        const ControlResult result = m_control.setBandwidth(bandwidthHz);
        if (result == ControlResult::Failed) {
            std::cerr << "[TUNER] warning: set bandwidth " << bandwidthHz << " Hz failed" << std::endl;
        } else if (result == ControlResult::Unsupported && m_verboseLogging) {
            std::cout << "[TUNER] " << m_control.name() << " cannot set bandwidth, skipping" << std::endl;
        }
    }

    if (m_verboseLogging) {
        std::cout << "[TUNER] tuned to " << formatFrequencyMHz(frequencyHz) << " MHz " << toUpper(mode)
                  << std::endl;
    }
    return true;
}

bool ReceiverTuner::tune(const FrequencyProfile& profile) {
    return tune(profile.frequency_hz, profile.mode, profile.squelch, profile.bandwidth_hz);
}

std::optional<TuningSettings> ReceiverTuner::snapshot() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::optional<TuningSettings> settings = m_control.currentSettings();
    if (!settings && m_currentFrequency.load() != 0) {
        TuningSettings fallback;
        fallback.frequencyHz = m_currentFrequency.load();
        settings = fallback;
    }
    if (m_verboseLogging) {
        if (settings) {
            std::cout << "[TUNER] saved settings at " << formatFrequencyMHz(settings->frequencyHz) << " MHz"
                      << std::endl;
        } else {
            std::cout << "[TUNER] receiver reported no settings to save" << std::endl;
        }
    }
    return settings;
}

bool ReceiverTuner::restore(const TuningSettings& settings) {
    if (settings.frequencyHz == 0) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_control.setFrequency(settings.frequencyHz) != ControlResult::Ok) {
        std::cerr << "[TUNER] restore: set frequency " << settings.frequencyHz << " Hz failed" << std::endl;
        return false;
    }
    m_currentFrequency = settings.frequencyHz;

    // Only fields the backend reported at snapshot time are written back.
    if (settings.mode && m_control.setMode(*settings.mode) == ControlResult::Failed) {
        std::cerr << "[TUNER] restore: set mode " << *settings.mode << " failed" << std::endl;
    }
    if (settings.squelch && m_control.setSquelch(*settings.squelch) == ControlResult::Failed) {
        std::cerr << "[TUNER] restore: set squelch failed" << std::endl;
    }
    if (settings.bandwidthHz && *settings.bandwidthHz > 0 &&
        m_control.setBandwidth(*settings.bandwidthHz) == ControlResult::Failed) {
        std::cerr << "[TUNER] restore: set bandwidth failed" << std::endl;
    }

    if (m_verboseLogging) {
        std::cout << "[TUNER] restored " << formatFrequencyMHz(settings.frequencyHz) << " MHz" << std::endl;
    }
    return true;
}

void ReceiverTuner::beginAutonomousControl() {
    m_autonomous = true;
    m_control.beginAutonomousControl();
}

void ReceiverTuner::endAutonomousControl() {
    m_autonomous = false;
    m_control.endAutonomousControl();
}
