#include "recording_notifier.h"

#include <iostream>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

std::string recordingStatusJson(const RecordingStatusEvent& event) {
    nlohmann::json doc;
    doc["type"] = "recording_status";
    doc["recording"] = event.recording;
    if (event.frequencyHz) {
        doc["frequency"] = *event.frequencyHz;
    } else {
        doc["frequency"] = nullptr;
    }
    return doc.dump();
}

RecordingNotifier::Handle RecordingNotifier::addObserver(Observer observer) {
    if (!observer) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    const Handle handle = m_nextHandle++;
    m_observers.emplace(handle, std::move(observer));
    return handle;
}

bool RecordingNotifier::removeObserver(Handle handle) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_observers.erase(handle) > 0;
}

size_t RecordingNotifier::observerCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_observers.size();
}

void RecordingNotifier::notify(const RecordingStatusEvent& event) {
    std::vector<std::pair<Handle, Observer>> observers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        observers.assign(m_observers.begin(), m_observers.end());
    }

    std::vector<Handle> failed;
    for (const auto& entry : observers) {
        try {
            entry.second(event);
        } catch (const std::exception& ex) {
            std::cerr << "[REC] dropping recording observer " << entry.first << ": " << ex.what()
                      << std::endl;
            failed.push_back(entry.first);
        }
    }

    if (!failed.empty()) {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (Handle handle : failed) {
            m_observers.erase(handle);
        }
    }
}
