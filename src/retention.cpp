#include "retention.h"

#include <filesystem>
#include <iostream>
#include <utility>

#include "signal_recorder.h"

namespace fs = std::filesystem;

namespace {
std::chrono::system_clock::time_point toSystemTime(fs::file_time_type ft) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ft - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
}
}  // namespace

RetentionSweeper::RetentionSweeper(std::string directory, int retentionDays, std::chrono::milliseconds interval,
                                   const SignalRecorder* recorder, bool verboseLogging)
    : m_directory(std::move(directory))
    , m_maxAge(std::chrono::hours(24) * (retentionDays > 0 ? retentionDays : 0))
    , m_interval(interval.count() > 0 ? interval : std::chrono::milliseconds(300000))
    , m_recorder(recorder)
    , m_verboseLogging(verboseLogging)
    , m_running(false) {
}

RetentionSweeper::~RetentionSweeper() {
    stop();
}

size_t RetentionSweeper::sweep(std::chrono::system_clock::time_point now) {
    if (m_maxAge.count() <= 0) {
        return 0;
    }

    std::error_code ec;
    fs::directory_iterator it(m_directory, ec);
    if (ec) {
        std::cerr << "[RETAIN] cannot list " << m_directory << ": " << ec.message() << std::endl;
        return 0;
    }

    size_t removed = 0;
    for (const fs::directory_entry& entry : it) {
        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc) || entryEc) {
            continue;
        }
        const std::string path = entry.path().string();
        if (m_recorder && m_recorder->isActiveStagingFile(path)) {
            continue;
        }
        const fs::file_time_type mtime = entry.last_write_time(entryEc);
        if (entryEc) {
            std::cerr << "[RETAIN] cannot stat " << path << ": " << entryEc.message() << std::endl;
            continue;
        }
        if (now - toSystemTime(mtime) <= m_maxAge) {
            continue;
        }
        if (!fs::remove(entry.path(), entryEc) || entryEc) {
            std::cerr << "[RETAIN] could not delete " << path
                      << (entryEc ? ": " + entryEc.message() : std::string()) << std::endl;
            continue;
        }
        removed++;
        if (m_verboseLogging) {
            std::cout << "[RETAIN] deleted " << path << std::endl;
        }
    }

    if (removed > 0) {
        std::cout << "[RETAIN] removed " << removed << " expired recordings" << std::endl;
    }
    return removed;
}

void RetentionSweeper::start() {
    if (m_running.exchange(true)) {
        return;
    }
    m_thread = std::thread([this]() {
        while (m_running) {
            try {
                sweep();
            } catch (const std::exception& ex) {
                std::cerr << "[RETAIN] sweep failed: " << ex.what() << std::endl;
            }
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait_for(lock, m_interval, [this]() { return !m_running.load(); });
        }
    });
}

void RetentionSweeper::stop() {
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
