#include "deadline_timer.h"

#include <iostream>
#include <utility>

DeadlineTimer::DeadlineTimer(const std::string& name)
    : m_name(name)
    , m_running(true) {
    m_thread = std::thread(&DeadlineTimer::run, this);
}

DeadlineTimer::~DeadlineTimer() {
    stop();
}

DeadlineTimer::Token DeadlineTimer::schedule(Clock::time_point deadline, Task task) {
    if (!task) {
        return kInvalidToken;
    }
    Token token = kInvalidToken;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return kInvalidToken;
        }
        token = m_nextToken++;
        m_entries.emplace(token, Entry{deadline, std::move(task)});
    }
    m_cv.notify_all();
    return token;
}

DeadlineTimer::Token DeadlineTimer::scheduleAfter(Clock::duration delay, Task task) {
    return schedule(Clock::now() + delay, std::move(task));
}

bool DeadlineTimer::cancel(Token token) {
    if (token == kInvalidToken) {
        return false;
    }
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        removed = m_entries.erase(token) > 0;
    }
    if (removed) {
        m_cv.notify_all();
    }
    return removed;
}

size_t DeadlineTimer::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

void DeadlineTimer::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return;
        }
        m_running = false;
        m_entries.clear();
    }
    m_cv.notify_all();
    if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
        m_thread.join();
    } else if (m_thread.joinable()) {
        m_thread.detach();
    }
}

void DeadlineTimer::run() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (m_running) {
        if (m_entries.empty()) {
            m_cv.wait(lock);
            continue;
        }

        auto earliest = m_entries.begin();
        for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
            if (it->second.deadline < earliest->second.deadline) {
                earliest = it;
            }
        }

        const Clock::time_point deadline = earliest->second.deadline;
        if (Clock::now() < deadline) {
            m_cv.wait_until(lock, deadline);
            continue;
        }

        Task task = std::move(earliest->second.task);
        m_entries.erase(earliest);
        lock.unlock();
        try {
            task();
        } catch (const std::exception& ex) {
            std::cerr << "[" << m_name << "] scheduled task failed: " << ex.what() << std::endl;
        }
        lock.lock();
    }
}
