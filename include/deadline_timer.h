#ifndef DEADLINE_TIMER_H
#define DEADLINE_TIMER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

// One thread that runs scheduled tasks at monotonic deadlines. Tasks run
// without the timer lock held, so a task may schedule or cancel others.
// Cancelling a task that has already started running has no effect; callers
// that care re-check their own state inside the task.
class DeadlineTimer {
public:
  using Clock = std::chrono::steady_clock;
  using Task = std::function<void()>;
  using Token = uint64_t;

  static constexpr Token kInvalidToken = 0;

  explicit DeadlineTimer(const std::string &name = "timer");
  ~DeadlineTimer();

  DeadlineTimer(const DeadlineTimer &) = delete;
  DeadlineTimer &operator=(const DeadlineTimer &) = delete;

  Token schedule(Clock::time_point deadline, Task task);
  Token scheduleAfter(Clock::duration delay, Task task);
  bool cancel(Token token);
  size_t pending() const;
  void stop();

private:
  struct Entry {
    Clock::time_point deadline;
    Task task;
  };

  void run();

  std::string m_name;
  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  std::map<Token, Entry> m_entries;
  Token m_nextToken = 1;
  std::atomic<bool> m_running;
  std::thread m_thread;
};

#endif
