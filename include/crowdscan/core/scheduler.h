/*
 * CrowdScan - Task Scheduler
 *
 * Single worker thread executing one-shot and periodic tasks in deadline
 * order. All delays in the scan and sync paths (debounce, restart backoff,
 * fix timeout, sync tick) are tasks here; nothing busy-waits.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_SCHEDULER_H
#define CROWDSCAN_SCHEDULER_H

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdint.h>
#include <thread>

namespace crowdscan {

typedef uint64_t TaskId;
static constexpr TaskId INVALID_TASK = 0;

class Scheduler {
public:
  explicit Scheduler(const char* name);
  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // Run fn once after delay_ms. Returns INVALID_TASK after shutdown().
  TaskId scheduleAfter(uint32_t delay_ms, std::function<void()> fn);

  // Run fn every period_ms, first run after period_ms.
  TaskId scheduleEvery(uint32_t period_ms, std::function<void()> fn);

  // Never blocks on a task that is currently executing. A cancelled
  // periodic task is not rescheduled.
  void cancel(TaskId id);
  void cancelAll();

  // Stops the worker and drops pending tasks. Must not be called from a task.
  void shutdown();

  size_t pendingCount() const;

private:
  typedef std::chrono::steady_clock Clock;

  struct Task {
    TaskId id;
    uint32_t period_ms;          // 0 for one-shot
    std::function<void()> fn;
  };

  void run();
  TaskId add(uint32_t delay_ms, uint32_t period_ms, std::function<void()> fn);

  const char* m_name;
  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  std::multimap<Clock::time_point, Task> m_queue;
  std::set<TaskId> m_cancelled_running;  // Cancelled while executing
  TaskId m_next_id;
  TaskId m_running_id;
  bool m_stopping;
  std::thread m_worker;
};

} // namespace crowdscan

#endif // CROWDSCAN_SCHEDULER_H
