/*
 * CrowdScan - Task Scheduler Implementation
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/core/scheduler.h"
#include "crowdscan/core/health_log.h"

#include <exception>

namespace crowdscan {

Scheduler::Scheduler(const char* name)
  : m_name(name), m_next_id(1), m_running_id(INVALID_TASK), m_stopping(false) {
  m_worker = std::thread(&Scheduler::run, this);
}

Scheduler::~Scheduler() {
  shutdown();
}

TaskId Scheduler::scheduleAfter(uint32_t delay_ms, std::function<void()> fn) {
  return add(delay_ms, 0, std::move(fn));
}

TaskId Scheduler::scheduleEvery(uint32_t period_ms, std::function<void()> fn) {
  if (period_ms == 0) period_ms = 1;
  return add(period_ms, period_ms, std::move(fn));
}

TaskId Scheduler::add(uint32_t delay_ms, uint32_t period_ms, std::function<void()> fn) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_stopping) return INVALID_TASK;
  TaskId id = m_next_id++;
  Clock::time_point due = Clock::now() + std::chrono::milliseconds(delay_ms);
  m_queue.emplace(due, Task{id, period_ms, std::move(fn)});
  m_cv.notify_all();
  return id;
}

void Scheduler::cancel(TaskId id) {
  if (id == INVALID_TASK) return;
  std::lock_guard<std::mutex> lock(m_mutex);
  for (auto it = m_queue.begin(); it != m_queue.end(); ++it) {
    if (it->second.id == id) {
      m_queue.erase(it);
      m_cv.notify_all();
      return;
    }
  }
  if (m_running_id == id) {
    m_cancelled_running.insert(id);
  }
}

void Scheduler::cancelAll() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_queue.clear();
  if (m_running_id != INVALID_TASK) {
    m_cancelled_running.insert(m_running_id);
  }
  m_cv.notify_all();
}

void Scheduler::shutdown() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stopping && !m_worker.joinable()) return;
    m_stopping = true;
    m_queue.clear();
  }
  m_cv.notify_all();
  if (m_worker.joinable() && m_worker.get_id() != std::this_thread::get_id()) {
    m_worker.join();
  }
}

size_t Scheduler::pendingCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_queue.size();
}

void Scheduler::run() {
  std::unique_lock<std::mutex> lock(m_mutex);
  while (!m_stopping) {
    if (m_queue.empty()) {
      m_cv.wait(lock);
      continue;
    }
    auto next = m_queue.begin();
    if (Clock::now() < next->first) {
      m_cv.wait_until(lock, next->first);
      continue;
    }

    Task task = std::move(next->second);
    Clock::time_point due = next->first;
    m_queue.erase(next);
    m_running_id = task.id;

    lock.unlock();
    try {
      task.fn();
    } catch (const std::exception& e) {
      health_logging::logf(LOG_LEVEL_ERROR, LOG_CAT_SYSTEM, "%s: task %llu threw: %s",
                           m_name, (unsigned long long)task.id, e.what());
    } catch (...) {
      health_logging::logf(LOG_LEVEL_ERROR, LOG_CAT_SYSTEM, "%s: task %llu threw",
                           m_name, (unsigned long long)task.id);
    }
    lock.lock();

    m_running_id = INVALID_TASK;
    bool cancelled = m_cancelled_running.erase(task.id) > 0;
    if (task.period_ms > 0 && !cancelled && !m_stopping) {
      // Fixed-rate schedule; skip missed slots instead of bursting
      Clock::time_point next_due = due + std::chrono::milliseconds(task.period_ms);
      Clock::time_point now = Clock::now();
      if (next_due < now) next_due = now + std::chrono::milliseconds(task.period_ms);
      m_queue.emplace(next_due, std::move(task));
    }
  }
}

} // namespace crowdscan
