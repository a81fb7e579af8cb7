/*
 * CrowdScan - Event Queue
 *
 * Unbounded multi-producer queue feeding one consumer thread. Producers never
 * block; a push after close() is a benign no-op that returns false.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_EVENT_QUEUE_H
#define CROWDSCAN_EVENT_QUEUE_H

#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace crowdscan {

template <typename T>
class EventQueue {
public:
  EventQueue() : m_closed(false) {}

  EventQueue(const EventQueue&) = delete;
  EventQueue& operator=(const EventQueue&) = delete;

  bool push(T item) {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      if (m_closed) return false;
      m_items.push_back(std::move(item));
    }
    m_cv.notify_one();
    return true;
  }

  // Blocks until an item is available. Returns false once closed; items
  // still queued at close are discarded.
  bool pop(T* out) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return m_closed || !m_items.empty(); });
    if (m_closed) return false;
    *out = std::move(m_items.front());
    m_items.pop_front();
    return true;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_closed = true;
      m_items.clear();
    }
    m_cv.notify_all();
  }

  // Reopen an empty queue for a new scan session.
  void reopen() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_items.clear();
    m_closed = false;
  }

  bool isClosed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_items.size();
  }

private:
  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  std::deque<T> m_items;
  bool m_closed;
};

} // namespace crowdscan

#endif // CROWDSCAN_EVENT_QUEUE_H
