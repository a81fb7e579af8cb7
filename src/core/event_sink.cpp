/*
 * CrowdScan - Event Sink
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/core/event_sink.h"
#include "crowdscan/core/health_log.h"

#include <exception>
#include <vector>

namespace crowdscan {

struct PendingEvent {
  const EventDispatcher* dispatcher;
  const char* name;
  bool is_string;
  int32_t value;
  std::string text;
};

static thread_local uint32_t t_deferral_depth = 0;
static thread_local std::vector<PendingEvent> t_pending;

// ════════════════════════════════════════════════════════════════════════════
// DISPATCHER
// ════════════════════════════════════════════════════════════════════════════

void EventDispatcher::emit(const char* name, int32_t value) const {
  if (!m_sink) return;
  if (t_deferral_depth > 0) {
    t_pending.push_back(PendingEvent{this, name, false, value, std::string()});
    return;
  }
  deliver(name, value);
}

void EventDispatcher::emitString(const char* name, const std::string& value) const {
  if (!m_sink) return;
  if (t_deferral_depth > 0) {
    t_pending.push_back(PendingEvent{this, name, true, 0, value});
    return;
  }
  deliverString(name, value);
}

void EventDispatcher::deliver(const char* name, int32_t value) const {
  EventSink* sink = m_sink;
  if (!sink) return;
  try {
    sink->sendEvent(name, value);
  } catch (const std::exception& e) {
    health_logging::logf(LOG_LEVEL_WARNING, LOG_CAT_SYSTEM,
                         "Event sink failed for %s: %s", name, e.what());
  } catch (...) {
    health_logging::logf(LOG_LEVEL_WARNING, LOG_CAT_SYSTEM,
                         "Event sink failed for %s: unknown exception", name);
  }
}

void EventDispatcher::deliverString(const char* name, const std::string& value) const {
  EventSink* sink = m_sink;
  if (!sink) return;
  try {
    sink->sendStringEvent(name, value);
  } catch (const std::exception& e) {
    health_logging::logf(LOG_LEVEL_WARNING, LOG_CAT_SYSTEM,
                         "Event sink failed for %s: %s", name, e.what());
  } catch (...) {
    health_logging::logf(LOG_LEVEL_WARNING, LOG_CAT_SYSTEM,
                         "Event sink failed for %s: unknown exception", name);
  }
}

// ════════════════════════════════════════════════════════════════════════════
// DEFERRAL
// ════════════════════════════════════════════════════════════════════════════

EventDeferral::EventDeferral() {
  t_deferral_depth++;
}

EventDeferral::~EventDeferral() {
  if (--t_deferral_depth > 0) return;

  // Sinks may emit again while we deliver; those go through directly
  std::vector<PendingEvent> pending;
  pending.swap(t_pending);
  for (const PendingEvent& e : pending) {
    if (e.is_string) {
      e.dispatcher->deliverString(e.name, e.text);
    } else {
      e.dispatcher->deliver(e.name, e.value);
    }
  }
}

} // namespace crowdscan
