/*
 * CrowdScan - ESP32 Connectivity
 *
 * Radio availability for the orchestrator. The controller is brought up
 * lazily by the discovery sources, so availability is the operator toggle
 * plus a controller that has not failed.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_ESP32_CONNECTIVITY_H
#define CROWDSCAN_ESP32_CONNECTIVITY_H

#include <atomic>
#include <functional>
#include "crowdscan/location/location_oracle.h"

namespace crowdscan {
namespace platform {

class Esp32Connectivity : public location::ConnectivityOracle {
public:
  typedef std::function<void(bool enabled)> ChangeHandler;

  Esp32Connectivity() : m_enabled(true) {}

  bool isRadioEnabled() override;

  // Operator toggle; the handler runs on the caller's thread.
  void setEnabled(bool enabled);
  void onChange(const ChangeHandler& handler) { m_handler = handler; }

private:
  std::atomic<bool> m_enabled;
  ChangeHandler m_handler;
};

} // namespace platform
} // namespace crowdscan

#endif // CROWDSCAN_ESP32_CONNECTIVITY_H
