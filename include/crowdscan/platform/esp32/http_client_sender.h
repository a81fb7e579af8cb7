/*
 * CrowdScan - HTTPClient Sender
 *
 * HttpSender over the Arduino-ESP32 HTTPClient. Blocking; called from
 * submission threads only.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_HTTP_CLIENT_SENDER_H
#define CROWDSCAN_HTTP_CLIENT_SENDER_H

#include "crowdscan/config.h"
#include "crowdscan/sync/http_sender.h"

namespace crowdscan {
namespace platform {

class HttpClientSender : public sync::HttpSender {
public:
  explicit HttpClientSender(uint32_t timeoutMs = HTTP_TIMEOUT_MS) : m_timeout_ms(timeoutMs) {}

  sync::HttpResponse post(const std::string& url, const std::string& body,
                          const sync::HttpHeaders& headers) override;

private:
  uint32_t m_timeout_ms;
};

} // namespace platform
} // namespace crowdscan

#endif // CROWDSCAN_HTTP_CLIENT_SENDER_H
