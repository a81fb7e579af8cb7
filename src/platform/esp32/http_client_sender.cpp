/*
 * CrowdScan - HTTPClient Sender Implementation
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/platform/esp32/http_client_sender.h"
#include "crowdscan/core/health_log.h"

#include <HTTPClient.h>
#include <WiFi.h>
#include <WiFiClientSecure.h>

namespace crowdscan {
namespace platform {

sync::HttpResponse HttpClientSender::post(const std::string& url, const std::string& body,
                                          const sync::HttpHeaders& headers) {
  sync::HttpResponse r;
  if (WiFi.status() != WL_CONNECTED) {
    r.error = "wifi not connected";
    return r;
  }

  HTTPClient http;
  WiFiClientSecure tls;
  http.setTimeout(m_timeout_ms);
  http.setConnectTimeout(m_timeout_ms);

  bool begun;
  if (url.compare(0, 8, "https://") == 0) {
    // TODO: pin the collector CA once the deployment certificate is fixed
    tls.setInsecure();
    begun = http.begin(tls, url.c_str());
  } else {
    begun = http.begin(url.c_str());
  }
  if (!begun) {
    r.error = "bad url";
    return r;
  }

  for (const auto& h : headers) http.addHeader(h.first.c_str(), h.second.c_str());

  int code = http.POST((uint8_t*)body.data(), body.size());
  if (code <= 0) {
    r.error = HTTPClient::errorToString(code).c_str();
    log_health(LOG_LEVEL_WARNING, LOG_CAT_NETWORK, "POST failed", r.error.c_str());
    http.end();
    return r;
  }

  r.transport_ok = true;
  r.status = code;
  String payload = http.getString();
  r.has_body = payload.length() > 0;
  r.body.assign(payload.c_str(), payload.length());
  http.end();
  return r;
}

} // namespace platform
} // namespace crowdscan
