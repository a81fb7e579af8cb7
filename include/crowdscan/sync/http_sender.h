/*
 * CrowdScan - HTTP Sender
 *
 * Minimal transport seam for the sync pipeline. The firmware implements it
 * with Arduino HTTPClient; tests substitute a scripted fake.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_HTTP_SENDER_H
#define CROWDSCAN_HTTP_SENDER_H

#include <string>
#include <utility>
#include <vector>

namespace crowdscan {
namespace sync {

typedef std::vector<std::pair<std::string, std::string>> HttpHeaders;

struct HttpResponse {
  bool transport_ok = false;   // Request reached the server and a status came back
  int status = 0;
  bool has_body = false;
  std::string body;
  std::string error;           // Transport error text when !transport_ok

  bool isSuccess() const { return transport_ok && status >= 200 && status < 300; }
};

class HttpSender {
public:
  virtual ~HttpSender() {}

  // Blocking POST. Never throws; failures are reported in the response.
  virtual HttpResponse post(const std::string& url, const std::string& body,
                            const HttpHeaders& headers) = 0;
};

} // namespace sync
} // namespace crowdscan

#endif // CROWDSCAN_HTTP_SENDER_H
