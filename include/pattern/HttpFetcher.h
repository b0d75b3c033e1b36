// ============================================================================
// HTTP FETCHER - GET abstraction used by PatternCache
// ============================================================================
// Firmware implementation: ArduinoHttpFetcher (HTTPClient + WiFiClientSecure)
// ============================================================================

#ifndef HTTP_FETCHER_H
#define HTTP_FETCHER_H

#include <string>

struct HttpResponse {
  int status = 0;       // HTTP status, <= 0 for transport errors
  std::string body;
  std::string error;    // Transport error description
};

class HttpFetcher {
public:
  virtual ~HttpFetcher() = default;

  virtual HttpResponse get(const std::string& url) = 0;
};

#endif // HTTP_FETCHER_H
