// ============================================================================
// ARDUINO HTTP FETCHER IMPLEMENTATION
// ============================================================================

#include "pattern/ArduinoHttpFetcher.h"
#include <WiFi.h>
#include <WiFiClient.h>
#include <WiFiClientSecure.h>
#include <HTTPClient.h>
#include "core/Config.h"
#include "core/logger/Logger.h"

HttpResponse ArduinoHttpFetcher::get(const std::string& url) {
  HttpResponse response;

  if (WiFi.status() != WL_CONNECTED) {
    response.error = "WiFi not connected";
    return response;
  }

  WiFiClientSecure secureClient;
  secureClient.setInsecure();
  WiFiClient plainClient;

  HTTPClient http;
  http.setTimeout(HTTP_TIMEOUT_MS);
  http.setFollowRedirects(HTTPC_STRICT_FOLLOW_REDIRECTS);

  bool secure = url.rfind("https://", 0) == 0;
  bool begun = secure ? http.begin(secureClient, url.c_str()) : http.begin(plainClient, url.c_str());
  if (!begun) {
    response.error = "Invalid URL: " + url;
    return response;
  }

  if (Log.isDebugEnabled()) {
    Log.debug("GET " + url);
  }

  int code = http.GET();
  if (code <= 0) {
    response.status = code;
    response.error = HTTPClient::errorToString(code).c_str();
    http.end();
    return response;
  }

  response.status = code;
  if (code == HTTP_CODE_OK) {
    int declaredSize = http.getSize();  // -1 when chunked
    if (declaredSize > static_cast<int>(MAX_CACHE_FILE_BYTES)) {
      response.status = 0;
      response.error = "Response too large: " + std::to_string(declaredSize) + " bytes";
      http.end();
      return response;
    }

    String payload = http.getString();
    if (payload.length() > MAX_CACHE_FILE_BYTES) {
      response.status = 0;
      response.error = "Response too large: " + std::to_string(payload.length()) + " bytes";
    } else {
      response.body.assign(payload.c_str(), payload.length());
    }
  }

  http.end();
  return response;
}
