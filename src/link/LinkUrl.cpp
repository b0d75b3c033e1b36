// ============================================================================
// LINK URL IMPLEMENTATION
// ============================================================================

#include "link/LinkUrl.h"
#include <cctype>

bool parseLinkUrl(const std::string& url, LinkEndpoint& out, std::string& errorMsg) {
  LinkEndpoint endpoint;
  std::string rest;

  if (url.rfind("ws://", 0) == 0) {
    rest = url.substr(5);
  } else if (url.rfind("wss://", 0) == 0) {
    endpoint.secure = true;
    endpoint.port = 443;
    rest = url.substr(6);
  } else {
    errorMsg = "Link URL must start with ws:// or wss://: " + url;
    return false;
  }

  size_t slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    endpoint.path = rest.substr(slash);
  }

  size_t colon = authority.rfind(':');
  if (colon != std::string::npos) {
    std::string portStr = authority.substr(colon + 1);
    authority.resize(colon);

    if (portStr.empty() || portStr.size() > 5) {
      errorMsg = "Invalid port in link URL: " + url;
      return false;
    }
    unsigned long port = 0;
    for (char c : portStr) {
      if (!std::isdigit(static_cast<unsigned char>(c))) {
        errorMsg = "Invalid port in link URL: " + url;
        return false;
      }
      port = port * 10 + static_cast<unsigned long>(c - '0');
    }
    if (port == 0 || port > 65535) {
      errorMsg = "Port out of range in link URL: " + url;
      return false;
    }
    endpoint.port = static_cast<uint16_t>(port);
  }

  if (authority.empty()) {
    errorMsg = "Missing host in link URL: " + url;
    return false;
  }
  endpoint.host = authority;

  out = endpoint;
  return true;
}
