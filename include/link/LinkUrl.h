// ============================================================================
// LINK URL - ws:// / wss:// endpoint parsing
// ============================================================================

#ifndef LINK_URL_H
#define LINK_URL_H

#include <cstdint>
#include <string>

struct LinkEndpoint {
  bool secure = false;
  std::string host;
  uint16_t port = 80;
  std::string path = "/";
};

/**
 * Split "ws://host:port/path" into its parts
 * Port defaults to 80 (ws) / 443 (wss), path defaults to "/"
 * @param errorMsg Reason on failure
 */
bool parseLinkUrl(const std::string& url, LinkEndpoint& out, std::string& errorMsg);

#endif // LINK_URL_H
