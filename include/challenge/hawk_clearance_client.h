#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "hawk_browser_page.h"
#include "hawk_config.h"
#include "hawk_http_client.h"

namespace hawk {

struct ClearanceResult {
  bool success = false;
  std::vector<CookieData> cookies;
  std::string user_agent;
  std::string error;
};

// Entries without name, value or domain are dropped
std::vector<CookieData> ConvertClearanceCookies(const nlohmann::json& cookies);

/**
 * ClearanceClient - FlareSolverr-compatible full-challenge service
 *
 * The service loads the URL in its own browser (through the given proxy)
 * and hands back the clearance cookies and the user agent they are bound to.
 * The service is optional; every caller handles it being unreachable.
 */
class ClearanceClient {
public:
  ClearanceClient(const ClearanceConfig& config, HttpTransport* transport);

  // GET /health once; the answer is cached for the client's lifetime
  bool IsAvailable();

  ClearanceResult Solve(const std::string& target_url, const std::string& proxy_url = "");

  const std::string& url() const { return url_; }

private:
  bool RequestJson(const HttpResponse& response, nlohmann::json* out, std::string* error) const;

  std::string url_;
  int timeout_seconds_;
  HttpTransport* transport_;
  std::optional<bool> available_;
};

}  // namespace hawk
