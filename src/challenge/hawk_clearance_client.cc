#include "hawk_clearance_client.h"
#include <algorithm>
#include <cstdint>
#include "logger.h"

using json = nlohmann::json;

namespace hawk {

namespace {

const int kHealthTimeoutSeconds = 5;

std::string StringField(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return "";
  if (it->is_string()) return it->get<std::string>();
  return it->dump();
}

bool BoolField(const json& obj, const char* key) {
  auto it = obj.find(key);
  return it != obj.end() && it->is_boolean() && it->get<bool>();
}

}  // namespace

std::vector<CookieData> ConvertClearanceCookies(const json& cookies) {
  std::vector<CookieData> converted;
  if (!cookies.is_array()) return converted;

  for (const auto& cookie : cookies) {
    if (!cookie.is_object()) continue;

    auto value = cookie.find("value");
    CookieData data;
    data.name = StringField(cookie, "name");
    data.domain = StringField(cookie, "domain");
    if (data.name.empty() || data.domain.empty() || value == cookie.end() || value->is_null()) {
      continue;
    }
    data.value = value->is_string() ? value->get<std::string>() : value->dump();

    std::string path = StringField(cookie, "path");
    if (!path.empty()) data.path = path;

    auto expiry = cookie.find("expiry");
    if (expiry != cookie.end() && expiry->is_number() && expiry->get<double>() != 0) {
      data.expires = static_cast<double>(static_cast<int64_t>(expiry->get<double>()));
    }

    data.http_only = BoolField(cookie, "httpOnly");
    data.secure = BoolField(cookie, "secure");

    std::string same_site = StringField(cookie, "sameSite");
    if (!same_site.empty()) data.same_site = same_site;

    converted.push_back(data);
  }
  return converted;
}

ClearanceClient::ClearanceClient(const ClearanceConfig& config, HttpTransport* transport)
    : url_(config.url.empty() ? "http://localhost:8191" : config.url),
      timeout_seconds_(config.timeout_seconds > 0 ? config.timeout_seconds : 60),
      transport_(transport) {
  while (!url_.empty() && url_.back() == '/') {
    url_.pop_back();
  }
}

bool ClearanceClient::RequestJson(const HttpResponse& response, json* out,
                                  std::string* error) const {
  if (!response.success) {
    *error = "Failed to reach clearance service at " + url_ + ": " + response.error;
    return false;
  }
  if (!response.ok()) {
    *error = "HTTP " + std::to_string(response.status_code) + " from clearance service: " +
             response.body.substr(0, 200);
    return false;
  }
  try {
    *out = json::parse(response.body.empty() ? "{}" : response.body);
  } catch (const json::parse_error&) {
    *error = "Non-JSON response from clearance service: " + response.body.substr(0, 200);
    return false;
  }
  if (!out->is_object()) {
    *error = "Unexpected response type from clearance service";
    return false;
  }
  return true;
}

bool ClearanceClient::IsAvailable() {
  if (available_.has_value()) {
    return *available_;
  }

  json doc;
  std::string error;
  HttpResponse response = transport_->Get(url_ + "/health", kHealthTimeoutSeconds);
  if (RequestJson(response, &doc, &error)) {
    available_ = StringField(doc, "status") == "ok";
  } else {
    LOG_DEBUG("ClearanceClient", "Health check failed: " + error);
    available_ = false;
  }

  if (!*available_) {
    LOG_INFO("ClearanceClient", "Clearance service not available at " + url_);
  }
  return *available_;
}

ClearanceResult ClearanceClient::Solve(const std::string& target_url,
                                       const std::string& proxy_url) {
  ClearanceResult result;
  if (target_url.empty()) {
    result.error = "Missing target_url";
    return result;
  }
  if (!IsAvailable()) {
    result.error = "Clearance service not available";
    return result;
  }

  json payload = {
    {"cmd", "request.get"},
    {"url", target_url},
    {"maxTimeout", timeout_seconds_ * 1000}
  };
  if (!proxy_url.empty()) {
    payload["proxy"] = {{"url", proxy_url}};
  }

  HttpResponse response = transport_->PostJson(url_ + "/v1", payload.dump(),
                                               std::max(10, timeout_seconds_ + 10));
  json doc;
  if (!RequestJson(response, &doc, &result.error)) {
    LOG_WARN("ClearanceClient", result.error);
    return result;
  }

  if (StringField(doc, "status") != "ok") {
    std::string message = StringField(doc, "message");
    if (message.empty()) message = StringField(doc, "error");
    result.error = message.empty() ? "Unknown error" : message;
    return result;
  }

  auto solution = doc.find("solution");
  if (solution != doc.end() && solution->is_object()) {
    auto cookies = solution->find("cookies");
    if (cookies != solution->end()) {
      result.cookies = ConvertClearanceCookies(*cookies);
    }
    result.user_agent = StringField(*solution, "userAgent");
  }
  result.success = true;
  return result;
}

}  // namespace hawk
