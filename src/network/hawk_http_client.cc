#include "hawk_http_client.h"
#include "hawk_url_utils.h"
#include "logger.h"
#include <curl/curl.h>
#include <mutex>

namespace hawk {

// Callback for curl to write response data
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
  return size * nmemb;
}

CurlHttpTransport::CurlHttpTransport() {
  static std::once_flag curl_init_flag;
  std::call_once(curl_init_flag, [] {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
      LOG_ERROR("HttpClient", std::string("curl_global_init failed: ") +
                curl_easy_strerror(rc));
    }
  });
}

HttpResponse CurlHttpTransport::Get(const std::string& url, int timeout_seconds) {
  return Perform(url, nullptr, "", timeout_seconds);
}

HttpResponse CurlHttpTransport::PostJson(const std::string& url, const std::string& body,
                                         int timeout_seconds) {
  return Perform(url, &body, "application/json", timeout_seconds);
}

HttpResponse CurlHttpTransport::PostForm(
    const std::string& url,
    const std::vector<std::pair<std::string, std::string>>& fields,
    int timeout_seconds) {
  std::string body = BuildFormBody(fields);
  return Perform(url, &body, "application/x-www-form-urlencoded", timeout_seconds);
}

HttpResponse CurlHttpTransport::Perform(const std::string& url, const std::string* body,
                                        const std::string& content_type,
                                        int timeout_seconds) {
  HttpResponse response;

  CURL* curl = curl_easy_init();
  if (!curl) {
    response.error = "Failed to initialize CURL";
    LOG_ERROR("HttpClient", response.error);
    return response;
  }

  struct curl_slist* headers = nullptr;
  if (!content_type.empty()) {
    std::string header = "Content-Type: " + content_type;
    headers = curl_slist_append(headers, header.c_str());
  }
  headers = curl_slist_append(headers, "Accept: application/json");

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  if (body) {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
  }
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds > 0 ? timeout_seconds : 30));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

  CURLcode res = curl_easy_perform(curl);

  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    response.error = "HTTP request failed: " + std::string(curl_easy_strerror(res));
    LOG_WARN("HttpClient", response.error);
    return response;
  }

  response.success = true;
  response.status_code = http_code;
  if (!response.ok()) {
    response.error = "HTTP error " + std::to_string(http_code);
    LOG_DEBUG("HttpClient", response.error + ": " + response.body.substr(0, 200));
  }
  return response;
}

}  // namespace hawk
