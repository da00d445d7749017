#pragma once

#include <string>
#include <utility>
#include <vector>

namespace hawk {

struct HttpResponse {
  bool success = false;     // transport-level success, any status code
  long status_code = 0;
  std::string body;
  std::string error;

  bool ok() const { return success && status_code >= 200 && status_code < 300; }
};

/**
 * HttpTransport - the HTTP calls the solver clients make
 */
class HttpTransport {
public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse Get(const std::string& url, int timeout_seconds) = 0;
  virtual HttpResponse PostJson(const std::string& url, const std::string& body,
                                int timeout_seconds) = 0;
  virtual HttpResponse PostForm(const std::string& url,
                                const std::vector<std::pair<std::string, std::string>>& fields,
                                int timeout_seconds) = 0;
};

// libcurl easy-handle implementation, one handle per request
class CurlHttpTransport : public HttpTransport {
public:
  CurlHttpTransport();

  HttpResponse Get(const std::string& url, int timeout_seconds) override;
  HttpResponse PostJson(const std::string& url, const std::string& body,
                        int timeout_seconds) override;
  HttpResponse PostForm(const std::string& url,
                        const std::vector<std::pair<std::string, std::string>>& fields,
                        int timeout_seconds) override;

private:
  HttpResponse Perform(const std::string& url, const std::string* body,
                       const std::string& content_type, int timeout_seconds);
};

}  // namespace hawk
