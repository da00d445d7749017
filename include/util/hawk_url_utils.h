#pragma once

#include <string>
#include <vector>
#include <utility>
#include <optional>

namespace hawk {

struct ParsedUrl {
  std::string scheme;    // lowercase, empty for relative input
  std::string authority; // host[:port], userinfo kept as-is
  std::string path;
  std::string query;     // without '?'
  std::string fragment;  // without '#'
};

ParsedUrl ParseUrl(const std::string& url);

std::string UrlEncode(const std::string& value);
std::string UrlDecode(const std::string& value);

// Ordered, decoded key/value pairs of a query string
std::vector<std::pair<std::string, std::string>> ParseQuery(const std::string& query);

// First value of a query parameter in url, nullopt when absent or empty
std::optional<std::string> GetQueryParam(const std::string& url, const std::string& name);

std::string BuildFormBody(const std::vector<std::pair<std::string, std::string>>& fields);

// Cache identity of a URL: trimmed, scheme and host lowercased, fragment and
// utm_* parameters removed. Other parameters keep their order.
std::string NormalizeUrlForCache(const std::string& url);

}  // namespace hawk
