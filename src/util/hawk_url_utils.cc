#include "hawk_url_utils.h"
#include "hawk_string_utils.h"
#include <cctype>
#include <cstdio>

namespace hawk {

namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

ParsedUrl ParseUrl(const std::string& url) {
  ParsedUrl parsed;
  std::string rest = url;

  size_t hash_pos = rest.find('#');
  if (hash_pos != std::string::npos) {
    parsed.fragment = rest.substr(hash_pos + 1);
    rest = rest.substr(0, hash_pos);
  }

  size_t query_pos = rest.find('?');
  if (query_pos != std::string::npos) {
    parsed.query = rest.substr(query_pos + 1);
    rest = rest.substr(0, query_pos);
  }

  size_t scheme_pos = rest.find("://");
  if (scheme_pos != std::string::npos) {
    parsed.scheme = ToLower(rest.substr(0, scheme_pos));
    rest = rest.substr(scheme_pos + 3);
    size_t slash = rest.find('/');
    if (slash == std::string::npos) {
      parsed.authority = rest;
      parsed.path = "";
    } else {
      parsed.authority = rest.substr(0, slash);
      parsed.path = rest.substr(slash);
    }
  } else {
    parsed.path = rest;
  }
  return parsed;
}

std::string UrlEncode(const std::string& value) {
  std::string out;
  out.reserve(value.size() * 3);
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      out += buf;
    }
  }
  return out;
}

std::string UrlDecode(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < value.size() &&
               HexValue(value[i + 1]) >= 0 && HexValue(value[i + 2]) >= 0) {
      out.push_back(static_cast<char>(HexValue(value[i + 1]) * 16 + HexValue(value[i + 2])));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::vector<std::pair<std::string, std::string>> ParseQuery(const std::string& query) {
  std::vector<std::pair<std::string, std::string>> pairs;
  size_t start = 0;
  while (start < query.size()) {
    size_t end = query.find('&', start);
    if (end == std::string::npos) end = query.size();
    std::string item = query.substr(start, end - start);
    if (!item.empty()) {
      size_t eq = item.find('=');
      if (eq == std::string::npos) {
        pairs.emplace_back(UrlDecode(item), "");
      } else {
        pairs.emplace_back(UrlDecode(item.substr(0, eq)), UrlDecode(item.substr(eq + 1)));
      }
    }
    start = end + 1;
  }
  return pairs;
}

std::optional<std::string> GetQueryParam(const std::string& url, const std::string& name) {
  ParsedUrl parsed = ParseUrl(url);
  for (const auto& [key, value] : ParseQuery(parsed.query)) {
    if (key == name && !value.empty()) {
      return value;
    }
  }
  return std::nullopt;
}

std::string BuildFormBody(const std::vector<std::pair<std::string, std::string>>& fields) {
  std::string body;
  for (const auto& [key, value] : fields) {
    if (!body.empty()) body += "&";
    body += UrlEncode(key) + "=" + UrlEncode(value);
  }
  return body;
}

std::string NormalizeUrlForCache(const std::string& url) {
  ParsedUrl parsed = ParseUrl(Trim(url));

  std::string kept_query;
  size_t start = 0;
  while (start < parsed.query.size()) {
    size_t end = parsed.query.find('&', start);
    if (end == std::string::npos) end = parsed.query.size();
    std::string item = parsed.query.substr(start, end - start);
    std::string key = item.substr(0, item.find('='));
    if (!item.empty() && !StartsWith(ToLower(key), "utm_")) {
      if (!kept_query.empty()) kept_query += "&";
      kept_query += item;
    }
    start = end + 1;
  }

  std::string normalized;
  if (!parsed.scheme.empty()) {
    // userinfo is case-sensitive, host is not
    std::string authority = parsed.authority;
    size_t at = authority.rfind('@');
    if (at == std::string::npos) {
      authority = ToLower(authority);
    } else {
      authority = authority.substr(0, at + 1) + ToLower(authority.substr(at + 1));
    }
    normalized = parsed.scheme + "://" + authority;
  }
  normalized += parsed.path;
  if (!kept_query.empty()) {
    normalized += "?" + kept_query;
  }
  return normalized;
}

}  // namespace hawk
