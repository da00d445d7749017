#include "hawk_string_utils.h"
#include <algorithm>
#include <cctype>

namespace hawk {

std::string ToLower(const std::string& str) {
  std::string result = str;
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

std::string Trim(const std::string& str) {
  size_t start = 0;
  while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
    start++;
  }
  size_t end = str.size();
  while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
    end--;
  }
  return str.substr(start, end - start);
}

std::string NormalizeText(const std::string& str) {
  std::string lowered = ToLower(Trim(str));
  std::string result;
  result.reserve(lowered.size());
  bool in_space = false;
  for (char c : lowered) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!in_space) {
        result.push_back(' ');
        in_space = true;
      }
    } else {
      result.push_back(c);
      in_space = false;
    }
  }
  return result;
}

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

bool StartsWith(const std::string& str, const std::string& prefix) {
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string& str, const std::string& suffix) {
  return str.size() >= suffix.size() &&
         str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string ReplaceAll(std::string str, const std::string& from, const std::string& to) {
  if (from.empty()) return str;
  size_t pos = 0;
  while ((pos = str.find(from, pos)) != std::string::npos) {
    str.replace(pos, from.length(), to);
    pos += to.length();
  }
  return str;
}

std::vector<std::string> SplitAndTrim(const std::string& str, char delim) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (start <= str.size()) {
    size_t end = str.find(delim, start);
    if (end == std::string::npos) end = str.size();
    std::string piece = Trim(str.substr(start, end - start));
    if (!piece.empty()) {
      parts.push_back(piece);
    }
    start = end + 1;
  }
  return parts;
}

std::string Truncate(const std::string& str, size_t max_len) {
  if (str.size() <= max_len) return str;
  return str.substr(0, max_len) + "...";
}

}  // namespace hawk
