#pragma once

#include <string>
#include <vector>

namespace hawk {

std::string ToLower(const std::string& str);
std::string Trim(const std::string& str);

// Trim, lowercase and collapse inner whitespace runs to one space
std::string NormalizeText(const std::string& str);

bool Contains(const std::string& haystack, const std::string& needle);
bool StartsWith(const std::string& str, const std::string& prefix);
bool EndsWith(const std::string& str, const std::string& suffix);

std::string ReplaceAll(std::string str, const std::string& from, const std::string& to);

// Splits on delim, trims every piece and drops empty ones
std::vector<std::string> SplitAndTrim(const std::string& str, char delim);

// Shortens secrets and keys for log lines
std::string Truncate(const std::string& str, size_t max_len);

}  // namespace hawk
