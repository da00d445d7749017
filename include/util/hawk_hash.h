#pragma once

#include <string>
#include <cstdint>

namespace hawk {

// Lowercase hex SHA-256 of data, empty string if OpenSSL fails
std::string Sha256Hex(const std::string& data);

// int(sha256(key)[:8], 16) % buckets; 0 when buckets <= 1
int StableBucket(const std::string& key, int buckets);

// 12 lowercase hex characters
std::string GenerateSessionId();

}  // namespace hawk
