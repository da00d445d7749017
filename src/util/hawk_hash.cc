#include "hawk_hash.h"
#include "logger.h"
#include <openssl/evp.h>
#include <random>
#include <cstdio>

namespace hawk {

std::string Sha256Hex(const std::string& data) {
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    LOG_ERROR("Hash", "Failed to create EVP_MD_CTX");
    return "";
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx, data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx, digest, &digest_len) != 1) {
    EVP_MD_CTX_free(ctx);
    LOG_ERROR("Hash", "SHA-256 digest failed");
    return "";
  }
  EVP_MD_CTX_free(ctx);

  std::string hex;
  hex.reserve(digest_len * 2);
  char buf[3];
  for (unsigned int i = 0; i < digest_len; ++i) {
    std::snprintf(buf, sizeof(buf), "%02x", digest[i]);
    hex += buf;
  }
  return hex;
}

int StableBucket(const std::string& key, int buckets) {
  if (buckets <= 1) {
    return 0;
  }
  std::string hex = Sha256Hex(key);
  if (hex.size() < 8) {
    return 0;
  }
  uint32_t value = static_cast<uint32_t>(std::stoul(hex.substr(0, 8), nullptr, 16));
  return static_cast<int>(value % static_cast<uint32_t>(buckets));
}

std::string GenerateSessionId() {
  static thread_local std::mt19937_64 gen{std::random_device{}()};
  std::uniform_int_distribution<int> dist(0, 15);
  static const char kHex[] = "0123456789abcdef";

  std::string id;
  id.reserve(12);
  for (int i = 0; i < 12; ++i) {
    id.push_back(kHex[dist(gen)]);
  }
  return id;
}

}  // namespace hawk
