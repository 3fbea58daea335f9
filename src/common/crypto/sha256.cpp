#include "common/crypto/sha256.h"

#include <fstream>

#include <openssl/sha.h>

namespace chatimport::common {

namespace {

constexpr size_t kReadBlockSize = 64 * 1024;

std::string digestToHex(const unsigned char* digest, size_t size) {
  static const char kHexDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (size_t i = 0; i < size; ++i) {
    out.push_back(kHexDigits[(digest[i] >> 4) & 0x0F]);
    out.push_back(kHexDigits[digest[i] & 0x0F]);
  }
  return out;
}

}  // namespace

std::string sha256Hex(const uint8_t* data, size_t size) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256_CTX ctx;
  SHA256_Init(&ctx);
  if (data && size > 0) {
    SHA256_Update(&ctx, data, size);
  }
  SHA256_Final(digest, &ctx);
  return digestToHex(digest, SHA256_DIGEST_LENGTH);
}

std::string sha256Hex(const std::vector<uint8_t>& data) {
  return sha256Hex(data.data(), data.size());
}

std::string sha256HexFile(const std::string& path, std::string* error) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    if (error) {
      *error = "failed to open file: " + path;
    }
    return {};
  }

  SHA256_CTX ctx;
  SHA256_Init(&ctx);
  std::vector<char> block(kReadBlockSize);
  while (file) {
    file.read(block.data(), static_cast<std::streamsize>(block.size()));
    const auto read_size = file.gcount();
    if (read_size > 0) {
      SHA256_Update(&ctx, block.data(), static_cast<size_t>(read_size));
    }
  }
  if (file.bad()) {
    if (error) {
      *error = "failed while reading file: " + path;
    }
    return {};
  }

  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256_Final(digest, &ctx);
  return digestToHex(digest, SHA256_DIGEST_LENGTH);
}

}  // namespace chatimport::common
