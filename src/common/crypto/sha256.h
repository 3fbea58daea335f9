#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace chatimport::common {

std::string sha256Hex(const uint8_t* data, size_t size);
std::string sha256Hex(const std::vector<uint8_t>& data);

// Streams the file through the digest; returns an empty string on failure.
std::string sha256HexFile(const std::string& path, std::string* error);

}  // namespace chatimport::common
