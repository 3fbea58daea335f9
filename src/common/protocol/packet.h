#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace chatimport::common {

// Requests and their responses share a type; a response echoes the request id.
enum class PacketType : uint16_t {
  PeerUpgrade = 1,
  ImportInit = 2,
  MediaOffer = 3,
  MediaChunk = 4,
  MediaDone = 5,
  ImportCommit = 6
};

bool isKnownPacketType(uint16_t type);
const char* toString(PacketType type);

struct PacketHeader {
  static constexpr uint32_t kMagic = 0x4348494D;  // "CHIM"
  static constexpr uint16_t kVersion = 1;

  uint32_t magic = kMagic;
  uint16_t version = kVersion;
  uint16_t type = 0;
  uint32_t flags = 0;
  uint64_t request_id = 0;
  uint32_t meta_len = 0;
  uint32_t bin_len = 0;
};

struct Packet {
  PacketHeader header;
  std::string meta_json;
  std::vector<uint8_t> binary;
};

}  // namespace chatimport::common
