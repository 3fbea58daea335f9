#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "common/net/byte_buffer.h"
#include "common/protocol/packet.h"

namespace chatimport::common {

class Codec {
 public:
  enum class DecodeResult {
    Packet,
    NeedMore,
    Malformed
  };

  static std::vector<uint8_t> encode(const Packet& packet);

  // Consumes exactly one frame from the buffer on DecodeResult::Packet and
  // nothing otherwise. Malformed frames leave the stream unusable.
  static DecodeResult decode(ByteBuffer& buffer, Packet* out_packet, std::string* error);

  static constexpr size_t kHeaderSize = 28;
  static constexpr uint32_t kMaxMetaSize = 1024 * 1024;
  static constexpr uint32_t kMaxBinarySize = 32 * 1024 * 1024;
};

}  // namespace chatimport::common
