#include "common/protocol/packet.h"

namespace chatimport::common {

bool isKnownPacketType(uint16_t type) {
  return type >= static_cast<uint16_t>(PacketType::PeerUpgrade) &&
         type <= static_cast<uint16_t>(PacketType::ImportCommit);
}

const char* toString(PacketType type) {
  switch (type) {
    case PacketType::PeerUpgrade:
      return "PeerUpgrade";
    case PacketType::ImportInit:
      return "ImportInit";
    case PacketType::MediaOffer:
      return "MediaOffer";
    case PacketType::MediaChunk:
      return "MediaChunk";
    case PacketType::MediaDone:
      return "MediaDone";
    case PacketType::ImportCommit:
      return "ImportCommit";
    default:
      return "Unknown";
  }
}

}  // namespace chatimport::common
