#pragma once

#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/protocol/packet.h"

namespace chatimport::client {

// Outbound half of a connection to the import service.
class PacketChannel {
 public:
  virtual ~PacketChannel() = default;

  virtual uint64_t nextRequestId() = 0;
  virtual bool sendJson(chatimport::common::PacketType type,
                        uint64_t request_id,
                        const nlohmann::json& meta,
                        const std::vector<uint8_t>* binary) = 0;
};

}  // namespace chatimport::client
