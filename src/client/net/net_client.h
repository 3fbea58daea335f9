#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "client/net/packet_channel.h"
#include "common/net/byte_buffer.h"
#include "common/protocol/packet.h"

namespace chatimport::client {

// Connection to the import service. Frames queued by sendJson() are written
// by a background thread, which also decodes replies for pollPacket(). Once
// the connection drops, connected() turns false and lastError() says why.
class NetClient : public PacketChannel {
 public:
  NetClient() = default;
  ~NetClient() override;

  NetClient(const NetClient&) = delete;
  NetClient& operator=(const NetClient&) = delete;

  bool connect(const std::string& host, uint16_t port, std::string* error);
  void close();
  bool connected() const;

  uint64_t nextRequestId() override;
  bool sendJson(chatimport::common::PacketType type,
                uint64_t request_id,
                const nlohmann::json& meta,
                const std::vector<uint8_t>* binary) override;

  bool pollPacket(chatimport::common::Packet* out);
  std::string lastError() const;

 private:
  void ioLoop();
  bool hasOutgoing();
  bool writeFrames();
  bool readFrames();
  void disconnect(const std::string& reason);

  int fd_ = -1;
  std::atomic<bool> connected_{false};
  std::thread io_thread_;
  std::atomic<uint64_t> next_request_id_{1};

  mutable std::mutex mutex_;
  std::string last_error_;
  std::deque<std::vector<uint8_t>> outgoing_;
  size_t written_ = 0;  // bytes of outgoing_.front() already sent
  std::deque<chatimport::common::Packet> replies_;

  // I/O thread only.
  chatimport::common::ByteBuffer received_;
};

}  // namespace chatimport::client
