#include "client/net/net_client.h"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "common/net/byte_buffer.h"
#include "common/protocol/codec.h"

namespace chatimport::client {
namespace {

using chatimport::common::ByteBuffer;
using chatimport::common::Codec;
using chatimport::common::Packet;
using chatimport::common::PacketType;

// Listening socket on 127.0.0.1 with an ephemeral port.
class LoopbackServer {
 public:
  LoopbackServer() {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    if (listen_fd_ >= 0 && ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
        ::listen(listen_fd_, 1) == 0 &&
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
      port_ = ntohs(addr.sin_port);
    }
  }

  ~LoopbackServer() {
    closePeer();
    if (listen_fd_ >= 0) {
      ::close(listen_fd_);
    }
  }

  uint16_t port() const { return port_; }

  bool accept() {
    peer_fd_ = ::accept(listen_fd_, nullptr, nullptr);
    if (peer_fd_ < 0) {
      return false;
    }
    timeval timeout{};
    timeout.tv_sec = 2;
    return ::setsockopt(peer_fd_, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) == 0;
  }

  void closePeer() {
    if (peer_fd_ >= 0) {
      ::close(peer_fd_);
      peer_fd_ = -1;
    }
  }

  bool send(const std::vector<uint8_t>& bytes) {
    size_t offset = 0;
    while (offset < bytes.size()) {
      const auto sent = ::send(peer_fd_, bytes.data() + offset, bytes.size() - offset, MSG_NOSIGNAL);
      if (sent <= 0) {
        return false;
      }
      offset += static_cast<size_t>(sent);
    }
    return true;
  }

  bool receive(Packet* packet) {
    std::string error;
    uint8_t chunk[4096];
    while (Codec::decode(buffer_, packet, &error) == Codec::DecodeResult::NeedMore) {
      const auto got = ::recv(peer_fd_, chunk, sizeof(chunk), 0);
      if (got <= 0) {
        return false;
      }
      buffer_.append(chunk, static_cast<size_t>(got));
    }
    return error.empty();
  }

 private:
  int listen_fd_ = -1;
  int peer_fd_ = -1;
  uint16_t port_ = 0;
  ByteBuffer buffer_;
};

std::vector<uint8_t> frame(uint16_t type, uint64_t request_id, const std::string& meta) {
  Packet packet;
  packet.header.type = type;
  packet.header.request_id = request_id;
  packet.meta_json = meta;
  return Codec::encode(packet);
}

template <typename Predicate>
bool waitFor(Predicate done) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (!done()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

class NetClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_NE(server_.port(), 0);
    std::string error;
    ASSERT_TRUE(client_.connect("127.0.0.1", server_.port(), &error)) << error;
    ASSERT_TRUE(server_.accept());
  }

  LoopbackServer server_;
  NetClient client_;
};

TEST_F(NetClientTest, QueuedRequestReachesTheServiceAsOneFrame) {
  const std::vector<uint8_t> chunk{9, 8, 7};
  const auto id = client_.nextRequestId();
  ASSERT_TRUE(client_.sendJson(PacketType::MediaChunk, id, {{"upload_id", "u1"}, {"offset", 0}}, &chunk));

  Packet packet;
  ASSERT_TRUE(server_.receive(&packet));
  EXPECT_EQ(packet.header.type, static_cast<uint16_t>(PacketType::MediaChunk));
  EXPECT_EQ(packet.header.request_id, id);
  EXPECT_EQ(nlohmann::json::parse(packet.meta_json)["upload_id"], "u1");
  EXPECT_EQ(packet.binary, chunk);
}

TEST_F(NetClientTest, RequestIdsIncrease) {
  const auto first = client_.nextRequestId();
  EXPECT_EQ(client_.nextRequestId(), first + 1);
}

TEST_F(NetClientTest, RepliesArriveInOrder) {
  auto bytes = frame(static_cast<uint16_t>(PacketType::ImportInit), 3, R"({"status":"ok"})");
  const auto second = frame(static_cast<uint16_t>(PacketType::ImportCommit), 4, R"({"status":"ok"})");
  bytes.insert(bytes.end(), second.begin(), second.end());
  ASSERT_TRUE(server_.send(bytes));

  std::vector<Packet> replies;
  ASSERT_TRUE(waitFor([&] {
    Packet packet;
    while (client_.pollPacket(&packet)) {
      replies.push_back(packet);
    }
    return replies.size() == 2;
  }));
  EXPECT_EQ(replies[0].header.request_id, 3u);
  EXPECT_EQ(replies[1].header.request_id, 4u);
  EXPECT_EQ(replies[1].header.type, static_cast<uint16_t>(PacketType::ImportCommit));
}

TEST_F(NetClientTest, RepliesOfUnknownTypeAreDropped) {
  auto bytes = frame(99, 5, "{}");
  const auto known = frame(static_cast<uint16_t>(PacketType::MediaDone), 6, R"({"status":"ok"})");
  bytes.insert(bytes.end(), known.begin(), known.end());
  ASSERT_TRUE(server_.send(bytes));

  Packet packet;
  ASSERT_TRUE(waitFor([&] { return client_.pollPacket(&packet); }));
  EXPECT_EQ(packet.header.request_id, 6u);
  EXPECT_FALSE(client_.pollPacket(&packet));
}

TEST_F(NetClientTest, ReplySentJustBeforeCloseIsKept) {
  ASSERT_TRUE(server_.send(frame(static_cast<uint16_t>(PacketType::MediaOffer), 7, R"({"status":"ok"})")));
  server_.closePeer();

  ASSERT_TRUE(waitFor([&] { return !client_.connected(); }));
  EXPECT_FALSE(client_.lastError().empty());
  Packet packet;
  ASSERT_TRUE(client_.pollPacket(&packet));
  EXPECT_EQ(packet.header.request_id, 7u);
}

TEST_F(NetClientTest, MalformedFrameDropsTheConnection) {
  ASSERT_TRUE(server_.send(std::vector<uint8_t>(Codec::kHeaderSize, 0xAB)));

  ASSERT_TRUE(waitFor([&] { return !client_.connected(); }));
  EXPECT_NE(client_.lastError().find("malformed"), std::string::npos);
}

TEST_F(NetClientTest, SendingAfterCloseFails) {
  client_.close();
  EXPECT_FALSE(client_.connected());
  EXPECT_FALSE(client_.sendJson(PacketType::ImportCommit, client_.nextRequestId(), {{"session_id", "s"}}, nullptr));
}

TEST(NetClientConnectTest, RefusedConnectionReportsAnError) {
  uint16_t port = 0;
  {
    LoopbackServer closed;
    port = closed.port();
  }
  ASSERT_NE(port, 0);

  NetClient client;
  std::string error;
  EXPECT_FALSE(client.connect("127.0.0.1", port, &error));
  EXPECT_FALSE(error.empty());
  EXPECT_FALSE(client.connected());
}

}  // namespace
}  // namespace chatimport::client
