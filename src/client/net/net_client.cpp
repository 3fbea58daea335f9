#include "client/net/net_client.h"

#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "common/log.h"
#include "common/protocol/codec.h"

namespace chatimport::client {

namespace {

using chatimport::common::Codec;
using chatimport::common::Logger;
using chatimport::common::LogLevel;
using chatimport::common::Packet;

constexpr int kPollIntervalMs = 20;

// Connected, non-blocking stream socket, or -1 with *error set.
int openStream(const std::string& host, uint16_t port, std::string* error) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  const std::string service = std::to_string(port);
  addrinfo* addresses = nullptr;
  const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &addresses);
  if (rc != 0) {
    *error = "cannot resolve " + host + ": " + ::gai_strerror(rc);
    return -1;
  }

  int fd = -1;
  *error = "no address for " + host;
  for (addrinfo* addr = addresses; addr != nullptr && fd < 0; addr = addr->ai_next) {
    fd = ::socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
    if (fd < 0) {
      continue;
    }
    if (::connect(fd, addr->ai_addr, addr->ai_addrlen) != 0) {
      *error = "cannot connect to " + host + ":" + service;
      ::close(fd);
      fd = -1;
    }
  }
  ::freeaddrinfo(addresses);

  if (fd >= 0) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
      *error = "cannot make socket non-blocking";
      ::close(fd);
      return -1;
    }
  }
  return fd;
}

}  // namespace

NetClient::~NetClient() {
  close();
}

bool NetClient::connect(const std::string& host, uint16_t port, std::string* error) {
  std::string reason = "already connected";
  if (fd_ < 0) {
    fd_ = openStream(host, port, &reason);
  }
  if (fd_ < 0 || io_thread_.joinable()) {
    if (error) {
      *error = reason;
    }
    return false;
  }
  Logger::log(LogLevel::Debug, "connected to import service at " + host + ":" + std::to_string(port));
  connected_ = true;
  io_thread_ = std::thread([this]() { ioLoop(); });
  return true;
}

void NetClient::close() {
  connected_ = false;
  if (fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
  }
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool NetClient::connected() const {
  return connected_;
}

uint64_t NetClient::nextRequestId() {
  return next_request_id_++;
}

bool NetClient::sendJson(chatimport::common::PacketType type,
                         uint64_t request_id,
                         const nlohmann::json& meta,
                         const std::vector<uint8_t>* binary) {
  if (!connected_) {
    return false;
  }
  Packet packet;
  packet.header.type = static_cast<uint16_t>(type);
  packet.header.request_id = request_id;
  packet.meta_json = meta.dump();
  if (packet.meta_json.size() > Codec::kMaxMetaSize || (binary && binary->size() > Codec::kMaxBinarySize)) {
    Logger::log(LogLevel::Warn, std::string(chatimport::common::toString(type)) + " request exceeds frame limits");
    return false;
  }
  if (binary) {
    packet.binary = *binary;
  }
  auto frame = Codec::encode(packet);
  std::lock_guard<std::mutex> lock(mutex_);
  outgoing_.push_back(std::move(frame));
  return true;
}

bool NetClient::pollPacket(Packet* out) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!out || replies_.empty()) {
    return false;
  }
  *out = std::move(replies_.front());
  replies_.pop_front();
  return true;
}

std::string NetClient::lastError() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

void NetClient::ioLoop() {
  while (connected_) {
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = static_cast<short>(POLLIN | (hasOutgoing() ? POLLOUT : 0));
    const int rc = ::poll(&pfd, 1, kPollIntervalMs);
    if (rc < 0 && errno != EINTR) {
      disconnect("poll failed");
    }
    if (rc <= 0) {
      continue;
    }
    if ((pfd.revents & POLLIN) && !readFrames()) {
      return;
    }
    if (pfd.revents & (POLLERR | POLLNVAL)) {
      disconnect("socket error");
    } else if (pfd.revents & POLLHUP) {
      disconnect("connection closed by service");
    } else if ((pfd.revents & POLLOUT) && !writeFrames()) {
      return;
    }
  }
}

bool NetClient::hasOutgoing() {
  std::lock_guard<std::mutex> lock(mutex_);
  return !outgoing_.empty();
}

bool NetClient::writeFrames() {
  bool failed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!outgoing_.empty()) {
      const auto& frame = outgoing_.front();
      const auto sent = ::send(fd_, frame.data() + written_, frame.size() - written_, MSG_NOSIGNAL);
      if (sent < 0) {
        if (errno == EINTR) {
          continue;
        }
        failed = errno != EAGAIN && errno != EWOULDBLOCK;
        break;
      }
      written_ += static_cast<size_t>(sent);
      if (written_ == frame.size()) {
        outgoing_.pop_front();
        written_ = 0;
      }
    }
  }
  if (failed) {
    disconnect("send failed");
  }
  return !failed;
}

bool NetClient::readFrames() {
  uint8_t chunk[16 * 1024];
  std::string closed;
  while (closed.empty()) {
    const auto got = ::recv(fd_, chunk, sizeof(chunk), 0);
    if (got > 0) {
      received_.append(chunk, static_cast<size_t>(got));
    } else if (got == 0) {
      closed = "connection closed by service";
    } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
      break;
    } else if (errno != EINTR) {
      closed = "recv failed";
    }
  }

  std::vector<Packet> decoded;
  std::string error;
  Packet packet;
  Codec::DecodeResult result;
  while ((result = Codec::decode(received_, &packet, &error)) == Codec::DecodeResult::Packet) {
    if (!chatimport::common::isKnownPacketType(packet.header.type)) {
      Logger::log(LogLevel::Warn, "dropping reply of unknown type " + std::to_string(packet.header.type));
      continue;
    }
    decoded.push_back(std::move(packet));
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& reply : decoded) {
      replies_.push_back(std::move(reply));
    }
  }
  if (result == Codec::DecodeResult::Malformed) {
    closed = "malformed reply frame: " + error;
  }
  if (!closed.empty()) {
    disconnect(closed);
    return false;
  }
  return true;
}

void NetClient::disconnect(const std::string& reason) {
  if (!connected_.exchange(false)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = reason;
  }
  Logger::log(LogLevel::Warn, "import service connection: " + reason);
}

}  // namespace chatimport::client
