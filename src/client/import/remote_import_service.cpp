#include "client/import/remote_import_service.h"

#include <algorithm>
#include <filesystem>
#include <utility>
#include <vector>

#include "common/crypto/sha256.h"
#include "common/fs.h"
#include "common/log.h"
#include "common/protocol/codec.h"

namespace chatimport::client {

namespace {

using chatimport::common::Logger;
using chatimport::common::LogLevel;
using chatimport::common::PacketType;

constexpr const char* kStatusOk = "ok";
constexpr const char* kStatusChatAdminRequired = "chat_admin_required";
constexpr const char* kStatusInvalidChatType = "invalid_chat_type";
constexpr const char* kStatusMalformedReply = "malformed_reply";
constexpr const char* kStatusSendFailed = "send_failed";
constexpr const char* kStatusLocalFile = "local_file_error";
constexpr const char* kStatusConnectionLost = "connection_lost";

InitSessionError initErrorFor(const std::string& status) {
  if (status == kStatusChatAdminRequired) {
    return InitSessionError::ChatAdminRequired;
  }
  if (status == kStatusInvalidChatType) {
    return InitSessionError::InvalidChatType;
  }
  return InitSessionError::Generic;
}

UploadMediaError uploadErrorFor(const std::string& status) {
  if (status == kStatusChatAdminRequired) {
    return UploadMediaError::ChatAdminRequired;
  }
  return UploadMediaError::Generic;
}

bool readWholeFile(const std::string& path, std::vector<uint8_t>* out, std::string* error) {
  int64_t size = 0;
  if (!chatimport::common::fileSize(path, &size, error)) {
    return false;
  }
  if (size > static_cast<int64_t>(chatimport::common::Codec::kMaxBinarySize)) {
    if (error) {
      *error = path + " is too large to send in one packet";
    }
    return false;
  }
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    if (error) {
      *error = "failed to open " + path;
    }
    return false;
  }
  std::vector<uint8_t> data(static_cast<size_t>(size));
  if (size > 0) {
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
    if (file.gcount() != static_cast<std::streamsize>(size)) {
      if (error) {
        *error = "short read from " + path;
      }
      return false;
    }
  }
  *out = std::move(data);
  return true;
}

}  // namespace

class RemoteImportService::CallHandle : public Operation {
 public:
  CallHandle(std::weak_ptr<Registry> registry, uint64_t call_id)
      : registry_(std::move(registry)), call_id_(call_id) {}

  void cancel() override {
    if (auto registry = registry_.lock()) {
      registry->cancel(call_id_);
    }
  }

 private:
  std::weak_ptr<Registry> registry_;
  uint64_t call_id_;
};

void RemoteImportService::Registry::cancel(uint64_t call_id) {
  auto it = calls.find(call_id);
  if (it == calls.end()) {
    return;
  }
  requests.erase(it->second.request_id);
  calls.erase(it);
}

RemoteImportService::RemoteImportService(PacketChannel& channel, int chunk_size)
    : channel_(channel), chunk_size_(chunk_size > 0 ? chunk_size : 128 * 1024),
      registry_(std::make_shared<Registry>()) {}

RemoteImportService::~RemoteImportService() = default;

OperationPtr RemoteImportService::convertGroupToSupergroup(const PeerId& peer, ConvertGroupCallbacks callbacks) {
  Call call;
  call.kind = CallKind::ConvertGroup;
  call.peer = peer;
  call.convert = std::move(callbacks);
  uint64_t call_id = 0;
  auto handle = registerCall(std::move(call), &call_id);

  nlohmann::json meta;
  meta["peer_kind"] = toString(peer.kind);
  meta["peer_id"] = peer.id;
  if (!sendRequest(call_id, PacketType::PeerUpgrade, meta, nullptr)) {
    deferFailure(call_id, kStatusSendFailed);
  }
  return handle;
}

OperationPtr RemoteImportService::initiateSession(const PeerId& peer,
                                                  const std::string& primary_file,
                                                  int media_count,
                                                  InitSessionCallbacks callbacks) {
  Call call;
  call.kind = CallKind::InitSession;
  call.peer = peer;
  call.media_count = media_count;
  call.init = std::move(callbacks);
  uint64_t call_id = 0;
  auto handle = registerCall(std::move(call), &call_id);

  std::vector<uint8_t> contents;
  std::string error;
  if (!readWholeFile(primary_file, &contents, &error)) {
    Logger::log(LogLevel::Error, "cannot send chat history: " + error);
    deferFailure(call_id, kStatusLocalFile);
    return handle;
  }

  nlohmann::json meta;
  meta["peer_kind"] = toString(peer.kind);
  meta["peer_id"] = peer.id;
  meta["media_count"] = media_count;
  meta["file_name"] = std::filesystem::path(primary_file).filename().string();
  meta["file_size"] = static_cast<int64_t>(contents.size());
  meta["sha256"] = chatimport::common::sha256Hex(contents);
  if (!sendRequest(call_id, PacketType::ImportInit, meta, &contents)) {
    deferFailure(call_id, kStatusSendFailed);
  }
  return handle;
}

OperationPtr RemoteImportService::uploadMedia(const ImportSession& session,
                                              const MediaUpload& upload,
                                              UploadMediaCallbacks callbacks) {
  Call call;
  call.kind = CallKind::Upload;
  call.upload = std::move(callbacks);
  call.task.file_path = upload.file_path;
  call.task.chunk_size = chunk_size_;
  uint64_t call_id = 0;
  auto handle = registerCall(std::move(call), &call_id);

  std::string error;
  int64_t size = 0;
  if (!chatimport::common::fileSize(upload.file_path, &size, &error)) {
    Logger::log(LogLevel::Error, "cannot upload " + upload.display_name + ": " + error);
    deferFailure(call_id, kStatusLocalFile);
    return handle;
  }
  const auto sha256 = chatimport::common::sha256HexFile(upload.file_path, &error);
  if (sha256.empty()) {
    Logger::log(LogLevel::Error, "cannot upload " + upload.display_name + ": " + error);
    deferFailure(call_id, kStatusLocalFile);
    return handle;
  }
  registry_->calls[call_id].task.file_size = size;

  nlohmann::json meta;
  meta["session_id"] = session.id;
  meta["file_name"] = upload.display_name;
  meta["mime_type"] = upload.mime_type;
  meta["media_type"] = toString(upload.media_type);
  meta["file_size"] = size;
  meta["sha256"] = sha256;
  meta["chunk_size"] = chunk_size_;
  if (!sendRequest(call_id, PacketType::MediaOffer, meta, nullptr)) {
    deferFailure(call_id, kStatusSendFailed);
  }
  return handle;
}

OperationPtr RemoteImportService::commitImport(const ImportSession& session, CommitImportCallbacks callbacks) {
  Call call;
  call.kind = CallKind::Commit;
  call.commit = std::move(callbacks);
  uint64_t call_id = 0;
  auto handle = registerCall(std::move(call), &call_id);

  nlohmann::json meta;
  meta["session_id"] = session.id;
  if (!sendRequest(call_id, PacketType::ImportCommit, meta, nullptr)) {
    deferFailure(call_id, kStatusSendFailed);
  }
  return handle;
}

bool RemoteImportService::handlePacket(const chatimport::common::Packet& packet) {
  auto request_it = registry_->requests.find(packet.header.request_id);
  if (request_it == registry_->requests.end()) {
    return false;
  }
  const uint64_t call_id = request_it->second;
  registry_->requests.erase(request_it);
  auto call_it = registry_->calls.find(call_id);
  if (call_it == registry_->calls.end()) {
    return true;
  }

  nlohmann::json meta;
  try {
    meta = packet.meta_json.empty() ? nlohmann::json::object() : nlohmann::json::parse(packet.meta_json);
  } catch (const nlohmann::json::exception& ex) {
    Logger::log(LogLevel::Warn, std::string("unparseable reply from import service: ") + ex.what());
    fail(call_id, kStatusMalformedReply);
    return true;
  }
  if (!meta.is_object()) {
    fail(call_id, kStatusMalformedReply);
    return true;
  }

  // Field reads throw on a wrongly typed value; such a reply fails the call.
  try {
    const auto status = meta.value("status", std::string(kStatusOk));
    if (status != kStatusOk) {
      Logger::log(LogLevel::Warn,
                  std::string(chatimport::common::toString(static_cast<PacketType>(packet.header.type))) +
                      " rejected: " + status + " " + meta.value("message", std::string()));
    }

    const auto type = static_cast<PacketType>(packet.header.type);
    const CallKind kind = call_it->second.kind;
    if (kind == CallKind::ConvertGroup && type == PacketType::PeerUpgrade) {
      handleConvertReply(call_id, status, meta);
    } else if (kind == CallKind::InitSession && type == PacketType::ImportInit) {
      handleInitReply(call_id, status, meta);
    } else if (kind == CallKind::Upload && type == PacketType::MediaOffer) {
      handleOfferReply(call_id, status, meta);
    } else if (kind == CallKind::Upload && type == PacketType::MediaChunk) {
      handleChunkReply(call_id, status, meta);
    } else if (kind == CallKind::Upload && type == PacketType::MediaDone) {
      handleDoneReply(call_id, status);
    } else if (kind == CallKind::Commit && type == PacketType::ImportCommit) {
      handleCommitReply(call_id, status);
    } else {
      Logger::log(LogLevel::Warn, "reply type does not match request " + std::to_string(packet.header.request_id));
      fail(call_id, kStatusMalformedReply);
    }
  } catch (const nlohmann::json::exception& ex) {
    Logger::log(LogLevel::Warn, std::string("malformed reply from import service: ") + ex.what());
    fail(call_id, kStatusMalformedReply);
  }
  return true;
}

void RemoteImportService::dispatchDeferred() {
  std::deque<std::pair<uint64_t, std::string>> failures;
  failures.swap(registry_->deferred_failures);
  for (const auto& failure : failures) {
    fail(failure.first, failure.second);
  }
}

void RemoteImportService::failAll(const std::string& reason) {
  if (registry_->calls.empty()) {
    return;
  }
  Logger::log(LogLevel::Warn,
              "failing " + std::to_string(registry_->calls.size()) + " pending import calls: " + reason);
  std::vector<uint64_t> ids;
  ids.reserve(registry_->calls.size());
  for (const auto& entry : registry_->calls) {
    ids.push_back(entry.first);
  }
  std::sort(ids.begin(), ids.end());
  for (const auto id : ids) {
    fail(id, kStatusConnectionLost);
  }
}

size_t RemoteImportService::pendingOperations() const {
  return registry_->calls.size();
}

OperationPtr RemoteImportService::registerCall(Call call, uint64_t* call_id) {
  const uint64_t id = registry_->next_call_id++;
  registry_->calls.emplace(id, std::move(call));
  if (call_id) {
    *call_id = id;
  }
  return std::make_unique<CallHandle>(registry_, id);
}

bool RemoteImportService::sendRequest(uint64_t call_id,
                                      PacketType type,
                                      const nlohmann::json& meta,
                                      const std::vector<uint8_t>* binary) {
  auto it = registry_->calls.find(call_id);
  if (it == registry_->calls.end()) {
    return false;
  }
  registry_->requests.erase(it->second.request_id);
  const uint64_t request_id = channel_.nextRequestId();
  it->second.request_id = request_id;
  if (!channel_.sendJson(type, request_id, meta, binary)) {
    Logger::log(LogLevel::Warn, std::string("failed to send ") + chatimport::common::toString(type));
    return false;
  }
  registry_->requests[request_id] = call_id;
  return true;
}

void RemoteImportService::deferFailure(uint64_t call_id, const std::string& status) {
  registry_->deferred_failures.emplace_back(call_id, status);
}

void RemoteImportService::handleConvertReply(uint64_t call_id, const std::string& status, const nlohmann::json& meta) {
  if (status != kStatusOk) {
    fail(call_id, status);
    return;
  }
  PeerId peer;
  const auto kind = meta.value("peer_kind", std::string());
  const auto id = meta.value("peer_id", static_cast<int64_t>(0));
  if (!parsePeerKind(kind, &peer.kind) || id <= 0) {
    fail(call_id, kStatusMalformedReply);
    return;
  }
  peer.id = id;
  auto callback = std::move(registry_->calls[call_id].convert.converted);
  registry_->cancel(call_id);
  if (callback) {
    callback(peer);
  }
}

void RemoteImportService::handleInitReply(uint64_t call_id, const std::string& status, const nlohmann::json& meta) {
  if (status != kStatusOk) {
    fail(call_id, status);
    return;
  }
  auto& call = registry_->calls[call_id];
  ImportSession session;
  session.id = meta.value("session_id", std::string());
  session.peer = call.peer;
  session.media_count = call.media_count;
  if (session.id.empty()) {
    fail(call_id, kStatusMalformedReply);
    return;
  }
  auto callback = std::move(call.init.ready);
  registry_->cancel(call_id);
  if (callback) {
    callback(session);
  }
}

void RemoteImportService::handleOfferReply(uint64_t call_id, const std::string& status, const nlohmann::json& meta) {
  if (status != kStatusOk) {
    fail(call_id, status);
    return;
  }
  auto& task = registry_->calls[call_id].task;
  task.upload_id = meta.value("upload_id", std::string());
  const int chunk_size = meta.value("chunk_size", chunk_size_);
  task.chunk_size = chunk_size > 0 ? chunk_size : chunk_size_;
  task.next_offset = std::clamp<int64_t>(meta.value("next_offset", static_cast<int64_t>(0)), 0, task.file_size);
  if (task.upload_id.empty()) {
    fail(call_id, kStatusMalformedReply);
    return;
  }
  reportUploadProgress(call_id);
  continueUpload(call_id);
}

void RemoteImportService::handleChunkReply(uint64_t call_id, const std::string& status, const nlohmann::json& meta) {
  if (status != kStatusOk) {
    fail(call_id, status);
    return;
  }
  auto& task = registry_->calls[call_id].task;
  const auto next_offset = meta.value("next_offset", static_cast<int64_t>(-1));
  if (next_offset < task.next_offset || next_offset > task.file_size) {
    fail(call_id, kStatusMalformedReply);
    return;
  }
  task.next_offset = next_offset;
  reportUploadProgress(call_id);
  continueUpload(call_id);
}

void RemoteImportService::handleDoneReply(uint64_t call_id, const std::string& status) {
  if (status != kStatusOk) {
    fail(call_id, status);
    return;
  }
  auto callback = std::move(registry_->calls[call_id].upload.completed);
  registry_->cancel(call_id);
  if (callback) {
    callback();
  }
}

void RemoteImportService::handleCommitReply(uint64_t call_id, const std::string& status) {
  if (status != kStatusOk) {
    fail(call_id, status);
    return;
  }
  auto callback = std::move(registry_->calls[call_id].commit.completed);
  registry_->cancel(call_id);
  if (callback) {
    callback();
  }
}

void RemoteImportService::continueUpload(uint64_t call_id) {
  auto it = registry_->calls.find(call_id);
  if (it == registry_->calls.end()) {
    return;
  }
  auto& task = it->second.task;
  if (task.next_offset >= task.file_size) {
    task.finishing = true;
    task.stream.reset();
    nlohmann::json meta;
    meta["upload_id"] = task.upload_id;
    if (!sendRequest(call_id, PacketType::MediaDone, meta, nullptr)) {
      fail(call_id, kStatusSendFailed);
    }
    return;
  }
  std::string error;
  if (!sendNextChunk(call_id, &error)) {
    Logger::log(LogLevel::Error, "upload of " + task.file_path + " stopped: " + error);
    fail(call_id, kStatusSendFailed);
  }
}

bool RemoteImportService::sendNextChunk(uint64_t call_id, std::string* error) {
  auto& task = registry_->calls[call_id].task;
  const int64_t to_read = std::min<int64_t>(task.file_size - task.next_offset, task.chunk_size);
  if (!task.stream) {
    task.stream = std::make_shared<std::ifstream>(task.file_path, std::ios::binary);
  }
  if (!task.stream->is_open()) {
    if (error) {
      *error = "failed to open " + task.file_path;
    }
    return false;
  }
  std::vector<uint8_t> data(static_cast<size_t>(to_read));
  task.stream->clear();
  task.stream->seekg(task.next_offset, std::ios::beg);
  task.stream->read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(to_read));
  if (task.stream->gcount() != static_cast<std::streamsize>(to_read)) {
    if (error) {
      *error = "short read from " + task.file_path;
    }
    return false;
  }

  nlohmann::json meta;
  meta["upload_id"] = task.upload_id;
  meta["offset"] = task.next_offset;
  if (!sendRequest(call_id, PacketType::MediaChunk, meta, &data)) {
    if (error) {
      *error = "failed to send chunk";
    }
    return false;
  }
  return true;
}

void RemoteImportService::reportUploadProgress(uint64_t call_id) {
  auto it = registry_->calls.find(call_id);
  if (it == registry_->calls.end()) {
    return;
  }
  const auto& task = it->second.task;
  const double fraction = task.file_size > 0
                              ? static_cast<double>(task.next_offset) / static_cast<double>(task.file_size)
                              : 1.0;
  auto callback = it->second.upload.progress;
  if (callback) {
    callback(fraction);
  }
}

void RemoteImportService::fail(uint64_t call_id, const std::string& status) {
  auto it = registry_->calls.find(call_id);
  if (it == registry_->calls.end()) {
    return;
  }
  Call call = std::move(it->second);
  registry_->cancel(call_id);
  switch (call.kind) {
    case CallKind::ConvertGroup:
      if (call.convert.failed) {
        call.convert.failed(ConvertGroupError::Generic);
      }
      break;
    case CallKind::InitSession:
      if (call.init.failed) {
        call.init.failed(initErrorFor(status));
      }
      break;
    case CallKind::Upload:
      if (call.upload.failed) {
        call.upload.failed(uploadErrorFor(status));
      }
      break;
    case CallKind::Commit:
      if (call.commit.failed) {
        call.commit.failed(CommitImportError::Generic);
      }
      break;
  }
}

}  // namespace chatimport::client
