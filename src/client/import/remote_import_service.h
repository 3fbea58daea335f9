#pragma once

#include <cstdint>
#include <deque>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "client/import/import_service.h"
#include "client/net/packet_channel.h"
#include "common/protocol/packet.h"

namespace chatimport::client {

// ImportService spoken over the client's packet protocol. Every request is
// one packet with JSON metadata; the reply carries the same request id and a
// "status" field. Media are uploaded as an offer followed by acknowledged
// chunks, one chunk in flight per upload.
//
// The owner feeds received packets to handlePacket() and calls
// dispatchDeferred() once per control loop iteration; both run callbacks.
class RemoteImportService : public ImportService {
 public:
  RemoteImportService(PacketChannel& channel, int chunk_size);
  ~RemoteImportService() override;

  RemoteImportService(const RemoteImportService&) = delete;
  RemoteImportService& operator=(const RemoteImportService&) = delete;

  OperationPtr convertGroupToSupergroup(const PeerId& peer, ConvertGroupCallbacks callbacks) override;
  OperationPtr initiateSession(const PeerId& peer,
                               const std::string& primary_file,
                               int media_count,
                               InitSessionCallbacks callbacks) override;
  OperationPtr uploadMedia(const ImportSession& session,
                           const MediaUpload& upload,
                           UploadMediaCallbacks callbacks) override;
  OperationPtr commitImport(const ImportSession& session, CommitImportCallbacks callbacks) override;

  // Returns false for packets that are not replies to a pending request.
  bool handlePacket(const chatimport::common::Packet& packet);
  void dispatchDeferred();
  // Fails every pending operation, e.g. after the connection dropped.
  void failAll(const std::string& reason);

  size_t pendingOperations() const;

 private:
  enum class CallKind {
    ConvertGroup,
    InitSession,
    Upload,
    Commit
  };

  struct UploadTask {
    std::string file_path;
    int64_t file_size = 0;
    std::string upload_id;
    int chunk_size = 0;
    int64_t next_offset = 0;
    bool finishing = false;
    std::shared_ptr<std::ifstream> stream;
  };

  struct Call {
    CallKind kind = CallKind::Upload;
    uint64_t request_id = 0;
    PeerId peer;
    int media_count = 0;
    ConvertGroupCallbacks convert;
    InitSessionCallbacks init;
    UploadMediaCallbacks upload;
    CommitImportCallbacks commit;
    UploadTask task;
  };

  struct Registry {
    uint64_t next_call_id = 1;
    std::unordered_map<uint64_t, Call> calls;
    std::unordered_map<uint64_t, uint64_t> requests;
    std::deque<std::pair<uint64_t, std::string>> deferred_failures;

    void cancel(uint64_t call_id);
  };

  class CallHandle;

  OperationPtr registerCall(Call call, uint64_t* call_id);
  bool sendRequest(uint64_t call_id,
                   chatimport::common::PacketType type,
                   const nlohmann::json& meta,
                   const std::vector<uint8_t>* binary);
  void deferFailure(uint64_t call_id, const std::string& status);

  void handleConvertReply(uint64_t call_id, const std::string& status, const nlohmann::json& meta);
  void handleInitReply(uint64_t call_id, const std::string& status, const nlohmann::json& meta);
  void handleOfferReply(uint64_t call_id, const std::string& status, const nlohmann::json& meta);
  void handleChunkReply(uint64_t call_id, const std::string& status, const nlohmann::json& meta);
  void handleDoneReply(uint64_t call_id, const std::string& status);
  void handleCommitReply(uint64_t call_id, const std::string& status);

  void continueUpload(uint64_t call_id);
  bool sendNextChunk(uint64_t call_id, std::string* error);
  void reportUploadProgress(uint64_t call_id);
  void fail(uint64_t call_id, const std::string& status);

  PacketChannel& channel_;
  const int chunk_size_;
  std::shared_ptr<Registry> registry_;
};

}  // namespace chatimport::client
