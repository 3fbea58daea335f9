#include "client/import/remote_import_service.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "test_support.h"

namespace chatimport::client {
namespace {

using chatimport::common::Packet;
using chatimport::common::PacketType;

class RecordingChannel : public PacketChannel {
 public:
  struct Sent {
    PacketType type;
    uint64_t request_id = 0;
    nlohmann::json meta;
    std::vector<uint8_t> binary;
  };

  uint64_t nextRequestId() override { return next_request_id_++; }

  bool sendJson(PacketType type,
                uint64_t request_id,
                const nlohmann::json& meta,
                const std::vector<uint8_t>* binary) override {
    if (!connected) {
      return false;
    }
    Sent sent_packet{type, request_id, meta, binary ? *binary : std::vector<uint8_t>()};
    sent.push_back(sent_packet);
    return true;
  }

  bool connected = true;
  std::vector<Sent> sent;

 private:
  uint64_t next_request_id_ = 100;
};

Packet replyTo(const RecordingChannel::Sent& request, const nlohmann::json& meta) {
  Packet packet;
  packet.header.type = static_cast<uint16_t>(request.type);
  packet.header.request_id = request.request_id;
  packet.meta_json = meta.dump();
  return packet;
}

std::string bytes(const std::vector<uint8_t>& data) {
  return std::string(data.begin(), data.end());
}

class RemoteImportServiceTest : public ::testing::Test {
 protected:
  RemoteImportServiceTest() : service_(channel_, 4) {}

  ImportSession session() const {
    ImportSession session;
    session.id = "s-9";
    session.peer = PeerId{PeerKind::Supergroup, 77};
    session.media_count = 1;
    return session;
  }

  OperationPtr startUpload(const std::string& contents) {
    media_path_ = dir_.file("IMG-1.jpg");
    chatimport::testing::writeFile(media_path_, contents);
    MediaUpload upload;
    upload.file_path = media_path_;
    upload.display_name = "IMG-1.jpg";
    upload.mime_type = "image/jpeg";
    upload.media_type = MediaType::Photo;
    UploadMediaCallbacks callbacks;
    callbacks.progress = [this](double fraction) { progress_.push_back(fraction); };
    callbacks.completed = [this]() { ++completed_; };
    callbacks.failed = [this](UploadMediaError error) { upload_error_ = error; };
    return service_.uploadMedia(session(), upload, std::move(callbacks));
  }

  void reply(const nlohmann::json& meta) { EXPECT_TRUE(service_.handlePacket(replyTo(channel_.sent.back(), meta))); }

  chatimport::testing::ScopedTempDir dir_;
  RecordingChannel channel_;
  RemoteImportService service_;
  std::string media_path_;
  std::vector<double> progress_;
  int completed_ = 0;
  std::optional<UploadMediaError> upload_error_;
};

TEST_F(RemoteImportServiceTest, UpgradesGroup) {
  std::optional<PeerId> converted;
  ConvertGroupCallbacks callbacks;
  callbacks.converted = [&converted](const PeerId& peer) { converted = peer; };
  callbacks.failed = [](ConvertGroupError) { FAIL() << "unexpected failure"; };
  auto operation = service_.convertGroupToSupergroup(PeerId{PeerKind::BasicGroup, 5}, callbacks);

  ASSERT_EQ(channel_.sent.size(), 1u);
  EXPECT_EQ(channel_.sent[0].type, PacketType::PeerUpgrade);
  EXPECT_EQ(channel_.sent[0].meta["peer_kind"], "group");
  EXPECT_EQ(channel_.sent[0].meta["peer_id"], 5);
  EXPECT_FALSE(converted.has_value());

  reply({{"status", "ok"}, {"peer_kind", "supergroup"}, {"peer_id", 77}});
  ASSERT_TRUE(converted.has_value());
  EXPECT_EQ(*converted, (PeerId{PeerKind::Supergroup, 77}));
  EXPECT_EQ(service_.pendingOperations(), 0u);
}

TEST_F(RemoteImportServiceTest, InitiatesSessionWithTranscript) {
  const auto transcript = dir_.file("_chat.txt");
  chatimport::testing::writeFile(transcript, "hello");
  std::optional<ImportSession> ready;
  InitSessionCallbacks callbacks;
  callbacks.ready = [&ready](const ImportSession& session) { ready = session; };
  callbacks.failed = [](InitSessionError) { FAIL() << "unexpected failure"; };
  auto operation = service_.initiateSession(PeerId{PeerKind::User, 3}, transcript, 2, callbacks);

  ASSERT_EQ(channel_.sent.size(), 1u);
  const auto& sent = channel_.sent[0];
  EXPECT_EQ(sent.type, PacketType::ImportInit);
  EXPECT_EQ(sent.meta["peer_kind"], "user");
  EXPECT_EQ(sent.meta["media_count"], 2);
  EXPECT_EQ(sent.meta["file_name"], "_chat.txt");
  EXPECT_EQ(sent.meta["file_size"], 5);
  EXPECT_EQ(sent.meta["sha256"], "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
  EXPECT_EQ(bytes(sent.binary), "hello");

  reply({{"status", "ok"}, {"session_id", "s-1"}});
  ASSERT_TRUE(ready.has_value());
  EXPECT_EQ(ready->id, "s-1");
  EXPECT_EQ(ready->peer, (PeerId{PeerKind::User, 3}));
  EXPECT_EQ(ready->media_count, 2);
}

TEST_F(RemoteImportServiceTest, MapsSessionStatusCodes) {
  const auto transcript = dir_.file("_chat.txt");
  chatimport::testing::writeFile(transcript, "x");
  const std::vector<std::pair<std::string, InitSessionError>> cases = {
      {"chat_admin_required", InitSessionError::ChatAdminRequired},
      {"invalid_chat_type", InitSessionError::InvalidChatType},
      {"flood_wait", InitSessionError::Generic},
  };
  for (const auto& status_case : cases) {
    std::optional<InitSessionError> failed;
    InitSessionCallbacks callbacks;
    callbacks.ready = [](const ImportSession&) { FAIL() << "unexpected session"; };
    callbacks.failed = [&failed](InitSessionError error) { failed = error; };
    auto operation = service_.initiateSession(PeerId{PeerKind::User, 3}, transcript, 0, callbacks);
    reply({{"status", status_case.first}, {"message", "no"}});
    ASSERT_TRUE(failed.has_value()) << status_case.first;
    EXPECT_EQ(*failed, status_case.second) << status_case.first;
  }
}

TEST_F(RemoteImportServiceTest, UploadsInAcknowledgedChunks) {
  auto operation = startUpload("0123456789");

  ASSERT_EQ(channel_.sent.size(), 1u);
  const auto& offer = channel_.sent[0];
  EXPECT_EQ(offer.type, PacketType::MediaOffer);
  EXPECT_EQ(offer.meta["session_id"], "s-9");
  EXPECT_EQ(offer.meta["file_name"], "IMG-1.jpg");
  EXPECT_EQ(offer.meta["mime_type"], "image/jpeg");
  EXPECT_EQ(offer.meta["media_type"], "photo");
  EXPECT_EQ(offer.meta["file_size"], 10);
  EXPECT_EQ(offer.meta["chunk_size"], 4);
  EXPECT_EQ(offer.meta["sha256"].get<std::string>().size(), 64u);

  reply({{"status", "ok"}, {"upload_id", "u1"}, {"chunk_size", 4}, {"next_offset", 0}});
  ASSERT_EQ(channel_.sent.back().type, PacketType::MediaChunk);
  EXPECT_EQ(channel_.sent.back().meta["upload_id"], "u1");
  EXPECT_EQ(channel_.sent.back().meta["offset"], 0);
  EXPECT_EQ(bytes(channel_.sent.back().binary), "0123");

  reply({{"status", "ok"}, {"next_offset", 4}});
  EXPECT_EQ(bytes(channel_.sent.back().binary), "4567");
  reply({{"status", "ok"}, {"next_offset", 8}});
  EXPECT_EQ(bytes(channel_.sent.back().binary), "89");
  reply({{"status", "ok"}, {"next_offset", 10}});
  ASSERT_EQ(channel_.sent.back().type, PacketType::MediaDone);
  EXPECT_EQ(channel_.sent.back().meta["upload_id"], "u1");
  EXPECT_EQ(completed_, 0);

  reply({{"status", "ok"}});
  EXPECT_EQ(completed_, 1);
  EXPECT_FALSE(upload_error_.has_value());
  EXPECT_EQ(progress_, (std::vector<double>{0.0, 0.4, 0.8, 1.0}));
  EXPECT_EQ(service_.pendingOperations(), 0u);
}

TEST_F(RemoteImportServiceTest, FollowsServerChunkSizeAndResumeOffset) {
  auto operation = startUpload("0123456789");
  reply({{"status", "ok"}, {"upload_id", "u2"}, {"chunk_size", 6}, {"next_offset", 4}});

  EXPECT_EQ(channel_.sent.back().meta["offset"], 4);
  EXPECT_EQ(bytes(channel_.sent.back().binary), "456789");
  EXPECT_EQ(progress_, (std::vector<double>{0.4}));
}

TEST_F(RemoteImportServiceTest, EmptyFileGoesStraightToDone) {
  auto operation = startUpload("");
  reply({{"status", "ok"}, {"upload_id", "u3"}});

  EXPECT_EQ(channel_.sent.back().type, PacketType::MediaDone);
  EXPECT_EQ(progress_, (std::vector<double>{1.0}));
}

TEST_F(RemoteImportServiceTest, MapsUploadFailures) {
  auto operation = startUpload("0123456789");
  reply({{"status", "chat_admin_required"}});
  ASSERT_TRUE(upload_error_.has_value());
  EXPECT_EQ(*upload_error_, UploadMediaError::ChatAdminRequired);

  upload_error_.reset();
  operation = startUpload("0123456789");
  reply({{"status", "ok"}, {"upload_id", "u4"}});
  reply({{"status", "invalid_chat_type"}});
  ASSERT_TRUE(upload_error_.has_value());
  EXPECT_EQ(*upload_error_, UploadMediaError::Generic);
}

TEST_F(RemoteImportServiceTest, RejectsAcknowledgementGoingBackwards) {
  auto operation = startUpload("0123456789");
  reply({{"status", "ok"}, {"upload_id", "u5"}, {"next_offset", 8}});
  reply({{"status", "ok"}, {"next_offset", 2}});

  ASSERT_TRUE(upload_error_.has_value());
  EXPECT_EQ(*upload_error_, UploadMediaError::Generic);
  EXPECT_EQ(service_.pendingOperations(), 0u);
}

TEST_F(RemoteImportServiceTest, WronglyTypedSessionIdFailsTheCall) {
  const auto transcript = dir_.file("_chat.txt");
  chatimport::testing::writeFile(transcript, "x");
  std::optional<InitSessionError> failed;
  InitSessionCallbacks callbacks;
  callbacks.ready = [](const ImportSession&) { FAIL() << "unexpected session"; };
  callbacks.failed = [&failed](InitSessionError error) { failed = error; };
  auto operation = service_.initiateSession(PeerId{PeerKind::User, 3}, transcript, 0, callbacks);

  EXPECT_NO_THROW(reply({{"status", "ok"}, {"session_id", 42}}));
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(*failed, InitSessionError::Generic);
  EXPECT_EQ(service_.pendingOperations(), 0u);
}

TEST_F(RemoteImportServiceTest, WronglyTypedOffsetFailsTheUpload) {
  auto operation = startUpload("0123456789");
  reply({{"status", "ok"}, {"upload_id", "u7"}});

  EXPECT_NO_THROW(reply({{"status", "ok"}, {"next_offset", "4"}}));
  ASSERT_TRUE(upload_error_.has_value());
  EXPECT_EQ(*upload_error_, UploadMediaError::Generic);
  EXPECT_EQ(service_.pendingOperations(), 0u);
}

TEST_F(RemoteImportServiceTest, WronglyTypedStatusFailsTheCall) {
  bool failed = false;
  CommitImportCallbacks callbacks;
  callbacks.completed = []() { FAIL() << "unexpected commit"; };
  callbacks.failed = [&failed](CommitImportError) { failed = true; };
  auto operation = service_.commitImport(session(), callbacks);

  EXPECT_NO_THROW(reply({{"status", 0}}));
  EXPECT_TRUE(failed);
}

TEST_F(RemoteImportServiceTest, CancelledUploadStaysSilent) {
  auto operation = startUpload("0123456789");
  operation->cancel();

  EXPECT_FALSE(service_.handlePacket(replyTo(channel_.sent.back(), {{"status", "ok"}, {"upload_id", "u6"}})));
  EXPECT_TRUE(progress_.empty());
  EXPECT_FALSE(upload_error_.has_value());
  EXPECT_EQ(channel_.sent.size(), 1u);
  EXPECT_EQ(service_.pendingOperations(), 0u);
  operation->cancel();
}

TEST_F(RemoteImportServiceTest, LocalProblemsFailOnlyWhenDispatched) {
  MediaUpload upload;
  upload.file_path = dir_.file("vanished.jpg");
  upload.display_name = "vanished.jpg";
  UploadMediaCallbacks callbacks;
  callbacks.failed = [this](UploadMediaError error) { upload_error_ = error; };
  auto operation = service_.uploadMedia(session(), upload, callbacks);

  EXPECT_TRUE(channel_.sent.empty());
  EXPECT_FALSE(upload_error_.has_value());
  service_.dispatchDeferred();
  ASSERT_TRUE(upload_error_.has_value());
  EXPECT_EQ(*upload_error_, UploadMediaError::Generic);
}

TEST_F(RemoteImportServiceTest, SendFailureIsDeferred) {
  channel_.connected = false;
  bool failed = false;
  CommitImportCallbacks callbacks;
  callbacks.completed = []() { FAIL() << "unexpected commit"; };
  callbacks.failed = [&failed](CommitImportError) { failed = true; };
  auto operation = service_.commitImport(session(), callbacks);

  EXPECT_FALSE(failed);
  service_.dispatchDeferred();
  EXPECT_TRUE(failed);
}

TEST_F(RemoteImportServiceTest, CommitsSession) {
  bool committed = false;
  CommitImportCallbacks callbacks;
  callbacks.completed = [&committed]() { committed = true; };
  auto operation = service_.commitImport(session(), callbacks);

  ASSERT_EQ(channel_.sent.size(), 1u);
  EXPECT_EQ(channel_.sent[0].type, PacketType::ImportCommit);
  EXPECT_EQ(channel_.sent[0].meta["session_id"], "s-9");
  reply({{"status", "ok"}});
  EXPECT_TRUE(committed);
}

TEST_F(RemoteImportServiceTest, FailAllAbortsEveryPendingCall) {
  bool commit_failed = false;
  CommitImportCallbacks callbacks;
  callbacks.failed = [&commit_failed](CommitImportError) { commit_failed = true; };
  auto commit = service_.commitImport(session(), callbacks);
  auto upload = startUpload("0123");
  ASSERT_EQ(service_.pendingOperations(), 2u);

  service_.failAll("socket closed");
  EXPECT_TRUE(commit_failed);
  ASSERT_TRUE(upload_error_.has_value());
  EXPECT_EQ(service_.pendingOperations(), 0u);
}

TEST_F(RemoteImportServiceTest, IgnoresUnsolicitedAndRejectsMismatchedReplies) {
  Packet stray;
  stray.header.type = static_cast<uint16_t>(PacketType::ImportCommit);
  stray.header.request_id = 9999;
  stray.meta_json = R"({"status":"ok"})";
  EXPECT_FALSE(service_.handlePacket(stray));

  auto operation = startUpload("0123");
  auto mismatched = replyTo(channel_.sent.back(), {{"status", "ok"}});
  mismatched.header.type = static_cast<uint16_t>(PacketType::ImportCommit);
  EXPECT_TRUE(service_.handlePacket(mismatched));
  ASSERT_TRUE(upload_error_.has_value());
  EXPECT_EQ(*upload_error_, UploadMediaError::Generic);
}

}  // namespace
}  // namespace chatimport::client
