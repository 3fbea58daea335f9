#pragma once

#include <cstdint>
#include <string>

namespace chatimport::client {

enum class PeerKind {
  User,
  BasicGroup,
  Supergroup
};

// Target conversation. Textual form is "<kind>:<id>", e.g. "group:42".
struct PeerId {
  PeerKind kind = PeerKind::User;
  int64_t id = 0;
};

bool operator==(const PeerId& lhs, const PeerId& rhs);
bool operator!=(const PeerId& lhs, const PeerId& rhs);

const char* toString(PeerKind kind);
bool parsePeerKind(const std::string& text, PeerKind* kind);
std::string toString(const PeerId& peer);
bool parsePeerId(const std::string& text, PeerId* peer, std::string* error);

enum class MediaType {
  File,
  Photo,
  Video,
  Sticker,
  Voice,
  Audio
};

const char* toString(MediaType type);

// One archive member scheduled for upload.
struct ImportEntry {
  std::string path;
  int64_t size = 0;
  std::string display_name;
  std::string mime_type;
  MediaType media_type = MediaType::File;
};

// Server-side import transaction; only the service interprets its contents.
struct ImportSession {
  std::string id;
  PeerId peer;
  int media_count = 0;
};

enum class ImportError {
  Generic,
  ChatAdminRequired,
  InvalidChatType
};

const char* toString(ImportError error);

class ImportState {
 public:
  enum class Kind {
    Progress,
    Error,
    Done
  };

  static ImportState progress(int64_t total_bytes, int64_t uploaded_bytes);
  static ImportState failed(ImportError error);
  static ImportState done();

  Kind kind() const { return kind_; }
  bool isProgress() const { return kind_ == Kind::Progress; }
  bool isError() const { return kind_ == Kind::Error; }
  bool isDone() const { return kind_ == Kind::Done; }

  // Meaningful for Kind::Progress only.
  int64_t totalBytes() const { return total_bytes_; }
  int64_t uploadedBytes() const { return uploaded_bytes_; }
  // Meaningful for Kind::Error only.
  ImportError error() const { return error_; }

  // Completed share in [0, 1]: an empty import counts as complete, an error as zero.
  double fraction() const;

  std::string describe() const;

 private:
  Kind kind_ = Kind::Progress;
  int64_t total_bytes_ = 0;
  int64_t uploaded_bytes_ = 0;
  ImportError error_ = ImportError::Generic;
};

bool operator==(const ImportState& lhs, const ImportState& rhs);

}  // namespace chatimport::client
