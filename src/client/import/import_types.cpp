#include "client/import/import_types.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>

namespace chatimport::client {

bool operator==(const PeerId& lhs, const PeerId& rhs) {
  return lhs.kind == rhs.kind && lhs.id == rhs.id;
}

bool operator!=(const PeerId& lhs, const PeerId& rhs) {
  return !(lhs == rhs);
}

const char* toString(PeerKind kind) {
  switch (kind) {
    case PeerKind::User:
      return "user";
    case PeerKind::BasicGroup:
      return "group";
    case PeerKind::Supergroup:
      return "supergroup";
    default:
      return "user";
  }
}

bool parsePeerKind(const std::string& text, PeerKind* kind) {
  PeerKind parsed;
  if (text == "user") {
    parsed = PeerKind::User;
  } else if (text == "group") {
    parsed = PeerKind::BasicGroup;
  } else if (text == "supergroup" || text == "channel") {
    parsed = PeerKind::Supergroup;
  } else {
    return false;
  }
  if (kind) {
    *kind = parsed;
  }
  return true;
}

std::string toString(const PeerId& peer) {
  return std::string(toString(peer.kind)) + ":" + std::to_string(peer.id);
}

bool parsePeerId(const std::string& text, PeerId* peer, std::string* error) {
  const auto colon = text.find(':');
  if (colon == std::string::npos) {
    if (error) {
      *error = "peer must look like <kind>:<id>";
    }
    return false;
  }
  PeerId parsed;
  if (!parsePeerKind(text.substr(0, colon), &parsed.kind)) {
    if (error) {
      *error = "unknown peer kind: " + text.substr(0, colon);
    }
    return false;
  }
  const std::string digits = text.substr(colon + 1);
  if (digits.empty()) {
    if (error) {
      *error = "peer id is empty";
    }
    return false;
  }
  errno = 0;
  char* end = nullptr;
  const long long value = std::strtoll(digits.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0' || value <= 0) {
    if (error) {
      *error = "invalid peer id: " + digits;
    }
    return false;
  }
  parsed.id = static_cast<int64_t>(value);
  if (peer) {
    *peer = parsed;
  }
  return true;
}

const char* toString(MediaType type) {
  switch (type) {
    case MediaType::File:
      return "file";
    case MediaType::Photo:
      return "photo";
    case MediaType::Video:
      return "video";
    case MediaType::Sticker:
      return "sticker";
    case MediaType::Voice:
      return "voice";
    case MediaType::Audio:
      return "audio";
    default:
      return "file";
  }
}

const char* toString(ImportError error) {
  switch (error) {
    case ImportError::Generic:
      return "generic";
    case ImportError::ChatAdminRequired:
      return "chat_admin_required";
    case ImportError::InvalidChatType:
      return "invalid_chat_type";
    default:
      return "generic";
  }
}

ImportState ImportState::progress(int64_t total_bytes, int64_t uploaded_bytes) {
  ImportState state;
  state.kind_ = Kind::Progress;
  state.total_bytes_ = std::max<int64_t>(total_bytes, 0);
  state.uploaded_bytes_ = std::clamp<int64_t>(uploaded_bytes, 0, state.total_bytes_);
  return state;
}

ImportState ImportState::failed(ImportError error) {
  ImportState state;
  state.kind_ = Kind::Error;
  state.error_ = error;
  return state;
}

ImportState ImportState::done() {
  ImportState state;
  state.kind_ = Kind::Done;
  return state;
}

double ImportState::fraction() const {
  switch (kind_) {
    case Kind::Progress:
      if (total_bytes_ == 0) {
        return 1.0;
      }
      return static_cast<double>(uploaded_bytes_) / static_cast<double>(total_bytes_);
    case Kind::Error:
      return 0.0;
    case Kind::Done:
      return 1.0;
    default:
      return 0.0;
  }
}

std::string ImportState::describe() const {
  switch (kind_) {
    case Kind::Progress:
      return "progress(" + std::to_string(uploaded_bytes_) + "/" + std::to_string(total_bytes_) + ")";
    case Kind::Error:
      return std::string("error(") + toString(error_) + ")";
    case Kind::Done:
      return "done";
    default:
      return "unknown";
  }
}

bool operator==(const ImportState& lhs, const ImportState& rhs) {
  if (lhs.kind() != rhs.kind()) {
    return false;
  }
  switch (lhs.kind()) {
    case ImportState::Kind::Progress:
      return lhs.totalBytes() == rhs.totalBytes() && lhs.uploadedBytes() == rhs.uploadedBytes();
    case ImportState::Kind::Error:
      return lhs.error() == rhs.error();
    default:
      return true;
  }
}

}  // namespace chatimport::client
