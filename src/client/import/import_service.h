#pragma once

#include <functional>
#include <memory>
#include <string>

#include "client/import/import_types.h"

namespace chatimport::client {

// Handle to an in-flight asynchronous call. After cancel() returns none of
// the call's callbacks run. Cancelling a finished call is a no-op, and
// destroying the handle does not cancel.
class Operation {
 public:
  virtual ~Operation() = default;
  virtual void cancel() = 0;
};

using OperationPtr = std::unique_ptr<Operation>;

enum class ConvertGroupError {
  Generic
};

enum class InitSessionError {
  Generic,
  ChatAdminRequired,
  InvalidChatType
};

enum class UploadMediaError {
  Generic,
  ChatAdminRequired
};

enum class CommitImportError {
  Generic
};

struct ConvertGroupCallbacks {
  std::function<void(const PeerId&)> converted;
  std::function<void(ConvertGroupError)> failed;
};

struct InitSessionCallbacks {
  std::function<void(const ImportSession&)> ready;
  std::function<void(InitSessionError)> failed;
};

struct MediaUpload {
  std::string file_path;
  std::string display_name;
  std::string mime_type;
  MediaType media_type = MediaType::File;
};

struct UploadMediaCallbacks {
  // Fractions in [0, 1], non-decreasing.
  std::function<void(double)> progress;
  std::function<void()> completed;
  std::function<void(UploadMediaError)> failed;
};

struct CommitImportCallbacks {
  std::function<void()> completed;
  std::function<void(CommitImportError)> failed;
};

// Remote side of a chat history import. Callbacks are delivered on the
// control thread and never from inside the call that started the operation.
class ImportService {
 public:
  virtual ~ImportService() = default;

  virtual OperationPtr convertGroupToSupergroup(const PeerId& peer, ConvertGroupCallbacks callbacks) = 0;
  virtual OperationPtr initiateSession(const PeerId& peer,
                                       const std::string& primary_file,
                                       int media_count,
                                       InitSessionCallbacks callbacks) = 0;
  virtual OperationPtr uploadMedia(const ImportSession& session,
                                   const MediaUpload& upload,
                                   UploadMediaCallbacks callbacks) = 0;
  virtual OperationPtr commitImport(const ImportSession& session, CommitImportCallbacks callbacks) = 0;
};

}  // namespace chatimport::client
