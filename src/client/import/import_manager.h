#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "client/import/archive_reader.h"
#include "client/import/import_service.h"
#include "client/import/import_types.h"
#include "common/temp_file_store.h"

namespace chatimport::client {

// Uploads the media of one chat export into an import session.
//
// Construction publishes progress(total, 0) and starts session initiation.
// Once the session is ready, entries are extracted and uploaded in the order
// given, at most kMaxActiveUploads at a time. The first failure moves the
// manager to error and cancels the remaining uploads; after the last entry
// the session is committed and the manager reports done.
//
// All methods and callbacks run on the control thread. The listener must not
// destroy the manager from inside a notification.
class ImportManager {
 public:
  static constexpr size_t kMaxActiveUploads = 2;

  using StateListener = std::function<void(const ImportState&)>;

  struct Params {
    PeerId peer;
    std::string primary_file;
    std::string archive_path;
    std::vector<ImportEntry> entries;
  };

  ImportManager(ImportService& service,
                ArchiveReader& archive,
                chatimport::common::TempFileStore& temp_files,
                Params params,
                StateListener listener);
  ~ImportManager();

  ImportManager(const ImportManager&) = delete;
  ImportManager& operator=(const ImportManager&) = delete;

  const ImportState& state() const;
  int64_t totalBytes() const;
  size_t activeCount() const;
  size_t pendingCount() const;

 private:
  struct EntryProgress {
    int64_t total = 0;
    int64_t uploaded = 0;
  };

  void onSessionReady(const ImportSession& session);
  void updateState();
  void startEntry(const ImportEntry& entry);
  void onEntryProgress(const std::string& path, double fraction);
  void onEntryCompleted(const std::string& path);
  void updateProgress();
  void failWithError(ImportError error);
  void complete();
  void setState(const ImportState& state);

  ImportService& service_;
  ArchiveReader& archive_;
  chatimport::common::TempFileStore& temp_files_;
  const PeerId peer_;
  const std::string primary_file_;
  const std::string archive_path_;
  StateListener listener_;

  int64_t total_bytes_ = 0;
  std::deque<ImportEntry> pending_;
  std::unordered_map<std::string, EntryProgress> entry_progress_;
  std::unordered_map<std::string, OperationPtr> active_;

  bool has_session_ = false;
  ImportSession session_;
  OperationPtr session_operation_;
  bool committing_ = false;

  ImportState state_;
  std::shared_ptr<bool> alive_;
};

}  // namespace chatimport::client
