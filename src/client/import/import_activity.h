#pragma once

#include <memory>
#include <string>
#include <vector>

#include "client/import/archive_reader.h"
#include "client/import/completion_sync.h"
#include "client/import/import_manager.h"
#include "client/import/import_service.h"
#include "client/import/import_types.h"
#include "common/temp_file_store.h"

namespace chatimport::client {

class ImportActivityObserver {
 public:
  virtual ~ImportActivityObserver() = default;

  virtual void onImportStateChanged(const ImportState& state) = 0;
  // The progress animation should finish its current loop and hand over to
  // the "done" presentation. Called at most once per attempt.
  virtual void onCompletionTransition() = 0;
};

// Drives one chat import attempt and its retries: upgrades a basic group
// target, owns the ImportManager, and decides from animation frames when the
// completion transition may start.
class ImportActivity {
 public:
  struct Source {
    PeerId peer;
    std::string archive_path;
    std::string primary_file;
    std::vector<ImportEntry> entries;
  };

  ImportActivity(ImportService& service,
                 ArchiveReader& archive,
                 chatimport::common::TempFileStore& temp_files,
                 Source source,
                 ImportActivityObserver& observer,
                 double animation_frame_rate);
  ~ImportActivity();

  ImportActivity(const ImportActivity&) = delete;
  ImportActivity& operator=(const ImportActivity&) = delete;

  // Discards any previous attempt and starts from zero with a new session.
  void begin();
  // Restarts after an error; ignored in any other state.
  bool retry();

  void onAnimationFrame(int frame_index, int frame_count);
  void onAnimationFrame(int frame_index, int frame_count, double now_seconds);

  const ImportState& state() const { return state_; }
  const PeerId& targetPeer() const { return source_.peer; }
  int64_t totalBytes() const { return total_bytes_; }
  bool completionStarted() const { return sync_.triggered(); }
  int attempts() const { return attempts_; }
  const ImportManager* manager() const { return manager_.get(); }

 private:
  void startManager(const PeerId& peer);
  void onManagerState(const ImportState& state);
  void setState(const ImportState& state);
  double animationRemaining(int frame_index, int frame_count) const;

  ImportService& service_;
  ArchiveReader& archive_;
  chatimport::common::TempFileStore& temp_files_;
  Source source_;
  ImportActivityObserver& observer_;
  const double frame_rate_;

  int64_t total_bytes_ = 0;
  ImportState state_;
  CompletionSync sync_;
  std::unique_ptr<ImportManager> manager_;
  OperationPtr resolve_operation_;
  std::shared_ptr<bool> attempt_token_;
  int attempts_ = 0;
};

}  // namespace chatimport::client
