#include "client/import/import_activity.h"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include "client/import/callback_guard.h"
#include "common/log.h"

namespace chatimport::client {

namespace {

using chatimport::common::Logger;
using chatimport::common::LogLevel;

}  // namespace

ImportActivity::ImportActivity(ImportService& service,
                               ArchiveReader& archive,
                               chatimport::common::TempFileStore& temp_files,
                               Source source,
                               ImportActivityObserver& observer,
                               double animation_frame_rate)
    : service_(service),
      archive_(archive),
      temp_files_(temp_files),
      source_(std::move(source)),
      observer_(observer),
      frame_rate_(animation_frame_rate > 0.0 ? animation_frame_rate : 60.0) {
  std::unordered_set<std::string> seen;
  std::vector<ImportEntry> entries;
  entries.reserve(source_.entries.size());
  for (auto& entry : source_.entries) {
    if (!seen.insert(entry.path).second) {
      Logger::log(LogLevel::Warn, "skipping duplicate archive entry " + entry.path);
      continue;
    }
    total_bytes_ += std::max<int64_t>(entry.size, 0);
    entries.push_back(std::move(entry));
  }
  source_.entries = std::move(entries);
  state_ = ImportState::progress(total_bytes_, 0);
}

ImportActivity::~ImportActivity() {
  attempt_token_.reset();
  if (resolve_operation_) {
    resolve_operation_->cancel();
  }
  manager_.reset();
}

void ImportActivity::begin() {
  attempt_token_ = std::make_shared<bool>(true);
  if (resolve_operation_) {
    resolve_operation_->cancel();
    resolve_operation_.reset();
  }
  manager_.reset();
  sync_.reset();
  ++attempts_;
  setState(ImportState::progress(total_bytes_, 0));

  if (source_.peer.kind != PeerKind::BasicGroup) {
    startManager(source_.peer);
    return;
  }

  Logger::log(LogLevel::Info, "upgrading " + toString(source_.peer) + " to a supergroup before import");
  ConvertGroupCallbacks callbacks;
  callbacks.converted = guarded(attempt_token_, [this](const PeerId& peer) {
    Logger::log(LogLevel::Info, toString(source_.peer) + " is now " + toString(peer));
    // Later attempts must not try to upgrade the migrated group again.
    source_.peer = peer;
    startManager(peer);
  });
  callbacks.failed = guarded(attempt_token_, [this](ConvertGroupError) {
    Logger::log(LogLevel::Warn, "failed to upgrade " + toString(source_.peer));
    setState(ImportState::failed(ImportError::Generic));
  });
  resolve_operation_ = service_.convertGroupToSupergroup(source_.peer, std::move(callbacks));
}

bool ImportActivity::retry() {
  if (!state_.isError()) {
    return false;
  }
  Logger::log(LogLevel::Info, "retrying import, attempt " + std::to_string(attempts_ + 1));
  begin();
  return true;
}

void ImportActivity::onAnimationFrame(int frame_index, int frame_count) {
  if (sync_.triggered() || !state_.isProgress() || !manager_) {
    return;
  }
  if (sync_.onFrame(state_.fraction(), animationRemaining(frame_index, frame_count))) {
    observer_.onCompletionTransition();
  }
}

void ImportActivity::onAnimationFrame(int frame_index, int frame_count, double now_seconds) {
  if (sync_.triggered() || !state_.isProgress() || !manager_) {
    return;
  }
  if (sync_.onFrame(state_.fraction(), animationRemaining(frame_index, frame_count), now_seconds)) {
    observer_.onCompletionTransition();
  }
}

void ImportActivity::startManager(const PeerId& peer) {
  ImportManager::Params params;
  params.peer = peer;
  params.primary_file = source_.primary_file;
  params.archive_path = source_.archive_path;
  params.entries = source_.entries;
  manager_ = std::make_unique<ImportManager>(service_, archive_, temp_files_, std::move(params),
                                             [this](const ImportState& state) { onManagerState(state); });
}

void ImportActivity::onManagerState(const ImportState& state) {
  setState(state);
  if (state.isDone() && sync_.force()) {
    observer_.onCompletionTransition();
  }
}

void ImportActivity::setState(const ImportState& state) {
  state_ = state;
  observer_.onImportStateChanged(state_);
}

double ImportActivity::animationRemaining(int frame_index, int frame_count) const {
  return static_cast<double>(frame_count - frame_index) / frame_rate_;
}

}  // namespace chatimport::client
