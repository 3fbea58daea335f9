#include "client/import/import_manager.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>
#include <utility>

#include "client/import/callback_guard.h"
#include "common/log.h"

namespace chatimport::client {

namespace {

using chatimport::common::Logger;
using chatimport::common::LogLevel;

ImportError mapInitError(InitSessionError error) {
  switch (error) {
    case InitSessionError::ChatAdminRequired:
      return ImportError::ChatAdminRequired;
    case InitSessionError::InvalidChatType:
      return ImportError::InvalidChatType;
    case InitSessionError::Generic:
    default:
      return ImportError::Generic;
  }
}

ImportError mapUploadError(UploadMediaError error) {
  switch (error) {
    case UploadMediaError::ChatAdminRequired:
      return ImportError::ChatAdminRequired;
    case UploadMediaError::Generic:
    default:
      return ImportError::Generic;
  }
}

std::string formatSeconds(double seconds) {
  std::ostringstream ss;
  ss.setf(std::ios::fixed);
  ss.precision(3);
  ss << seconds;
  return ss.str();
}

}  // namespace

ImportManager::ImportManager(ImportService& service,
                             ArchiveReader& archive,
                             chatimport::common::TempFileStore& temp_files,
                             Params params,
                             StateListener listener)
    : service_(service),
      archive_(archive),
      temp_files_(temp_files),
      peer_(params.peer),
      primary_file_(std::move(params.primary_file)),
      archive_path_(std::move(params.archive_path)),
      listener_(std::move(listener)),
      alive_(std::make_shared<bool>(true)) {
  for (auto& entry : params.entries) {
    if (entry_progress_.find(entry.path) != entry_progress_.end()) {
      Logger::log(LogLevel::Warn, "skipping duplicate archive entry " + entry.path);
      continue;
    }
    auto& progress = entry_progress_[entry.path];
    progress.total = std::max<int64_t>(entry.size, 0);
    progress.uploaded = 0;
    total_bytes_ += progress.total;
    pending_.push_back(std::move(entry));
  }

  setState(ImportState::progress(total_bytes_, 0));

  Logger::log(LogLevel::Info,
              "initiating import into " + toString(peer_) + " with " +
                  std::to_string(pending_.size()) + " media entries (" +
                  std::to_string(total_bytes_) + " bytes)");

  InitSessionCallbacks callbacks;
  callbacks.ready = guarded(alive_, [this](const ImportSession& session) { onSessionReady(session); });
  callbacks.failed = guarded(alive_, [this](InitSessionError error) {
    Logger::log(LogLevel::Warn, std::string("import session rejected: ") + toString(mapInitError(error)));
    failWithError(mapInitError(error));
  });
  session_operation_ = service_.initiateSession(peer_, primary_file_, static_cast<int>(pending_.size()),
                                                std::move(callbacks));
}

ImportManager::~ImportManager() {
  alive_.reset();
  if (session_operation_) {
    session_operation_->cancel();
  }
  for (auto& entry : active_) {
    if (entry.second) {
      entry.second->cancel();
    }
  }
}

const ImportState& ImportManager::state() const {
  return state_;
}

int64_t ImportManager::totalBytes() const {
  return total_bytes_;
}

size_t ImportManager::activeCount() const {
  return active_.size();
}

size_t ImportManager::pendingCount() const {
  return pending_.size();
}

void ImportManager::onSessionReady(const ImportSession& session) {
  Logger::log(LogLevel::Debug, "import session " + session.id + " ready");
  session_ = session;
  has_session_ = true;
  updateState();
}

void ImportManager::updateState() {
  if (!has_session_) {
    return;
  }
  if (!state_.isProgress() || committing_) {
    return;
  }
  while (active_.size() < kMaxActiveUploads && !pending_.empty()) {
    const ImportEntry entry = std::move(pending_.front());
    pending_.pop_front();
    startEntry(entry);
    if (state_.isError()) {
      return;
    }
  }
  if (pending_.empty() && active_.empty()) {
    complete();
  }
}

void ImportManager::startEntry(const ImportEntry& entry) {
  std::string temp_path;
  std::string error;
  if (!temp_files_.tempFile(entry.path, &temp_path, &error)) {
    Logger::log(LogLevel::Error, "no temp file for " + entry.path + ": " + error);
    failWithError(ImportError::Generic);
    return;
  }

  Logger::log(LogLevel::Debug, "Extracting " + entry.path + " to " + temp_path + "...");
  const auto started = std::chrono::steady_clock::now();
  if (!archive_.extractEntry(archive_path_, entry.path, temp_path, &error)) {
    Logger::log(LogLevel::Error, "extract failed: " + error);
    failWithError(ImportError::Generic);
    return;
  }
  const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
  Logger::log(LogLevel::Debug,
              "[Done in " + formatSeconds(elapsed.count()) + " s] Extract " + entry.path + " to " + temp_path);

  MediaUpload upload;
  upload.file_path = temp_path;
  upload.display_name = entry.display_name;
  upload.mime_type = entry.mime_type;
  upload.media_type = entry.media_type;

  const std::string path = entry.path;
  UploadMediaCallbacks callbacks;
  callbacks.progress = guarded(alive_, [this, path](double fraction) { onEntryProgress(path, fraction); });
  callbacks.completed = guarded(alive_, [this, path]() { onEntryCompleted(path); });
  callbacks.failed = guarded(alive_, [this, path](UploadMediaError upload_error) {
    if (active_.find(path) == active_.end()) {
      return;
    }
    Logger::log(LogLevel::Warn,
                "upload of " + path + " failed: " + toString(mapUploadError(upload_error)));
    active_.erase(path);
    failWithError(mapUploadError(upload_error));
  });
  active_[path] = service_.uploadMedia(session_, upload, std::move(callbacks));
}

void ImportManager::onEntryProgress(const std::string& path, double fraction) {
  if (active_.find(path) == active_.end()) {
    return;
  }
  auto it = entry_progress_.find(path);
  if (it == entry_progress_.end()) {
    return;
  }
  if (!(fraction >= 0.0)) {
    fraction = 0.0;
  }
  fraction = std::min(fraction, 1.0);
  const auto uploaded = static_cast<int64_t>(std::llround(fraction * static_cast<double>(it->second.total)));
  it->second.uploaded = std::clamp<int64_t>(std::max(uploaded, it->second.uploaded), 0, it->second.total);
  updateProgress();
}

void ImportManager::onEntryCompleted(const std::string& path) {
  auto it = active_.find(path);
  if (it == active_.end()) {
    return;
  }
  active_.erase(it);
  auto progress_it = entry_progress_.find(path);
  if (progress_it != entry_progress_.end() && progress_it->second.uploaded != progress_it->second.total) {
    progress_it->second.uploaded = progress_it->second.total;
    updateProgress();
  }
  Logger::log(LogLevel::Debug, "uploaded " + path);
  updateState();
}

void ImportManager::updateProgress() {
  if (!state_.isProgress()) {
    return;
  }
  int64_t uploaded = 0;
  for (const auto& entry : entry_progress_) {
    uploaded += entry.second.uploaded;
  }
  setState(ImportState::progress(total_bytes_, uploaded));
}

void ImportManager::failWithError(ImportError error) {
  if (state_.isError()) {
    return;
  }
  setState(ImportState::failed(error));
  auto active = std::move(active_);
  active_.clear();
  for (auto& entry : active) {
    if (entry.second) {
      Logger::log(LogLevel::Debug, "cancelling upload of " + entry.first);
      entry.second->cancel();
    }
  }
}

void ImportManager::complete() {
  if (!has_session_) {
    failWithError(ImportError::Generic);
    return;
  }
  committing_ = true;
  Logger::log(LogLevel::Info, "all media uploaded, committing import session " + session_.id);

  CommitImportCallbacks callbacks;
  callbacks.completed = guarded(alive_, [this]() {
    Logger::log(LogLevel::Info, "import into " + toString(peer_) + " committed");
    setState(ImportState::done());
  });
  callbacks.failed = guarded(alive_, [this](CommitImportError) {
    Logger::log(LogLevel::Warn, "commit of import session " + session_.id + " failed");
    failWithError(ImportError::Generic);
  });
  session_operation_ = service_.commitImport(session_, std::move(callbacks));
}

void ImportManager::setState(const ImportState& state) {
  state_ = state;
  if (listener_) {
    listener_(state_);
  }
}

}  // namespace chatimport::client
