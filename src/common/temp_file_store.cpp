#include "common/temp_file_store.h"

#include <filesystem>
#include <system_error>

#include "common/fs.h"
#include "common/log.h"

namespace chatimport::common {

TempFileStore::TempFileStore(const std::string& root_dir) : root_dir_(root_dir) {
  while (root_dir_.size() > 1 && root_dir_.back() == '/') {
    root_dir_.pop_back();
  }
}

bool TempFileStore::tempFile(const std::string& file_name, std::string* path, std::string* error) {
  uint64_t id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_id_++;
  }
  const auto base_name = sanitizeFileName(std::filesystem::path(file_name).filename().string());
  const auto dir = root_dir_ + "/" + std::to_string(id);
  if (!ensureDirectory(dir, error)) {
    return false;
  }
  if (path) {
    *path = dir + "/" + base_name;
  }
  return true;
}

void TempFileStore::purge() {
  std::error_code code;
  std::filesystem::remove_all(root_dir_, code);
  if (code) {
    Logger::log(LogLevel::Warn, "failed to purge temp dir " + root_dir_ + ": " + code.message());
  }
}

const std::string& TempFileStore::rootDir() const {
  return root_dir_;
}

}  // namespace chatimport::common
