#pragma once

#include <cstdint>
#include <mutex>
#include <string>

namespace chatimport::common {

// Hands out fresh, not yet existing file paths under one root directory.
// Every path lives in its own numbered subdirectory so two entries with the
// same base name never collide. Files are removed by purge(), not by callers.
class TempFileStore {
 public:
  explicit TempFileStore(const std::string& root_dir);

  bool tempFile(const std::string& file_name, std::string* path, std::string* error);
  void purge();

  const std::string& rootDir() const;

 private:
  std::string root_dir_;
  std::mutex mutex_;
  uint64_t next_id_ = 1;
};

}  // namespace chatimport::common
