#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace chatimport::client {

struct ArchiveEntry {
  std::string path;
  int64_t size = 0;
  bool is_directory = false;
};

class ArchiveReader {
 public:
  virtual ~ArchiveReader() = default;

  virtual bool listEntries(const std::string& archive_path,
                           std::vector<ArchiveEntry>* entries,
                           std::string* error) = 0;
  // Writes the member's uncompressed bytes to dest_path, replacing any existing file.
  virtual bool extractEntry(const std::string& archive_path,
                            const std::string& entry_path,
                            const std::string& dest_path,
                            std::string* error) = 0;
};

// Zip access through libarchive.
class LibArchiveReader : public ArchiveReader {
 public:
  bool listEntries(const std::string& archive_path,
                   std::vector<ArchiveEntry>* entries,
                   std::string* error) override;
  bool extractEntry(const std::string& archive_path,
                    const std::string& entry_path,
                    const std::string& dest_path,
                    std::string* error) override;
};

}  // namespace chatimport::client
