#include "client/import/archive_reader.h"

#include <fstream>
#include <memory>

#include <archive.h>
#include <archive_entry.h>

namespace chatimport::client {

namespace {

constexpr size_t kOpenBlockSize = 10240;
constexpr size_t kCopyBlockSize = 64 * 1024;

struct ArchiveFree {
  void operator()(archive* handle) const {
    archive_read_free(handle);
  }
};

using ArchivePtr = std::unique_ptr<archive, ArchiveFree>;

ArchivePtr openArchive(const std::string& archive_path, std::string* error) {
  ArchivePtr handle(archive_read_new());
  if (!handle) {
    if (error) {
      *error = "archive_read_new failed";
    }
    return nullptr;
  }
  archive_read_support_filter_all(handle.get());
  archive_read_support_format_zip(handle.get());
  if (archive_read_open_filename(handle.get(), archive_path.c_str(), kOpenBlockSize) != ARCHIVE_OK) {
    if (error) {
      const char* message = archive_error_string(handle.get());
      *error = "failed to open archive " + archive_path + ": " + (message ? message : "unknown error");
    }
    return nullptr;
  }
  return handle;
}

std::string archiveError(archive* handle, const std::string& fallback) {
  const char* message = archive_error_string(handle);
  return message ? std::string(message) : fallback;
}

}  // namespace

bool LibArchiveReader::listEntries(const std::string& archive_path,
                                   std::vector<ArchiveEntry>* entries,
                                   std::string* error) {
  auto handle = openArchive(archive_path, error);
  if (!handle) {
    return false;
  }

  std::vector<ArchiveEntry> listed;
  archive_entry* header = nullptr;
  int rc = ARCHIVE_OK;
  while ((rc = archive_read_next_header(handle.get(), &header)) == ARCHIVE_OK) {
    const char* path = archive_entry_pathname(header);
    if (!path) {
      archive_read_data_skip(handle.get());
      continue;
    }
    ArchiveEntry entry;
    entry.path = path;
    entry.is_directory = archive_entry_filetype(header) == AE_IFDIR;
    entry.size = archive_entry_size_is_set(header) ? static_cast<int64_t>(archive_entry_size(header)) : 0;
    listed.push_back(std::move(entry));
    archive_read_data_skip(handle.get());
  }
  if (rc != ARCHIVE_EOF) {
    if (error) {
      *error = "failed to read archive " + archive_path + ": " + archiveError(handle.get(), "corrupt archive");
    }
    return false;
  }
  if (entries) {
    *entries = std::move(listed);
  }
  return true;
}

bool LibArchiveReader::extractEntry(const std::string& archive_path,
                                    const std::string& entry_path,
                                    const std::string& dest_path,
                                    std::string* error) {
  auto handle = openArchive(archive_path, error);
  if (!handle) {
    return false;
  }

  archive_entry* header = nullptr;
  int rc = ARCHIVE_OK;
  while ((rc = archive_read_next_header(handle.get(), &header)) == ARCHIVE_OK) {
    const char* path = archive_entry_pathname(header);
    if (!path || entry_path != path) {
      archive_read_data_skip(handle.get());
      continue;
    }
    if (archive_entry_filetype(header) == AE_IFDIR) {
      if (error) {
        *error = entry_path + " is a directory";
      }
      return false;
    }

    std::ofstream out(dest_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      if (error) {
        *error = "failed to create " + dest_path;
      }
      return false;
    }
    std::vector<char> block(kCopyBlockSize);
    while (true) {
      const la_ssize_t read = archive_read_data(handle.get(), block.data(), block.size());
      if (read == 0) {
        break;
      }
      if (read < 0) {
        if (error) {
          *error = "failed to extract " + entry_path + ": " + archiveError(handle.get(), "read error");
        }
        return false;
      }
      out.write(block.data(), static_cast<std::streamsize>(read));
      if (!out) {
        if (error) {
          *error = "failed to write " + dest_path;
        }
        return false;
      }
    }
    out.flush();
    if (!out) {
      if (error) {
        *error = "failed to write " + dest_path;
      }
      return false;
    }
    return true;
  }

  if (error) {
    if (rc == ARCHIVE_EOF) {
      *error = "entry not found in archive: " + entry_path;
    } else {
      *error = "failed to read archive " + archive_path + ": " + archiveError(handle.get(), "corrupt archive");
    }
  }
  return false;
}

}  // namespace chatimport::client
