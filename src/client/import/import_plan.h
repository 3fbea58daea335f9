#pragma once

#include <string>
#include <vector>

#include "client/import/archive_reader.h"
#include "client/import/import_types.h"

namespace chatimport::client {

// What an exported chat archive turns into: the transcript that opens the
// session and the media entries uploaded after it, in archive order.
struct ImportPlan {
  std::string primary_entry;
  std::vector<ImportEntry> media;
};

// Picks the transcript ("_chat.txt", then "WhatsApp Chat*.txt", then the
// first top-level .txt) and classifies every other regular file. Directory
// entries, "__MACOSX/" resource forks and hidden files are skipped.
bool buildImportPlan(const std::vector<ArchiveEntry>& entries, ImportPlan* plan, std::string* error);

std::string mimeTypeForPath(const std::string& path);
MediaType mediaTypeFor(const std::string& mime_type, const std::string& path);

}  // namespace chatimport::client
