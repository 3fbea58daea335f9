#include "client/import/import_plan.h"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "common/log.h"

namespace chatimport::client {

namespace {

using chatimport::common::Logger;
using chatimport::common::LogLevel;

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return text;
}

std::string baseName(const std::string& path) {
  const auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string extensionOf(const std::string& path) {
  const auto name = baseName(path);
  const auto dot = name.find_last_of('.');
  if (dot == std::string::npos || dot == 0) {
    return {};
  }
  return toLower(name.substr(dot + 1));
}

bool isSkipped(const ArchiveEntry& entry) {
  if (entry.is_directory || entry.path.empty() || entry.path.back() == '/') {
    return true;
  }
  if (entry.path.rfind("__MACOSX/", 0) == 0) {
    return true;
  }
  const auto name = baseName(entry.path);
  return name.empty() || name.front() == '.';
}

bool isTopLevel(const std::string& path) {
  return path.find('/') == std::string::npos;
}

bool startsWith(const std::string& text, const std::string& prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

std::string mimeTypeForPath(const std::string& path) {
  static const std::unordered_map<std::string, std::string> kMimeTypes = {
      {"jpg", "image/jpeg"},       {"jpeg", "image/jpeg"},     {"png", "image/png"},
      {"gif", "image/gif"},        {"webp", "image/webp"},     {"heic", "image/heic"},
      {"mp4", "video/mp4"},        {"mov", "video/quicktime"}, {"3gp", "video/3gpp"},
      {"webm", "video/webm"},      {"opus", "audio/ogg"},      {"ogg", "audio/ogg"},
      {"m4a", "audio/mp4"},        {"mp3", "audio/mpeg"},      {"aac", "audio/aac"},
      {"wav", "audio/wav"},        {"pdf", "application/pdf"}, {"txt", "text/plain"},
      {"vcf", "text/vcard"},
  };
  const auto it = kMimeTypes.find(extensionOf(path));
  if (it == kMimeTypes.end()) {
    return "application/octet-stream";
  }
  return it->second;
}

MediaType mediaTypeFor(const std::string& mime_type, const std::string& path) {
  const auto extension = extensionOf(path);
  if (mime_type == "image/webp") {
    return MediaType::Sticker;
  }
  if (mime_type == "image/jpeg" || mime_type == "image/png") {
    return MediaType::Photo;
  }
  if (startsWith(mime_type, "video/")) {
    return MediaType::Video;
  }
  if (extension == "opus" || extension == "ogg") {
    return MediaType::Voice;
  }
  if (startsWith(mime_type, "audio/")) {
    return MediaType::Audio;
  }
  return MediaType::File;
}

bool buildImportPlan(const std::vector<ArchiveEntry>& entries, ImportPlan* plan, std::string* error) {
  std::vector<const ArchiveEntry*> files;
  std::unordered_set<std::string> seen;
  for (const auto& entry : entries) {
    if (isSkipped(entry)) {
      continue;
    }
    if (!seen.insert(entry.path).second) {
      Logger::log(LogLevel::Warn, "archive lists " + entry.path + " more than once");
      continue;
    }
    files.push_back(&entry);
  }

  const ArchiveEntry* primary = nullptr;
  for (const auto* file : files) {
    if (baseName(file->path) == "_chat.txt") {
      primary = file;
      break;
    }
  }
  if (!primary) {
    for (const auto* file : files) {
      const auto name = baseName(file->path);
      if (startsWith(name, "WhatsApp Chat") && extensionOf(name) == "txt") {
        primary = file;
        break;
      }
    }
  }
  if (!primary) {
    for (const auto* file : files) {
      if (isTopLevel(file->path) && extensionOf(file->path) == "txt") {
        primary = file;
        break;
      }
    }
  }
  if (!primary) {
    if (error) {
      *error = "archive contains no chat transcript";
    }
    return false;
  }

  ImportPlan result;
  result.primary_entry = primary->path;
  for (const auto* file : files) {
    if (file == primary) {
      continue;
    }
    ImportEntry media;
    media.path = file->path;
    media.size = std::max<int64_t>(file->size, 0);
    media.display_name = baseName(file->path);
    media.mime_type = mimeTypeForPath(file->path);
    media.media_type = mediaTypeFor(media.mime_type, file->path);
    result.media.push_back(std::move(media));
  }
  if (plan) {
    *plan = std::move(result);
  }
  return true;
}

}  // namespace chatimport::client
