#include "common/fs.h"

#include <filesystem>
#include <system_error>

namespace chatimport::common {

bool ensureDirectory(const std::string& path, std::string* error) {
  std::error_code code;
  if (path.empty()) {
    if (error) {
      *error = "path is empty";
    }
    return false;
  }
  const std::filesystem::path dir(path);
  if (std::filesystem::exists(dir, code)) {
    if (std::filesystem::is_directory(dir, code)) {
      return true;
    }
    if (error) {
      *error = "path exists but is not a directory: " + path;
    }
    return false;
  }
  if (std::filesystem::create_directories(dir, code)) {
    return true;
  }
  if (error) {
    *error = code.message();
  }
  return false;
}

bool fileSize(const std::string& path, int64_t* size, std::string* error) {
  std::error_code code;
  const auto value = std::filesystem::file_size(path, code);
  if (code) {
    if (error) {
      *error = "failed to stat " + path + ": " + code.message();
    }
    return false;
  }
  if (size) {
    *size = static_cast<int64_t>(value);
  }
  return true;
}

std::string sanitizeFileName(const std::string& name) {
  std::string sanitized;
  sanitized.reserve(name.size());
  for (const char ch : name) {
    if ((ch >= 'a' && ch <= 'z') ||
        (ch >= 'A' && ch <= 'Z') ||
        (ch >= '0' && ch <= '9') ||
        ch == '.' || ch == '_' || ch == '-') {
      sanitized.push_back(ch);
    } else {
      sanitized.push_back('_');
    }
  }
  if (sanitized.empty() || sanitized == "." || sanitized == "..") {
    return "file";
  }
  return sanitized;
}

}  // namespace chatimport::common
