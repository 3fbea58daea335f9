#pragma once

#include <cstdint>
#include <string>

namespace chatimport::common {

bool ensureDirectory(const std::string& path, std::string* error);
bool fileSize(const std::string& path, int64_t* size, std::string* error);

// Keeps [A-Za-z0-9._-] and replaces everything else with '_'.
std::string sanitizeFileName(const std::string& name);

}  // namespace chatimport::common
