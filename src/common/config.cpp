#include "common/config.h"

#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

namespace chatimport::common {

namespace {

constexpr int kMaxChunkSize = 16 * 1024 * 1024;

std::string readFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("failed to open config file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

template <typename T>
T readRequired(const nlohmann::json& root, const std::string& key) {
  if (!root.contains(key)) {
    throw ConfigError("missing required config key: " + key);
  }
  try {
    return root.at(key).get<T>();
  } catch (const nlohmann::json::exception&) {
    throw ConfigError("invalid type for config key: " + key);
  }
}

template <typename T>
T readOptional(const nlohmann::json& root, const std::string& key, const T& fallback) {
  if (!root.contains(key)) {
    return fallback;
  }
  try {
    return root.at(key).get<T>();
  } catch (const nlohmann::json::exception&) {
    throw ConfigError("invalid type for config key: " + key);
  }
}

uint16_t readPort(const nlohmann::json& root, const std::string& key) {
  const int port = readRequired<int>(root, key);
  if (port <= 0 || port > std::numeric_limits<uint16_t>::max()) {
    throw ConfigError("port out of range for key: " + key);
  }
  return static_cast<uint16_t>(port);
}

}  // namespace

ImportConfig parseImportConfig(const std::string& text) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& ex) {
    throw ConfigError(std::string("config is not valid json: ") + ex.what());
  }
  if (!json.is_object()) {
    throw ConfigError("config root must be an object");
  }

  ImportConfig cfg;
  cfg.server_host = readRequired<std::string>(json, "server_host");
  cfg.server_port = readPort(json, "server_port");
  cfg.data_dir = readRequired<std::string>(json, "data_dir");
  std::string default_temp = cfg.data_dir;
  if (!default_temp.empty() && default_temp.back() == '/') {
    default_temp.pop_back();
  }
  default_temp += "/tmp";
  cfg.temp_dir = readOptional<std::string>(json, "temp_dir", default_temp);
  cfg.log_level = readOptional<std::string>(json, "log_level", "info");
  cfg.upload_chunk_size = readOptional<int>(json, "upload_chunk_size", 128 * 1024);
  cfg.animation_frame_count = readOptional<int>(json, "animation_frame_count", 180);
  cfg.animation_frame_rate = readOptional<double>(json, "animation_frame_rate", 60.0);
  cfg.max_retries = readOptional<int>(json, "max_retries", 0);

  if (cfg.data_dir.empty()) {
    throw ConfigError("data_dir must not be empty");
  }
  if (cfg.upload_chunk_size <= 0 || cfg.upload_chunk_size > kMaxChunkSize) {
    throw ConfigError("upload_chunk_size must be in (0, 16 MiB]");
  }
  if (cfg.animation_frame_count <= 0) {
    throw ConfigError("animation_frame_count must be positive");
  }
  if (!(cfg.animation_frame_rate > 0.0)) {
    throw ConfigError("animation_frame_rate must be positive");
  }
  if (cfg.max_retries < 0) {
    throw ConfigError("max_retries must not be negative");
  }
  return cfg;
}

ImportConfig loadImportConfig(const std::string& path) {
  return parseImportConfig(readFile(path));
}

}  // namespace chatimport::common
