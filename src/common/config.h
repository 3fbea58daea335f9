#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace chatimport::common {

struct ImportConfig {
  std::string server_host;
  uint16_t server_port = 0;
  std::string data_dir;
  std::string temp_dir;
  std::string log_level;
  int upload_chunk_size = 128 * 1024;
  int animation_frame_count = 180;
  double animation_frame_rate = 60.0;
  int max_retries = 0;
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

ImportConfig loadImportConfig(const std::string& path);
ImportConfig parseImportConfig(const std::string& text);

}  // namespace chatimport::common
