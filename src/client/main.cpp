#include "client/import/archive_reader.h"
#include "client/import/import_activity.h"
#include "client/import/import_plan.h"
#include "client/import/remote_import_service.h"
#include "client/net/net_client.h"
#include "client/ui/loop_animation.h"
#include "common/config.h"
#include "common/fs.h"
#include "common/log.h"
#include "common/temp_file_store.h"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

using chatimport::common::Logger;
using chatimport::common::LogLevel;

std::string argValue(int argc, char** argv, const std::string& name) {
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == name) {
      return argv[i + 1];
    }
  }
  return {};
}

std::string resolveConfigPath(int argc, char** argv) {
  const auto explicit_path = argValue(argc, argv, "--config");
  if (!explicit_path.empty()) {
    return explicit_path;
  }
  std::vector<std::string> candidates = {
      "config/chatimport.json",
      "../config/chatimport.json",
  };

  std::error_code error;
  const auto exe_path = std::filesystem::absolute(argv[0], error);
  if (!error) {
    const auto exe_dir = exe_path.parent_path();
    if (!exe_dir.empty()) {
      candidates.push_back((exe_dir / "config/chatimport.json").lexically_normal().string());
      candidates.push_back((exe_dir / "../config/chatimport.json").lexically_normal().string());
    }
  }

  for (const auto& path : candidates) {
    if (std::filesystem::exists(path)) {
      return path;
    }
  }
  return candidates.front();
}

double nowSeconds() {
  using Seconds = std::chrono::duration<double>;
  return std::chrono::duration_cast<Seconds>(std::chrono::steady_clock::now().time_since_epoch()).count();
}

std::string formatBytes(int64_t bytes) {
  static const char* kUnits[] = {"B", "KB", "MB", "GB"};
  double value = static_cast<double>(bytes);
  int unit = 0;
  while (value >= 1024.0 && unit < 3) {
    value /= 1024.0;
    ++unit;
  }
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), unit == 0 ? "%.0f %s" : "%.1f %s", value, kUnits[unit]);
  return buffer;
}

// Terminal stand-in for the import screen.
class ConsoleImportView : public chatimport::client::ImportActivityObserver {
 public:
  explicit ConsoleImportView(chatimport::client::LoopAnimation& animation) : animation_(animation) {}

  void onImportStateChanged(const chatimport::client::ImportState& state) override {
    if (state.isProgress()) {
      const int percent = static_cast<int>(state.fraction() * 100.0);
      if (percent != last_percent_) {
        last_percent_ = percent;
        Logger::log(LogLevel::Info, std::to_string(percent) + "% (" + formatBytes(state.uploadedBytes()) +
                                        " of " + formatBytes(state.totalBytes()) + ")");
      }
      return;
    }
    last_percent_ = -1;
    Logger::log(state.isDone() ? LogLevel::Info : LogLevel::Error, "import " + state.describe());
  }

  void onCompletionTransition() override {
    Logger::log(LogLevel::Debug, "finishing progress animation");
    animation_.stopAtNearestLoop();
  }

 private:
  chatimport::client::LoopAnimation& animation_;
  int last_percent_ = -1;
};

}  // namespace

int main(int argc, char** argv) {
  try {
    const std::string archive_path = argValue(argc, argv, "--archive");
    const std::string peer_text = argValue(argc, argv, "--peer");
    if (archive_path.empty() || peer_text.empty()) {
      std::cerr << "usage: " << argv[0] << " [--config <file>] --archive <zip> --peer <kind>:<id>" << std::endl;
      return 1;
    }

    const std::string config_path = resolveConfigPath(argc, argv);
    const auto config = chatimport::common::loadImportConfig(config_path);
    Logger::setLevel(chatimport::common::parseLogLevel(config.log_level));
    Logger::log(LogLevel::Info, "starting import with config: " + config_path);

    std::string error;
    chatimport::client::PeerId peer;
    if (!chatimport::client::parsePeerId(peer_text, &peer, &error)) {
      Logger::log(LogLevel::Error, "bad --peer: " + error);
      return 1;
    }
    if (!chatimport::common::ensureDirectory(config.data_dir, &error)) {
      Logger::log(LogLevel::Error, "failed to create data_dir: " + error);
      return 1;
    }

    chatimport::common::TempFileStore temp_files(config.temp_dir);
    temp_files.purge();

    chatimport::client::LibArchiveReader archive;
    std::vector<chatimport::client::ArchiveEntry> entries;
    if (!archive.listEntries(archive_path, &entries, &error)) {
      Logger::log(LogLevel::Error, "cannot read archive: " + error);
      return 1;
    }
    chatimport::client::ImportPlan plan;
    if (!chatimport::client::buildImportPlan(entries, &plan, &error)) {
      Logger::log(LogLevel::Error, error);
      return 1;
    }
    std::string primary_file;
    if (!temp_files.tempFile(plan.primary_entry, &primary_file, &error) ||
        !archive.extractEntry(archive_path, plan.primary_entry, primary_file, &error)) {
      Logger::log(LogLevel::Error, "cannot extract " + plan.primary_entry + ": " + error);
      return 1;
    }
    Logger::log(LogLevel::Info, "transcript " + plan.primary_entry + " with " +
                                    std::to_string(plan.media.size()) + " media files");

    chatimport::client::NetClient net;
    if (!net.connect(config.server_host, config.server_port, &error)) {
      Logger::log(LogLevel::Error, "connect failed: " + error);
      temp_files.purge();
      return 1;
    }

    chatimport::client::RemoteImportService service(net, config.upload_chunk_size);
    chatimport::client::LoopAnimation animation(config.animation_frame_count, config.animation_frame_rate);
    ConsoleImportView view(animation);

    chatimport::client::ImportActivity::Source source;
    source.peer = peer;
    source.archive_path = archive_path;
    source.primary_file = primary_file;
    source.entries = std::move(plan.media);
    chatimport::client::ImportActivity activity(service, archive, temp_files, std::move(source), view,
                                                config.animation_frame_rate);

    animation.setFrameCallback([&activity](int frame_index, int frame_count) {
      activity.onAnimationFrame(frame_index, frame_count);
    });
    animation.start(nowSeconds());
    activity.begin();

    int retries_left = config.max_retries;
    int exit_code = 0;
    chatimport::common::Packet packet;
    while (true) {
      while (net.pollPacket(&packet)) {
        if (!service.handlePacket(packet)) {
          Logger::log(LogLevel::Debug, "ignoring unsolicited packet " + std::to_string(packet.header.request_id));
        }
      }
      if (!net.connected()) {
        service.failAll("connection lost: " + net.lastError());
      }
      service.dispatchDeferred();
      animation.advance(nowSeconds());

      const auto& state = activity.state();
      if (state.isDone() && animation.isStopped()) {
        break;
      }
      if (state.isError()) {
        if (retries_left <= 0) {
          exit_code = 1;
          break;
        }
        --retries_left;
        activity.retry();
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }

    net.close();
    temp_files.purge();
    return exit_code;
  } catch (const chatimport::common::ConfigError& ex) {
    std::cerr << "config error: " << ex.what() << std::endl;
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "fatal error: " << ex.what() << std::endl;
    return 1;
  }
}
