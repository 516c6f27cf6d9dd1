#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace config {

struct HttpServiceConfig {
  std::string host;
  unsigned short port;
  int io_threads;
};

struct StorageConfig {
  std::string upload_dir;
  std::string local_dir;
  std::string output_dir;
};

struct EngineConfig {
  std::string ffmpeg_path;               // empty -> search PATH
  std::chrono::milliseconds terminate_grace;
  size_t diagnostic_tail_lines;
  int av_log_level;                      // AV_LOG_* value used by the media probe
};

struct SchedulerConfig {
  size_t worker_threads;
  size_t audio_lanes;
  std::chrono::seconds task_retention;
  std::chrono::seconds sweep_interval;
};

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Getters
const HttpServiceConfig& getHttp() const { return http_; }
const StorageConfig& getStorage() const { return storage_; }
const EngineConfig& getEngine() const { return engine_; }
const SchedulerConfig& getScheduler() const { return scheduler_; }
const std::string& getBaseDir() const { return base_dir_; }
std::string getHttpIpPort() const { return http_.host+":"+std::to_string(http_.port);}

private:
  Config();
  void applyEnvironment();

  HttpServiceConfig http_;
  StorageConfig storage_;
  EngineConfig engine_;
  SchedulerConfig scheduler_;
  std::string base_dir_;
};

} // namespace config
