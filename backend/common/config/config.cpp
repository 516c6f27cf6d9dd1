#include "config.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <string_view>

namespace config {

namespace {

const char* env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

template <typename T>
bool envNumber(const char* name, T& out) {
  const char* value = env(name);
  if (!value) {
    return false;
  }
  std::string_view text(value);
  T parsed{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    std::cerr << "[config] ignoring invalid " << name << "=" << text << std::endl;
    return false;
  }
  out = parsed;
  return true;
}

} // namespace

  Config::Config() {
    base_dir_ = "/var/lib/mediaconv";

    http_ = {
      .host = "0.0.0.0",
      .port = 5123,
      .io_threads = 4
    };

    engine_ = {
      .ffmpeg_path = "",
      .terminate_grace = std::chrono::milliseconds(5000),
      .diagnostic_tail_lines = 20,
      .av_log_level = 16 // AV_LOG_ERROR
    };

    scheduler_ = {
      .worker_threads = 8,
      .audio_lanes = 3,
      .task_retention = std::chrono::seconds(3600),
      .sweep_interval = std::chrono::seconds(60)
    };

    applyEnvironment();

    storage_ = {
      .upload_dir = base_dir_ + "/uploads",
      .local_dir = base_dir_ + "/localfiles",
      .output_dir = base_dir_ + "/outputs"
    };
  }

  void Config::applyEnvironment() {
    if (const char* host = env("MEDIACONV_HOST")) {
      http_.host = host;
    }
    envNumber("MEDIACONV_PORT", http_.port);
    if (const char* dir = env("MEDIACONV_BASE_DIR")) {
      base_dir_ = dir;
    }
    if (const char* ffmpeg = env("FFMPEG_PATH")) {
      engine_.ffmpeg_path = ffmpeg;
    }

    size_t lanes = scheduler_.audio_lanes;
    if (envNumber("MEDIACONV_AUDIO_LANES", lanes)) {
      scheduler_.audio_lanes = std::clamp<size_t>(lanes, 2, 4);
    }
    size_t workers = scheduler_.worker_threads;
    if (envNumber("MEDIACONV_WORKERS", workers) && workers > 0) {
      scheduler_.worker_threads = workers;
    }
    long retention = 0;
    if (envNumber("MEDIACONV_TASK_RETENTION", retention) && retention > 0) {
      scheduler_.task_retention = std::chrono::seconds(retention);
    }
  }
}
