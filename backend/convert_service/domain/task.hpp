#pragma once

// project
#include "conversion_options.hpp"
#include "media.hpp"
#include "transcoding_engine.hpp"

// std
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace convert_service {

enum class JobStatus { Pending, Processing, Completed, Failed };

enum class TaskState { Pending, Processing, Paused, Completed };

std::string_view toString(JobStatus status);
std::string_view toString(TaskState state);

inline bool isTerminal(JobStatus status) {
  return status == JobStatus::Completed || status == JobStatus::Failed;
}

struct OutputArtifact {
  std::filesystem::path path;
  std::uintmax_t size{0};
};

struct FileJob {
  std::string filename;                 // as submitted, relative to the source root
  SourceCategory source{SourceCategory::Upload};
  std::filesystem::path input_path;
  std::filesystem::path output_path;    // final artifact
  std::filesystem::path staging_path;   // partial artifact while the engine runs

  JobStatus status{JobStatus::Pending};
  double progress{0.0};
  std::optional<OutputArtifact> output;
  std::optional<std::string> error;
  std::optional<MediaInfo> media;

  bool selected{true};                  // part of the current run
  bool claimed{false};                  // reserved by a lane, probe in flight
  std::shared_ptr<TranscodeProcess> process;  // set only while Processing
};

struct FileJobSnapshot {
  std::string filename;
  JobStatus status{JobStatus::Pending};
  double progress{0.0};
  std::optional<std::string> error;
  std::optional<std::string> output_file;
  std::optional<std::uintmax_t> output_size;
};

struct TaskSnapshot {
  std::string task_id;
  TaskState state{TaskState::Pending};
  bool paused{false};
  std::chrono::system_clock::time_point created_at;
  SourceCategory source{SourceCategory::Upload};
  MediaCategory category{MediaCategory::Audio};
  std::string output_format;
  std::vector<FileJobSnapshot> files;
  double overall_progress{0.0};
};

// A submitted batch. Readable from any thread; only TaskOrchestrator mutates it.
class Task {
public:
  Task(std::string id, SourceCategory source, MediaCategory category,
       ConversionOptions options, std::vector<FileJob> jobs);

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  const std::string& id() const { return id_; }
  SourceCategory source() const { return source_; }
  MediaCategory category() const { return category_; }
  const ConversionOptions& options() const { return options_; }
  std::chrono::system_clock::time_point createdAt() const { return created_at_; }

  TaskSnapshot snapshot() const;
  double overallProgress() const;

  // Every job completed or failed and no lane still attached.
  bool isFinished() const;
  std::chrono::steady_clock::time_point lastUpdate() const;

private:
  friend class TaskOrchestrator;

  double overallProgressLocked() const;
  bool allJobsTerminalLocked() const;
  size_t busyJobsLocked() const;
  TaskState stateLocked() const;
  void touchLocked();

  const std::string id_;
  const SourceCategory source_;
  const MediaCategory category_;
  const ConversionOptions options_;
  const std::chrono::system_clock::time_point created_at_;

  mutable std::mutex mutex_;
  std::condition_variable changed_;
  std::vector<FileJob> jobs_;
  bool paused_{false};
  bool pausing_{false};                 // pause() is terminating processes
  uint64_t generation_{0};
  size_t active_lanes_{0};
  int consecutive_spawn_failures_{0};
  std::chrono::steady_clock::time_point last_update_;
};

} // namespace convert_service
