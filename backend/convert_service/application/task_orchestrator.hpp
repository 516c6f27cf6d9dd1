#pragma once

// project
#include "application/task_registry.hpp"
#include "common/config/config.hpp"
#include "common/thread_pool.hpp"
#include "domain/file_catalog.hpp"
#include "domain/media_probe.hpp"
#include "domain/task.hpp"
#include "domain/transcoding_engine.hpp"

// std
#include <atomic>
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace convert_service {

// Drives tasks through the transcoding engine.
//
// A task runs on lanes: sequential loops that claim the next pending job,
// probe it, start the engine, relay its progress and settle the result. Video
// tasks get one lane, audio tasks up to `audio_lanes`. Pause terminates every
// in-flight process and rolls its job back to pending before returning.
class TaskOrchestrator {
public:
  TaskOrchestrator(std::shared_ptr<TaskRegistry> registry,
                   std::shared_ptr<FileCatalog> catalog,
                   std::shared_ptr<MediaProbe> probe,
                   std::shared_ptr<TranscodingEngine> engine,
                   const config::SchedulerConfig& config);
  ~TaskOrchestrator();

  TaskOrchestrator(const TaskOrchestrator&) = delete;
  TaskOrchestrator& operator=(const TaskOrchestrator&) = delete;

  // Validates, creates the task in the registry and starts it. Nothing is
  // created when validation or file resolution fails.
  std::expected<std::shared_ptr<Task>, ConvertError> submit(
    const std::vector<std::string>& files, SourceCategory source, const ConversionOptions& options);

  void run(const std::shared_ptr<Task>& task);
  void pause(const std::shared_ptr<Task>& task);

  // Without `filenames` every non-terminal job runs again. With it only the
  // listed ones do; names that are not part of the task are ignored.
  void resume(const std::shared_ptr<Task>& task,
              const std::optional<std::vector<std::string>>& filenames = std::nullopt);

  // Pause, then fail whatever has not completed.
  void cancel(const std::shared_ptr<Task>& task);

  double overallProgress(const std::shared_ptr<Task>& task) const;

  // True once no lane of the task is running, false on timeout.
  bool waitUntilIdle(const std::shared_ptr<Task>& task, std::chrono::milliseconds timeout) const;

  // Pauses every registered task and refuses new work.
  void shutdown();

private:
  void runLane(const std::shared_ptr<Task>& task, uint64_t generation);
  void processJob(const std::shared_ptr<Task>& task, size_t index, uint64_t generation);
  void settleJob(const std::shared_ptr<Task>& task, size_t index,
                 const std::expected<void, ConvertError>& result);
  void failJob(const std::shared_ptr<Task>& task, size_t index, const ConvertError& error);

  // Marks every selected pending job failed. Caller holds the task mutex.
  static void failRemainingLocked(Task& task, const std::string& reason);

  std::shared_ptr<TaskRegistry> registry_;
  std::shared_ptr<FileCatalog> catalog_;
  std::shared_ptr<MediaProbe> probe_;
  std::shared_ptr<TranscodingEngine> engine_;
  const size_t audio_lanes_;
  std::atomic_bool stopping_{false};

  // declared last: joins the lanes before anything they use goes away
  common::ThreadPool pool_;
};

} // namespace convert_service
