#include "task_orchestrator.hpp"

#include "infrastructure/progress_parser.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <iostream>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace convert_service {

namespace {

constexpr int kSpawnFailureLimit = 2;

// Engine-visible duration once the trim range is applied; 0 when unknown.
double effectiveDuration(const MediaInfo& info, const ConversionOptions& options) {
  if (info.duration_seconds <= 0.0) {
    return 0.0;
  }
  const double start = options.trim_start.value_or(0.0);
  const double end = std::min(options.trim_end.value_or(info.duration_seconds), info.duration_seconds);
  return std::max(0.0, end - start);
}

fs::path uniqueOutput(const fs::path& wanted, const std::set<fs::path>& taken) {
  if (!taken.contains(wanted)) {
    return wanted;
  }
  for (int counter = 1;; ++counter) {
    auto candidate = wanted.parent_path() /
                     std::format("{}_{}{}", wanted.stem().string(), counter, wanted.extension().string());
    if (!taken.contains(candidate)) {
      return candidate;
    }
  }
}

} // namespace

TaskOrchestrator::TaskOrchestrator(std::shared_ptr<TaskRegistry> registry,
                                   std::shared_ptr<FileCatalog> catalog,
                                   std::shared_ptr<MediaProbe> probe,
                                   std::shared_ptr<TranscodingEngine> engine,
                                   const config::SchedulerConfig& config)
  : registry_(std::move(registry)),
    catalog_(std::move(catalog)),
    probe_(std::move(probe)),
    engine_(std::move(engine)),
    audio_lanes_(std::max<size_t>(1, config.audio_lanes)),
    pool_(static_cast<unsigned>(config.worker_threads)) {}

TaskOrchestrator::~TaskOrchestrator() {
  shutdown();
}

std::expected<std::shared_ptr<Task>, ConvertError> TaskOrchestrator::submit(
  const std::vector<std::string>& files, SourceCategory source, const ConversionOptions& options) {
  if (stopping_.load()) {
    return std::unexpected(ConvertError{ErrorCode::Conflict, "service is shutting down"});
  }
  if (auto valid = validateOptions(options); !valid) {
    return std::unexpected(valid.error());
  }
  if (files.empty()) {
    return std::unexpected(validationError("no files given"));
  }

  const auto format = lowercase(options.output_format);
  const auto target = categoryOfFormat(format);

  std::optional<MediaCategory> batch;
  for (const auto& file : files) {
    auto category = categoryOfFile(file);
    if (!category) {
      return std::unexpected(validationError("unsupported file type: " + file));
    }
    if (batch && *batch != *category) {
      return std::unexpected(validationError("audio and video files cannot be mixed in one task"));
    }
    batch = category;
  }
  if (*batch == MediaCategory::Audio && target == MediaCategory::Video) {
    return std::unexpected(validationError("audio files cannot be converted to a video format"));
  }

  std::vector<fs::path> inputs;
  inputs.reserve(files.size());
  for (const auto& file : files) {
    auto input = catalog_->resolve(source, file);
    if (!input) {
      return std::unexpected(input.error());
    }
    inputs.push_back(std::move(*input));
  }

  // outputs never overwrite an input or each other
  std::set<fs::path> taken(inputs.begin(), inputs.end());
  std::vector<FileJob> jobs;
  jobs.reserve(files.size());
  for (size_t i = 0; i < files.size(); ++i) {
    FileJob job;
    job.filename = files[i];
    job.source = source;
    job.input_path = inputs[i];
    job.output_path = uniqueOutput(catalog_->outputPathFor(files[i], format), taken);
    taken.insert(job.output_path);
    jobs.push_back(std::move(job));
  }

  auto task = registry_->create(source, *batch, options, std::move(jobs));
  {
    // tasks converting the same file write to the same output directory
    std::lock_guard<std::mutex> lock(task->mutex_);
    for (size_t i = 0; i < task->jobs_.size(); ++i) {
      auto& job = task->jobs_[i];
      job.staging_path = job.output_path.parent_path() /
                         std::format(".{}.{}.{}.partial.{}", job.output_path.stem().string(),
                                     task->id(), i, format);
    }
  }
  std::cout << "[orchestrator] task " << task->id() << " created: " << files.size() << " "
            << toString(*batch) << " file(s) -> " << options.debug() << std::endl;
  run(task);
  return task;
}

void TaskOrchestrator::run(const std::shared_ptr<Task>& task) {
  if (stopping_.load()) {
    return;
  }
  size_t lanes = 0;
  uint64_t generation = 0;
  {
    std::unique_lock<std::mutex> lock(task->mutex_);
    task->changed_.wait(lock, [&] { return !task->pausing_; });
    if (task->active_lanes_ > 0 && !task->paused_) {
      return;
    }
    const auto runnable = static_cast<size_t>(std::count_if(
      task->jobs_.begin(), task->jobs_.end(), [](const FileJob& job) {
        return job.status == JobStatus::Pending && job.selected;
      }));
    // nothing selected: unselected jobs keep the task paused
    task->paused_ = runnable == 0 && !task->allJobsTerminalLocked();
    generation = ++task->generation_;

    lanes = task->category_ == MediaCategory::Video ? std::min<size_t>(1, runnable)
                                                    : std::min(audio_lanes_, runnable);
    task->active_lanes_ += lanes;
    task->touchLocked();
  }

  for (size_t i = 0; i < lanes; ++i) {
    pool_.commit([this, task, generation] { runLane(task, generation); });
  }
}

void TaskOrchestrator::runLane(const std::shared_ptr<Task>& task, uint64_t generation) {
  while (true) {
    size_t index = 0;
    {
      std::lock_guard<std::mutex> lock(task->mutex_);
      if (task->paused_ || task->generation_ != generation) {
        break;
      }
      auto it = std::find_if(task->jobs_.begin(), task->jobs_.end(), [](const FileJob& job) {
        return job.status == JobStatus::Pending && job.selected && !job.claimed;
      });
      if (it == task->jobs_.end()) {
        break;
      }
      it->claimed = true;
      index = static_cast<size_t>(it - task->jobs_.begin());
    }

    try {
      processJob(task, index, generation);
    } catch (const std::exception& e) {
      std::cerr << "[orchestrator] task " << task->id() << ": " << e.what() << std::endl;
      failJob(task, index, ConvertError{ErrorCode::Encode, e.what()});
    }
  }

  std::lock_guard<std::mutex> lock(task->mutex_);
  --task->active_lanes_;
  // a narrowed resume leaves unselected jobs behind; they wait for the next resume
  if (task->active_lanes_ == 0 && !task->paused_ && !task->allJobsTerminalLocked()) {
    task->paused_ = true;
  }
  task->touchLocked();
  task->changed_.notify_all();
  if (task->active_lanes_ == 0 && task->allJobsTerminalLocked()) {
    std::cout << "[orchestrator] task " << task->id() << " finished" << std::endl;
  }
}

void TaskOrchestrator::processJob(const std::shared_ptr<Task>& task, size_t index, uint64_t generation) {
  fs::path input;
  fs::path staging;
  {
    std::lock_guard<std::mutex> lock(task->mutex_);
    input = task->jobs_[index].input_path;
    staging = task->jobs_[index].staging_path;
  }

  auto info = probe_->probe(input);
  if (!info) {
    failJob(task, index, info.error());
    return;
  }

  std::error_code ec;
  fs::create_directories(staging.parent_path(), ec);
  if (ec) {
    failJob(task, index, ConvertError{ErrorCode::Spawn, std::format(
      "cannot create {}: {}", staging.parent_path().string(), ec.message())});
    return;
  }

  TranscodeRequest request{input, staging, info->category, task->options_};
  {
    std::lock_guard<std::mutex> lock(task->mutex_);
    auto& job = task->jobs_[index];
    job.media = *info;
    if (task->paused_ || task->generation_ != generation) {
      job.claimed = false;
      task->changed_.notify_all();
      return;
    }
  }

  // the job stays claimed while the engine starts, so a concurrent pause waits
  // for this lane to attach or discard the process
  auto started = engine_->start(request);

  std::shared_ptr<TranscodeProcess> process;
  {
    std::unique_lock<std::mutex> lock(task->mutex_);
    auto& job = task->jobs_[index];
    if (!started) {
      job.status = JobStatus::Failed;
      job.error = started.error().message;
      job.claimed = false;
      std::cerr << "[orchestrator] task " << task->id() << ": " << job.filename << ": "
                << started.error().message << std::endl;
      if (++task->consecutive_spawn_failures_ >= kSpawnFailureLimit) {
        failRemainingLocked(*task, started.error().message);
      }
      task->touchLocked();
      task->changed_.notify_all();
      return;
    }

    task->consecutive_spawn_failures_ = 0;
    process = *started;
    if (task->paused_ || task->generation_ != generation) {
      lock.unlock();
      process->terminate();
      settleJob(task, index, process->wait());
      return;
    }
    job.process = process;
    job.status = JobStatus::Processing;
    job.progress = 0.0;
    task->touchLocked();
  }

  ProgressParser parser(effectiveDuration(*info, task->options_));
  while (auto line = process->nextLine()) {
    if (auto fraction = parser.feed(*line)) {
      std::lock_guard<std::mutex> lock(task->mutex_);
      auto& job = task->jobs_[index];
      job.progress = std::max(job.progress, *fraction);
    }
  }

  settleJob(task, index, process->wait());
}

void TaskOrchestrator::settleJob(const std::shared_ptr<Task>& task, size_t index,
                                 const std::expected<void, ConvertError>& result) {
  fs::path staging;
  fs::path output;
  std::string filename;
  {
    std::lock_guard<std::mutex> lock(task->mutex_);
    staging = task->jobs_[index].staging_path;
    output = task->jobs_[index].output_path;
    filename = task->jobs_[index].filename;
  }

  std::optional<OutputArtifact> artifact;
  std::optional<ConvertError> error;
  std::error_code ec;
  if (result) {
    fs::rename(staging, output, ec);
    if (ec) {
      error = ConvertError{ErrorCode::Encode, std::format("cannot move output to {}: {}",
                                                          output.string(), ec.message())};
    } else {
      auto size = fs::file_size(output, ec);
      artifact = OutputArtifact{output, ec ? 0 : size};
    }
  } else {
    error = result.error();
  }
  if (!artifact) {
    fs::remove(staging, ec);
  }

  std::lock_guard<std::mutex> lock(task->mutex_);
  auto& job = task->jobs_[index];
  job.process.reset();
  job.claimed = false;
  if (artifact) {
    job.status = JobStatus::Completed;
    job.progress = 1.0;
    job.output = artifact;
    std::cout << "[orchestrator] task " << task->id() << ": " << filename << " -> "
              << output.string() << " (" << artifact->size << " bytes)" << std::endl;
  } else if (error->code == ErrorCode::Terminated) {
    job.status = JobStatus::Pending;
    job.progress = 0.0;
  } else {
    job.status = JobStatus::Failed;
    job.error = error->message;
    std::cerr << "[orchestrator] task " << task->id() << ": " << filename << " failed: "
              << toString(error->code) << std::endl;
  }
  task->touchLocked();
  task->changed_.notify_all();
}

void TaskOrchestrator::failJob(const std::shared_ptr<Task>& task, size_t index, const ConvertError& error) {
  std::shared_ptr<TranscodeProcess> process;
  {
    std::lock_guard<std::mutex> lock(task->mutex_);
    process = task->jobs_[index].process;
  }
  if (process) {
    process->terminate();
  }

  fs::path staging;
  {
    std::lock_guard<std::mutex> lock(task->mutex_);
    staging = task->jobs_[index].staging_path;
  }
  std::error_code ec;
  fs::remove(staging, ec);

  std::lock_guard<std::mutex> lock(task->mutex_);
  auto& job = task->jobs_[index];
  job.process.reset();
  job.claimed = false;
  job.status = JobStatus::Failed;
  job.error = error.message;
  std::cerr << "[orchestrator] task " << task->id() << ": " << job.filename << " failed: "
            << toString(error.code) << ": " << error.message << std::endl;
  task->touchLocked();
  task->changed_.notify_all();
}

void TaskOrchestrator::failRemainingLocked(Task& task, const std::string& reason) {
  for (auto& job : task.jobs_) {
    if (job.status == JobStatus::Pending && job.selected && !job.claimed) {
      job.status = JobStatus::Failed;
      job.error = reason;
    }
  }
}

void TaskOrchestrator::pause(const std::shared_ptr<Task>& task) {
  std::vector<std::shared_ptr<TranscodeProcess>> running;
  {
    // a concurrent pause returns only once the first one has rolled back
    std::unique_lock<std::mutex> lock(task->mutex_);
    task->changed_.wait(lock, [&] { return !task->pausing_; });
    if (task->paused_ || task->allJobsTerminalLocked()) {
      return;
    }
    task->paused_ = true;
    task->pausing_ = true;
    task->touchLocked();
    for (const auto& job : task->jobs_) {
      if (job.process) {
        running.push_back(job.process);
      }
    }
  }

  for (const auto& process : running) {
    process->terminate();
  }

  std::unique_lock<std::mutex> lock(task->mutex_);
  task->changed_.wait(lock, [&] { return task->busyJobsLocked() == 0; });
  task->pausing_ = false;
  task->changed_.notify_all();
  std::cout << "[orchestrator] task " << task->id() << " paused" << std::endl;
}

void TaskOrchestrator::resume(const std::shared_ptr<Task>& task,
                              const std::optional<std::vector<std::string>>& filenames) {
  {
    std::unique_lock<std::mutex> lock(task->mutex_);
    task->changed_.wait(lock, [&] { return !task->pausing_; });
    if (task->active_lanes_ > 0 && !task->paused_) {
      return;
    }
    if (filenames) {
      const std::set<std::string> wanted(filenames->begin(), filenames->end());
      for (auto& job : task->jobs_) {
        job.selected = wanted.contains(job.filename);
      }
      for (const auto& name : wanted) {
        bool known = std::any_of(task->jobs_.begin(), task->jobs_.end(),
                                 [&](const FileJob& job) { return job.filename == name; });
        if (!known) {
          std::cerr << "[orchestrator] task " << task->id() << ": resume ignores unknown file "
                    << name << std::endl;
        }
      }
    } else {
      for (auto& job : task->jobs_) {
        job.selected = true;
      }
    }
  }
  std::cout << "[orchestrator] task " << task->id() << " resumed" << std::endl;
  run(task);
}

void TaskOrchestrator::cancel(const std::shared_ptr<Task>& task) {
  pause(task);
  std::lock_guard<std::mutex> lock(task->mutex_);
  for (auto& job : task->jobs_) {
    if (!isTerminal(job.status)) {
      job.status = JobStatus::Failed;
      job.error = "cancelled";
    }
  }
  task->touchLocked();
  task->changed_.notify_all();
  std::cout << "[orchestrator] task " << task->id() << " cancelled" << std::endl;
}

double TaskOrchestrator::overallProgress(const std::shared_ptr<Task>& task) const {
  return task->overallProgress();
}

bool TaskOrchestrator::waitUntilIdle(const std::shared_ptr<Task>& task,
                                     std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(task->mutex_);
  return task->changed_.wait_for(lock, timeout, [&] { return task->active_lanes_ == 0; });
}

void TaskOrchestrator::shutdown() {
  if (stopping_.exchange(true)) {
    return;
  }
  for (const auto& task : registry_->list()) {
    pause(task);
  }
}

} // namespace convert_service
