#include "task.hpp"

#include <algorithm>

namespace convert_service {

std::string_view toString(JobStatus status) {
  switch (status) {
    case JobStatus::Pending: return "pending";
    case JobStatus::Processing: return "processing";
    case JobStatus::Completed: return "completed";
    case JobStatus::Failed: return "failed";
  }
  return "pending";
}

std::string_view toString(TaskState state) {
  switch (state) {
    case TaskState::Pending: return "pending";
    case TaskState::Processing: return "processing";
    case TaskState::Paused: return "paused";
    case TaskState::Completed: return "completed";
  }
  return "pending";
}

Task::Task(std::string id, SourceCategory source, MediaCategory category,
           ConversionOptions options, std::vector<FileJob> jobs)
  : id_(std::move(id)),
    source_(source),
    category_(category),
    options_(std::move(options)),
    created_at_(std::chrono::system_clock::now()),
    jobs_(std::move(jobs)),
    last_update_(std::chrono::steady_clock::now()) {}

TaskSnapshot Task::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  TaskSnapshot snap;
  snap.task_id = id_;
  snap.state = stateLocked();
  snap.paused = paused_;
  snap.created_at = created_at_;
  snap.source = source_;
  snap.category = category_;
  snap.output_format = options_.output_format;
  snap.overall_progress = overallProgressLocked();
  snap.files.reserve(jobs_.size());
  for (const auto& job : jobs_) {
    FileJobSnapshot file;
    file.filename = job.filename;
    file.status = job.status;
    file.progress = job.progress;
    file.error = job.error;
    if (job.output) {
      file.output_file = job.output->path.string();
      file.output_size = job.output->size;
    }
    snap.files.push_back(std::move(file));
  }
  return snap;
}

double Task::overallProgress() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return overallProgressLocked();
}

bool Task::isFinished() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_lanes_ == 0 && allJobsTerminalLocked();
}

std::chrono::steady_clock::time_point Task::lastUpdate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_update_;
}

// completed and failed both count as done: failures are never retried
double Task::overallProgressLocked() const {
  if (jobs_.empty()) {
    return 1.0;
  }
  double sum = 0.0;
  for (const auto& job : jobs_) {
    sum += isTerminal(job.status) ? 1.0 : job.progress;
  }
  return sum / static_cast<double>(jobs_.size());
}

bool Task::allJobsTerminalLocked() const {
  return std::all_of(jobs_.begin(), jobs_.end(),
                     [](const FileJob& job) { return isTerminal(job.status); });
}

size_t Task::busyJobsLocked() const {
  return static_cast<size_t>(std::count_if(jobs_.begin(), jobs_.end(), [](const FileJob& job) {
    return job.claimed || job.status == JobStatus::Processing;
  }));
}

TaskState Task::stateLocked() const {
  if (allJobsTerminalLocked()) {
    return TaskState::Completed;
  }
  if (paused_) {
    return TaskState::Paused;
  }
  bool processing = std::any_of(jobs_.begin(), jobs_.end(), [](const FileJob& job) {
    return job.status == JobStatus::Processing;
  });
  return processing ? TaskState::Processing : TaskState::Pending;
}

void Task::touchLocked() {
  last_update_ = std::chrono::steady_clock::now();
}

} // namespace convert_service
