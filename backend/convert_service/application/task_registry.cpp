#include "task_registry.hpp"

#include <uuid/uuid.h>

#include <algorithm>
#include <iostream>
#include <mutex>

namespace convert_service {

std::string TaskRegistry::newId() {
  uuid_t uuid;
  uuid_generate(uuid);
  char uuid_str[37];
  uuid_unparse(uuid, uuid_str);
  return uuid_str;
}

std::shared_ptr<Task> TaskRegistry::create(SourceCategory source, MediaCategory category,
                                           ConversionOptions options, std::vector<FileJob> jobs) {
  std::unique_lock lock(mutex_);
  std::string id = newId();
  while (tasks_.contains(id)) {
    id = newId();
  }
  auto task = std::make_shared<Task>(id, source, category, std::move(options), std::move(jobs));
  tasks_.emplace(id, task);
  return task;
}

std::expected<std::shared_ptr<Task>, ConvertError> TaskRegistry::get(const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return std::unexpected(ConvertError{ErrorCode::NotFound, "task not found: " + id});
  }
  return it->second;
}

std::expected<void, ConvertError> TaskRegistry::remove(const std::string& id) {
  std::unique_lock lock(mutex_);
  auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return std::unexpected(ConvertError{ErrorCode::NotFound, "task not found: " + id});
  }
  if (!it->second->isFinished()) {
    return std::unexpected(ConvertError{ErrorCode::Conflict, "task still has unfinished files: " + id});
  }
  tasks_.erase(it);
  std::cout << "[registry] removed task " << id << std::endl;
  return {};
}

std::vector<std::shared_ptr<Task>> TaskRegistry::list() const {
  std::shared_lock lock(mutex_);
  std::vector<std::shared_ptr<Task>> tasks;
  tasks.reserve(tasks_.size());
  for (const auto& [id, task] : tasks_) {
    tasks.push_back(task);
  }
  std::sort(tasks.begin(), tasks.end(), [](const auto& a, const auto& b) {
    return a->createdAt() < b->createdAt();
  });
  return tasks;
}

size_t TaskRegistry::evictExpired(std::chrono::steady_clock::time_point now,
                                  std::chrono::seconds retention) {
  std::unique_lock lock(mutex_);
  auto evicted = std::erase_if(tasks_, [&](const auto& entry) {
    const auto& task = entry.second;
    return task->isFinished() && task->lastUpdate() + retention <= now;
  });
  if (evicted > 0) {
    std::cout << "[registry] evicted " << evicted << " expired task(s)" << std::endl;
  }
  return evicted;
}

size_t TaskRegistry::size() const {
  std::shared_lock lock(mutex_);
  return tasks_.size();
}

} // namespace convert_service
