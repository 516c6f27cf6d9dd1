#pragma once

// project
#include "domain/task.hpp"

// std
#include <chrono>
#include <expected>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace convert_service {

// Process-wide id -> Task store. Status polls take the shared lock only.
class TaskRegistry {
public:
  std::shared_ptr<Task> create(SourceCategory source, MediaCategory category,
                               ConversionOptions options, std::vector<FileJob> jobs);

  std::expected<std::shared_ptr<Task>, ConvertError> get(const std::string& id) const;

  // Refused with Conflict until every job is terminal and no lane is attached.
  std::expected<void, ConvertError> remove(const std::string& id);

  std::vector<std::shared_ptr<Task>> list() const;

  // Drops finished tasks idle for at least `retention`. Returns how many went.
  size_t evictExpired(std::chrono::steady_clock::time_point now, std::chrono::seconds retention);

  size_t size() const;

private:
  static std::string newId();

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Task>> tasks_;
};

} // namespace convert_service
