#pragma once

#include "domain/media_probe.hpp"
#include "domain/transcoding_engine.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace convert_service::fakes {

// Probe answering from a table keyed by file name; anything else is classified
// by extension with a 10 second duration.
class FakeProbe : public MediaProbe {
public:
  static constexpr double kDefaultDuration = 10.0;

  void set(const std::string& filename, std::expected<MediaInfo, ConvertError> result) {
    std::lock_guard<std::mutex> lock(mutex_);
    results_.insert_or_assign(filename, std::move(result));
  }

  std::expected<MediaInfo, ConvertError> probe(const std::filesystem::path& path) override {
    std::lock_guard<std::mutex> lock(mutex_);
    probed_.push_back(path.filename().string());
    if (auto it = results_.find(path.filename().string()); it != results_.end()) {
      return it->second;
    }
    return MediaInfo{categoryOfFile(path.filename().string()).value_or(MediaCategory::Audio),
                     kDefaultDuration};
  }

  std::vector<std::string> probed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return probed_;
  }

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::expected<MediaInfo, ConvertError>> results_;
  std::vector<std::string> probed_;
};

// Shared barrier for held processes.
struct Gate {
  std::mutex mutex;
  std::condition_variable cv;
  bool open{false};

  void release() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      open = true;
    }
    cv.notify_all();
  }
};

struct Script {
  std::vector<std::string> lines{"out_time_us=5000000", "progress=continue"};
  bool hold{false};                     // after the lines, block until the gate opens or terminate()
  std::optional<ConvertError> failure;  // exit result once the stream ends
  std::chrono::milliseconds terminate_delay{0};  // time the process takes to die
};

class FakeProcess : public TranscodeProcess {
public:
  FakeProcess(Script script, std::shared_ptr<Gate> gate, std::filesystem::path staging,
              std::function<void()> on_exit)
    : script_(std::move(script)), gate_(std::move(gate)),
      staging_(std::move(staging)), on_exit_(std::move(on_exit)) {}

  std::optional<std::string> nextLine() override {
    std::unique_lock<std::mutex> lock(gate_->mutex);
    if (!terminated_ && next_ < script_.lines.size()) {
      return script_.lines[next_++];
    }
    holdLocked(lock);
    return std::nullopt;
  }

  std::expected<void, ConvertError> wait() override {
    std::unique_lock<std::mutex> lock(gate_->mutex);
    holdLocked(lock);
    exitLocked();
    if (terminated_) {
      return std::unexpected(ConvertError{ErrorCode::Terminated, "terminated"});
    }
    if (script_.failure) {
      return std::unexpected(*script_.failure);
    }
    std::ofstream(staging_, std::ios::binary | std::ios::trunc) << "converted media payload";
    return {};
  }

  void terminate() override {
    std::this_thread::sleep_for(script_.terminate_delay);
    std::lock_guard<std::mutex> lock(gate_->mutex);
    if (exited_) {
      return;
    }
    terminated_ = true;
    exitLocked();
    gate_->cv.notify_all();
  }

private:
  void holdLocked(std::unique_lock<std::mutex>& lock) {
    if (script_.hold) {
      gate_->cv.wait(lock, [this] { return terminated_ || gate_->open; });
    }
  }

  void exitLocked() {
    if (!exited_) {
      exited_ = true;
      on_exit_();
    }
  }

  Script script_;
  std::shared_ptr<Gate> gate_;
  std::filesystem::path staging_;
  std::function<void()> on_exit_;
  size_t next_{0};
  bool terminated_{false};
  bool exited_{false};
};

// Engine whose processes follow a per-file script. Writes a partial staging
// file at start like a real encoder would.
class FakeEngine : public TranscodingEngine {
public:
  void script(const std::string& filename, Script script) {
    std::lock_guard<std::mutex> lock(mutex_);
    scripts_.insert_or_assign(filename, std::move(script));
  }

  void holdAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    default_script_.hold = true;
  }

  void delayStart(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    start_delay_ = delay;
  }

  void failSpawn(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_spawn_ = fail;
  }

  Gate& gate() { return *gate_; }

  std::expected<std::shared_ptr<TranscodeProcess>, ConvertError> start(
    const TranscodeRequest& request) override {
    std::chrono::milliseconds delay{0};
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++spawn_attempts_;
      delay = start_delay_;
    }
    std::this_thread::sleep_for(delay);

    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_spawn_) {
      return std::unexpected(ConvertError{ErrorCode::Spawn, "ffmpeg not found in PATH"});
    }

    const auto name = request.input_path.filename().string();
    Script script = default_script_;
    if (auto it = scripts_.find(name); it != scripts_.end()) {
      script = it->second;
    }
    std::ofstream(request.output_path, std::ios::binary | std::ios::trunc) << "partial";

    ++running_;
    max_running_ = std::max(max_running_, running_);
    started_.push_back(name);
    requests_.push_back(request);
    return std::make_shared<FakeProcess>(std::move(script), gate_, request.output_path, [this] {
      std::lock_guard<std::mutex> lock(mutex_);
      --running_;
    });
  }

  int running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
  }

  int maxRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_running_;
  }

  int spawnAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spawn_attempts_;
  }

  std::vector<std::string> started() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
  }

  std::vector<TranscodeRequest> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

private:
  mutable std::mutex mutex_;
  std::shared_ptr<Gate> gate_ = std::make_shared<Gate>();
  std::map<std::string, Script> scripts_;
  Script default_script_;
  bool fail_spawn_{false};
  std::chrono::milliseconds start_delay_{0};
  int running_{0};
  int max_running_{0};
  int spawn_attempts_{0};
  std::vector<std::string> started_;
  std::vector<TranscodeRequest> requests_;
};

} // namespace convert_service::fakes
