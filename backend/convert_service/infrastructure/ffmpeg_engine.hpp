#pragma once

// project
#include "common/config/config.hpp"
#include "domain/transcoding_engine.hpp"

// boost
#include <boost/filesystem.hpp>
#include <boost/process.hpp>

// std
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace convert_service {

// One child process with its stderr piped back line by line. stdout and stdin
// are tied to the null device.
class FfmpegProcess : public TranscodeProcess {
public:
  // Throws boost::process::process_error when the executable cannot be started.
  FfmpegProcess(const boost::filesystem::path& executable,
                const std::vector<std::string>& arguments,
                std::chrono::milliseconds terminate_grace,
                size_t tail_lines);
  ~FfmpegProcess() override;

  FfmpegProcess(const FfmpegProcess&) = delete;
  FfmpegProcess& operator=(const FfmpegProcess&) = delete;

  std::optional<std::string> nextLine() override;
  std::expected<void, ConvertError> wait() override;
  void terminate() override;

  int pid() const { return pid_; }

private:
  void readLoop();
  void waitLoop();
  std::string tailLocked() const;

  const std::chrono::milliseconds grace_;
  const size_t tail_lines_;

  boost::process::ipstream stderr_;
  boost::process::child child_;
  const int pid_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> lines_;
  std::deque<std::string> tail_;  // last non-progress lines, for error reports
  bool eof_{false};
  bool exiting_{false};  // exited but not reaped yet; the pid is still ours
  bool exited_{false};
  bool terminate_requested_{false};
  int exit_code_{-1};

  std::jthread reader_;
  std::jthread waiter_;
};

class FfmpegEngine : public TranscodingEngine {
public:
  explicit FfmpegEngine(config::EngineConfig config);

  std::expected<std::shared_ptr<TranscodeProcess>, ConvertError> start(
    const TranscodeRequest& request) override;

  // Configured path when it names a file, PATH lookup otherwise.
  std::expected<boost::filesystem::path, ConvertError> locateBinary() const;

private:
  config::EngineConfig config_;
};

} // namespace convert_service
