#include "ffmpeg_engine.hpp"

#include "ffmpeg_command.hpp"
#include "progress_parser.hpp"

#include <cerrno>
#include <csignal>
#include <format>
#include <iostream>
#include <system_error>

#include <sys/types.h>
#include <sys/wait.h>
#include <signal.h>

namespace bp = boost::process;

namespace convert_service {

FfmpegProcess::FfmpegProcess(const boost::filesystem::path& executable,
                             const std::vector<std::string>& arguments,
                             std::chrono::milliseconds terminate_grace,
                             size_t tail_lines)
  : grace_(terminate_grace),
    tail_lines_(tail_lines),
    child_(executable, bp::args(arguments),
           bp::std_out > bp::null, bp::std_err > stderr_, bp::std_in < bp::null),
    pid_(child_.id()) {
  reader_ = std::jthread([this] { readLoop(); });
  waiter_ = std::jthread([this] { waitLoop(); });
}

FfmpegProcess::~FfmpegProcess() {
  terminate();
  if (waiter_.joinable()) {
    waiter_.join();
  }
  if (reader_.joinable()) {
    reader_.join();
  }
}

void FfmpegProcess::readLoop() {
  std::string line;
  while (std::getline(stderr_, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!line.empty() && !ProgressParser::isProgressLine(line)) {
      tail_.push_back(line);
      if (tail_.size() > tail_lines_) {
        tail_.pop_front();
      }
    }
    lines_.push_back(std::move(line));
    cv_.notify_all();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  eof_ = true;
  cv_.notify_all();
}

void FfmpegProcess::waitLoop() {
  // wait for the exit without reaping: the pid stays reserved until signals
  // from terminate() can no longer be sent
  siginfo_t info{};
  while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) == -1 && errno == EINTR) {
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    exiting_ = true;
    cv_.notify_all();
  }

  std::error_code ec;
  child_.wait(ec);
  std::lock_guard<std::mutex> lock(mutex_);
  if (ec) {
    std::cerr << "[ffmpeg] wait for pid " << pid_ << " failed: " << ec.message() << std::endl;
    exit_code_ = -1;
  } else {
    exit_code_ = child_.exit_code();
  }
  exited_ = true;
  cv_.notify_all();
}

std::optional<std::string> FfmpegProcess::nextLine() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !lines_.empty() || eof_; });
  if (lines_.empty()) {
    return std::nullopt;
  }
  std::string line = std::move(lines_.front());
  lines_.pop_front();
  return line;
}

std::expected<void, ConvertError> FfmpegProcess::wait() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return exited_; });
  if (terminate_requested_) {
    return std::unexpected(ConvertError{ErrorCode::Terminated, "terminated"});
  }
  if (exit_code_ == 0) {
    return {};
  }
  return std::unexpected(ConvertError{
    ErrorCode::Encode, std::format("ffmpeg exited with code {}: {}", exit_code_, tailLocked())});
}

void FfmpegProcess::terminate() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!exiting_) {
    terminate_requested_ = true;
    ::kill(pid_, SIGTERM);
    if (!cv_.wait_for(lock, grace_, [this] { return exiting_; })) {
      std::cerr << "[ffmpeg] pid " << pid_ << " still running after "
                << grace_.count() << "ms, sending SIGKILL" << std::endl;
      ::kill(pid_, SIGKILL);
    }
  }
  cv_.wait(lock, [this] { return exited_; });
}

std::string FfmpegProcess::tailLocked() const {
  std::string text;
  for (const auto& line : tail_) {
    if (!text.empty()) {
      text += '\n';
    }
    text += line;
  }
  return text;
}

FfmpegEngine::FfmpegEngine(config::EngineConfig config) : config_(std::move(config)) {}

std::expected<boost::filesystem::path, ConvertError> FfmpegEngine::locateBinary() const {
  const std::string name = config_.ffmpeg_path.empty() ? "ffmpeg" : config_.ffmpeg_path;
  if (name.find('/') != std::string::npos) {
    boost::system::error_code ec;
    if (!boost::filesystem::is_regular_file(name, ec)) {
      return std::unexpected(ConvertError{ErrorCode::Spawn, "ffmpeg binary not found: " + name});
    }
    return boost::filesystem::path(name);
  }
  auto found = bp::search_path(name);
  if (found.empty()) {
    return std::unexpected(ConvertError{ErrorCode::Spawn, name + " not found in PATH"});
  }
  return found;
}

std::expected<std::shared_ptr<TranscodeProcess>, ConvertError> FfmpegEngine::start(
  const TranscodeRequest& request) {
  auto binary = locateBinary();
  if (!binary) {
    return std::unexpected(binary.error());
  }

  const auto arguments = buildFfmpegArguments(request);
  try {
    auto process = std::make_shared<FfmpegProcess>(
      *binary, arguments, config_.terminate_grace, config_.diagnostic_tail_lines);
    std::cout << "[ffmpeg] pid " << process->pid() << ": " << request.input_path.string()
              << " -> " << request.output_path.string() << std::endl;
    return process;
  } catch (const bp::process_error& e) {
    return std::unexpected(ConvertError{
      ErrorCode::Spawn, std::format("failed to start {}: {}", binary->string(), e.what())});
  }
}

} // namespace convert_service
