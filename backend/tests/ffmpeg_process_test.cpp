#include "infrastructure/ffmpeg_engine.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace convert_service;
using namespace std::chrono_literals;
using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::Not;

// Runs /bin/sh scripts in place of ffmpeg to exercise the process plumbing.
class FfmpegProcessTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("mediaconv-process-" + std::to_string(::getpid()) + "-" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::create_directories(dir_);
  }

  void TearDown() override { fs::remove_all(dir_); }

  fs::path script(const std::string& body) {
    auto path = dir_ / "fake-ffmpeg";
    std::ofstream(path) << "#!/bin/sh\n" << body << "\n";
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
    return path;
  }

  std::unique_ptr<FfmpegProcess> spawn(const std::string& body,
                                       std::chrono::milliseconds grace = 2000ms) {
    return std::make_unique<FfmpegProcess>(boost::filesystem::path(script(body).string()),
                                           std::vector<std::string>{}, grace, 5);
  }

  static std::vector<std::string> drain(TranscodeProcess& process) {
    std::vector<std::string> lines;
    while (auto line = process.nextLine()) {
      lines.push_back(*line);
    }
    return lines;
  }

  fs::path dir_;
};

TEST_F(FfmpegProcessTest, CleanExitSucceeds) {
  auto process = spawn("echo 'frame=1' >&2\nprintf 'out_time_us=1000000\\r\\n' >&2\nexit 0");
  auto lines = drain(*process);
  EXPECT_THAT(lines, Contains("frame=1"));
  EXPECT_THAT(lines, Contains("out_time_us=1000000"));
  EXPECT_TRUE(process->wait().has_value());
}

TEST_F(FfmpegProcessTest, NonZeroExitReportsTail) {
  auto process = spawn(
    "echo 'Input #0, wav' >&2\n"
    "echo \"Unknown encoder 'nope'\" >&2\n"
    "echo 'progress=end' >&2\n"
    "exit 1");
  drain(*process);
  auto result = process->wait();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::Encode);
  EXPECT_THAT(result.error().message, HasSubstr("code 1"));
  EXPECT_THAT(result.error().message, HasSubstr("Unknown encoder 'nope'"));
  EXPECT_THAT(result.error().message, Not(HasSubstr("progress=end")));
}

TEST_F(FfmpegProcessTest, TailKeepsLastLines) {
  auto process = spawn("for i in 1 2 3 4 5 6 7 8; do echo \"line $i\" >&2; done\nexit 2");
  drain(*process);
  auto result = process->wait();
  ASSERT_FALSE(result.has_value());
  EXPECT_THAT(result.error().message, Not(HasSubstr("line 3")));
  EXPECT_THAT(result.error().message, HasSubstr("line 4"));
  EXPECT_THAT(result.error().message, HasSubstr("line 8"));
}

TEST_F(FfmpegProcessTest, TerminateStopsGracefully) {
  auto process = spawn("trap 'exit 3' TERM\necho ready >&2\nwhile :; do sleep 0.05; done");
  ASSERT_EQ(process->nextLine(), "ready");
  process->terminate();
  auto result = process->wait();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::Terminated);
  EXPECT_FALSE(process->nextLine().has_value());
}

TEST_F(FfmpegProcessTest, TerminateEscalatesToKill) {
  auto process = spawn("trap '' TERM\necho ready >&2\nwhile :; do sleep 0.05; done", 200ms);
  ASSERT_EQ(process->nextLine(), "ready");

  const auto started = std::chrono::steady_clock::now();
  process->terminate();
  const auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_GE(elapsed, 200ms);
  EXPECT_LT(elapsed, 10s);
  auto result = process->wait();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::Terminated);
}

TEST_F(FfmpegProcessTest, TerminateAfterExitIsNoop) {
  auto process = spawn("exit 0");
  drain(*process);
  ASSERT_TRUE(process->wait().has_value());
  process->terminate();
  EXPECT_TRUE(process->wait().has_value());
}

TEST_F(FfmpegProcessTest, TerminateBeforeWaitAfterExitKeepsTheExitStatus) {
  auto process = spawn("echo done >&2\nexit 0");
  drain(*process);
  // the child has exited but nobody called wait() yet
  std::this_thread::sleep_for(200ms);

  const auto started = std::chrono::steady_clock::now();
  process->terminate();
  EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
  EXPECT_TRUE(process->wait().has_value());
}

TEST_F(FfmpegProcessTest, EnginePassesBuiltArguments) {
  auto binary = script("for arg in \"$@\"; do echo \"$arg\" >&2; done");
  config::EngineConfig engine_config{
    .ffmpeg_path = binary.string(),
    .terminate_grace = 2000ms,
    .diagnostic_tail_lines = 5,
    .av_log_level = 16
  };
  FfmpegEngine engine(engine_config);

  TranscodeRequest request;
  request.input_path = dir_ / "in put.wav";
  request.output_path = dir_ / ".in put.task.0.partial.mp3";
  request.options.output_format = "mp3";

  auto process = engine.start(request);
  ASSERT_TRUE(process.has_value()) << process.error().message;
  auto lines = drain(**process);
  EXPECT_TRUE((*process)->wait().has_value());

  EXPECT_THAT(lines, Contains(request.input_path.string()));
  EXPECT_THAT(lines, Contains(request.output_path.string()));
  EXPECT_THAT(lines, Contains("libmp3lame"));
  EXPECT_THAT(lines, Contains("pipe:2"));
}

TEST(FfmpegEngineTest, MissingBinaryIsSpawnError) {
  config::EngineConfig engine_config{
    .ffmpeg_path = "/nonexistent/mediaconv/ffmpeg",
    .terminate_grace = 100ms,
    .diagnostic_tail_lines = 5,
    .av_log_level = 16
  };
  FfmpegEngine engine(engine_config);
  EXPECT_EQ(engine.locateBinary().error().code, ErrorCode::Spawn);

  TranscodeRequest request;
  request.input_path = "/tmp/in.wav";
  request.output_path = "/tmp/out.mp3";
  request.options.output_format = "mp3";
  auto process = engine.start(request);
  ASSERT_FALSE(process.has_value());
  EXPECT_EQ(process.error().code, ErrorCode::Spawn);
}

TEST(FfmpegEngineTest, UnknownCommandInPathIsSpawnError) {
  config::EngineConfig engine_config{
    .ffmpeg_path = "mediaconv-no-such-ffmpeg",
    .terminate_grace = 100ms,
    .diagnostic_tail_lines = 5,
    .av_log_level = 16
  };
  FfmpegEngine engine(engine_config);
  auto binary = engine.locateBinary();
  ASSERT_FALSE(binary.has_value());
  EXPECT_THAT(binary.error().message, HasSubstr("not found in PATH"));
}
