#include "infrastructure/libav_media_probe.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace convert_service;

namespace {

void putLe(std::ofstream& out, uint32_t value, int bytes) {
  for (int i = 0; i < bytes; ++i) {
    out.put(static_cast<char>((value >> (8 * i)) & 0xff));
  }
}

// One second of 8 kHz mono s16le silence.
void writeWav(const fs::path& path) {
  constexpr uint32_t kRate = 8000;
  constexpr uint32_t kDataBytes = kRate * 2;
  std::ofstream out(path, std::ios::binary);
  out.write("RIFF", 4);
  putLe(out, 36 + kDataBytes, 4);
  out.write("WAVE", 4);
  out.write("fmt ", 4);
  putLe(out, 16, 4);         // fmt chunk size
  putLe(out, 1, 2);          // PCM
  putLe(out, 1, 2);          // channels
  putLe(out, kRate, 4);
  putLe(out, kRate * 2, 4);  // byte rate
  putLe(out, 2, 2);          // block align
  putLe(out, 16, 2);         // bits per sample
  out.write("data", 4);
  putLe(out, kDataBytes, 4);
  const std::string silence(kDataBytes, '\0');
  out.write(silence.data(), static_cast<std::streamsize>(silence.size()));
}

} // namespace

class LibavMediaProbeTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("mediaconv-probe-" + std::to_string(::getpid()) + "-" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::create_directories(dir_);
  }

  void TearDown() override { fs::remove_all(dir_); }

  fs::path dir_;
  LibavMediaProbe probe_{AV_LOG_QUIET};
};

TEST_F(LibavMediaProbeTest, PcmWaveIsAudioWithDuration) {
  const auto path = dir_ / "tone.wav";
  writeWav(path);

  auto info = probe_.probe(path);
  ASSERT_TRUE(info.has_value()) << info.error().message;
  EXPECT_EQ(info->category, MediaCategory::Audio);
  EXPECT_NEAR(info->duration_seconds, 1.0, 0.1);
}

TEST_F(LibavMediaProbeTest, MissingFileIsUnreadable) {
  auto info = probe_.probe(dir_ / "input.wav");
  ASSERT_FALSE(info.has_value());
  EXPECT_EQ(info.error().code, ErrorCode::UnreadableMedia);
}

TEST_F(LibavMediaProbeTest, EmptyFileIsUnreadable) {
  const auto path = dir_ / "empty.wav";
  std::ofstream(path, std::ios::binary).close();

  auto info = probe_.probe(path);
  ASSERT_FALSE(info.has_value());
  EXPECT_EQ(info.error().code, ErrorCode::UnreadableMedia);
}

TEST_F(LibavMediaProbeTest, DirectoryIsUnreadable) {
  auto info = probe_.probe(dir_);
  ASSERT_FALSE(info.has_value());
  EXPECT_EQ(info.error().code, ErrorCode::UnreadableMedia);
}
