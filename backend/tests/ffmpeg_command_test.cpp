#include "infrastructure/ffmpeg_command.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>

using namespace convert_service;
using ::testing::ElementsAre;

namespace {

TranscodeRequest request(const std::string& input, const std::string& output,
                         MediaCategory source, ConversionOptions options) {
  return TranscodeRequest{input, output, source, std::move(options)};
}

bool contains(const std::vector<std::string>& args, const std::string& flag) {
  return std::find(args.begin(), args.end(), flag) != args.end();
}

std::string valueOf(const std::vector<std::string>& args, const std::string& flag) {
  auto it = std::find(args.begin(), args.end(), flag);
  return (it == args.end() || it + 1 == args.end()) ? std::string() : *(it + 1);
}

} // namespace

TEST(FfmpegCommandTest, MinimalAudioConversion) {
  ConversionOptions options;
  options.output_format = "mp3";
  auto args = buildFfmpegArguments(request("/in/a.wav", "/out/.a.0.partial.mp3", MediaCategory::Audio, options));

  EXPECT_THAT(args, ElementsAre("-hide_banner", "-nostdin", "-i", "/in/a.wav",
                                "-c:a", "libmp3lame",
                                "-progress", "pipe:2", "-nostats", "-y", "/out/.a.0.partial.mp3"));
}

TEST(FfmpegCommandTest, FullVideoConversion) {
  ConversionOptions options;
  options.output_format = "mp4";
  options.video_codec = "libx264";
  options.audio_codec = "aac";
  options.resolution = Resolution{1280, 720};
  options.video_bitrate = 2'000'000;
  options.frame_rate = 30.0;
  options.audio_bitrate = 128'000;
  options.trim_start = 5.0;
  options.trim_end = 12.5;
  options.hwaccel = "cuda";
  auto args = buildFfmpegArguments(request("in.mkv", "out.mp4", MediaCategory::Video, options));

  EXPECT_THAT(args, ElementsAre("-hide_banner", "-nostdin", "-hwaccel", "cuda", "-ss", "5",
                                "-i", "in.mkv", "-t", "7.5",
                                "-c:v", "libx264", "-s", "1280x720", "-b:v", "2M", "-r", "30",
                                "-c:a", "aac", "-b:a", "128k",
                                "-progress", "pipe:2", "-nostats", "-y", "out.mp4"));
}

TEST(FfmpegCommandTest, VideoToAudioDropsVideoStream) {
  ConversionOptions options;
  options.output_format = "m4a";
  options.sample_rate = 44100;
  options.audio_channels = 2;
  options.volume_percent = 150;
  auto args = buildFfmpegArguments(request("clip.mp4", "clip.m4a", MediaCategory::Video, options));

  EXPECT_TRUE(contains(args, "-vn"));
  EXPECT_EQ(valueOf(args, "-c:a"), "aac");
  EXPECT_EQ(valueOf(args, "-ar"), "44100");
  EXPECT_EQ(valueOf(args, "-ac"), "2");
  EXPECT_EQ(valueOf(args, "-af"), "volume=1.5");
}

TEST(FfmpegCommandTest, BitDepthSelectsSampleFormat) {
  ConversionOptions wav;
  wav.output_format = "wav";
  wav.bit_depth = 24;
  auto args = buildFfmpegArguments(request("a.flac", "a.wav", MediaCategory::Audio, wav));
  EXPECT_EQ(valueOf(args, "-c:a"), "pcm_s24le");
  EXPECT_FALSE(contains(args, "-sample_fmt"));

  ConversionOptions flac;
  flac.output_format = "flac";
  flac.bit_depth = 16;
  args = buildFfmpegArguments(request("a.wav", "a.flac", MediaCategory::Audio, flac));
  EXPECT_EQ(valueOf(args, "-c:a"), "flac");
  EXPECT_EQ(valueOf(args, "-sample_fmt"), "s16");
}

TEST(FfmpegCommandTest, IncompatibleAudioCopyIsReencoded) {
  ConversionOptions options;
  options.output_format = "mp3";
  options.audio_codec = "copy";
  auto args = buildFfmpegArguments(request("song.wav", "song.mp3", MediaCategory::Audio, options));
  EXPECT_EQ(valueOf(args, "-c:a"), "libmp3lame");

  options.output_format = "m4a";
  args = buildFfmpegArguments(request("song.aac", "song.m4a", MediaCategory::Audio, options));
  EXPECT_EQ(valueOf(args, "-c:a"), "copy");
}

TEST(FfmpegCommandTest, SameRequestSameArguments) {
  ConversionOptions options;
  options.output_format = "ogg";
  options.audio_bitrate = 96'000;
  options.trim_end = 30.0;
  auto req = request("a.mp3", "a.ogg", MediaCategory::Audio, options);
  EXPECT_EQ(buildFfmpegArguments(req), buildFfmpegArguments(req));
  EXPECT_EQ(valueOf(buildFfmpegArguments(req), "-t"), "30");
  EXPECT_FALSE(contains(buildFfmpegArguments(req), "-ss"));
}

TEST(FfmpegCommandTest, NumberFormatting) {
  EXPECT_EQ(formatVolumeFactor(100), "1");
  EXPECT_EQ(formatVolumeFactor(75), "0.75");
  EXPECT_EQ(formatVolumeFactor(0), "0");
  EXPECT_EQ(formatSeconds(12.5), "12.5");
  EXPECT_EQ(formatSeconds(0.001), "0.001");
}
