#include "domain/conversion_options.hpp"

#include <gtest/gtest.h>

using namespace convert_service;

namespace {

ConversionOptions target(const std::string& format) {
  ConversionOptions options;
  options.output_format = format;
  return options;
}

void expectRejected(const ConversionOptions& options) {
  auto result = validateOptions(options);
  ASSERT_FALSE(result.has_value()) << options.debug();
  EXPECT_EQ(result.error().code, ErrorCode::Validation);
}

} // namespace

TEST(ConversionOptionsTest, AcceptsPlainTargets) {
  EXPECT_TRUE(validateOptions(target("mp3")).has_value());
  EXPECT_TRUE(validateOptions(target("MKV")).has_value());

  auto video = target("mp4");
  video.video_codec = "libx264";
  video.audio_codec = "aac";
  video.video_bitrate = 2'000'000;
  video.resolution = Resolution{1280, 720};
  video.frame_rate = 29.97;
  video.trim_start = 1.5;
  video.trim_end = 10.0;
  video.hwaccel = "cuda";
  EXPECT_TRUE(validateOptions(video).has_value());
}

TEST(ConversionOptionsTest, RejectsUnknownFormatAndCodecs) {
  expectRejected(target("exe"));

  auto options = target("mp3");
  options.audio_codec = "does_not_exist";
  expectRejected(options);

  options = target("mkv");
  options.video_codec = "h263_magic";
  expectRejected(options);
}

TEST(ConversionOptionsTest, RejectsCodecContainerMismatch) {
  auto options = target("mp3");
  options.audio_codec = "aac";
  expectRejected(options);

  options = target("webm");
  options.video_codec = "libx264";
  expectRejected(options);
}

TEST(ConversionOptionsTest, RejectsCopyWithReencodeParameters) {
  auto options = target("mp4");
  options.video_codec = "copy";
  options.resolution = Resolution{640, 480};
  expectRejected(options);

  options = target("m4a");
  options.audio_codec = "copy";
  options.audio_bitrate = 128'000;
  expectRejected(options);
}

TEST(ConversionOptionsTest, RejectsVideoParametersForAudioTarget) {
  auto options = target("wav");
  options.frame_rate = 30.0;
  expectRejected(options);

  options = target("flac");
  options.hwaccel = "vaapi";
  expectRejected(options);
}

TEST(ConversionOptionsTest, RejectsOutOfRangeValues) {
  auto options = target("mp3");
  options.sample_rate = 4000;
  expectRejected(options);

  options = target("mp3");
  options.audio_channels = 9;
  expectRejected(options);

  options = target("mp3");
  options.volume_percent = 1001;
  expectRejected(options);

  options = target("mp4");
  options.resolution = Resolution{1281, 720};
  expectRejected(options);

  options = target("mp4");
  options.frame_rate = 0.0;
  expectRejected(options);

  options = target("mp3");
  options.trim_start = 5.0;
  options.trim_end = 5.0;
  expectRejected(options);
}

TEST(ConversionOptionsTest, BitDepthOnlyForLosslessTargets) {
  auto options = target("wav");
  options.bit_depth = 24;
  EXPECT_TRUE(validateOptions(options).has_value());

  options.audio_codec = "pcm_s16le";
  expectRejected(options);

  options = target("mp3");
  options.bit_depth = 16;
  expectRejected(options);

  options = target("flac");
  options.bit_depth = 20;
  expectRejected(options);
}

TEST(ConversionOptionsTest, ParsesTextualForms) {
  EXPECT_EQ(*parseBitrate("192k"), 192'000);
  EXPECT_EQ(*parseBitrate("2M"), 2'000'000);
  EXPECT_EQ(*parseBitrate("1.5M"), 1'500'000);
  EXPECT_EQ(*parseBitrate("128000"), 128'000);
  EXPECT_FALSE(parseBitrate("fast").has_value());
  EXPECT_FALSE(parseBitrate("-5k").has_value());

  auto resolution = parseResolution("1920x1080");
  ASSERT_TRUE(resolution.has_value());
  EXPECT_EQ(resolution->width, 1920);
  EXPECT_EQ(resolution->height, 1080);
  EXPECT_FALSE(parseResolution("1080p").has_value());

  EXPECT_EQ(*parseVolumeMultiplier("1.5"), 150);
  EXPECT_EQ(*parseVolumeMultiplier("0"), 0);
  EXPECT_FALSE(parseVolumeMultiplier("loud").has_value());
  EXPECT_FALSE(parseVolumeMultiplier("42949672.96").has_value());
  EXPECT_FALSE(parseVolumeMultiplier("-0.5").has_value());
  EXPECT_EQ(*volumePercent(2.0), 200);
  EXPECT_FALSE(volumePercent(1e300).has_value());
  EXPECT_FALSE(parseBitrate("1e300k").has_value());
  EXPECT_FALSE(parseBitrate("0.0001").has_value());

  EXPECT_EQ(formatBitrate(2'000'000), "2M");
  EXPECT_EQ(formatBitrate(192'000), "192k");
  EXPECT_EQ(formatBitrate(1'500'000), "1500k");
}

TEST(ConversionOptionsTest, ContainerDefaultsAndCopyCompatibility) {
  EXPECT_EQ(defaultAudioCodec("mp3"), "libmp3lame");
  EXPECT_EQ(defaultAudioCodec("M4A"), "aac");
  EXPECT_EQ(defaultAudioCodec("aac"), "aac");
  EXPECT_FALSE(defaultAudioCodec("mkv").has_value());

  EXPECT_FALSE(audioCopyCompatible("wav", "mp3"));
  EXPECT_FALSE(audioCopyCompatible("wma", "aac"));
  EXPECT_TRUE(audioCopyCompatible("aac", "m4a"));
}
