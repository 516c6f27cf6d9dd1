#pragma once
#include "convert_error.hpp"
#include "media.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace convert_service {

struct Resolution {
  int width{0};
  int height{0};
};

// Every field except output_format is optional: an absent field means the
// engine keeps the source value (or picks its default encoder for the container).
struct ConversionOptions {
  std::string output_format;                 // container, e.g. "mp3", "mkv"
  std::optional<std::string> video_codec;    // "libx264", "copy", ...
  std::optional<std::string> audio_codec;    // "aac", "libmp3lame", "copy", ...
  std::optional<long long> video_bitrate;    // bits per second
  std::optional<long long> audio_bitrate;    // bits per second
  std::optional<Resolution> resolution;
  std::optional<double> frame_rate;
  std::optional<int> sample_rate;            // Hz
  std::optional<int> audio_channels;
  std::optional<int> bit_depth;              // 16, 24 or 32; wav/flac only
  std::optional<int> volume_percent;         // 100 = unchanged
  std::optional<double> trim_start;          // seconds
  std::optional<double> trim_end;            // seconds
  std::optional<std::string> hwaccel;        // "cuda", "vaapi", ...

  bool hasVideoParams() const;
  bool hasAudioParams() const;
  std::string debug() const;
};

// Checks the options on their own: known format and codecs, codec/container
// pairing, value ranges, copy without re-encode parameters, no video
// parameters for an audio target.
std::expected<void, ConvertError> validateOptions(const ConversionOptions& options);

// "192k" -> 192000, "2M" -> 2000000, "1.5M" -> 1500000, "128000" -> 128000
std::expected<long long, ConvertError> parseBitrate(std::string_view text);
std::string formatBitrate(long long bits_per_second);

// "1920x1080" -> {1920, 1080}
std::expected<Resolution, ConvertError> parseResolution(std::string_view text);

// 1.5 -> 150; negative, non-finite or unrepresentable factors are rejected
std::expected<int, ConvertError> volumePercent(double multiplier);

// "1.5" -> 150
std::expected<int, ConvertError> parseVolumeMultiplier(std::string_view text);

// Encoder the engine should use for a container when none was requested.
std::optional<std::string> defaultAudioCodec(std::string_view format);

// Whether an audio stream can be stream-copied from one container to another.
bool audioCopyCompatible(std::string_view source_ext, std::string_view target_ext);

} // namespace convert_service
