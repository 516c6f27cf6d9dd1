#include "conversion_options.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <limits>
#include <map>
#include <set>
#include <utility>
#include <vector>

namespace convert_service {

namespace {

const std::set<std::string, std::less<>> kVideoCodecs{
  "copy", "libx264", "libx265", "h264_nvenc", "hevc_nvenc", "h264_qsv", "hevc_qsv",
  "h264_vaapi", "hevc_vaapi", "libvpx", "libvpx-vp9", "libaom-av1", "mpeg4",
  "mpeg2video", "mpeg1video", "wmv2", "flv", "prores_ks"};

const std::set<std::string, std::less<>> kAudioCodecs{
  "copy", "aac", "libmp3lame", "libvorbis", "libopus", "flac", "alac", "ac3", "mp2",
  "wmav2", "pcm_s16le", "pcm_s24le", "pcm_s32le"};

const std::set<std::string, std::less<>> kHwAccels{
  "auto", "cuda", "vaapi", "qsv", "videotoolbox", "d3d11va", "dxva2"};

struct ContainerCodecs {
  std::vector<std::string> video;  // empty: any known codec
  std::vector<std::string> audio;
};

const std::map<std::string, ContainerCodecs, std::less<>>& containerCodecs() {
  static const std::map<std::string, ContainerCodecs, std::less<>> table{
    {"mp3", {{}, {"libmp3lame"}}},
    {"wav", {{}, {"pcm_s16le", "pcm_s24le", "pcm_s32le"}}},
    {"aac", {{}, {"aac"}}},
    {"flac", {{}, {"flac"}}},
    {"ogg", {{}, {"libvorbis", "libopus", "flac"}}},
    {"m4a", {{}, {"aac", "alac"}}},
    {"wma", {{}, {"wmav2"}}},
    {"mp4", {{"libx264", "libx265", "h264_nvenc", "hevc_nvenc", "h264_qsv", "hevc_qsv",
              "h264_vaapi", "hevc_vaapi", "libaom-av1", "libvpx-vp9", "mpeg4"},
             {"aac", "libmp3lame", "ac3", "alac", "libopus"}}},
    {"mkv", {{}, {}}},
    {"mov", {{"libx264", "libx265", "h264_nvenc", "hevc_nvenc", "mpeg4", "prores_ks"},
             {"aac", "alac", "libmp3lame", "ac3", "pcm_s16le", "pcm_s24le"}}},
    {"avi", {{"libx264", "h264_nvenc", "mpeg4", "mpeg2video"},
             {"libmp3lame", "ac3", "mp2", "pcm_s16le"}}},
    {"webm", {{"libvpx", "libvpx-vp9", "libaom-av1"}, {"libvorbis", "libopus"}}},
    {"flv", {{"libx264", "h264_nvenc", "flv"}, {"aac", "libmp3lame"}}},
    {"wmv", {{"wmv2"}, {"wmav2"}}},
    {"mpeg", {{"mpeg2video", "mpeg1video"}, {"mp2", "ac3"}}},
  };
  return table;
}

// source -> target pairs whose audio stream has to be re-encoded
const std::set<std::pair<std::string, std::string>>& incompatibleAudioCopies() {
  static const std::set<std::pair<std::string, std::string>> pairs{
    {"wma", "mp3"}, {"wma", "aac"}, {"wma", "flac"}, {"wma", "wav"},
    {"m4a", "mp3"}, {"m4a", "wma"}, {"aac", "mp3"}, {"aac", "wma"},
    {"mp3", "aac"}, {"mp3", "wma"}, {"mp3", "flac"},
    {"flac", "mp3"}, {"flac", "aac"}, {"flac", "wma"},
    {"wav", "mp3"}, {"wav", "aac"}, {"wav", "wma"}, {"wav", "flac"},
  };
  return pairs;
}

bool allowed(const std::vector<std::string>& list, const std::string& codec) {
  return list.empty() || std::find(list.begin(), list.end(), codec) != list.end();
}

template <typename T>
std::optional<T> parseNumber(std::string_view text) {
  T value{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::expected<void, ConvertError> fail(std::string message) {
  return std::unexpected(validationError(std::move(message)));
}

} // namespace

bool ConversionOptions::hasVideoParams() const {
  return video_bitrate || resolution || frame_rate;
}

bool ConversionOptions::hasAudioParams() const {
  return audio_bitrate || sample_rate || audio_channels || bit_depth || volume_percent;
}

std::string ConversionOptions::debug() const {
  auto text = [](const std::optional<std::string>& v) { return v ? *v : std::string("-"); };
  auto num = [](const auto& v) { return v ? std::format("{}", *v) : std::string("-"); };
  return std::format("format:{},vcodec:{},acodec:{},vbitrate:{},abitrate:{},resolution:{},"
                     "fps:{},ar:{},ac:{},bits:{},volume:{},trim:{}-{},hwaccel:{}",
    output_format, text(video_codec), text(audio_codec), num(video_bitrate), num(audio_bitrate),
    resolution ? std::format("{}x{}", resolution->width, resolution->height) : std::string("-"),
    num(frame_rate), num(sample_rate), num(audio_channels), num(bit_depth), num(volume_percent),
    num(trim_start), num(trim_end), text(hwaccel));
}

std::expected<void, ConvertError> validateOptions(const ConversionOptions& options) {
  const auto target = categoryOfFormat(options.output_format);
  if (!target) {
    return fail("Unsupported output format: " + options.output_format);
  }
  const auto& codecs = containerCodecs().at(lowercase(options.output_format));

  if (*target == MediaCategory::Audio) {
    if (options.video_codec || options.hasVideoParams() || options.hwaccel) {
      return fail("Video parameters cannot be applied to audio format " + options.output_format);
    }
  }

  if (options.video_codec) {
    const auto& codec = *options.video_codec;
    if (!kVideoCodecs.contains(codec)) {
      return fail("Unknown video codec: " + codec);
    }
    if (codec == "copy" && options.hasVideoParams()) {
      return fail("Video codec 'copy' cannot be combined with bitrate, resolution or frame rate");
    }
    if (codec != "copy" && !allowed(codecs.video, codec)) {
      return fail("Video codec " + codec + " is not supported in " + options.output_format);
    }
  }

  if (options.audio_codec) {
    const auto& codec = *options.audio_codec;
    if (!kAudioCodecs.contains(codec)) {
      return fail("Unknown audio codec: " + codec);
    }
    if (codec == "copy" && options.hasAudioParams()) {
      return fail("Audio codec 'copy' cannot be combined with bitrate, sample rate, channels, "
                  "bit depth or volume");
    }
    if (codec != "copy" && !allowed(codecs.audio, codec)) {
      return fail("Audio codec " + codec + " is not supported in " + options.output_format);
    }
  }

  if (options.video_bitrate && *options.video_bitrate <= 0) {
    return fail("Video bitrate must be positive");
  }
  if (options.audio_bitrate && *options.audio_bitrate <= 0) {
    return fail("Audio bitrate must be positive");
  }
  if (options.resolution) {
    const auto& r = *options.resolution;
    if (r.width <= 0 || r.height <= 0 || r.width % 2 != 0 || r.height % 2 != 0) {
      return fail(std::format("Resolution must be positive and even, got {}x{}", r.width, r.height));
    }
  }
  if (options.frame_rate && (!(*options.frame_rate > 0.0) || *options.frame_rate > 240.0)) {
    return fail("Frame rate must be in (0, 240]");
  }
  if (options.sample_rate && (*options.sample_rate < 8000 || *options.sample_rate > 192000)) {
    return fail("Sample rate must be between 8000 and 192000");
  }
  if (options.audio_channels && (*options.audio_channels < 1 || *options.audio_channels > 8)) {
    return fail("Channel count must be between 1 and 8");
  }
  if (options.volume_percent && (*options.volume_percent < 0 || *options.volume_percent > 1000)) {
    return fail("Volume must be between 0 and 1000 percent");
  }

  if (options.bit_depth) {
    const int depth = *options.bit_depth;
    if (depth != 16 && depth != 24 && depth != 32) {
      return fail("Bit depth must be 16, 24 or 32");
    }
    const auto format = lowercase(options.output_format);
    if (format != "wav" && format != "flac") {
      return fail("Bit depth is only supported for wav and flac");
    }
    if (format == "wav" && options.audio_codec &&
        *options.audio_codec != std::format("pcm_s{}le", depth)) {
      return fail("Bit depth " + std::to_string(depth) + " conflicts with audio codec " +
                  *options.audio_codec);
    }
  }

  if (options.trim_start && (!std::isfinite(*options.trim_start) || *options.trim_start < 0.0)) {
    return fail("Trim start must be a non-negative number of seconds");
  }
  if (options.trim_end) {
    const double start = options.trim_start.value_or(0.0);
    if (!std::isfinite(*options.trim_end) || *options.trim_end <= start) {
      return fail("Trim end must be greater than trim start");
    }
  }

  if (options.hwaccel && !kHwAccels.contains(*options.hwaccel)) {
    return fail("Unknown hardware acceleration device: " + *options.hwaccel);
  }

  return {};
}

std::expected<long long, ConvertError> parseBitrate(std::string_view text) {
  if (text.empty()) {
    return std::unexpected(validationError("Empty bitrate"));
  }
  double multiplier = 1.0;
  auto number = text;
  switch (text.back()) {
    case 'k': case 'K': multiplier = 1e3; number.remove_suffix(1); break;
    case 'm': case 'M': multiplier = 1e6; number.remove_suffix(1); break;
    default: break;
  }
  auto value = parseNumber<double>(number);
  if (!value || !(*value > 0.0) || !std::isfinite(*value)) {
    return std::unexpected(validationError("Invalid bitrate: " + std::string(text)));
  }
  const double bits = std::round(*value * multiplier);
  if (bits < 1.0 || bits >= static_cast<double>(std::numeric_limits<long long>::max())) {
    return std::unexpected(validationError("Bitrate out of range: " + std::string(text)));
  }
  return static_cast<long long>(bits);
}

std::string formatBitrate(long long bits_per_second) {
  if (bits_per_second % 1000000 == 0) {
    return std::format("{}M", bits_per_second / 1000000);
  }
  if (bits_per_second % 1000 == 0) {
    return std::format("{}k", bits_per_second / 1000);
  }
  return std::to_string(bits_per_second);
}

std::expected<Resolution, ConvertError> parseResolution(std::string_view text) {
  auto sep = text.find_first_of("xX");
  if (sep == std::string_view::npos) {
    return std::unexpected(validationError("Invalid resolution: " + std::string(text)));
  }
  auto width = parseNumber<int>(text.substr(0, sep));
  auto height = parseNumber<int>(text.substr(sep + 1));
  if (!width || !height) {
    return std::unexpected(validationError("Invalid resolution: " + std::string(text)));
  }
  return Resolution{*width, *height};
}

std::expected<int, ConvertError> volumePercent(double multiplier) {
  const double percent = std::round(multiplier * 100.0);
  if (!std::isfinite(percent) || percent < 0.0 ||
      percent > static_cast<double>(std::numeric_limits<int>::max())) {
    return std::unexpected(validationError(std::format("Invalid volume: {}", multiplier)));
  }
  return static_cast<int>(percent);
}

std::expected<int, ConvertError> parseVolumeMultiplier(std::string_view text) {
  auto value = parseNumber<double>(text);
  if (!value) {
    return std::unexpected(validationError("Invalid volume: " + std::string(text)));
  }
  return volumePercent(*value);
}

std::optional<std::string> defaultAudioCodec(std::string_view format) {
  const auto value = lowercase(format);
  if (value == "mp3") return "libmp3lame";
  if (value == "m4a" || value == "aac") return "aac";
  if (value == "flac") return "flac";
  if (value == "ogg") return "libvorbis";
  if (value == "wma") return "wmav2";
  if (value == "wav") return "pcm_s16le";
  return std::nullopt;
}

bool audioCopyCompatible(std::string_view source_ext, std::string_view target_ext) {
  return !incompatibleAudioCopies().contains(
    {lowercase(source_ext), lowercase(target_ext)});
}

} // namespace convert_service
