#include "ffmpeg_command.hpp"

#include <format>

namespace convert_service {

namespace {

std::string trimZeros(std::string text) {
  if (text.find('.') == std::string::npos) {
    return text;
  }
  while (!text.empty() && text.back() == '0') {
    text.pop_back();
  }
  if (!text.empty() && text.back() == '.') {
    text.pop_back();
  }
  return text;
}

std::string formatRate(double fps) {
  return trimZeros(std::format("{:.3f}", fps));
}

void appendVideoFlags(const ConversionOptions& options, std::vector<std::string>& args) {
  if (options.video_codec) {
    args.insert(args.end(), {"-c:v", *options.video_codec});
  }
  if (options.resolution) {
    args.insert(args.end(), {"-s", std::format("{}x{}", options.resolution->width, options.resolution->height)});
  }
  if (options.video_bitrate) {
    args.insert(args.end(), {"-b:v", formatBitrate(*options.video_bitrate)});
  }
  if (options.frame_rate) {
    args.insert(args.end(), {"-r", formatRate(*options.frame_rate)});
  }
}

// Encoder for the audio stream, or nullopt to let ffmpeg pick.
std::optional<std::string> audioEncoder(const TranscodeRequest& request) {
  const auto& options = request.options;
  const auto format = lowercase(options.output_format);

  if (options.bit_depth && format == "wav") {
    return std::format("pcm_s{}le", *options.bit_depth);
  }
  if (options.audio_codec) {
    if (*options.audio_codec != "copy") {
      return options.audio_codec;
    }
    // stream copy only works when the target container can hold the source codec
    const auto source_ext = extensionOf(request.input_path.filename().string());
    if (request.source_category == MediaCategory::Video || audioCopyCompatible(source_ext, format)) {
      return options.audio_codec;
    }
    return defaultAudioCodec(format);
  }
  return defaultAudioCodec(format);
}

void appendAudioFlags(const TranscodeRequest& request, std::vector<std::string>& args) {
  const auto& options = request.options;
  const auto format = lowercase(options.output_format);

  if (auto encoder = audioEncoder(request)) {
    args.insert(args.end(), {"-c:a", *encoder});
  }
  if (options.bit_depth && format == "flac") {
    args.insert(args.end(), {"-sample_fmt", *options.bit_depth == 16 ? "s16" : "s32"});
  }
  if (options.audio_bitrate) {
    args.insert(args.end(), {"-b:a", formatBitrate(*options.audio_bitrate)});
  }
  if (options.sample_rate) {
    args.insert(args.end(), {"-ar", std::to_string(*options.sample_rate)});
  }
  if (options.audio_channels) {
    args.insert(args.end(), {"-ac", std::to_string(*options.audio_channels)});
  }
  if (options.volume_percent && *options.volume_percent != 100) {
    args.insert(args.end(), {"-af", "volume=" + formatVolumeFactor(*options.volume_percent)});
  }
}

} // namespace

std::string formatVolumeFactor(int percent) {
  return trimZeros(std::format("{:.2f}", static_cast<double>(percent) / 100.0));
}

std::string formatSeconds(double seconds) {
  return trimZeros(std::format("{:.3f}", seconds));
}

std::vector<std::string> buildFfmpegArguments(const TranscodeRequest& request) {
  const auto& options = request.options;
  const auto target = categoryOfFormat(options.output_format).value_or(MediaCategory::Audio);

  std::vector<std::string> args{"-hide_banner", "-nostdin"};

  if (options.hwaccel && target == MediaCategory::Video) {
    args.insert(args.end(), {"-hwaccel", *options.hwaccel});
  }
  if (options.trim_start && *options.trim_start > 0.0) {
    args.insert(args.end(), {"-ss", formatSeconds(*options.trim_start)});
  }
  args.insert(args.end(), {"-i", request.input_path.string()});
  if (options.trim_end) {
    const double start = options.trim_start.value_or(0.0);
    args.insert(args.end(), {"-t", formatSeconds(*options.trim_end - start)});
  }

  if (target == MediaCategory::Video) {
    appendVideoFlags(options, args);
  } else if (request.source_category == MediaCategory::Video) {
    args.emplace_back("-vn");
  }
  appendAudioFlags(request, args);

  args.insert(args.end(), {"-progress", "pipe:2", "-nostats", "-y", request.output_path.string()});
  return args;
}

} // namespace convert_service
