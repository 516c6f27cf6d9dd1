#include "libav_media_probe.hpp"

#include <format>
#include <memory>

namespace convert_service {

namespace {

struct InputCloser {
  void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};

std::string avError(int code) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(code, buf, sizeof(buf));
  return buf;
}

} // namespace

LibavMediaProbe::LibavMediaProbe(int loglevel) {
  av_log_set_level(loglevel);
}

std::expected<MediaInfo, ConvertError> LibavMediaProbe::probe(const std::filesystem::path& path) {
  AVFormatContext* raw = nullptr;
  if (int ret = avformat_open_input(&raw, path.c_str(), nullptr, nullptr); ret < 0) {
    return std::unexpected(ConvertError{
      ErrorCode::UnreadableMedia, std::format("cannot open {}: {}", path.string(), avError(ret))});
  }
  std::unique_ptr<AVFormatContext, InputCloser> ctx(raw);

  if (int ret = avformat_find_stream_info(ctx.get(), nullptr); ret < 0) {
    return std::unexpected(ConvertError{
      ErrorCode::UnreadableMedia,
      std::format("cannot read stream info of {}: {}", path.string(), avError(ret))});
  }

  bool has_video = false;
  bool has_audio = false;
  for (unsigned i = 0; i < ctx->nb_streams; ++i) {
    const AVStream* stream = ctx->streams[i];
    switch (stream->codecpar->codec_type) {
      case AVMEDIA_TYPE_VIDEO:
        // embedded cover art does not make an audio file a video
        if (!(stream->disposition & AV_DISPOSITION_ATTACHED_PIC)) {
          has_video = true;
        }
        break;
      case AVMEDIA_TYPE_AUDIO:
        has_audio = true;
        break;
      default:
        break;
    }
  }

  if (!has_video && !has_audio) {
    return std::unexpected(ConvertError{
      ErrorCode::UnreadableMedia, std::format("{} has no audio or video stream", path.string())});
  }

  MediaInfo info;
  info.category = has_video ? MediaCategory::Video : MediaCategory::Audio;
  if (ctx->duration != AV_NOPTS_VALUE && ctx->duration > 0) {
    info.duration_seconds = static_cast<double>(ctx->duration) / AV_TIME_BASE;
  }
  return info;
}

} // namespace convert_service
