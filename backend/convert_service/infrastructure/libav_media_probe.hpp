#pragma once

// project
#include "domain/media_probe.hpp"

// ffmpeg
extern "C" {
  #include <libavformat/avformat.h>
  #include <libavutil/log.h>
}

namespace convert_service {

// Reads container headers with libavformat. Nothing is decoded.
class LibavMediaProbe : public MediaProbe {
public:
  // AV_LOG_QUIET   = -8
  // AV_LOG_ERROR   = 16
  // AV_LOG_WARNING = 24
  // AV_LOG_INFO    = 32
  explicit LibavMediaProbe(int loglevel = AV_LOG_ERROR);

  std::expected<MediaInfo, ConvertError> probe(const std::filesystem::path& path) override;
};

} // namespace convert_service
