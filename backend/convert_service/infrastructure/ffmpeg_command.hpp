#pragma once

// project
#include "domain/transcoding_engine.hpp"

// std
#include <string>
#include <vector>

namespace convert_service {

// ffmpeg argument vector (without the program name) for one request. The same
// request always yields the same vector.
//
//   -hide_banner -nostdin [-hwaccel D] [-ss START] -i IN [-t DURATION]
//   [video flags | -vn] [audio flags] -progress pipe:2 -nostats -y OUT
std::vector<std::string> buildFfmpegArguments(const TranscodeRequest& request);

// "1.5" for 150 percent, trailing zeros dropped
std::string formatVolumeFactor(int percent);

// seconds with millisecond precision, trailing zeros dropped: 12.5 -> "12.5"
std::string formatSeconds(double seconds);

} // namespace convert_service
