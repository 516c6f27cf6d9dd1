#pragma once
#include "convert_error.hpp"
#include "media.hpp"

#include <expected>
#include <filesystem>

namespace convert_service {
class MediaProbe {
public:
  virtual ~MediaProbe() = default;
  virtual std::expected<MediaInfo, ConvertError> probe(const std::filesystem::path& path) = 0;
};
}
