#include "media.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace convert_service {

namespace {

bool contains(const std::vector<std::string>& list, const std::string& value) {
  return std::find(list.begin(), list.end(), value) != list.end();
}

} // namespace

std::string_view toString(MediaCategory category) {
  return category == MediaCategory::Audio ? "audio" : "video";
}

std::string_view toString(SourceCategory source) {
  switch (source) {
    case SourceCategory::Upload: return "upload";
    case SourceCategory::Local: return "local";
    case SourceCategory::Output: return "output";
  }
  return "upload";
}

std::optional<SourceCategory> parseSourceCategory(std::string_view text) {
  auto value = lowercase(text);
  if (value == "upload") return SourceCategory::Upload;
  if (value == "local") return SourceCategory::Local;
  if (value == "output") return SourceCategory::Output;
  return std::nullopt;
}

const std::vector<std::string>& supportedAudioFormats() {
  static const std::vector<std::string> formats{"mp3", "wav", "aac", "flac", "ogg", "m4a", "wma"};
  return formats;
}

const std::vector<std::string>& supportedVideoFormats() {
  static const std::vector<std::string> formats{"mp4", "avi", "mkv", "mov", "webm", "flv", "wmv", "mpeg"};
  return formats;
}

std::optional<MediaCategory> categoryOfFormat(std::string_view format) {
  auto value = lowercase(format);
  if (contains(supportedAudioFormats(), value)) {
    return MediaCategory::Audio;
  }
  if (contains(supportedVideoFormats(), value)) {
    return MediaCategory::Video;
  }
  return std::nullopt;
}

std::optional<MediaCategory> categoryOfFile(std::string_view filename) {
  auto ext = extensionOf(filename);
  if (ext.empty()) {
    return std::nullopt;
  }
  return categoryOfFormat(ext);
}

std::string lowercase(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string extensionOf(std::string_view filename) {
  auto ext = std::filesystem::path(filename).extension().string();
  if (!ext.empty() && ext.front() == '.') {
    ext.erase(0, 1);
  }
  return lowercase(ext);
}

} // namespace convert_service
