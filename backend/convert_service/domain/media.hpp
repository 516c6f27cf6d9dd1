#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace convert_service {

enum class MediaCategory { Audio, Video };

enum class SourceCategory { Upload, Local, Output };

struct MediaInfo {
  MediaCategory category{MediaCategory::Audio};
  double duration_seconds{0.0};  // 0 when the container does not report one
};

std::string_view toString(MediaCategory category);
std::string_view toString(SourceCategory source);
std::optional<SourceCategory> parseSourceCategory(std::string_view text);

const std::vector<std::string>& supportedAudioFormats();
const std::vector<std::string>& supportedVideoFormats();

// Classifies a container name ("mp3", "MKV") by the supported format lists.
std::optional<MediaCategory> categoryOfFormat(std::string_view format);

// Classifies a file by its extension, as the catalogs and the submit path do.
std::optional<MediaCategory> categoryOfFile(std::string_view filename);

std::string lowercase(std::string_view text);

// Lowercase extension without the dot, empty if none.
std::string extensionOf(std::string_view filename);

} // namespace convert_service
