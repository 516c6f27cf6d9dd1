#pragma once
#include "convert_error.hpp"
#include "media.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace convert_service {

struct CatalogEntry {
  std::string filename;            // relative to the catalog root, '/' separated
  std::filesystem::path path;
  std::uintmax_t size{0};
  std::optional<MediaCategory> media;
  double last_modified{0.0};       // seconds since epoch
};

class FileCatalog {
public:
  virtual ~FileCatalog() = default;

  // Absolute path of `filename` inside the root of `source`. Rejects names that
  // escape the root.
  virtual std::expected<std::filesystem::path, ConvertError> resolve(
    SourceCategory source, std::string_view filename) const = 0;

  // Final output location for a source file converted to `format`; keeps the
  // source's sub-directories.
  virtual std::filesystem::path outputPathFor(std::string_view filename,
                                              std::string_view format) const = 0;

  virtual std::expected<std::vector<CatalogEntry>, ConvertError> list(SourceCategory source) const = 0;

  virtual std::expected<void, ConvertError> remove(SourceCategory source,
                                                   std::string_view filename) const = 0;
};

} // namespace convert_service
