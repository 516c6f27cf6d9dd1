#pragma once

// project
#include "common/config/config.hpp"
#include "domain/file_catalog.hpp"

namespace convert_service {

// Catalog roots on the local filesystem: uploads, local files, outputs.
class LocalFileCatalog : public FileCatalog {
public:
  explicit LocalFileCatalog(const config::StorageConfig& storage);

  std::expected<std::filesystem::path, ConvertError> resolve(
    SourceCategory source, std::string_view filename) const override;

  std::filesystem::path outputPathFor(std::string_view filename,
                                      std::string_view format) const override;

  // Supported media files below the root, recursively, sorted by name. Hidden
  // files (staging artifacts among them) are skipped.
  std::expected<std::vector<CatalogEntry>, ConvertError> list(SourceCategory source) const override;

  std::expected<void, ConvertError> remove(SourceCategory source,
                                           std::string_view filename) const override;

  const std::filesystem::path& root(SourceCategory source) const;

  // Creates every root that does not exist yet.
  std::expected<void, ConvertError> ensureRoots() const;

private:
  // filename relative to a root, normalized; rejects escapes
  static std::expected<std::filesystem::path, ConvertError> relativeName(std::string_view filename);

  std::filesystem::path upload_root_;
  std::filesystem::path local_root_;
  std::filesystem::path output_root_;
};

} // namespace convert_service
