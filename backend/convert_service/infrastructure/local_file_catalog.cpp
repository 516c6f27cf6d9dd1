#include "local_file_catalog.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace convert_service {

LocalFileCatalog::LocalFileCatalog(const config::StorageConfig& storage)
  : upload_root_(storage.upload_dir),
    local_root_(storage.local_dir),
    output_root_(storage.output_dir) {}

const fs::path& LocalFileCatalog::root(SourceCategory source) const {
  switch (source) {
    case SourceCategory::Upload: return upload_root_;
    case SourceCategory::Local: return local_root_;
    case SourceCategory::Output: return output_root_;
  }
  return upload_root_;
}

std::expected<void, ConvertError> LocalFileCatalog::ensureRoots() const {
  for (const auto* dir : {&upload_root_, &local_root_, &output_root_}) {
    std::error_code ec;
    fs::create_directories(*dir, ec);
    if (ec) {
      return std::unexpected(ConvertError{
        ErrorCode::Storage, std::format("cannot create {}: {}", dir->string(), ec.message())});
    }
  }
  return {};
}

std::expected<fs::path, ConvertError> LocalFileCatalog::relativeName(std::string_view filename) {
  if (filename.empty()) {
    return std::unexpected(validationError("filename must not be empty"));
  }
  fs::path name(filename);
  if (name.is_absolute() || name.has_root_name()) {
    return std::unexpected(validationError(std::format("absolute path not allowed: {}", filename)));
  }
  auto normal = name.lexically_normal();
  if (normal.empty() || normal == "." || *normal.begin() == "..") {
    return std::unexpected(validationError(std::format("path escapes its directory: {}", filename)));
  }
  return normal;
}

std::expected<fs::path, ConvertError> LocalFileCatalog::resolve(SourceCategory source,
                                                                std::string_view filename) const {
  auto name = relativeName(filename);
  if (!name) {
    return std::unexpected(name.error());
  }
  auto path = root(source) / *name;
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return std::unexpected(ConvertError{
      ErrorCode::NotFound, std::format("{} file not found: {}", toString(source), filename)});
  }
  return path;
}

fs::path LocalFileCatalog::outputPathFor(std::string_view filename, std::string_view format) const {
  auto name = fs::path(filename).lexically_normal();
  auto file = name.stem().string() + "." + lowercase(format);
  return output_root_ / name.parent_path() / file;
}

std::expected<std::vector<CatalogEntry>, ConvertError> LocalFileCatalog::list(SourceCategory source) const {
  const auto& dir = root(source);
  std::vector<CatalogEntry> entries;

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return entries;
  }

  fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    return std::unexpected(ConvertError{
      ErrorCode::Storage, std::format("cannot read {}: {}", dir.string(), ec.message())});
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      return std::unexpected(ConvertError{
        ErrorCode::Storage, std::format("cannot read {}: {}", dir.string(), ec.message())});
    }
    const auto& path = it->path();
    std::error_code entry_ec;
    if (path.filename().string().starts_with(".")) {
      if (it->is_directory(entry_ec)) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!it->is_regular_file(entry_ec)) {
      continue;
    }
    auto category = categoryOfFile(path.filename().string());
    if (!category) {
      continue;
    }

    CatalogEntry entry;
    entry.filename = path.lexically_relative(dir).generic_string();
    entry.path = path;
    entry.media = category;
    if (auto size = it->file_size(entry_ec); !entry_ec) {
      entry.size = size;
    }
    if (auto mtime = it->last_write_time(entry_ec); !entry_ec) {
      auto sys = std::chrono::file_clock::to_sys(mtime);
      entry.last_modified = std::chrono::duration<double>(sys.time_since_epoch()).count();
    }
    entries.push_back(std::move(entry));
  }
  if (ec) {
    return std::unexpected(ConvertError{
      ErrorCode::Storage, std::format("cannot read {}: {}", dir.string(), ec.message())});
  }

  std::sort(entries.begin(), entries.end(),
            [](const CatalogEntry& a, const CatalogEntry& b) { return a.filename < b.filename; });
  return entries;
}

std::expected<void, ConvertError> LocalFileCatalog::remove(SourceCategory source,
                                                           std::string_view filename) const {
  auto path = resolve(source, filename);
  if (!path) {
    return std::unexpected(path.error());
  }
  std::error_code ec;
  if (!fs::remove(*path, ec) || ec) {
    return std::unexpected(ConvertError{
      ErrorCode::Storage,
      std::format("cannot delete {}: {}", path->string(), ec ? ec.message() : "already gone")});
  }
  std::cout << "[catalog] deleted " << path->string() << std::endl;
  return {};
}

} // namespace convert_service
