#include "rest_api_handler.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <format>
#include <type_traits>
#include <utility>

namespace convert_service {

namespace {

using nlohmann::json;

std::optional<std::string> optString(const json &body, const char *key) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw common::BadRequest(std::format("'{}' must be a string", key));
  }
  auto value = it->get<std::string>();
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

// JSON integer -> T, refusing values T cannot hold.
template <typename T>
T integerValue(const json &value, const char *key) {
  if (!value.is_number_integer()) {
    throw common::BadRequest(std::format("'{}' must be an integer", key));
  }
  const bool fits = value.is_number_unsigned()
    ? std::in_range<T>(value.get<std::uint64_t>())
    : std::in_range<T>(value.get<std::int64_t>());
  if (!fits) {
    throw common::BadRequest(std::format("'{}' is out of range: {}", key, value.dump()));
  }
  return static_cast<T>(value.is_number_unsigned() ? value.get<std::uint64_t>()
                                                   : value.get<std::int64_t>());
}

// Numeric fields arrive as JSON numbers or as strings ("44100", "29.97").
template <typename T>
std::optional<T> optNumber(const json &body, const char *key) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return std::nullopt;
  }
  if (it->is_number()) {
    if constexpr (std::is_integral_v<T>) {
      return integerValue<T>(*it, key);
    } else {
      return it->get<T>();
    }
  }
  if (!it->is_string()) {
    throw common::BadRequest(std::format("'{}' must be a number", key));
  }
  const auto text = it->get<std::string>();
  if (text.empty()) {
    return std::nullopt;
  }
  T value{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    throw common::BadRequest(std::format("'{}' is not a valid number: {}", key, text));
  }
  return value;
}

template <typename T>
T unwrap(std::expected<T, ConvertError> value) {
  if (!value) {
    throw common::BadRequest(value.error().message);
  }
  return *value;
}

std::optional<long long> optBitrate(const json &body, const char *key) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return std::nullopt;
  }
  if (it->is_number_integer()) {
    return integerValue<long long>(*it, key);
  }
  if (auto text = optString(body, key)) {
    return unwrap(parseBitrate(*text));
  }
  return std::nullopt;
}

double percent(double fraction) {
  return std::round(fraction * 10000.0) / 100.0;
}

json nullable(const std::optional<std::string> &value) {
  return value ? json(*value) : json(nullptr);
}

} // namespace

RestApiHandler::RestApiHandler(std::shared_ptr<TaskRegistry> registry,
                               std::shared_ptr<TaskOrchestrator> orchestrator,
                               std::shared_ptr<FileCatalog> catalog)
    : registry_(std::move(registry)),
      orchestrator_(std::move(orchestrator)),
      catalog_(std::move(catalog)) {}

http::response<http::string_body> RestApiHandler::doHandleRequest(
    http::request<http::string_body,
                  http::basic_fields<std::allocator<char>>> &&req) {
  const std::string target(req.target());
  const std::string path(pathOf(target));
  const auto method = req.method();

  if (path == "/health" && method == http::verb::get) {
    return createJsonResponse(http::status::ok, {{"status", "healthy"}});
  }
  if (path == "/api/convert" && method == http::verb::post) {
    return handleConvert(parseRequestBody(req.body()));
  }
  if (auto id = pathParam(path, "/api/status/"); id && method == http::verb::get) {
    return handleStatus(*id);
  }
  if (auto id = pathParam(path, "/api/pause/"); id && method == http::verb::post) {
    return handlePause(*id);
  }
  if (auto id = pathParam(path, "/api/resume/"); id && method == http::verb::post) {
    return handleResume(*id, parseRequestBody(req.body()));
  }
  if (auto id = pathParam(path, "/api/stop/"); id && method == http::verb::post) {
    return handleStop(*id);
  }
  if (auto id = pathParam(path, "/api/tasks/"); id && method == http::verb::delete_) {
    return handleDeleteTask(*id);
  }
  if (auto source = pathParam(path, "/api/files/"); source && method == http::verb::get) {
    return handleListFiles(*source);
  }

  constexpr std::string_view files_prefix = "/api/files/";
  if (path.starts_with(files_prefix) && method == http::verb::delete_) {
    auto rest = std::string_view(path).substr(files_prefix.size());
    auto slash = rest.find('/');
    if (slash != std::string_view::npos && slash + 1 < rest.size()) {
      return handleDeleteFile(std::string(rest.substr(0, slash)),
                              percentDecode(rest.substr(slash + 1)));
    }
  }

  return createErrorResponse(http::status::not_found, "Endpoint not found");
}

ConversionOptions RestApiHandler::parseOptions(const nlohmann::json &body) {
  ConversionOptions options;
  auto format = optString(body, "output_format");
  if (!format) {
    throw common::BadRequest("'output_format' is required");
  }
  options.output_format = lowercase(*format);

  options.video_codec = optString(body, "video_codec");
  options.audio_codec = optString(body, "audio_codec");
  options.video_bitrate = optBitrate(body, "video_bitrate");
  options.audio_bitrate = optBitrate(body, "audio_bitrate");
  if (auto resolution = optString(body, "resolution")) {
    options.resolution = unwrap(parseResolution(*resolution));
  }
  options.frame_rate = optNumber<double>(body, "frame_rate");
  options.sample_rate = optNumber<int>(body, "sample_rate");
  options.audio_channels = optNumber<int>(body, "audio_channels");
  options.bit_depth = optNumber<int>(body, "bit_depth");

  options.volume_percent = optNumber<int>(body, "volume_percent");
  if (auto factor = body.find("volume_adjust"); factor != body.end() && !factor->is_null()) {
    if (factor->is_number()) {
      options.volume_percent = unwrap(volumePercent(factor->get<double>()));
    } else if (auto text = optString(body, "volume_adjust")) {
      options.volume_percent = unwrap(parseVolumeMultiplier(*text));
    }
  }

  options.trim_start = optNumber<double>(body, "trim_start");
  options.trim_end = optNumber<double>(body, "trim_end");
  options.hwaccel = optString(body, "hwaccel");
  return options;
}

nlohmann::json RestApiHandler::snapshotToJson(const TaskSnapshot &snapshot) {
  json files = json::array();
  for (const auto &file : snapshot.files) {
    files.push_back({
      {"filename", file.filename},
      {"status", std::string(toString(file.status))},
      {"progress", percent(file.progress)},
      {"error", nullable(file.error)},
      {"output_file", nullable(file.output_file)},
      {"output_size", file.output_size ? json(*file.output_size) : json(nullptr)}
    });
  }

  const auto created_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
    snapshot.created_at.time_since_epoch()).count();
  return {
    {"task_id", snapshot.task_id},
    {"state", std::string(toString(snapshot.state))},
    {"paused", snapshot.paused},
    {"created_at", created_ms},
    {"source", std::string(toString(snapshot.source))},
    {"media_type", std::string(toString(snapshot.category))},
    {"output_format", snapshot.output_format},
    {"total_files", snapshot.files.size()},
    {"overall_progress", percent(snapshot.overall_progress)},
    {"files", files}
  };
}

http::response<http::string_body>
RestApiHandler::handleConvert(const nlohmann::json &body) {
  auto files_it = body.find("files");
  if (files_it == body.end() || !files_it->is_array()) {
    throw common::BadRequest("'files' must be an array of file names");
  }
  std::vector<std::string> files;
  for (const auto &file : *files_it) {
    if (!file.is_string()) {
      throw common::BadRequest("'files' must be an array of file names");
    }
    files.push_back(file.get<std::string>());
  }

  auto source_text = optString(body, "source").value_or("upload");
  auto source = parseSourceCategory(source_text);
  if (!source) {
    throw common::BadRequest("unknown source: " + source_text);
  }

  auto task = orchestrator_->submit(files, *source, parseOptions(body));
  if (!task) {
    return errorResponse(task.error());
  }
  return createJsonResponse(http::status::ok, snapshotToJson((*task)->snapshot()));
}

http::response<http::string_body>
RestApiHandler::handleStatus(const std::string &task_id) {
  auto task = registry_->get(task_id);
  if (!task) {
    return errorResponse(task.error());
  }
  return createJsonResponse(http::status::ok, snapshotToJson((*task)->snapshot()));
}

http::response<http::string_body>
RestApiHandler::handlePause(const std::string &task_id) {
  auto task = registry_->get(task_id);
  if (!task) {
    return errorResponse(task.error());
  }
  orchestrator_->pause(*task);
  return createJsonResponse(http::status::ok, {{"status", "paused"}, {"task_id", task_id}});
}

http::response<http::string_body>
RestApiHandler::handleResume(const std::string &task_id, const nlohmann::json &body) {
  auto task = registry_->get(task_id);
  if (!task) {
    return errorResponse(task.error());
  }

  std::optional<std::vector<std::string>> filenames;
  if (auto it = body.find("filenames"); it != body.end() && !it->is_null()) {
    if (!it->is_array()) {
      throw common::BadRequest("'filenames' must be an array of file names");
    }
    filenames.emplace();
    for (const auto &name : *it) {
      if (!name.is_string()) {
        throw common::BadRequest("'filenames' must be an array of file names");
      }
      filenames->push_back(name.get<std::string>());
    }
  }

  orchestrator_->resume(*task, filenames);
  return createJsonResponse(http::status::ok, {{"status", "resumed"}, {"task_id", task_id}});
}

http::response<http::string_body>
RestApiHandler::handleStop(const std::string &task_id) {
  auto task = registry_->get(task_id);
  if (!task) {
    return errorResponse(task.error());
  }
  orchestrator_->cancel(*task);
  return createJsonResponse(http::status::ok, {{"status", "stopped"}, {"task_id", task_id}});
}

http::response<http::string_body>
RestApiHandler::handleDeleteTask(const std::string &task_id) {
  if (auto removed = registry_->remove(task_id); !removed) {
    return errorResponse(removed.error());
  }
  return createJsonResponse(http::status::ok, {{"success", true}, {"task_id", task_id}});
}

http::response<http::string_body>
RestApiHandler::handleListFiles(const std::string &source_text) {
  auto source = parseSourceCategory(source_text);
  if (!source) {
    return createErrorResponse(http::status::not_found, "unknown source: " + source_text);
  }
  auto entries = catalog_->list(*source);
  if (!entries) {
    return errorResponse(entries.error());
  }

  json files = json::array();
  for (const auto &entry : *entries) {
    files.push_back({
      {"filename", entry.filename},
      {"path", entry.path.string()},
      {"size", entry.size},
      {"media_type", entry.media ? json(std::string(toString(*entry.media))) : json(nullptr)},
      {"last_modified", entry.last_modified}
    });
  }
  return createJsonResponse(http::status::ok, files);
}

http::response<http::string_body>
RestApiHandler::handleDeleteFile(const std::string &source_text, const std::string &filename) {
  auto source = parseSourceCategory(source_text);
  if (!source) {
    return createErrorResponse(http::status::not_found, "unknown source: " + source_text);
  }
  if (auto removed = catalog_->remove(*source, filename); !removed) {
    return errorResponse(removed.error());
  }
  return createJsonResponse(http::status::ok, {{"success", true}, {"filename", filename}});
}

http::response<http::string_body>
RestApiHandler::errorResponse(const ConvertError &error) {
  switch (error.code) {
    case ErrorCode::Validation:
      return createErrorResponse(http::status::bad_request, error.message);
    case ErrorCode::NotFound:
      return createErrorResponse(http::status::not_found, error.message);
    case ErrorCode::Conflict:
      return createErrorResponse(http::status::conflict, error.message);
    default:
      logError(std::string(toString(error.code)) + ": " + error.message);
      return createErrorResponse(http::status::internal_server_error, error.message);
  }
}

} // namespace convert_service
