#pragma once
#include "application/task_orchestrator.hpp"
#include "application/task_registry.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include "domain/file_catalog.hpp"
#include <memory>
#include <nlohmann/json.hpp>

namespace convert_service {

class RestApiHandler : public common::RestApiHandlerBase {
public:
  RestApiHandler(std::shared_ptr<TaskRegistry> registry,
                 std::shared_ptr<TaskOrchestrator> orchestrator,
                 std::shared_ptr<FileCatalog> catalog);

  // Request body -> options. Throws common::BadRequest on wrong types or
  // unparsable values; range checks are left to validateOptions.
  static ConversionOptions parseOptions(const nlohmann::json& body);

  static nlohmann::json snapshotToJson(const TaskSnapshot& snapshot);

protected:
  http::response<http::string_body> doHandleRequest(
      http::request<http::string_body,
                    http::basic_fields<std::allocator<char>>> &&req) override;

private:
  std::shared_ptr<TaskRegistry> registry_;
  std::shared_ptr<TaskOrchestrator> orchestrator_;
  std::shared_ptr<FileCatalog> catalog_;

  http::response<http::string_body> handleConvert(const nlohmann::json &body);
  http::response<http::string_body> handleStatus(const std::string &task_id);
  http::response<http::string_body> handlePause(const std::string &task_id);
  http::response<http::string_body> handleResume(const std::string &task_id, const nlohmann::json &body);
  http::response<http::string_body> handleStop(const std::string &task_id);
  http::response<http::string_body> handleDeleteTask(const std::string &task_id);
  http::response<http::string_body> handleListFiles(const std::string &source);
  http::response<http::string_body> handleDeleteFile(const std::string &source, const std::string &filename);

  http::response<http::string_body> errorResponse(const ConvertError &error);
};

} // namespace convert_service
