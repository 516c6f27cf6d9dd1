#include "rest_api_handler_base.hpp"

#include <iostream>

namespace common {

http::response<http::string_body> RestApiHandlerBase::createJsonResponse(
  http::status status, const nlohmann::json& json) {

  http::response<http::string_body> res{status, 11};
  res.set(http::field::content_type, "application/json");
  res.body() = json.dump();
  res.prepare_payload();
  return res;
}

http::response<http::string_body> RestApiHandlerBase::createErrorResponse(
  http::status status, const std::string& message) {

  nlohmann::json error_json = {
    {"success", false},
    {"error", message}
  };
  return createJsonResponse(status, error_json);
}

nlohmann::json RestApiHandlerBase::parseRequestBody(const std::string& body) {
  if (body.empty()) {
    return nlohmann::json::object();
  }
  try {
    auto json = nlohmann::json::parse(body);
    if (!json.is_object()) {
      throw BadRequest("Request body must be a JSON object");
    }
    return json;
  } catch (const nlohmann::json::parse_error& e) {
    throw BadRequest("Invalid JSON in request body: " + std::string(e.what()));
  }
}

std::string_view RestApiHandlerBase::pathOf(std::string_view target) {
  auto query = target.find('?');
  return query == std::string_view::npos ? target : target.substr(0, query);
}

std::optional<std::string> RestApiHandlerBase::pathParam(std::string_view path,
                                                         std::string_view prefix) {
  if (!path.starts_with(prefix) || path.size() == prefix.size()) {
    return std::nullopt;
  }
  auto rest = path.substr(prefix.size());
  if (rest.find('/') != std::string_view::npos) {
    return std::nullopt;
  }
  return std::string(rest);
}

std::string RestApiHandlerBase::percentDecode(std::string_view text) {
  auto hex = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };

  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '%') {
      out += text[i];
      continue;
    }
    if (i + 2 >= text.size() || hex(text[i + 1]) < 0 || hex(text[i + 2]) < 0) {
      throw BadRequest("Malformed percent-encoding in path");
    }
    out += static_cast<char>(hex(text[i + 1]) * 16 + hex(text[i + 2]));
    i += 2;
  }
  return out;
}

void RestApiHandlerBase::logError(const std::string& message) {
  std::cerr << "[http] " << message << std::endl;
}

}
