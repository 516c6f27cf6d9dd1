#pragma once
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

// Thrown by handlers for malformed client input; answered with 400.
class BadRequest : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class RestApiHandlerBase {
public:
  virtual ~RestApiHandlerBase() = default;

  template<class Body, class Allocator>
  http::response<http::string_body> handleRequest(
    http::request<Body, http::basic_fields<Allocator>>&& req) {

    auto addCorsHeaders = [](auto& res) {
      res.set(http::field::access_control_allow_origin, "*");
      res.set(http::field::access_control_allow_methods, "GET, POST, PUT, DELETE, OPTIONS");
      res.set(http::field::access_control_allow_headers, "Content-Type, Authorization");
    };

    if (req.method() == http::verb::options) {
      http::response<http::string_body> res{http::status::ok, req.version()};
      addCorsHeaders(res);
      res.prepare_payload();
      return res;
    }

    const unsigned version = req.version();
    const bool keep_alive = req.keep_alive();
    auto finish = [&](http::response<http::string_body>& res) {
      addCorsHeaders(res);
      res.version(version);
      res.keep_alive(keep_alive);
    };

    try {
      auto response = doHandleRequest(std::move(req));
      finish(response);
      return response;
    } catch (const BadRequest& e) {
      auto response = createErrorResponse(http::status::bad_request, e.what());
      finish(response);
      return response;
    } catch (const std::exception& e) {
      logError(std::string("Unhandled error: ") + e.what());
      auto response = createErrorResponse(http::status::internal_server_error,
                                        "Internal server error: " + std::string(e.what()));
      finish(response);
      return response;
    }
  }

protected:
  virtual http::response<http::string_body> doHandleRequest(
    http::request<http::string_body, http::basic_fields<std::allocator<char>>>&& req) = 0;

  http::response<http::string_body> createJsonResponse(
    http::status status, const nlohmann::json& json);

  http::response<http::string_body> createErrorResponse(
    http::status status, const std::string& message);

  nlohmann::json parseRequestBody(const std::string& body);

  // "/api/status/abc?x=1" -> "/api/status/abc"
  static std::string_view pathOf(std::string_view target);

  // Returns the remainder of `path` after `prefix`, or nullopt if the prefix
  // does not match or nothing follows it.
  static std::optional<std::string> pathParam(std::string_view path, std::string_view prefix);

  // "%2Fa%20b" -> "/a b"; throws BadRequest on a malformed escape
  static std::string percentDecode(std::string_view text);

  static void logError(const std::string& message);
};

}
